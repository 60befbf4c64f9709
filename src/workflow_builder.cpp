#include "workflow_builder.hpp"
#include "component_logger.hpp"
#include "scheduler_exceptions.hpp"
#include <chrono>
#include <utility>

namespace autoflow {

namespace {

void requirePositive(const std::string &field, int value) {
  if (value <= 0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              field + " must be positive", field,
                              std::to_string(value));
  }
}

void requireHandler(const std::shared_ptr<Runnable> &handler,
                    const std::string &workflowType) {
  if (!handler) {
    throw ValidationException(ErrorCode::MISSING_FIELD,
                              "No handler available for workflow type " +
                                  workflowType,
                              "handler", workflowType);
  }
}

Duration minutes(int count) {
  return std::chrono::duration_cast<Duration>(std::chrono::minutes(count));
}

} // namespace

// ===== Options =====

EmailProcessingOptions
EmailProcessingOptions::fromJson(const nlohmann::json &json) {
  EmailProcessingOptions options;
  options.query = json.value("query", options.query);
  options.intervalMinutes =
      json.value("interval_minutes", options.intervalMinutes);
  options.maxEmails = json.value("max_emails", options.maxEmails);
  options.autoReply = json.value("auto_reply", options.autoReply);
  return options;
}

CrmFollowupOptions CrmFollowupOptions::fromJson(const nlohmann::json &json) {
  CrmFollowupOptions options;
  if (auto it = json.find("stage_filter"); it != json.end() && !it->is_null()) {
    options.stageFilter = it->get<std::string>();
  }
  options.intervalHours = json.value("interval_hours", options.intervalHours);
  options.send = json.value("send", options.send);
  return options;
}

LeadIngestionOptions
LeadIngestionOptions::fromJson(const nlohmann::json &json) {
  LeadIngestionOptions options;
  options.source = json.value("source", options.source);
  options.intervalMinutes =
      json.value("interval_minutes", options.intervalMinutes);
  return options;
}

BusinessHoursOptions
BusinessHoursOptions::fromJson(const nlohmann::json &json) {
  BusinessHoursOptions options;
  options.workflowType = json.value("workflow_type", options.workflowType);
  options.intervalMinutes =
      json.value("interval_minutes", options.intervalMinutes);
  options.startHour = json.value("start_hour", options.startHour);
  options.endHour = json.value("end_hour", options.endHour);
  return options;
}

// ===== BusinessHoursRunnable =====

BusinessHoursRunnable::BusinessHoursRunnable(std::shared_ptr<Runnable> inner,
                                             std::shared_ptr<Clock> clock,
                                             int startHour, int endHour)
    : inner_(std::move(inner)), clock_(std::move(clock)), startHour_(startHour),
      endHour_(endHour) {}

bool BusinessHoursRunnable::withinWindow() const {
  int hour = localHourOf(clock_->now());
  return hour >= startHour_ && hour <= endHour_;
}

void BusinessHoursRunnable::run(const JobMetadata &metadata) {
  if (!withinWindow()) {
    WORKFLOW_LOG_DEBUG("Outside business hours ({}-{}), skipping run",
                       startHour_, endHour_);
    return;
  }
  inner_->run(metadata);
}

// ===== WorkflowBuilder =====

WorkflowBuilder::WorkflowBuilder(std::shared_ptr<JobRegistry> registry)
    : registry_(std::move(registry)) {
  if (!registry_) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Workflow builder requires a job registry",
                              "registry");
  }
}

JobId WorkflowBuilder::scheduleEmailProcessing(
    const EmailProcessingOptions &options, std::shared_ptr<Runnable> handler,
    bool enabled) {
  requirePositive("interval_minutes", options.intervalMinutes);
  requirePositive("max_emails", options.maxEmails);

  JobMetadata metadata = {{"query", options.query},
                          {"max_emails", options.maxEmails},
                          {"auto_reply", options.autoReply}};

  auto jobId = registry_->add("Email Processing - " + options.query,
                              workflow_types::EMAIL_PROCESSING,
                              std::move(handler),
                              minutes(options.intervalMinutes), metadata,
                              enabled);
  WORKFLOW_LOG_INFO("Scheduled email processing every {} minutes: {}",
                    options.intervalMinutes, jobId);
  return jobId;
}

JobId WorkflowBuilder::scheduleCrmFollowups(const CrmFollowupOptions &options,
                                            std::shared_ptr<Runnable> handler,
                                            bool enabled) {
  requirePositive("interval_hours", options.intervalHours);

  JobMetadata metadata = {{"send", options.send}};
  metadata["stage_filter"] = options.stageFilter
                                 ? nlohmann::json(*options.stageFilter)
                                 : nlohmann::json();

  auto jobId = registry_->add(
      "CRM Follow-ups - " + options.stageFilter.value_or("all"),
      workflow_types::CRM_FOLLOWUPS, std::move(handler),
      std::chrono::duration_cast<Duration>(
          std::chrono::hours(options.intervalHours)),
      metadata, enabled);
  WORKFLOW_LOG_INFO("Scheduled CRM follow-ups every {} hours: {}",
                    options.intervalHours, jobId);
  return jobId;
}

JobId WorkflowBuilder::scheduleLeadIngestion(const LeadIngestionOptions &options,
                                             std::shared_ptr<Runnable> handler,
                                             bool enabled) {
  requirePositive("interval_minutes", options.intervalMinutes);

  JobMetadata metadata = {{"source", options.source}};

  auto jobId = registry_->add("Lead Ingestion - " + options.source,
                              workflow_types::LEAD_INGESTION, std::move(handler),
                              minutes(options.intervalMinutes), metadata,
                              enabled);
  WORKFLOW_LOG_INFO("Scheduled lead ingestion from {} every {} minutes: {}",
                    options.source, options.intervalMinutes, jobId);
  return jobId;
}

JobId WorkflowBuilder::scheduleBusinessHoursWorkflow(
    const BusinessHoursOptions &options, std::shared_ptr<Runnable> handler,
    bool enabled) {
  if (options.workflowType != workflow_types::EMAIL_PROCESSING &&
      options.workflowType != workflow_types::CRM_FOLLOWUPS) {
    throw ValidationException(
        ErrorCode::INVALID_INPUT,
        "Business hours workflow type must be email_processing or "
        "crm_followups",
        "workflow_type", options.workflowType);
  }
  requirePositive("interval_minutes", options.intervalMinutes);
  if (options.startHour < 0 || options.endHour > 23 ||
      options.startHour > options.endHour) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Business hours must satisfy 0 <= start_hour <= "
                              "end_hour <= 23",
                              "start_hour",
                              std::to_string(options.startHour) + "-" +
                                  std::to_string(options.endHour));
  }
  requireHandler(handler, options.workflowType);

  JobMetadata metadata = {{"workflow_type", options.workflowType},
                          {"start_hour", options.startHour},
                          {"end_hour", options.endHour}};

  auto gated = std::make_shared<BusinessHoursRunnable>(
      std::move(handler), registry_->clock(), options.startHour,
      options.endHour);

  auto jobId = registry_->add("Business Hours - " + options.workflowType,
                              workflow_types::BUSINESS_HOURS, std::move(gated),
                              minutes(options.intervalMinutes), metadata,
                              enabled);
  WORKFLOW_LOG_INFO("Scheduled business hours {} workflow ({}:00-{}:00): {}",
                    options.workflowType, options.startHour, options.endHour,
                    jobId);
  return jobId;
}

JobId WorkflowBuilder::scheduleEntry(const nlohmann::json &entry,
                                     const WorkflowHandlers &handlers) {
  if (!entry.is_object()) {
    throw ValidationException(ErrorCode::INVALID_FORMAT,
                              "Workflow entry must be an object", "workflows",
                              entry.dump());
  }
  auto enabledIt = entry.find("enabled");
  bool enabled = enabledIt == entry.end() || !enabledIt->is_boolean() ||
                 enabledIt->get<bool>();

  std::string type;
  try {
    type = entry.value("type", "");
    if (type == workflow_types::EMAIL_PROCESSING) {
      requireHandler(handlers.emailProcessing, type);
      return scheduleEmailProcessing(EmailProcessingOptions::fromJson(entry),
                                     handlers.emailProcessing, enabled);
    }
    if (type == workflow_types::CRM_FOLLOWUPS) {
      requireHandler(handlers.crmFollowups, type);
      return scheduleCrmFollowups(CrmFollowupOptions::fromJson(entry),
                                  handlers.crmFollowups, enabled);
    }
    if (type == workflow_types::LEAD_INGESTION) {
      requireHandler(handlers.leadIngestion, type);
      return scheduleLeadIngestion(LeadIngestionOptions::fromJson(entry),
                                   handlers.leadIngestion, enabled);
    }
    if (type == workflow_types::BUSINESS_HOURS) {
      auto options = BusinessHoursOptions::fromJson(entry);
      auto inner = options.workflowType == workflow_types::CRM_FOLLOWUPS
                       ? handlers.crmFollowups
                       : handlers.emailProcessing;
      return scheduleBusinessHoursWorkflow(options, inner, enabled);
    }
  } catch (const nlohmann::json::exception &e) {
    throw ValidationException(ErrorCode::INVALID_FORMAT,
                              std::string("Malformed workflow entry: ") +
                                  e.what(),
                              "workflows", entry.dump());
  }
  throw ValidationException(ErrorCode::INVALID_INPUT, "Unknown workflow type",
                            "type", type);
}

std::vector<JobId>
WorkflowBuilder::scheduleFromConfig(const nlohmann::json &workflows,
                                    const WorkflowHandlers &handlers) {
  std::vector<JobId> jobIds;
  if (workflows.is_null()) {
    return jobIds;
  }
  if (!workflows.is_array()) {
    throw ValidationException(ErrorCode::INVALID_FORMAT,
                              "workflows must be an array", "workflows",
                              workflows.dump());
  }

  try {
    for (const auto &entry : workflows) {
      jobIds.push_back(scheduleEntry(entry, handlers));
    }
  } catch (const SchedulerException &e) {
    for (const auto &jobId : jobIds) {
      registry_->remove(jobId);
    }
    WORKFLOW_LOG_ERROR("Workflow configuration rejected, rolled back {} jobs: {}",
                       jobIds.size(), e.getMessage());
    throw;
  }

  WORKFLOW_LOG_INFO("Registered {} workflows from configuration",
                    jobIds.size());
  return jobIds;
}

} // namespace autoflow
