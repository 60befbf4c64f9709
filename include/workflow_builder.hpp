#pragma once

#include "job_registry.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace autoflow {

namespace workflow_types {
inline constexpr const char *EMAIL_PROCESSING = "email_processing";
inline constexpr const char *CRM_FOLLOWUPS = "crm_followups";
inline constexpr const char *LEAD_INGESTION = "lead_ingestion";
inline constexpr const char *BUSINESS_HOURS = "business_hours";
} // namespace workflow_types

struct EmailProcessingOptions {
  std::string query = "is:unread";
  int intervalMinutes = 30;
  int maxEmails = 10;
  bool autoReply = false;

  static EmailProcessingOptions fromJson(const nlohmann::json &json);
};

struct CrmFollowupOptions {
  std::optional<std::string> stageFilter;
  int intervalHours = 24;
  bool send = false;

  static CrmFollowupOptions fromJson(const nlohmann::json &json);
};

struct LeadIngestionOptions {
  std::string source = "webhook";
  int intervalMinutes = 15;

  static LeadIngestionOptions fromJson(const nlohmann::json &json);
};

struct BusinessHoursOptions {
  std::string workflowType = workflow_types::EMAIL_PROCESSING;
  int intervalMinutes = 60;
  int startHour = 9;
  int endHour = 18;

  static BusinessHoursOptions fromJson(const nlohmann::json &json);
};

// External integrations the workflows delegate to
struct WorkflowHandlers {
  std::shared_ptr<Runnable> emailProcessing;
  std::shared_ptr<Runnable> crmFollowups;
  std::shared_ptr<Runnable> leadIngestion;
};

/**
 * Runs the wrapped handler only while the local hour of the clock lies in
 * [startHour, endHour]. Outside the window a run is a successful no-op.
 */
class BusinessHoursRunnable : public Runnable {
public:
  BusinessHoursRunnable(std::shared_ptr<Runnable> inner,
                        std::shared_ptr<Clock> clock, int startHour,
                        int endHour);

  void run(const JobMetadata &metadata) override;

  bool withinWindow() const;

private:
  std::shared_ptr<Runnable> inner_;
  std::shared_ptr<Clock> clock_;
  int startHour_;
  int endHour_;
};

/**
 * Registers the standard automation workflows. Each schedule* call checks
 * its options, packs them into the job metadata and calls
 * JobRegistry::add(); nothing else in the registry is touched.
 */
class WorkflowBuilder {
public:
  explicit WorkflowBuilder(std::shared_ptr<JobRegistry> registry);

  JobId scheduleEmailProcessing(const EmailProcessingOptions &options,
                                std::shared_ptr<Runnable> handler,
                                bool enabled = true);
  JobId scheduleCrmFollowups(const CrmFollowupOptions &options,
                             std::shared_ptr<Runnable> handler,
                             bool enabled = true);
  JobId scheduleLeadIngestion(const LeadIngestionOptions &options,
                              std::shared_ptr<Runnable> handler,
                              bool enabled = true);
  JobId scheduleBusinessHoursWorkflow(const BusinessHoursOptions &options,
                                      std::shared_ptr<Runnable> handler,
                                      bool enabled = true);

  /**
   * Registers every entry of a "workflows" configuration array, picking the
   * handler by type. Entries with "enabled": false are registered disabled.
   * All or nothing: when an entry is rejected, the jobs already registered
   * from the same array are removed again before the exception propagates.
   * @throws ValidationException on an unknown type or invalid options
   */
  std::vector<JobId> scheduleFromConfig(const nlohmann::json &workflows,
                                        const WorkflowHandlers &handlers);

private:
  JobId scheduleEntry(const nlohmann::json &entry,
                      const WorkflowHandlers &handlers);

  std::shared_ptr<JobRegistry> registry_;
};

} // namespace autoflow
