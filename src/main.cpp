#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "config_manager.hpp"
#include "job_registry.hpp"
#include "logger.hpp"
#include "scheduler_exceptions.hpp"
#include "workflow_builder.hpp"
#include "workflow_scheduler.hpp"

namespace {

// Stand-in for the external Gmail/CRM/lead integrations
class LoggingHandler : public autoflow::Runnable {
public:
  explicit LoggingHandler(std::string integration)
      : integration_(std::move(integration)) {}

  void run(const autoflow::JobMetadata &metadata) override {
    autoflow::Logger::getInstance().info("Main",
                                         "Dispatching to " + integration_,
                                         {{"metadata", metadata.dump()}});
  }

private:
  std::string integration_;
};

std::string resolveConfigPath(int argc, char *argv[]) {
  if (argc > 1) {
    return argv[1];
  }
  if (const char *envPath = std::getenv("AUTOFLOW_CONFIG")) {
    return envPath;
  }
  return "config/config.json";
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace autoflow;

  try {
    auto configPath = resolveConfigPath(argc, argv);

    auto &config = ConfigManager::getInstance();
    if (!config.loadConfig(configPath)) {
      std::cerr << "Failed to load configuration from " << configPath
                << std::endl;
      return 1;
    }

    auto &logger = Logger::getInstance();
    logger.configure(config.getLoggingConfig());

    LOG_INFO("Main", "Starting autoflow scheduler daemon");

    auto validation = config.validateConfiguration();
    for (const auto &warning : validation.warnings) {
      LOG_WARN("Main", "Configuration warning: " + warning);
    }
    if (!validation.isValid) {
      for (const auto &error : validation.errors) {
        LOG_ERROR("Main", "Configuration error: " + error);
      }
      logger.shutdown();
      return 1;
    }

    auto schedulerConfig = config.getSchedulerConfig();
    auto registry = std::make_shared<JobRegistry>(
        makeSystemClock(), schedulerConfig.reenablePolicy,
        schedulerConfig.lockTimeout);
    WorkflowScheduler scheduler(registry, schedulerConfig);
    WorkflowBuilder builder(registry);

    WorkflowHandlers handlers;
    handlers.emailProcessing = std::make_shared<LoggingHandler>("gmail");
    handlers.crmFollowups = std::make_shared<LoggingHandler>("crm");
    handlers.leadIngestion = std::make_shared<LoggingHandler>("lead-intake");

    auto jobIds = builder.scheduleFromConfig(
        config.getJsonConfig().value("workflows", nlohmann::json::array()),
        handlers);
    LOG_INFO("Main", "Registered " + std::to_string(jobIds.size()) +
                         " workflows");

    if (!scheduler.start()) {
      LOG_FATAL("Main", "Scheduler failed to start");
      logger.shutdown();
      return 1;
    }

    boost::asio::io_context ioContext;
    boost::asio::signal_set signals(ioContext, SIGINT, SIGTERM);
    signals.async_wait(
        [&](const boost::system::error_code &ec, int signalNumber) {
          if (ec) {
            return;
          }
          LOG_INFO("Main", "Received signal " + std::to_string(signalNumber) +
                               ". Shutting down gracefully...");
          ioContext.stop();
        });
    ioContext.run();

    LOG_INFO("Main", "Final scheduler status: " +
                         scheduler.status().toJson().dump());

    bool stopped = scheduler.stop();
    if (!stopped) {
      LOG_WARN("Main", "Scheduler did not stop within " +
                           std::to_string(schedulerConfig.stopTimeout.count()) +
                           "ms, waiting for the running job to return");
    }

    LOG_INFO("Main", "Autoflow daemon stopped");
    logger.shutdown();
    return stopped ? 0 : 2;
  } catch (const SchedulerException &e) {
    std::cerr << "Fatal error: " << e.toLogString() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
