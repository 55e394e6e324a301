#include "OrchestrationContext.h"
#include "TransferSession.h"

namespace CodeDrop {

    OrchestrationContext::OrchestrationContext(OrchestrationSettings settings, Config config)
        : config_(std::move(config)),
          settings_(std::move(settings)),
          pool_(settings_.poolThreads),
          dispatcher_(settings_.eventQueueCapacity),
          security_(&metrics_, settings_.forcedMode),
          profiler_(pool_, settings_.profiler, &metrics_),
          manager_(registry_, pool_, settings_.transport, &metrics_) {
        Logger::instance().log(LogLevel::DEBUG,
            "Orchestration context ready with " + std::to_string(pool_.size()) + " worker threads",
            "OrchestrationContext");
    }

    OrchestrationContext::~OrchestrationContext() {
        dispatcher_.stop();
        pool_.shutdown();
        registry_.closeAll();
        Logger::instance().log(LogLevel::DEBUG, metrics_.getMetricsSummary(), "OrchestrationContext");
    }

    Result<std::unique_ptr<OrchestrationContext>> OrchestrationContext::create(const Config& config) {
        auto settings = OrchestrationSettings::fromConfig(config);
        if (settings.isError()) {
            return settings.error();
        }
        settings.value().applyLogging();
        return std::make_unique<OrchestrationContext>(settings.takeValue(), config);
    }

    void OrchestrationContext::seal() {
        registry_.seal();
    }

    std::unique_ptr<TransferSession> OrchestrationContext::createSession(SessionRequest request,
                                                                         std::shared_ptr<SessionObserver> observer) {
        return std::make_unique<TransferSession>(*this, std::move(request), std::move(observer));
    }

    TransportConfig OrchestrationContext::transportConfig() const {
        TransportConfig tc;
        tc.relayServers = config_.getList("transport.relay_servers");
        tc.overlayProxy = config_.get("transport.overlay_proxy", "127.0.0.1:9050");
        tc.httpsProxy = config_.get("transport.https_proxy");
        tc.spoolDir = settings_.spool.dir;
        tc.callTimeout = settings_.transport.attemptTimeout;
        tc.extra["spool.poll_interval_ms"] = std::to_string(settings_.spool.pollInterval.count());
        return tc;
    }

}
