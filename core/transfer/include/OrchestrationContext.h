#pragma once

/**
 * @file OrchestrationContext.h
 * @brief Per-run owner of everything sessions share
 *
 * One context is built per application run and handed to every session.
 * Sessions must be destroyed before their context.
 */

#include "Config.h"
#include "EventDispatcher.h"
#include "ITransport.h"
#include "MetricsCollector.h"
#include "NetworkProfiler.h"
#include "OrchestrationSettings.h"
#include "Result.h"
#include "SecurityEngine.h"
#include "SessionRegistry.h"
#include "ThreadPool.h"
#include "TransportManager.h"
#include "TransportRegistry.h"

#include <memory>

namespace CodeDrop {

    class TransferSession;
    struct SessionRequest;

    class OrchestrationContext {
    public:
        explicit OrchestrationContext(OrchestrationSettings settings, Config config = Config());
        ~OrchestrationContext();

        OrchestrationContext(const OrchestrationContext&) = delete;
        OrchestrationContext& operator=(const OrchestrationContext&) = delete;

        /**
         * @brief Parse settings from config, apply logging, build the context
         */
        static Result<std::unique_ptr<OrchestrationContext>> create(const Config& config);

        // Freeze transport registration; sessions call this on start
        void seal();

        std::unique_ptr<TransferSession> createSession(SessionRequest request,
                                                       std::shared_ptr<SessionObserver> observer = nullptr);

        // Settings handed to every backend's setup()
        TransportConfig transportConfig() const;

        const Config& config() const { return config_; }
        const OrchestrationSettings& settings() const { return settings_; }
        MetricsCollector& metrics() { return metrics_; }
        TransportRegistry& registry() { return registry_; }
        ThreadPool& pool() { return pool_; }
        EventDispatcher& dispatcher() { return dispatcher_; }
        const SecurityEngine& security() const { return security_; }
        NetworkProfiler& profiler() { return profiler_; }
        const TransportManager& manager() const { return manager_; }
        TransportManager& manager() { return manager_; }
        SessionRegistry& sessions() { return sessions_; }

    private:
        // Declaration order is destruction order in reverse: the pool joins
        // before the registry closes the backends its tasks may still use.
        Config config_;
        OrchestrationSettings settings_;
        MetricsCollector metrics_;
        TransportRegistry registry_;
        ThreadPool pool_;
        EventDispatcher dispatcher_;
        SecurityEngine security_;
        NetworkProfiler profiler_;
        TransportManager manager_;
        SessionRegistry sessions_;
    };

}
