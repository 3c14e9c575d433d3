#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "../common/Config.hpp"
#include "DeviceRegistry.hpp"
#include "HostnameResolver.hpp"

namespace lanwatch::discovery
{
    // Resolves hostnames only for devices a viewer currently shows. The wanted
    // set is replaced on every request; a device scrolled out of view is
    // simply dropped from the queue.
    class LazyResolutionScheduler
    {
    public:
        LazyResolutionScheduler(DeviceRegistry &registry,
                                std::shared_ptr<HostnameResolver> resolver,
                                config::ScanSettings settings = {});
        ~LazyResolutionScheduler();

        LazyResolutionScheduler(const LazyResolutionScheduler &) = delete;
        LazyResolutionScheduler &operator=(const LazyResolutionScheduler &) = delete;

        // Invalid MACs are ignored
        void RequestResolutionForVisible(const std::vector<std::string> &macs);

        // Empties the wanted set once; returns the number of lookups performed
        size_t DrainOnce();
        size_t PendingCount() const;

        void Start();
        void Stop();
        bool IsRunning() const { return m_running; }

    private:
        void WorkerLoop();
        std::optional<std::string> TakeNext();

        DeviceRegistry &m_registry;
        std::shared_ptr<HostnameResolver> m_resolver;
        config::ScanSettings m_settings;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::set<std::string> m_wanted;
        bool m_stopRequested = false;

        std::atomic<bool> m_running;
        std::thread m_thread;
    };
}
