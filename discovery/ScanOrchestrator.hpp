#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../common/Config.hpp"
#include "DeviceRegistry.hpp"
#include "DiscoverySource.hpp"
#include "HostnameResolver.hpp"
#include "TaskPool.hpp"

namespace lanwatch::discovery
{
    enum class SourceOutcome
    {
        Ok,
        Failed,
        TimedOut
    };

    std::string ToString(SourceOutcome outcome);

    struct SourceReport
    {
        std::string name;
        SourceOutcome outcome = SourceOutcome::Failed;
        size_t sightings = 0;
    };

    struct ScanReport
    {
        bool quick = false;
        bool bracketed = false;
        size_t observed = 0;
        size_t went_offline = 0;
        std::vector<SourceReport> sources;
    };

    // Drives discovery passes. A quick pass reads only the neighbor table and
    // never takes anything offline; a full pass runs every source concurrently
    // and brackets the results so unseen devices go offline, provided a source
    // reporting hardware addresses answered. The pool keeps a spare thread per
    // source so one left running by a timed-out pass does not starve the next.
    class ScanOrchestrator
    {
    public:
        ScanOrchestrator(DeviceRegistry &registry,
                         std::shared_ptr<DiscoverySource> quick_source,
                         std::vector<std::shared_ptr<DiscoverySource>> slow_sources,
                         std::shared_ptr<HostnameResolver> resolver,
                         config::ScanSettings settings = {});
        ~ScanOrchestrator();

        ScanOrchestrator(const ScanOrchestrator &) = delete;
        ScanOrchestrator &operator=(const ScanOrchestrator &) = delete;

        // False when debounced or when another scan is already running
        bool Scan(bool force = false, bool quick = false);
        bool IsScanning() const { return m_scanning; }

        // Reverse-resolves online devices that have no hostname yet; returns how many were filled
        size_t ResolveMissingHostnames();

        ScanReport LastScanReport() const;

    private:
        struct SourceResult
        {
            SourceReport report;
            std::vector<Sighting> sightings;
        };

        bool TryBeginScan(bool force);
        std::vector<SourceResult> RunSources(const std::vector<std::shared_ptr<DiscoverySource>> &sources);
        size_t Apply(const std::vector<SourceResult> &results);

        DeviceRegistry &m_registry;
        std::shared_ptr<DiscoverySource> m_quickSource;
        std::vector<std::shared_ptr<DiscoverySource>> m_slowSources;
        std::shared_ptr<HostnameResolver> m_resolver;
        config::ScanSettings m_settings;

        std::atomic<bool> m_scanning;
        mutable std::mutex m_stateMutex;
        std::optional<std::chrono::steady_clock::time_point> m_lastScanStart;
        ScanReport m_lastReport;

        TaskPool m_pool;
    };
}
