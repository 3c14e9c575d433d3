#include "ScanOrchestrator.hpp"
#include "../common/Errors.hpp"

#include <future>
#include <iostream>
#include <variant>

namespace lanwatch::discovery
{
    using lanwatch::common::FormatError;

    std::string ToString(SourceOutcome outcome)
    {
        switch (outcome)
        {
        case SourceOutcome::Ok:
            return "ok";
        case SourceOutcome::Failed:
            return "failed";
        case SourceOutcome::TimedOut:
            return "timed out";
        }
        return "unknown";
    }

    ScanOrchestrator::ScanOrchestrator(DeviceRegistry &registry,
                                       std::shared_ptr<DiscoverySource> quick_source,
                                       std::vector<std::shared_ptr<DiscoverySource>> slow_sources,
                                       std::shared_ptr<HostnameResolver> resolver,
                                       config::ScanSettings settings)
        : m_registry(registry),
          m_quickSource(std::move(quick_source)),
          m_slowSources(std::move(slow_sources)),
          m_resolver(std::move(resolver)),
          m_settings(settings),
          m_scanning(false),
          m_pool(2 * (1 + m_slowSources.size()))
    {
        m_pool.Start();
    }

    ScanOrchestrator::~ScanOrchestrator()
    {
        m_pool.Stop();
    }

    bool ScanOrchestrator::TryBeginScan(bool force)
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);

        if (m_scanning)
            return false;

        const auto now = std::chrono::steady_clock::now();
        if (!force && m_lastScanStart && now - *m_lastScanStart < m_settings.min_scan_interval)
            return false;

        m_scanning = true;
        m_lastScanStart = now;
        return true;
    }

    bool ScanOrchestrator::Scan(bool force, bool quick)
    {
        if (!TryBeginScan(force))
            return false;

        struct ScanningGuard
        {
            std::atomic<bool> &flag;
            ~ScanningGuard() { flag = false; }
        } guard{m_scanning};

        ScanReport report;
        report.quick = quick;

        std::vector<std::shared_ptr<DiscoverySource>> sources = {m_quickSource};
        if (!quick)
            sources.insert(sources.end(), m_slowSources.begin(), m_slowSources.end());

        std::vector<SourceResult> results = RunSources(sources);

        bool any_ok = false;
        bool addresses_ok = false;
        for (size_t i = 0; i < results.size(); ++i)
        {
            report.sources.push_back(results[i].report);
            if (results[i].report.outcome != SourceOutcome::Ok)
                continue;
            any_ok = true;
            if (sources[i]->ReportsHardwareAddresses())
                addresses_ok = true;
        }

        if (quick)
        {
            report.observed = Apply(results);
        }
        else if (!any_ok)
        {
            std::cerr << "[Scanner] Every source failed; keeping previous device state\n";
        }
        else if (!addresses_ok)
        {
            // Service records alone cannot show that a device left
            std::cerr << "[Scanner] No hardware-address source answered; nothing taken offline\n";
            report.observed = Apply(results);
        }
        else
        {
            m_registry.BeginPass();
            report.observed = Apply(results);
            report.went_offline = m_registry.EndPass();
            report.bracketed = true;
        }

        DeviceCounts counts = m_registry.GetCounts();
        std::cout << "[Scanner] " << (quick ? "Quick" : "Full") << " scan done: "
                  << counts.online << " online / " << counts.total << " total";
        if (report.went_offline > 0)
            std::cout << ", " << report.went_offline << " went offline";
        std::cout << "\n";

        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_lastReport = std::move(report);
        }
        return true;
    }

    std::vector<ScanOrchestrator::SourceResult> ScanOrchestrator::RunSources(
        const std::vector<std::shared_ptr<DiscoverySource>> &sources)
    {
        using Clock = std::chrono::steady_clock;
        const auto submitted = Clock::now();

        std::vector<std::future<Clock::time_point>> began;
        std::vector<std::future<std::vector<Sighting>>> futures;
        began.reserve(sources.size());
        futures.reserve(sources.size());
        for (const auto &source : sources)
        {
            auto start = std::make_shared<std::promise<Clock::time_point>>();
            began.push_back(start->get_future());

            // The task owns the source so a late finisher outlives this pass
            futures.push_back(m_pool.Submit([source, start]()
                                            {
                                                start->set_value(Clock::now());
                                                return source->Discover();
                                            }));
        }

        std::vector<SourceResult> results;
        results.reserve(sources.size());
        for (size_t i = 0; i < sources.size(); ++i)
        {
            SourceResult result;
            result.report.name = sources[i]->Name();

            // The deadline runs from when the job started, not from when it was queued
            const auto timeout = sources[i]->Timeout();
            bool started = began[i].wait_until(submitted + timeout) == std::future_status::ready;
            if (!started || futures[i].wait_until(began[i].get() + timeout) != std::future_status::ready)
            {
                result.report.outcome = SourceOutcome::TimedOut;
                if (started)
                    std::cerr << "[Scanner] Source " << result.report.name << " timed out after "
                              << timeout.count() << "ms\n";
                else
                    std::cerr << "[Scanner] Source " << result.report.name << " never started; pool is busy\n";
                results.push_back(std::move(result));
                continue;
            }

            try
            {
                result.sightings = futures[i].get();
                result.report.outcome = SourceOutcome::Ok;
                result.report.sightings = result.sightings.size();
            }
            catch (const std::exception &e)
            {
                result.report.outcome = SourceOutcome::Failed;
                std::cerr << "[Scanner] Source " << result.report.name << " failed: " << e.what() << "\n";
            }
            results.push_back(std::move(result));
        }
        return results;
    }

    size_t ScanOrchestrator::Apply(const std::vector<SourceResult> &results)
    {
        size_t observed = 0;
        std::map<std::string, std::string> pass_macs; // ip -> mac from this pass

        auto observe = [&](const PartialObservation &obs)
        {
            try
            {
                m_registry.Observe(obs);
                ++observed;
            }
            catch (const FormatError &e)
            {
                std::cerr << "[Scanner] Dropped sighting for " << obs.ip << ": " << e.what() << "\n";
            }
        };

        // Hardware-addressed sightings first so service sightings can be matched to them
        for (const auto &result : results)
        {
            for (const auto &sighting : result.sightings)
            {
                if (const auto *neighbor = std::get_if<NeighborSighting>(&sighting))
                {
                    pass_macs[neighbor->ip] = neighbor->mac;
                    observe(ToObservation(*neighbor));
                }
                else if (const auto *named = std::get_if<HostnameSighting>(&sighting))
                {
                    observe(ToObservation(*named));
                }
            }
        }

        size_t unmatched = 0;
        for (const auto &result : results)
        {
            for (const auto &sighting : result.sightings)
            {
                const auto *service = std::get_if<ServiceSighting>(&sighting);
                if (!service)
                    continue;

                std::optional<std::string> mac;
                auto it = pass_macs.find(service->ip);
                if (it != pass_macs.end())
                    mac = it->second;
                else
                    mac = m_registry.FindMacByIp(service->ip);

                if (!mac)
                {
                    ++unmatched;
                    continue;
                }
                observe(ToObservation(*service, *mac));
            }
        }

        if (unmatched > 0)
            std::cout << "[Scanner] " << unmatched << " service records had no known hardware address\n";
        return observed;
    }

    size_t ScanOrchestrator::ResolveMissingHostnames()
    {
        size_t filled = 0;

        for (const auto &dev : m_registry.GetOnline())
        {
            if (dev.hostname || dev.ip_address.empty())
                continue;

            std::optional<std::string> name = m_resolver->Resolve(dev.ip_address, m_settings.hostname_timeout);
            if (!name)
                continue;

            m_registry.Observe(ToObservation(HostnameSighting{dev.mac_address, dev.ip_address, *name}));
            ++filled;
        }

        if (filled > 0)
            std::cout << "[Scanner] Resolved " << filled << " hostnames\n";
        return filled;
    }

    ScanReport ScanOrchestrator::LastScanReport() const
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_lastReport;
    }
}
