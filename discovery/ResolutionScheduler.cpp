#include "ResolutionScheduler.hpp"
#include "../common/MacAddress.hpp"

#include <iostream>

namespace lanwatch::discovery
{
    namespace mac = lanwatch::common::mac;

    LazyResolutionScheduler::LazyResolutionScheduler(DeviceRegistry &registry,
                                                     std::shared_ptr<HostnameResolver> resolver,
                                                     config::ScanSettings settings)
        : m_registry(registry), m_resolver(std::move(resolver)), m_settings(settings), m_running(false)
    {
    }

    LazyResolutionScheduler::~LazyResolutionScheduler()
    {
        Stop();
    }

    void LazyResolutionScheduler::RequestResolutionForVisible(const std::vector<std::string> &macs)
    {
        std::set<std::string> wanted;
        for (const auto &entry : macs)
        {
            if (mac::IsValid(entry))
                wanted.insert(mac::Normalize(entry));
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_wanted = std::move(wanted);
        }
        m_cv.notify_all();
    }

    size_t LazyResolutionScheduler::PendingCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_wanted.size();
    }

    std::optional<std::string> LazyResolutionScheduler::TakeNext()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_wanted.empty() || m_stopRequested)
            return std::nullopt;

        std::string next = *m_wanted.begin();
        m_wanted.erase(m_wanted.begin());
        return next;
    }

    size_t LazyResolutionScheduler::DrainOnce()
    {
        size_t lookups = 0;

        while (auto next = TakeNext())
        {
            std::optional<NetworkDevice> dev = m_registry.Find(*next);
            if (!dev || dev->hostname || dev->ip_address.empty())
                continue;

            if (lookups > 0 && m_settings.resolution_pacing.count() > 0)
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait_for(lock, m_settings.resolution_pacing, [this]
                              { return m_stopRequested; });
            }

            ++lookups;
            std::optional<std::string> name = m_resolver->Resolve(dev->ip_address, m_settings.hostname_timeout);
            if (name)
                m_registry.Observe(ToObservation(HostnameSighting{dev->mac_address, dev->ip_address, *name}));
        }
        return lookups;
    }

    void LazyResolutionScheduler::Start()
    {
        if (m_running)
            return;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopRequested = false;
        }
        m_running = true;
        m_thread = std::thread(&LazyResolutionScheduler::WorkerLoop, this);
    }

    void LazyResolutionScheduler::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopRequested = true;
        }
        m_running = false;
        m_cv.notify_all();

        if (m_thread.joinable())
            m_thread.join();
    }

    void LazyResolutionScheduler::WorkerLoop()
    {
        while (m_running)
        {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait_for(lock, m_settings.resolution_poll_interval, [this]
                              { return m_stopRequested || !m_wanted.empty(); });
                if (m_stopRequested)
                    break;
            }

            try
            {
                DrainOnce();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Resolver] Drain failed: " << e.what() << "\n";
            }
        }
    }
}
