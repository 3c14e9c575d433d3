#include "DeviceScanner.hpp"
#include "ArpSweepSource.hpp"
#include "MdnsSource.hpp"
#include "NeighborTableSource.hpp"

#include <filesystem>
#include <iostream>

namespace lanwatch::discovery
{
    static std::string DataDirFor(const ScannerOptions &options)
    {
        if (!options.data_dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(options.data_dir, ec);
            if (ec)
                std::cerr << "[Config] Cannot create data directory " << options.data_dir << ": " << ec.message() << "\n";
            return options.data_dir;
        }
        return config::ResolveDataDirectory();
    }

    static VendorDirectory VendorsFor(const ScannerOptions &options)
    {
        if (!options.oui_file.empty())
            return VendorDirectory::LoadFromFile(options.oui_file);
        return VendorDirectory::LoadFirstAvailable(config::OuiSearchPaths());
    }

    DeviceScanner::DeviceScanner(ScannerOptions options)
        : m_dataDir(DataDirFor(options)),
          m_vendors(VendorsFor(options)),
          m_names((std::filesystem::path(m_dataDir) / config::NAMES_FILE).string()),
          m_registry(m_vendors, m_names),
          m_executor(options.executor)
    {
        bool have_avahi = true;
        if (!m_executor)
        {
            m_runner = std::make_shared<exec::SystemCommandRunner>(config::DefaultAllowedCommands());
            m_executor = m_runner;
            have_avahi = m_runner->HasTool("avahi-browse");
        }

        auto neighbors = std::make_shared<NeighborTableSource>(m_executor, m_vendors, LocalMacAddresses());

        std::vector<std::shared_ptr<DiscoverySource>> slow;
        if (options.active_probe)
            slow.push_back(std::make_shared<ArpSweepSource>(m_vendors, config::ARP_SWEEP_SETTLE));
        if (have_avahi)
            slow.push_back(std::make_shared<MdnsSource>(m_executor));
        else
            std::cerr << "[Scanner] avahi-browse not installed; mDNS discovery disabled\n";

        m_resolver = std::make_shared<GetentHostnameResolver>(m_executor);
        m_orchestrator = std::make_unique<ScanOrchestrator>(m_registry, neighbors, std::move(slow),
                                                            m_resolver, options.settings);
        m_scheduler = std::make_unique<LazyResolutionScheduler>(m_registry, m_resolver, options.settings);
    }

    DeviceScanner::~DeviceScanner()
    {
        Stop();
        if (!m_names.Flush())
            std::cerr << "[NameStore] Unsaved names left in memory for " << m_names.Path() << "\n";
    }

    std::vector<NetworkDevice> DeviceScanner::GetAllDevices() const
    {
        return m_registry.GetAll();
    }

    DeviceCounts DeviceScanner::GetDeviceCount() const
    {
        return m_registry.GetCounts();
    }

    void DeviceScanner::SetDeviceName(const std::string &mac, const std::string &name)
    {
        m_registry.Rename(mac, name);
    }

    void DeviceScanner::ClearDeviceName(const std::string &mac)
    {
        m_registry.ClearName(mac);
    }

    void DeviceScanner::RequestResolutionForVisible(const std::vector<std::string> &macs)
    {
        m_scheduler->RequestResolutionForVisible(macs);
    }

    bool DeviceScanner::Scan(bool force, bool quick)
    {
        if (!m_orchestrator->Scan(force, quick))
            return false;

        // The sweep refreshed the kernel table; the next quick scan must not see the cached copy
        if (!quick && m_runner)
            m_runner->Invalidate({"ip", "-4", "neigh", "show"});

        if (!quick && m_names.IsDirty() && !m_names.Flush())
            std::cerr << "[Scanner] Device names remain unsaved\n";
        return true;
    }

    size_t DeviceScanner::ResolveMissingHostnames()
    {
        return m_orchestrator->ResolveMissingHostnames();
    }

    ScanReport DeviceScanner::LastScanReport() const
    {
        return m_orchestrator->LastScanReport();
    }

    void DeviceScanner::Start()
    {
        m_scheduler->Start();
    }

    void DeviceScanner::Stop()
    {
        m_scheduler->Stop();
    }
}
