#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../common/Config.hpp"
#include "../exec/CommandRunner.hpp"
#include "DeviceNameStore.hpp"
#include "DeviceRegistry.hpp"
#include "ResolutionScheduler.hpp"
#include "ScanOrchestrator.hpp"
#include "VendorDirectory.hpp"

namespace lanwatch::discovery
{
    struct ScannerOptions
    {
        // Empty means ResolveDataDirectory()
        std::string data_dir;
        // Empty means the first readable file of OuiSearchPaths()
        std::string oui_file;
        // Run the libtins ARP sweep during full scans
        bool active_probe = true;
        config::ScanSettings settings;
        // Defaults to a SystemCommandRunner with the default allow-list
        std::shared_ptr<exec::CommandExecutor> executor;
    };

    // Entry point for front ends. Owns every collaborator of a scanning session.
    class DeviceScanner
    {
    public:
        explicit DeviceScanner(ScannerOptions options = {});
        ~DeviceScanner();

        DeviceScanner(const DeviceScanner &) = delete;
        DeviceScanner &operator=(const DeviceScanner &) = delete;

        std::vector<NetworkDevice> GetAllDevices() const;
        DeviceCounts GetDeviceCount() const;

        // Throw FormatError for a bad MAC and PersistenceError when the names file cannot be written
        void SetDeviceName(const std::string &mac, const std::string &name);
        void ClearDeviceName(const std::string &mac);

        void RequestResolutionForVisible(const std::vector<std::string> &macs);
        bool Scan(bool force = false, bool quick = false);
        size_t ResolveMissingHostnames();
        ScanReport LastScanReport() const;

        // Background hostname resolution worker
        void Start();
        void Stop();

        const VendorDirectory &Vendors() const { return m_vendors; }
        const std::string &DataDirectory() const { return m_dataDir; }

    private:
        std::string m_dataDir;
        VendorDirectory m_vendors;
        DeviceNameStore m_names;
        DeviceRegistry m_registry;

        std::shared_ptr<exec::CommandExecutor> m_executor;
        // Set only when the scanner built its own runner
        std::shared_ptr<exec::SystemCommandRunner> m_runner;
        std::shared_ptr<HostnameResolver> m_resolver;
        std::unique_ptr<ScanOrchestrator> m_orchestrator;
        std::unique_ptr<LazyResolutionScheduler> m_scheduler;
    };
}
