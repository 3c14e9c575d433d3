#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lanwatch::config
{
    using namespace std::chrono_literals;

    // Scanning cadence
    inline constexpr std::chrono::seconds MIN_SCAN_INTERVAL = 30s;
    inline constexpr std::chrono::seconds DEFAULT_WATCH_INTERVAL = 60s;

    // Per-source timeouts
    inline constexpr std::chrono::milliseconds NEIGHBOR_TABLE_TIMEOUT = 1000ms;
    inline constexpr std::chrono::milliseconds ARP_SWEEP_TIMEOUT = 6000ms;
    inline constexpr std::chrono::milliseconds ARP_SWEEP_SETTLE = 2000ms;
    inline constexpr std::chrono::milliseconds MDNS_BROWSE_TIMEOUT = 5000ms;
    inline constexpr std::chrono::milliseconds HOSTNAME_RESOLVE_TIMEOUT = 2000ms;

    // Neighbor table changes slowly; repeated quick scans may reuse it
    inline constexpr std::chrono::milliseconds NEIGHBOR_TABLE_TTL = 10000ms;
    inline constexpr std::chrono::milliseconds TOOL_CHECK_TTL = 3600000ms;

    inline constexpr std::chrono::milliseconds RESOLUTION_POLL_INTERVAL = 500ms;
    inline constexpr std::chrono::milliseconds RESOLUTION_PACING = 100ms;

    // ARP sweep never probes more than a /23
    inline constexpr uint32_t ARP_SWEEP_MAX_HOSTS = 512;

    inline constexpr size_t COMMAND_CACHE_MAX_ENTRIES = 50;
    inline constexpr size_t COMMAND_OUTPUT_LIMIT = 4 * 1024 * 1024;

    inline constexpr const char *DATA_DIR_NAME = ".lanwatch";
    inline constexpr const char *DATA_DIR_ENV = "LANWATCH_DATA_DIR";
    inline constexpr const char *NAMES_FILE = "device_names.json";

    inline const std::vector<std::string> &OuiSearchPaths()
    {
        static const std::vector<std::string> paths = {
            "data/oui.txt",
            "/usr/local/share/lanwatch/oui.txt",
            "/usr/share/lanwatch/oui.txt",
            "/usr/local/share/arp-scan/ieee-oui.txt",
            "/usr/share/arp-scan/ieee-oui.txt",
        };
        return paths;
    }

    inline const std::vector<std::string> &DefaultAllowedCommands()
    {
        static const std::vector<std::string> commands = {
            "ip",
            "arp",
            "avahi-browse",
            "getent",
            "which",
        };
        return commands;
    }

    struct ScanSettings
    {
        std::chrono::milliseconds min_scan_interval = MIN_SCAN_INTERVAL;
        std::chrono::milliseconds hostname_timeout = HOSTNAME_RESOLVE_TIMEOUT;
        std::chrono::milliseconds resolution_poll_interval = RESOLUTION_POLL_INTERVAL;
        std::chrono::milliseconds resolution_pacing = RESOLUTION_PACING;
    };

    // $LANWATCH_DATA_DIR, then $XDG_DATA_HOME/lanwatch, then $HOME/.lanwatch.
    // The directory is created if missing.
    std::string ResolveDataDirectory();
}
