#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "DeviceNameStore.hpp"
#include "NetworkDevice.hpp"
#include "Observation.hpp"
#include "VendorDirectory.hpp"

namespace lanwatch::discovery
{
    struct DeviceCounts
    {
        size_t online = 0;
        size_t total = 0;
    };

    // The single authoritative device table. Every mutation goes through one
    // mutex held only for the in-memory update.
    //
    // Merge rules: ip always follows the latest sighting; optional fields are
    // filled but never cleared; services only grow; custom_name is only
    // written by Rename()/ClearName().
    //
    // Pass bracketing: BeginPass() marks every record pending, Observe()
    // clears the mark, EndPass() takes every still-pending record offline.
    // Records are never deleted.
    class DeviceRegistry
    {
    public:
        DeviceRegistry(const VendorDirectory &vendors, DeviceNameStore &names);

        DeviceRegistry(const DeviceRegistry &) = delete;
        DeviceRegistry &operator=(const DeviceRegistry &) = delete;

        // Returns true if the MAC had never been seen. Throws FormatError on a bad MAC.
        bool Observe(const PartialObservation &observation);

        void BeginPass();
        // Returns how many devices went offline
        size_t EndPass();
        bool PassInProgress() const;

        // Snapshot in display order: custom-named, identified, typed, then by IP
        std::vector<NetworkDevice> GetAll() const;
        std::vector<NetworkDevice> GetOnline() const;
        DeviceCounts GetCounts() const;

        std::optional<NetworkDevice> Find(const std::string &mac) const;
        std::optional<std::string> FindMacByIp(const std::string &ip) const;

        // The in-memory name changes even when the store fails to persist;
        // PersistenceError is rethrown afterwards.
        void Rename(const std::string &mac, const std::string &name);
        void ClearName(const std::string &mac);

    private:
        bool MergeLocked(const std::string &key,
                         const PartialObservation &observation,
                         const std::optional<std::string> &vendor,
                         Clock::time_point now,
                         std::string &announce);
        void ApplyCustomName(const std::string &mac, const std::optional<std::string> &name);

        const VendorDirectory &m_vendors;
        DeviceNameStore &m_names;

        mutable std::mutex m_mutex;
        std::map<std::string, NetworkDevice> m_devices;
        std::set<std::string> m_pending;
        bool m_passActive = false;
    };

    // Display-priority comparison used by GetAll()
    bool DisplayOrderLess(const NetworkDevice &a, const NetworkDevice &b);
}
