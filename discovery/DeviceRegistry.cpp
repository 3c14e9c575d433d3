#include "DeviceRegistry.hpp"
#include "DeviceClassifier.hpp"
#include "../common/Errors.hpp"
#include "../common/MacAddress.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <tuple>
#include <arpa/inet.h>

namespace lanwatch::discovery
{
    namespace mac = lanwatch::common::mac;

    static void FillIfKnown(std::optional<std::string> &field, const std::optional<std::string> &value)
    {
        if (value && !value->empty())
            field = value;
    }

    static void ApplyClassification(NetworkDevice &dev)
    {
        std::vector<std::string> services(dev.services.begin(), dev.services.end());
        Classification c = Infer(dev.vendor, dev.hostname, services, dev.mdns_name);

        if (c.type != DeviceType::Unknown)
            dev.device_type = c.type;
        if (c.os_hint)
            dev.os_hint = c.os_hint;
        if (c.model_hint)
            dev.model_hint = c.model_hint;
    }

    DeviceRegistry::DeviceRegistry(const VendorDirectory &vendors, DeviceNameStore &names)
        : m_vendors(vendors), m_names(names)
    {
    }

    bool DeviceRegistry::Observe(const PartialObservation &observation)
    {
        const std::string key = mac::Normalize(observation.mac);

        std::optional<std::string> vendor = observation.vendor;
        if (!vendor || vendor->empty())
            vendor = m_vendors.Lookup(key);

        const auto now = Clock::now();
        bool created = false;
        std::string announce;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            created = MergeLocked(key, observation, vendor, now, announce);
        }

        if (created)
            std::cout << "[Registry] New device " << announce << "\n";
        return created;
    }

    bool DeviceRegistry::MergeLocked(const std::string &key,
                                     const PartialObservation &observation,
                                     const std::optional<std::string> &vendor,
                                     Clock::time_point now,
                                     std::string &announce)
    {
        bool created = false;

        auto it = m_devices.find(key);
        if (it == m_devices.end())
        {
            NetworkDevice dev;
            dev.mac_address = key;
            // Read under the registry lock so a concurrent Rename cannot slip past the new record
            dev.custom_name = m_names.GetName(key);
            dev.first_seen = now;
            dev.last_seen = now;
            it = m_devices.emplace(key, std::move(dev)).first;
            created = true;
        }

        NetworkDevice &dev = it->second;
        if (!observation.ip.empty())
            dev.ip_address = observation.ip;

        FillIfKnown(dev.hostname, observation.hostname);
        FillIfKnown(dev.mdns_name, observation.mdns_name);
        if (!dev.vendor)
            FillIfKnown(dev.vendor, vendor);
        else
            FillIfKnown(dev.vendor, observation.vendor);

        for (const auto &service : observation.services)
        {
            if (!service.empty())
                dev.services.insert(service);
        }

        ApplyClassification(dev);

        dev.last_seen = std::max(dev.last_seen, now);
        dev.is_online = true;
        m_pending.erase(key);

        if (created)
        {
            announce = key + " at " + dev.ip_address;
            if (dev.vendor)
                announce += " (" + *dev.vendor + ")";
        }
        return created;
    }

    void DeviceRegistry::BeginPass()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.clear();
        for (const auto &entry : m_devices)
            m_pending.insert(entry.first);
        m_passActive = true;
    }

    size_t DeviceRegistry::EndPass()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_passActive)
            return 0;

        size_t went_offline = 0;
        for (const auto &key : m_pending)
        {
            auto it = m_devices.find(key);
            if (it == m_devices.end())
                continue;
            if (it->second.is_online)
                ++went_offline;
            it->second.is_online = false;
        }
        m_pending.clear();
        m_passActive = false;
        return went_offline;
    }

    bool DeviceRegistry::PassInProgress() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_passActive;
    }

    bool DisplayOrderLess(const NetworkDevice &a, const NetworkDevice &b)
    {
        auto key = [](const NetworkDevice &d)
        {
            in_addr addr{};
            bool is_ipv4 = inet_pton(AF_INET, d.ip_address.c_str(), &addr) == 1;
            uint32_t numeric = is_ipv4 ? ntohl(addr.s_addr) : 0;
            return std::tuple<bool, bool, bool, bool, uint32_t, const std::string &, const std::string &>(
                !d.custom_name.has_value(),
                !d.IsIdentified(),
                d.device_type == DeviceType::Unknown,
                !is_ipv4,
                numeric,
                d.ip_address,
                d.mac_address);
        };
        return key(a) < key(b);
    }

    std::vector<NetworkDevice> DeviceRegistry::GetAll() const
    {
        std::vector<NetworkDevice> snapshot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot.reserve(m_devices.size());
            for (const auto &entry : m_devices)
                snapshot.push_back(entry.second);
        }
        std::sort(snapshot.begin(), snapshot.end(), DisplayOrderLess);
        return snapshot;
    }

    std::vector<NetworkDevice> DeviceRegistry::GetOnline() const
    {
        std::vector<NetworkDevice> all = GetAll();
        all.erase(std::remove_if(all.begin(), all.end(),
                                 [](const NetworkDevice &d)
                                 { return !d.is_online; }),
                  all.end());
        return all;
    }

    DeviceCounts DeviceRegistry::GetCounts() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        DeviceCounts counts;
        counts.total = m_devices.size();
        for (const auto &entry : m_devices)
        {
            if (entry.second.is_online)
                ++counts.online;
        }
        return counts;
    }

    std::optional<NetworkDevice> DeviceRegistry::Find(const std::string &raw_mac) const
    {
        if (!mac::IsValid(raw_mac))
            return std::nullopt;
        const std::string key = mac::Normalize(raw_mac);

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(key);
        if (it == m_devices.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<std::string> DeviceRegistry::FindMacByIp(const std::string &ip) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const NetworkDevice *best = nullptr;
        for (const auto &entry : m_devices)
        {
            const NetworkDevice &dev = entry.second;
            if (dev.ip_address != ip)
                continue;
            // A stale record can still hold a reassigned address; prefer the freshest
            if (!best || dev.last_seen > best->last_seen)
                best = &dev;
        }
        if (!best)
            return std::nullopt;
        return best->mac_address;
    }

    void DeviceRegistry::Rename(const std::string &raw_mac, const std::string &name)
    {
        const std::string key = mac::Normalize(raw_mac);

        std::exception_ptr failure;
        try
        {
            m_names.SetName(key, name);
        }
        catch (const common::PersistenceError &e)
        {
            std::cerr << "[Registry] Name for " << key << " not saved: " << e.what() << "\n";
            failure = std::current_exception();
        }

        ApplyCustomName(key, name.empty() ? std::nullopt : std::optional<std::string>(name));

        if (failure)
            std::rethrow_exception(failure);
    }

    void DeviceRegistry::ClearName(const std::string &raw_mac)
    {
        const std::string key = mac::Normalize(raw_mac);

        std::exception_ptr failure;
        try
        {
            m_names.RemoveName(key);
        }
        catch (const common::PersistenceError &e)
        {
            std::cerr << "[Registry] Name removal for " << key << " not saved: " << e.what() << "\n";
            failure = std::current_exception();
        }

        ApplyCustomName(key, std::nullopt);

        if (failure)
            std::rethrow_exception(failure);
    }

    void DeviceRegistry::ApplyCustomName(const std::string &key, const std::optional<std::string> &name)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(key);
        if (it != m_devices.end())
            it->second.custom_name = name;
    }
}
