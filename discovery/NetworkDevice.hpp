#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace lanwatch::discovery
{
    enum class DeviceType
    {
        Unknown,
        Desktop,
        Laptop,
        Phone,
        Tablet,
        TV,
        Speaker,
        IoT,
        Router,
        Printer,
        Camera,
        Gaming,
        Watch
    };

    const char *ToString(DeviceType type);

    using Clock = std::chrono::system_clock;

    struct NetworkDevice
    {
        std::string mac_address;
        std::string ip_address;

        std::optional<std::string> hostname;
        std::optional<std::string> vendor;
        std::optional<std::string> mdns_name;
        std::optional<std::string> model_hint;
        std::optional<std::string> os_hint;

        DeviceType device_type = DeviceType::Unknown;

        // User override; discovery never writes it
        std::optional<std::string> custom_name;

        std::set<std::string> services;

        Clock::time_point first_seen;
        Clock::time_point last_seen;
        bool is_online = false;

        // Custom > mDNS > model > short hostname > vendor > IP
        std::string DisplayName() const;

        // Known hostname or model
        bool IsIdentified() const;
    };

    // Identity is the hardware address alone
    inline bool operator==(const NetworkDevice &a, const NetworkDevice &b)
    {
        return a.mac_address == b.mac_address;
    }

    inline bool operator!=(const NetworkDevice &a, const NetworkDevice &b)
    {
        return !(a == b);
    }

    struct NetworkDeviceHash
    {
        size_t operator()(const NetworkDevice &device) const
        {
            return std::hash<std::string>()(device.mac_address);
        }
    };
}
