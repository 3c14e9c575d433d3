#include "NetworkDevice.hpp"

namespace lanwatch::discovery
{
    const char *ToString(DeviceType type)
    {
        switch (type)
        {
        case DeviceType::Desktop:
            return "desktop";
        case DeviceType::Laptop:
            return "laptop";
        case DeviceType::Phone:
            return "phone";
        case DeviceType::Tablet:
            return "tablet";
        case DeviceType::TV:
            return "tv";
        case DeviceType::Speaker:
            return "speaker";
        case DeviceType::IoT:
            return "iot";
        case DeviceType::Router:
            return "router";
        case DeviceType::Printer:
            return "printer";
        case DeviceType::Camera:
            return "camera";
        case DeviceType::Gaming:
            return "gaming";
        case DeviceType::Watch:
            return "watch";
        case DeviceType::Unknown:
            break;
        }
        return "unknown";
    }

    std::string NetworkDevice::DisplayName() const
    {
        if (custom_name)
            return *custom_name;
        if (mdns_name)
            return *mdns_name;
        if (model_hint)
            return *model_hint;
        if (hostname && *hostname != ip_address)
            return hostname->substr(0, hostname->find('.'));
        if (vendor)
            return *vendor;
        return ip_address;
    }

    bool NetworkDevice::IsIdentified() const
    {
        return hostname.has_value() || model_hint.has_value();
    }
}
