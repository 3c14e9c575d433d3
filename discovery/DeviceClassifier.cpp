#include "DeviceClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace lanwatch::discovery
{
    namespace
    {
        struct HostnameRule
        {
            std::regex pattern;
            DeviceType type;
            const char *os_hint;
            const char *model_hint;
        };

        HostnameRule Rule(const char *pattern, DeviceType type, const char *os, const char *model)
        {
            return {std::regex(pattern, std::regex::icase | std::regex::optimize), type, os, model};
        }

        const std::vector<HostnameRule> &HostnameRules()
        {
            static const std::vector<HostnameRule> rules = {
                Rule("iphone|ios", DeviceType::Phone, "iOS", "iPhone"),
                Rule("ipad", DeviceType::Tablet, "iPadOS", "iPad"),
                Rule("macbook|mbp|mba", DeviceType::Laptop, "macOS", "MacBook"),
                Rule("imac|mac-?pro|mac-?mini|mac-?studio", DeviceType::Desktop, "macOS", nullptr),
                Rule("apple-?watch|watch", DeviceType::Watch, "watchOS", "Apple Watch"),
                Rule("apple-?tv|appletv", DeviceType::TV, "tvOS", "Apple TV"),
                Rule("homepod", DeviceType::Speaker, nullptr, "HomePod"),
                Rule("android|pixel|galaxy|oneplus|xiaomi|redmi", DeviceType::Phone, "Android", nullptr),
                Rule("echo|alexa", DeviceType::Speaker, nullptr, "Amazon Echo"),
                Rule("fire-?tv|firestick", DeviceType::TV, nullptr, "Fire TV"),
                Rule("chromecast", DeviceType::TV, nullptr, "Chromecast"),
                Rule("roku", DeviceType::TV, nullptr, "Roku"),
                Rule("playstation|ps[345]", DeviceType::Gaming, nullptr, "PlayStation"),
                Rule("xbox", DeviceType::Gaming, nullptr, "Xbox"),
                Rule("switch", DeviceType::Gaming, nullptr, "Nintendo Switch"),
                Rule("printer|print|laserjet|deskjet", DeviceType::Printer, nullptr, nullptr),
                Rule("cam|camera|doorbell", DeviceType::Camera, nullptr, nullptr),
                Rule("tv|television|smarttv|bravia|webos|tizen", DeviceType::TV, nullptr, nullptr),
                Rule("sonos|speaker", DeviceType::Speaker, nullptr, nullptr),
                Rule("desktop|workstation|pc", DeviceType::Desktop, "Windows", nullptr),
                Rule("laptop|notebook|surface", DeviceType::Laptop, "Windows", nullptr),
                Rule("raspberry|raspi|pi[0-9]", DeviceType::IoT, "Linux", "Raspberry Pi"),
            };
            return rules;
        }

        const std::vector<std::pair<std::string, DeviceType>> &ServiceRules()
        {
            static const std::vector<std::pair<std::string, DeviceType>> rules = {
                {"_airplay._tcp", DeviceType::TV},
                {"_raop._tcp", DeviceType::Speaker},
                {"_googlecast._tcp", DeviceType::TV},
                {"_spotify-connect._tcp", DeviceType::Speaker},
                {"_printer._tcp", DeviceType::Printer},
                {"_ipp._tcp", DeviceType::Printer},
                {"_ipps._tcp", DeviceType::Printer},
                {"_scanner._tcp", DeviceType::Printer},
                {"_hap._tcp", DeviceType::IoT},
                {"_homekit._tcp", DeviceType::IoT},
                {"_smb._tcp", DeviceType::Desktop},
                {"_afpovertcp._tcp", DeviceType::Desktop},
                {"_ssh._tcp", DeviceType::Desktop},
                {"_companion-link._tcp", DeviceType::Phone},
                {"_apple-mobdev2._tcp", DeviceType::Phone},
            };
            return rules;
        }

        // Substring match against the lower-cased vendor name; order is the tie-break
        const std::vector<std::pair<std::string, DeviceType>> &VendorRules()
        {
            static const std::vector<std::pair<std::string, DeviceType>> rules = {
                // Network equipment
                {"huawei", DeviceType::Router},
                {"cisco", DeviceType::Router},
                {"netgear", DeviceType::Router},
                {"tp-link", DeviceType::Router},
                {"linksys", DeviceType::Router},
                {"asus", DeviceType::Router},
                {"d-link", DeviceType::Router},
                {"ubiquiti", DeviceType::Router},
                {"aruba", DeviceType::Router},
                {"mikrotik", DeviceType::Router},
                {"zyxel", DeviceType::Router},

                // Smart home
                {"espressif", DeviceType::IoT},
                {"tuya", DeviceType::IoT},
                {"shelly", DeviceType::IoT},
                {"sonoff", DeviceType::IoT},
                {"ewelink", DeviceType::IoT},
                {"xiaomi", DeviceType::IoT},
                {"philips", DeviceType::IoT},
                {"signify", DeviceType::IoT},
                {"nest", DeviceType::IoT},
                {"raspberry", DeviceType::IoT},
                {"ring", DeviceType::Camera},
                {"wyze", DeviceType::Camera},
                {"eufy", DeviceType::Camera},
                {"arlo", DeviceType::Camera},
                {"shanghai high-flying", DeviceType::IoT},

                // Phones
                {"samsung", DeviceType::Phone},
                {"oneplus", DeviceType::Phone},
                {"oppo", DeviceType::Phone},
                {"vivo", DeviceType::Phone},
                {"motorola", DeviceType::Phone},
                {"google", DeviceType::Phone},

                // TV and media
                {"roku", DeviceType::TV},
                {"lg electronics", DeviceType::TV},
                {"tcl", DeviceType::TV},
                {"vizio", DeviceType::TV},
                {"hisense", DeviceType::TV},

                // Audio
                {"sonos", DeviceType::Speaker},
                {"bose", DeviceType::Speaker},
                {"harman", DeviceType::Speaker},

                // Consoles
                {"sony", DeviceType::Gaming},
                {"microsoft", DeviceType::Gaming},
                {"nintendo", DeviceType::Gaming},
                {"valve", DeviceType::Gaming},

                // Printers
                {"epson", DeviceType::Printer},
                {"hp inc", DeviceType::Printer},
                {"hewlett", DeviceType::Printer},
                {"canon", DeviceType::Printer},
                {"brother", DeviceType::Printer},
                {"xerox", DeviceType::Printer},

                // Computers
                {"intel", DeviceType::Desktop},
                {"dell", DeviceType::Desktop},
                {"lenovo", DeviceType::Desktop},
                {"asrock", DeviceType::Desktop},
                {"gigabyte", DeviceType::Desktop},
                {"amd", DeviceType::Desktop},

                // Refined by hostname or services when those are known
                {"apple", DeviceType::Laptop},
            };
            return rules;
        }

        std::optional<std::string> Hint(const char *value)
        {
            if (value == nullptr)
                return std::nullopt;
            return std::string(value);
        }

        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }
    }

    Classification Infer(const std::optional<std::string> &vendor,
                         const std::optional<std::string> &hostname,
                         const std::vector<std::string> &services,
                         const std::optional<std::string> &mdns_name)
    {
        Classification result;

        std::vector<const std::string *> names;
        if (hostname && !hostname->empty())
            names.push_back(&*hostname);
        if (mdns_name && !mdns_name->empty())
            names.push_back(&*mdns_name);

        if (!names.empty())
        {
            for (const auto &rule : HostnameRules())
            {
                for (const std::string *name : names)
                {
                    if (std::regex_search(*name, rule.pattern))
                    {
                        result.type = rule.type;
                        result.os_hint = Hint(rule.os_hint);
                        result.model_hint = Hint(rule.model_hint);
                        return result;
                    }
                }
            }
        }

        for (const auto &service : services)
        {
            for (const auto &rule : ServiceRules())
            {
                if (service == rule.first)
                {
                    result.type = rule.second;
                    return result;
                }
            }
        }

        if (vendor && !vendor->empty())
        {
            std::string lowered = ToLower(*vendor);
            for (const auto &rule : VendorRules())
            {
                if (lowered.find(rule.first) != std::string::npos)
                {
                    result.type = rule.second;
                    return result;
                }
            }
        }

        return result;
    }
}
