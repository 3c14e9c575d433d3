#pragma once

#include <memory>
#include <string>
#include <vector>
#include "DiscoverySource.hpp"
#include "../exec/CommandRunner.hpp"

namespace lanwatch::discovery
{
    // Multicast DNS service discovery through avahi-browse. Yields service
    // sightings keyed by IP; the orchestrator attaches them to a MAC.
    class MdnsSource : public DiscoverySource
    {
    public:
        explicit MdnsSource(std::shared_ptr<exec::CommandExecutor> executor);

        std::string Name() const override { return "mdns"; }
        std::chrono::milliseconds Timeout() const override;
        std::vector<Sighting> Discover() override;
        bool ReportsHardwareAddresses() const override { return false; }

    private:
        std::shared_ptr<exec::CommandExecutor> m_executor;
    };

    // Parses `avahi-browse -a -k -p -r -t` output. Only resolved IPv4 records
    // ("=;iface;IPv4;name;type;domain;host;address;port;txt") are used;
    // services of one instance at one address are merged.
    std::vector<ServiceSighting> ParseAvahiBrowseOutput(const std::string &output);

    // avahi escapes bytes as \DDD (decimal) and punctuation as \<char>
    std::string DecodeAvahiEscapes(const std::string &field);
}
