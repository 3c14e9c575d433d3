#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "DiscoverySource.hpp"
#include "VendorDirectory.hpp"

namespace lanwatch::discovery
{
    // Active probe: broadcasts an ARP request to every address of the default
    // interface's subnet and collects the replies for a settle window.
    // Needs raw socket access (root); otherwise Discover() throws SourceUnavailable.
    class ArpSweepSource : public DiscoverySource
    {
    public:
        ArpSweepSource(const VendorDirectory &vendors,
                       std::chrono::milliseconds settle = std::chrono::milliseconds(2000));

        std::string Name() const override { return "arp-sweep"; }
        std::chrono::milliseconds Timeout() const override;
        std::vector<Sighting> Discover() override;

    private:
        const VendorDirectory &m_vendors;
        std::chrono::milliseconds m_settle;
    };

    // Host addresses to probe for the given interface address and netmask
    // (host byte order). Subnets larger than max_hosts fall back to the /24
    // around the interface address. The interface address itself is excluded.
    std::vector<uint32_t> SweepTargets(uint32_t ip, uint32_t netmask, uint32_t max_hosts);
}
