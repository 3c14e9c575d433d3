#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>
#include "DiscoverySource.hpp"
#include "VendorDirectory.hpp"
#include "../exec/CommandRunner.hpp"

namespace lanwatch::discovery
{
    // Reads the kernel neighbor (ARP) cache. Cheap and bounded, so it is the
    // only source a quick scan uses.
    class NeighborTableSource : public DiscoverySource
    {
    public:
        NeighborTableSource(std::shared_ptr<exec::CommandExecutor> executor,
                            const VendorDirectory &vendors,
                            std::set<std::string> own_macs = {});

        std::string Name() const override { return "neighbor-table"; }
        std::chrono::milliseconds Timeout() const override;
        std::vector<Sighting> Discover() override;

    private:
        std::vector<NeighborSighting> Filter(std::vector<NeighborSighting> raw) const;

        std::shared_ptr<exec::CommandExecutor> m_executor;
        const VendorDirectory &m_vendors;
        std::set<std::string> m_ownMacs;
    };

    // "192.168.1.1 dev eth0 lladdr 00:11:22:33:44:55 REACHABLE"
    std::vector<NeighborSighting> ParseIpNeighOutput(const std::string &output);

    // "? (192.168.1.1) at 00:11:22:33:44:55 [ether] on eth0"
    std::vector<NeighborSighting> ParseArpOutput(const std::string &output);

    // Multicast (224-239) and x.x.x.255 addresses never identify a device
    bool IsIgnoredNeighborIp(const std::string &ip);

    // Hardware addresses of this host's interfaces, canonical form
    std::set<std::string> LocalMacAddresses();
}
