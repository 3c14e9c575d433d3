#include "NeighborTableSource.hpp"
#include "../common/Config.hpp"
#include "../common/Errors.hpp"
#include "../common/MacAddress.hpp"

#include <tins/tins.h>

#include <iostream>
#include <map>
#include <regex>
#include <sstream>
#include <arpa/inet.h>

namespace lanwatch::discovery
{
    namespace mac = lanwatch::common::mac;
    using lanwatch::common::CommandError;
    using lanwatch::common::SourceTimeout;
    using lanwatch::common::SourceUnavailable;

    std::vector<NeighborSighting> ParseIpNeighOutput(const std::string &output)
    {
        std::vector<NeighborSighting> results;
        std::istringstream stream(output);
        std::string line;

        while (std::getline(stream, line))
        {
            std::istringstream ss(line);
            std::vector<std::string> tokens;
            std::string token;
            while (ss >> token)
                tokens.push_back(token);

            if (tokens.size() < 4)
                continue;

            const std::string &state = tokens.back();
            if (state == "FAILED" || state == "INCOMPLETE")
                continue;

            for (size_t i = 1; i + 1 < tokens.size(); ++i)
            {
                if (tokens[i] != "lladdr")
                    continue;
                if (mac::IsValid(tokens[i + 1]))
                    results.push_back({tokens[0], mac::Normalize(tokens[i + 1]), std::nullopt});
                break;
            }
        }
        return results;
    }

    std::vector<NeighborSighting> ParseArpOutput(const std::string &output)
    {
        static const std::regex pattern(R"(\((\d+\.\d+\.\d+\.\d+)\)\s+at\s+([0-9a-fA-F:]+))");

        std::vector<NeighborSighting> results;
        std::istringstream stream(output);
        std::string line;

        while (std::getline(stream, line))
        {
            std::smatch match;
            if (!std::regex_search(line, match, pattern))
                continue;
            if (!mac::IsValid(match[2].str()))
                continue;
            results.push_back({match[1].str(), mac::Normalize(match[2].str()), std::nullopt});
        }
        return results;
    }

    bool IsIgnoredNeighborIp(const std::string &ip)
    {
        in_addr addr{};
        if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
            return true;

        uint32_t value = ntohl(addr.s_addr);
        uint32_t first_octet = value >> 24;
        if (first_octet >= 224 && first_octet <= 239)
            return true;
        return (value & 0xFF) == 0xFF;
    }

    std::set<std::string> LocalMacAddresses()
    {
        std::set<std::string> own;
        try
        {
            for (const auto &iface : Tins::NetworkInterface::all())
            {
                std::string hw = iface.hw_address().to_string();
                if (!mac::IsValid(hw))
                    continue;
                std::string canonical = mac::Normalize(hw);
                if (!mac::IsZero(canonical))
                    own.insert(canonical);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scanner] Cannot enumerate local interfaces: " << e.what() << "\n";
        }
        return own;
    }

    NeighborTableSource::NeighborTableSource(std::shared_ptr<exec::CommandExecutor> executor,
                                             const VendorDirectory &vendors,
                                             std::set<std::string> own_macs)
        : m_executor(std::move(executor)), m_vendors(vendors), m_ownMacs(std::move(own_macs))
    {
    }

    std::chrono::milliseconds NeighborTableSource::Timeout() const
    {
        return config::NEIGHBOR_TABLE_TIMEOUT;
    }

    std::vector<Sighting> NeighborTableSource::Discover()
    {
        const auto deadline = std::chrono::steady_clock::now() + Timeout();
        std::vector<NeighborSighting> raw;
        bool have_table = false;

        try
        {
            exec::CommandResult result = m_executor->Run({"ip", "-4", "neigh", "show"},
                                                         Timeout(), config::NEIGHBOR_TABLE_TTL);
            if (result.exit_code == 0)
            {
                raw = ParseIpNeighOutput(result.stdout_text);
                have_table = true;
            }
        }
        catch (const CommandError &e)
        {
            std::cerr << "[Scanner] ip neigh unavailable: " << e.what() << "\n";
        }

        if (!have_table)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                throw SourceTimeout("neighbor table read exceeded its budget");

            try
            {
                exec::CommandResult result = m_executor->Run({"arp", "-an"}, remaining, config::NEIGHBOR_TABLE_TTL);
                if (result.exit_code != 0)
                    throw SourceUnavailable("arp -an exited with " + std::to_string(result.exit_code));
                raw = ParseArpOutput(result.stdout_text);
            }
            catch (const CommandError &e)
            {
                throw SourceUnavailable(std::string("no neighbor table tool: ") + e.what());
            }
        }

        std::vector<Sighting> sightings;
        for (auto &entry : Filter(std::move(raw)))
            sightings.emplace_back(std::move(entry));
        return sightings;
    }

    std::vector<NeighborSighting> NeighborTableSource::Filter(std::vector<NeighborSighting> raw) const
    {
        // Last entry wins when the table lists a MAC twice
        std::map<std::string, NeighborSighting> by_mac;

        for (auto &entry : raw)
        {
            if (mac::IsZero(entry.mac) || mac::IsBroadcast(entry.mac) || mac::IsMulticast(entry.mac))
                continue;
            if (m_ownMacs.count(entry.mac))
                continue;
            if (IsIgnoredNeighborIp(entry.ip))
                continue;

            entry.vendor = m_vendors.Lookup(entry.mac);
            by_mac[entry.mac] = std::move(entry);
        }

        std::vector<NeighborSighting> filtered;
        filtered.reserve(by_mac.size());
        for (auto &pair : by_mac)
            filtered.push_back(std::move(pair.second));
        return filtered;
    }
}
