#include "ArpSweepSource.hpp"
#include "../common/Config.hpp"
#include "../common/Errors.hpp"
#include "../common/MacAddress.hpp"

#include <tins/tins.h>

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <arpa/inet.h>
#include <unistd.h>

namespace lanwatch::discovery
{
    namespace mac = lanwatch::common::mac;
    using lanwatch::common::SourceUnavailable;

    static bool IsRoot()
    {
        return geteuid() == 0;
    }

    // libtins hands addresses around in network byte order
    static uint32_t ToHostOrder(const Tins::IPv4Address &ip)
    {
        return ntohl(static_cast<uint32_t>(ip));
    }

    static Tins::IPv4Address FromHostOrder(uint32_t ip)
    {
        return Tins::IPv4Address(htonl(ip));
    }

    std::vector<uint32_t> SweepTargets(uint32_t ip, uint32_t netmask, uint32_t max_hosts)
    {
        std::vector<uint32_t> targets;

        uint32_t network = ip & netmask;
        uint32_t broadcast = network | ~netmask;
        uint32_t first = network + 1;
        uint32_t last = broadcast;

        if (broadcast <= network + 1 || (last - first) > max_hosts)
        {
            network = ip & 0xFFFFFF00u;
            first = network + 1;
            last = network | 0xFFu;
        }

        for (uint32_t t = first; t < last; ++t)
        {
            if (t != ip)
                targets.push_back(t);
        }
        return targets;
    }

    ArpSweepSource::ArpSweepSource(const VendorDirectory &vendors, std::chrono::milliseconds settle)
        : m_vendors(vendors), m_settle(settle)
    {
    }

    std::chrono::milliseconds ArpSweepSource::Timeout() const
    {
        return config::ARP_SWEEP_TIMEOUT;
    }

    std::vector<Sighting> ArpSweepSource::Discover()
    {
        if (!IsRoot())
            throw SourceUnavailable("ARP sweep needs root privileges");

        Tins::NetworkInterface iface;
        Tins::NetworkInterface::Info info;
        try
        {
            iface = Tins::NetworkInterface::default_interface();
            info = iface.info();
        }
        catch (const std::exception &e)
        {
            throw SourceUnavailable(std::string("no default interface: ") + e.what());
        }

        const uint32_t own_ip = ToHostOrder(info.ip_addr);
        const std::string own_mac = mac::Normalize(info.hw_addr.to_string());
        std::vector<uint32_t> targets = SweepTargets(own_ip, ToHostOrder(info.netmask), config::ARP_SWEEP_MAX_HOSTS);

        std::map<std::string, std::string> replies; // ip -> mac
        std::mutex replies_mutex;
        std::atomic<bool> stop_sniffer(false);

        Tins::SnifferConfiguration sniff_config;
        sniff_config.set_promisc_mode(false);
        sniff_config.set_filter("arp");
        sniff_config.set_timeout(100);

        std::unique_ptr<Tins::Sniffer> sniffer;
        try
        {
            sniffer = std::make_unique<Tins::Sniffer>(iface.name(), sniff_config);
        }
        catch (const std::exception &e)
        {
            throw SourceUnavailable(std::string("cannot open capture on ") + iface.name() + ": " + e.what());
        }

        std::thread sniffer_thread([&]()
                                   {
            while (!stop_sniffer)
            {
                std::unique_ptr<Tins::PDU> pdu;
                try
                {
                    pdu.reset(sniffer->next_packet());
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[ArpSweep] Capture error: " << e.what() << "\n";
                    break;
                }
                if (!pdu)
                    continue;

                const Tins::ARP *arp = pdu->find_pdu<Tins::ARP>();
                if (!arp || arp->opcode() != Tins::ARP::REPLY)
                    continue;

                std::string found_mac = arp->sender_hw_addr().to_string();
                if (!mac::IsValid(found_mac))
                    continue;

                std::lock_guard<std::mutex> lock(replies_mutex);
                replies[arp->sender_ip_addr().to_string()] = mac::Normalize(found_mac);
            } });

        Tins::PacketSender sender;
        size_t send_failures = 0;
        for (uint32_t target : targets)
        {
            try
            {
                Tins::EthernetII request = Tins::EthernetII("ff:ff:ff:ff:ff:ff", info.hw_addr) /
                                           Tins::ARP(FromHostOrder(target), info.ip_addr,
                                                     Tins::HWAddress<6>("00:00:00:00:00:00"), info.hw_addr);
                sender.send(request, iface);
            }
            catch (const std::exception &e)
            {
                if (send_failures++ == 0)
                    std::cerr << "[ArpSweep] Send failed: " << e.what() << "\n";
            }
            std::this_thread::sleep_for(std::chrono::microseconds(300));
        }

        std::this_thread::sleep_for(m_settle);
        stop_sniffer = true;

        // Wake the capture loop in case no more traffic arrives
        try
        {
            Tins::EthernetII wake = Tins::EthernetII(info.hw_addr, info.hw_addr) / Tins::ARP(info.ip_addr, info.ip_addr);
            sender.send(wake, iface);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[ArpSweep] Wake frame failed: " << e.what() << "\n";
        }

        if (sniffer_thread.joinable())
            sniffer_thread.join();

        if (send_failures == targets.size() && !targets.empty())
            throw SourceUnavailable("every ARP request failed to send");

        std::vector<Sighting> sightings;
        std::lock_guard<std::mutex> lock(replies_mutex);
        for (const auto &reply : replies)
        {
            const std::string &found_mac = reply.second;
            if (found_mac == own_mac || mac::IsZero(found_mac) || mac::IsBroadcast(found_mac))
                continue;
            sightings.emplace_back(NeighborSighting{reply.first, found_mac, m_vendors.Lookup(found_mac)});
        }
        std::cout << "[ArpSweep] " << targets.size() << " addresses probed on " << iface.name()
                  << ", " << sightings.size() << " replied\n";
        return sightings;
    }
}
