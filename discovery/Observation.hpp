#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lanwatch::discovery
{
    // What one source learned about one device. mac and ip are required.
    struct PartialObservation
    {
        std::string mac;
        std::string ip;
        std::optional<std::string> hostname;
        std::optional<std::string> vendor;
        std::optional<std::string> mdns_name;
        std::vector<std::string> services;
    };

    // Neighbor table read or ARP probe reply
    struct NeighborSighting
    {
        std::string ip;
        std::string mac;
        std::optional<std::string> vendor;
    };

    // Multicast service discovery; carries no hardware address
    struct ServiceSighting
    {
        std::string ip;
        std::string instance_name;
        std::optional<std::string> host_name;
        std::vector<std::string> services;
    };

    struct HostnameSighting
    {
        std::string mac;
        std::string ip;
        std::string hostname;
    };

    using Sighting = std::variant<NeighborSighting, ServiceSighting, HostnameSighting>;

    PartialObservation ToObservation(const NeighborSighting &sighting);
    PartialObservation ToObservation(const ServiceSighting &sighting, const std::string &mac);
    PartialObservation ToObservation(const HostnameSighting &sighting);
}
