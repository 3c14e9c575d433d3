#include "Observation.hpp"

namespace lanwatch::discovery
{
    static std::optional<std::string> NonEmpty(const std::string &value)
    {
        if (value.empty())
            return std::nullopt;
        return value;
    }

    PartialObservation ToObservation(const NeighborSighting &sighting)
    {
        PartialObservation obs;
        obs.mac = sighting.mac;
        obs.ip = sighting.ip;
        obs.vendor = sighting.vendor;
        return obs;
    }

    PartialObservation ToObservation(const ServiceSighting &sighting, const std::string &mac)
    {
        PartialObservation obs;
        obs.mac = mac;
        obs.ip = sighting.ip;
        obs.mdns_name = NonEmpty(sighting.instance_name);
        if (sighting.host_name)
            obs.hostname = NonEmpty(*sighting.host_name);
        obs.services = sighting.services;
        return obs;
    }

    PartialObservation ToObservation(const HostnameSighting &sighting)
    {
        PartialObservation obs;
        obs.mac = sighting.mac;
        obs.ip = sighting.ip;
        obs.hostname = NonEmpty(sighting.hostname);
        return obs;
    }
}
