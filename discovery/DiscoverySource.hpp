#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "Observation.hpp"

namespace lanwatch::discovery
{
    // One independent, unreliable way of finding devices. Discover() blocks
    // and may throw (SourceUnavailable, CommandError, ...); the orchestrator
    // treats any failure as "nothing found this pass".
    class DiscoverySource
    {
    public:
        virtual ~DiscoverySource() = default;

        virtual std::string Name() const = 0;
        virtual std::chrono::milliseconds Timeout() const = 0;
        virtual std::vector<Sighting> Discover() = 0;

        // Whether sightings name devices by hardware address. A full pass is
        // only conclusive about absent devices when such a source answered.
        virtual bool ReportsHardwareAddresses() const { return true; }
    };
}
