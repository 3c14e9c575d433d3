#pragma once

#include <optional>
#include <string>
#include <vector>
#include "NetworkDevice.hpp"

namespace lanwatch::discovery
{
    struct Classification
    {
        DeviceType type = DeviceType::Unknown;
        std::optional<std::string> os_hint;
        std::optional<std::string> model_hint;
    };

    // Best-effort guess from whatever is known so far. First match wins:
    //   1. hostname keywords (hostname first, then the mDNS name)
    //   2. advertised service tags, in the order given
    //   3. vendor defaults
    // otherwise Unknown with no hints. Pure and deterministic.
    Classification Infer(const std::optional<std::string> &vendor,
                         const std::optional<std::string> &hostname,
                         const std::vector<std::string> &services = {},
                         const std::optional<std::string> &mdns_name = std::nullopt);
}
