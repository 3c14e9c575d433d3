#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "../exec/CommandRunner.hpp"

namespace lanwatch::discovery
{
    // Reverse lookup of an IP to a host name. Never throws; any failure is "no name".
    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;

        virtual std::optional<std::string> Resolve(const std::string &ip,
                                                   std::chrono::milliseconds timeout) = 0;
    };

    // Uses `getent hosts <ip>`, which consults /etc/hosts, DNS and mDNS per nsswitch.conf
    class GetentHostnameResolver : public HostnameResolver
    {
    public:
        explicit GetentHostnameResolver(std::shared_ptr<exec::CommandExecutor> executor);

        std::optional<std::string> Resolve(const std::string &ip,
                                           std::chrono::milliseconds timeout) override;

    private:
        std::shared_ptr<exec::CommandExecutor> m_executor;
    };

    // Canonical name from one `getent hosts` line ("10.0.0.5   nas.lan nas")
    std::optional<std::string> ParseGetentHostsOutput(const std::string &output, const std::string &ip);
}
