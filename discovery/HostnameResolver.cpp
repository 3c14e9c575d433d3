#include "HostnameResolver.hpp"
#include "../common/Errors.hpp"

#include <iostream>
#include <sstream>

namespace lanwatch::discovery
{
    // getent: key not found in database
    static constexpr int GETENT_NOT_FOUND = 2;

    std::optional<std::string> ParseGetentHostsOutput(const std::string &output, const std::string &ip)
    {
        std::istringstream stream(output);
        std::string address;
        std::string name;
        if (!(stream >> address >> name))
            return std::nullopt;

        // A trailing dot is DNS notation for the root
        if (name.size() > 1 && name.back() == '.')
            name.pop_back();

        if (name.empty() || name == ip || name == address)
            return std::nullopt;
        return name;
    }

    GetentHostnameResolver::GetentHostnameResolver(std::shared_ptr<exec::CommandExecutor> executor)
        : m_executor(std::move(executor))
    {
    }

    std::optional<std::string> GetentHostnameResolver::Resolve(const std::string &ip,
                                                               std::chrono::milliseconds timeout)
    {
        exec::CommandResult result;
        try
        {
            result = m_executor->Run({"getent", "hosts", ip}, timeout, std::chrono::milliseconds(0));
        }
        catch (const common::CommandError &e)
        {
            std::cerr << "[Resolver] Lookup for " << ip << " failed: " << e.what() << "\n";
            return std::nullopt;
        }

        if (result.exit_code == GETENT_NOT_FOUND)
            return std::nullopt;
        if (result.exit_code != 0)
        {
            std::cerr << "[Resolver] getent exited with " << result.exit_code << " for " << ip << "\n";
            return std::nullopt;
        }
        return ParseGetentHostsOutput(result.stdout_text, ip);
    }
}
