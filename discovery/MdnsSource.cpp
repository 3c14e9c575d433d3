#include "MdnsSource.hpp"
#include "../common/Config.hpp"
#include "../common/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <arpa/inet.h>

namespace lanwatch::discovery
{
    using lanwatch::common::CommandError;
    using lanwatch::common::SourceUnavailable;

    // Leave the runner time to kill avahi-browse before the orchestrator gives up
    static constexpr std::chrono::milliseconds KILL_MARGIN(250);

    std::string DecodeAvahiEscapes(const std::string &field)
    {
        std::string out;
        out.reserve(field.size());

        for (size_t i = 0; i < field.size(); ++i)
        {
            if (field[i] != '\\' || i + 1 >= field.size())
            {
                out += field[i];
                continue;
            }

            if (i + 3 < field.size() && std::isdigit(static_cast<unsigned char>(field[i + 1])) &&
                std::isdigit(static_cast<unsigned char>(field[i + 2])) &&
                std::isdigit(static_cast<unsigned char>(field[i + 3])))
            {
                int code = std::stoi(field.substr(i + 1, 3));
                out += static_cast<char>(code);
                i += 3;
            }
            else
            {
                out += field[i + 1];
                i += 1;
            }
        }
        return out;
    }

    static std::vector<std::string> SplitFields(const std::string &line)
    {
        std::vector<std::string> fields;
        std::string current;
        for (char c : line)
        {
            if (c == ';')
            {
                fields.push_back(current);
                current.clear();
            }
            else
            {
                current += c;
            }
        }
        fields.push_back(current);
        return fields;
    }

    static std::string StripLocalSuffix(const std::string &host)
    {
        static const std::string suffix = ".local";
        if (host.size() > suffix.size() &&
            host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0)
            return host.substr(0, host.size() - suffix.size());
        return host;
    }

    std::vector<ServiceSighting> ParseAvahiBrowseOutput(const std::string &output)
    {
        std::map<std::pair<std::string, std::string>, ServiceSighting> merged;
        std::vector<std::pair<std::string, std::string>> order;

        std::istringstream stream(output);
        std::string line;
        while (std::getline(stream, line))
        {
            if (line.empty() || line[0] != '=')
                continue;

            std::vector<std::string> fields = SplitFields(line);
            if (fields.size() < 9 || fields[2] != "IPv4")
                continue;

            const std::string &address = fields[7];
            in_addr addr{};
            if (inet_pton(AF_INET, address.c_str(), &addr) != 1)
                continue;

            std::string instance = DecodeAvahiEscapes(fields[3]);
            std::string service = fields[4];
            std::string host = StripLocalSuffix(DecodeAvahiEscapes(fields[6]));

            auto key = std::make_pair(address, instance);
            auto it = merged.find(key);
            if (it == merged.end())
            {
                ServiceSighting sighting;
                sighting.ip = address;
                sighting.instance_name = instance;
                if (!host.empty())
                    sighting.host_name = host;
                it = merged.emplace(key, std::move(sighting)).first;
                order.push_back(key);
            }

            auto &services = it->second.services;
            if (!service.empty() && std::find(services.begin(), services.end(), service) == services.end())
                services.push_back(service);
        }

        std::vector<ServiceSighting> results;
        results.reserve(order.size());
        for (const auto &key : order)
            results.push_back(std::move(merged[key]));
        return results;
    }

    MdnsSource::MdnsSource(std::shared_ptr<exec::CommandExecutor> executor)
        : m_executor(std::move(executor))
    {
    }

    std::chrono::milliseconds MdnsSource::Timeout() const
    {
        return config::MDNS_BROWSE_TIMEOUT;
    }

    std::vector<Sighting> MdnsSource::Discover()
    {
        exec::CommandResult result;
        try
        {
            // -k keeps the raw service types; without it avahi prints its database's display names
            result = m_executor->Run({"avahi-browse", "-a", "-k", "-p", "-r", "-t"},
                                     Timeout() - KILL_MARGIN, std::chrono::milliseconds(0));
        }
        catch (const CommandError &e)
        {
            throw SourceUnavailable(std::string("avahi-browse failed: ") + e.what());
        }

        if (result.exit_code != 0)
            throw SourceUnavailable("avahi-browse exited with " + std::to_string(result.exit_code) +
                                    ": " + result.stderr_text.substr(0, 200));

        std::vector<Sighting> sightings;
        for (auto &entry : ParseAvahiBrowseOutput(result.stdout_text))
            sightings.emplace_back(std::move(entry));
        return sightings;
    }
}
