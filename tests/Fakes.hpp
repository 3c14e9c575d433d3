#pragma once

#include "../common/Errors.hpp"
#include "../discovery/DiscoverySource.hpp"
#include "../discovery/HostnameResolver.hpp"
#include "../exec/CommandRunner.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lanwatch::testing
{
    // Canned command output keyed by the joined command line. Unknown
    // commands behave like a missing executable.
    class FakeCommandExecutor : public exec::CommandExecutor
    {
    public:
        void Respond(const std::string &command, int exit_code, const std::string &out, const std::string &err = "")
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_responses[command] = {exit_code, out, err};
        }

        void TimeOut(const std::string &command)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_timeouts.insert(command);
        }

        exec::CommandResult Run(const std::vector<std::string> &argv,
                                std::chrono::milliseconds,
                                std::chrono::milliseconds) override
        {
            const std::string command = exec::JoinCommand(argv);
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back(command);

            if (m_timeouts.count(command))
                throw common::CommandTimeout(command);

            auto it = m_responses.find(command);
            if (it == m_responses.end())
                throw common::CommandError("Command not found", command);
            return it->second;
        }

        std::vector<std::string> Calls() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_calls;
        }

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, exec::CommandResult> m_responses;
        std::set<std::string> m_timeouts;
        std::vector<std::string> m_calls;
    };

    class FakeSource : public discovery::DiscoverySource
    {
    public:
        FakeSource(std::string name, std::vector<discovery::Sighting> sightings,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(500))
            : m_name(std::move(name)), m_sightings(std::move(sightings)), m_timeout(timeout) {}

        std::string Name() const override { return m_name; }
        std::chrono::milliseconds Timeout() const override { return m_timeout; }
        bool ReportsHardwareAddresses() const override { return hardware_addresses; }

        std::vector<discovery::Sighting> Discover() override
        {
            ++calls;
            if (delay.count() > 0)
                std::this_thread::sleep_for(delay);
            if (fail)
                throw common::SourceUnavailable(m_name + " is broken");

            std::lock_guard<std::mutex> lock(m_mutex);
            return m_sightings;
        }

        void SetSightings(std::vector<discovery::Sighting> sightings)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sightings = std::move(sightings);
        }

        std::atomic<bool> fail{false};
        std::chrono::milliseconds delay{0};
        std::atomic<int> calls{0};
        bool hardware_addresses = true;

    private:
        std::string m_name;
        std::mutex m_mutex;
        std::vector<discovery::Sighting> m_sightings;
        std::chrono::milliseconds m_timeout;
    };

    class FakeResolver : public discovery::HostnameResolver
    {
    public:
        explicit FakeResolver(std::map<std::string, std::string> names = {}) : m_names(std::move(names)) {}

        std::optional<std::string> Resolve(const std::string &ip, std::chrono::milliseconds) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_asked.push_back(ip);
            auto it = m_names.find(ip);
            if (it == m_names.end())
                return std::nullopt;
            return it->second;
        }

        std::vector<std::string> Asked() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_asked;
        }

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, std::string> m_names;
        std::vector<std::string> m_asked;
    };

    // Fresh directory under the system temp dir, removed on destruction
    class ScopedTempDir
    {
    public:
        ScopedTempDir()
        {
            std::random_device rd;
            m_path = std::filesystem::temp_directory_path() / ("lanwatch-test-" + std::to_string(rd()));
            std::filesystem::create_directories(m_path);
        }

        ~ScopedTempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        const std::filesystem::path &Path() const { return m_path; }

        std::string Write(const std::string &name, const std::string &content) const
        {
            std::filesystem::path file = m_path / name;
            std::ofstream out(file);
            out << content;
            return file.string();
        }

    private:
        std::filesystem::path m_path;
    };

    inline discovery::NeighborSighting Neighbor(const std::string &ip, const std::string &mac)
    {
        return discovery::NeighborSighting{ip, mac, std::nullopt};
    }
}
