#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace lanwatch::exec
{
    struct CommandResult
    {
        int exit_code = -1;
        std::string stdout_text;
        std::string stderr_text;
    };

    struct CacheStats
    {
        size_t hits = 0;
        size_t misses = 0;
        size_t errors = 0;
        size_t size = 0;
    };

    // Every external tool invocation goes through this interface.
    // Implementations throw CommandError / CommandTimeout.
    class CommandExecutor
    {
    public:
        virtual ~CommandExecutor() = default;

        // A completed result younger than ttl may be served from cache; ttl of zero always runs.
        virtual CommandResult Run(const std::vector<std::string> &argv,
                                  std::chrono::milliseconds timeout,
                                  std::chrono::milliseconds ttl) = 0;
    };

    class SystemCommandRunner : public CommandExecutor
    {
    public:
        explicit SystemCommandRunner(const std::vector<std::string> &allowed_commands);

        CommandResult Run(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds ttl) override;

        bool IsAllowed(const std::string &command) const;
        bool HasTool(const std::string &tool);

        void Invalidate();
        void Invalidate(const std::vector<std::string> &argv);
        CacheStats Stats() const;

    private:
        struct CachedResult
        {
            CommandResult result;
            std::chrono::steady_clock::time_point stored_at;
        };

        CommandResult Spawn(const std::vector<std::string> &argv, std::chrono::milliseconds timeout);
        void EvictLocked();

        std::set<std::string> m_allowed;

        mutable std::mutex m_mutex;
        std::map<std::vector<std::string>, CachedResult> m_cache;
        std::map<std::string, bool> m_tools;
        CacheStats m_stats;
    };

    std::string JoinCommand(const std::vector<std::string> &argv);
}
