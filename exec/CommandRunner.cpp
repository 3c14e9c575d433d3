#include "CommandRunner.hpp"
#include "../common/Config.hpp"
#include "../common/Errors.hpp"

#include <iostream>
#include <thread>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace lanwatch::exec
{
    using lanwatch::common::CommandError;
    using lanwatch::common::CommandTimeout;

    std::string JoinCommand(const std::vector<std::string> &argv)
    {
        std::string joined;
        for (const auto &arg : argv)
        {
            if (!joined.empty())
                joined += ' ';
            joined += arg;
        }
        return joined;
    }

    static std::string BaseName(const std::string &command)
    {
        auto slash = command.find_last_of('/');
        if (slash == std::string::npos)
            return command;
        return command.substr(slash + 1);
    }

    static int DecodeStatus(int status)
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

    SystemCommandRunner::SystemCommandRunner(const std::vector<std::string> &allowed_commands)
        : m_allowed(allowed_commands.begin(), allowed_commands.end())
    {
    }

    bool SystemCommandRunner::IsAllowed(const std::string &command) const
    {
        return m_allowed.count(BaseName(command)) > 0;
    }

    CommandResult SystemCommandRunner::Run(const std::vector<std::string> &argv,
                                           std::chrono::milliseconds timeout,
                                           std::chrono::milliseconds ttl)
    {
        if (argv.empty())
            throw CommandError("Empty command", "");

        const std::string command = JoinCommand(argv);
        if (!IsAllowed(argv[0]))
            throw CommandError("Command not in allow-list", command);

        const bool cacheable = ttl.count() > 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (cacheable)
            {
                auto it = m_cache.find(argv);
                if (it != m_cache.end() && std::chrono::steady_clock::now() - it->second.stored_at < ttl)
                {
                    m_stats.hits++;
                    return it->second.result;
                }
            }
            m_stats.misses++;
        }

        CommandResult result;
        try
        {
            result = Spawn(argv, timeout);
        }
        catch (const CommandError &)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stats.errors++;
            throw;
        }

        if (cacheable)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cache[argv] = {result, std::chrono::steady_clock::now()};
            EvictLocked();
        }
        return result;
    }

    void SystemCommandRunner::EvictLocked()
    {
        if (m_cache.size() <= config::COMMAND_CACHE_MAX_ENTRIES)
            return;

        // Drop the oldest entries until the cache fits again
        while (m_cache.size() > config::COMMAND_CACHE_MAX_ENTRIES)
        {
            auto oldest = m_cache.begin();
            for (auto it = m_cache.begin(); it != m_cache.end(); ++it)
            {
                if (it->second.stored_at < oldest->second.stored_at)
                    oldest = it;
            }
            m_cache.erase(oldest);
        }
    }

    CommandResult SystemCommandRunner::Spawn(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
    {
        const std::string command = JoinCommand(argv);

        int out_pipe[2];
        int err_pipe[2];
        if (pipe2(out_pipe, O_CLOEXEC) != 0)
            throw CommandError(std::string("pipe failed: ") + std::strerror(errno), command);
        if (pipe2(err_pipe, O_CLOEXEC) != 0)
        {
            int saved = errno;
            close(out_pipe[0]);
            close(out_pipe[1]);
            throw CommandError(std::string("pipe failed: ") + std::strerror(saved), command);
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

        // Own process group so a timeout can kill helpers the tool forked
        posix_spawnattr_t attr;
        posix_spawnattr_init(&attr);
        posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
        posix_spawnattr_setpgroup(&attr, 0);

        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        pid_t pid = -1;
        int spawn_ret = posix_spawnp(&pid, args[0], &actions, &attr, args.data(), environ);

        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
        close(out_pipe[1]);
        close(err_pipe[1]);

        if (spawn_ret != 0)
        {
            close(out_pipe[0]);
            close(err_pipe[0]);
            if (spawn_ret == ENOENT)
                throw CommandError("Command not found", command);
            throw CommandError(std::string("spawn failed: ") + std::strerror(spawn_ret), command);
        }

        CommandResult result;
        std::string *sinks[2] = {&result.stdout_text, &result.stderr_text};
        struct pollfd fds[2];
        fds[0] = {out_pipe[0], POLLIN, 0};
        fds[1] = {err_pipe[0], POLLIN, 0};
        int open_fds = 2;

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool timed_out = false;
        char buffer[4096];

        while (open_fds > 0)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                timed_out = true;
                break;
            }

            int ret = poll(fds, 2, static_cast<int>(remaining.count()));
            if (ret < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (ret == 0)
            {
                timed_out = true;
                break;
            }

            for (int i = 0; i < 2; ++i)
            {
                if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                    continue;

                ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0)
                {
                    if (sinks[i]->size() < config::COMMAND_OUTPUT_LIMIT)
                        sinks[i]->append(buffer, static_cast<size_t>(n));
                }
                else if (n == 0 || (errno != EINTR && errno != EAGAIN))
                {
                    close(fds[i].fd);
                    fds[i].fd = -1;
                    --open_fds;
                }
            }
        }

        int status = 0;
        if (!timed_out)
        {
            // Output closed; give the child the rest of the budget to exit
            while (true)
            {
                pid_t w = waitpid(pid, &status, WNOHANG);
                if (w == pid)
                    break;
                if (w < 0 && errno != EINTR)
                {
                    status = 0;
                    break;
                }
                if (std::chrono::steady_clock::now() >= deadline)
                {
                    timed_out = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }

        for (auto &pfd : fds)
        {
            if (pfd.fd >= 0)
                close(pfd.fd);
        }

        if (timed_out)
        {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            {
            }
            std::cerr << "[CommandRunner] Command timed out after " << timeout.count() << "ms: " << command << "\n";
            throw CommandTimeout(command);
        }

        result.exit_code = DecodeStatus(status);
        return result;
    }

    bool SystemCommandRunner::HasTool(const std::string &tool)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_tools.find(tool);
            if (it != m_tools.end())
                return it->second;
        }

        bool available = false;
        try
        {
            CommandResult result = Run({"which", tool}, std::chrono::milliseconds(2000), config::TOOL_CHECK_TTL);
            available = (result.exit_code == 0);
        }
        catch (const CommandError &e)
        {
            std::cerr << "[CommandRunner] Tool check failed for " << tool << ": " << e.what() << "\n";
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_tools[tool] = available;
        return available;
    }

    void SystemCommandRunner::Invalidate()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cache.clear();
    }

    void SystemCommandRunner::Invalidate(const std::vector<std::string> &argv)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cache.erase(argv);
    }

    CacheStats SystemCommandRunner::Stats() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        CacheStats stats = m_stats;
        stats.size = m_cache.size();
        return stats;
    }
}
