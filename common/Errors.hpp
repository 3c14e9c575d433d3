#pragma once

#include <stdexcept>
#include <string>

namespace lanwatch::common
{
    class LanwatchError : public std::runtime_error
    {
    public:
        explicit LanwatchError(const std::string &message) : std::runtime_error(message) {}
    };

    // Malformed hardware address handed to the codec
    class FormatError : public LanwatchError
    {
    public:
        explicit FormatError(const std::string &message) : LanwatchError(message) {}
    };

    class PersistenceError : public LanwatchError
    {
    public:
        PersistenceError(const std::string &message, const std::string &path)
            : LanwatchError(message + " (" + path + ")"), m_path(path) {}

        const std::string &Path() const { return m_path; }

    private:
        std::string m_path;
    };

    class SourceUnavailable : public LanwatchError
    {
    public:
        explicit SourceUnavailable(const std::string &message) : LanwatchError(message) {}
    };

    class SourceTimeout : public LanwatchError
    {
    public:
        explicit SourceTimeout(const std::string &message) : LanwatchError(message) {}
    };

    class CommandError : public LanwatchError
    {
    public:
        CommandError(const std::string &message, const std::string &command)
            : LanwatchError(message + ": " + command), m_command(command) {}

        const std::string &Command() const { return m_command; }

    private:
        std::string m_command;
    };

    class CommandTimeout : public CommandError
    {
    public:
        explicit CommandTimeout(const std::string &command)
            : CommandError("Command timed out", command) {}
    };
}
