#include "DeviceNameStore.hpp"
#include "../common/Errors.hpp"
#include "../common/MacAddress.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <fcntl.h>
#include <unistd.h>

namespace lanwatch::discovery
{
    using json = nlohmann::json;
    using lanwatch::common::PersistenceError;
    namespace mac = lanwatch::common::mac;

    DeviceNameStore::DeviceNameStore(const std::string &path) : m_path(path)
    {
        Load();
    }

    void DeviceNameStore::Load()
    {
        std::ifstream file(m_path);
        if (!file.is_open())
            return;

        json doc = json::parse(file, nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
        {
            std::cerr << "[NameStore] Ignoring unreadable names file " << m_path << "\n";
            return;
        }

        for (auto it = doc.begin(); it != doc.end(); ++it)
        {
            if (!it.value().is_string() || !mac::IsValid(it.key()))
                continue;
            m_names[mac::Normalize(it.key())] = it.value().get<std::string>();
        }
    }

    std::optional<std::string> DeviceNameStore::GetName(const std::string &raw_mac) const
    {
        std::string key = mac::Normalize(raw_mac);
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_names.find(key);
        if (it == m_names.end())
            return std::nullopt;
        return it->second;
    }

    void DeviceNameStore::SetName(const std::string &raw_mac, const std::string &name)
    {
        std::string key = mac::Normalize(raw_mac);
        if (name.empty())
        {
            RemoveName(key);
            return;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_names[key] = name;
        SaveLocked();
    }

    void DeviceNameStore::RemoveName(const std::string &raw_mac)
    {
        std::string key = mac::Normalize(raw_mac);
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_names.erase(key) == 0)
            return;
        SaveLocked();
    }

    bool DeviceNameStore::Flush()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_dirty)
            return true;

        try
        {
            SaveLocked();
            std::cout << "[NameStore] Pending names written to " << m_path << "\n";
            return true;
        }
        catch (const PersistenceError &e)
        {
            std::cerr << "[NameStore] Retry failed: " << e.what() << "\n";
            return false;
        }
    }

    bool DeviceNameStore::IsDirty() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dirty;
    }

    size_t DeviceNameStore::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_names.size();
    }

    void DeviceNameStore::SaveLocked()
    {
        // Marked clean only once the rename has landed
        m_dirty = true;

        const std::string content = json(m_names).dump(2) + "\n";
        const std::string tmp_path = m_path + ".tmp";

        std::filesystem::path parent = std::filesystem::path(m_path).parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }

        int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0)
            throw PersistenceError(std::string("Cannot create temp file: ") + std::strerror(errno), tmp_path);

        size_t written = 0;
        while (written < content.size())
        {
            ssize_t n = ::write(fd, content.data() + written, content.size() - written);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                int saved = errno;
                ::close(fd);
                ::unlink(tmp_path.c_str());
                throw PersistenceError(std::string("Write failed: ") + std::strerror(saved), tmp_path);
            }
            written += static_cast<size_t>(n);
        }

        if (::fsync(fd) != 0)
        {
            int saved = errno;
            ::close(fd);
            ::unlink(tmp_path.c_str());
            throw PersistenceError(std::string("fsync failed: ") + std::strerror(saved), tmp_path);
        }

        if (::close(fd) != 0)
        {
            int saved = errno;
            ::unlink(tmp_path.c_str());
            throw PersistenceError(std::string("close failed: ") + std::strerror(saved), tmp_path);
        }

        if (std::rename(tmp_path.c_str(), m_path.c_str()) != 0)
        {
            int saved = errno;
            ::unlink(tmp_path.c_str());
            throw PersistenceError(std::string("rename failed: ") + std::strerror(saved), m_path);
        }

        m_dirty = false;
    }
}
