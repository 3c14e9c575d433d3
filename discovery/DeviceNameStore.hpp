#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lanwatch::discovery
{
    // User-assigned device names, persisted as a small JSON object
    // { "AA:BB:CC:DD:EE:FF": "Bob's Laptop", ... } so it stays hand-editable.
    //
    // Every change is written synchronously: temp file, fsync, rename. If the
    // write fails the new value stays in memory, the store is marked dirty and
    // PersistenceError is thrown; the next write or Flush() retries.
    class DeviceNameStore
    {
    public:
        explicit DeviceNameStore(const std::string &path);

        DeviceNameStore(const DeviceNameStore &) = delete;
        DeviceNameStore &operator=(const DeviceNameStore &) = delete;

        std::optional<std::string> GetName(const std::string &mac) const;
        void SetName(const std::string &mac, const std::string &name);
        void RemoveName(const std::string &mac);

        // Retries a failed write. Returns true when nothing is left unsaved.
        bool Flush();

        bool IsDirty() const;
        size_t Size() const;
        const std::string &Path() const { return m_path; }

    private:
        void Load();
        void SaveLocked();

        std::string m_path;
        mutable std::mutex m_mutex;
        std::map<std::string, std::string> m_names;
        bool m_dirty = false;
    };
}
