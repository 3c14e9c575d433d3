#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanwatch::discovery
{
    // Read-only OUI prefix -> vendor name table, loaded once.
    //
    // The file format is the one arp-scan ships as ieee-oui.txt: one
    // "HEXPREFIX<TAB>Vendor" pair per line, '#' comments. 24-bit prefixes
    // are the norm; 28-bit and 36-bit IEEE blocks are matched first when present.
    class VendorDirectory
    {
    public:
        // Always-empty directory
        static VendorDirectory Empty();

        // Missing or unreadable file yields an empty directory, never an error
        static VendorDirectory LoadFromFile(const std::string &path);

        static VendorDirectory LoadFirstAvailable(const std::vector<std::string> &paths);

        static VendorDirectory FromText(const std::string &text);

        // Accepts any spelling Normalize() accepts; invalid input finds nothing
        std::optional<std::string> Lookup(const std::string &mac) const;

        size_t Size() const { return m_vendors.size(); }
        bool IsEmpty() const { return m_vendors.empty(); }
        const std::string &Source() const { return m_source; }

    private:
        VendorDirectory() = default;
        size_t ParseText(const std::string &text);

        std::unordered_map<std::string, std::string> m_vendors;
        std::string m_source;
    };
}
