#include "VendorDirectory.hpp"
#include "../common/Errors.hpp"
#include "../common/MacAddress.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace lanwatch::discovery
{
    namespace mac = lanwatch::common::mac;

    // MA-S (36 bit), MA-M (28 bit), MA-L (24 bit)
    static constexpr size_t PREFIX_LENGTHS[] = {9, 7, 6};

    static std::string Trim(const std::string &s)
    {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
            ++start;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
            --end;
        return s.substr(start, end - start);
    }

    static bool NormalizePrefix(const std::string &raw, std::string &out)
    {
        out.clear();
        for (char c : raw)
        {
            if (c == ':' || c == '-' || c == '.')
                continue;
            if (!std::isxdigit(static_cast<unsigned char>(c)))
                return false;
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        for (size_t len : PREFIX_LENGTHS)
        {
            if (out.size() == len)
                return true;
        }
        return false;
    }

    VendorDirectory VendorDirectory::Empty()
    {
        return VendorDirectory();
    }

    VendorDirectory VendorDirectory::FromText(const std::string &text)
    {
        VendorDirectory directory;
        directory.ParseText(text);
        return directory;
    }

    size_t VendorDirectory::ParseText(const std::string &text)
    {
        std::istringstream stream(text);
        std::string line;
        size_t added = 0;

        while (std::getline(stream, line))
        {
            line = Trim(line);
            if (line.empty() || line[0] == '#')
                continue;

            size_t split = line.find('\t');
            if (split == std::string::npos)
                split = line.find_first_of(" \t");
            if (split == std::string::npos)
                continue;

            std::string prefix;
            if (!NormalizePrefix(line.substr(0, split), prefix))
                continue;

            std::string vendor = Trim(line.substr(split + 1));
            if (vendor.empty())
                continue;

            m_vendors[prefix] = vendor;
            ++added;
        }
        return added;
    }

    VendorDirectory VendorDirectory::LoadFromFile(const std::string &path)
    {
        VendorDirectory directory;

        std::ifstream file(path);
        if (!file.is_open())
        {
            std::cerr << "[Vendors] Cannot open vendor table " << path << "; vendor lookup disabled\n";
            return directory;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad())
        {
            std::cerr << "[Vendors] Read error on " << path << "; vendor lookup disabled\n";
            return directory;
        }

        directory.ParseText(buffer.str());
        directory.m_source = path;
        std::cout << "[Vendors] Loaded " << directory.Size() << " prefixes from " << path << "\n";
        return directory;
    }

    VendorDirectory VendorDirectory::LoadFirstAvailable(const std::vector<std::string> &paths)
    {
        for (const auto &path : paths)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
                continue;

            VendorDirectory directory = LoadFromFile(path);
            if (!directory.IsEmpty())
                return directory;
        }

        std::cerr << "[Vendors] No vendor table found; devices will have no vendor\n";
        return VendorDirectory();
    }

    std::optional<std::string> VendorDirectory::Lookup(const std::string &raw_mac) const
    {
        if (m_vendors.empty())
            return std::nullopt;

        std::string hex;
        try
        {
            hex = mac::StripSeparators(mac::Normalize(raw_mac));
        }
        catch (const common::FormatError &)
        {
            return std::nullopt;
        }

        for (size_t len : PREFIX_LENGTHS)
        {
            auto it = m_vendors.find(hex.substr(0, len));
            if (it != m_vendors.end())
                return it->second;
        }
        return std::nullopt;
    }
}
