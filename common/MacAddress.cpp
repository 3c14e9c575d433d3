#include "MacAddress.hpp"
#include "Errors.hpp"
#include <cctype>
#include <vector>

namespace lanwatch::common::mac
{
    static std::vector<std::string> SplitGroups(const std::string &raw)
    {
        std::vector<std::string> groups;
        std::string current;
        for (char c : raw)
        {
            if (c == ':' || c == '-')
            {
                groups.push_back(current);
                current.clear();
            }
            else
            {
                current += c;
            }
        }
        groups.push_back(current);
        return groups;
    }

    std::string Normalize(const std::string &raw)
    {
        std::vector<std::string> groups = SplitGroups(raw);
        if (groups.size() != OCTET_COUNT)
            throw FormatError("MAC address must have 6 groups: '" + raw + "'");

        std::string result;
        result.reserve(CANONICAL_LENGTH);

        for (size_t i = 0; i < groups.size(); ++i)
        {
            const std::string &group = groups[i];
            if (group.empty() || group.size() > 2)
                throw FormatError("Invalid MAC address group '" + group + "' in '" + raw + "'");

            for (char c : group)
            {
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    throw FormatError("Non-hex character in MAC address '" + raw + "'");
            }

            if (i > 0)
                result += ':';
            if (group.size() == 1)
                result += '0';
            for (char c : group)
                result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return result;
    }

    bool IsValid(const std::string &raw)
    {
        try
        {
            Normalize(raw);
            return true;
        }
        catch (const FormatError &)
        {
            return false;
        }
    }

    std::string StripSeparators(const std::string &canonical)
    {
        std::string hex;
        hex.reserve(12);
        for (char c : canonical)
        {
            if (c != ':' && c != '-')
                hex += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return hex;
    }

    std::string OuiPrefix(const std::string &canonical)
    {
        return StripSeparators(canonical).substr(0, 6);
    }

    bool IsZero(const std::string &canonical)
    {
        return canonical == "00:00:00:00:00:00";
    }

    bool IsBroadcast(const std::string &canonical)
    {
        return canonical == "FF:FF:FF:FF:FF:FF";
    }

    bool IsMulticast(const std::string &canonical)
    {
        if (canonical.size() < 2)
            return false;
        int first_octet = std::stoi(canonical.substr(0, 2), nullptr, 16);
        return (first_octet & 0x01) != 0;
    }
}
