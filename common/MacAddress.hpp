#pragma once

#include <cstddef>
#include <string>

namespace lanwatch::common::mac
{
    inline constexpr size_t OCTET_COUNT = 6;
    inline constexpr size_t CANONICAL_LENGTH = 17; // "AA:BB:CC:DD:EE:FF"

    // Canonical form is six upper-case, zero-padded hex octets joined by ':'.
    // Throws FormatError when the input cannot be brought into that form.
    std::string Normalize(const std::string &raw);

    bool IsValid(const std::string &raw);

    // First three octets of a canonical address without separators ("AABBCC")
    std::string OuiPrefix(const std::string &canonical);

    // Hex digits only, no separators ("AABBCCDDEEFF")
    std::string StripSeparators(const std::string &canonical);

    bool IsZero(const std::string &canonical);
    bool IsBroadcast(const std::string &canonical);
    bool IsMulticast(const std::string &canonical);
}
