#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

struct Verification
{
    std::string digest_hex;
    // Absent when no expected digest was supplied
    std::optional<bool> matched;
};

bool checksums_equal(std::string_view expected, std::string_view actual);

Verification verify(std::span<const char> data,
                    const std::optional<std::string> &expected_checksum);
