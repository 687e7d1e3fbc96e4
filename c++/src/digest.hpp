#pragma once

#include <array>
#include <span>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <openssl/sha.h>

using digest_t = std::array<unsigned char, SHA256_DIGEST_LENGTH>;
using hexdigest_t = std::array<char, SHA256_DIGEST_LENGTH * 2>;

class Digest {
  public:
    Digest(std::span<const char> data)
        : m_digest(get_digest(data)), m_hexdigest(get_hexdigest(m_digest))
    {}

    const hexdigest_t &hexdigest() const { return m_hexdigest; }
    const digest_t &digest() const { return m_digest; }

    std::string hexstring() const
    {
        return std::string(m_hexdigest.begin(), m_hexdigest.end());
    }

  private:
    static digest_t get_digest(std::span<const char> data)
    {
        digest_t digest;
        SHA256(reinterpret_cast<const unsigned char *>(data.data()),
               data.size(), digest.data());
        return digest;
    }

    static hexdigest_t get_hexdigest(const digest_t &digest)
    {
        hexdigest_t hex;
        auto hex_output = hex.begin();
        for (std::size_t i = 0; i != digest.size(); i++)
        {
            hex_output = fmt::format_to(hex_output, "{:02x}", digest[i]);
        }
        return hex;
    }

    digest_t m_digest;
    hexdigest_t m_hexdigest;
};
