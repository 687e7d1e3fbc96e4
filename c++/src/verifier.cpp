#include <boost/algorithm/string/predicate.hpp>

#include "digest.hpp"
#include "verifier.hpp"

bool checksums_equal(std::string_view expected, std::string_view actual)
{
    return boost::algorithm::iequals(expected, actual);
}

Verification verify(std::span<const char> data,
                    const std::optional<std::string> &expected_checksum)
{
    Verification verification{Digest(data).hexstring(), std::nullopt};
    if (expected_checksum)
    {
        verification.matched =
            checksums_equal(*expected_checksum, verification.digest_hex);
    }
    return verification;
}
