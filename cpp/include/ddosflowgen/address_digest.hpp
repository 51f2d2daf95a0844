#ifndef DDOSFLOWGEN_ADDRESS_DIGEST_HPP
#define DDOSFLOWGEN_ADDRESS_DIGEST_HPP

#include <array>
#include <string>
#include <cstdint>

namespace ddosflowgen {

constexpr size_t DIGEST_LENGTH = 16;

using Digest = std::array<uint8_t, DIGEST_LENGTH>;

/**
 * MD5 of the bytes of text
 *
 * The only reproducible source of pseudo-randomness: identical input gives
 * identical bytes on every run and in every output view.
 */
Digest digest(const std::string& text);

/**
 * "<prefix>.<d[0]>.<d[1]>", a host inside a two-octet network
 */
std::string host_in_prefix(const std::string& prefix, const Digest& d);

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_ADDRESS_DIGEST_HPP
