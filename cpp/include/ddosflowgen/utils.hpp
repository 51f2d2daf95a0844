#ifndef DDOSFLOWGEN_UTILS_HPP
#define DDOSFLOWGEN_UTILS_HPP

#include <string>
#include <vector>
#include <random>
#include <cstdint>
#include <stdexcept>

namespace ddosflowgen {
namespace utils {

/**
 * Random number generator singleton
 *
 * Source of all values that need not be reproducible (packet/byte jitter,
 * probe addresses and ports). Clock-seeded unless seed() is called.
 */
class Random {
public:
    static Random& instance();

    void seed(uint64_t seed_value);

    int randint(int min, int max);
    uint64_t randint64(uint64_t min, uint64_t max);

private:
    Random();
    std::mt19937_64 gen_;
};

/**
 * First octets that are never emitted for synthetic addresses
 */
const std::vector<uint8_t>& reserved_first_octets();

bool is_reserved_first_octet(uint32_t octet);

/**
 * Convert IPv4 string to uint32_t (host byte order)
 *
 * @param ip_str IPv4 address string (e.g., "192.168.1.1")
 * @return IPv4 address as uint32_t
 */
uint32_t ip_str_to_uint32(const std::string& ip_str);

/**
 * Convert uint32_t to IPv4 string (host byte order)
 */
std::string uint32_to_ip_str(uint32_t ip);

/**
 * Check for a two-octet network prefix such as "172.16"
 */
bool is_two_octet_prefix(const std::string& prefix);

/**
 * Generate random IPv4 address avoiding the reserved first octets
 *
 * @param prefix Two-octet prefix (e.g., "172.16"); empty generates all four
 *               octets. Generated octets are in [1, 255].
 * @return IPv4 address string
 */
std::string random_ipv4_avoiding(const std::string& prefix = "");

/**
 * floor + uniform[0, floor], the spread used for synthetic counters
 */
uint64_t jittered(uint64_t floor);

/**
 * Parse an rwcut timestamp ("YYYY/MM/DDTHH:MM:SS.fff", UTC)
 *
 * Accepts 1 to 6 fractional digits; precision beyond milliseconds is
 * truncated.
 *
 * @return milliseconds since Unix epoch
 * @throws std::invalid_argument on malformed input
 */
int64_t parse_timestamp_ms(const std::string& text);

/**
 * Format milliseconds since Unix epoch as "YYYY/MM/DDTHH:MM:SS.mmm"
 */
std::string format_timestamp_ms(int64_t ms);

/**
 * Format a duration as seconds with 3 decimals ("55.000")
 */
std::string format_duration_ms(uint64_t ms);

/**
 * Right-justify text to width (longer text is left as-is)
 */
std::string rjust(const std::string& text, size_t width);

/**
 * Strip leading and trailing whitespace
 */
std::string trim(const std::string& text);

} // namespace utils
} // namespace ddosflowgen

#endif // DDOSFLOWGEN_UTILS_HPP
