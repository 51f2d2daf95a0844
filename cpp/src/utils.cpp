#include "ddosflowgen/utils.hpp"
#include <stdexcept>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace ddosflowgen {
namespace utils {

// Random singleton implementation
Random& Random::instance() {
    static Random inst;
    return inst;
}

Random::Random() {
    auto seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    gen_.seed(seed);
}

void Random::seed(uint64_t seed_value) {
    gen_.seed(seed_value);
}

int Random::randint(int min, int max) {
    std::uniform_int_distribution<int> dist(min, max);
    return dist(gen_);
}

uint64_t Random::randint64(uint64_t min, uint64_t max) {
    std::uniform_int_distribution<uint64_t> dist(min, max);
    return dist(gen_);
}

const std::vector<uint8_t>& reserved_first_octets() {
    static const std::vector<uint8_t> reserved = {0, 10, 127, 172, 255};
    return reserved;
}

bool is_reserved_first_octet(uint32_t octet) {
    const auto& reserved = reserved_first_octets();
    return std::find(reserved.begin(), reserved.end(), octet) != reserved.end();
}

// Convert IPv4 string to uint32_t (host byte order)
uint32_t ip_str_to_uint32(const std::string& ip_str) {
    std::istringstream iss(ip_str);
    std::string token;
    std::vector<int> octets;

    while (std::getline(iss, token, '.')) {
        if (token.empty() || token.size() > 3 ||
            !std::all_of(token.begin(), token.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            throw std::runtime_error("Invalid IPv4 address: " + ip_str);
        }
        octets.push_back(std::stoi(token));
    }

    if (octets.size() != 4) {
        throw std::runtime_error("Invalid IPv4 address: " + ip_str);
    }
    for (int octet : octets) {
        if (octet > 255) {
            throw std::runtime_error("Invalid IPv4 address: " + ip_str);
        }
    }

    // Convert to uint32_t (host byte order: big-endian)
    return (static_cast<uint32_t>(octets[0]) << 24) |
           (static_cast<uint32_t>(octets[1]) << 16) |
           (static_cast<uint32_t>(octets[2]) << 8) |
           static_cast<uint32_t>(octets[3]);
}

// Convert uint32_t to IPv4 string (host byte order)
std::string uint32_to_ip_str(uint32_t ip) {
    std::ostringstream oss;
    oss << ((ip >> 24) & 0xFF) << "."
        << ((ip >> 16) & 0xFF) << "."
        << ((ip >> 8) & 0xFF) << "."
        << (ip & 0xFF);
    return oss.str();
}

bool is_two_octet_prefix(const std::string& prefix) {
    try {
        ip_str_to_uint32(prefix + ".0.0");
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

std::string random_ipv4_avoiding(const std::string& prefix) {
    auto& rng = Random::instance();
    std::string network = prefix;

    if (network.empty()) {
        int octet1;
        do {
            octet1 = rng.randint(1, 255);
        } while (is_reserved_first_octet(octet1));
        int octet2 = rng.randint(1, 255);
        network = std::to_string(octet1) + "." + std::to_string(octet2);
    }

    int octet3 = rng.randint(1, 255);
    int octet4 = rng.randint(1, 255);
    return network + "." + std::to_string(octet3) + "." + std::to_string(octet4);
}

uint64_t jittered(uint64_t floor) {
    return floor + Random::instance().randint64(0, floor);
}

// Days since 1970-01-01 for a proleptic Gregorian date
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

static bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

// Read `count` digits starting at pos
static int read_digits(const std::string& text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid timestamp: " + text);
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

int64_t parse_timestamp_ms(const std::string& text) {
    // YYYY/MM/DDTHH:MM:SS[.f{1,6}]
    if (text.size() < 19 || text[4] != '/' || text[7] != '/' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }

    int year = read_digits(text, 0, 4);
    int month = read_digits(text, 5, 2);
    int day = read_digits(text, 8, 2);
    int hour = read_digits(text, 11, 2);
    int minute = read_digits(text, 14, 2);
    int second = read_digits(text, 17, 2);

    int millis = 0;
    if (text.size() > 19) {
        size_t frac_len = text.size() - 20;
        if (text[19] != '.' || frac_len < 1 || frac_len > 6) {
            throw std::invalid_argument("Invalid timestamp: " + text);
        }
        int frac = read_digits(text, 20, frac_len);
        // scale to microseconds, then truncate to milliseconds
        for (size_t i = frac_len; i < 6; ++i) {
            frac *= 10;
        }
        millis = frac / 1000;
    }

    if (year < 1 || month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        throw std::invalid_argument("Timestamp out of range: " + text);
    }

    int64_t days = days_from_civil(year, month, day);
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return seconds * 1000 + millis;
}

std::string format_timestamp_ms(int64_t ms) {
    int64_t seconds = ms / 1000;
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }
    int64_t days = seconds / 86400;
    int64_t secs_of_day = seconds % 86400;
    if (secs_of_day < 0) {
        secs_of_day += 86400;
        days -= 1;
    }

    int64_t year;
    unsigned month;
    unsigned day;
    civil_from_days(days, year, month, day);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << "/"
        << std::setw(2) << month << "/"
        << std::setw(2) << day << "T"
        << std::setw(2) << secs_of_day / 3600 << ":"
        << std::setw(2) << (secs_of_day % 3600) / 60 << ":"
        << std::setw(2) << secs_of_day % 60 << "."
        << std::setw(3) << millis;
    return oss.str();
}

std::string format_duration_ms(uint64_t ms) {
    std::ostringstream oss;
    oss << ms / 1000 << "." << std::setfill('0') << std::setw(3) << ms % 1000;
    return oss.str();
}

std::string rjust(const std::string& text, size_t width) {
    if (text.size() >= width) {
        return text;
    }
    return std::string(width - text.size(), ' ') + text;
}

std::string trim(const std::string& text) {
    static const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace utils
} // namespace ddosflowgen
