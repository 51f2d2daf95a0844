#ifndef DDOSFLOWGEN_ERRORS_HPP
#define DDOSFLOWGEN_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace ddosflowgen {

/**
 * Invalid topology or missing required input (fatal, raised before processing)
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Malformed flow-record line
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what, size_t line_number = 0)
        : std::runtime_error(line_number == 0 ? what
                             : "line " + std::to_string(line_number) + ": " + what),
          line_number_(line_number) {}

    // 1-based line number in the noise log, 0 if unknown
    size_t line_number() const { return line_number_; }

private:
    size_t line_number_;
};

/**
 * Output sinks cannot be created or written
 */
class ResourceError : public std::runtime_error {
public:
    explicit ResourceError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace ddosflowgen

#endif // DDOSFLOWGEN_ERRORS_HPP
