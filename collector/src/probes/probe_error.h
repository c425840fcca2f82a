#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace hosthealth::probes {

    // Raised by probes for conditions they cannot report as data.
    // category is one of: ReadError, ParseError, CommandError, ProbeError.
    class ProbeError : public std::runtime_error {
    public:
        ProbeError(std::string category, const std::string& message)
            : std::runtime_error(message), category_(std::move(category)) {}

        const std::string& category() const { return category_; }

    private:
        std::string category_;
    };

    [[noreturn]] inline void throw_read_error(const std::string& what) {
        throw ProbeError("ReadError", what);
    }

    [[noreturn]] inline void throw_parse_error(const std::string& what) {
        throw ProbeError("ParseError", what);
    }

} // namespace hosthealth::probes
