#pragma once

#include <string>

namespace LSE {
namespace Log {

/**
 * @brief Make a caller-supplied string safe to embed in one log line
 *
 * Event names, service ids and error texts reach the log verbatim from
 * callers. Newline and carriage return are escaped; other non-printable
 * bytes become '?'.
 */
inline std::string sanitize(const std::string &input) {
    std::string sanitized;
    sanitized.reserve(input.length());

    for (char c : input) {
        if (c == '\n') {
            sanitized += "\\n";
        } else if (c == '\r') {
            sanitized += "\\r";
        } else if (c >= 32 && c < 127) {
            sanitized += c;
        } else {
            sanitized += '?';
        }
    }

    return sanitized;
}

}  // namespace Log
}  // namespace LSE
