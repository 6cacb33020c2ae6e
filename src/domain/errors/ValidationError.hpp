#pragma once

#include <string>

namespace oagg::domain {

// Rejection produced by a validating factory. Carries the offending field so
// callers can report it without parsing the message.
struct ValidationError {
    std::string field;
    std::string message;

    bool operator==(const ValidationError&) const = default;
};

} // namespace oagg::domain
