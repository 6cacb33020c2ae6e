#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace oagg::domain {

// Caller-supplied identifier of a line item. Opaque to the aggregate, which
// only compares it for equality.
class LineItemId {
public:
    explicit LineItemId(std::string value);

    static LineItemId from_number(uint64_t number);

    const std::string& value() const noexcept { return value_; }

    bool operator==(const LineItemId&) const = default;
    auto operator<=>(const LineItemId&) const = default;

private:
    std::string value_;
};

} // namespace oagg::domain
