#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace oagg::domain {

// Monetary amount in integer minor units (cents). May be negative so that
// callers can express a bad input and have the aggregate reject it.
class Money {
public:
    static Money from_minor_units(int64_t minor_units) noexcept;
    static Money from_string(const std::string& str);
    static Money zero() noexcept;

    int64_t minor_units() const noexcept { return minor_units_; }
    bool is_negative() const noexcept { return minor_units_ < 0; }

    std::string to_string() const;

    // nullopt when the sum does not fit in int64_t
    std::optional<Money> checked_add(const Money& other) const noexcept;
    Money operator+(const Money& other) const;

    bool operator==(const Money&) const = default;
    auto operator<=>(const Money&) const = default;

private:
    explicit Money(int64_t minor_units) noexcept : minor_units_(minor_units) {}

    int64_t minor_units_;
};

} // namespace oagg::domain
