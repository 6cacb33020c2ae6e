#pragma once

#include "domain/errors/ValidationError.hpp"

#include <compare>
#include <variant>

namespace oagg::domain {

class UnitQuantity;

using UnitQuantityResult = std::variant<UnitQuantity, ValidationError>;

// A count of units between kMin and kMax inclusive. The only way to obtain
// one is create(), so every instance in existence is in range.
class UnitQuantity {
public:
    static constexpr int kMin = 1;
    static constexpr int kMax = 1000;

    static UnitQuantityResult create(int value);

    int value() const noexcept { return value_; }

    bool operator==(const UnitQuantity&) const = default;
    auto operator<=>(const UnitQuantity&) const = default;

private:
    explicit UnitQuantity(int value) noexcept : value_(value) {}

    int value_;
};

} // namespace oagg::domain
