#pragma once

#include <compare>
#include <string>

namespace oagg::domain {

class OrderId {
public:
    explicit OrderId(std::string value);

    const std::string& value() const noexcept { return value_; }

    bool operator==(const OrderId&) const = default;
    auto operator<=>(const OrderId&) const = default;

private:
    std::string value_;
};

} // namespace oagg::domain
