#pragma once

#include "domain/value_objects/LineItemId.hpp"
#include "domain/value_objects/Money.hpp"

namespace oagg::domain {

struct LineItem {
    LineItemId id;
    Money price;

    bool operator==(const LineItem&) const = default;
};

} // namespace oagg::domain
