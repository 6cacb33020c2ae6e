#pragma once

#include "domain/value_objects/OrderId.hpp"

namespace oagg::domain {

struct OrderCommand {
    OrderId order_id;
};

} // namespace oagg::domain
