#pragma once

#include "domain/commands/OrderCommand.hpp"
#include "domain/value_objects/LineItemId.hpp"
#include "domain/value_objects/Money.hpp"

namespace oagg::domain {

struct ChangeLineItemPrice : OrderCommand {
    LineItemId line_item_id;
    Money new_price;
};

} // namespace oagg::domain
