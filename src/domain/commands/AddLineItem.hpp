#pragma once

#include "domain/commands/OrderCommand.hpp"
#include "domain/entities/LineItem.hpp"

namespace oagg::domain {

struct AddLineItem : OrderCommand {
    LineItem item;
};

} // namespace oagg::domain
