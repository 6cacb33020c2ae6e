#pragma once

#include "domain/aggregates/Order.hpp"
#include "domain/value_objects/OrderId.hpp"
#include "repositories/IOrderRepository.hpp"

#include <nlohmann/json.hpp>

namespace oagg::infrastructure {

// JSON rendering of orders and rejections for the command-line output.
// Money is written as a decimal string to keep it exact.
class OrderSerializer {
public:
    nlohmann::json to_json(const oagg::domain::OrderId& order_id,
                           const oagg::domain::Order& order) const;
    nlohmann::json to_json(const oagg::domain::OrderId& order_id,
                           const oagg::domain::OrderError& error) const;
    nlohmann::json to_json(const oagg::repositories::VersionConflict& conflict) const;
};

} // namespace oagg::infrastructure
