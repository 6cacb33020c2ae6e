#include "infrastructure/OrderSerializer.hpp"

using json = nlohmann::json;
using namespace oagg::domain;

namespace oagg::infrastructure {

json OrderSerializer::to_json(const OrderId& order_id, const Order& order) const {
    json items = json::array();
    for (const auto& item : order.line_items()) {
        items.push_back({
            {"id", item.id.value()},
            {"price", item.price.to_string()}
        });
    }

    return {
        {"order_id", order_id.value()},
        {"line_items", std::move(items)},
        {"amount_to_bill", order.total_amount().to_string()}
    };
}

json OrderSerializer::to_json(const OrderId& order_id, const OrderError& error) const {
    const auto& line_item_id = std::visit(
        [](const auto& e) -> const LineItemId& { return e.line_item_id; }, error);

    return {
        {"order_id", order_id.value()},
        {"error", error_name(error)},
        {"message", describe(error)},
        {"line_item_id", line_item_id.value()}
    };
}

json OrderSerializer::to_json(const oagg::repositories::VersionConflict& conflict) const {
    return {
        {"order_id", conflict.order_id.value()},
        {"error", "VersionConflict"},
        {"expected_version", conflict.expected_version},
        {"actual_version", conflict.actual_version}
    };
}

} // namespace oagg::infrastructure
