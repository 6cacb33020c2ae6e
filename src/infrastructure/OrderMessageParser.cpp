#include "infrastructure/OrderMessageParser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;
using namespace oagg::domain;

namespace oagg::infrastructure {

namespace {

Money parse_price(const json& obj) {
    if (obj.contains("price_minor")) {
        const auto& minor = obj["price_minor"];
        if (!minor.is_number_integer()) {
            throw std::invalid_argument("\"price_minor\" must be an integer, got " + minor.dump());
        }
        if (minor.is_number_unsigned() &&
            minor.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::invalid_argument("\"price_minor\" out of range: " + minor.dump());
        }
        return Money::from_minor_units(minor.get<int64_t>());
    }
    if (!obj.contains("price")) {
        throw std::invalid_argument("Command is missing \"price\"");
    }
    // Decimal strings only: a JSON float would already have lost exactness
    return Money::from_string(obj["price"].get<std::string>());
}

AddLineItem parse_add_line_item(const json& obj) {
    return AddLineItem{
        {OrderId(obj.at("order_id").get<std::string>())},
        LineItem{LineItemId(obj.at("line_item_id").get<std::string>()), parse_price(obj)}
    };
}

ChangeLineItemPrice parse_change_line_item_price(const json& obj) {
    return ChangeLineItemPrice{
        {OrderId(obj.at("order_id").get<std::string>())},
        LineItemId(obj.at("line_item_id").get<std::string>()),
        parse_price(obj)
    };
}

} // anonymous namespace

std::vector<OrderCommandVariant> OrderMessageParser::parse(const std::string& json_str) const {
    auto json_msg = json::parse(json_str);
    std::vector<OrderCommandVariant> commands;

    auto& items = json_msg.is_array() ? json_msg : (json_msg = json::array({json_msg}));

    for (const auto& obj : items) {
        if (!obj.is_object() || !obj.contains("type")) continue;

        auto type = obj["type"].get<std::string>();

        if (type == "add_line_item") {
            commands.push_back(parse_add_line_item(obj));
        } else if (type == "change_line_item_price") {
            commands.push_back(parse_change_line_item_price(obj));
        }
    }

    return commands;
}

} // namespace oagg::infrastructure
