#include "domain/aggregates/Order.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace oagg::domain {

namespace {

// The total is always rebuilt from the items, never adjusted by a delta.
// nullopt when the sum does not fit in Money.
std::optional<Money> sum_prices(const std::vector<LineItem>& items) {
    auto total = Money::zero();
    for (const auto& item : items) {
        auto next = total.checked_add(item.price);
        if (!next) return std::nullopt;
        total = *next;
    }
    return total;
}

} // anonymous namespace

Order::Order(std::vector<LineItem> line_items, Money amount_to_bill)
    : line_items_(std::move(line_items))
    , amount_to_bill_(amount_to_bill) {}

Order Order::empty() {
    return Order(std::vector<LineItem>{}, Money::zero());
}

OrderResult Order::rebuild(std::vector<LineItem> items, const LineItem& changed) {
    auto total = sum_prices(items);
    if (!total) {
        return OrderResult::failure(TotalOverflowError{changed.id, changed.price});
    }
    return OrderResult::success(Order(std::move(items), *total));
}

OrderResult Order::add_line_item(const LineItem& item) const {
    if (contains(item.id)) {
        return OrderResult::failure(DuplicateLineItemError{item.id});
    }
    if (item.price.is_negative()) {
        return OrderResult::failure(InvalidPriceError{item.id, item.price});
    }

    auto items = line_items_;
    items.push_back(item);
    return rebuild(std::move(items), item);
}

OrderResult Order::change_line_item_price(const LineItemId& id, Money new_price) const {
    auto items = line_items_;
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const LineItem& item) { return item.id == id; });

    if (it == items.end()) {
        return OrderResult::failure(LineItemNotFoundError{id});
    }
    if (new_price.is_negative()) {
        return OrderResult::failure(InvalidPriceError{id, new_price});
    }

    it->price = new_price;
    auto changed = *it;
    return rebuild(std::move(items), changed);
}

OrderResult Order::apply(const AddLineItem& command) const {
    return add_line_item(command.item);
}

OrderResult Order::apply(const ChangeLineItemPrice& command) const {
    return change_line_item_price(command.line_item_id, command.new_price);
}

// Variant dispatch
OrderResult Order::apply(const OrderCommandVariant& command) const {
    return std::visit([this](const auto& c) { return this->apply(c); }, command);
}

std::optional<LineItem> Order::find_line_item(const LineItemId& id) const {
    auto it = std::find_if(line_items_.begin(), line_items_.end(),
                           [&](const LineItem& item) { return item.id == id; });
    if (it == line_items_.end()) {
        return std::nullopt;
    }
    return *it;
}

bool Order::contains(const LineItemId& id) const {
    return std::any_of(line_items_.begin(), line_items_.end(),
                       [&](const LineItem& item) { return item.id == id; });
}

OrderResult::OrderResult(std::variant<Order, OrderError> outcome)
    : outcome_(std::move(outcome)) {}

OrderResult OrderResult::success(Order order) {
    return OrderResult(std::move(order));
}

OrderResult OrderResult::failure(OrderError error) {
    return OrderResult(std::move(error));
}

const Order& OrderResult::value() const {
    if (!ok()) {
        throw std::logic_error("OrderResult holds an error: " + describe(std::get<OrderError>(outcome_)));
    }
    return std::get<Order>(outcome_);
}

const OrderError& OrderResult::error() const {
    if (ok()) {
        throw std::logic_error("OrderResult holds an order, not an error");
    }
    return std::get<OrderError>(outcome_);
}

} // namespace oagg::domain
