#pragma once

#include "domain/commands/AddLineItem.hpp"
#include "domain/commands/ChangeLineItemPrice.hpp"
#include "domain/entities/LineItem.hpp"
#include "domain/errors/OrderError.hpp"
#include "domain/value_objects/LineItemId.hpp"
#include "domain/value_objects/Money.hpp"

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace oagg::domain {

using OrderCommandVariant = std::variant<AddLineItem, ChangeLineItemPrice>;

class OrderResult;

// Consistency boundary around a set of line items. amount_to_bill always
// equals the sum of the item prices and item ids are unique. A change whose
// total would not fit in Money is rejected with TotalOverflowError. Every
// operation returns a new Order; the receiver is never modified.
class Order {
public:
    // Factory
    static Order empty();

    // Transitions
    OrderResult add_line_item(const LineItem& item) const;
    OrderResult change_line_item_price(const LineItemId& id, Money new_price) const;

    OrderResult apply(const AddLineItem& command) const;
    OrderResult apply(const ChangeLineItemPrice& command) const;
    OrderResult apply(const OrderCommandVariant& command) const;

    // Queries
    Money total_amount() const noexcept { return amount_to_bill_; }
    const std::vector<LineItem>& line_items() const noexcept { return line_items_; }
    std::optional<LineItem> find_line_item(const LineItemId& id) const;
    bool contains(const LineItemId& id) const;
    std::size_t item_count() const noexcept { return line_items_.size(); }
    bool is_empty() const noexcept { return line_items_.empty(); }

    bool operator==(const Order&) const = default;

private:
    Order(std::vector<LineItem> line_items, Money amount_to_bill);

    // Recomputes the total of items; fails if it overflows because of `changed`
    static OrderResult rebuild(std::vector<LineItem> items, const LineItem& changed);

    std::vector<LineItem> line_items_;   // Insertion order
    Money amount_to_bill_;               // Sum of line_items_ prices
};

class OrderResult {
public:
    static OrderResult success(Order order);
    static OrderResult failure(OrderError error);

    bool ok() const noexcept { return std::holds_alternative<Order>(outcome_); }
    explicit operator bool() const noexcept { return ok(); }

    // Throw std::logic_error when called on the other alternative
    const Order& value() const;
    const OrderError& error() const;

private:
    explicit OrderResult(std::variant<Order, OrderError> outcome);

    std::variant<Order, OrderError> outcome_;
};

} // namespace oagg::domain
