#pragma once

#include "domain/value_objects/LineItemId.hpp"
#include "domain/value_objects/Money.hpp"

#include <string>
#include <variant>

namespace oagg::domain {

struct InvalidPriceError {
    LineItemId line_item_id;
    Money price;

    bool operator==(const InvalidPriceError&) const = default;
};

struct DuplicateLineItemError {
    LineItemId line_item_id;

    bool operator==(const DuplicateLineItemError&) const = default;
};

struct LineItemNotFoundError {
    LineItemId line_item_id;

    bool operator==(const LineItemNotFoundError&) const = default;
};

// The new total would exceed what Money can hold.
struct TotalOverflowError {
    LineItemId line_item_id;
    Money price;

    bool operator==(const TotalOverflowError&) const = default;
};

// Expected business rejections of an order operation. None of them is fatal;
// the order the operation was called on stays authoritative.
using OrderError = std::variant<InvalidPriceError, DuplicateLineItemError, LineItemNotFoundError,
                                TotalOverflowError>;

std::string error_name(const OrderError& error);
std::string describe(const OrderError& error);

} // namespace oagg::domain
