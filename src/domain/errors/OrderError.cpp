#include "domain/errors/OrderError.hpp"

namespace oagg::domain {

namespace {

struct NameVisitor {
    std::string operator()(const InvalidPriceError&) const { return "InvalidPriceError"; }
    std::string operator()(const DuplicateLineItemError&) const { return "DuplicateLineItemError"; }
    std::string operator()(const LineItemNotFoundError&) const { return "LineItemNotFoundError"; }
    std::string operator()(const TotalOverflowError&) const { return "TotalOverflowError"; }
};

struct DescribeVisitor {
    std::string operator()(const InvalidPriceError& e) const {
        return "Price must be non-negative, got " + e.price.to_string() +
               " for line item " + e.line_item_id.value();
    }
    std::string operator()(const DuplicateLineItemError& e) const {
        return "Line item " + e.line_item_id.value() + " already exists in order";
    }
    std::string operator()(const LineItemNotFoundError& e) const {
        return "Line item " + e.line_item_id.value() + " not found in order";
    }
    std::string operator()(const TotalOverflowError& e) const {
        return "Order total overflows when line item " + e.line_item_id.value() +
               " is priced " + e.price.to_string();
    }
};

} // anonymous namespace

std::string error_name(const OrderError& error) {
    return std::visit(NameVisitor{}, error);
}

std::string describe(const OrderError& error) {
    return std::visit(DescribeVisitor{}, error);
}

} // namespace oagg::domain
