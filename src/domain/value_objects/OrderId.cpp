#include "domain/value_objects/OrderId.hpp"

#include <stdexcept>
#include <utility>

namespace oagg::domain {

OrderId::OrderId(std::string value) : value_(std::move(value)) {
    if (value_.empty()) {
        throw std::invalid_argument("OrderId must not be empty");
    }
}

} // namespace oagg::domain
