#include "domain/value_objects/LineItemId.hpp"

#include <stdexcept>
#include <utility>

namespace oagg::domain {

LineItemId::LineItemId(std::string value) : value_(std::move(value)) {
    if (value_.empty()) {
        throw std::invalid_argument("LineItemId must not be empty");
    }
}

LineItemId LineItemId::from_number(uint64_t number) {
    return LineItemId(std::to_string(number));
}

} // namespace oagg::domain
