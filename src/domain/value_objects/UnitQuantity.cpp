#include "domain/value_objects/UnitQuantity.hpp"

#include <string>

namespace oagg::domain {

UnitQuantityResult UnitQuantity::create(int value) {
    if (value < kMin) {
        return ValidationError{"quantity",
            "UnitQuantity must be at least " + std::to_string(kMin) + ", got: " + std::to_string(value)};
    }
    if (value > kMax) {
        return ValidationError{"quantity",
            "UnitQuantity must be at most " + std::to_string(kMax) + ", got: " + std::to_string(value)};
    }
    return UnitQuantity(value);
}

} // namespace oagg::domain
