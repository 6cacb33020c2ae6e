#include "domain/value_objects/EmailAddress.hpp"

#include <algorithm>

namespace oagg::domain {

UnverifiedEmailResult UnverifiedEmailAddress::create(std::string address) {
    if (std::count(address.begin(), address.end(), '@') != 1) {
        return ValidationError{"email", "Email must contain exactly one '@': " + address};
    }

    auto at = address.find('@');
    if (at == 0) {
        return ValidationError{"email", "Email local part must not be empty: " + address};
    }
    if (at == address.size() - 1) {
        return ValidationError{"email", "Email domain must not be empty: " + address};
    }

    return UnverifiedEmailAddress(std::move(address));
}

} // namespace oagg::domain
