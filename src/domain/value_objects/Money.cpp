#include "domain/value_objects/Money.hpp"

#include <cctype>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace oagg::domain {

namespace {

constexpr std::size_t kFractionDigits = 2;
constexpr int64_t kMinorPerMajor = 100;

int64_t parse_digits(const std::string& digits, const std::string& original) {
    int64_t result = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Money contains a non-digit character: " + original);
        }
        if (result > (std::numeric_limits<int64_t>::max() - (c - '0')) / 10) {
            throw std::invalid_argument("Money out of range: " + original);
        }
        result = result * 10 + (c - '0');
    }
    return result;
}

} // anonymous namespace

Money Money::from_minor_units(int64_t minor_units) noexcept {
    return Money(minor_units);
}

// Parses "12", "12.3", "12.34", "-0.01". No exponent, no more than two
// fractional digits, so the conversion to minor units is exact.
Money Money::from_string(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Money must not be empty");
    }

    bool negative = str.front() == '-';
    std::string body = negative ? str.substr(1) : str;

    auto dot = body.find('.');
    std::string whole = body.substr(0, dot);
    std::string fraction = (dot == std::string::npos) ? "" : body.substr(dot + 1);

    if (whole.empty()) {
        throw std::invalid_argument("Money has no integer part: " + str);
    }
    if (dot != std::string::npos && fraction.empty()) {
        throw std::invalid_argument("Money has a trailing decimal point: " + str);
    }
    if (fraction.size() > kFractionDigits) {
        throw std::invalid_argument(
            "Money has more than " + std::to_string(kFractionDigits) + " fractional digits: " + str);
    }

    fraction.append(kFractionDigits - fraction.size(), '0');

    int64_t major = parse_digits(whole, str);
    int64_t minor = parse_digits(fraction, str);
    if (major > (std::numeric_limits<int64_t>::max() - minor) / kMinorPerMajor) {
        throw std::invalid_argument("Money out of range: " + str);
    }

    int64_t units = major * kMinorPerMajor + minor;
    return Money(negative ? -units : units);
}

Money Money::zero() noexcept {
    return Money(0);
}

std::string Money::to_string() const {
    // Work in unsigned space so INT64_MIN renders correctly
    uint64_t magnitude = minor_units_ < 0
        ? static_cast<uint64_t>(-(minor_units_ + 1)) + 1
        : static_cast<uint64_t>(minor_units_);

    std::string fraction = std::to_string(magnitude % kMinorPerMajor);
    if (fraction.size() < kFractionDigits) {
        fraction.insert(0, kFractionDigits - fraction.size(), '0');
    }

    return (minor_units_ < 0 ? "-" : "") + std::to_string(magnitude / kMinorPerMajor) + "." + fraction;
}

std::optional<Money> Money::checked_add(const Money& other) const noexcept {
    int64_t a = minor_units_;
    int64_t b = other.minor_units_;
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
        return std::nullopt;
    }
    return Money(a + b);
}

Money Money::operator+(const Money& other) const {
    auto sum = checked_add(other);
    if (!sum) {
        throw std::overflow_error(
            "Money addition overflows: " + to_string() + " + " + other.to_string());
    }
    return *sum;
}

} // namespace oagg::domain
