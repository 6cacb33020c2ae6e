#pragma once

#include "domain/errors/ValidationError.hpp"

#include <string>
#include <utility>
#include <variant>

namespace oagg::domain {

class UnverifiedEmailAddress;
class EmailVerificationService;

using UnverifiedEmailResult = std::variant<UnverifiedEmailAddress, ValidationError>;

// Syntactically valid address that has not been confirmed by its owner.
class UnverifiedEmailAddress {
public:
    static UnverifiedEmailResult create(std::string address);

    const std::string& address() const noexcept { return address_; }

    bool operator==(const UnverifiedEmailAddress&) const = default;

private:
    explicit UnverifiedEmailAddress(std::string address) : address_(std::move(address)) {}

    std::string address_;
};

// Address confirmed through EmailVerificationService. It has no public
// constructor; holding one is proof that verification happened.
class VerifiedEmailAddress {
public:
    const std::string& address() const noexcept { return address_; }

    bool operator==(const VerifiedEmailAddress&) const = default;

private:
    friend class EmailVerificationService;

    explicit VerifiedEmailAddress(std::string address) : address_(std::move(address)) {}

    std::string address_;
};

using EmailAddress = std::variant<UnverifiedEmailAddress, VerifiedEmailAddress>;

inline bool is_verified(const EmailAddress& email) noexcept {
    return std::holds_alternative<VerifiedEmailAddress>(email);
}

inline const std::string& address_of(const EmailAddress& email) {
    return std::visit([](const auto& e) -> const std::string& { return e.address(); }, email);
}

} // namespace oagg::domain
