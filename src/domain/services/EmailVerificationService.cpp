#include "domain/services/EmailVerificationService.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace oagg::domain {

namespace {

std::string random_six_digit_code() {
    static thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 999999);
    std::ostringstream ss;
    ss << std::setw(6) << std::setfill('0') << dist(engine);
    return ss.str();
}

} // anonymous namespace

EmailVerificationService::EmailVerificationService()
    : generator_(random_six_digit_code) {}

EmailVerificationService::EmailVerificationService(CodeGenerator generator)
    : generator_(std::move(generator)) {}

std::string EmailVerificationService::issue_code(const UnverifiedEmailAddress& email) {
    auto code = generator_();
    pending_codes_.insert_or_assign(email.address(), code);
    return code;
}

VerifiedEmailResult EmailVerificationService::verify(const UnverifiedEmailAddress& email,
                                                     const std::string& code) {
    auto it = pending_codes_.find(email.address());
    if (it == pending_codes_.end()) {
        return ValidationError{"email", "No verification pending for: " + email.address()};
    }
    if (it->second != code) {
        return ValidationError{"verification_code", "Verification code does not match"};
    }

    pending_codes_.erase(it);
    return VerifiedEmailAddress(email.address());
}

bool EmailVerificationService::has_pending_code(const UnverifiedEmailAddress& email) const {
    return pending_codes_.count(email.address()) > 0;
}

} // namespace oagg::domain
