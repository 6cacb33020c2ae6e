#pragma once

#include "domain/errors/ValidationError.hpp"
#include "domain/value_objects/EmailAddress.hpp"

#include <functional>
#include <map>
#include <string>
#include <variant>

namespace oagg::domain {

using VerifiedEmailResult = std::variant<VerifiedEmailAddress, ValidationError>;

// Sole producer of VerifiedEmailAddress. Issues a one-time code per address
// and exchanges a matching code for the verified value.
class EmailVerificationService {
public:
    using CodeGenerator = std::function<std::string()>;

    EmailVerificationService();
    explicit EmailVerificationService(CodeGenerator generator);

    // Issues (or re-issues) the code for this address. Delivery is up to the caller.
    std::string issue_code(const UnverifiedEmailAddress& email);

    // Consumes the pending code on success, so a code verifies at most once.
    VerifiedEmailResult verify(const UnverifiedEmailAddress& email, const std::string& code);

    bool has_pending_code(const UnverifiedEmailAddress& email) const;

private:
    CodeGenerator generator_;
    std::map<std::string, std::string> pending_codes_;
};

} // namespace oagg::domain
