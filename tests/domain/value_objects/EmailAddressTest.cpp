#include "domain/value_objects/EmailAddress.hpp"

#include <gtest/gtest.h>

using namespace oagg::domain;

TEST(UnverifiedEmailAddress, CreatesFromWellFormedAddress) {
    auto result = UnverifiedEmailAddress::create("ana@example.com");
    ASSERT_TRUE(std::holds_alternative<UnverifiedEmailAddress>(result));
    EXPECT_EQ(std::get<UnverifiedEmailAddress>(result).address(), "ana@example.com");
}

TEST(UnverifiedEmailAddress, RejectsMissingAt) {
    auto result = UnverifiedEmailAddress::create("ana.example.com");
    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_EQ(std::get<ValidationError>(result).field, "email");
}

TEST(UnverifiedEmailAddress, RejectsTwoAts) {
    EXPECT_TRUE(std::holds_alternative<ValidationError>(
        UnverifiedEmailAddress::create("a@b@example.com")));
}

TEST(UnverifiedEmailAddress, RejectsEmptyLocalPart) {
    EXPECT_TRUE(std::holds_alternative<ValidationError>(
        UnverifiedEmailAddress::create("@example.com")));
}

TEST(UnverifiedEmailAddress, RejectsEmptyDomain) {
    EXPECT_TRUE(std::holds_alternative<ValidationError>(
        UnverifiedEmailAddress::create("ana@")));
}

TEST(EmailAddress, UnverifiedVariantIsNotVerified) {
    EmailAddress email = std::get<UnverifiedEmailAddress>(
        UnverifiedEmailAddress::create("ana@example.com"));
    EXPECT_FALSE(is_verified(email));
    EXPECT_EQ(address_of(email), "ana@example.com");
}
