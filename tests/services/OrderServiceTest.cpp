#include "repositories/InMemoryOrderRepository.hpp"
#include "services/OrderService.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <thread>
#include <vector>

using namespace oagg::domain;
using namespace oagg::services;
using oagg::repositories::InMemoryOrderRepository;
using oagg::repositories::IOrderRepository;
using oagg::repositories::SaveResult;
using oagg::repositories::VersionConflict;
using oagg::repositories::VersionedOrder;

// --- Test fake ---

// Delegates to an in-memory store but can run a hook just before a save,
// which lets a test play the part of a racing writer.
class RacingOrderRepository : public IOrderRepository {
public:
    std::function<void()> before_save;
    int rejected_saves = 0;

    std::optional<VersionedOrder> load(const OrderId& order_id) const override {
        return inner.load(order_id);
    }

    SaveResult save(const OrderId& order_id, uint64_t expected_version,
                    const Order& order) override {
        if (before_save) {
            auto hook = std::move(before_save);
            before_save = nullptr;
            hook();
        }
        auto result = inner.save(order_id, expected_version, order);
        if (std::holds_alternative<VersionConflict>(result)) ++rejected_saves;
        return result;
    }

    InMemoryOrderRepository inner;
};

// Rejects every save with a conflict, as if another writer always won.
class AlwaysConflictingRepository : public IOrderRepository {
public:
    int save_attempts = 0;

    std::optional<VersionedOrder> load(const OrderId&) const override { return std::nullopt; }

    SaveResult save(const OrderId& order_id, uint64_t expected_version, const Order&) override {
        ++save_attempts;
        return VersionConflict{order_id, expected_version, expected_version + 1};
    }
};

// --- Fixture ---

class OrderServiceTest : public ::testing::Test {
protected:
    InMemoryOrderRepository repo;
    OrderId order_id{"o-1"};

    OrderCommandVariant add(const std::string& id, const std::string& price) {
        return AddLineItem{{order_id}, LineItem{LineItemId(id), Money::from_string(price)}};
    }

    OrderCommandVariant change(const std::string& id, const std::string& price) {
        return ChangeLineItemPrice{{order_id}, LineItemId(id), Money::from_string(price)};
    }
};

// --- Command execution ---

TEST_F(OrderServiceTest, FirstCommandCreatesOrder) {
    OrderService service(repo);

    auto result = service.execute(add("0", "2.00"));

    ASSERT_TRUE(std::holds_alternative<Order>(result));
    EXPECT_EQ(std::get<Order>(result).total_amount(), Money::from_string("2.00"));
    EXPECT_EQ(repo.version_of(order_id), 1);
    EXPECT_EQ(service.commands_executed(), 1);
}

TEST_F(OrderServiceTest, AppliesCommandsInSequence) {
    OrderService service(repo);

    service.execute(add("0", "2.00"));
    service.execute(add("1", "1.25"));
    service.execute(change("0", "3.00"));

    auto order = service.get_order(order_id);
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->total_amount(), Money::from_string("4.25"));
    EXPECT_EQ(repo.version_of(order_id), 3);
}

TEST_F(OrderServiceTest, RejectionIsReturnedAndNotSaved) {
    OrderService service(repo);
    service.execute(add("0", "2.00"));

    auto result = service.execute(add("0", "5.00"));

    ASSERT_TRUE(std::holds_alternative<OrderError>(result));
    EXPECT_TRUE(std::holds_alternative<DuplicateLineItemError>(std::get<OrderError>(result)));
    EXPECT_EQ(repo.version_of(order_id), 1);
    EXPECT_EQ(service.get_order(order_id)->total_amount(), Money::from_string("2.00"));
    EXPECT_EQ(service.commands_rejected(), 1);
}

TEST_F(OrderServiceTest, TotalOverflowIsRejectedWithoutThrowing) {
    OrderService service(repo);
    service.execute(add("0", "50000000000000000.00"));

    ExecutionResult result = Order::empty();
    EXPECT_NO_THROW(result = service.execute(add("1", "50000000000000000.00")));

    ASSERT_TRUE(std::holds_alternative<OrderError>(result));
    EXPECT_TRUE(std::holds_alternative<TotalOverflowError>(std::get<OrderError>(result)));
    EXPECT_EQ(repo.version_of(order_id), 1);
    EXPECT_EQ(service.get_order(order_id)->total_amount(), Money::from_string("50000000000000000.00"));
    EXPECT_EQ(service.commands_rejected(), 1);
}

TEST_F(OrderServiceTest, ChangeOnUnknownOrderIsNotFound) {
    OrderService service(repo);

    auto result = service.execute(change("99", "5.00"));

    ASSERT_TRUE(std::holds_alternative<OrderError>(result));
    EXPECT_TRUE(std::holds_alternative<LineItemNotFoundError>(std::get<OrderError>(result)));
    EXPECT_EQ(repo.order_count(), 0);
}

TEST_F(OrderServiceTest, GetOrderForUnknownIdIsNullopt) {
    OrderService service(repo);
    EXPECT_FALSE(service.get_order(OrderId("nope")).has_value());
}

TEST_F(OrderServiceTest, OrdersAreIndependent) {
    OrderService service(repo);

    service.execute(add("0", "2.00"));
    service.execute(AddLineItem{{OrderId("o-2")}, LineItem{LineItemId("0"), Money::from_string("7.00")}});

    EXPECT_EQ(service.get_order(order_id)->total_amount(), Money::from_string("2.00"));
    EXPECT_EQ(service.get_order(OrderId("o-2"))->total_amount(), Money::from_string("7.00"));
}

// --- Optimistic concurrency ---

TEST_F(OrderServiceTest, RetriesAfterConflictAndKeepsRacingWrite) {
    RacingOrderRepository racing;
    OrderService service(racing);
    service.execute(add("0", "2.00"));

    // Another writer commits item 1 between our read and our save
    racing.before_save = [&] {
        auto current = racing.inner.load(order_id);
        auto theirs = current->order
            .add_line_item(LineItem{LineItemId("1"), Money::from_string("1.00")})
            .value();
        racing.inner.save(order_id, current->version, theirs);
    };

    auto result = service.execute(add("2", "0.50"));

    ASSERT_TRUE(std::holds_alternative<Order>(result));
    EXPECT_EQ(racing.rejected_saves, 1);
    EXPECT_EQ(service.conflicts_retried(), 1);

    auto order = service.get_order(order_id);
    EXPECT_EQ(order->item_count(), 3);
    EXPECT_EQ(order->total_amount(), Money::from_string("3.50"));
}

TEST_F(OrderServiceTest, RacingWriteCanTurnRetryIntoRejection) {
    RacingOrderRepository racing;
    OrderService service(racing);

    // Another writer adds the same id first; the retry sees it and rejects
    racing.before_save = [&] {
        racing.inner.save(order_id, 0,
            Order::empty().add_line_item(LineItem{LineItemId("0"), Money::from_string("9.00")}).value());
    };

    auto result = service.execute(add("0", "2.00"));

    ASSERT_TRUE(std::holds_alternative<OrderError>(result));
    EXPECT_TRUE(std::holds_alternative<DuplicateLineItemError>(std::get<OrderError>(result)));
    EXPECT_EQ(service.get_order(order_id)->total_amount(), Money::from_string("9.00"));
}

TEST_F(OrderServiceTest, GivesUpAfterMaxRetries) {
    AlwaysConflictingRepository conflicting;
    oagg::config::ServiceSettings settings;
    settings.max_commit_retries = 2;
    OrderService service(conflicting, settings);

    auto result = service.execute(add("0", "2.00"));

    ASSERT_TRUE(std::holds_alternative<VersionConflict>(result));
    EXPECT_EQ(conflicting.save_attempts, 3);
    EXPECT_EQ(service.conflicts_retried(), 2);
    EXPECT_EQ(service.commands_executed(), 0);
}

TEST_F(OrderServiceTest, ZeroRetriesMeansSingleAttempt) {
    AlwaysConflictingRepository conflicting;
    oagg::config::ServiceSettings settings;
    settings.max_commit_retries = 0;
    OrderService service(conflicting, settings);

    auto result = service.execute(add("0", "2.00"));

    EXPECT_TRUE(std::holds_alternative<VersionConflict>(result));
    EXPECT_EQ(conflicting.save_attempts, 1);
}

TEST_F(OrderServiceTest, ConcurrentWritersAllLand) {
    oagg::config::ServiceSettings settings;
    settings.max_commit_retries = 100000;
    OrderService service(repo, settings);

    constexpr int kThreads = 8;
    constexpr int kItemsPerThread = 50;

    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&, t] {
            for (int i = 0; i < kItemsPerThread; ++i) {
                auto id = std::to_string(t) + "-" + std::to_string(i);
                service.execute(AddLineItem{{order_id},
                    LineItem{LineItemId(id), Money::from_minor_units(t * 1000 + i)}});
            }
        });
    }
    for (auto& w : writers) w.join();

    int64_t expected = 0;
    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kItemsPerThread; ++i) expected += t * 1000 + i;
    }

    auto order = service.get_order(order_id);
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->item_count(), static_cast<size_t>(kThreads * kItemsPerThread));
    EXPECT_EQ(order->total_amount(), Money::from_minor_units(expected));
    EXPECT_EQ(repo.version_of(order_id), static_cast<uint64_t>(kThreads * kItemsPerThread));
    EXPECT_EQ(service.commands_executed(), static_cast<uint64_t>(kThreads * kItemsPerThread));
}

// --- Helpers ---

TEST(TargetOrder, ReadsOrderIdFromEitherCommand) {
    OrderCommandVariant a = AddLineItem{{OrderId("x")}, LineItem{LineItemId("0"), Money::zero()}};
    OrderCommandVariant b = ChangeLineItemPrice{{OrderId("y")}, LineItemId("0"), Money::zero()};

    EXPECT_EQ(target_order(a), OrderId("x"));
    EXPECT_EQ(target_order(b), OrderId("y"));
}
