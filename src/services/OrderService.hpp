#pragma once

#include "config/Settings.hpp"
#include "domain/aggregates/Order.hpp"
#include "domain/value_objects/OrderId.hpp"
#include "repositories/IOrderRepository.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <variant>

namespace oagg::services {

using ExecutionResult = std::variant<oagg::domain::Order,
                                     oagg::domain::OrderError,
                                     oagg::repositories::VersionConflict>;

// Applies commands to logical orders held in a repository. Each command is
// read / compute / compare-and-swap, retried on VersionConflict.
class OrderService {
public:
    OrderService(oagg::repositories::IOrderRepository& repo,
                 const oagg::config::ServiceSettings& settings = {});

    ExecutionResult execute(const oagg::domain::OrderCommandVariant& command);

    std::optional<oagg::domain::Order> get_order(const oagg::domain::OrderId& order_id) const;

    uint64_t commands_executed() const noexcept { return commands_executed_; }
    uint64_t commands_rejected() const noexcept { return commands_rejected_; }
    uint64_t conflicts_retried() const noexcept { return conflicts_retried_; }

private:
    oagg::repositories::IOrderRepository& repository_;
    int max_commit_retries_;
    std::atomic<uint64_t> commands_executed_{0};
    std::atomic<uint64_t> commands_rejected_{0};
    std::atomic<uint64_t> conflicts_retried_{0};
};

const oagg::domain::OrderId& target_order(const oagg::domain::OrderCommandVariant& command);

} // namespace oagg::services
