#include "services/OrderService.hpp"

using namespace oagg::domain;
using oagg::repositories::VersionConflict;

namespace oagg::services {

OrderService::OrderService(oagg::repositories::IOrderRepository& repo,
                           const oagg::config::ServiceSettings& settings)
    : repository_(repo)
    , max_commit_retries_(settings.max_commit_retries < 0 ? 0 : settings.max_commit_retries) {}

ExecutionResult OrderService::execute(const OrderCommandVariant& command) {
    const auto& order_id = target_order(command);

    for (int attempt = 0;; ++attempt) {
        // Read
        auto stored = repository_.load(order_id);
        Order current = stored ? stored->order : Order::empty();
        uint64_t version = stored ? stored->version : 0;

        // Compute
        auto result = current.apply(command);
        if (!result) {
            ++commands_rejected_;
            return result.error();
        }

        // Commit only if nobody else did in between
        auto saved = repository_.save(order_id, version, result.value());
        if (std::holds_alternative<uint64_t>(saved)) {
            ++commands_executed_;
            return result.value();
        }

        if (attempt >= max_commit_retries_) {
            return std::get<VersionConflict>(saved);
        }
        ++conflicts_retried_;
    }
}

std::optional<Order> OrderService::get_order(const OrderId& order_id) const {
    auto stored = repository_.load(order_id);
    if (!stored) return std::nullopt;
    return stored->order;
}

const OrderId& target_order(const OrderCommandVariant& command) {
    return std::visit([](const auto& c) -> const OrderId& { return c.order_id; }, command);
}

} // namespace oagg::services
