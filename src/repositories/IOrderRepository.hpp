#pragma once

#include "domain/aggregates/Order.hpp"
#include "domain/value_objects/OrderId.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace oagg::repositories {

struct VersionedOrder {
    oagg::domain::Order order;
    uint64_t version;
};

// Another writer committed first. The caller must re-read and retry.
struct VersionConflict {
    oagg::domain::OrderId order_id;
    uint64_t expected_version;
    uint64_t actual_version;

    bool operator==(const VersionConflict&) const = default;
};

// Holds the version assigned by a successful save, or the conflict.
using SaveResult = std::variant<uint64_t, VersionConflict>;

class IOrderRepository {
public:
    // Unknown orders return nullopt; they are treated as version 0
    virtual std::optional<VersionedOrder> load(const oagg::domain::OrderId& order_id) const = 0;

    // Compare-and-swap: commits only if the stored version is still expected_version
    virtual SaveResult save(const oagg::domain::OrderId& order_id,
                            uint64_t expected_version,
                            const oagg::domain::Order& order) = 0;

    virtual ~IOrderRepository() = default;
};

} // namespace oagg::repositories
