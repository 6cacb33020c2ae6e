#pragma once

#include "repositories/IOrderRepository.hpp"

#include <cstddef>
#include <map>
#include <mutex>

namespace oagg::repositories {

class InMemoryOrderRepository : public oagg::repositories::IOrderRepository {
public:
    std::optional<VersionedOrder> load(const oagg::domain::OrderId& order_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it != orders_.end()) return it->second;
        return std::nullopt;
    }

    SaveResult save(const oagg::domain::OrderId& order_id,
                    uint64_t expected_version,
                    const oagg::domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        uint64_t actual_version = (it != orders_.end()) ? it->second.version : 0;
        if (actual_version != expected_version) {
            return VersionConflict{order_id, expected_version, actual_version};
        }

        uint64_t next_version = actual_version + 1;
        orders_.insert_or_assign(order_id, VersionedOrder{order, next_version});
        return next_version;
    }

    // Test helpers
    size_t order_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.size();
    }
    uint64_t version_of(const oagg::domain::OrderId& order_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        return (it != orders_.end()) ? it->second.version : 0;
    }

private:
    mutable std::mutex mutex_;
    std::map<oagg::domain::OrderId, VersionedOrder> orders_;
};

} // namespace oagg::repositories
