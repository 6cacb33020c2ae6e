#pragma once

#include "domain/aggregates/Order.hpp"

#include <string>
#include <vector>

namespace oagg::infrastructure {

class OrderMessageParser {
public:
    // Parse a JSON command message into domain commands.
    // Accepts a single object or an array of objects. Entries with an
    // unrecognized "type" are skipped, so the result may be empty.
    // Prices are decimal strings ("2.00") or integer "price_minor" cents.
    std::vector<oagg::domain::OrderCommandVariant> parse(const std::string& json_str) const;
};

} // namespace oagg::infrastructure
