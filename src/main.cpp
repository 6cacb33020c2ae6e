#include "config/Settings.hpp"
#include "infrastructure/OrderMessageParser.hpp"
#include "infrastructure/OrderSerializer.hpp"
#include "repositories/InMemoryOrderRepository.hpp"
#include "services/OrderService.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

struct ResultPrinter {
    const oagg::domain::OrderId& order_id;
    const oagg::infrastructure::OrderSerializer& serializer;
    bool json_output;

    void operator()(const oagg::domain::Order& order) const {
        if (json_output) {
            std::cout << serializer.to_json(order_id, order).dump() << std::endl;
            return;
        }
        std::cout << "[order] " << order_id.value()
                  << " total=" << order.total_amount().to_string()
                  << " items=" << order.item_count() << std::endl;
    }

    void operator()(const oagg::domain::OrderError& error) const {
        if (json_output) {
            std::cout << serializer.to_json(order_id, error).dump() << std::endl;
            return;
        }
        std::cout << "[rejected] " << order_id.value() << " "
                  << oagg::domain::describe(error) << std::endl;
    }

    void operator()(const oagg::repositories::VersionConflict& conflict) const {
        if (json_output) {
            std::cout << serializer.to_json(conflict).dump() << std::endl;
            return;
        }
        std::cout << "[conflict] " << order_id.value()
                  << " expected_version=" << conflict.expected_version
                  << " actual_version=" << conflict.actual_version << std::endl;
    }
};

} // namespace

int main(int argc, char* argv[]) {
    auto settings = oagg::config::Settings::from_environment();
    bool json_output = settings.output.format == "json";

    // Optional CLI arg: command file, one JSON message per line
    std::ifstream file;
    if (argc >= 2) {
        file.open(argv[1]);
        if (!file) {
            std::cerr << "Usage: order_aggregate [commands.jsonl]" << std::endl;
            std::cerr << "Cannot open: " << argv[1] << std::endl;
            return 1;
        }
    }
    std::istream& input = file.is_open() ? static_cast<std::istream&>(file) : std::cin;

    oagg::repositories::InMemoryOrderRepository repo;
    oagg::services::OrderService service(repo, settings.service);
    oagg::infrastructure::OrderMessageParser parser;
    oagg::infrastructure::OrderSerializer serializer;

    std::cerr << "[engine] Started (format=" << settings.output.format
              << ", max_commit_retries=" << settings.service.max_commit_retries << ")" << std::endl;

    std::set<oagg::domain::OrderId> touched_orders;
    std::string line;
    uint64_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        std::vector<oagg::domain::OrderCommandVariant> commands;
        try {
            commands = parser.parse(line);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[parser] line " << line_number << ": " << e.what() << std::endl;
            continue;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[parser] line " << line_number << ": " << e.what() << std::endl;
            continue;
        }

        for (const auto& command : commands) {
            const auto& order_id = oagg::services::target_order(command);
            touched_orders.insert(order_id);
            try {
                auto result = service.execute(command);
                std::visit(ResultPrinter{order_id, serializer, json_output}, result);
            } catch (const std::exception& e) {
                std::cerr << "[engine] line " << line_number << ": order " << order_id.value()
                          << " command failed: " << e.what() << std::endl;
            }
        }
    }

    if (settings.output.print_summary) {
        std::cerr << "[stats] orders=" << touched_orders.size()
                  << " executed=" << service.commands_executed()
                  << " rejected=" << service.commands_rejected()
                  << " retried=" << service.conflicts_retried() << std::endl;

        for (const auto& order_id : touched_orders) {
            auto order = service.get_order(order_id);
            if (!order) continue;
            std::cerr << "[stats] " << order_id.value()
                      << " amount_to_bill=" << order->total_amount().to_string() << std::endl;
        }
    }

    std::cerr << "[engine] Done. Processed " << line_number << " lines." << std::endl;
    return 0;
}
