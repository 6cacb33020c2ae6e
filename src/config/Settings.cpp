#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace oagg::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("OAGG_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.service.max_commit_retries = env_int_or("OAGG_MAX_COMMIT_RETRIES", s.service.max_commit_retries);
    if (s.service.max_commit_retries < 0) {
        s.service.max_commit_retries = 0;
    }
    s.output.format = env_or("OAGG_OUTPUT_FORMAT", s.output.format);
    s.output.print_summary = env_bool_or("OAGG_PRINT_SUMMARY", s.output.print_summary);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.service.max_commit_retries = 3;
    s.output.format = "text";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.service.max_commit_retries = 10;
    s.output.format = "json";
    return s;
}

} // namespace oagg::config
