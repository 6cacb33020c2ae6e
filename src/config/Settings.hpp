#pragma once

#include <string>

namespace oagg::config {

struct ServiceSettings {
    int max_commit_retries = 3;   // extra attempts after a VersionConflict
};

struct OutputSettings {
    std::string format = "text";  // "text" or "json"
    bool print_summary = true;
};

struct Settings {
    ServiceSettings service;
    OutputSettings output;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace oagg::config
