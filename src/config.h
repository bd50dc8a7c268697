#pragma once

#include <string>
#include <stdexcept>
#include <json/json.h>

#include "constants.h"
#include "output_compare.h"

namespace gradebox {

// Bad flag, unreadable config file or out-of-range value
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

struct ServiceConfig {
    int port = DEFAULT_PORT;
    std::string bind_address = "0.0.0.0";
    std::string interpreter = "python3";
    std::string scratch_root = "/tmp/gradebox";
    int max_concurrent = MAX_CONCURRENT_EXECUTIONS;
    int queue_length = MAX_QUEUED_REQUESTS;
    int queue_wait_seconds = QUEUE_WAIT_SECONDS;
    CompareMode compare_mode = CompareMode::TRAILING_WHITESPACE;
    bool require_isolation = false;
    bool fail_on_stderr = false;
    size_t max_stored_submissions = MAX_STORED_SUBMISSIONS;
    bool show_help = false;
};

class ConfigLoader {
public:
    // Flags override values from --config FILE. Throws ConfigError.
    static ServiceConfig from_args(int argc, char* argv[]);

    // Applies the keys present in a JSON object. Throws ConfigError.
    static void apply_json(const Json::Value& json, ServiceConfig& config);

    static void apply_file(const std::string& path, ServiceConfig& config);

    static std::string usage(const std::string& program);
};

} // namespace gradebox
