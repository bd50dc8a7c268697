#include "config.h"

#include <fstream>
#include <sstream>

namespace gradebox {

namespace {

int parse_int(const std::string& flag, const std::string& text, int min_value) {
    int value = 0;
    size_t used = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw ConfigError(flag + " expects an integer, got '" + text + "'");
    }
    if (value < min_value) {
        throw ConfigError(flag + " must be at least " + std::to_string(min_value));
    }
    return value;
}

int json_int(const Json::Value& json, const char* key, int min_value) {
    const Json::Value& value = json[key];
    if (!value.isInt()) {
        throw ConfigError(std::string("config key '") + key + "' must be an integer");
    }
    if (value.asInt() < min_value) {
        throw ConfigError(std::string("config key '") + key + "' must be at least " + std::to_string(min_value));
    }
    return value.asInt();
}

std::string json_string(const Json::Value& json, const char* key) {
    const Json::Value& value = json[key];
    if (!value.isString()) {
        throw ConfigError(std::string("config key '") + key + "' must be a string");
    }
    return value.asString();
}

bool json_bool(const Json::Value& json, const char* key) {
    const Json::Value& value = json[key];
    if (!value.isBool()) {
        throw ConfigError(std::string("config key '") + key + "' must be a boolean");
    }
    return value.asBool();
}

CompareMode compare_mode_from(const std::string& name) {
    CompareMode mode;
    if (!OutputComparator::parse_mode(name, mode)) {
        throw ConfigError("unknown compare mode '" + name + "' (trailing_whitespace, exact, trim)");
    }
    return mode;
}

} // namespace

void ConfigLoader::apply_json(const Json::Value& json, ServiceConfig& config) {
    if (!json.isObject()) {
        throw ConfigError("config file must contain a JSON object");
    }

    if (json.isMember("port")) config.port = json_int(json, "port", 0);
    if (json.isMember("bind")) config.bind_address = json_string(json, "bind");
    if (json.isMember("interpreter")) config.interpreter = json_string(json, "interpreter");
    if (json.isMember("scratch_root")) config.scratch_root = json_string(json, "scratch_root");
    if (json.isMember("max_concurrent")) config.max_concurrent = json_int(json, "max_concurrent", 1);
    if (json.isMember("queue_length")) config.queue_length = json_int(json, "queue_length", 0);
    if (json.isMember("queue_wait")) config.queue_wait_seconds = json_int(json, "queue_wait", 0);
    if (json.isMember("compare")) config.compare_mode = compare_mode_from(json_string(json, "compare"));
    if (json.isMember("require_isolation")) config.require_isolation = json_bool(json, "require_isolation");
    if (json.isMember("fail_on_stderr")) config.fail_on_stderr = json_bool(json, "fail_on_stderr");
    if (json.isMember("max_stored_submissions")) {
        config.max_stored_submissions = static_cast<size_t>(json_int(json, "max_stored_submissions", 1));
    }
}

void ConfigLoader::apply_file(const std::string& path, ServiceConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        throw ConfigError("invalid config file " + path + ": " + errors);
    }
    apply_json(root, config);
}

ServiceConfig ConfigLoader::from_args(int argc, char* argv[]) {
    ServiceConfig config;

    // The file is applied first so flags win regardless of order
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                throw ConfigError("--config requires a value");
            }
            apply_file(argv[i + 1], config);
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--config") {
            ++i;
        } else if (arg == "--port") {
            config.port = parse_int(arg, next(), 0);
        } else if (arg == "--bind") {
            config.bind_address = next();
        } else if (arg == "--interpreter") {
            config.interpreter = next();
        } else if (arg == "--scratch-root") {
            config.scratch_root = next();
        } else if (arg == "--max-concurrent") {
            config.max_concurrent = parse_int(arg, next(), 1);
        } else if (arg == "--queue-length") {
            config.queue_length = parse_int(arg, next(), 0);
        } else if (arg == "--queue-wait") {
            config.queue_wait_seconds = parse_int(arg, next(), 0);
        } else if (arg == "--compare") {
            config.compare_mode = compare_mode_from(next());
        } else if (arg == "--require-isolation") {
            config.require_isolation = true;
        } else if (arg == "--fail-on-stderr") {
            config.fail_on_stderr = true;
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else {
            throw ConfigError("unknown option: " + arg);
        }
    }

    if (config.port > 65535) {
        throw ConfigError("port out of range: " + std::to_string(config.port));
    }
    return config;
}

std::string ConfigLoader::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --port N               Listen port (default " << DEFAULT_PORT << ")\n"
        << "  --bind ADDR            Listen address (default 0.0.0.0)\n"
        << "  --interpreter PATH     Python interpreter (default python3)\n"
        << "  --scratch-root DIR     Parent of per-run scratch directories (default /tmp/gradebox)\n"
        << "  --max-concurrent N     Simultaneous sandboxed requests (default " << MAX_CONCURRENT_EXECUTIONS << ")\n"
        << "  --queue-length N       Requests allowed to wait for a slot (default " << MAX_QUEUED_REQUESTS << ")\n"
        << "  --queue-wait SECONDS   Longest wait for a slot (default " << QUEUE_WAIT_SECONDS << ")\n"
        << "  --compare MODE         trailing_whitespace | exact | trim\n"
        << "  --require-isolation    Refuse to run without namespace isolation\n"
        << "  --fail-on-stderr       Fail tests that write to stderr\n"
        << "  --config FILE          JSON file with the same keys; flags override it\n";
    return out.str();
}

} // namespace gradebox
