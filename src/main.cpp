/*
 * gradebox - Sandboxed Python execution and grading
 * Runs untrusted submissions against ordered test cases
 */

#include "http_server.h"
#include "sandbox.h"
#include "config.h"
#include "gateway.h"
#include "grading_api.h"
#include "execution_pool.h"
#include "submission_store.h"
#include <iostream>
#include <csignal>

using namespace gradebox;

namespace {

HttpServer* g_server = nullptr;

void handle_shutdown(int) {
    if (g_server) {
        g_server->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    ServiceConfig config;
    try {
        config = ConfigLoader::from_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << ConfigLoader::usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << ConfigLoader::usage(argv[0]);
        return 0;
    }

    std::cout << "gradebox - Sandboxed Python Grading" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    SandboxConfig sandbox_config;
    sandbox_config.interpreter = config.interpreter;
    sandbox_config.scratch_root = config.scratch_root;
    sandbox_config.require_isolation = config.require_isolation;
    Sandbox sandbox(sandbox_config);

    std::cout << "Interpreter: " << config.interpreter << std::endl;
    std::cout << "Isolation:   " << (sandbox.isolation_available() ? "namespaces" : "rlimits only")
              << (config.require_isolation ? " (required)" : "") << std::endl;
    std::cout << "Compare:     " << OutputComparator::mode_to_string(config.compare_mode) << std::endl;
    std::cout << "Pool:        " << config.max_concurrent << " concurrent, "
              << config.queue_length << " queued, " << config.queue_wait_seconds << "s wait" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    std::string reason;
    if (!sandbox.check_ready(reason)) {
        // Keep serving so /health reports the problem
        std::cerr << "[Main] Sandbox not ready: " << reason << std::endl;
    }

    ExecutionPool::Config pool_config;
    pool_config.max_concurrent = config.max_concurrent;
    pool_config.max_queue = config.queue_length;
    pool_config.queue_wait = std::chrono::seconds(config.queue_wait_seconds);
    ExecutionPool pool(pool_config);

    GatewayOptions gateway_options;
    gateway_options.harness.compare_mode = config.compare_mode;
    gateway_options.harness.fail_on_stderr = config.fail_on_stderr;
    Gateway gateway(sandbox, pool, gateway_options);

    SubmissionStore submissions(config.max_stored_submissions);

    GradingApi api(gateway, pool, submissions, [&sandbox](std::string& why) {
        return sandbox.check_ready(why);
    });

    HttpServer server(config.port, config.bind_address);
    api.register_routes(server);

    g_server = &server;
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_shutdown);
    std::signal(SIGTERM, handle_shutdown);

    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        g_server = nullptr;
        return 1;
    }

    g_server = nullptr;
    std::cout << "[Main] Shut down" << std::endl;
    return 0;
}
