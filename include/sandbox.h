#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>

#include "cancellation.h"

namespace gradebox {

// How a single sandboxed run ended
enum class RunStatus {
    COMPLETED,        // Ran to completion within limits (any exit code)
    TIMED_OUT,        // Wall-clock deadline or CPU backstop hit; group killed
    MEMORY_EXCEEDED,  // Killed or failed by the memory ceiling
    LAUNCH_FAILED,    // Sandbox could not start; not the submitted code's fault
    CANCELLED         // Caller cancelled; group killed
};

struct RunOutcome {
    RunStatus status = RunStatus::LAUNCH_FAILED;
    std::string stdout_output;               // Partial for TIMED_OUT / MEMORY_EXCEEDED
    std::string stderr_output;
    int exit_code = -1;
    std::chrono::milliseconds duration{0};
    size_t peak_memory_kb = 0;               // ru_maxrss of the child
    bool output_truncated = false;
    std::string reason;                      // LAUNCH_FAILED / CANCELLED detail
};

struct SyntaxCheck {
    bool ok = true;
    std::vector<std::string> messages;       // "Syntax error at line N: msg"
    bool infrastructure_failure = false;     // Checker itself could not run
    std::chrono::milliseconds duration{0};
};

struct SandboxConfig {
    std::string interpreter = "python3";
    std::vector<std::string> interpreter_args = {"-s", "-B", "-u"};
    std::string scratch_root = "/tmp/gradebox";
    size_t max_output_bytes = 1024 * 1024;
    size_t max_file_size_bytes = 16 * 1024 * 1024;
    int max_processes = 32;
    int max_open_files = 64;
    bool enable_namespaces = true;           // user/pid/mount/net/ipc/uts namespaces
    bool enable_seccomp = true;
    bool require_isolation = false;          // Fail the launch if namespaces are unavailable
};

// Seam between the test harness and the process sandbox
class CodeRunner {
public:
    virtual ~CodeRunner() = default;

    virtual RunOutcome run(const std::string& code,
                           const std::string& stdin_data,
                           std::chrono::seconds timeout,
                           size_t memory_limit_mb,
                           const CancellationToken* cancel) = 0;

    virtual SyntaxCheck check_syntax(const std::string& code,
                                     const CancellationToken* cancel) = 0;
};

// Runs one untrusted program per call in a fresh process group and scratch
// directory. Safe to share between threads: no per-call state is kept.
class Sandbox : public CodeRunner {
public:
    explicit Sandbox(const SandboxConfig& config = SandboxConfig{});
    ~Sandbox() override;

    RunOutcome run(const std::string& code,
                   const std::string& stdin_data,
                   std::chrono::seconds timeout,
                   size_t memory_limit_mb,
                   const CancellationToken* cancel = nullptr) override;

    SyntaxCheck check_syntax(const std::string& code,
                             const CancellationToken* cancel = nullptr) override;

    // Interpreter resolvable and scratch root writable
    bool check_ready(std::string& reason) const;

    // Namespaces could be set up when the sandbox was created
    bool isolation_available() const;

    const SandboxConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Status of a run that died on a signal the runner did not send.
// cpu_limit is the RLIMIT_CPU soft limit the run was given.
RunStatus classify_signal(int sig, std::chrono::microseconds cpu_time, std::chrono::seconds cpu_limit);

std::string run_status_to_string(RunStatus status);

} // namespace gradebox
