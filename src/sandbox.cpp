#include "sandbox.h"
#include "constants.h"

#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <unistd.h>
#include <sched.h>
#include <signal.h>
#include <seccomp.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <cstdint>
#include <chrono>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>
#include <system_error>
#include <algorithm>

namespace gradebox {

namespace fs = std::filesystem;

namespace {

// Compiles the program read from stdin without running it.
const char* const SYNTAX_CHECKER = R"(import sys
source = sys.stdin.read()
try:
    compile(source, "main.py", "exec")
except SyntaxError as e:
    print("Syntax error at line %s: %s" % (e.lineno, e.msg))
    sys.exit(3)
except ValueError as e:
    print("Syntax error: %s" % e)
    sys.exit(3)
)";
constexpr int SYNTAX_ERROR_EXIT_CODE = 3;
constexpr size_t SYNTAX_CHECK_MEMORY_MB = 256;
constexpr auto DRAIN_GRACE = std::chrono::milliseconds(500);
constexpr int MAX_FD_SCAN = 65536;

// Where child setup failed, reported over the status pipe
enum ChildStage : int {
    STAGE_NAMESPACE = 1,
    STAGE_ID_MAP,
    STAGE_MOUNT,
    STAGE_CHDIR,
    STAGE_STDIO,
    STAGE_FORK,
    STAGE_RLIMIT,
    STAGE_SECCOMP,
    STAGE_EXEC
};

struct ChildError {
    int stage;
    int error;
};

const char* stage_name(int stage) {
    switch (stage) {
        case STAGE_NAMESPACE: return "unshare";
        case STAGE_ID_MAP: return "id map";
        case STAGE_MOUNT: return "mount";
        case STAGE_CHDIR: return "chdir";
        case STAGE_STDIO: return "stdio";
        case STAGE_FORK: return "fork";
        case STAGE_RLIMIT: return "setrlimit";
        case STAGE_SECCOMP: return "seccomp";
        case STAGE_EXEC: return "exec";
        default: return "setup";
    }
}

// Owns a pipe; both ends close-on-exec
class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) == -1) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_fd() const { return fds_[0]; }
    int write_fd() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) { close(fds_[0]); fds_[0] = -1; }
    }
    void close_write() {
        if (fds_[1] >= 0) { close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2] = {-1, -1};
};

// Per-run scratch directory, removed on every exit path
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& root) {
        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec) {
            throw std::system_error(ec, "create scratch root " + root);
        }
        std::string tmpl = root + "/run_XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            throw std::system_error(errno, std::generic_category(), "mkdtemp in " + root);
        }
        path_ = buf.data();
    }

    ~ScratchDirectory() {
        std::error_code ec;
        // The program may have dropped write permission on its own directories
        for (auto it = fs::recursive_directory_iterator(path_, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code perm_ec;
            if (it->is_directory(perm_ec) && !it->is_symlink(perm_ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
            }
        }
        ec.clear();
        fs::remove_all(path_, ec);
        if (ec) {
            std::cerr << "[Sandbox] Failed to remove scratch " << path_ << ": " << ec.message() << std::endl;
        }
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to create " + path);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}

// Resolve a bare interpreter name against PATH
std::string resolve_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

unsigned long mount_flags_of(const std::string& path) {
    struct statvfs st;
    if (statvfs(path.c_str(), &st) != 0) {
        return 0;
    }
    unsigned long flags = 0;
    if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
    if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
    if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
    if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
    return flags;
}

// Everything the child needs, prepared before fork
struct ChildPlan {
    std::string scratch;
    std::string stdin_path;
    std::string interpreter_path;
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;

    bool isolate = false;
    std::string uid_map;
    std::string gid_map;
    std::vector<std::pair<std::string, unsigned long>> readonly_mounts;

    rlim_t memory_bytes = 0;
    rlim_t cpu_seconds = 0;                  // Soft limit; the hard limit is one second later
    rlim_t file_size_bytes = 0;
    rlim_t max_processes = 0;
    rlim_t max_open_files = 0;

    int stdout_fd = -1;
    int stderr_fd = -1;
    int status_fd = -1;
    int max_fd = 1024;
    scmp_filter_ctx seccomp = nullptr;

    void finalize() {
        argv.clear();
        for (auto& arg : argv_storage) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);
        envp.clear();
        for (auto& var : env_storage) envp.push_back(const_cast<char*>(var.c_str()));
        envp.push_back(nullptr);
    }
};

bool write_all_fd(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool write_proc_file(const char* path, const std::string& content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = write_all_fd(fd, content.data(), content.size());
    close(fd);
    return ok;
}

// Runs in the child only. Returns 0 or the failing stage.
// The user namespace is created even when the server runs as root so the
// program never holds capabilities over host resources. CLONE_NEWPID only
// applies to children forked after this call.
int setup_isolation(const ChildPlan& plan) {
    int flags = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;
    if (unshare(flags) != 0) {
        return STAGE_NAMESPACE;
    }

    if (!write_proc_file("/proc/self/setgroups", "deny") ||
        !write_proc_file("/proc/self/uid_map", plan.uid_map) ||
        !write_proc_file("/proc/self/gid_map", plan.gid_map)) {
        return STAGE_ID_MAP;
    }

    // Keep our mount changes out of the host namespace
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        return STAGE_MOUNT;
    }
    // Scratch gets its own writable mount before the rest turns read-only
    if (mount(plan.scratch.c_str(), plan.scratch.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) {
        return STAGE_MOUNT;
    }
    for (const auto& [path, extra] : plan.readonly_mounts) {
        int rc = mount(nullptr, path.c_str(), nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | extra, nullptr);
        // Only the root mount is mandatory; the others may not be mount points
        if (rc != 0 && path == "/") {
            return STAGE_MOUNT;
        }
    }
    return 0;
}

[[noreturn]] void child_fail(int status_fd, int stage) {
    ChildError err{stage, errno};
    write_all_fd(status_fd, reinterpret_cast<const char*>(&err), sizeof(err));
    _exit(127);
}

// Waits for the program and exits the same way, so the server's wait4 sees
// the program's status and the rusage of everything reaped here.
[[noreturn]] void relay_exit_status(pid_t program, int status_fd) {
    close(status_fd);
    close(STDIN_FILENO);
    close(STDOUT_FILENO);
    close(STDERR_FILENO);

    int status = 0;
    while (waitpid(program, &status, 0) < 0) {
        if (errno != EINTR) _exit(127);
    }
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        struct rlimit no_core;
        no_core.rlim_cur = no_core.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &no_core);
        signal(sig, SIG_DFL);
        sigset_t unblock;
        sigemptyset(&unblock);
        sigaddset(&unblock, sig);
        sigprocmask(SIG_UNBLOCK, &unblock, nullptr);
        kill(getpid(), sig);
        _exit(128 + sig);
    }
    _exit(WIFEXITED(status) ? WEXITSTATUS(status) : 127);
}

[[noreturn]] void exec_child(const ChildPlan& plan) {
    setpgid(0, 0);
    prctl(PR_SET_PDEATHSIG, SIGKILL);

    if (plan.isolate) {
        int stage = setup_isolation(plan);
        if (stage != 0) {
            child_fail(plan.status_fd, stage);
        }
    }

    if (chdir(plan.scratch.c_str()) != 0) {
        child_fail(plan.status_fd, STAGE_CHDIR);
    }

    int stdin_fd = open(plan.stdin_path.c_str(), O_RDONLY);
    if (stdin_fd < 0 ||
        dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(plan.stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(plan.stderr_fd, STDERR_FILENO) < 0) {
        child_fail(plan.status_fd, STAGE_STDIO);
    }

    // Nothing inherited from other server threads reaches the program
    for (int fd = 3; fd < plan.max_fd; ++fd) {
        if (fd != plan.status_fd) {
            close(fd);
        }
    }

    // The program runs as init of the new PID namespace: when it exits the
    // kernel kills everything it left behind in there
    if (plan.isolate) {
        pid_t program = fork();
        if (program < 0) {
            child_fail(plan.status_fd, STAGE_FORK);
        }
        if (program > 0) {
            relay_exit_status(program, plan.status_fd);
        }
        prctl(PR_SET_PDEATHSIG, SIGKILL);
    }

    struct rlimit limit;
    limit.rlim_cur = limit.rlim_max = plan.memory_bytes;
    if (setrlimit(RLIMIT_AS, &limit) != 0) child_fail(plan.status_fd, STAGE_RLIMIT);
    // SIGXCPU at the soft limit, SIGKILL at the hard one
    limit.rlim_cur = plan.cpu_seconds;
    limit.rlim_max = plan.cpu_seconds + 1;
    if (setrlimit(RLIMIT_CPU, &limit) != 0) child_fail(plan.status_fd, STAGE_RLIMIT);
    limit.rlim_cur = limit.rlim_max = plan.file_size_bytes;
    if (setrlimit(RLIMIT_FSIZE, &limit) != 0) child_fail(plan.status_fd, STAGE_RLIMIT);
    limit.rlim_cur = limit.rlim_max = plan.max_open_files;
    if (setrlimit(RLIMIT_NOFILE, &limit) != 0) child_fail(plan.status_fd, STAGE_RLIMIT);
    limit.rlim_cur = limit.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &limit) != 0) child_fail(plan.status_fd, STAGE_RLIMIT);
    limit.rlim_cur = limit.rlim_max = plan.max_processes;
    if (setrlimit(RLIMIT_NPROC, &limit) != 0) child_fail(plan.status_fd, STAGE_RLIMIT);

    if (plan.seccomp != nullptr && seccomp_load(plan.seccomp) != 0) {
        child_fail(plan.status_fd, STAGE_SECCOMP);
    }

    execve(plan.interpreter_path.c_str(), plan.argv.data(), plan.envp.data());
    child_fail(plan.status_fd, STAGE_EXEC);
}

void kill_group(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno == ESRCH) {
        kill(pid, SIGKILL);
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Reads what is available; returns false at EOF or error
bool drain_fd(int fd, std::string& out, size_t cap, bool& truncated) {
    char buffer[PIPE_BUFFER_SIZE];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = cap > out.size() ? cap - out.size() : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            out.append(buffer, take);
            if (take < static_cast<size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

std::string last_line(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return "";
    size_t start = text.rfind('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

bool is_memory_error(const std::string& stderr_output) {
    return last_line(stderr_output).find("MemoryError") != std::string::npos;
}

std::chrono::microseconds cpu_time_of(const struct rusage& usage) {
    return std::chrono::seconds(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
           std::chrono::microseconds(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec);
}

bool add_kill_rule(scmp_filter_ctx ctx, int syscall, uint32_t target) {
    // pid_t is 32 bits; the upper half of the register is not defined
    struct scmp_arg_cmp cmp;
    cmp.arg = 0;
    cmp.op = SCMP_CMP_MASKED_EQ;
    cmp.datum_a = 0xFFFFFFFFu;
    cmp.datum_b = target;
    return seccomp_rule_add_array(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 1, &cmp) == 0;
}

} // namespace

class Sandbox::Impl {
public:
    SandboxConfig config_;
    std::string interpreter_path_;
    bool isolation_available_ = false;
    scmp_filter_ctx seccomp_ = nullptr;
    int max_fd_ = 1024;

    explicit Impl(const SandboxConfig& config) : config_(config) {
        interpreter_path_ = resolve_executable(config_.interpreter);
        if (interpreter_path_.empty()) {
            std::cerr << "[Sandbox] Interpreter not found on PATH: " << config_.interpreter << std::endl;
        }

        struct rlimit nofile;
        if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY) {
            max_fd_ = static_cast<int>(std::min<rlim_t>(nofile.rlim_cur, MAX_FD_SCAN));
        } else {
            max_fd_ = MAX_FD_SCAN;
        }

        if (config_.enable_seccomp) {
            seccomp_ = build_seccomp_filter();
        }
        if (config_.enable_namespaces) {
            isolation_available_ = try_isolation();
            if (!isolation_available_) {
                std::cerr << "[Sandbox] Namespace isolation unavailable"
                          << (config_.require_isolation ? "; runs will be refused" :
                                                          "; relying on rlimits and seccomp")
                          << std::endl;
            }
        }
    }

    ~Impl() {
        if (seccomp_ != nullptr) {
            seccomp_release(seccomp_);
        }
    }

    RunOutcome run(const std::string& code,
                   const std::string& stdin_data,
                   std::chrono::seconds timeout,
                   size_t memory_limit_mb,
                   const CancellationToken* cancel) {
        RunOutcome outcome;
        auto start_time = std::chrono::steady_clock::now();

        if (cancel != nullptr && cancel->is_cancelled()) {
            outcome.status = RunStatus::CANCELLED;
            outcome.reason = cancel->reason();
            return outcome;
        }
        if (config_.enable_namespaces && config_.require_isolation && !isolation_available_) {
            outcome.reason = "namespace isolation required but unavailable";
            return outcome;
        }
        if (interpreter_path_.empty()) {
            outcome.reason = "interpreter not found: " + config_.interpreter;
            return outcome;
        }

        std::unique_ptr<ScratchDirectory> scratch;
        std::unique_ptr<Pipe> stdout_pipe, stderr_pipe, status_pipe;
        ChildPlan plan;
        try {
            scratch = std::make_unique<ScratchDirectory>(config_.scratch_root);
            write_file(scratch->path() + "/main.py", code);
            write_file(scratch->path() + "/stdin.txt", stdin_data);
            stdout_pipe = std::make_unique<Pipe>();
            stderr_pipe = std::make_unique<Pipe>();
            status_pipe = std::make_unique<Pipe>();
        } catch (const std::exception& e) {
            outcome.reason = e.what();
            return outcome;
        }

        prepare_plan(plan, scratch->path(), timeout, memory_limit_mb);
        plan.stdout_fd = stdout_pipe->write_fd();
        plan.stderr_fd = stderr_pipe->write_fd();
        plan.status_fd = status_pipe->write_fd();

        pid_t pid = fork();
        if (pid < 0) {
            outcome.reason = std::string("fork failed: ") + std::strerror(errno);
            return outcome;
        }
        if (pid == 0) {
            exec_child(plan);
        }

        // Both sides set the group so killpg never races the child
        setpgid(pid, pid);
        stdout_pipe->close_write();
        stderr_pipe->close_write();
        status_pipe->close_write();

        ChildError child_error{0, 0};
        ssize_t status_bytes;
        do {
            status_bytes = read(status_pipe->read_fd(), &child_error, sizeof(child_error));
        } while (status_bytes < 0 && errno == EINTR);

        if (status_bytes == static_cast<ssize_t>(sizeof(child_error))) {
            int wstatus;
            kill_group(pid);
            waitpid(pid, &wstatus, 0);
            outcome.reason = std::string(stage_name(child_error.stage)) + " failed: " +
                             std::strerror(child_error.error);
            outcome.duration = elapsed_since(start_time);
            std::cerr << "[Sandbox] Launch failed: " << outcome.reason << std::endl;
            return outcome;
        }

        supervise(pid, *stdout_pipe, *stderr_pipe, timeout, cancel, start_time, outcome);
        return outcome;
    }

    SyntaxCheck check_syntax(const std::string& code, const CancellationToken* cancel) {
        SyntaxCheck check;
        RunOutcome outcome = run(SYNTAX_CHECKER, code,
                                 std::chrono::seconds(SYNTAX_CHECK_TIMEOUT_SECONDS),
                                 SYNTAX_CHECK_MEMORY_MB, cancel);
        check.duration = outcome.duration;

        if (outcome.status == RunStatus::COMPLETED && outcome.exit_code == 0) {
            return check;
        }
        if (outcome.status == RunStatus::COMPLETED && outcome.exit_code == SYNTAX_ERROR_EXIT_CODE) {
            check.ok = false;
            std::istringstream lines(outcome.stdout_output);
            std::string line;
            while (std::getline(lines, line)) {
                if (!line.empty()) check.messages.push_back(line);
            }
            if (check.messages.empty()) {
                check.messages.push_back("Syntax error");
            }
            return check;
        }

        check.infrastructure_failure = true;
        std::string detail = outcome.reason.empty() ? last_line(outcome.stderr_output) : outcome.reason;
        check.messages.push_back("Syntax check failed (" + run_status_to_string(outcome.status) +
                                 (detail.empty() ? "" : ": " + detail) + ")");
        return check;
    }

    bool check_ready(std::string& reason) const {
        std::string resolved = resolve_executable(config_.interpreter);
        if (resolved.empty() || access(resolved.c_str(), X_OK) != 0) {
            reason = "interpreter not executable: " + config_.interpreter;
            return false;
        }
        try {
            ScratchDirectory scratch(config_.scratch_root);
            write_file(scratch.path() + "/ready", "ok");
        } catch (const std::exception& e) {
            reason = std::string("scratch root not writable: ") + e.what();
            return false;
        }
        if (config_.enable_namespaces && config_.require_isolation && !isolation_available_) {
            reason = "namespace isolation required but unavailable";
            return false;
        }
        reason.clear();
        return true;
    }

private:
    static std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    }

    void prepare_plan(ChildPlan& plan, const std::string& scratch,
                      std::chrono::seconds timeout, size_t memory_limit_mb) const {
        plan.scratch = scratch;
        plan.stdin_path = scratch + "/stdin.txt";
        plan.interpreter_path = interpreter_path_;

        plan.argv_storage.push_back(config_.interpreter);
        for (const auto& arg : config_.interpreter_args) {
            plan.argv_storage.push_back(arg);
        }
        plan.argv_storage.push_back("main.py");

        // Fixed environment: nothing from the server leaks into a run
        plan.env_storage = {
            "PATH=/usr/local/bin:/usr/bin:/bin",
            "HOME=" + scratch,
            "TMPDIR=" + scratch,
            "LANG=C.UTF-8",
            "PYTHONHASHSEED=0",
            "PYTHONDONTWRITEBYTECODE=1",
            "PYTHONUNBUFFERED=1",
            "PYTHONIOENCODING=utf-8"
        };
        plan.finalize();

        plan.isolate = config_.enable_namespaces && isolation_available_;
        prepare_isolation(plan);

        plan.memory_bytes = static_cast<rlim_t>(memory_limit_mb) * 1024 * 1024;
        plan.cpu_seconds = static_cast<rlim_t>(timeout.count()) + 1;
        plan.file_size_bytes = config_.max_file_size_bytes;
        plan.max_processes = static_cast<rlim_t>(config_.max_processes);
        plan.max_open_files = static_cast<rlim_t>(config_.max_open_files);
        plan.max_fd = max_fd_;
        plan.seccomp = seccomp_;
    }

    static void prepare_isolation(ChildPlan& plan) {
        plan.uid_map = std::to_string(geteuid()) + " " + std::to_string(geteuid()) + " 1";
        plan.gid_map = std::to_string(getegid()) + " " + std::to_string(getegid()) + " 1";
        plan.readonly_mounts.clear();
        for (const char* path : {"/", "/tmp", "/var/tmp", "/dev/shm", "/run"}) {
            plan.readonly_mounts.emplace_back(path, mount_flags_of(path));
        }
    }

    bool try_isolation() const {
        std::unique_ptr<ScratchDirectory> scratch;
        try {
            scratch = std::make_unique<ScratchDirectory>(config_.scratch_root);
        } catch (const std::exception& e) {
            std::cerr << "[Sandbox] Isolation check skipped: " << e.what() << std::endl;
            return false;
        }

        ChildPlan plan;
        plan.scratch = scratch->path();
        prepare_isolation(plan);

        pid_t pid = fork();
        if (pid < 0) {
            return false;
        }
        if (pid == 0) {
            _exit(setup_isolation(plan) == 0 ? 0 : 1);
        }
        int status = 0;
        if (waitpid(pid, &status, 0) != pid) {
            return false;
        }
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }

    static scmp_filter_ctx build_seccomp_filter() {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) {
            std::cerr << "[Sandbox] seccomp_init failed; syscall filter disabled" << std::endl;
            return nullptr;
        }

        // Network, escaping the process group, and host-level operations
        const std::vector<int> denied = {
            SCMP_SYS(socket), SCMP_SYS(connect), SCMP_SYS(bind),
            SCMP_SYS(listen), SCMP_SYS(accept), SCMP_SYS(accept4),
            SCMP_SYS(setsid), SCMP_SYS(setpgid),
            SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
            SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
            SCMP_SYS(unshare), SCMP_SYS(setns),
            SCMP_SYS(kexec_load), SCMP_SYS(reboot), SCMP_SYS(swapon), SCMP_SYS(swapoff),
            SCMP_SYS(init_module), SCMP_SYS(finit_module), SCMP_SYS(delete_module),
            SCMP_SYS(bpf), SCMP_SYS(perf_event_open),
            SCMP_SYS(keyctl), SCMP_SYS(add_key), SCMP_SYS(request_key)
        };

        int skipped = 0;
        for (int syscall : denied) {
            if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0) != 0) {
                ++skipped;
            }
        }

        // Signals may only reach the program's own processes: kill(0) would
        // hit the process that relays its exit status, kill(-1) everything the
        // uid owns, and without namespaces the server's pid is visible
        const pid_t server = getpid();
        const pid_t server_group = getpgrp();
        for (uint32_t target : {0u, static_cast<uint32_t>(-1),
                                static_cast<uint32_t>(server),
                                static_cast<uint32_t>(-server_group)}) {
            if (!add_kill_rule(ctx, SCMP_SYS(kill), target)) ++skipped;
        }
        if (!add_kill_rule(ctx, SCMP_SYS(tgkill), static_cast<uint32_t>(server))) ++skipped;
        if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(tkill), 0) != 0) ++skipped;
        if (skipped > 0) {
            std::cerr << "[Sandbox] " << skipped << " seccomp rules not supported on this architecture" << std::endl;
        }
        return ctx;
    }

    void supervise(pid_t pid, Pipe& stdout_pipe, Pipe& stderr_pipe,
                   std::chrono::seconds timeout,
                   const CancellationToken* cancel,
                   std::chrono::steady_clock::time_point start_time,
                   RunOutcome& outcome) {
        set_nonblocking(stdout_pipe.read_fd());
        set_nonblocking(stderr_pipe.read_fd());

        const auto deadline = start_time + timeout;
        bool stdout_open = true;
        bool stderr_open = true;
        bool exited = false;
        bool killed_by_us = false;
        int wait_status = 0;
        struct rusage usage;
        std::memset(&usage, 0, sizeof(usage));
        std::chrono::steady_clock::time_point exit_time;

        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (!exited && !killed_by_us) {
                if (cancel != nullptr && cancel->is_cancelled()) {
                    kill_group(pid);
                    killed_by_us = true;
                    outcome.status = RunStatus::CANCELLED;
                    outcome.reason = cancel->reason();
                } else if (now >= deadline) {
                    kill_group(pid);
                    killed_by_us = true;
                    outcome.status = RunStatus::TIMED_OUT;
                }
            }

            struct pollfd fds[2];
            nfds_t nfds = 0;
            if (stdout_open) fds[nfds++] = {stdout_pipe.read_fd(), POLLIN, 0};
            if (stderr_open) fds[nfds++] = {stderr_pipe.read_fd(), POLLIN, 0};
            if (poll(nfds > 0 ? fds : nullptr, nfds, POLL_INTERVAL_MS) < 0 && errno != EINTR) {
                std::cerr << "[Sandbox] poll failed: " << std::strerror(errno) << std::endl;
            }

            if (stdout_open) {
                stdout_open = drain_fd(stdout_pipe.read_fd(), outcome.stdout_output,
                                       config_.max_output_bytes, outcome.output_truncated);
            }
            if (stderr_open) {
                stderr_open = drain_fd(stderr_pipe.read_fd(), outcome.stderr_output,
                                       config_.max_output_bytes, outcome.output_truncated);
            }

            if (!exited) {
                pid_t r = wait4(pid, &wait_status, WNOHANG, &usage);
                if (r == pid) {
                    exited = true;
                    exit_time = std::chrono::steady_clock::now();
                    // Leader is gone; take any forked children with it
                    kill(-pid, SIGKILL);
                } else if (r < 0 && errno != EINTR) {
                    std::cerr << "[Sandbox] wait4 failed: " << std::strerror(errno) << std::endl;
                    kill_group(pid);
                    exited = true;
                    exit_time = std::chrono::steady_clock::now();
                }
            }

            if (exited && !stdout_open && !stderr_open) break;
            if (exited && std::chrono::steady_clock::now() - exit_time > DRAIN_GRACE) break;
        }

        outcome.duration = elapsed_since(start_time);
        outcome.peak_memory_kb = static_cast<size_t>(usage.ru_maxrss);
        if (outcome.output_truncated) {
            outcome.stdout_output += "\n[output truncated]";
        }

        if (killed_by_us) {
            outcome.exit_code = -SIGKILL;
            return;
        }

        if (WIFSIGNALED(wait_status)) {
            int sig = WTERMSIG(wait_status);
            outcome.exit_code = 128 + sig;
            outcome.status = classify_signal(sig, cpu_time_of(usage),
                                             timeout + std::chrono::seconds(1));
            if (outcome.status == RunStatus::COMPLETED) {
                if (!outcome.stderr_output.empty() && outcome.stderr_output.back() != '\n') {
                    outcome.stderr_output += "\n";
                }
                outcome.stderr_output += "Process terminated by signal " + std::to_string(sig) +
                                         " (" + strsignal(sig) + ")";
            }
            return;
        }

        outcome.exit_code = WIFEXITED(wait_status) ? WEXITSTATUS(wait_status) : -1;
        if (outcome.exit_code != 0 && is_memory_error(outcome.stderr_output)) {
            outcome.status = RunStatus::MEMORY_EXCEEDED;
        } else {
            outcome.status = RunStatus::COMPLETED;
        }
    }
};

Sandbox::Sandbox(const SandboxConfig& config) : pImpl(std::make_unique<Impl>(config)) {}

Sandbox::~Sandbox() = default;

RunOutcome Sandbox::run(const std::string& code,
                        const std::string& stdin_data,
                        std::chrono::seconds timeout,
                        size_t memory_limit_mb,
                        const CancellationToken* cancel) {
    return pImpl->run(code, stdin_data, timeout, memory_limit_mb, cancel);
}

SyntaxCheck Sandbox::check_syntax(const std::string& code, const CancellationToken* cancel) {
    return pImpl->check_syntax(code, cancel);
}

bool Sandbox::check_ready(std::string& reason) const {
    return pImpl->check_ready(reason);
}

bool Sandbox::isolation_available() const {
    return pImpl->isolation_available_;
}

const SandboxConfig& Sandbox::config() const {
    return pImpl->config_;
}

RunStatus classify_signal(int sig, std::chrono::microseconds cpu_time, std::chrono::seconds cpu_limit) {
    if (sig == SIGXCPU) {
        return RunStatus::TIMED_OUT;
    }
    if (sig == SIGKILL) {
        // Init of a PID namespace ignores SIGXCPU, so the CPU backstop
        // arrives as SIGKILL at the hard limit
        if (cpu_time >= cpu_limit) {
            return RunStatus::TIMED_OUT;
        }
        // Otherwise the kernel OOM killer or an external memory limit
        return RunStatus::MEMORY_EXCEEDED;
    }
    return RunStatus::COMPLETED;
}

std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::TIMED_OUT: return "timed_out";
        case RunStatus::MEMORY_EXCEEDED: return "memory_exceeded";
        case RunStatus::LAUNCH_FAILED: return "launch_failed";
        case RunStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace gradebox
