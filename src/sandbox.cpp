#include "sandbox.h"
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <seccomp.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace calcrun {

long cpu_limit_seconds(double timeout_seconds) {
    return std::max(1L, static_cast<long>(timeout_seconds));
}

std::string build_script(const std::string& code, double timeout_seconds,
                         size_t memory_limit_bytes) {
    long cpu = cpu_limit_seconds(timeout_seconds);
    std::string memory = std::to_string(memory_limit_bytes);
    return "try:\n"
           "    import resource\n"
           "    resource.setrlimit(resource.RLIMIT_CPU, (" + std::to_string(cpu) + ", " +
           std::to_string(cpu + 1) + "))\n"
           "    resource.setrlimit(resource.RLIMIT_AS, (" + memory + ", " + memory + "))\n"
           "except Exception:\n"
           "    pass\n\n" + code;
}

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Both ends of a pipe, closed on scope exit
struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    int& read_end() { return fds[0]; }
    int& write_end() { return fds[1]; }

    ~Pipe() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }
};

} // namespace

class ProcessRunner::Impl {
public:
    SandboxConfig config_;

    explicit Impl(const SandboxConfig& config) : config_(config) {}

    RunOutcome run(const std::string& code, double timeout_seconds) {
        RunOutcome outcome;
        auto start_time = std::chrono::steady_clock::now();

        if (config_.interpreter_path.empty()) {
            outcome.spawn_error = "Python interpreter not found";
            return outcome;
        }

        std::string script = build_script(code, timeout_seconds, config_.memory_limit_bytes);

        // Everything the child needs is prepared before fork
        std::vector<std::string> args = {config_.interpreter_path, "-I", "-S", "-c", script};
        std::vector<std::string> env = {
            "PYTHONUNBUFFERED=1",
            "PYTHONIOENCODING=utf-8",
            "PYTHONNOUSERSITE=1"
        };
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);
        std::vector<char*> envp;
        for (auto& var : env) envp.push_back(const_cast<char*>(var.c_str()));
        envp.push_back(nullptr);

        Pipe stdout_pipe, stderr_pipe;
        if (!stdout_pipe.open() || !stderr_pipe.open()) {
            outcome.spawn_error = std::string("Failed to create pipes: ") + std::strerror(errno);
            return outcome;
        }

        pid_t pid = fork();
        if (pid == -1) {
            outcome.spawn_error = std::string("Failed to fork process: ") + std::strerror(errno);
            return outcome;
        }

        if (pid == 0) {
            execute_in_child(argv.data(), envp.data(), stdout_pipe.write_end(),
                             stderr_pipe.write_end(), timeout_seconds);
        }

        // Parent process
        close_fd(stdout_pipe.write_end());
        close_fd(stderr_pipe.write_end());

        auto deadline = start_time + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(timeout_seconds));

        int status = 0;
        bool reaped = supervise(pid, stdout_pipe.read_end(), stderr_pipe.read_end(),
                                deadline, status, outcome);

        if (outcome.timed_out) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            wait_for(pid, status);
        } else if (reaped) {
            if (WIFEXITED(status)) {
                outcome.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                outcome.exit_code = -WTERMSIG(status);
            }
        } else {
            outcome.spawn_error = std::string("Failed to wait for child process: ") +
                                  std::strerror(errno);
            kill(pid, SIGKILL);
            wait_for(pid, status);
        }

        // Grandchildren left in the group do not outlive the request
        kill(-pid, SIGKILL);

        // Whatever is still buffered in the pipes
        drain_available(stdout_pipe.read_end(), outcome.stdout_bytes);
        drain_available(stderr_pipe.read_end(), outcome.stderr_bytes);

        outcome.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return outcome;
    }

private:
    [[noreturn]] void execute_in_child(char* const* argv, char* const* envp,
                                       int stdout_fd, int stderr_fd, double timeout_seconds) {
        // Own process group so a timeout can kill everything the snippet starts
        setsid();

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        dup2(stdout_fd, STDOUT_FILENO);
        dup2(stderr_fd, STDERR_FILENO);
        close_inherited_descriptors();

        apply_resource_limits(timeout_seconds);
        if (config_.seccomp_enabled) {
            setup_seccomp_filter();
        }

        execve(argv[0], argv, envp);
        const char message[] = "failed to start Python interpreter\n";
        ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)ignored;
        _exit(127);
    }

    // Nothing the host process holds open is reachable from the snippet
    void close_inherited_descriptors() {
        if (close_range(3, ~0U, 0) == 0) {
            return;
        }
        long max_fd = sysconf(_SC_OPEN_MAX);
        if (max_fd < 256) max_fd = 256;
        for (int fd = 3; fd < max_fd; ++fd) {
            close(fd);
        }
    }

    void apply_resource_limits(double timeout_seconds) {
        struct rlimit limit;

        // Same ceilings as the preamble, so its own setrlimit calls still succeed
        long cpu = cpu_limit_seconds(timeout_seconds);
        limit.rlim_cur = static_cast<rlim_t>(cpu);
        limit.rlim_max = static_cast<rlim_t>(cpu + 1);
        setrlimit(RLIMIT_CPU, &limit);

        limit.rlim_cur = limit.rlim_max = config_.memory_limit_bytes;
        setrlimit(RLIMIT_AS, &limit);

        // No core dumps
        limit.rlim_cur = limit.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &limit);
    }

    // Denylist on top of a default-allow policy; numeric snippets never
    // need any of these
    void setup_seccomp_filter() {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) {
            return;
        }

        std::vector<int> denied_syscalls = {
            SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
            SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
            SCMP_SYS(unshare), SCMP_SYS(setns),
            SCMP_SYS(init_module), SCMP_SYS(finit_module), SCMP_SYS(delete_module),
            SCMP_SYS(reboot), SCMP_SYS(kexec_load), SCMP_SYS(bpf),
            SCMP_SYS(add_key), SCMP_SYS(request_key), SCMP_SYS(keyctl),
            SCMP_SYS(swapon), SCMP_SYS(swapoff)
        };

        for (int syscall : denied_syscalls) {
            seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0);
        }

        seccomp_load(ctx);
        seccomp_release(ctx);
    }

    void append_capped(std::string& target, const char* data, size_t len) {
        if (target.size() >= config_.max_capture_bytes) return;
        size_t room = config_.max_capture_bytes - target.size();
        target.append(data, std::min(len, room));
    }

    // Read both pipes and poll for exit until the child is reaped or the
    // deadline passes. Returns true once the child has been reaped.
    bool supervise(pid_t pid, int stdout_fd, int stderr_fd,
                   std::chrono::steady_clock::time_point deadline, int& status,
                   RunOutcome& outcome) {
        struct pollfd fds[2];
        fds[0] = {stdout_fd, POLLIN, 0};
        fds[1] = {stderr_fd, POLLIN, 0};
        std::string* targets[2] = {&outcome.stdout_bytes, &outcome.stderr_bytes};
        int open_count = 2;
        char buffer[PIPE_BUFFER_SIZE];

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                outcome.timed_out = true;
                return false;
            }

            int wait_ms = static_cast<int>(std::min<long long>(remaining.count(), POLL_INTERVAL_MS));
            int ready = poll(fds, 2, wait_ms);
            if (ready < 0 && errno != EINTR) {
                return false;
            }

            for (int i = 0; ready > 0 && i < 2; ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) continue;
                ssize_t bytes_read = read(fds[i].fd, buffer, sizeof(buffer));
                if (bytes_read > 0) {
                    append_capped(*targets[i], buffer, static_cast<size_t>(bytes_read));
                } else if (bytes_read == 0 || errno != EINTR) {
                    // poll ignores negative descriptors
                    fds[i].fd = -1;
                    --open_count;
                }
            }

            pid_t result = waitpid(pid, &status, WNOHANG);
            if (result == pid) return true;
            if (result == -1 && errno != EINTR) return false;
        }
    }

    // Non-blocking read of whatever is left in a pipe
    void drain_available(int fd, std::string& target) {
        if (fd < 0) return;
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        char buffer[PIPE_BUFFER_SIZE];
        ssize_t bytes_read;
        while ((bytes_read = read(fd, buffer, sizeof(buffer))) > 0) {
            append_capped(target, buffer, static_cast<size_t>(bytes_read));
        }
    }

    bool wait_for(pid_t pid, int& status) {
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) return false;
        }
        return true;
    }
};

ProcessRunner::ProcessRunner(const SandboxConfig& config) : impl(std::make_unique<Impl>(config)) {}

ProcessRunner::~ProcessRunner() = default;

RunOutcome ProcessRunner::run(const std::string& code, double timeout_seconds) {
    return impl->run(code, timeout_seconds);
}

} // namespace calcrun
