#include "toolmux/transport/process_transport.hpp"
#include "toolmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <thread>
#include <vector>

extern char** environ;

namespace toolmux {

namespace {

constexpr std::chrono::milliseconds kExitPollInterval{10};
constexpr std::chrono::milliseconds kStdinCloseGrace{100};
constexpr std::size_t kMaxCapturedStderr = 64 * 1024;

// A dead child's stdin must produce EPIPE, not kill the host process.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void set_cloexec(int fd) {
    const int flags = fcntl(fd, F_GETFD);
    if (flags != -1) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

struct PipePair {
    int read_end{-1};
    int write_end{-1};

    bool open() {
        int fds[2];
        if (pipe(fds) == -1) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        set_cloexec(read_end);
        set_cloexec(write_end);
        return true;
    }

    void close_both() {
        if (read_end != -1) { ::close(read_end); read_end = -1; }
        if (write_end != -1) { ::close(write_end); write_end = -1; }
    }
};

// Everything the child needs is materialized before fork(); after fork only
// async-signal-safe calls are made.
struct ExecImage {
    std::vector<std::string> arg_storage;
    std::vector<char*> argv;
    std::vector<std::string> env_storage;
    std::vector<char*> envp;

    ExecImage(const SpawnTarget& target, const std::map<std::string, std::string>& overrides) {
        arg_storage.reserve(target.args.size() + 1);
        arg_storage.push_back(target.command);
        arg_storage.insert(arg_storage.end(), target.args.begin(), target.args.end());
        for (auto& arg : arg_storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        std::map<std::string, std::string> merged;
        for (char** entry = environ; (entry != nullptr) && (*entry != nullptr); ++entry) {
            std::string_view kv(*entry);
            const auto eq = kv.find('=');
            if (eq == std::string_view::npos) {
                continue;
            }
            merged[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
        }
        for (const auto& [name, value] : target.env) {
            merged[name] = value;
        }
        for (const auto& [name, value] : overrides) {
            merged[name] = value;
        }

        env_storage.reserve(merged.size());
        for (const auto& [name, value] : merged) {
            env_storage.push_back(name + "=" + value);
        }
        for (auto& kv : env_storage) {
            envp.push_back(kv.data());
        }
        envp.push_back(nullptr);
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ProcessTransport::ProcessTransport(
    asio::any_io_executor executor,
    SpawnTarget target,
    TransportOptions options
)
    : target_(std::move(target))
    , options_(std::move(options))
    , executor_(std::move(executor))
{}

ProcessTransport::~ProcessTransport() {
    if (io_) {
        io_->close();
    }
    close_pipes();
    if (child_pid_ > 0) {
        kill(child_pid_, SIGTERM);
        const auto deadline = std::chrono::steady_clock::now() + kStdinCloseGrace;
        while (!reap(false) && (std::chrono::steady_clock::now() < deadline)) {
            std::this_thread::sleep_for(kExitPollInterval);
        }
        kill_now();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor ProcessTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> ProcessTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(TransportError::protocol("Transport already running"));
    }
    if (target_.command.empty()) {
        co_return tl::unexpected(TransportError::network("Empty spawn command"));
    }

    ignore_sigpipe_once();

    auto spawned = spawn();
    if (!spawned.has_value()) {
        get_logger().warn_fmt("{}: spawn failed: {}", describe(), spawned.error().message);
        co_return spawned;
    }

    io_ = std::make_shared<Io>(executor_, stdout_pipe_, stdin_pipe_, StreamIoConfig{
        options_.framing,
        options_.max_message_size,
        64,
        64,
        describe()
    });
    io_->start();

    if (stderr_pipe_) {
        asio::co_spawn(executor_, stderr_loop(stderr_pipe_), asio::detached);
    }

    running_ = true;
    get_logger().info_fmt("{}: started (pid {})", describe(), child_pid_);
    co_return TransportResult<void>{};
}

asio::awaitable<void> ProcessTransport::async_stop() {
    if (!running_.exchange(false)) {
        co_return;
    }

    if (io_) {
        io_->close();
    }

    // Servers following the stdio convention exit once stdin closes.
    if (stdin_pipe_ && stdin_pipe_->is_open()) {
        asio::error_code ignored;
        stdin_pipe_->close(ignored);
    }

    bool exited = co_await wait_for_exit(kStdinCloseGrace);
    if (!exited && (child_pid_ > 0)) {
        kill(child_pid_, SIGTERM);
        exited = co_await wait_for_exit(options_.shutdown_grace);
    }
    if (!exited) {
        get_logger().warn_fmt("{}: did not exit after SIGTERM, sending SIGKILL", describe());
        kill_now();
    }

    close_pipes();
    get_logger().info_fmt("{}: stopped (exit code {})", describe(), exit_code_.value_or(-1));
}

asio::awaitable<TransportResult<void>> ProcessTransport::async_send(Json message) {
    if (!running_ || (io_ == nullptr)) {
        co_return tl::unexpected(TransportError::closed("Transport not running"));
    }
    co_return co_await io_->send(message);
}

asio::awaitable<TransportResult<Json>> ProcessTransport::async_receive() {
    if (io_ == nullptr) {
        co_return tl::unexpected(TransportError::closed("Transport not started"));
    }
    co_return co_await io_->receive();
}

bool ProcessTransport::is_running() const {
    return running_;
}

std::string ProcessTransport::describe() const {
    return "spawn:" + target_.command;
}

std::string ProcessTransport::captured_stderr() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_buffer_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internals
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> ProcessTransport::spawn() {
    ExecImage image(target_, options_.env_overrides);

    PipePair in_pipe;
    PipePair out_pipe;
    PipePair err_pipe;
    PipePair exec_status;  // CLOEXEC: stays silent when exec succeeds

    auto fail = [&](const std::string& what) {
        const std::string reason = what + ": " + std::strerror(errno);
        in_pipe.close_both();
        out_pipe.close_both();
        err_pipe.close_both();
        exec_status.close_both();
        return tl::unexpected(TransportError::network(reason));
    };

    if (!in_pipe.open() || !out_pipe.open() || !exec_status.open()) {
        return fail("Failed to create pipes");
    }
    const bool capture = (options_.stderr_handling == StderrHandling::Capture);
    if (capture && !err_pipe.open()) {
        return fail("Failed to create stderr pipe");
    }

    const pid_t pid = fork();
    if (pid == -1) {
        return fail("Failed to fork");
    }

    if (pid == 0) {
        dup2(in_pipe.read_end, STDIN_FILENO);
        dup2(out_pipe.write_end, STDOUT_FILENO);

        switch (options_.stderr_handling) {
            case StderrHandling::Discard: {
                const int devnull = open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    dup2(devnull, STDERR_FILENO);
                    ::close(devnull);
                }
                break;
            }
            case StderrHandling::Passthrough:
                break;
            case StderrHandling::Capture:
                dup2(err_pipe.write_end, STDERR_FILENO);
                break;
        }

        environ = image.envp.data();
        execvp(image.argv[0], image.argv.data());

        const int exec_errno = errno;
        (void)!write(exec_status.write_end, &exec_errno, sizeof(exec_errno));
        _exit(127);
    }

    ::close(in_pipe.read_end);
    ::close(out_pipe.write_end);
    ::close(exec_status.write_end);
    if (capture) {
        ::close(err_pipe.write_end);
    }

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
    } while ((n == -1) && (errno == EINTR));
    ::close(exec_status.read_end);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        ::close(in_pipe.write_end);
        ::close(out_pipe.read_end);
        if (capture) {
            ::close(err_pipe.read_end);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        return tl::unexpected(TransportError::network(
            "Failed to execute '" + target_.command + "': " + std::strerror(exec_errno)));
    }

    child_pid_ = pid;
    exit_code_.reset();
    stdin_pipe_ = std::make_shared<Pipe>(executor_, in_pipe.write_end);
    stdout_pipe_ = std::make_shared<Pipe>(executor_, out_pipe.read_end);
    if (capture) {
        stderr_pipe_ = std::make_shared<Pipe>(executor_, err_pipe.read_end);
    }
    return {};
}

asio::awaitable<void> ProcessTransport::stderr_loop(std::shared_ptr<Pipe> pipe) {
    std::array<char, 4096> chunk{};
    for (;;) {
        std::size_t n = 0;
        try {
            n = co_await pipe->async_read_some(asio::buffer(chunk), asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (e.code() != asio::error::eof && e.code() != asio::error::operation_aborted) {
                get_logger().debug_fmt("{}: stderr read ended: {}", describe(), e.what());
            }
            co_return;
        }

        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_buffer_.append(chunk.data(), n);
        if (stderr_buffer_.size() > kMaxCapturedStderr) {
            stderr_buffer_.erase(0, stderr_buffer_.size() - kMaxCapturedStderr);
        }
    }
}

asio::awaitable<bool> ProcessTransport::wait_for_exit(std::chrono::milliseconds limit) {
    asio::steady_timer timer(executor_);
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return false;
        }
        timer.expires_after(kExitPollInterval);
        asio::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    co_return true;
}

bool ProcessTransport::reap(bool block) {
    if (child_pid_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t result = 0;
    do {
        result = waitpid(child_pid_, &status, block ? 0 : WNOHANG);
    } while ((result == -1) && (errno == EINTR));

    if (result == 0) {
        return false;
    }
    if (result == child_pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);
        }
    }
    child_pid_ = -1;
    return true;
}

void ProcessTransport::close_pipes() {
    for (auto* pipe : {&stdin_pipe_, &stdout_pipe_, &stderr_pipe_}) {
        if (*pipe && (*pipe)->is_open()) {
            asio::error_code ignored;
            (*pipe)->close(ignored);
        }
    }
}

void ProcessTransport::kill_now() {
    if (child_pid_ <= 0) {
        return;
    }
    kill(child_pid_, SIGKILL);
    (void)reap(true);
}

}  // namespace toolmux
