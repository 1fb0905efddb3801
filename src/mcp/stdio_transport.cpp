#include "mcp/stdio_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

extern char** environ;

namespace toolbridge::mcp {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxLineBytes = 64 * 1024 * 1024;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(::close(fds[i]));
            fds[i] = -1;
        }
    }
}

// Writes to a child that already exited must fail with EPIPE instead of killing the bridge
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

}  // namespace

StdioTransport::StdioTransport(protocol::StdioSpec spec) : spec_(std::move(spec)) {}

StdioTransport::~StdioTransport() {
    close();
    if (stdin_fd_ >= 0) {
        static_cast<void>(::close(stdin_fd_));
    }
    if (stdout_fd_ >= 0) {
        static_cast<void>(::close(stdout_fd_));
    }

    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ <= 0 || exited_) {
        return;
    }
    for (int i = 0; i < 20; ++i) {
        if (reap(false)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    static_cast<void>(kill(pid_, SIGKILL));
    static_cast<void>(reap(true));
}

core::errors::Result<bool> StdioTransport::open() {
    if (spec_.command.empty()) {
        return BridgeError{ErrorCategory::Input, "No command specified", "missing_command"};
    }
    ignore_sigpipe_once();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(exec_pipe);
        return BridgeError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    // Everything the child needs is built before fork()
    std::vector<std::string> arg_storage;
    arg_storage.push_back(spec_.command);
    arg_storage.insert(arg_storage.end(), spec_.args.begin(), spec_.args.end());
    std::vector<char*> argv;
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (const auto& [key, value] : spec_.env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(exec_pipe);
        return BridgeError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        int err = 0;
        if (!spec_.cwd.empty() && chdir(spec_.cwd.c_str()) != 0) {
            err = errno;
            static_cast<void>(write(exec_pipe[1], &err, sizeof(err)));
            _exit(126);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        if (!spec_.env.empty()) {
            environ = envp.data();
        }
        execvp(argv[0], argv.data());
        err = errno;
        static_cast<void>(write(exec_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    static_cast<void>(::close(stdin_pipe[0]));
    static_cast<void>(::close(stdout_pipe[1]));
    static_cast<void>(::close(exec_pipe[1]));

    // The exec pipe closes on a successful exec; a payload means chdir or exec failed
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(::close(exec_pipe[0]));

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        pid_ = pid;
    }
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    set_nonblocking(stdout_fd_);

    if (n > 0) {
        std::lock_guard<std::mutex> lock(process_mutex_);
        static_cast<void>(reap(true));
        stream_closed_.store(true);
        return BridgeError{ErrorCategory::Transport,
                           "Failed to start '" + spec_.command + "' in '" + spec_.cwd +
                               "': " + std::strerror(child_errno),
                           "spawn_failed"};
    }

    LOG_INFO("StdioTransport: started '" + spec_.command + "' (pid " + std::to_string(pid) + ")");
    return true;
}

core::errors::Result<json> StdioTransport::request(const json& message,
                                                   const std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (!is_open()) {
        return BridgeError{ErrorCategory::Transport, "Process is not running" + exit_description(),
                           "process_exited"};
    }

    auto written = write_line(message.dump());
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    const std::string wanted = id_key(message["id"]);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto incoming = read_message(deadline);
        if (core::errors::is_error(incoming)) {
            return core::errors::get_error(incoming);
        }
        const json& payload = core::errors::get_value(incoming);
        if (payload.contains("method")) {
            if (payload.contains("id")) {
                answer_server_request(payload);
            } else {
                LOG_DEBUG("StdioTransport: notification " + payload["method"].dump());
            }
            continue;
        }
        if (payload.contains("id") && id_key(payload["id"]) == wanted) {
            return payload;
        }
        LOG_DEBUG("StdioTransport: discarding response for id " +
                  (payload.contains("id") ? payload["id"].dump() : std::string("<none>")));
    }
}

core::errors::Result<bool> StdioTransport::notify(const json& message) {
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (!is_open()) {
        return BridgeError{ErrorCategory::Transport, "Process is not running" + exit_description(),
                           "process_exited"};
    }
    return write_line(message.dump());
}

void StdioTransport::close() {
    if (closing_.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ > 0 && !exited_ && !reap(false)) {
        static_cast<void>(kill(pid_, SIGTERM));
    }
}

bool StdioTransport::is_open() const {
    if (closing_.load() || stream_closed_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (pid_ <= 0) {
        return false;
    }
    return !exited_ && !reap(false);
}

pid_t StdioTransport::pid() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return pid_;
}

std::optional<int> StdioTransport::exit_code() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!exited_ && !reap(false)) {
        return std::nullopt;
    }
    return exit_code_;
}

core::errors::Result<bool> StdioTransport::write_line(const std::string& line) {
    std::string data = line;
    data.push_back('\n');
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t n = write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        stream_closed_.store(true);
        return BridgeError{ErrorCategory::Transport,
                           std::string("Failed to write to process: ") + std::strerror(errno),
                           "process_write_failed"};
    }
    return true;
}

core::errors::Result<json> StdioTransport::read_message(
    const std::chrono::steady_clock::time_point deadline) {
    while (true) {
        const auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }
            json payload = json::parse(line, nullptr, false);
            if (payload.is_discarded() || !payload.is_object()) {
                // Servers that print banners to stdout are tolerated
                LOG_DEBUG("StdioTransport: ignoring non-JSON output: " + line.substr(0, 200));
                continue;
            }
            return payload;
        }

        if (read_buffer_.size() > kMaxLineBytes) {
            stream_closed_.store(true);
            return BridgeError{ErrorCategory::Transport, "Process output line too large",
                               "message_too_large"};
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return BridgeError{ErrorCategory::Transport, "Timed out waiting for process response",
                               "request_timeout"};
        }
        if (closing_.load()) {
            return BridgeError{ErrorCategory::Transport, "Transport closed", "transport_closed"};
        }

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        pollfd fd{stdout_fd_, POLLIN, 0};
        const int ready = ::poll(&fd, 1, static_cast<int>(std::min<long long>(remaining, 100)));
        if (ready <= 0) {
            continue;
        }

        char buffer[4096];
        while (true) {
            const ssize_t n = read(stdout_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                read_buffer_.append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0) {
                stream_closed_.store(true);
                {
                    std::lock_guard<std::mutex> lock(process_mutex_);
                    for (int i = 0; i < 10 && !exited_ && !reap(false); ++i) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(10));
                    }
                }
                return BridgeError{ErrorCategory::Transport,
                                   "Process closed its output" + exit_description(),
                                   "process_exited"};
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                stream_closed_.store(true);
                return BridgeError{ErrorCategory::Transport,
                                   std::string("Failed to read from process: ") + std::strerror(errno),
                                   "process_read_failed"};
            }
            break;
        }
    }
}

void StdioTransport::answer_server_request(const json& message) {
    json reply;
    reply["jsonrpc"] = "2.0";
    reply["id"] = message["id"];
    if (message["method"] == "ping") {
        reply["result"] = json::object();
    } else {
        reply["error"] = {{"code", core::errors::codes::kNotFound},
                          {"message", "Method not supported by client: " + message["method"].dump()}};
    }
    static_cast<void>(write_line(reply.dump()));
}

// Caller holds process_mutex_
bool StdioTransport::reap(const bool block) const {
    if (pid_ <= 0 || exited_) {
        return exited_;
    }
    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);
    if (waited != pid_) {
        return false;
    }
    exited_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
    LOG_INFO("StdioTransport: process " + std::to_string(pid_) + " exited with code " +
             std::to_string(exit_code_));
    return true;
}

std::string StdioTransport::exit_description() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!exited_) {
        return "";
    }
    return " (exit code " + std::to_string(exit_code_) + ")";
}

}  // namespace toolbridge::mcp
