#include "gates/compliance_checker.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace hookguard::gates {

using core::errors::ErrorCategory;
using core::errors::HookError;
using nlohmann::json;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Keeps SIGPIPE ignored while feeding a child that may exit before reading.
class ScopedIgnoreSigpipe {
public:
    ScopedIgnoreSigpipe() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }

    ScopedIgnoreSigpipe(const ScopedIgnoreSigpipe&) = delete;
    ScopedIgnoreSigpipe& operator=(const ScopedIgnoreSigpipe&) = delete;

    ~ScopedIgnoreSigpipe() {
        if (installed_) {
            static_cast<void>(sigaction(SIGPIPE, &previous_, nullptr));
        }
    }

private:
    struct sigaction previous_ {};
    bool installed_ = false;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

void feed_pipe(int& fd, const std::string& input, std::size_t& offset) {
    while (fd >= 0 && offset < input.size()) {
        const ssize_t n = write(fd, input.data() + offset, input.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return;
        }
        // EPIPE: the child stopped reading. Its answer is still collected.
        close_fd(fd);
        return;
    }
    close_fd(fd);
}

core::errors::Result<ProcessCapture> run_with_input(
    const std::string& command, const std::string& input,
    const std::filesystem::path& cwd, const std::uint32_t timeout_ms) {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0],
                        &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1]}) {
            close_fd(*fd);
        }
        return HookError{ErrorCategory::ExternalCheck,
                         "Failed to create compliance check pipes.",
                         "external_check_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0],
                        &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1]}) {
            close_fd(*fd);
        }
        return HookError{ErrorCategory::ExternalCheck,
                         "Failed to fork compliance check.",
                         "external_check_failed"};
    }

    if (pid == 0) {
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        for (const int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0],
                             stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) {
            static_cast<void>(close(fd));
        }
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    std::size_t input_offset = 0;
    bool child_exited = false;
    int status = 0;

    while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0 || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - started)
                                 .count();
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        feed_pipe(stdin_pipe[1], input, input_offset);

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stdin_pipe[1] >= 0) {
            fds[nfds].fd = stdin_pipe[1];
            fds[nfds].events = POLLOUT;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        }

        drain_pipe(stdout_pipe[0], capture.stdout_text);
        drain_pipe(stderr_pipe[0], capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        if (child_exited && stdout_pipe[0] < 0 && stderr_pipe[0] < 0) {
            break;
        }
        // A killed child may leave grandchildren holding the pipes open.
        if (child_exited && capture.timed_out) {
            break;
        }
    }

    close_fd(stdin_pipe[1]);
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace

CommandComplianceChecker::CommandComplianceChecker(std::string command,
                                                   const std::uint32_t timeout_ms,
                                                   std::filesystem::path working_directory)
    : command_(std::move(command)),
      timeout_ms_(timeout_ms),
      working_directory_(std::move(working_directory)) {}

core::errors::Result<ComplianceVerdict> CommandComplianceChecker::check(
    const json& summary) {
    const ScopedIgnoreSigpipe sigpipe_guard;
    // Transcript text is not guaranteed to be valid UTF-8.
    const std::string input = summary.dump(-1, ' ', false, json::error_handler_t::replace);
    auto capture_result = run_with_input(command_, input, working_directory_, timeout_ms_);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.timed_out) {
        LOG_WARN("Compliance check timed out after " + std::to_string(timeout_ms_) + "ms");
        return HookError{ErrorCategory::ExternalCheck,
                         "Compliance check timed out after " +
                             std::to_string(timeout_ms_) + "ms.",
                         "external_check_timeout",
                         "Raise CUSTODIET_CHECK_TIMEOUT_MS or fix the checker."};
    }

    if (capture.exit_code != 0) {
        std::string detail = trim(capture.stderr_text);
        if (detail.size() > 240) {
            detail = detail.substr(0, 240) + "...";
        }
        return HookError{ErrorCategory::ExternalCheck,
                         "Compliance check exited with code " +
                             std::to_string(capture.exit_code) +
                             (detail.empty() ? "." : ": " + detail),
                         "external_check_failed"};
    }

    LOG_DEBUG("Compliance check finished in " +
              std::to_string(static_cast<long long>(capture.duration_ms)) + "ms");
    return parse_compliance_output(capture.stdout_text);
}

core::errors::Result<ComplianceVerdict> parse_compliance_output(
    const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    std::optional<json> payload;
    const json whole = json::parse(output, nullptr, false);
    if (!whole.is_discarded() && whole.is_object()) {
        payload = whole;
    }
    for (auto it = lines.rbegin(); !payload.has_value() && it != lines.rend(); ++it) {
        json candidate = json::parse(*it, nullptr, false);
        if (!candidate.is_discarded() && candidate.is_object()) {
            payload = std::move(candidate);
        }
    }

    if (!payload.has_value()) {
        return HookError{ErrorCategory::ExternalCheck,
                         "Compliance check produced no JSON verdict.",
                         "external_check_failed"};
    }

    const auto verdict_it = payload->find("verdict");
    if (verdict_it == payload->end() || !verdict_it->is_string()) {
        return HookError{ErrorCategory::ExternalCheck,
                         "Compliance check verdict is missing.",
                         "external_check_failed"};
    }
    const auto verdict = protocol::parse_verdict(verdict_it->get<std::string>());
    if (!verdict.has_value()) {
        return HookError{ErrorCategory::ExternalCheck,
                         "Compliance check verdict is unknown: " +
                             verdict_it->get<std::string>(),
                         "external_check_failed"};
    }

    ComplianceVerdict result;
    result.verdict = verdict.value();
    const auto citation_it = payload->find("citation");
    if (citation_it != payload->end() && citation_it->is_string() &&
        !citation_it->get<std::string>().empty()) {
        result.citation = citation_it->get<std::string>();
    }
    const auto message_it = payload->find("message");
    if (message_it != payload->end() && message_it->is_string()) {
        result.message = message_it->get<std::string>();
    }
    return result;
}

}  // namespace hookguard::gates
