#include "engine/process_bridge.h"
#include "common/base64.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace multiocr {

namespace {

std::once_flag g_sigpipe_once;

// A dead worker must surface as EPIPE on write, not kill the service
void ignoreSigpipe() {
    std::call_once(g_sigpipe_once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

std::string preview(const std::string& line) {
    constexpr size_t kMax = 120;
    return line.size() <= kMax ? line : line.substr(0, kMax) + "...";
}

} // namespace

std::string BridgeCommand::describe() const {
    std::string text = executable;
    for (const auto& arg : args) {
        text += " " + arg;
    }
    return text;
}

ProcessBridge::ProcessBridge(EngineId engine, BridgeCommand command)
    : engine_(engine)
    , command_(std::move(command)) {}

ProcessBridge::~ProcessBridge() {
    terminate();
    closePipes();
}

bool ProcessBridge::spawn(std::string& error_msg) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (pid_ > 0) return true;
    if (command_.executable.empty()) {
        error_msg = "no worker command configured";
        return false;
    }

    ignoreSigpipe();
    closePipes();

    int toChild[2];
    int fromChild[2];
    if (::pipe2(toChild, O_CLOEXEC) != 0) {
        error_msg = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(fromChild, O_CLOEXEC) != 0) {
        error_msg = std::string("pipe failed: ") + std::strerror(errno);
        ::close(toChild[0]);
        ::close(toChild[1]);
        return false;
    }

    // argv must be built before fork: only async-signal-safe calls in the child
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command_.executable.c_str()));
    for (const auto& arg : command_.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        error_msg = std::string("fork failed: ") + std::strerror(errno);
        ::close(toChild[0]);
        ::close(toChild[1]);
        ::close(fromChild[0]);
        ::close(fromChild[1]);
        return false;
    }

    if (pid == 0) {
        ::dup2(toChild[0], STDIN_FILENO);
        ::dup2(fromChild[1], STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(toChild[0]);
    ::close(fromChild[1]);
    stdinFd_ = toChild[1];
    stdoutFd_ = fromChild[0];
    buffer_.clear();
    tainted_ = false;
    pid_ = pid;

    LOG_INFO("[{}] worker spawned (pid {}): {}", toString(engine_), pid, command_.describe());
    return true;
}

bool ProcessBridge::probe(int timeoutMs) {
    try {
        json response = call(json{{"action", "test"}}, timeoutMs);
        if (response.is_object() && response.contains("success") &&
            response["success"].is_boolean() && response["success"].get<bool>()) {
            return true;
        }
        LOG_WARN("[{}] probe rejected: {}", toString(engine_), preview(response.dump()));
    } catch (const OCRError& e) {
        LOG_WARN("[{}] probe failed ({}): {}", toString(engine_), toString(e.kind()), e.what());
    }
    return false;
}

json ProcessBridge::invoke(const std::string& imageBytes, const std::string& language, int timeoutMs) {
    json request;
    request["action"] = "process";
    request["image"] = Base64::encode(imageBytes);
    request["language"] = language;

    json response = call(request, timeoutMs);

    if (!response.is_object() || !response.contains("success") || !response["success"].is_boolean()) {
        throw OCRError(ErrorKind::BridgeProtocolError,
                       "response has no boolean 'success' field: " + preview(response.dump()), engine_);
    }
    if (!response["success"].get<bool>()) {
        std::string message = "engine reported failure";
        if (response.contains("error") && response["error"].is_string()) {
            message = response["error"].get<std::string>();
        }
        throw OCRError(ErrorKind::EngineReportedFailure, message, engine_);
    }
    return response;
}

json ProcessBridge::call(const json& request, int timeoutMs) {
    std::lock_guard<std::mutex> lock(callMutex_);

    if (!isAvailable()) {
        throw OCRError(ErrorKind::EngineUnavailable,
                       std::string(toString(engine_)) + " worker is not running", engine_);
    }

    ++invocations_;
    discardStaleOutput();
    writeLine(request.dump() + "\n");

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    json response;
    while (!extractResponse(response)) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            taint("no response within " + std::to_string(timeoutMs) + "ms");
            throw OCRError(ErrorKind::EngineTimeout,
                           std::string(toString(engine_)) + " timed out after " +
                           std::to_string(timeoutMs) + "ms", engine_);
        }

        struct pollfd pfd;
        pfd.fd = stdoutFd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::string("poll failed: ") + std::strerror(errno);
            taint(reason);
            throw OCRError(ErrorKind::BridgeProtocolError, reason, engine_);
        }
        if (rc == 0) continue;

        char chunk[65536];
        ssize_t n = ::read(stdoutFd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            std::string reason = std::string("read failed: ") + std::strerror(errno);
            taint(reason);
            throw OCRError(ErrorKind::BridgeProtocolError, reason, engine_);
        }
        if (n == 0) {
            taint("worker closed its output");
            throw OCRError(ErrorKind::BridgeProtocolError,
                           std::string(toString(engine_)) + " worker exited", engine_);
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
    return response;
}

void ProcessBridge::discardStaleOutput() {
    if (!buffer_.empty()) {
        LOG_WARN("[{}] discarding {} unread bytes: {}", toString(engine_), buffer_.size(), preview(buffer_));
        buffer_.clear();
    }

    struct pollfd pfd;
    pfd.fd = stdoutFd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    while (::poll(&pfd, 1, 0) > 0) {
        char chunk[4096];
        ssize_t n = ::read(stdoutFd_, chunk, sizeof(chunk));
        if (n > 0) {
            LOG_WARN("[{}] discarding {} late bytes from a previous request", toString(engine_), n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        taint("worker closed its output");
        throw OCRError(ErrorKind::BridgeProtocolError,
                       std::string(toString(engine_)) + " worker exited", engine_);
    }
}

void ProcessBridge::writeLine(const std::string& line) {
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(stdinFd_, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::string("write failed: ") + std::strerror(errno);
            taint(reason);
            throw OCRError(ErrorKind::BridgeProtocolError, reason, engine_);
        }
        written += static_cast<size_t>(n);
    }
}

bool ProcessBridge::extractResponse(json& out) {
    size_t searchFrom = 0;
    while (true) {
        size_t newline = buffer_.find('\n', searchFrom);
        if (newline == std::string::npos) break;

        std::string candidate = buffer_.substr(0, newline);
        if (candidate.find_first_not_of(" \t\r\n") == std::string::npos) {
            buffer_.erase(0, newline + 1);
            searchFrom = 0;
            continue;
        }

        try {
            json parsed = json::parse(candidate);
            buffer_.erase(0, newline + 1);
            searchFrom = 0;
            if (parsed.is_object()) {
                out = std::move(parsed);
                return true;
            }
            LOG_WARN("[{}] skipping non-object output line: {}", toString(engine_), preview(candidate));
        } catch (const json::parse_error& e) {
            if (e.byte >= candidate.size()) {
                // Object continues on a later line
                searchFrom = newline + 1;
                continue;
            }
            // Worker chatter on stdout; the response for this request is still owed
            LOG_WARN("[{}] skipping non-JSON output line: {}", toString(engine_), preview(candidate));
            buffer_.erase(0, newline + 1);
            searchFrom = 0;
        }
    }

    // Complete object still waiting for its newline
    if (!buffer_.empty() && json::accept(buffer_)) {
        json parsed = json::parse(buffer_);
        if (parsed.is_object()) {
            out = std::move(parsed);
            buffer_.clear();
            return true;
        }
    }
    return false;
}

void ProcessBridge::taint(const std::string& reason) {
    if (!tainted_.exchange(true)) {
        LOG_WARN("[{}] worker tainted: {}; terminating and evicting", toString(engine_), reason);
    }
    buffer_.clear();
    reapChild();
    closePipes();
}

bool ProcessBridge::terminate() {
    bool reaped = reapChild();
    // An in-flight call still owns the pipes; it sees EOF and closes them when it taints
    std::unique_lock<std::mutex> callLock(callMutex_, std::try_to_lock);
    if (callLock.owns_lock()) {
        buffer_.clear();
        closePipes();
    }
    return reaped;
}

bool ProcessBridge::reapChild() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    pid_t pid = pid_.exchange(-1);
    if (pid <= 0) return true;

    if (::kill(pid, SIGTERM) != 0 && errno != ESRCH) {
        LOG_ERROR("[{}] SIGTERM to pid {} failed: {}", toString(engine_), pid, std::strerror(errno));
    }

    int status = 0;
    const auto graceEnd = std::chrono::steady_clock::now() + std::chrono::milliseconds(kTerminateGraceMs);
    while (std::chrono::steady_clock::now() < graceEnd) {
        pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid || (rc < 0 && errno == ECHILD)) {
            LOG_DEBUG("[{}] worker pid {} exited", toString(engine_), pid);
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    LOG_WARN("[{}] worker pid {} ignored SIGTERM, sending SIGKILL", toString(engine_), pid);
    if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_ERROR("[{}] SIGKILL to pid {} failed: {}", toString(engine_), pid, std::strerror(errno));
        return false;
    }
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return errno == ECHILD;
        }
    }
    return true;
}

void ProcessBridge::closePipes() {
    if (stdinFd_ >= 0) {
        ::close(stdinFd_);
        stdinFd_ = -1;
    }
    if (stdoutFd_ >= 0) {
        ::close(stdoutFd_);
        stdoutFd_ = -1;
    }
}

} // namespace multiocr
