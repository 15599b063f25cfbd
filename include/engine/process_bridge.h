#pragma once

#include "common/types.hpp"
#include <sys/types.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace multiocr {

/**
 * @brief Command line of an external engine worker
 */
struct BridgeCommand {
    std::string executable;            // resolved through PATH
    std::vector<std::string> args;

    std::string describe() const;
};

/**
 * @brief One long-lived external engine process spoken to over stdin/stdout
 *
 * Protocol: one JSON object per line in each direction.
 *   request:  {"action":"process","image":"<base64>","language":"<code>"}
 *             {"action":"test"}
 *   response: {"success":true,"results":[...],"text":"..."}
 *             {"success":false,"error":"..."}
 *
 * Responses are correlated only by arrival order, so at most one request is
 * outstanding at a time; call() serializes on an internal mutex.
 *
 * A call that times out, or finds the process gone, taints the bridge: the
 * process is terminated and the bridge reports itself unavailable from then on.
 */
class ProcessBridge {
public:
    ProcessBridge(EngineId engine, BridgeCommand command);
    ~ProcessBridge();

    ProcessBridge(const ProcessBridge&) = delete;
    ProcessBridge& operator=(const ProcessBridge&) = delete;

    /**
     * @brief fork/exec the worker with piped stdin/stdout
     */
    bool spawn(std::string& error_msg);

    /**
     * @brief Send {"action":"test"}
     * @return true if the worker answered success=true within the timeout
     */
    bool probe(int timeoutMs);

    /**
     * @brief Recognize one image
     * @return the worker's success response
     * @throws OCRError EngineTimeout / EngineReportedFailure /
     *         BridgeProtocolError / EngineUnavailable
     */
    json invoke(const std::string& imageBytes, const std::string& language, int timeoutMs);

    /**
     * @brief Write one request line and read one response object
     * @throws OCRError EngineTimeout / BridgeProtocolError / EngineUnavailable
     */
    json call(const json& request, int timeoutMs);

    /**
     * @brief SIGTERM, short grace period, then SIGKILL; reaps the child and
     *        closes the pipes. Idempotent.
     * @return false if the process could not be signalled or reaped
     */
    bool terminate();

    bool isAvailable() const { return pid_ > 0 && !tainted_; }
    bool pipesOpen() const { return stdinFd_ >= 0 || stdoutFd_ >= 0; }
    bool isTainted() const { return tainted_; }
    pid_t pid() const { return pid_; }
    EngineId engine() const { return engine_; }
    uint64_t invocationCount() const { return invocations_; }

    static constexpr int kTerminateGraceMs = 200;

private:
    void writeLine(const std::string& line);

    /**
     * @brief Drop bytes left over from an earlier request (e.g. the tail of
     *        a malformed reply) so the next response is not misattributed
     */
    void discardStaleOutput();

    /**
     * @brief Extract one complete JSON object from buffer_ if present.
     *        Complete lines that are not a JSON object are logged and dropped.
     * @return true and fill out when found; false when more data is needed
     */
    bool extractResponse(json& out);

    void taint(const std::string& reason);
    bool reapChild();
    void closePipes();

    const EngineId engine_;
    const BridgeCommand command_;

    std::mutex callMutex_;        // one outstanding request
    std::mutex lifecycleMutex_;   // spawn / terminate

    std::atomic<pid_t> pid_{-1};
    int stdinFd_ = -1;
    int stdoutFd_ = -1;
    std::string buffer_;

    std::atomic<bool> tainted_{false};
    std::atomic<uint64_t> invocations_{0};
};

} // namespace multiocr
