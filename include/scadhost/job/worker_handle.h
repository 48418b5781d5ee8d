#pragma once

/**
 * WorkerHandle - one scadhost-worker child process and its channel
 *
 * Lifecycle: Spawned -> Active (job message written) -> Terminated.
 * Terminated is entered exactly once and carries the reason. Any other
 * transition is refused and logged.
 *
 * The child gets a fresh socket pair on fd 3 for protocol frames and
 * inherits stdout/stderr for its logs. terminate() kills the process
 * (SIGKILL) if it is still running and closes the channel; the process
 * handle is closed once libuv has reaped the child. closed() turns true
 * when both handles are gone, so running the owning loop to completion
 * guarantees no process is left behind.
 */

#include "scadhost/async/event_loop.h"
#include "scadhost/protocol/messages.h"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace scadhost {
namespace job {

enum class WorkerState {
    Spawned,
    Active,
    Terminated
};

enum class TerminationReason {
    None,
    Success,
    Error,
    Timeout,
    Crash
};

const char* workerStateName(WorkerState state);
const char* terminationReasonName(TerminationReason reason);

class WorkerHandle {
public:
    using LineHandler = std::function<void(const std::string& line)>;
    using EofHandler = std::function<void()>;
    using ExitHandler = std::function<void(int64_t exitStatus, int termSignal)>;

    explicit WorkerHandle(async::EventLoop& loop);
    ~WorkerHandle();

    // Set before spawn()
    void onLine(LineHandler handler) { lineHandler_ = std::move(handler); }
    void onEof(EofHandler handler) { eofHandler_ = std::move(handler); }
    void onExit(ExitHandler handler) { exitHandler_ = std::move(handler); }

    /**
     * Start the worker executable with the channel on fd 3.
     * On failure the handles are already closing; the loop still has to run.
     * pid() stays 0 unless the process started and was then killed because
     * its channel could not be read.
     */
    bool spawn(const std::string& executable, const std::vector<std::string>& args, std::string& error);

    /**
     * Write the job frame. Moves Spawned -> Active.
     */
    bool send(const std::string& frame, std::string& error);

    /**
     * Enter Terminated with the given reason: kill if still running, stop
     * reading the channel. Returns false if already terminated.
     */
    bool terminate(TerminationReason reason);

    WorkerState state() const { return state_; }
    TerminationReason reason() const { return reason_; }
    int pid() const { return pid_; }

    bool exited() const { return exited_; }
    bool channelEof() const { return eof_; }
    int64_t exitStatus() const { return exitStatus_; }
    int termSignal() const { return termSignal_; }

    /**
     * Both the process and channel handles have finished closing.
     */
    bool closed() const { return closedHandles_ == openedHandles_; }

    WorkerHandle(const WorkerHandle&) = delete;
    WorkerHandle& operator=(const WorkerHandle&) = delete;

private:
    struct WriteRequest;

    bool transition(WorkerState next, TerminationReason reason);
    void closeChannel();
    void closeProcessIfReaped();

    static void onAlloc(uv_handle_t* handle, size_t suggested, uv_buf_t* buf);
    static void onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);
    static void onWrite(uv_write_t* req, int status);
    static void onProcessExit(uv_process_t* process, int64_t exitStatus, int termSignal);
    static void onHandleClose(uv_handle_t* handle);

    async::EventLoop& loop_;
    uv_process_t process_;
    uv_pipe_t channel_;

    WorkerState state_ = WorkerState::Spawned;
    TerminationReason reason_ = TerminationReason::None;
    bool spawned_ = false;
    bool exited_ = false;
    bool eof_ = false;
    int pid_ = 0;
    int64_t exitStatus_ = 0;
    int termSignal_ = 0;
    int openedHandles_ = 0;
    int closedHandles_ = 0;

    LineHandler lineHandler_;
    EofHandler eofHandler_;
    ExitHandler exitHandler_;

    protocol::FrameReader reader_;
    char readBuffer_[64 * 1024];
};

} // namespace job
} // namespace scadhost
