#include "scadhost/job/worker_handle.h"
#include <csignal>
#include <iostream>

namespace scadhost {
namespace job {

const char* workerStateName(WorkerState state) {
    switch (state) {
        case WorkerState::Spawned: return "Spawned";
        case WorkerState::Active: return "Active";
        case WorkerState::Terminated: return "Terminated";
    }
    return "Unknown";
}

const char* terminationReasonName(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None: return "None";
        case TerminationReason::Success: return "Success";
        case TerminationReason::Error: return "Error";
        case TerminationReason::Timeout: return "Timeout";
        case TerminationReason::Crash: return "Crash";
    }
    return "Unknown";
}

struct WorkerHandle::WriteRequest {
    uv_write_t req;
    std::string data;
};

WorkerHandle::WorkerHandle(async::EventLoop& loop) : loop_(loop) {}

WorkerHandle::~WorkerHandle() {
    if (!closed()) {
        std::cerr << "[Job] Worker " << pid_ << " destroyed with open handles" << std::endl;
    }
}

bool WorkerHandle::spawn(const std::string& executable,
                         const std::vector<std::string>& args,
                         std::string& error) {
    if (spawned_) {
        error = "Worker already spawned";
        return false;
    }

    uv_loop_t* loop = loop_.handle();
    if (!loop) {
        error = "EventLoop not available";
        return false;
    }

    int result = uv_pipe_init(loop, &channel_, 0);
    if (result != 0) {
        error = std::string("uv_pipe_init failed: ") + uv_strerror(result);
        return false;
    }
    channel_.data = this;
    openedHandles_++;

    // argv: executable, args..., nullptr
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    uv_stdio_container_t stdio[4];
    stdio[0].flags = UV_IGNORE;
    stdio[1].flags = UV_INHERIT_FD;
    stdio[1].data.fd = 1;
    stdio[2].flags = UV_INHERIT_FD;
    stdio[2].data.fd = 2;
    stdio[3].flags = static_cast<uv_stdio_flags>(UV_CREATE_PIPE | UV_READABLE_PIPE | UV_WRITABLE_PIPE);
    stdio[3].data.stream = reinterpret_cast<uv_stream_t*>(&channel_);

    uv_process_options_t options = {};
    options.file = executable.c_str();
    options.args = argv.data();
    options.exit_cb = onProcessExit;
    options.stdio_count = 4;
    options.stdio = stdio;

    process_.data = this;
    result = uv_spawn(loop, &process_, &options);
    // uv_spawn initializes the handle even when it fails
    openedHandles_++;

    if (result != 0) {
        error = "Failed to spawn " + executable + ": " + uv_strerror(result);
        state_ = WorkerState::Terminated;
        reason_ = TerminationReason::Crash;
        uv_close(reinterpret_cast<uv_handle_t*>(&process_), onHandleClose);
        uv_close(reinterpret_cast<uv_handle_t*>(&channel_), onHandleClose);
        return false;
    }

    spawned_ = true;
    pid_ = process_.pid;
    state_ = WorkerState::Spawned;

    result = uv_read_start(reinterpret_cast<uv_stream_t*>(&channel_), onAlloc, onRead);
    if (result != 0) {
        error = std::string("Cannot read worker channel: ") + uv_strerror(result);
        terminate(TerminationReason::Crash);
        return false;
    }

    return true;
}

bool WorkerHandle::send(const std::string& frame, std::string& error) {
    if (state_ != WorkerState::Spawned) {
        error = std::string("Cannot send job to a worker in state ") + workerStateName(state_);
        std::cerr << "[Job] " << error << std::endl;
        return false;
    }

    auto* req = new WriteRequest();
    req->data = frame;
    req->req.data = req;

    uv_buf_t buf = uv_buf_init(&req->data[0], static_cast<unsigned int>(req->data.size()));
    int result = uv_write(&req->req, reinterpret_cast<uv_stream_t*>(&channel_), &buf, 1, onWrite);
    if (result != 0) {
        error = std::string("Failed to write job message: ") + uv_strerror(result);
        delete req;
        return false;
    }

    return transition(WorkerState::Active, TerminationReason::None);
}

bool WorkerHandle::terminate(TerminationReason reason) {
    if (!transition(WorkerState::Terminated, reason)) {
        return false;
    }

    if (spawned_ && !exited_) {
        int result = uv_process_kill(&process_, SIGKILL);
        if (result != 0 && result != UV_ESRCH) {
            std::cerr << "[Job] Failed to kill worker " << pid_ << ": " << uv_strerror(result) << std::endl;
        }
    }

    closeChannel();
    closeProcessIfReaped();
    return true;
}

bool WorkerHandle::transition(WorkerState next, TerminationReason reason) {
    bool legal = false;
    switch (state_) {
        case WorkerState::Spawned:
            legal = (next == WorkerState::Active || next == WorkerState::Terminated);
            break;
        case WorkerState::Active:
            legal = (next == WorkerState::Terminated);
            break;
        case WorkerState::Terminated:
            legal = false;
            break;
    }

    if (!legal) {
        std::cerr << "[Job] Refusing worker " << pid_ << " transition "
                  << workerStateName(state_) << " -> " << workerStateName(next) << std::endl;
        return false;
    }

    state_ = next;
    if (next == WorkerState::Terminated) {
        reason_ = reason;
    }
    return true;
}

void WorkerHandle::closeChannel() {
    uv_handle_t* handle = reinterpret_cast<uv_handle_t*>(&channel_);
    if (openedHandles_ == 0 || uv_is_closing(handle)) {
        return;
    }
    uv_read_stop(reinterpret_cast<uv_stream_t*>(&channel_));
    uv_close(handle, onHandleClose);
}

void WorkerHandle::closeProcessIfReaped() {
    // Closing an unreaped process handle would leave a zombie behind
    if (!spawned_ || !exited_ || state_ != WorkerState::Terminated) {
        return;
    }
    uv_handle_t* handle = reinterpret_cast<uv_handle_t*>(&process_);
    if (!uv_is_closing(handle)) {
        uv_close(handle, onHandleClose);
    }
}

void WorkerHandle::onAlloc(uv_handle_t* handle, size_t, uv_buf_t* buf) {
    auto* self = static_cast<WorkerHandle*>(handle->data);
    buf->base = self->readBuffer_;
    buf->len = sizeof(self->readBuffer_);
}

void WorkerHandle::onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    auto* self = static_cast<WorkerHandle*>(stream->data);

    if (nread < 0) {
        if (nread != UV_EOF) {
            std::cerr << "[Job] Worker " << self->pid_ << " channel read error: "
                      << uv_strerror(static_cast<int>(nread)) << std::endl;
        }
        self->eof_ = true;
        uv_read_stop(stream);
        if (self->eofHandler_) {
            self->eofHandler_();
        }
        return;
    }

    self->reader_.append(buf->base, static_cast<size_t>(nread));
    if (self->reader_.overflowed()) {
        std::cerr << "[Job] Worker " << self->pid_ << " sent a frame over "
                  << protocol::kMaxFrameBytes << " bytes; killing it" << std::endl;
        uv_read_stop(stream);
        if (!self->exited_) {
            int result = uv_process_kill(&self->process_, SIGKILL);
            if (result != 0 && result != UV_ESRCH) {
                std::cerr << "[Job] Failed to kill worker " << self->pid_ << ": "
                          << uv_strerror(result) << std::endl;
            }
        }
        self->eof_ = true;
        if (self->eofHandler_) {
            self->eofHandler_();
        }
        return;
    }

    std::string line;
    while (self->reader_.next(line)) {
        if (line.empty()) {
            continue;
        }
        if (self->lineHandler_) {
            self->lineHandler_(line);
        }
        // The handler may have terminated the worker
        if (self->state_ == WorkerState::Terminated) {
            return;
        }
    }
}

void WorkerHandle::onWrite(uv_write_t* req, int status) {
    auto* write = static_cast<WriteRequest*>(req->data);
    if (status != 0 && status != UV_ECANCELED) {
        std::cerr << "[Job] Job message write failed: " << uv_strerror(status) << std::endl;
    }
    delete write;
}

void WorkerHandle::onProcessExit(uv_process_t* process, int64_t exitStatus, int termSignal) {
    auto* self = static_cast<WorkerHandle*>(process->data);
    self->exited_ = true;
    self->exitStatus_ = exitStatus;
    self->termSignal_ = termSignal;

    if (self->exitHandler_) {
        self->exitHandler_(exitStatus, termSignal);
    }
    self->closeProcessIfReaped();
}

void WorkerHandle::onHandleClose(uv_handle_t* handle) {
    auto* self = static_cast<WorkerHandle*>(handle->data);
    if (self) {
        self->closedHandles_++;
    }
}

} // namespace job
} // namespace scadhost
