#pragma once

/**
 * MessagePort - the worker's end of the host channel
 *
 * Wraps an inherited file descriptor (fd 3) as a libuv pipe. Inbound lines
 * are parsed into envelopes and queued; the worker main loop drains them
 * with processInbound() so JS is never entered from a libuv callback.
 */

#include "scadhost/async/event_loop.h"
#include "scadhost/protocol/messages.h"
#include <functional>
#include <queue>
#include <string>

namespace scadhost {
namespace shim {

class MessagePort {
public:
    using InboundHandler = std::function<void(const protocol::Envelope& envelope)>;

    explicit MessagePort(async::EventLoop& loop);
    ~MessagePort();

    /**
     * Attach to an open descriptor and start reading.
     */
    bool open(int fd, std::string& error);

    /**
     * Post a payload that is already JSON text (as produced by JSON.stringify).
     */
    void postPayloadJson(const std::string& payloadJson);

    void post(const protocol::JsonValue& payload);

    /**
     * Report an uncaught worker fault.
     */
    void postError(const std::string& message);

    /**
     * Deliver queued inbound envelopes.
     * Returns true if any were delivered.
     */
    bool processInbound(const InboundHandler& handler);

    bool isOpen() const { return open_; }
    bool isEof() const { return eof_; }
    bool hasPendingWrites() const { return pendingWrites_ > 0; }
    size_t framesSent() const { return framesSent_; }

    void close();

    MessagePort(const MessagePort&) = delete;
    MessagePort& operator=(const MessagePort&) = delete;

private:
    struct WriteRequest;

    void write(std::string frame);

    static void onAlloc(uv_handle_t* handle, size_t suggested, uv_buf_t* buf);
    static void onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);
    static void onWrite(uv_write_t* req, int status);

    async::EventLoop& loop_;
    uv_pipe_t pipe_;
    bool open_ = false;
    bool eof_ = false;
    size_t pendingWrites_ = 0;
    size_t framesSent_ = 0;
    protocol::FrameReader reader_;
    std::queue<protocol::Envelope> inbound_;
    char readBuffer_[64 * 1024];
};

} // namespace shim
} // namespace scadhost
