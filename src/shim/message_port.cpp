#include "scadhost/shim/message_port.h"
#include <iostream>

namespace scadhost {
namespace shim {

struct MessagePort::WriteRequest {
    uv_write_t req;
    std::string data;
    MessagePort* port;
};

MessagePort::MessagePort(async::EventLoop& loop) : loop_(loop) {}

MessagePort::~MessagePort() {
    close();
}

bool MessagePort::open(int fd, std::string& error) {
    if (open_) {
        return true;
    }

    uv_loop_t* loop = loop_.handle();
    if (!loop) {
        error = "EventLoop not available";
        return false;
    }

    int result = uv_pipe_init(loop, &pipe_, 0);
    if (result != 0) {
        error = std::string("uv_pipe_init failed: ") + uv_strerror(result);
        return false;
    }
    pipe_.data = this;

    result = uv_pipe_open(&pipe_, fd);
    if (result != 0) {
        error = "Cannot open channel fd " + std::to_string(fd) + ": " + uv_strerror(result);
        uv_close(reinterpret_cast<uv_handle_t*>(&pipe_), nullptr);
        return false;
    }

    result = uv_read_start(reinterpret_cast<uv_stream_t*>(&pipe_), onAlloc, onRead);
    if (result != 0) {
        error = std::string("uv_read_start failed: ") + uv_strerror(result);
        uv_close(reinterpret_cast<uv_handle_t*>(&pipe_), nullptr);
        return false;
    }

    open_ = true;
    return true;
}

void MessagePort::postPayloadJson(const std::string& payloadJson) {
    std::string frame;
    frame.reserve(payloadJson.size() + 32);
    frame += "{\"type\":\"message\",\"data\":";
    frame += payloadJson;
    frame += "}\n";
    write(std::move(frame));
}

void MessagePort::post(const protocol::JsonValue& payload) {
    write(protocol::frameMessage(payload));
}

void MessagePort::postError(const std::string& message) {
    write(protocol::frameError(message));
}

void MessagePort::write(std::string frame) {
    if (!open_) {
        std::cerr << "[Worker] Dropping frame: channel closed" << std::endl;
        return;
    }

    auto* req = new WriteRequest();
    req->data = std::move(frame);
    req->port = this;
    req->req.data = req;

    uv_buf_t buf = uv_buf_init(&req->data[0], static_cast<unsigned int>(req->data.size()));
    int result = uv_write(&req->req, reinterpret_cast<uv_stream_t*>(&pipe_), &buf, 1, onWrite);
    if (result != 0) {
        std::cerr << "[Worker] Channel write failed: " << uv_strerror(result) << std::endl;
        delete req;
        return;
    }
    pendingWrites_++;
    framesSent_++;
}

bool MessagePort::processInbound(const InboundHandler& handler) {
    if (inbound_.empty()) {
        return false;
    }
    std::queue<protocol::Envelope> toProcess;
    std::swap(toProcess, inbound_);
    while (!toProcess.empty()) {
        if (handler) {
            handler(toProcess.front());
        }
        toProcess.pop();
    }
    return true;
}

void MessagePort::close() {
    if (!open_) {
        return;
    }
    open_ = false;
    uv_read_stop(reinterpret_cast<uv_stream_t*>(&pipe_));
    if (!uv_is_closing(reinterpret_cast<uv_handle_t*>(&pipe_))) {
        uv_close(reinterpret_cast<uv_handle_t*>(&pipe_), nullptr);
    }
}

void MessagePort::onAlloc(uv_handle_t* handle, size_t, uv_buf_t* buf) {
    auto* self = static_cast<MessagePort*>(handle->data);
    buf->base = self->readBuffer_;
    buf->len = sizeof(self->readBuffer_);
}

void MessagePort::onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    auto* self = static_cast<MessagePort*>(stream->data);

    if (nread < 0) {
        if (nread != UV_EOF) {
            std::cerr << "[Worker] Channel read error: " << uv_strerror(static_cast<int>(nread)) << std::endl;
        }
        self->eof_ = true;
        uv_read_stop(stream);
        return;
    }

    self->reader_.append(buf->base, static_cast<size_t>(nread));
    if (self->reader_.overflowed()) {
        std::cerr << "[Worker] Inbound frame too large; closing channel" << std::endl;
        self->eof_ = true;
        uv_read_stop(stream);
        return;
    }

    std::string line;
    while (self->reader_.next(line)) {
        if (line.empty()) {
            continue;
        }
        protocol::Envelope envelope;
        std::string error;
        if (!protocol::parseEnvelope(line, envelope, error)) {
            std::cerr << "[Worker] Ignoring malformed frame: " << error << std::endl;
            continue;
        }
        self->inbound_.push(std::move(envelope));
    }
}

void MessagePort::onWrite(uv_write_t* req, int status) {
    auto* write = static_cast<WriteRequest*>(req->data);
    write->port->pendingWrites_--;
    if (status != 0) {
        std::cerr << "[Worker] Channel write failed: " << uv_strerror(status) << std::endl;
    }
    delete write;
}

} // namespace shim
} // namespace scadhost
