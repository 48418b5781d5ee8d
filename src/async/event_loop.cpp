#include "scadhost/async/event_loop.h"
#include <iostream>

namespace scadhost {
namespace async {

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    shutdown();
}

bool EventLoop::init() {
    if (initialized_) {
        return true;
    }

    int rc = uv_loop_init(&loop_);
    if (rc != 0) {
        std::cerr << "[EventLoop] uv_loop_init failed: " << uv_strerror(rc) << std::endl;
        return false;
    }
    initialized_ = true;
    return true;
}

bool EventLoop::runOnce() {
    if (!initialized_) {
        return false;
    }
    // Non-zero while handles or requests are still referenced
    return uv_run(&loop_, UV_RUN_NOWAIT) != 0;
}

void EventLoop::run() {
    if (initialized_) {
        uv_run(&loop_, UV_RUN_DEFAULT);
    }
}

void EventLoop::shutdown() {
    if (!initialized_) {
        return;
    }

    // Anything still open here was leaked by its owner; close it so the
    // loop can be torn down, and say so.
    int leaked = 0;
    uv_walk(&loop_, [](uv_handle_t* h, void* arg) {
        if (!uv_is_closing(h)) {
            ++*static_cast<int*>(arg);
            uv_close(h, nullptr);
        }
    }, &leaked);
    if (leaked > 0) {
        std::cerr << "[EventLoop] Force-closed " << leaked << " open handle(s)" << std::endl;
    }

    while (uv_loop_alive(&loop_)) {
        uv_run(&loop_, UV_RUN_ONCE);
    }

    int rc = uv_loop_close(&loop_);
    if (rc != 0) {
        std::cerr << "[EventLoop] uv_loop_close: " << uv_strerror(rc) << std::endl;
    }
    initialized_ = false;
}

uv_loop_t* EventLoop::handle() {
    return initialized_ ? &loop_ : nullptr;
}

} // namespace async
} // namespace scadhost
