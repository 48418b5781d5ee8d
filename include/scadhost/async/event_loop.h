#pragma once

/**
 * EventLoop - owns one libuv loop
 *
 * There is no process-wide loop. A worker process creates one for its
 * asset reads, timers and host channel; every JobCoordinator::execute()
 * creates one for the child process, the deadline timer and the channel.
 * Jobs on different threads therefore never share libuv state.
 *
 * init() before use. Drive with runOnce() from a polling loop or block
 * in run(). shutdown() (also run by the destructor) closes whatever is
 * still open and releases the loop.
 */

#include <uv.h>

namespace scadhost {
namespace async {

class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Idempotent. False if libuv refused to create the loop.
    bool init();

    // One non-blocking iteration; true while work remains
    bool runOnce();

    // Blocks until no referenced handle or request remains
    void run();

    void shutdown();

    // nullptr before init()
    uv_loop_t* handle();

private:
    uv_loop_t loop_;
    bool initialized_ = false;
};

} // namespace async
} // namespace scadhost
