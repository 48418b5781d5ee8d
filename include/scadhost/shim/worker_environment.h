#pragma once

/**
 * WorkerEnvironment - browser worker surface for the geometry kernel
 *
 * The kernel is an Emscripten build meant for a browser Web Worker. This
 * object builds the primitives it expects (self, postMessage, fetch, URL,
 * Response, streaming WebAssembly instantiation, importScripts, timers,
 * TextEncoder/TextDecoder, Blob) inside one JS engine and hands them to
 * the kernel as parameters of a wrapper function. Nothing is installed on
 * the engine's global object, so two environments in one isolate would
 * not see each other.
 *
 * Usage:
 *   WorkerEnvironment env(*engine, loop, resolver, port, options);
 *   env.install(error);
 *   env.loadKernel(source, "openscad-worker.js", error);
 *   // main loop:
 *   port.processInbound([&](const protocol::Envelope& e) { env.deliver(e); });
 *   env.processPending();
 *   engine->runPendingJobs();
 */

#include "scadhost/assets/asset_response.h"
#include "scadhost/assets/async_asset_reader.h"
#include "scadhost/js/engine.h"
#include "scadhost/shim/message_port.h"
#include <map>
#include <memory>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

namespace scadhost {
namespace shim {

struct EnvironmentOptions {
    // What self.location reports. The kernel derives asset URLs from it;
    // only their final segment reaches the resolver.
    std::string kernelUrl = "https://scadhost.invalid/openscad-worker.js";
    bool verbose = false;
};

class WorkerEnvironment {
public:
    WorkerEnvironment(js::Engine& engine,
                      async::EventLoop& loop,
                      const assets::AssetResolver& resolver,
                      MessagePort& port,
                      EnvironmentOptions options = EnvironmentOptions());
    ~WorkerEnvironment();

    /**
     * Build the environment. A second call is a no-op that returns true.
     */
    bool install(std::string& error);
    bool isInstalled() const { return installed_; }

    /**
     * Evaluate the kernel source with the environment's primitives in scope.
     * A throw during top-level evaluation is reported as a worker fault.
     */
    bool loadKernel(const std::string& source, const std::string& filename, std::string& error);

    /**
     * Dispatch an inbound envelope to the kernel's message listeners.
     */
    void deliver(const protocol::Envelope& envelope);

    /**
     * Run completed asset lookups and due timers.
     * Returns true if any callback ran.
     */
    bool processPending();

    /**
     * Report an uncaught worker fault to the host. Only the first terminal
     * frame is sent; later faults are logged.
     */
    void reportFault(const std::string& message);

    /**
     * A terminal payload ({result} or {error}) or a fault report was posted.
     */
    bool terminalPosted() const { return terminalPosted_; }
    bool faulted() const { return faulted_; }

    /**
     * Stop and close all timers. Call before the event loop shuts down.
     */
    void shutdown();

    WorkerEnvironment(const WorkerEnvironment&) = delete;
    WorkerEnvironment& operator=(const WorkerEnvironment&) = delete;

private:
    struct TimerContext {
        uv_timer_t handle;
        int id;
        js::JSValueHandle callback;
        uint64_t intervalMs;  // 0 for setTimeout
        bool cancelled;
        WorkerEnvironment* env;
    };

    struct PendingTimer {
        int id;
        js::JSValueHandle callback;
        uint64_t intervalMs;
    };

    void installNatives(js::JSValueHandle natives);

    js::JSValueHandle wrapResponse(std::unique_ptr<assets::AssetResponse> response);
    assets::AssetResponse* unwrapResponse(js::JSValueHandle holder);

    int createTimer(js::JSValueHandle callback, uint64_t delayMs, uint64_t intervalMs);
    void cancelTimer(int id);
    void closeTimer(TimerContext* ctx);
    bool runDueTimers();

    static void onTimer(uv_timer_t* handle);
    static void onTimerClose(uv_handle_t* handle);

    js::Engine& engine_;
    async::EventLoop& loop_;
    const assets::AssetResolver& resolver_;
    MessagePort& port_;
    EnvironmentOptions options_;
    assets::AsyncAssetReader reader_;

    bool installed_ = false;
    bool terminalPosted_ = false;
    bool faulted_ = false;
    js::JSValueHandle env_;

    // Responses handed to JS; released with the environment
    std::vector<std::unique_ptr<assets::AssetResponse>> responses_;

    std::map<int, TimerContext*> timers_;
    std::queue<PendingTimer> pendingTimers_;
    std::unordered_set<int> cancelledTimerIds_;
    int nextTimerId_ = 1;
};

} // namespace shim
} // namespace scadhost
