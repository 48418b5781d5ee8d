#pragma once

/**
 * Async asset lookups on the libuv thread pool
 *
 * Lookups run on a pool thread; completions are queued and handed back on
 * the worker's main thread from processCompleted(), never from inside a
 * libuv callback, so the callback is free to call into the JS engine.
 *
 * Usage:
 *   AsyncAssetReader reader(loop, resolver);
 *   reader.lookup("openscad.wasm", [](assets::AssetLookup result) { ... });
 *   // main loop:
 *   loop.runOnce();
 *   reader.processCompleted();
 */

#include "scadhost/assets/asset_resolver.h"
#include "scadhost/async/event_loop.h"
#include <functional>
#include <mutex>
#include <queue>

namespace scadhost {
namespace assets {

using AssetCallback = std::function<void(AssetLookup result)>;

class AsyncAssetReader {
public:
    AsyncAssetReader(async::EventLoop& loop, const AssetResolver& resolver);
    ~AsyncAssetReader();

    /**
     * Queue a lookup. The callback runs during a later processCompleted().
     */
    void lookup(const std::string& request, AssetCallback callback);

    /**
     * Invoke callbacks of finished lookups.
     * Returns true if any callbacks were invoked.
     */
    bool processCompleted();

    /**
     * Lookups queued but not yet delivered.
     */
    size_t inFlight() const;

    AsyncAssetReader(const AsyncAssetReader&) = delete;
    AsyncAssetReader& operator=(const AsyncAssetReader&) = delete;

private:
    struct Completed {
        AssetCallback callback;
        AssetLookup result;
    };

    struct ReadContext;
    static void lookupWorker(uv_work_t* req);
    static void lookupAfterWork(uv_work_t* req, int status);

    void queueCompleted(AssetCallback callback, AssetLookup result);

    async::EventLoop& loop_;
    const AssetResolver& resolver_;
    std::queue<Completed> completed_;
    mutable std::mutex queueMutex_;
    size_t inFlight_ = 0;
};

} // namespace assets
} // namespace scadhost
