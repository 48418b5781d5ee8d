/**
 * Async asset lookup implementation
 *
 * Uses libuv's uv_queue_work to run resolver lookups on the thread pool.
 * Callbacks are queued and processed separately via processCompleted() so
 * they run on the main thread, outside any libuv callback.
 */

#include "scadhost/assets/async_asset_reader.h"
#include <iostream>

namespace scadhost {
namespace assets {

/**
 * Context for a single lookup
 */
struct AsyncAssetReader::ReadContext {
    uv_work_t work;
    AsyncAssetReader* reader;
    std::string request;
    AssetCallback callback;
    AssetLookup result;
};

/**
 * Worker function - runs on thread pool
 */
void AsyncAssetReader::lookupWorker(uv_work_t* req) {
    auto* ctx = static_cast<ReadContext*>(req->data);
    ctx->result = ctx->reader->resolver_.lookup(ctx->request);
}

/**
 * After work callback - runs on the loop thread
 * DON'T invoke JS callbacks here - queue them for safe processing
 */
void AsyncAssetReader::lookupAfterWork(uv_work_t* req, int status) {
    auto* ctx = static_cast<ReadContext*>(req->data);

    if (status == UV_ECANCELED) {
        ctx->result = AssetLookup();
        ctx->result.request = ctx->request;
        ctx->result.status = LookupStatus::IoError;
        ctx->result.error = "Asset read cancelled";
    }

    ctx->reader->queueCompleted(std::move(ctx->callback), std::move(ctx->result));
    delete ctx;
}

AsyncAssetReader::AsyncAssetReader(async::EventLoop& loop, const AssetResolver& resolver)
    : loop_(loop), resolver_(resolver) {}

AsyncAssetReader::~AsyncAssetReader() {
    if (inFlight_ > 0) {
        std::cerr << "[Assets] Reader destroyed with " << inFlight_
                  << " lookup(s) in flight" << std::endl;
    }
}

void AsyncAssetReader::queueCompleted(AssetCallback callback, AssetLookup result) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    completed_.push({std::move(callback), std::move(result)});
}

void AsyncAssetReader::lookup(const std::string& request, AssetCallback callback) {
    uv_loop_t* loop = loop_.handle();
    if (!loop) {
        // No loop: resolve inline but still deliver through the queue
        queueCompleted(std::move(callback), resolver_.lookup(request));
        inFlight_++;
        return;
    }

    auto* ctx = new ReadContext();
    ctx->work.data = ctx;
    ctx->reader = this;
    ctx->request = request;
    ctx->callback = std::move(callback);

    int result = uv_queue_work(loop, &ctx->work, lookupWorker, lookupAfterWork);
    if (result != 0) {
        std::cerr << "[Assets] Failed to queue lookup: " << uv_strerror(result) << std::endl;
        AssetLookup failed;
        failed.request = request;
        failed.status = LookupStatus::IoError;
        failed.error = std::string("Failed to queue asset read: ") + uv_strerror(result);
        queueCompleted(std::move(ctx->callback), std::move(failed));
        delete ctx;
    }
    inFlight_++;
}

bool AsyncAssetReader::processCompleted() {
    // Move completed items out of the queue while holding the lock
    std::queue<Completed> toProcess;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        std::swap(toProcess, completed_);
    }

    bool hadCallbacks = !toProcess.empty();

    while (!toProcess.empty()) {
        auto completed = std::move(toProcess.front());
        toProcess.pop();
        inFlight_--;

        if (completed.callback) {
            completed.callback(std::move(completed.result));
        }
    }

    return hadCallbacks;
}

size_t AsyncAssetReader::inFlight() const {
    return inFlight_;
}

} // namespace assets
} // namespace scadhost
