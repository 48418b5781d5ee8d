#pragma once

/**
 * JobCoordinator - runs one compilation job in a fresh worker process
 *
 * execute() validates the script and the installation, spawns
 * scadhost-worker, posts the job message, arms the deadline, and waits on
 * its own libuv loop until the job settles and the worker has been reaped.
 * Every exit path returns exactly one JobOutcome; nothing throws.
 *
 * Usage:
 *   JobCoordinator coordinator(Config::fromEnvironment());
 *   JobOutcome outcome = coordinator.execute("cube([10,10,10]);");
 *   if (outcome) write(outcome.bytes);
 *   else report(protocol::errorKindName(outcome.error), outcome.message);
 *
 * execute() may be called from several threads at once; each call owns
 * its loop and its worker.
 *
 * The process signal state is left alone. A worker that dies while its
 * job frame is being written raises SIGPIPE in the host, so the embedding
 * program should ignore it (the scadhost CLI does) to get EPIPE instead.
 */

#include "scadhost/config.h"
#include "scadhost/protocol/errors.h"
#include "scadhost/protocol/messages.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace scadhost {
namespace job {

struct JobOutcome {
    bool ok = false;
    protocol::ErrorKind error = protocol::ErrorKind::None;
    std::string message;
    std::string outputPath;
    std::vector<uint8_t> bytes;
    int workerPid = 0;
    uint64_t elapsedMs = 0;

    explicit operator bool() const noexcept { return ok; }

    static JobOutcome failure(protocol::ErrorKind kind, std::string message);
};

struct CompilationJob {
    uint64_t id = 0;
    std::string scriptText;
    std::vector<std::string> args;
    std::vector<std::string> outputPaths;
    std::chrono::steady_clock::time_point submittedAt;
    std::chrono::steady_clock::time_point deadline;
};

class JobCoordinator {
public:
    explicit JobCoordinator(Config config);

    JobOutcome execute(const std::string& scriptText);

    /**
     * Workers spawned by this coordinator so far.
     */
    uint64_t spawnCount() const { return spawnCount_.load(); }

    /**
     * Workers spawned but not yet reaped.
     */
    uint64_t activeWorkers() const { return activeWorkers_.load(); }

    const Config& config() const { return config_; }

private:
    std::vector<std::string> workerArgs() const;

    Config config_;
    std::atomic<uint64_t> spawnCount_{0};
    std::atomic<uint64_t> activeWorkers_{0};
    std::atomic<uint64_t> nextJobId_{1};
};

/**
 * Accept only non-blank, NUL-free, valid UTF-8 text up to maxBytes.
 * @return false with the InvalidInput message in error
 */
bool validateScript(const std::string& scriptText, size_t maxBytes, std::string& error);

} // namespace job
} // namespace scadhost
