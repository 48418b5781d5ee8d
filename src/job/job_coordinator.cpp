#include "scadhost/job/job_coordinator.h"
#include "scadhost/async/event_loop.h"
#include "scadhost/job/result_extractor.h"
#include "scadhost/job/settlement.h"
#include "scadhost/job/worker_handle.h"
#include <iostream>

namespace scadhost {
namespace job {

JobOutcome JobOutcome::failure(protocol::ErrorKind kind, std::string message) {
    JobOutcome outcome;
    outcome.ok = false;
    outcome.error = kind;
    outcome.message = std::move(message);
    return outcome;
}

namespace {

bool isBlank(const std::string& text) {
    for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v') {
            return false;
        }
    }
    return true;
}

/**
 * Strict UTF-8 check: no overlong forms, no surrogates, nothing past U+10FFFF.
 * On failure offset is the index of the first bad byte.
 */
bool isValidUtf8(const std::string& text, size_t& offset) {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    size_t len = text.size();
    size_t i = 0;
    while (i < len) {
        unsigned char c = s[i];
        size_t extra = 0;
        uint32_t cp = 0;
        uint32_t min = 0;
        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
            min = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
            min = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
            min = 0x10000;
        } else {
            offset = i;
            return false;
        }

        if (i + extra >= len) {
            offset = i;
            return false;
        }
        for (size_t k = 1; k <= extra; k++) {
            unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80) {
                offset = i;
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            offset = i;
            return false;
        }
        i += extra + 1;
    }
    return true;
}

/**
 * State of one execute() call. Lives on the caller's stack; every libuv
 * handle it owns is closed before run() returns.
 */
class JobRun {
public:
    JobRun(const Config& config, CompilationJob job)
        : config_(config),
          job_(std::move(job)),
          worker_(loop_),
          extractor_(job_.outputPaths.empty() ? std::string(protocol::kOutputPath)
                                              : job_.outputPaths.front()) {}

    JobOutcome run(const std::vector<std::string>& args,
                   const std::string& requestFrame,
                   std::atomic<uint64_t>& spawnCount,
                   std::atomic<uint64_t>& activeWorkers);

    JobRun(const JobRun&) = delete;
    JobRun& operator=(const JobRun&) = delete;

private:
    void handleLine(const std::string& line);
    void handleEof();
    void handleExit(int64_t exitStatus, int termSignal);
    void settleUnexpectedExit();
    void settle(JobOutcome outcome, TerminationReason reason);
    void closeDeadline();

    static void onDeadline(uv_timer_t* timer);

    const Config& config_;
    CompilationJob job_;
    async::EventLoop loop_;
    WorkerHandle worker_;
    ResultExtractor extractor_;
    Settlement<JobOutcome> settlement_;
    uv_timer_t deadline_;
    bool deadlineInitialized_ = false;
};

JobOutcome JobRun::run(const std::vector<std::string>& args,
                       const std::string& requestFrame,
                       std::atomic<uint64_t>& spawnCount,
                       std::atomic<uint64_t>& activeWorkers) {
    if (!loop_.init()) {
        return JobOutcome::failure(protocol::ErrorKind::WorkerCrashed,
                                   "Cannot create an event loop for the job");
    }

    worker_.onLine([this](const std::string& line) { handleLine(line); });
    worker_.onEof([this]() { handleEof(); });
    worker_.onExit([this](int64_t status, int signal) { handleExit(status, signal); });

    std::string error;
    bool started = worker_.spawn(config_.workerExecutable, args, error);
    if (!started && worker_.pid() == 0) {
        std::cerr << "[Job] #" << job_.id << " " << error << std::endl;
        // Let the handles finish closing
        loop_.run();
        loop_.shutdown();
        return JobOutcome::failure(protocol::ErrorKind::ConfigurationError, error);
    }

    spawnCount++;
    activeWorkers++;
    if (config_.debug) {
        std::cout << "[Job] #" << job_.id << " spawned worker pid " << worker_.pid() << std::endl;
    }

    int result = 0;
    if (!started) {
        // The process exists but its channel is unusable; spawn() already killed it
        std::cerr << "[Job] #" << job_.id << " " << error << std::endl;
        settlement_.settle(JobOutcome::failure(protocol::ErrorKind::WorkerCrashed, error));
    } else if ((result = uv_timer_init(loop_.handle(), &deadline_)) != 0) {
        settle(JobOutcome::failure(protocol::ErrorKind::WorkerCrashed,
                                   std::string("Cannot arm job deadline: ") + uv_strerror(result)),
               TerminationReason::Crash);
    } else {
        deadlineInitialized_ = true;
        deadline_.data = this;
        uv_update_time(loop_.handle());
        result = uv_timer_start(&deadline_, onDeadline, config_.timeoutMs, 0);
        if (result != 0) {
            settle(JobOutcome::failure(protocol::ErrorKind::WorkerCrashed,
                                       std::string("Cannot arm job deadline: ") + uv_strerror(result)),
                   TerminationReason::Crash);
        }
    }

    if (!settlement_.isSettled() && !worker_.send(requestFrame, error)) {
        settle(JobOutcome::failure(protocol::ErrorKind::WorkerCrashed, error), TerminationReason::Crash);
    }

    // Returns once the timer, the channel and the reaped process are closed
    loop_.run();
    loop_.shutdown();
    activeWorkers--;

    if (config_.debug) {
        std::cout << "[Job] #" << job_.id << " worker " << worker_.pid() << " "
                  << workerStateName(worker_.state()) << " ("
                  << terminationReasonName(worker_.reason()) << ")" << std::endl;
    }

    JobOutcome outcome = settlement_.isSettled()
        ? settlement_.take()
        : JobOutcome::failure(protocol::ErrorKind::WorkerExitedUnexpectedly,
                              "Worker finished without settling the job");
    outcome.workerPid = worker_.pid();
    return outcome;
}

void JobRun::handleLine(const std::string& line) {
    if (settlement_.isSettled()) {
        if (config_.debug) {
            std::cout << "[Job] #" << job_.id << " ignoring message after settlement" << std::endl;
        }
        return;
    }

    protocol::Envelope envelope;
    std::string error;
    if (!protocol::parseEnvelope(line, envelope, error)) {
        std::cerr << "[Job] #" << job_.id << " ignoring malformed frame: " << error << std::endl;
        return;
    }

    if (envelope.type == protocol::EnvelopeType::Error) {
        std::cerr << "[Job] #" << job_.id << " worker fault: " << envelope.message << std::endl;
        settle(JobOutcome::failure(protocol::ErrorKind::WorkerCrashed, envelope.message),
               TerminationReason::Crash);
        return;
    }

    switch (protocol::classifyPayload(envelope.data)) {
        case protocol::PayloadKind::Result: {
            ExtractedOutput output = extractor_.extract(*envelope.data.find("result"));
            if (!output) {
                settle(JobOutcome::failure(output.error, output.message), TerminationReason::Error);
                return;
            }
            JobOutcome outcome;
            outcome.ok = true;
            outcome.outputPath = std::move(output.path);
            outcome.bytes = std::move(output.bytes);
            settle(std::move(outcome), TerminationReason::Success);
            return;
        }
        case protocol::PayloadKind::Error: {
            const protocol::JsonValue* value = envelope.data.find("error");
            std::string text = value->isString() ? value->stringVal : protocol::writeJson(*value);
            settle(JobOutcome::failure(protocol::ErrorKind::WorkerReportedError, text),
                   TerminationReason::Error);
            return;
        }
        case protocol::PayloadKind::Other:
            if (config_.debug) {
                std::string text = protocol::writeJson(envelope.data);
                if (text.size() > 200) {
                    text = text.substr(0, 200) + "...";
                }
                std::cout << "[Job] #" << job_.id << " non-terminal message: " << text << std::endl;
            }
            return;
    }
}

void JobRun::handleEof() {
    if (!settlement_.isSettled() && worker_.exited()) {
        settleUnexpectedExit();
    }
}

void JobRun::handleExit(int64_t exitStatus, int termSignal) {
    if (config_.debug) {
        std::cout << "[Job] #" << job_.id << " worker " << worker_.pid() << " exited (status "
                  << exitStatus << ", signal " << termSignal << ")" << std::endl;
    }
    // A terminal frame written just before exit may still be in the pipe
    if (!settlement_.isSettled() && worker_.channelEof()) {
        settleUnexpectedExit();
    }
}

void JobRun::settleUnexpectedExit() {
    std::string message = "Worker exited without a result";
    if (worker_.termSignal() != 0) {
        message += " (signal " + std::to_string(worker_.termSignal()) + ")";
    } else if (worker_.exitStatus() != 0) {
        message += " (status " + std::to_string(worker_.exitStatus()) + ")";
    }
    settle(JobOutcome::failure(protocol::ErrorKind::WorkerExitedUnexpectedly, message),
           TerminationReason::Crash);
}

void JobRun::settle(JobOutcome outcome, TerminationReason reason) {
    protocol::ErrorKind kind = outcome.error;
    if (!settlement_.settle(std::move(outcome))) {
        std::cerr << "[Job] #" << job_.id << " already settled; dropping "
                  << protocol::errorKindName(kind) << std::endl;
        return;
    }
    if (config_.debug) {
        std::cout << "[Job] #" << job_.id << " settled: " << protocol::errorKindName(kind) << std::endl;
    }
    closeDeadline();
    worker_.terminate(reason);
}

void JobRun::closeDeadline() {
    if (!deadlineInitialized_) {
        return;
    }
    uv_handle_t* handle = reinterpret_cast<uv_handle_t*>(&deadline_);
    if (uv_is_closing(handle)) {
        return;
    }
    uv_timer_stop(&deadline_);
    uv_close(handle, nullptr);
}

void JobRun::onDeadline(uv_timer_t* timer) {
    auto* self = static_cast<JobRun*>(timer->data);
    std::cerr << "[Job] #" << self->job_.id << " exceeded " << self->config_.timeoutMs
              << " ms; killing worker " << self->worker_.pid() << std::endl;
    self->settle(JobOutcome::failure(protocol::ErrorKind::Timeout,
                                     "Render timed out after " + std::to_string(self->config_.timeoutMs) + " ms"),
                 TerminationReason::Timeout);
}

} // anonymous namespace

bool validateScript(const std::string& scriptText, size_t maxBytes, std::string& error) {
    if (scriptText.empty()) {
        error = "Script is empty";
        return false;
    }
    if (scriptText.size() > maxBytes) {
        error = "Script is " + std::to_string(scriptText.size()) + " bytes; the limit is " +
                std::to_string(maxBytes);
        return false;
    }
    if (isBlank(scriptText)) {
        error = "Script contains only whitespace";
        return false;
    }
    size_t nul = scriptText.find('\0');
    if (nul != std::string::npos) {
        error = "Script contains a NUL byte at offset " + std::to_string(nul);
        return false;
    }
    size_t offset = 0;
    if (!isValidUtf8(scriptText, offset)) {
        error = "Script is not valid UTF-8 (offset " + std::to_string(offset) + ")";
        return false;
    }
    return true;
}

JobCoordinator::JobCoordinator(Config config) : config_(std::move(config)) {
    if (config_.workerExecutable.empty()) {
        config_.workerExecutable = defaultWorkerExecutable();
    }
}

std::vector<std::string> JobCoordinator::workerArgs() const {
    std::vector<std::string> args = {"--channel-fd", "3", "--kernel", config_.kernelModule()};
    for (const auto& dir : config_.assetSearchDirs()) {
        args.push_back("--asset-dir");
        args.push_back(dir);
    }
    if (config_.debug) {
        args.push_back("--debug");
    }
    return args;
}

JobOutcome JobCoordinator::execute(const std::string& scriptText) {
    auto start = std::chrono::steady_clock::now();
    auto finish = [start](JobOutcome outcome) {
        outcome.elapsedMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
        return outcome;
    };

    std::string error;
    if (!validateScript(scriptText, config_.maxScriptBytes, error)) {
        std::cerr << "[Job] Rejected script: " << error << std::endl;
        return finish(JobOutcome::failure(protocol::ErrorKind::InvalidInput, error));
    }

    if (!config_.validate(error)) {
        std::cerr << "[Job] " << error << std::endl;
        return finish(JobOutcome::failure(protocol::ErrorKind::ConfigurationError, error));
    }

    protocol::JobRequest request = protocol::makeRenderRequest(scriptText);

    CompilationJob job;
    job.id = nextJobId_++;
    job.scriptText = scriptText;
    job.args = request.args;
    job.outputPaths = request.outputPaths;
    job.submittedAt = start;
    job.deadline = start + std::chrono::milliseconds(config_.timeoutMs);

    uint64_t id = job.id;
    std::string frame = protocol::frameMessage(protocol::requestToJson(request));

    JobOutcome outcome;
    {
        JobRun run(config_, std::move(job));
        outcome = run.run(workerArgs(), frame, spawnCount_, activeWorkers_);
    }
    outcome = finish(std::move(outcome));

    if (outcome) {
        std::cout << "[Job] #" << id << " produced " << outcome.bytes.size() << " bytes ("
                  << outcome.outputPath << ") in " << outcome.elapsedMs << " ms" << std::endl;
    } else {
        std::cerr << "[Job] #" << id << " failed: " << protocol::errorKindName(outcome.error)
                  << ": " << outcome.message << std::endl;
    }
    return outcome;
}

} // namespace job
} // namespace scadhost
