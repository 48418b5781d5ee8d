#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include "scadhost/config.h"
#include "scadhost/job/job_coordinator.h"
#include "scadhost/protocol/errors.h"
#include "scadhost/service/render_service.h"

#ifndef SCADHOST_TEST_WORKER
#define SCADHOST_TEST_WORKER "scadhost-worker"
#endif

namespace fs = std::filesystem;

namespace {
    using scadhost::Config;
    using scadhost::job::JobCoordinator;
    using scadhost::job::JobOutcome;
    using scadhost::protocol::ErrorKind;

    bool ExpectTrue(bool condition, const std::string &message) {
        if (!condition) {
            std::cout << "    assertion failed: " << message << std::endl;
        }
        return condition;
    }

    bool ExpectKind(const JobOutcome &outcome, ErrorKind expected, const std::string &message) {
        if (outcome.error != expected) {
            std::cout << "    kind mismatch: " << message << std::endl;
            std::cout << "    expected " << scadhost::protocol::errorKindName(expected)
                    << " got " << scadhost::protocol::errorKindName(outcome.error)
                    << " (" << outcome.message << ")" << std::endl;
            return false;
        }
        return true;
    }

    std::string AsText(const std::vector<uint8_t> &bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

    bool ProcessGone(int pid) {
        return pid > 0 && ::kill(pid, 0) == -1 && errno == ESRCH;
    }

    void WriteFile(const fs::path &path, const std::string &content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    // Smallest valid WebAssembly module: magic + version
    const std::string kEmptyWasmModule("\0asm\x01\0\0\0", 8);

    /**
     * A kernel install in a temp directory whose openscad-worker.js is a
     * scripted stand-in for the real kernel.
     */
    struct FakeKernel {
        fs::path root;

        explicit FakeKernel(const std::string &workerSource) {
            static int counter = 0;
            root = fs::temp_directory_path() / ("scadhost-kernel-" + std::to_string(::getpid()) + "-" +
                                                std::to_string(counter++));
            fs::create_directories(root / "openscad-playground" / "dist" / "wasm");
            fs::create_directories(root / "browserfs" / "dist");
            WriteFile(dist() / "openscad-worker.js", workerSource);
            WriteFile(dist() / "wasm" / "openscad.wasm", kEmptyWasmModule);
        }

        ~FakeKernel() {
            std::error_code ec;
            fs::remove_all(root, ec);
        }

        fs::path dist() const {
            return root / "openscad-playground" / "dist";
        }

        Config config(uint64_t timeoutMs = 20000) const {
            Config config;
            config.setKernelRoot(root.string());
            config.workerExecutable = SCADHOST_TEST_WORKER;
            config.timeoutMs = timeoutMs;
            return config;
        }

        // Replace the worker with a shell script (exit-path scenarios)
        std::string writeScriptWorker(const std::string &body) const {
            fs::path path = root / "fake-worker.sh";
            WriteFile(path, "#!/bin/sh\n" + body + "\n");
            fs::permissions(path, fs::perms::owner_all);
            return path.string();
        }
    };

    const char *kEchoKernel = R"JS(
addEventListener('message', (e) => {
    const job = e.data;
    const ok = job.inputs.length === 1 && job.inputs[0].path === 'input.scad' &&
        job.args.join(' ') === 'input.scad -o output.stl --export-format=binstl';
    if (!ok) {
        postMessage({ error: 'unexpected job: ' + JSON.stringify(job) });
        return;
    }
    const bytes = new TextEncoder().encode('solid ' + job.inputs[0].content);
    postMessage({ result: { outputs: [[job.outputPaths[0], bytes]] } });
});
)JS";

    bool SuccessfulRunReturnsBytes() {
        FakeKernel kernel(kEchoKernel);
        JobCoordinator coordinator(kernel.config());
        JobOutcome outcome = coordinator.execute("cube([10,10,10]);");
        bool ok = ExpectKind(outcome, ErrorKind::None, "Echo kernel succeeds");
        ok &= ExpectTrue(static_cast<bool>(outcome), "Outcome converts to true");
        ok &= ExpectTrue(AsText(outcome.bytes) == "solid cube([10,10,10]);", "Bytes round-tripped through the worker");
        ok &= ExpectTrue(outcome.outputPath == "output.stl", "Output path");
        ok &= ExpectTrue(coordinator.spawnCount() == 1, "One worker spawned");
        ok &= ExpectTrue(coordinator.activeWorkers() == 0, "Worker reaped");
        ok &= ExpectTrue(ProcessGone(outcome.workerPid), "Worker process gone");
        return ok;
    }

    bool KernelErrorIsReportedVerbatim() {
        FakeKernel kernel(R"JS(
self.onmessage = () => {
    postMessage({ error: 'ERROR: Parser error in file "input.scad", line 2: syntax error' });
};
)JS");
        JobCoordinator coordinator(kernel.config());
        JobOutcome outcome = coordinator.execute("cube([1,1,1]);\n{");
        bool ok = ExpectKind(outcome, ErrorKind::WorkerReportedError, "Kernel error surfaced");
        ok &= ExpectTrue(outcome.message == "ERROR: Parser error in file \"input.scad\", line 2: syntax error",
                         "Kernel text unmodified");
        ok &= ExpectTrue(ProcessGone(outcome.workerPid), "Worker process gone");
        return ok;
    }

    bool NonTerminalMessagesAreIgnored() {
        FakeKernel kernel(R"JS(
addEventListener('message', () => {
    postMessage({ stdout: 'Compiling design (CSG Tree generation)...' });
    postMessage('progress');
    setTimeout(() => {
        postMessage({ stderr: 'WARNING: object may not be a valid 2-manifold' });
        postMessage({ result: { outputs: [['output.stl', new Uint8Array([1, 2, 3, 4])]] } });
    }, 5);
});
)JS");
        JobCoordinator coordinator(kernel.config());
        JobOutcome outcome = coordinator.execute("sphere(5);");
        bool ok = ExpectKind(outcome, ErrorKind::None, "Result after log messages");
        ok &= ExpectTrue(outcome.bytes == std::vector<uint8_t>{1, 2, 3, 4}, "Binary bytes intact");
        return ok;
    }

    bool SilentKernelTimesOut() {
        FakeKernel kernel("addEventListener('message', () => {});\n");
        JobCoordinator coordinator(kernel.config(300));
        JobOutcome outcome = coordinator.execute("cube(1);");
        bool ok = ExpectKind(outcome, ErrorKind::Timeout, "Deadline enforced");
        ok &= ExpectTrue(outcome.elapsedMs >= 250, "Waited for the deadline");
        ok &= ExpectTrue(ProcessGone(outcome.workerPid), "Timed-out worker killed and reaped");
        ok &= ExpectTrue(coordinator.activeWorkers() == 0, "No active workers");
        return ok;
    }

    bool OneMillisecondDeadlineLeavesNoProcess() {
        FakeKernel kernel(kEchoKernel);
        JobCoordinator coordinator(kernel.config(1));
        JobOutcome outcome = coordinator.execute("cube(1);");
        bool ok = ExpectKind(outcome, ErrorKind::Timeout, "1 ms deadline fires first");
        ok &= ExpectTrue(ProcessGone(outcome.workerPid), "No lingering process");
        return ok;
    }

    bool UncaughtHandlerErrorIsCrash() {
        FakeKernel kernel(R"JS(
addEventListener('message', () => {
    throw new TypeError('Module.callMain is not a function');
});
)JS");
        JobCoordinator coordinator(kernel.config());
        JobOutcome outcome = coordinator.execute("cube(1);");
        bool ok = ExpectKind(outcome, ErrorKind::WorkerCrashed, "Uncaught handler error");
        ok &= ExpectTrue(outcome.message.find("callMain") != std::string::npos, "Fault text forwarded");
        return ok;
    }

    bool KernelLoadFailureIsCrash() {
        FakeKernel kernel("throw new Error('kernel bundle corrupted');\n");
        JobCoordinator coordinator(kernel.config());
        JobOutcome outcome = coordinator.execute("cube(1);");
        bool ok = ExpectKind(outcome, ErrorKind::WorkerCrashed, "Top-level throw");
        ok &= ExpectTrue(outcome.message.find("kernel bundle corrupted") != std::string::npos, "Load error forwarded");
        return ok;
    }

    bool ExitWithoutResultIsUnexpected() {
        FakeKernel kernel(kEchoKernel);
        bool ok = true;

        Config clean = kernel.config();
        clean.workerExecutable = kernel.writeScriptWorker("exit 0");
        JobCoordinator cleanCoordinator(clean);
        JobOutcome cleanExit = cleanCoordinator.execute("cube(1);");
        ok &= ExpectKind(cleanExit, ErrorKind::WorkerExitedUnexpectedly, "Clean exit without a result");

        Config failing = kernel.config();
        failing.workerExecutable = kernel.writeScriptWorker("exit 3");
        JobCoordinator failingCoordinator(failing);
        JobOutcome failed = failingCoordinator.execute("cube(1);");
        ok &= ExpectKind(failed, ErrorKind::WorkerExitedUnexpectedly, "Nonzero exit");
        ok &= ExpectTrue(failed.message.find("status 3") != std::string::npos, "Exit status reported");

        Config signalled = kernel.config();
        signalled.workerExecutable = kernel.writeScriptWorker("kill -TERM $$");
        JobCoordinator signalledCoordinator(signalled);
        JobOutcome killed = signalledCoordinator.execute("cube(1);");
        ok &= ExpectKind(killed, ErrorKind::WorkerExitedUnexpectedly, "Killed by a signal");
        ok &= ExpectTrue(killed.message.find("signal") != std::string::npos, "Signal reported");
        return ok;
    }

    bool TerminalMessageBeforeExitWins() {
        FakeKernel kernel(kEchoKernel);
        Config config = kernel.config();
        config.workerExecutable = kernel.writeScriptWorker(
            "printf '%s\\n' '{\"type\":\"message\",\"data\":{\"error\":\"written before exit\"}}' >&3\nexit 0");
        JobCoordinator coordinator(config);
        JobOutcome outcome = coordinator.execute("cube(1);");
        bool ok = ExpectKind(outcome, ErrorKind::WorkerReportedError, "Buffered terminal frame is read first");
        ok &= ExpectTrue(outcome.message == "written before exit", "Message kept");
        return ok;
    }

    bool LoneSurrogateKernelErrorKeepsText() {
        // JSON.stringify writes unpaired surrogates as escapes
        FakeKernel kernel(kEchoKernel);
        Config config = kernel.config();
        config.workerExecutable = kernel.writeScriptWorker(
            "printf '%s\\n' '{\"type\":\"message\",\"data\":{\"error\":\"bad \\ud800 text\"}}' >&3\nexit 0");
        JobCoordinator coordinator(config);
        JobOutcome outcome = coordinator.execute("cube(1);");
        bool ok = ExpectKind(outcome, ErrorKind::WorkerReportedError, "Lone surrogate error still reported");
        ok &= ExpectTrue(outcome.message == "bad \xEF\xBF\xBD text", "Surrogate replaced, text kept: " + outcome.message);
        return ok;
    }

    bool EmptyOutputsAreNoOutput() {
        FakeKernel kernel(R"JS(
addEventListener('message', () => postMessage({ result: { outputs: [] } }));
)JS");
        JobCoordinator coordinator(kernel.config());
        JobOutcome outcome = coordinator.execute("cube(1);");
        return ExpectKind(outcome, ErrorKind::NoOutputProduced, "Empty output list");
    }

    bool FirstOutputIsTakenRegardlessOfPath() {
        FakeKernel kernel(R"JS(
addEventListener('message', () => postMessage({ result: { outputs: [
    ['model.stl', new TextEncoder().encode('first')],
    ['output.stl', new TextEncoder().encode('second')],
] } }));
)JS");
        JobCoordinator coordinator(kernel.config());
        JobOutcome outcome = coordinator.execute("cube(1);");
        bool ok = ExpectKind(outcome, ErrorKind::None, "Mismatched first output accepted");
        ok &= ExpectTrue(outcome.outputPath == "model.stl", "First path reported");
        ok &= ExpectTrue(AsText(outcome.bytes) == "first", "First bytes taken");
        return ok;
    }

    bool InvalidInputNeverSpawns() {
        FakeKernel kernel(kEchoKernel);
        Config config = kernel.config();
        config.maxScriptBytes = 64;
        JobCoordinator coordinator(config);

        bool ok = ExpectKind(coordinator.execute(""), ErrorKind::InvalidInput, "Empty script");
        ok &= ExpectKind(coordinator.execute(" \n\t "), ErrorKind::InvalidInput, "Whitespace script");
        ok &= ExpectKind(coordinator.execute(std::string("cube(1);\0", 9)), ErrorKind::InvalidInput, "NUL byte");
        ok &= ExpectKind(coordinator.execute("cube(\xFF);"), ErrorKind::InvalidInput, "Invalid UTF-8");
        ok &= ExpectKind(coordinator.execute(std::string(65, 'x')), ErrorKind::InvalidInput, "Too large");
        ok &= ExpectTrue(coordinator.spawnCount() == 0, "No worker spawned");
        return ok;
    }

    bool MissingInstallationIsConfigurationError() {
        bool ok = true;
        {
            FakeKernel kernel(kEchoKernel);
            fs::remove(kernel.dist() / "openscad-worker.js");
            JobCoordinator coordinator(kernel.config());
            JobOutcome outcome = coordinator.execute("cube(1);");
            ok &= ExpectKind(outcome, ErrorKind::ConfigurationError, "Missing kernel module");
            ok &= ExpectTrue(coordinator.spawnCount() == 0, "No spawn without kernel");
        }
        {
            FakeKernel kernel(kEchoKernel);
            fs::remove(kernel.dist() / "wasm" / "openscad.wasm");
            JobCoordinator coordinator(kernel.config());
            JobOutcome outcome = coordinator.execute("cube(1);");
            ok &= ExpectKind(outcome, ErrorKind::ConfigurationError, "Missing wasm asset");
            ok &= ExpectTrue(outcome.message.find("openscad.wasm") != std::string::npos, "Asset named");
        }
        {
            FakeKernel kernel(kEchoKernel);
            Config config = kernel.config();
            config.workerExecutable = (kernel.root / "no-such-worker").string();
            JobCoordinator coordinator(config);
            JobOutcome outcome = coordinator.execute("cube(1);");
            ok &= ExpectKind(outcome, ErrorKind::ConfigurationError, "Missing worker executable");
            ok &= ExpectTrue(outcome.workerPid == 0, "No process behind a failed spawn");
            ok &= ExpectTrue(coordinator.spawnCount() == 0 && coordinator.activeWorkers() == 0,
                             "Failed spawn is not counted");
        }
        return ok;
    }

    bool ConstructorLeavesSignalsAlone() {
        struct sigaction saved;
        struct sigaction defaults;
        ::sigemptyset(&defaults.sa_mask);
        defaults.sa_flags = 0;
        defaults.sa_handler = SIG_DFL;
        ::sigaction(SIGPIPE, &defaults, &saved);

        struct sigaction current;
        {
            FakeKernel kernel(kEchoKernel);
            JobCoordinator coordinator(kernel.config());
            ::sigaction(SIGPIPE, nullptr, &current);
        }
        ::sigaction(SIGPIPE, &saved, nullptr);
        return ExpectTrue(current.sa_handler == SIG_DFL, "SIGPIPE disposition unchanged by the coordinator");
    }

    bool RunsUseIndependentWorkers() {
        // Module-level state would leak between runs if a worker were reused
        FakeKernel kernel(R"JS(
let runs = 0;
addEventListener('message', (e) => {
    runs++;
    postMessage({ result: { outputs: [['output.stl', new TextEncoder().encode('run ' + runs + ' ' + e.data.inputs[0].content)]] } });
});
)JS");
        JobCoordinator coordinator(kernel.config());
        JobOutcome first = coordinator.execute("cube(1);");
        JobOutcome second = coordinator.execute("cube(1);");
        bool ok = ExpectKind(first, ErrorKind::None, "First run");
        ok &= ExpectKind(second, ErrorKind::None, "Second run");
        ok &= ExpectTrue(AsText(first.bytes) == "run 1 cube(1);", "First run output");
        ok &= ExpectTrue(AsText(second.bytes) == "run 1 cube(1);", "Second run starts fresh");
        ok &= ExpectTrue(first.workerPid != second.workerPid, "Different processes");
        ok &= ExpectTrue(coordinator.spawnCount() == 2, "Two workers spawned");
        return ok;
    }

    bool ConcurrentRunsDoNotInterfere() {
        FakeKernel kernel(kEchoKernel);
        JobCoordinator coordinator(kernel.config());
        JobOutcome a;
        JobOutcome b;
        std::thread left([&]() { a = coordinator.execute("cube(1);"); });
        std::thread right([&]() { b = coordinator.execute("sphere(2);"); });
        left.join();
        right.join();
        bool ok = ExpectKind(a, ErrorKind::None, "Left run");
        ok &= ExpectKind(b, ErrorKind::None, "Right run");
        ok &= ExpectTrue(AsText(a.bytes) == "solid cube(1);", "Left output");
        ok &= ExpectTrue(AsText(b.bytes) == "solid sphere(2);", "Right output");
        ok &= ExpectTrue(coordinator.activeWorkers() == 0, "All reaped");
        return ok;
    }

    bool ShimProvidesBrowserSurface() {
        // Exercises what the Emscripten loader touches, then reports as one result
        FakeKernel kernel(R"JS(
const checks = {};
let removedCalls = 0;
function removed() { removedCalls++; }
addEventListener('message', removed);
removeEventListener('message', removed);
addEventListener('message', async () => {
    checks.removedCalls = removedCalls;
    checks.importScripts = typeof importScripts === 'function';
    importScripts('helper.js');
    checks.helper = globalThis.helperValue === 42;

    const wasmUrl = new URL('wasm/openscad.wasm', location.href);
    checks.urlHref = wasmUrl.href;
    checks.urlPath = new URL('../dist/./x.js', 'https://h.invalid/a/b/c.js').pathname;

    const { instance, module } = await WebAssembly.instantiateStreaming(fetch(wasmUrl), {});
    checks.instantiated = instance instanceof WebAssembly.Instance && module instanceof WebAssembly.Module;

    const missing = await fetch('file:///nowhere/fonts.conf');
    checks.missingOk = missing.ok;
    checks.missingStatus = missing.status;
    checks.missingLength = (await missing.arrayBuffer()).byteLength;

    const wasmResponse = await fetch('openscad.wasm');
    const copy = wasmResponse.clone();
    checks.wasmLength = (await wasmResponse.arrayBuffer()).byteLength;
    checks.cloneLength = (await copy.blob()).size;

    checks.decoded = new TextDecoder().decode(new TextEncoder().encode('héllo'));
    await new Promise((resolve) => setTimeout(resolve, 2));
    checks.timer = true;

    postMessage({ result: { outputs: [['output.stl', JSON.stringify(checks)]] } });
});
)JS");
        WriteFile(kernel.dist() / "helper.js", "var helperValue = 42;\n");

        JobCoordinator coordinator(kernel.config());
        JobOutcome outcome = coordinator.execute("cube(1);");
        bool ok = ExpectKind(outcome, ErrorKind::None, "Browser-surface kernel succeeds");
        std::string report = AsText(outcome.bytes);
        auto has = [&report](const std::string &fragment) {
            return report.find(fragment) != std::string::npos;
        };
        ok &= ExpectTrue(has("\"importScripts\":true"), "importScripts present: " + report);
        ok &= ExpectTrue(has("\"removedCalls\":0"), "Removed listener never called");
        ok &= ExpectTrue(has("\"helper\":true"), "Imported script ran at global scope");
        ok &= ExpectTrue(has("\"urlHref\":\"https://scadhost.invalid/wasm/openscad.wasm\""), "URL resolved against location");
        ok &= ExpectTrue(has("\"urlPath\":\"/a/dist/x.js\""), "Dot segments collapsed");
        ok &= ExpectTrue(has("\"instantiated\":true"), "instantiateStreaming via buffer");
        ok &= ExpectTrue(has("\"missingOk\":true"), "Missing asset still ok");
        ok &= ExpectTrue(has("\"missingStatus\":200"), "Missing asset status");
        ok &= ExpectTrue(has("\"missingLength\":0"), "Missing asset is empty");
        ok &= ExpectTrue(has("\"wasmLength\":8"), "Asset bytes served");
        ok &= ExpectTrue(has("\"cloneLength\":8"), "Clone reads independently");
        ok &= ExpectTrue(has("\"decoded\":\"h\xC3\xA9llo\""), "UTF-8 text codec");
        ok &= ExpectTrue(has("\"timer\":true"), "setTimeout fires");
        return ok;
    }

    bool RenderServiceWrapsOutcome() {
        FakeKernel kernel(kEchoKernel);
        JobCoordinator coordinator(kernel.config());
        scadhost::service::RenderService service(coordinator);

        auto response = service.render("cube(2);");
        bool ok = ExpectTrue(static_cast<bool>(response), "Render succeeds");
        ok &= ExpectTrue(response.status() == 200, "Status 200");
        ok &= ExpectTrue(response.scriptText == "cube(2);", "Script echoed");

        auto rejected = service.render("");
        ok &= ExpectTrue(!rejected && rejected.status() == 400, "Empty script is a 400");
        return ok;
    }

    struct TestCase {
        const char *name;

        bool (*fn)();
    };
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);

    if (!fs::exists(SCADHOST_TEST_WORKER)) {
        std::cout << "Worker executable not found: " << SCADHOST_TEST_WORKER << std::endl;
        return 1;
    }

    std::vector<TestCase> tests{
        {"SuccessfulRunReturnsBytes", SuccessfulRunReturnsBytes},
        {"KernelErrorIsReportedVerbatim", KernelErrorIsReportedVerbatim},
        {"NonTerminalMessagesAreIgnored", NonTerminalMessagesAreIgnored},
        {"SilentKernelTimesOut", SilentKernelTimesOut},
        {"OneMillisecondDeadlineLeavesNoProcess", OneMillisecondDeadlineLeavesNoProcess},
        {"UncaughtHandlerErrorIsCrash", UncaughtHandlerErrorIsCrash},
        {"KernelLoadFailureIsCrash", KernelLoadFailureIsCrash},
        {"ExitWithoutResultIsUnexpected", ExitWithoutResultIsUnexpected},
        {"TerminalMessageBeforeExitWins", TerminalMessageBeforeExitWins},
        {"LoneSurrogateKernelErrorKeepsText", LoneSurrogateKernelErrorKeepsText},
        {"EmptyOutputsAreNoOutput", EmptyOutputsAreNoOutput},
        {"FirstOutputIsTakenRegardlessOfPath", FirstOutputIsTakenRegardlessOfPath},
        {"InvalidInputNeverSpawns", InvalidInputNeverSpawns},
        {"MissingInstallationIsConfigurationError", MissingInstallationIsConfigurationError},
        {"ConstructorLeavesSignalsAlone", ConstructorLeavesSignalsAlone},
        {"RunsUseIndependentWorkers", RunsUseIndependentWorkers},
        {"ConcurrentRunsDoNotInterfere", ConcurrentRunsDoNotInterfere},
        {"ShimProvidesBrowserSurface", ShimProvidesBrowserSurface},
        {"RenderServiceWrapsOutcome", RenderServiceWrapsOutcome}
    };

    std::size_t passed = 0;
    for (const auto &test: tests) {
        std::cout << "Running " << test.name << std::endl;
        if (test.fn()) {
            ++passed;
            std::cout << "  [PASS]" << std::endl;
        } else {
            std::cout << "  [FAIL]" << std::endl;
            std::cout << "Executed " << passed << " / " << tests.size() << " tests" << std::endl;
            return 1;
        }
    }

    std::cout << "Executed " << passed << " / " << tests.size() << " tests" << std::endl;
    return 0;
}
