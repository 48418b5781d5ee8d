/**
 * scadhost-worker
 *
 * One process per compilation job. Loads the geometry kernel into a fresh
 * V8 isolate behind the worker environment shim and bridges it to the host
 * over an inherited channel descriptor.
 *
 * Usage (spawned by the job coordinator, not meant for humans):
 *   scadhost-worker --channel-fd 3 --kernel <openscad-worker.js>
 *                   --asset-dir <dir> [--asset-dir <dir> ...] [--debug]
 *
 * Exit codes: 0 after a terminal message was flushed, 1 on a fault or a
 * lost host, 2 on bad arguments.
 */

#include "scadhost/assets/asset_resolver.h"
#include "scadhost/async/event_loop.h"
#include "scadhost/js/engine.h"
#include "scadhost/shim/message_port.h"
#include "scadhost/shim/worker_environment.h"
#include "scadhost/version.h"
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

struct WorkerOptions {
    int channelFd = 3;
    std::string kernelPath;
    std::vector<std::string> assetDirs;
    bool debug = false;
    bool showVersion = false;
};

static bool parseArgs(int argc, char* argv[], WorkerOptions& opts, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--channel-fd" && i + 1 < argc) {
            try {
                opts.channelFd = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                error = std::string("Invalid --channel-fd: ") + argv[i];
                return false;
            }
        } else if (arg == "--kernel" && i + 1 < argc) {
            opts.kernelPath = argv[++i];
        } else if (arg == "--asset-dir" && i + 1 < argc) {
            opts.assetDirs.push_back(argv[++i]);
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--version" || arg == "-v") {
            opts.showVersion = true;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }

    if (!opts.showVersion && opts.kernelPath.empty()) {
        error = "Missing --kernel";
        return false;
    }
    return true;
}

static bool readTextFile(const std::string& path, std::string& out, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "Cannot open kernel module: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

int main(int argc, char* argv[]) {
    WorkerOptions opts;
    std::string error;
    if (!parseArgs(argc, argv, opts, error)) {
        std::cerr << "[Worker] " << error << std::endl;
        return 2;
    }

    if (opts.showVersion) {
        std::cout << "scadhost-worker v" << SCADHOST_VERSION << std::endl;
        return 0;
    }

    // Writes to a vanished host fail with EPIPE instead
    std::signal(SIGPIPE, SIG_IGN);

    scadhost::async::EventLoop loop;
    if (!loop.init()) {
        return 1;
    }

    scadhost::shim::MessagePort port(loop);
    if (!port.open(opts.channelFd, error)) {
        std::cerr << "[Worker] " << error << std::endl;
        return 1;
    }

    auto engine = scadhost::js::createEngine();
    if (!engine) {
        port.postError("No JavaScript engine available in worker");
        while (port.hasPendingWrites()) {
            loop.runOnce();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return 1;
    }
    engine->setConsoleSink([](const std::string& level, const std::string& message) {
        std::ostream& out = (level == "error" || level == "warn") ? std::cerr : std::cout;
        out << "[kernel:" << level << "] " << message << std::endl;
    });

    scadhost::assets::AssetResolver resolver(opts.assetDirs);
    resolver.setVerbose(opts.debug);

    scadhost::shim::EnvironmentOptions envOptions;
    envOptions.verbose = opts.debug;

    int exitCode = 0;
    {
        scadhost::shim::WorkerEnvironment env(*engine, loop, resolver, port, envOptions);

        std::string kernelSource;
        if (!readTextFile(opts.kernelPath, kernelSource, error)) {
            env.reportFault(error);
        } else if (!env.install(error)) {
            env.reportFault(error);
        } else {
            // A load failure has already been reported on the channel
            env.loadKernel(kernelSource, opts.kernelPath, error);
        }

        if (opts.debug) {
            std::cout << "[Worker] pid " << getpid() << " ready (" << engine->getName() << ")" << std::endl;
        }

        auto deliver = [&env](const scadhost::protocol::Envelope& envelope) {
            env.deliver(envelope);
        };

        while (true) {
            loop.runOnce();

            bool busy = port.processInbound(deliver);
            if (env.processPending()) {
                busy = true;
            }
            if (engine->runPendingJobs()) {
                busy = true;
            }

            // Done once the terminal frame has left the process
            if (env.terminalPosted() && !port.hasPendingWrites()) {
                break;
            }

            if (port.isEof() && !env.terminalPosted()) {
                std::cerr << "[Worker] Host closed the channel before a result was produced" << std::endl;
                exitCode = 1;
                break;
            }

            if (!busy) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }

        if (env.faulted()) {
            exitCode = 1;
        }
        env.shutdown();
        port.close();
        // Let libuv finish closing timers and the channel while env is alive
        loop.shutdown();
    }

    if (opts.debug) {
        std::cout << "[Worker] exiting with code " << exitCode << std::endl;
    }
    return exitCode;
}
