/**
 * scadhost CLI
 *
 * Command-line interface for rendering OpenSCAD scripts to binary STL in a
 * sandboxed worker process.
 *
 * Usage:
 *   scadhost render <model.scad> [-o out.stl]   Render a script file
 *   scadhost render - --json                    Render stdin, print JSON body
 *   scadhost check                              Validate the installation
 *   scadhost --version                          Show version information
 *   scadhost --help                             Show help
 */

#include "scadhost/config.h"
#include "scadhost/job/job_coordinator.h"
#include "scadhost/protocol/json.h"
#include "scadhost/service/render_service.h"
#include "scadhost/version.h"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

void printVersion() {
    std::cout << "scadhost v" << scadhost::getVersion() << std::endl;
    std::cout << "Sandboxed OpenSCAD renderer - " << scadhost::getJSEngine() << " + WebAssembly build" << std::endl;
}

void printHelp() {
    std::cout << R"(
scadhost - Sandboxed OpenSCAD renderer

USAGE:
    scadhost render <model.scad> [options]    Render a script to binary STL
    scadhost render - [options]               Read the script from stdin
    scadhost check                            Check the kernel and worker installation
    scadhost --version                        Show version information
    scadhost --help                           Show this help message

RENDER OPTIONS:
    --output, -o <file>   Output STL path (default: <model>.stl, or output.stl for stdin)
    --timeout <ms>        Render deadline in milliseconds (default: 120000)
    --kernel-root <dir>   Directory holding openscad-playground/ and browserfs/
    --json                Print the render response as JSON instead of writing a file
    --debug               Verbose logging from the host and the worker

EXIT CODES:
    0    Rendered successfully
    1    Rendering failed (timeout, kernel error, crash, missing installation)
    2    The script was empty or malformed

EXAMPLES:
    scadhost render box.scad                          # Writes box.stl
    scadhost render box.scad -o /tmp/box.stl --timeout 30000
    echo 'cube([10,10,10]);' | scadhost render - --json

ENVIRONMENT:
    SCADHOST_RENDER_TIMEOUT_MS=<ms>   Render deadline (default: 120000)
    SCADHOST_KERNEL_ROOT=<dir>        Kernel bundle root
    SCADHOST_WORKER=<path>            scadhost-worker executable
    SCADHOST_MAX_SCRIPT_BYTES=<n>     Largest accepted script (default: 1048576)
    SCADHOST_DEBUG=1                  Enable verbose debug logging

)" << std::endl;
}

bool readScript(const std::string& path, std::string& out, std::string& error) {
    if (path == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        out = buffer.str();
        return true;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

bool writeFile(const std::string& path, const std::vector<uint8_t>& data, std::string& error) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        error = "Cannot create file: " + path;
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        error = "Failed writing " + path;
        return false;
    }
    return true;
}

struct CLIOptions {
    std::string command;
    std::string scriptPath;
    std::string outputPath;
    std::string kernelRoot;
    uint64_t timeoutMs = 0;  // 0 = from config
    bool json = false;
    bool debug = false;
    bool showHelp = false;
    bool showVersion = false;
    std::string error;
};

CLIOptions parseArgs(int argc, char* argv[]) {
    CLIOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
        } else if (arg == "--version" || arg == "-v") {
            opts.showVersion = true;
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            opts.outputPath = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!scadhost::parsePositiveInt(value, opts.timeoutMs)) {
                opts.error = "Invalid --timeout: " + value;
            }
        } else if (arg == "--kernel-root" && i + 1 < argc) {
            opts.kernelRoot = argv[++i];
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if ((arg == "render" || arg == "check") && opts.command.empty()) {
            opts.command = arg;
        } else if (opts.command == "render" && opts.scriptPath.empty() &&
                   (arg == "-" || arg[0] != '-')) {
            opts.scriptPath = arg;
        } else {
            opts.error = "Unknown argument: " + arg;
        }
    }

    return opts;
}

scadhost::Config buildConfig(const CLIOptions& opts) {
    scadhost::Config config = scadhost::Config::fromEnvironment();
    if (!opts.kernelRoot.empty()) {
        config.setKernelRoot(opts.kernelRoot);
    }
    if (opts.timeoutMs > 0) {
        config.timeoutMs = opts.timeoutMs;
    }
    if (opts.debug) {
        config.debug = true;
    }
    return config;
}

int checkInstallation(const CLIOptions& opts) {
    scadhost::Config config = buildConfig(opts);

    std::cout << "Kernel module: " << config.kernelModule() << std::endl;
    for (const auto& dir : config.assetSearchDirs()) {
        std::cout << "Asset dir:     " << dir << std::endl;
    }
    std::cout << "Worker:        " << config.workerExecutable << std::endl;
    std::cout << "Timeout:       " << config.timeoutMs << " ms" << std::endl;

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    std::cout << "Installation OK" << std::endl;
    return 0;
}

std::string defaultOutputPath(const std::string& scriptPath) {
    if (scriptPath == "-") {
        return scadhost::protocol::kOutputPath;
    }
    std::filesystem::path path(scriptPath);
    path.replace_extension(".stl");
    return path.string();
}

int renderScript(const CLIOptions& opts) {
    std::string scriptText;
    std::string error;
    if (!readScript(opts.scriptPath, scriptText, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    scadhost::job::JobCoordinator coordinator(buildConfig(opts));
    scadhost::service::RenderService service(coordinator);
    scadhost::service::RenderResponse response = service.render(scriptText);

    if (opts.json) {
        std::cout << scadhost::protocol::writeJson(response.toJson()) << std::endl;
    } else if (response) {
        std::string outputPath = opts.outputPath.empty() ? defaultOutputPath(opts.scriptPath) : opts.outputPath;
        if (!writeFile(outputPath, response.bytes, error)) {
            std::cerr << "Error: " << error << std::endl;
            return 1;
        }
        std::cout << "Wrote " << response.bytes.size() << " bytes to " << outputPath << std::endl;
    } else {
        std::cerr << "Error: " << scadhost::service::errorHeadline(response.error) << std::endl;
        if (!response.message.empty()) {
            std::cerr << response.message << std::endl;
        }
    }

    if (response) {
        return 0;
    }
    return response.error == scadhost::protocol::ErrorKind::InvalidInput ? 2 : 1;
}

int main(int argc, char* argv[]) {
    // A worker that dies mid-write must surface as EPIPE, not kill the host
    std::signal(SIGPIPE, SIG_IGN);

    CLIOptions opts = parseArgs(argc, argv);

    // Handle --version
    if (opts.showVersion) {
        printVersion();
        return 0;
    }

    // Handle --help
    if (opts.showHelp) {
        printHelp();
        return 0;
    }

    if (!opts.error.empty()) {
        std::cerr << "Error: " << opts.error << std::endl;
        printHelp();
        return 1;
    }

    if (opts.command.empty()) {
        printHelp();
        return 1;
    }

    if (opts.command == "check") {
        return checkInstallation(opts);
    }

    // Handle 'render' command
    if (opts.scriptPath.empty()) {
        std::cerr << "Error: No script file specified." << std::endl;
        std::cerr << "Usage: scadhost render <model.scad>" << std::endl;
        return 1;
    }
    return renderScript(opts);
}
