#include "scadhost/config.h"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>

namespace fs = std::filesystem;

#ifndef SCADHOST_DEFAULT_WORKER
#define SCADHOST_DEFAULT_WORKER "/usr/local/libexec/scadhost-worker"
#endif

namespace scadhost {

namespace {

const char* envValue(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

bool envFlag(const char* name) {
    const char* value = envValue(name);
    if (!value) {
        return false;
    }
    std::string v = value;
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

bool isRegularFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // anonymous namespace

bool parsePositiveInt(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 19) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value == 0) {
        return false;
    }
    out = value;
    return true;
}

Config Config::fromEnvironment() {
    Config config;

    if (const char* timeout = envValue("SCADHOST_RENDER_TIMEOUT_MS")) {
        uint64_t value = 0;
        if (parsePositiveInt(timeout, value)) {
            config.timeoutMs = value;
        } else {
            std::cerr << "[Config] Ignoring invalid SCADHOST_RENDER_TIMEOUT_MS=\"" << timeout
                      << "\" (using " << config.timeoutMs << ")" << std::endl;
        }
    }

    if (const char* root = envValue("SCADHOST_KERNEL_ROOT")) {
        config.kernelRoot = root;
    }

    if (const char* worker = envValue("SCADHOST_WORKER")) {
        config.workerExecutable = worker;
    } else {
        config.workerExecutable = defaultWorkerExecutable();
    }

    if (const char* maxBytes = envValue("SCADHOST_MAX_SCRIPT_BYTES")) {
        uint64_t value = 0;
        if (parsePositiveInt(maxBytes, value) && value <= std::numeric_limits<size_t>::max()) {
            config.maxScriptBytes = static_cast<size_t>(value);
        } else {
            std::cerr << "[Config] Ignoring invalid SCADHOST_MAX_SCRIPT_BYTES=\"" << maxBytes
                      << "\" (using " << config.maxScriptBytes << ")" << std::endl;
        }
    }

    config.debug = envFlag("SCADHOST_DEBUG");
    return config;
}

std::string Config::kernelDistDir() const {
    return (fs::path(kernelRoot) / "openscad-playground" / "dist").string();
}

std::string Config::kernelWasmDir() const {
    return (fs::path(kernelDistDir()) / "wasm").string();
}

std::string Config::vfsDistDir() const {
    return (fs::path(kernelRoot) / "browserfs" / "dist").string();
}

std::string Config::kernelModule() const {
    return (fs::path(kernelDistDir()) / kKernelModuleName).string();
}

std::vector<std::string> Config::assetSearchDirs() const {
    return {kernelDistDir(), kernelWasmDir(), vfsDistDir()};
}

bool Config::validate(std::string& error) const {
    if (!isRegularFile(kernelModule())) {
        error = "Kernel module not found: " + kernelModule();
        return false;
    }

    bool haveWasm = false;
    for (const auto& dir : assetSearchDirs()) {
        if (isRegularFile(fs::path(dir) / kKernelWasmName)) {
            haveWasm = true;
            break;
        }
    }
    if (!haveWasm) {
        error = std::string("Kernel asset ") + kKernelWasmName + " not found under " + kernelDistDir();
        return false;
    }

    if (workerExecutable.empty() || !isRegularFile(workerExecutable)) {
        error = "Worker executable not found: " +
                (workerExecutable.empty() ? std::string("<unset>") : workerExecutable);
        return false;
    }
    return true;
}

std::string defaultWorkerExecutable() {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        fs::path sibling = self.parent_path() / kWorkerExecutableName;
        if (isRegularFile(sibling)) {
            return sibling.string();
        }
    }
    return SCADHOST_DEFAULT_WORKER;
}

} // namespace scadhost
