#pragma once

/**
 * Runtime configuration
 *
 * Loaded from SCADHOST_* environment variables on top of compiled-in
 * defaults. Paths of the kernel bundle are derived from one root.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scadhost {

// Kernel install location - uses CMake-defined SCADHOST_DEFAULT_KERNEL_ROOT
#ifndef SCADHOST_DEFAULT_KERNEL_ROOT
#define SCADHOST_DEFAULT_KERNEL_ROOT "/usr/local/share/scadhost/kernel"
#endif

constexpr uint64_t kDefaultTimeoutMs = 120000;
constexpr size_t kDefaultMaxScriptBytes = 1024 * 1024;

constexpr const char* kKernelModuleName = "openscad-worker.js";
constexpr const char* kKernelWasmName = "openscad.wasm";
constexpr const char* kWorkerExecutableName = "scadhost-worker";

struct Config {
    uint64_t timeoutMs = kDefaultTimeoutMs;
    std::string kernelRoot = SCADHOST_DEFAULT_KERNEL_ROOT;
    std::string workerExecutable;
    size_t maxScriptBytes = kDefaultMaxScriptBytes;
    bool debug = false;

    /**
     * Defaults overridden by SCADHOST_RENDER_TIMEOUT_MS, SCADHOST_KERNEL_ROOT,
     * SCADHOST_WORKER, SCADHOST_MAX_SCRIPT_BYTES and SCADHOST_DEBUG.
     * Unparseable numbers are ignored with a warning.
     */
    static Config fromEnvironment();

    /**
     * Point every kernel path at one root (tests, --kernel-root).
     */
    void setKernelRoot(const std::string& root) { kernelRoot = root; }

    std::string kernelDistDir() const;   // <root>/openscad-playground/dist
    std::string kernelWasmDir() const;   // <root>/openscad-playground/dist/wasm
    std::string vfsDistDir() const;      // <root>/browserfs/dist
    std::string kernelModule() const;    // <kernelDistDir>/openscad-worker.js

    /**
     * Asset search order: kernel dist, kernel wasm, virtual-filesystem dist.
     */
    std::vector<std::string> assetSearchDirs() const;

    /**
     * Check that the kernel module, openscad.wasm (in any search dir) and
     * the worker executable exist.
     * @return false with a ConfigurationError message in error
     */
    bool validate(std::string& error) const;
};

/**
 * Default location of scadhost-worker: next to the running executable,
 * else the compiled-in install path.
 */
std::string defaultWorkerExecutable();

/**
 * Parse a positive decimal integer. Rejects signs, junk and overflow.
 */
bool parsePositiveInt(const std::string& text, uint64_t& out);

} // namespace scadhost
