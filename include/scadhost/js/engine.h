/**
 * JavaScript Engine Abstraction
 *
 * The surface the worker environment needs to host the geometry kernel:
 * classic-script evaluation, value construction and inspection, native
 * callbacks and the pump for engine-queued work. The kernel is a
 * WebAssembly module with a JS loader, so an engine must ship WebAssembly
 * support; V8 is the only implementation compiled in.
 *
 * Handles returned by the engine are owned by the caller and released with
 * unprotect(). Handles passed into a NativeFunction are released by the
 * engine after the callback returns unless protect() was called on them.
 */

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <vector>
#include <cstdint>

namespace scadhost {
namespace js {

struct JSValueHandle {
    void* ptr = nullptr;
    void* ctx = nullptr;
};

using NativeFunction = std::function<JSValueHandle(void* ctx, const std::vector<JSValueHandle>& args)>;

// Level is one of "log", "info", "warn", "error", "debug"
using ConsoleSink = std::function<void(const std::string& level, const std::string& message)>;

class Engine {
public:
    virtual ~Engine() = default;

    virtual const char* getName() const = 0;

    // ========================================================================
    // Evaluation
    // ========================================================================

    /**
     * Evaluate a classic script at global scope.
     * @return false if it failed to compile or threw (see getException())
     */
    virtual bool evalScript(const std::string& code, const std::string& filename = "<eval>") = 0;

    // Completion value, or a null handle on error. Embedded NULs are kept.
    virtual JSValueHandle evalScriptWithResult(const std::string& code, const std::string& filename = "<eval>") = 0;

    /**
     * Run foreground platform tasks (asynchronous WebAssembly compilation
     * posts these), then a microtask checkpoint.
     * @return true if any platform task ran
     */
    virtual bool runPendingJobs() = 0;

    // ========================================================================
    // Values
    // ========================================================================

    virtual JSValueHandle newUndefined() = 0;
    virtual JSValueHandle newBoolean(bool value) = 0;
    virtual JSValueHandle newNumber(double value) = 0;
    virtual JSValueHandle newString(const std::string& value) = 0;
    virtual JSValueHandle newObject() = 0;

    // Bytes are copied
    virtual JSValueHandle newArrayBuffer(const uint8_t* data, size_t length) = 0;
    virtual JSValueHandle createUint8Array(const uint8_t* data, size_t count) = 0;

    /**
     * Backing bytes of an ArrayBuffer or view (offset applied for views).
     * nullptr with *size == 0 for anything else.
     */
    virtual void* getArrayBufferData(JSValueHandle value, size_t* size) = 0;

    virtual JSValueHandle newFunction(const char* name, NativeFunction fn) = 0;

    virtual bool toBoolean(JSValueHandle value) = 0;
    virtual double toNumber(JSValueHandle value) = 0;
    virtual std::string toString(JSValueHandle value) = 0;

    virtual bool isFunction(JSValueHandle value) = 0;

    // ========================================================================
    // Objects and calls
    // ========================================================================

    virtual bool setProperty(JSValueHandle obj, const char* name, JSValueHandle value) = 0;
    virtual JSValueHandle getProperty(JSValueHandle obj, const char* name) = 0;

    // Null handle if the callee threw or is not a function
    virtual JSValueHandle call(JSValueHandle func, JSValueHandle thisArg, const std::vector<JSValueHandle>& args) = 0;

    virtual void setPrivateData(JSValueHandle obj, void* data) = 0;
    virtual void* getPrivateData(JSValueHandle obj) = 0;

    // ========================================================================
    // Lifetime and errors
    // ========================================================================

    virtual void protect(JSValueHandle value) = 0;
    virtual void unprotect(JSValueHandle value) = 0;

    // Last exception message, cleared on read
    virtual std::string getException() = 0;

    virtual void throwException(const char* message) = 0;

    virtual void setConsoleSink(ConsoleSink sink) = 0;
};

/**
 * Create the engine compiled into this build.
 * Returns nullptr if none with WebAssembly support is available.
 */
std::unique_ptr<Engine> createEngine();

} // namespace js
} // namespace scadhost
