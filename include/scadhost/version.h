#pragma once

namespace scadhost {

// Version info - uses CMake-defined SCADHOST_VERSION
#ifndef SCADHOST_VERSION
#define SCADHOST_VERSION "0.1.0"
#endif

inline const char* getVersion() {
    return SCADHOST_VERSION;
}

// Build configuration - uses CMake-defined values
#ifndef SCADHOST_JS_ENGINE
#define SCADHOST_JS_ENGINE "v8"
#endif

inline const char* getJSEngine() {
    return SCADHOST_JS_ENGINE;
}

} // namespace scadhost
