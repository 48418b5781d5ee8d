#include "scadhost/js/engine.h"
#include <iostream>

namespace scadhost {
namespace js {

#if defined(SCADHOST_JS_V8)
std::unique_ptr<Engine> createV8Engine();
#endif

std::unique_ptr<Engine> createEngine() {
#if defined(SCADHOST_JS_V8)
    return createV8Engine();
#else
    std::cerr << "[JS] No JavaScript engine with WebAssembly support compiled in" << std::endl;
    return nullptr;
#endif
}

} // namespace js
} // namespace scadhost
