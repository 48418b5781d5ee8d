#pragma once

/**
 * RenderService - the boundary used by request handlers
 *
 * render(scriptText) runs one job and packages the outcome the way the
 * render endpoint answers: the STL as base64 next to the echoed script on
 * success, or an error headline, its kind and details on failure.
 */

#include "scadhost/job/job_coordinator.h"
#include "scadhost/protocol/errors.h"
#include "scadhost/protocol/json.h"
#include <cstdint>
#include <string>
#include <vector>

namespace scadhost {
namespace service {

struct RenderResponse {
    bool ok = false;
    std::vector<uint8_t> bytes;
    std::string scriptText;
    protocol::ErrorKind error = protocol::ErrorKind::None;
    std::string message;

    explicit operator bool() const noexcept { return ok; }

    /**
     * HTTP status for this response (200, 400 or 500).
     */
    int status() const { return httpStatus(error); }

    /**
     * {"stlData":"<base64>","scadCode":"..."} or
     * {"error":"...","kind":"...","details":"..."}
     */
    protocol::JsonValue toJson() const;

    static int httpStatus(protocol::ErrorKind kind) { return protocol::httpStatusFor(kind); }
};

class RenderService {
public:
    explicit RenderService(job::JobCoordinator& coordinator);

    RenderResponse render(const std::string& scriptText);

private:
    job::JobCoordinator& coordinator_;
};

/**
 * Short error headline shown to callers for a failure kind.
 */
const char* errorHeadline(protocol::ErrorKind kind);

} // namespace service
} // namespace scadhost
