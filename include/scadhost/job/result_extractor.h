#pragma once

#include "scadhost/protocol/errors.h"
#include "scadhost/protocol/json.h"
#include <cstdint>
#include <string>
#include <vector>

namespace scadhost {
namespace job {

struct ExtractedOutput {
    bool ok = false;
    std::string path;
    std::vector<uint8_t> bytes;
    protocol::ErrorKind error = protocol::ErrorKind::None;
    std::string message;

    explicit operator bool() const noexcept { return ok; }
};

/**
 * ResultExtractor - turns a worker's {result: {outputs: [[path, bytes]...]}}
 * payload into one validated byte buffer.
 *
 * The first output is taken whatever its path; a mismatch with the
 * requested path is only logged. Anything unusable is NoOutputProduced.
 */
class ResultExtractor {
public:
    explicit ResultExtractor(std::string expectedPath);

    /**
     * @param result the value of the payload's "result" member
     */
    ExtractedOutput extract(const protocol::JsonValue& result) const;

    const std::string& expectedPath() const { return expectedPath_; }

private:
    std::string expectedPath_;
};

} // namespace job
} // namespace scadhost
