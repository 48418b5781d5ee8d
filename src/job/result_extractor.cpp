#include "scadhost/job/result_extractor.h"
#include "scadhost/protocol/messages.h"
#include <iostream>

namespace scadhost {
namespace job {

namespace {

ExtractedOutput noOutput(const std::string& message) {
    ExtractedOutput out;
    out.error = protocol::ErrorKind::NoOutputProduced;
    out.message = message;
    return out;
}

} // namespace

ResultExtractor::ResultExtractor(std::string expectedPath)
    : expectedPath_(std::move(expectedPath)) {}

ExtractedOutput ResultExtractor::extract(const protocol::JsonValue& result) const {
    const protocol::JsonValue* outputs = result.find("outputs");
    if (!outputs) {
        return noOutput("Worker result has no outputs");
    }
    if (!outputs->isArray()) {
        return noOutput("Worker result outputs is not a list");
    }
    if (outputs->arrayVal.empty()) {
        return noOutput("Worker produced no output files");
    }

    const protocol::JsonValue& first = outputs->arrayVal.front();
    if (!first.isArray() || first.arrayVal.size() < 2 || !first.arrayVal[0].isString()) {
        return noOutput("First output is not a [path, bytes] pair");
    }

    ExtractedOutput out;
    out.path = first.arrayVal[0].stringVal;
    const protocol::JsonValue& content = first.arrayVal[1];

    if (protocol::isBytes(content)) {
        std::string error;
        if (!protocol::bytesFromJson(content, out.bytes, error)) {
            return noOutput("Output " + out.path + " is not decodable: " + error);
        }
    } else if (content.isString()) {
        // Text exports arrive as plain strings
        out.bytes.assign(content.stringVal.begin(), content.stringVal.end());
    } else {
        return noOutput("Output " + out.path + " carries no byte buffer");
    }

    if (out.bytes.empty()) {
        return noOutput("Output " + out.path + " is empty");
    }

    if (out.path != expectedPath_) {
        std::cerr << "[Job] Warning: first output is " << out.path
                  << ", requested " << expectedPath_ << "; using it anyway" << std::endl;
    }
    if (outputs->arrayVal.size() > 1) {
        std::cout << "[Job] Ignoring " << (outputs->arrayVal.size() - 1)
                  << " additional output(s)" << std::endl;
    }

    out.ok = true;
    return out;
}

} // namespace job
} // namespace scadhost
