#pragma once

/**
 * Worker channel protocol
 *
 * Newline-delimited JSON envelopes on a private pipe (fd 3 in the worker):
 *   host -> worker: {"type":"message","data":<job request>}
 *   worker -> host: {"type":"message","data":<kernel payload>}
 *                   {"type":"error","message":"<uncaught fault>"}
 *
 * Binary values travel as {"$bytes":"<base64>"}.
 */

#include "scadhost/protocol/json.h"
#include <cstdint>
#include <string>
#include <vector>

namespace scadhost {
namespace protocol {

// Fixed virtual paths inside the kernel's private filesystem
constexpr const char* kInputPath = "input.scad";
constexpr const char* kOutputPath = "output.stl";
constexpr const char* kExportFormatArg = "--export-format=binstl";

constexpr const char* kBytesKey = "$bytes";

// Upper bound for a single frame; a binary STL for a large model stays well below
constexpr size_t kMaxFrameBytes = 512 * 1024 * 1024;

struct InputFile {
    std::string path;
    std::string content;
};

struct JobRequest {
    std::vector<InputFile> inputs;
    std::vector<std::string> args;
    std::vector<std::string> outputPaths;
};

/**
 * The one request shape this host sends: script at input.scad, binary STL
 * export to output.stl.
 */
JobRequest makeRenderRequest(const std::string& scriptText);

JsonValue requestToJson(const JobRequest& request);

enum class EnvelopeType {
    Message,
    Error
};

struct Envelope {
    EnvelopeType type = EnvelopeType::Message;
    JsonValue data;       // Message
    std::string message;  // Error
};

/**
 * Serialize an envelope, including the trailing newline.
 */
std::string frameMessage(const JsonValue& data);
std::string frameError(const std::string& message);

/**
 * Parse one line (without its newline) into an envelope.
 */
bool parseEnvelope(const std::string& line, Envelope& out, std::string& error);

enum class PayloadKind {
    Result,  // carries a "result" field
    Error,   // carries an "error" field
    Other    // progress, log lines, anything non-terminal
};

PayloadKind classifyPayload(const JsonValue& payload);

JsonValue bytesToJson(const uint8_t* data, size_t len);
bool isBytes(const JsonValue& value);
bool bytesFromJson(const JsonValue& value, std::vector<uint8_t>& out, std::string& error);

/**
 * Splits a byte stream into newline-terminated frames.
 */
class FrameReader {
public:
    void append(const char* data, size_t len);

    /**
     * Pop the next complete line (newline stripped).
     * @return false if no complete line is buffered
     */
    bool next(std::string& line);

    /**
     * True once the buffered partial frame exceeded kMaxFrameBytes.
     */
    bool overflowed() const { return overflowed_; }

    size_t pendingBytes() const { return buffer_.size(); }

private:
    std::string buffer_;
    size_t scanFrom_ = 0;
    bool overflowed_ = false;
};

} // namespace protocol
} // namespace scadhost
