#include "scadhost/protocol/messages.h"
#include "scadhost/protocol/base64.h"

namespace scadhost {
namespace protocol {

JobRequest makeRenderRequest(const std::string& scriptText) {
    JobRequest request;
    request.inputs.push_back({kInputPath, scriptText});
    request.args = {kInputPath, "-o", kOutputPath, kExportFormatArg};
    request.outputPaths = {kOutputPath};
    return request;
}

JsonValue requestToJson(const JobRequest& request) {
    JsonValue inputs = JsonValue::array();
    for (const auto& input : request.inputs) {
        JsonValue file = JsonValue::object();
        file.set("path", JsonValue::string(input.path));
        file.set("content", JsonValue::string(input.content));
        inputs.push(std::move(file));
    }

    JsonValue args = JsonValue::array();
    for (const auto& arg : request.args) {
        args.push(JsonValue::string(arg));
    }

    JsonValue outputPaths = JsonValue::array();
    for (const auto& path : request.outputPaths) {
        outputPaths.push(JsonValue::string(path));
    }

    JsonValue root = JsonValue::object();
    root.set("inputs", std::move(inputs));
    root.set("args", std::move(args));
    root.set("outputPaths", std::move(outputPaths));
    return root;
}

std::string frameMessage(const JsonValue& data) {
    JsonValue envelope = JsonValue::object();
    envelope.set("type", JsonValue::string("message"));
    envelope.set("data", data);
    return writeJson(envelope) + "\n";
}

std::string frameError(const std::string& message) {
    JsonValue envelope = JsonValue::object();
    envelope.set("type", JsonValue::string("error"));
    envelope.set("message", JsonValue::string(message));
    return writeJson(envelope) + "\n";
}

bool parseEnvelope(const std::string& line, Envelope& out, std::string& error) {
    JsonValue root;
    if (!parseJson(line, root, error)) {
        return false;
    }
    const JsonValue* type = root.find("type");
    if (!type || !type->isString()) {
        error = "Envelope has no type";
        return false;
    }

    if (type->stringVal == "message") {
        out.type = EnvelopeType::Message;
        const JsonValue* data = root.find("data");
        out.data = data ? *data : JsonValue::null();
        return true;
    }
    if (type->stringVal == "error") {
        out.type = EnvelopeType::Error;
        const JsonValue* message = root.find("message");
        out.message = (message && message->isString()) ? message->stringVal : "Unknown worker error";
        return true;
    }

    error = "Unknown envelope type: " + type->stringVal;
    return false;
}

PayloadKind classifyPayload(const JsonValue& payload) {
    if (!payload.isObject()) {
        return PayloadKind::Other;
    }
    if (payload.has("result")) {
        return PayloadKind::Result;
    }
    if (payload.has("error")) {
        return PayloadKind::Error;
    }
    return PayloadKind::Other;
}

JsonValue bytesToJson(const uint8_t* data, size_t len) {
    JsonValue value = JsonValue::object();
    value.set(kBytesKey, JsonValue::string(base64Encode(data, len)));
    return value;
}

bool isBytes(const JsonValue& value) {
    const JsonValue* encoded = value.find(kBytesKey);
    return encoded && encoded->isString() && value.objectVal.size() == 1;
}

bool bytesFromJson(const JsonValue& value, std::vector<uint8_t>& out, std::string& error) {
    if (!isBytes(value)) {
        error = "Value is not a byte buffer";
        return false;
    }
    return base64Decode(value.find(kBytesKey)->stringVal, out, error);
}

void FrameReader::append(const char* data, size_t len) {
    buffer_.append(data, len);
    if (buffer_.size() > kMaxFrameBytes && buffer_.find('\n', scanFrom_) == std::string::npos) {
        overflowed_ = true;
    }
}

bool FrameReader::next(std::string& line) {
    size_t newline = buffer_.find('\n', scanFrom_);
    if (newline == std::string::npos) {
        scanFrom_ = buffer_.size();
        return false;
    }
    line.assign(buffer_, 0, newline);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    buffer_.erase(0, newline + 1);
    scanFrom_ = 0;
    return true;
}

} // namespace protocol
} // namespace scadhost
