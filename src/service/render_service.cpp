#include "scadhost/service/render_service.h"
#include "scadhost/protocol/base64.h"
#include <iostream>

namespace scadhost {
namespace service {

const char* errorHeadline(protocol::ErrorKind kind) {
    switch (kind) {
        case protocol::ErrorKind::None: return "";
        case protocol::ErrorKind::InvalidInput: return "SCAD code is missing or invalid";
        case protocol::ErrorKind::ConfigurationError: return "OpenSCAD renderer is not installed";
        case protocol::ErrorKind::Timeout: return "Rendering timed out";
        case protocol::ErrorKind::WorkerReportedError: return "Failed to generate model";
        case protocol::ErrorKind::WorkerCrashed: return "Renderer crashed";
        case protocol::ErrorKind::WorkerExitedUnexpectedly: return "Renderer exited unexpectedly";
        case protocol::ErrorKind::NoOutputProduced: return "Failed to read generated model";
    }
    return "Internal server error during rendering";
}

protocol::JsonValue RenderResponse::toJson() const {
    protocol::JsonValue body = protocol::JsonValue::object();
    if (ok) {
        body.set("stlData", protocol::JsonValue::string(protocol::base64Encode(bytes)));
        body.set("scadCode", protocol::JsonValue::string(scriptText));
        return body;
    }
    body.set("error", protocol::JsonValue::string(errorHeadline(error)));
    body.set("kind", protocol::JsonValue::string(protocol::errorKindName(error)));
    body.set("details", protocol::JsonValue::string(message));
    return body;
}

RenderService::RenderService(job::JobCoordinator& coordinator) : coordinator_(coordinator) {}

RenderResponse RenderService::render(const std::string& scriptText) {
    RenderResponse response;
    response.scriptText = scriptText;

    job::JobOutcome outcome = coordinator_.execute(scriptText);
    if (outcome) {
        response.ok = true;
        response.bytes = std::move(outcome.bytes);
        std::cout << "[Render] " << response.bytes.size() << " bytes of STL" << std::endl;
    } else {
        response.error = outcome.error;
        response.message = std::move(outcome.message);
        std::cerr << "[Render] " << errorHeadline(response.error) << " ("
                  << protocol::errorKindName(response.error) << ", HTTP "
                  << response.status() << ")" << std::endl;
    }
    return response;
}

} // namespace service
} // namespace scadhost
