#include "scadhost/protocol/errors.h"

namespace scadhost {
namespace protocol {

namespace {

struct KindName {
    ErrorKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {ErrorKind::None, "None"},
    {ErrorKind::InvalidInput, "InvalidInput"},
    {ErrorKind::ConfigurationError, "ConfigurationError"},
    {ErrorKind::Timeout, "Timeout"},
    {ErrorKind::WorkerReportedError, "WorkerReportedError"},
    {ErrorKind::WorkerCrashed, "WorkerCrashed"},
    {ErrorKind::WorkerExitedUnexpectedly, "WorkerExitedUnexpectedly"},
    {ErrorKind::NoOutputProduced, "NoOutputProduced"},
};

} // anonymous namespace

const char* errorKindName(ErrorKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "Unknown";
}

bool parseErrorKind(const std::string& name, ErrorKind& out) {
    for (const auto& entry : kKindNames) {
        if (name == entry.name) {
            out = entry.kind;
            return true;
        }
    }
    return false;
}

int httpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return 200;
        case ErrorKind::InvalidInput:
            return 400;
        default:
            return 500;
    }
}

} // namespace protocol
} // namespace scadhost
