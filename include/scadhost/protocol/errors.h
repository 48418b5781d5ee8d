#pragma once

#include <string>

namespace scadhost {
namespace protocol {

/**
 * Failure taxonomy for a compilation job.
 * Every job settles with exactly one of these (None on success).
 */
enum class ErrorKind {
    None,
    InvalidInput,              // empty or malformed script
    ConfigurationError,        // kernel module, assets or worker executable missing
    Timeout,                   // deadline exceeded
    WorkerReportedError,       // kernel reported a compile/geometry failure
    WorkerCrashed,             // uncaught fault inside the worker
    WorkerExitedUnexpectedly,  // process exit without a terminal message
    NoOutputProduced           // successful run with an empty or unusable output set
};

const char* errorKindName(ErrorKind kind);

/**
 * Inverse of errorKindName(). Returns false for unknown names.
 */
bool parseErrorKind(const std::string& name, ErrorKind& out);

/**
 * Caller-facing status: InvalidInput is a client error (400), every other
 * failure is a server error (500), success is 200.
 */
int httpStatusFor(ErrorKind kind);

} // namespace protocol
} // namespace scadhost
