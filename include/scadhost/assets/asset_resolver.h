#pragma once

/**
 * AssetResolver - maps kernel resource requests to files on disk
 *
 * The kernel asks for resources by URL or relative path ("openscad.wasm",
 * "file:///opt/kernel/openscad.wasm", "./fonts/x.ttf?v=2"). Only the final
 * path segment is significant; it is looked up in an ordered list of
 * candidate directories and the first regular file wins.
 *
 * Backing files never change at runtime, so one resolver can serve any
 * number of concurrent lookups.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace scadhost {
namespace assets {

enum class LookupStatus {
    Found,
    NotFound,  // no candidate matched; the caller serves an empty body
    IoError    // a candidate exists but could not be read
};

struct AssetLookup {
    LookupStatus status = LookupStatus::NotFound;
    std::string request;                  // as asked by the kernel
    std::string name;                     // logical resource name (final segment)
    std::string path;                     // file that matched or failed
    std::vector<uint8_t> bytes;           // Found only
    std::string error;                    // IoError only
    std::vector<std::string> candidates;  // every path tried, in order

    bool found() const { return status == LookupStatus::Found; }
};

class AssetResolver {
public:
    /**
     * @param searchDirs Candidate directories, searched in order
     */
    explicit AssetResolver(std::vector<std::string> searchDirs);

    /**
     * Resolve a request to bytes. Never throws; failures are reported
     * through the returned status.
     */
    AssetLookup lookup(const std::string& request) const;

    /**
     * Logical resource name for a request: scheme, query and fragment
     * stripped, separators normalised, trailing separators removed,
     * percent-escapes decoded, final segment taken.
     * Returns an empty string for names that cannot be served ("", ".", "..").
     */
    static std::string resourceName(const std::string& request);

    const std::vector<std::string>& searchDirs() const { return searchDirs_; }

    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    std::vector<std::string> searchDirs_;
    bool verbose_ = false;
};

} // namespace assets
} // namespace scadhost
