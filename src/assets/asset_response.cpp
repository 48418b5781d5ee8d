#include "scadhost/assets/asset_response.h"

namespace scadhost {
namespace assets {

FileAssetResponse::FileAssetResponse(AssetLookup lookup)
    : lookup_(std::move(lookup)) {}

bool FileAssetResponse::ok() const {
    return lookup_.status != LookupStatus::IoError;
}

int FileAssetResponse::status() const {
    return ok() ? 200 : 500;
}

std::string FileAssetResponse::statusText() const {
    switch (lookup_.status) {
        case LookupStatus::Found:
            return "OK";
        case LookupStatus::NotFound:
            return "OK (empty: not found)";
        case LookupStatus::IoError:
            return lookup_.error;
    }
    return "";
}

std::string FileAssetResponse::text() const {
    return std::string(lookup_.bytes.begin(), lookup_.bytes.end());
}

std::unique_ptr<AssetResponse> FileAssetResponse::clone() const {
    return std::make_unique<FileAssetResponse>(lookup_);
}

} // namespace assets
} // namespace scadhost
