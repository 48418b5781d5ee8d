#pragma once

/**
 * AssetResponse - what the kernel's fetch() resolves to
 *
 * A body that can be read repeatedly, plus the status fields the kernel
 * inspects. Unresolved assets are ok() with an empty body; read failures
 * are !ok() with status 500.
 */

#include "scadhost/assets/asset_resolver.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace scadhost {
namespace assets {

class AssetResponse {
public:
    virtual ~AssetResponse() = default;

    virtual bool ok() const = 0;
    virtual int status() const = 0;
    virtual std::string statusText() const = 0;
    virtual std::string url() const = 0;
    virtual const std::vector<uint8_t>& body() const = 0;
    virtual std::string text() const = 0;
    virtual std::unique_ptr<AssetResponse> clone() const = 0;
};

/**
 * Filesystem-backed response built from an AssetLookup.
 */
class FileAssetResponse : public AssetResponse {
public:
    explicit FileAssetResponse(AssetLookup lookup);

    bool ok() const override;
    int status() const override;
    std::string statusText() const override;
    std::string url() const override { return lookup_.request; }
    const std::vector<uint8_t>& body() const override { return lookup_.bytes; }
    std::string text() const override;
    std::unique_ptr<AssetResponse> clone() const override;

private:
    AssetLookup lookup_;
};

} // namespace assets
} // namespace scadhost
