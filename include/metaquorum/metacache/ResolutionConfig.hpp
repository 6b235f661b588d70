#pragma once
#include "metaquorum/core/Error.hpp"
#include "metaquorum/metacache/MetaCacheEntries.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace MQ::MetaCache {

/*
 * Quorum settings for resolving a listing, as stored in JSON:
 *   {"dirQuorum": 2, "objQuorum": 2, "requestedVersions": 0, "strict": false, "bucket": "photos"}
 * Every key is optional.
 */
struct ResolutionConfig {
    std::size_t dirQuorum         = 1;
    std::size_t objQuorum         = 1;
    std::size_t requestedVersions = 0;
    bool        strict            = false;
    std::string bucket;

    [[nodiscard]] auto toParams() const -> MetadataResolutionParams;

    auto operator==(ResolutionConfig const&) const -> bool = default;
};

[[nodiscard]] auto parseResolutionConfig(std::string_view json) -> Expected<ResolutionConfig>;
[[nodiscard]] auto loadResolutionConfig(std::filesystem::path const& path) -> Expected<ResolutionConfig>;
[[nodiscard]] auto resolutionConfigToJson(ResolutionConfig const& config) -> std::string;

} // namespace MQ::MetaCache
