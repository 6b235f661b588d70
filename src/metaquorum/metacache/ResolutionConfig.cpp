#include "metaquorum/metacache/ResolutionConfig.hpp"
#include "core/JsonFields.hpp"
#include "log/TaggedLogger.hpp"

namespace MQ::MetaCache {

using JsonFields::Json;

auto ResolutionConfig::toParams() const -> MetadataResolutionParams {
    MetadataResolutionParams params;
    params.dirQuorum         = this->dirQuorum;
    params.objQuorum         = this->objQuorum;
    params.requestedVersions = this->requestedVersions;
    params.strict            = this->strict;
    params.bucket            = this->bucket;
    return params;
}

auto parseResolutionConfig(std::string_view text) -> Expected<ResolutionConfig> {
    auto json = JsonFields::parseObject(text, "resolution config");
    if (!json) {
        return std::unexpected(json.error());
    }
    ResolutionConfig config;
    auto             dirQuorum = JsonFields::readUint(*json, "dirQuorum", config.dirQuorum);
    if (!dirQuorum) {
        return std::unexpected(dirQuorum.error());
    }
    auto objQuorum = JsonFields::readUint(*json, "objQuorum", config.objQuorum);
    if (!objQuorum) {
        return std::unexpected(objQuorum.error());
    }
    auto requested = JsonFields::readUint(*json, "requestedVersions", config.requestedVersions);
    if (!requested) {
        return std::unexpected(requested.error());
    }
    auto strict = JsonFields::readBool(*json, "strict", config.strict);
    if (!strict) {
        return std::unexpected(strict.error());
    }
    auto bucket = JsonFields::readString(*json, "bucket", config.bucket);
    if (!bucket) {
        return std::unexpected(bucket.error());
    }
    config.dirQuorum         = static_cast<std::size_t>(*dirQuorum);
    config.objQuorum         = static_cast<std::size_t>(*objQuorum);
    config.requestedVersions = static_cast<std::size_t>(*requested);
    config.strict            = *strict;
    config.bucket            = std::move(*bucket);
    return config;
}

auto loadResolutionConfig(std::filesystem::path const& path) -> Expected<ResolutionConfig> {
    auto text = JsonFields::readFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    mq_log("loading resolution config from " + path.string(), "Config");
    return parseResolutionConfig(*text);
}

auto resolutionConfigToJson(ResolutionConfig const& config) -> std::string {
    Json json{{"dirQuorum", config.dirQuorum},
              {"objQuorum", config.objQuorum},
              {"requestedVersions", config.requestedVersions},
              {"strict", config.strict},
              {"bucket", config.bucket}};
    return json.dump(2);
}

} // namespace MQ::MetaCache
