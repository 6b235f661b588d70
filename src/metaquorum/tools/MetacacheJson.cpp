#include "tools/MetacacheJson.hpp"

#include <string>

namespace MQ::Tools {
namespace {

[[nodiscard]] auto entry_kind(MetaCache::MetaCacheEntry const& entry) -> char const* {
    if (entry.isDir()) {
        return "dir";
    }
    if (entry.isObjectDir()) {
        return "object_dir";
    }
    if (entry.isObject()) {
        return "object";
    }
    return "prefix";
}

} // namespace

auto versionHeaderToJson(Meta::VersionHeader const& header) -> nlohmann::json {
    return nlohmann::json{{"versionId", Meta::versionIdToString(header.versionId)},
                          {"modTime", header.modTime},
                          {"type", std::string{Meta::versionTypeToString(header.type)}},
                          {"flags", header.flags},
                          {"freeVersion", header.freeVersion()},
                          {"ecN", header.ecN},
                          {"ecM", header.ecM}};
}

auto entryToJson(MetaCache::MetaCacheEntry& entry, bool decode) -> nlohmann::json {
    nlohmann::json json{{"name", entry.name}, {"kind", entry_kind(entry)}, {"metadataSize", entry.metadata.size()}};
    if (entry.error) {
        json["error"] = describeError(*entry.error);
    }
    if (!decode || !entry.isObject()) {
        return json;
    }

    auto const* meta = entry.xlMeta();
    if (meta == nullptr) {
        json["decodeError"] = true;
        return json;
    }
    auto versions = nlohmann::json::array();
    for (auto const& version : meta->versions) {
        auto item        = versionHeaderToJson(version.header);
        item["metaSize"] = version.meta.size();
        versions.push_back(std::move(item));
    }
    json["metaVersion"]        = meta->metaVersion;
    json["versions"]           = std::move(versions);
    json["latestDeleteMarker"] = entry.isLatestDeleteMarker();
    return json;
}

} // namespace MQ::Tools
