#pragma once
#include "metaquorum/metacache/MetaCacheEntry.hpp"

#include <nlohmann/json.hpp>

namespace MQ::Tools {

// JSON view of an entry for the inspection tools. With `decode` the version headers are listed.
[[nodiscard]] auto entryToJson(MetaCache::MetaCacheEntry& entry, bool decode) -> nlohmann::json;

[[nodiscard]] auto versionHeaderToJson(Meta::VersionHeader const& header) -> nlohmann::json;

} // namespace MQ::Tools
