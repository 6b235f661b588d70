#pragma once
#include "metaquorum/filemeta/FileMeta.hpp"
#include "metaquorum/metacache/MetaCacheEntry.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace MQ::Testing {

inline auto versionId(std::uint8_t tag) -> Meta::VersionId {
    Meta::VersionId id{};
    id.fill(tag);
    return id;
}

inline auto header(std::uint8_t      tag,
                   std::int64_t      modTime,
                   Meta::VersionType type  = Meta::VersionType::Object,
                   std::uint8_t      ecN   = 2,
                   std::uint8_t      ecM   = 2,
                   std::uint8_t      flags = 0) -> Meta::VersionHeader {
    Meta::VersionHeader h;
    h.versionId = versionId(tag);
    h.modTime   = modTime;
    h.signature = {tag, 0x01, 0x02, 0x03};
    h.type      = type;
    h.flags     = flags;
    h.ecN       = ecN;
    h.ecM       = ecM;
    return h;
}

inline auto version(Meta::VersionHeader h) -> Meta::ShallowVersion {
    return Meta::ShallowVersion{h, std::vector<std::byte>{std::byte{h.versionId[0]}, std::byte{0xee}}};
}

inline auto metaBytes(std::vector<Meta::VersionHeader> const& headers) -> std::vector<std::byte> {
    Meta::FileMeta meta;
    for (auto const& h : headers) {
        meta.versions.push_back(version(h));
    }
    auto bytes = meta.marshal();
    REQUIRE(bytes.has_value());
    return *bytes;
}

inline auto objectEntry(std::string name, std::vector<Meta::VersionHeader> const& headers) -> MetaCache::MetaCacheEntry {
    MetaCache::MetaCacheEntry entry;
    entry.name     = std::move(name);
    entry.metadata = metaBytes(headers);
    return entry;
}

inline auto dirEntry(std::string name) -> MetaCache::MetaCacheEntry {
    MetaCache::MetaCacheEntry entry;
    entry.name = std::move(name);
    return entry;
}

inline auto asBytes(std::initializer_list<unsigned> values) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    for (auto v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

} // namespace MQ::Testing
