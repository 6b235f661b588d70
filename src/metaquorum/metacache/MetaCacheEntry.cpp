#include "metaquorum/metacache/MetaCacheEntry.hpp"

namespace MQ::MetaCache {
namespace {

[[nodiscard]] auto ends_with_separator(std::string_view name) -> bool {
    return name.ends_with(kSlashSeparator);
}

// Separator absent, or present only as the final character(s).
[[nodiscard]] auto at_most_trailing_separator(std::string_view rest, std::string_view separator) -> bool {
    auto const idx = rest.find(separator);
    return idx == std::string_view::npos || idx == rest.size() - separator.size();
}

} // namespace

auto MetaCacheEntry::isDir() const -> bool {
    return this->metadata.empty() && ends_with_separator(this->name);
}

auto MetaCacheEntry::isObjectDir() const -> bool {
    return !this->metadata.empty() && ends_with_separator(this->name);
}

auto MetaCacheEntry::isInDir(std::string_view dir, std::string_view separator) const -> bool {
    std::string_view const name{this->name};
    if (dir.empty()) {
        return at_most_trailing_separator(name, separator);
    }
    if (!name.starts_with(dir)) {
        return false;
    }
    return at_most_trailing_separator(name.substr(dir.size()), separator);
}

auto MetaCacheEntry::xlMeta() -> Meta::FileMeta const* {
    if (this->isDir()) {
        return nullptr;
    }
    if (this->cached) {
        return &*this->cached;
    }
    if (this->metadata.empty()) {
        return nullptr;
    }
    auto decoded = Meta::FileMeta::load(this->metadata);
    if (!decoded) {
        return nullptr;
    }
    this->cached = std::move(*decoded);
    return &*this->cached;
}

auto MetaCacheEntry::isLatestDeleteMarker() -> bool {
    if (this->cached) {
        return this->cached->versions.empty() || this->cached->versions.front().header.type == Meta::VersionType::Delete;
    }
    if (!Meta::FileMeta::isXl2V1Format(this->metadata)) {
        return false;
    }
    auto prefix = Meta::FileMeta::checkXl2V1(this->metadata);
    if (!prefix) {
        return true;
    }
    if (!prefix->payload.empty()) {
        return Meta::FileMeta::isLatestDeleteMarker(prefix->payload);
    }
    auto const* meta = this->xlMeta();
    if (meta == nullptr) {
        return true;
    }
    return meta->versions.empty() || meta->versions.front().header.type == Meta::VersionType::Delete;
}

auto MetaCacheEntry::matches(MetaCacheEntry& other, bool strict) -> std::pair<std::optional<MetaCacheEntry>, bool> {
    if (this->name != other.name) {
        if (this->name < other.name) {
            return {*this, false};
        }
        return {other, false};
    }

    if (other.isDir() || this->isDir()) {
        bool const bothDirs = other.isDir() == this->isDir();
        if (this->isDir()) {
            return {*this, bothDirs};
        }
        return {other, bothDirs};
    }

    auto const* mine   = this->xlMeta();
    auto const* theirs = other.xlMeta();
    if (mine == nullptr || theirs == nullptr) {
        return {std::nullopt, false};
    }

    if (mine->versions.size() != theirs->versions.size()) {
        auto const myLatest    = mine->latestModTime();
        auto const theirLatest = theirs->latestModTime();
        if (myLatest > theirLatest) {
            return {*this, false};
        }
        if (myLatest < theirLatest) {
            return {other, false};
        }
        if (mine->versions.size() > theirs->versions.size()) {
            return {*this, false};
        }
        return {other, false};
    }

    std::optional<MetaCacheEntry> prefer;
    for (std::size_t i = 0; i < mine->versions.size(); ++i) {
        auto const& a = mine->versions[i].header;
        auto const& b = theirs->versions[i].header;
        if (a == b) {
            continue;
        }
        // One side may have been written before its erasure layout was recorded.
        if (a.hasEc() != b.hasEc() && a.withoutEc() == b.withoutEc()) {
            continue;
        }
        if (!strict && a.matchesNotStrict(b)) {
            if (!prefer) {
                prefer = a.sortsBefore(b) ? *this : other;
            }
            continue;
        }
        if (prefer) {
            return {std::move(prefer), false};
        }
        if (a.sortsBefore(b)) {
            return {*this, false};
        }
        return {other, false};
    }

    if (!prefer) {
        prefer = *this;
    }
    return {std::move(prefer), true};
}

} // namespace MQ::MetaCache
