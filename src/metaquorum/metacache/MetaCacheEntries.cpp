#include "metaquorum/metacache/MetaCacheEntries.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace MQ::MetaCache {

auto MetaCacheEntries::resolve(MetadataResolutionParams& params) const -> std::optional<MetaCacheEntry> {
    if (this->slots_.empty()) {
        mq_log("resolve: no slots", "MetaCacheResolve");
        return std::nullopt;
    }

    params.candidates.clear();
    params.stats = {};
    auto& stats  = params.stats;

    std::optional<MetaCacheEntry> selected;
    for (auto const& slot : this->slots_) {
        if (!slot || slot->name.empty()) {
            continue;
        }
        auto entry = *slot;

        if (entry.isDir()) {
            ++stats.dirExists;
            selected = std::move(entry);
            continue;
        }

        auto const* meta = entry.xlMeta();
        if (meta == nullptr) {
            mq_log("resolve: undecodable metadata for " + entry.name, "MetaCacheResolve");
            continue;
        }
        ++stats.objsValid;
        params.candidates.push_back(meta->versions);

        if (!selected) {
            selected        = std::move(entry);
            stats.objsAgree = 1;
            continue;
        }

        auto [preferred, agree] = entry.matches(*selected, params.strict);
        if (agree) {
            selected = std::move(preferred);
            ++stats.objsAgree;
        }
    }

    if (!selected) {
        mq_log("resolve: nothing selected", "MetaCacheResolve");
        return std::nullopt;
    }

    if (selected->isDir()) {
        if (stats.dirExists >= params.dirQuorum) {
            return selected;
        }
        mq_log("resolve: directory " + selected->name + " below quorum " + std::to_string(stats.dirExists) + " < "
                   + std::to_string(params.dirQuorum),
               "MetaCacheResolve");
        return std::nullopt;
    }

    if (stats.objsValid < params.objQuorum) {
        mq_log("resolve: " + selected->name + " has too few valid objects " + std::to_string(stats.objsValid) + " < "
                   + std::to_string(params.objQuorum),
               "MetaCacheResolve");
        return std::nullopt;
    }

    if (stats.objsAgree == stats.objsValid) {
        return selected;
    }

    if (!selected->cached) {
        mq_log("resolve: selected " + selected->name + " has no decoded versions", "MetaCacheResolve");
        return std::nullopt;
    }

    auto versions = params.merge(params.objQuorum, params.strict, params.requestedVersions, params.candidates);
    if (versions.empty()) {
        mq_log("resolve: merge of " + selected->name + " produced no versions", "MetaCacheResolve");
        return std::nullopt;
    }

    Meta::FileMeta merged{.metaVersion = selected->cached->metaVersion, .versions = std::move(versions)};
    auto           metadata = merged.marshal();
    if (!metadata) {
        mq_log("resolve: re-encoding " + selected->name + " failed: " + describeError(metadata.error()), "MetaCacheResolve");
        return std::nullopt;
    }

    MetaCacheEntry canonical;
    canonical.name     = selected->name;
    canonical.metadata = std::move(*metadata);
    canonical.cached   = std::move(merged);
    canonical.reusable = true;
    return canonical;
}

auto MetaCacheEntries::firstFound() const -> std::pair<std::optional<MetaCacheEntry>, std::size_t> {
    auto it = std::find_if(this->slots_.begin(), this->slots_.end(), [](auto const& slot) { return slot.has_value(); });
    if (it == this->slots_.end()) {
        return {std::nullopt, this->slots_.size()};
    }
    return {*it, this->slots_.size()};
}

auto MetaCacheEntriesSorted::entries() const -> std::vector<MetaCacheEntry const*> {
    std::vector<MetaCacheEntry const*> present;
    present.reserve(this->o.size());
    for (auto const& slot : this->o.slots()) {
        if (slot) {
            present.push_back(&*slot);
        }
    }
    return present;
}

auto MetaCacheEntriesSorted::forwardPast(std::optional<std::string_view> marker) -> void {
    if (!marker) {
        return;
    }
    auto& slots = this->o.slots();
    auto  first = std::find_if(slots.begin(), slots.end(), [&](auto const& slot) { return slot && std::string_view{slot->name} > *marker; });
    if (first == slots.end()) {
        return;
    }
    slots.erase(slots.begin(), first);
}

} // namespace MQ::MetaCache
