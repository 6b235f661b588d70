#include "metaquorum/filemeta/MergeVersions.hpp"

#include <algorithm>
#include <span>
#include <utility>

namespace MQ::Meta {
namespace {

using VersionList = std::span<ShallowVersion const>;

[[nodiscard]] auto counting_key(VersionHeader header, bool strict) -> VersionHeader {
    if (!strict) {
        header.signature = {};
    }
    return header;
}

/*
 * Versions share an id but could not be matched directly. Count identical headers among the
 * tops with that id and take the most common one, ties going to the header that sorts first.
 * Keys are visited in order of first appearance so the outcome does not depend on hashing.
 */
auto pick_by_count(std::vector<ShallowVersion> const& tops, VersionId const& id, bool strict, ShallowVersion& latest) -> std::size_t {
    std::vector<std::pair<VersionHeader, std::size_t>> counts;
    for (auto const& top : tops) {
        if (top.header.versionId != id) {
            continue;
        }
        auto key = counting_key(top.header, strict);
        auto it  = std::find_if(counts.begin(), counts.end(), [&](auto const& entry) { return entry.first == key; });
        if (it == counts.end()) {
            counts.emplace_back(key, 1);
        } else {
            ++it->second;
        }
    }

    std::size_t latestCount = 0;
    for (auto const& [key, count] : counts) {
        if (count < latestCount) {
            continue;
        }
        if (count == latestCount && latest.header.sortsBefore(key)) {
            continue;
        }
        for (auto const& top : tops) {
            if (counting_key(top.header, strict) == key) {
                latest = top;
            }
        }
        latestCount = count;
    }
    return latestCount;
}

[[nodiscard]] auto already_merged(std::vector<ShallowVersion> const& merged, VersionId const& id) -> bool {
    return std::any_of(merged.begin(), merged.end(), [&](ShallowVersion const& version) { return version.header.versionId == id; });
}

} // namespace

auto mergeFileMetaVersions(std::size_t                                   quorum,
                           bool                                          strict,
                           std::size_t                                   requestedVersions,
                           std::vector<std::vector<ShallowVersion>> const& candidates) -> std::vector<ShallowVersion> {
    if (quorum == 0) {
        quorum = 1;
    }
    if (candidates.size() < quorum || candidates.empty()) {
        return {};
    }
    if (candidates.size() == 1) {
        return candidates.front();
    }
    if (quorum == 1) {
        strict = true;
    }

    std::vector<VersionList> lists;
    lists.reserve(candidates.size());
    for (auto const& candidate : candidates) {
        lists.emplace_back(candidate);
    }

    std::vector<ShallowVersion> merged;
    merged.reserve(candidates.front().size());
    std::vector<ShallowVersion> tops;
    tops.reserve(lists.size());
    std::size_t nonFreeVersions = 0;

    for (;;) {
        tops.clear();
        bool consistent = true;
        for (auto const& list : lists) {
            if (list.empty()) {
                consistent = false;
                continue;
            }
            if (!tops.empty() && !(list.front().header == tops.front().header)) {
                consistent = false;
            }
            tops.push_back(list.front());
        }

        if (tops.size() < quorum) {
            break;
        }

        ShallowVersion latest;
        if (consistent) {
            latest = tops.front();
            merged.push_back(latest);
            if (!latest.header.freeVersion()) {
                ++nonFreeVersions;
            }
        } else {
            std::size_t latestCount = 0;
            for (std::size_t i = 0; i < tops.size(); ++i) {
                auto const& version = tops[i];
                if (version.header == latest.header) {
                    ++latestCount;
                    continue;
                }
                if (i == 0 || version.header.sortsBefore(latest.header)) {
                    if (i == 0 || latestCount == 0) {
                        latestCount = 1;
                    } else if (!strict && version.header.matchesNotStrict(latest.header)) {
                        ++latestCount;
                    } else {
                        latestCount = 1;
                    }
                    latest = version;
                    continue;
                }

                // Older than the current pick.
                if (latestCount > 0 && !strict && version.header.matchesNotStrict(latest.header)) {
                    ++latestCount;
                    continue;
                }
                if (latestCount > 0 && version.header.versionId == latest.header.versionId) {
                    latestCount = pick_by_count(tops, version.header.versionId, strict, latest);
                    break;
                }
            }
            if (latestCount >= quorum) {
                if (!latest.header.freeVersion()) {
                    ++nonFreeVersions;
                }
                merged.push_back(latest);
            }
        }

        // Drop from every list whatever is newer than, equal to, or already covered by the pick.
        for (auto& list : lists) {
            while (!list.empty()) {
                auto const& top = list.front().header;
                if (top.modTime > latest.header.modTime || top == latest.header || top.versionId == latest.header.versionId
                    || already_merged(merged, top.versionId)) {
                    list = list.subspan(1);
                    continue;
                }
                break;
            }
        }

        if (requestedVersions > 0 && requestedVersions == nonFreeVersions) {
            merged.insert(merged.end(), lists.front().begin(), lists.front().end());
            break;
        }
    }
    return merged;
}

} // namespace MQ::Meta
