#pragma once
#include "metaquorum/filemeta/FileMeta.hpp"

#include <cstddef>
#include <vector>

namespace MQ::Meta {

/*
 * Merges the version lists reported by several disks into one list that at least `quorum`
 * of them agree on. Each input list must be sorted newest first.
 *
 * The top of every list is examined per round. A version is accepted when `quorum` tops are
 * identical, or (non-strict only) match by id, type and compatible erasure layout. With
 * quorum 1 the comparison is always strict. When `requestedVersions` is non-zero, merging
 * stops once that many non-free versions are accepted and the rest of the first list is
 * appended unchanged.
 *
 * Fewer lists than `quorum` yields an empty result; a single list is returned as is.
 */
[[nodiscard]] auto mergeFileMetaVersions(std::size_t                                   quorum,
                                         bool                                          strict,
                                         std::size_t                                   requestedVersions,
                                         std::vector<std::vector<ShallowVersion>> const& candidates) -> std::vector<ShallowVersion>;

} // namespace MQ::Meta
