#pragma once
#include "metaquorum/core/Error.hpp"
#include "metaquorum/metacache/MetaCacheEntries.hpp"
#include "metaquorum/metacache/MetacacheStream.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace MQ::MetaCache {

/*
 * Walks several name-sorted metacache streams (one per disk) in lockstep. Each call to next()
 * returns the group for the smallest name still pending: slot i holds disk i's entry for that
 * name, or nothing if disk i does not list it. Readers are borrowed.
 */
class MetacacheMerger {
public:
    explicit MetacacheMerger(std::vector<MetacacheReader*> readers) : readers_(std::move(readers)) {}

    // Next aligned group, or nullopt when every stream is closed. A failing stream fails the walk.
    auto next() -> Expected<std::optional<MetaCacheEntries>>;

    [[nodiscard]] auto groupsEmitted() const -> std::size_t { return this->groups_; }

private:
    std::vector<MetacacheReader*> readers_;
    std::size_t                   groups_ = 0;
};

} // namespace MQ::MetaCache
