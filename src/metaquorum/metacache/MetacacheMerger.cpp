#include "metaquorum/metacache/MetacacheMerger.hpp"
#include "log/TaggedLogger.hpp"

#include <string>

namespace MQ::MetaCache {

auto MetacacheMerger::next() -> Expected<std::optional<MetaCacheEntries>> {
    std::vector<std::optional<MetaCacheEntry>> heads(this->readers_.size());
    std::optional<std::string>                 smallest;

    for (std::size_t i = 0; i < this->readers_.size(); ++i) {
        auto head = this->readers_[i]->peek();
        if (!head) {
            mq_log("metacache merge: stream " + std::to_string(i) + " failed: " + describeError(head.error()), "MetacacheStream");
            return std::unexpected(head.error());
        }
        if (!*head) {
            continue;
        }
        if (!smallest || (*head)->name < *smallest) {
            smallest = (*head)->name;
        }
        heads[i] = std::move(*head);
    }
    if (!smallest) {
        return std::optional<MetaCacheEntries>{};
    }

    MetaCacheEntries group(this->readers_.size());
    for (std::size_t i = 0; i < this->readers_.size(); ++i) {
        if (!heads[i] || heads[i]->name != *smallest) {
            continue;
        }
        if (auto consumed = this->readers_[i]->skip(1); !consumed) {
            return std::unexpected(consumed.error());
        }
        group[i] = std::move(heads[i]);
    }
    ++this->groups_;
    return std::optional<MetaCacheEntries>{std::move(group)};
}

} // namespace MQ::MetaCache
