#include "metaquorum/metacache/MetacacheStream.hpp"
#include "log/TaggedLogger.hpp"
#include "metaquorum/core/ErrorCode.hpp"

#include <algorithm>
#include <string>

namespace MQ::MetaCache {
namespace {

[[nodiscard]] auto error_from_record(std::uint32_t code, std::string message) -> Error {
    if (auto error = errorFromCode(code, message)) {
        return *std::move(error);
    }
    return Error::other(std::move(message));
}

} // namespace

auto MetacacheWriter::init() -> Expected<void> {
    if (this->created_) {
        return {};
    }
    Rmp::Packer packer;
    if (auto packed = packer.packPfix(kMetacacheStreamVersion); !packed) {
        return packed;
    }
    if (auto written = packer.flushTo(this->out_); !written) {
        return written;
    }
    this->created_ = true;
    return {};
}

auto MetacacheWriter::write(std::span<MetaCacheEntry const> entries) -> Expected<void> {
    if (entries.empty()) {
        return {};
    }
    auto unnamed = std::find_if(entries.begin(), entries.end(), [](MetaCacheEntry const& entry) { return entry.name.empty(); });
    if (unnamed != entries.end()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "metacache writer: entry without a name"});
    }
    if (auto ready = this->init(); !ready) {
        return ready;
    }
    for (auto const& entry : entries) {
        if (auto written = this->writeObj(entry); !written) {
            return written;
        }
    }
    return {};
}

auto MetacacheWriter::writeObj(MetaCacheEntry const& entry) -> Expected<void> {
    if (auto ready = this->init(); !ready) {
        return ready;
    }
    std::uint32_t code = 0;
    std::string   message;
    if (entry.error) {
        code    = toErrorCode(*entry.error).asU32();
        message = entry.error->message.value_or(std::string{errorCodeToString(entry.error->code)});
    }
    return this->writeRecord(EntryType::Object, entry.name, entry.metadata, code, message);
}

auto MetacacheWriter::close() -> Expected<void> {
    if (auto ready = this->init(); !ready) {
        return ready;
    }
    return this->writeRecord(EntryType::Close, {}, {}, 0, {});
}

auto MetacacheWriter::writeErr(std::uint32_t code, std::string_view message) -> Expected<void> {
    if (auto ready = this->init(); !ready) {
        return ready;
    }
    return this->writeRecord(EntryType::Error, {}, {}, code, message);
}

auto MetacacheWriter::writeRecord(EntryType                  type,
                                  std::string_view           name,
                                  std::span<std::byte const> metadata,
                                  std::uint32_t              code,
                                  std::string_view           message) -> Expected<void> {
    Rmp::Packer packer;
    if (auto w = packer.packPfix(entryTypeToWire(type)); !w) {
        return w;
    }
    if (auto w = packer.packStr(name); !w) {
        return w;
    }
    if (auto w = packer.packBin(metadata); !w) {
        return w;
    }
    packer.pack_fix_uint32(code);
    if (auto w = packer.packStr(message); !w) {
        return w;
    }
    return packer.flushTo(this->out_);
}

auto MetacacheReader::checkInit() -> Expected<void> {
    if (this->err_) {
        return std::unexpected(*this->err_);
    }
    if (this->init_) {
        return {};
    }
    auto version = this->in_.readPfix();
    if (!version) {
        this->err_ = version.error();
    } else if (*version != kMetacacheStreamVersion) {
        this->err_ = Error{Error::Code::UnsupportedVersion, "invalid metacache stream version " + std::to_string(*version)};
    }
    this->init_ = true;
    if (this->err_) {
        mq_log("metacache stream rejected: " + describeError(*this->err_), "MetacacheStream");
        return std::unexpected(*this->err_);
    }
    return {};
}

auto MetacacheReader::readRecord() -> Expected<std::optional<MetaCacheEntry>> {
    auto tag = this->in_.readPfix();
    if (!tag) {
        return std::unexpected(tag.error());
    }
    auto type = entryTypeFromWire(*tag);
    if (!type) {
        return std::unexpected(Error{Error::Code::MalformedInput, "unknown metacache record tag " + std::to_string(*tag)});
    }

    MetaCacheEntry entry;
    auto           name = this->in_.readStr();
    if (!name) {
        return std::unexpected(name.error());
    }
    entry.name    = std::move(*name);
    auto metadata = this->in_.readBin();
    if (!metadata) {
        return std::unexpected(metadata.error());
    }
    entry.metadata = std::move(*metadata);
    auto code      = this->in_.readU32();
    if (!code) {
        return std::unexpected(code.error());
    }
    auto message = this->in_.readStr();
    if (!message) {
        return std::unexpected(message.error());
    }

    switch (*type) {
    case EntryType::Close:
        this->closed_ = true;
        return std::optional<MetaCacheEntry>{};
    case EntryType::Error:
        mq_log("metacache error record: " + *message, "MetacacheStream");
        return std::unexpected(error_from_record(*code, std::move(*message)));
    case EntryType::Object:
        break;
    }
    if (*code != 0) {
        return std::unexpected(error_from_record(*code, std::move(*message)));
    }
    return std::optional<MetaCacheEntry>{std::move(entry)};
}

auto MetacacheReader::next() -> Expected<std::optional<MetaCacheEntry>> {
    if (auto ready = this->checkInit(); !ready) {
        return std::unexpected(ready.error());
    }
    if (this->current_) {
        auto current = std::move(*this->current_);
        this->current_.reset();
        if (!current) {
            return std::unexpected(current.error());
        }
        return std::optional<MetaCacheEntry>{std::move(*current)};
    }
    if (this->closed_) {
        return std::optional<MetaCacheEntry>{};
    }
    return this->readRecord();
}

auto MetacacheReader::peek() -> Expected<std::optional<MetaCacheEntry>> {
    if (auto ready = this->checkInit(); !ready) {
        return std::unexpected(ready.error());
    }
    if (!this->current_) {
        if (this->closed_) {
            return std::optional<MetaCacheEntry>{};
        }
        auto record = this->readRecord();
        if (record && !*record) {
            return std::optional<MetaCacheEntry>{};
        }
        if (record) {
            this->current_.emplace(std::move(**record));
        } else {
            this->current_.emplace(std::unexpected(record.error()));
        }
    }
    if (!*this->current_) {
        return std::unexpected(this->current_->error());
    }
    return std::optional<MetaCacheEntry>{**this->current_};
}

auto MetacacheReader::skip(std::size_t count) -> Expected<void> {
    if (auto ready = this->checkInit(); !ready) {
        return ready;
    }
    while (count > 0) {
        auto entry = this->next();
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (!*entry) {
            break;
        }
        --count;
    }
    return {};
}

auto MetacacheReader::readAll() -> Expected<std::vector<MetaCacheEntry>> {
    std::vector<MetaCacheEntry> entries;
    for (;;) {
        auto entry = this->next();
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (!*entry) {
            break;
        }
        entries.push_back(std::move(**entry));
    }
    return entries;
}

} // namespace MQ::MetaCache
