#include "metaquorum/filemeta/VersionHeader.hpp"

#include <algorithm>
#include <cstdio>
#include <span>
#include <string>

namespace MQ::Meta {
namespace {

constexpr std::uint32_t kHeaderFields = 7;

template <std::size_t N>
auto read_fixed_bin(msgpack::object const& field, std::array<std::uint8_t, N>& out, std::string_view name) -> Expected<void> {
    auto bytes = Rmp::asBin(field);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    if (bytes->size() != N) {
        return std::unexpected(Error{Error::Code::FileCorrupt,
                                     std::string{name} + " has " + std::to_string(bytes->size()) + " bytes, want " + std::to_string(N)});
    }
    std::transform(bytes->begin(), bytes->end(), out.begin(), [](std::byte b) { return std::to_integer<std::uint8_t>(b); });
    return {};
}

auto read_small(msgpack::object const& field, std::string_view name) -> Expected<std::uint8_t> {
    auto value = Rmp::asUint(field);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (*value > 0xff) {
        return std::unexpected(Error{Error::Code::FileCorrupt, std::string{name} + " out of range"});
    }
    return static_cast<std::uint8_t>(*value);
}

} // namespace

auto versionTypeToString(VersionType type) -> std::string_view {
    switch (type) {
    case VersionType::Invalid:
        return "invalid";
    case VersionType::Object:
        return "object";
    case VersionType::Delete:
        return "delete";
    case VersionType::Legacy:
        return "legacy";
    }
    return "unknown";
}

auto VersionHeader::matchesEc(VersionHeader const& other) const -> bool {
    if (this->hasEc() && other.hasEc()) {
        return this->ecN == other.ecN && this->ecM == other.ecM;
    }
    return true;
}

auto VersionHeader::matchesNotStrict(VersionHeader const& other) const -> bool {
    return this->versionId == other.versionId && this->type == other.type && this->matchesEc(other);
}

auto VersionHeader::sortsBefore(VersionHeader const& other) const -> bool {
    if (*this == other) {
        return false;
    }
    if (this->modTime != other.modTime) {
        return this->modTime > other.modTime;
    }
    if (this->type != other.type) {
        return this->type < other.type;
    }
    if (this->signature != other.signature) {
        return this->signature > other.signature;
    }
    if (this->versionId != other.versionId) {
        return this->versionId > other.versionId;
    }
    return this->flags > other.flags;
}

auto VersionHeader::encode(Rmp::Packer& out) const -> Expected<void> {
    out.pack_array(kHeaderFields);
    if (auto w = out.packBin(std::as_bytes(std::span{this->versionId})); !w) {
        return w;
    }
    out.pack_int64(this->modTime);
    if (auto w = out.packBin(std::as_bytes(std::span{this->signature})); !w) {
        return w;
    }
    out.pack_uint8(static_cast<std::uint8_t>(this->type));
    out.pack_uint8(this->flags);
    out.pack_uint8(this->ecN);
    out.pack_uint8(this->ecM);
    return {};
}

auto VersionHeader::decode(std::span<std::byte const> bytes) -> Expected<VersionHeader> {
    std::size_t offset = 0;
    auto        handle = Rmp::unpack(bytes, offset);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (offset != bytes.size()) {
        return std::unexpected(Error{Error::Code::FileCorrupt, "trailing bytes after version header"});
    }
    auto fields = Rmp::asArray(handle->get());
    if (!fields) {
        return std::unexpected(fields.error());
    }
    if (fields->size() != kHeaderFields) {
        return std::unexpected(Error{Error::Code::FileCorrupt, "version header has " + std::to_string(fields->size()) + " fields"});
    }

    VersionHeader header;
    if (auto r = read_fixed_bin((*fields)[0], header.versionId, "version id"); !r) {
        return std::unexpected(r.error());
    }
    auto modTime = Rmp::asInt((*fields)[1]);
    if (!modTime) {
        return std::unexpected(modTime.error());
    }
    header.modTime = *modTime;
    if (auto r = read_fixed_bin((*fields)[2], header.signature, "signature"); !r) {
        return std::unexpected(r.error());
    }

    auto type = read_small((*fields)[3], "version type");
    if (!type) {
        return std::unexpected(type.error());
    }
    if (*type > static_cast<std::uint8_t>(VersionType::Legacy)) {
        return std::unexpected(Error{Error::Code::FileCorrupt, "unknown version type " + std::to_string(*type)});
    }
    header.type = static_cast<VersionType>(*type);

    auto flags = read_small((*fields)[4], "flags");
    if (!flags) {
        return std::unexpected(flags.error());
    }
    header.flags = *flags;
    auto ecN = read_small((*fields)[5], "ec data blocks");
    if (!ecN) {
        return std::unexpected(ecN.error());
    }
    header.ecN = *ecN;
    auto ecM = read_small((*fields)[6], "ec parity blocks");
    if (!ecM) {
        return std::unexpected(ecM.error());
    }
    header.ecM = *ecM;
    return header;
}

auto versionIdToString(VersionId const& id) -> std::string {
    char text[37];
    std::snprintf(text,
                  sizeof(text),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  id[0], id[1], id[2], id[3], id[4], id[5], id[6], id[7],
                  id[8], id[9], id[10], id[11], id[12], id[13], id[14], id[15]);
    return text;
}

} // namespace MQ::Meta
