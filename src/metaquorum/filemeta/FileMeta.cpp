#include "metaquorum/filemeta/FileMeta.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace MQ::Meta {
namespace {

constexpr std::size_t kPrefixSize = 8;

// Decoded envelope of a payload. The version entries point into `versions`.
struct PayloadView {
    msgpack::object_handle           envelope;
    msgpack::object_handle           versions;
    std::uint8_t                     metaVersion = 0;
    std::span<msgpack::object const> entries;
};

[[nodiscard]] auto corrupt(std::string message) -> Error {
    return Error{Error::Code::FileCorrupt, std::move(message)};
}

[[nodiscard]] auto read_le16(std::span<std::byte const> bytes, std::size_t offset) -> std::uint16_t {
    return static_cast<std::uint16_t>(std::to_integer<std::uint16_t>(bytes[offset])
                                      | (std::to_integer<std::uint16_t>(bytes[offset + 1]) << 8));
}

auto append_le16(std::vector<std::byte>& out, std::uint16_t value) -> void {
    out.push_back(std::byte{static_cast<std::uint8_t>(value & 0xff)});
    out.push_back(std::byte{static_cast<std::uint8_t>(value >> 8)});
}

// Opens the bin envelope of a payload and decodes the version array inside it.
auto open_payload(std::span<std::byte const> payload) -> Expected<PayloadView> {
    PayloadView view;
    std::size_t offset   = 0;
    auto        envelope = Rmp::unpack(payload, offset);
    if (!envelope) {
        return std::unexpected(envelope.error());
    }
    view.envelope = std::move(*envelope);
    auto body     = Rmp::asBin(view.envelope.get());
    if (!body) {
        return std::unexpected(body.error());
    }

    std::size_t cursor        = 0;
    auto        headerVersion = Rmp::unpackPfix(*body, cursor);
    if (!headerVersion) {
        return std::unexpected(headerVersion.error());
    }
    if (*headerVersion == 0 || *headerVersion > kXlHeaderVersion) {
        return std::unexpected(Error{Error::Code::UnsupportedVersion, "unknown header version " + std::to_string(*headerVersion)});
    }
    auto metaVersion = Rmp::unpackPfix(*body, cursor);
    if (!metaVersion) {
        return std::unexpected(metaVersion.error());
    }
    if (*metaVersion == 0 || *metaVersion > kXlMetaVersion) {
        return std::unexpected(Error{Error::Code::UnsupportedVersion, "unknown meta version " + std::to_string(*metaVersion)});
    }
    view.metaVersion = *metaVersion;

    auto versions = Rmp::unpack(*body, cursor);
    if (!versions) {
        return std::unexpected(versions.error());
    }
    if (cursor != body->size()) {
        return std::unexpected(corrupt("trailing bytes after version list"));
    }
    view.versions = std::move(*versions);
    auto entries  = Rmp::asArray(view.versions.get());
    if (!entries) {
        return std::unexpected(entries.error());
    }
    view.entries = *entries;
    return view;
}

auto read_version(msgpack::object const& entry) -> Expected<ShallowVersion> {
    auto pair = Rmp::asArray(entry);
    if (!pair) {
        return std::unexpected(pair.error());
    }
    if (pair->size() != 2) {
        return std::unexpected(corrupt("version entry has " + std::to_string(pair->size()) + " fields, want 2"));
    }
    auto headerBytes = Rmp::asBin((*pair)[0]);
    if (!headerBytes) {
        return std::unexpected(headerBytes.error());
    }
    auto header = VersionHeader::decode(*headerBytes);
    if (!header) {
        return std::unexpected(header.error());
    }
    auto meta = Rmp::asBin((*pair)[1]);
    if (!meta) {
        return std::unexpected(meta.error());
    }
    return ShallowVersion{*header, std::vector<std::byte>(meta->begin(), meta->end())};
}

} // namespace

auto FileMeta::isXl2V1Format(std::span<std::byte const> bytes) -> bool {
    return FileMeta::checkXl2V1(bytes).has_value();
}

auto FileMeta::checkXl2V1(std::span<std::byte const> bytes) -> Expected<Xl2Prefix> {
    if (bytes.size() < kPrefixSize) {
        return std::unexpected(corrupt("metadata too short"));
    }
    if (!std::equal(kXl2Magic.begin(), kXl2Magic.end(), bytes.begin())) {
        return std::unexpected(corrupt("unknown metadata format"));
    }
    Xl2Prefix prefix;
    prefix.major = read_le16(bytes, 4);
    prefix.minor = read_le16(bytes, 6);
    if (prefix.major != kXlVersionMajor) {
        return std::unexpected(Error{Error::Code::UnsupportedVersion, "unknown major metadata version " + std::to_string(prefix.major)});
    }
    if (prefix.minor > kXlVersionMinor) {
        return std::unexpected(Error{Error::Code::UnsupportedVersion, "unknown minor metadata version " + std::to_string(prefix.minor)});
    }
    prefix.payload = bytes.subspan(kPrefixSize);
    return prefix;
}

auto FileMeta::isLatestDeleteMarker(std::span<std::byte const> payload) -> bool {
    auto opened = open_payload(payload);
    if (!opened || opened->entries.empty()) {
        return true;
    }
    auto latest = read_version(opened->entries.front());
    if (!latest) {
        return true;
    }
    return latest->header.type == VersionType::Delete;
}

auto FileMeta::load(std::span<std::byte const> bytes) -> Expected<FileMeta> {
    auto prefix = FileMeta::checkXl2V1(bytes);
    if (!prefix) {
        return std::unexpected(prefix.error());
    }
    auto opened = open_payload(prefix->payload);
    if (!opened) {
        return std::unexpected(opened.error());
    }

    FileMeta meta;
    meta.metaVersion = opened->metaVersion;
    meta.versions.reserve(opened->entries.size());
    for (auto const& entry : opened->entries) {
        auto version = read_version(entry);
        if (!version) {
            return std::unexpected(version.error());
        }
        meta.versions.push_back(std::move(*version));
    }
    return meta;
}

auto FileMeta::marshal() const -> Expected<std::vector<std::byte>> {
    if (this->versions.size() > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "too many versions: " + std::to_string(this->versions.size())});
    }
    Rmp::Packer body;
    if (auto w = body.packPfix(kXlHeaderVersion); !w) {
        return std::unexpected(w.error());
    }
    if (auto w = body.packPfix(this->metaVersion); !w) {
        return std::unexpected(w.error());
    }
    body.pack_array(static_cast<std::uint32_t>(this->versions.size()));
    for (auto const& version : this->versions) {
        Rmp::Packer header;
        if (auto w = version.header.encode(header); !w) {
            return std::unexpected(w.error());
        }
        body.pack_array(2);
        if (auto w = body.packBin(header.bytes()); !w) {
            return std::unexpected(w.error());
        }
        if (auto w = body.packBin(version.meta); !w) {
            return std::unexpected(w.error());
        }
    }

    Rmp::Packer envelope;
    if (auto w = envelope.packBin(body.bytes()); !w) {
        return std::unexpected(w.error());
    }
    std::vector<std::byte> out(kXl2Magic.begin(), kXl2Magic.end());
    append_le16(out, kXlVersionMajor);
    append_le16(out, kXlVersionMinor);
    auto packed = envelope.bytes();
    out.insert(out.end(), packed.begin(), packed.end());
    return out;
}

auto FileMeta::latestModTime() const -> std::optional<std::int64_t> {
    if (this->versions.empty()) {
        return std::nullopt;
    }
    auto newest = std::max_element(this->versions.begin(), this->versions.end(), [](ShallowVersion const& a, ShallowVersion const& b) {
        return a.header.modTime < b.header.modTime;
    });
    return newest->header.modTime;
}

auto FileMeta::addVersion(ShallowVersion version) -> void {
    std::erase_if(this->versions, [&](ShallowVersion const& existing) { return existing.header.versionId == version.header.versionId; });
    auto position = std::find_if(this->versions.begin(), this->versions.end(), [&](ShallowVersion const& existing) {
        return version.header.sortsBefore(existing.header);
    });
    this->versions.insert(position, std::move(version));
}

} // namespace MQ::Meta
