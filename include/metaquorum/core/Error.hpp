#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace MQ {

struct Error {
    enum class Code {
        InvalidError = 0,
        FileNotFound,
        FileVersionNotFound,
        VolumeNotFound,
        FileCorrupt,
        DoneForNow,
        MethodNotAllowed,
        Unexpected,
        Io,
        UnsupportedVersion,
        MalformedInput,
        InvalidArgument
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    // Transport failure, keeps the transport's kind and text.
    [[nodiscard]] static auto io(std::errc kind, std::string m) -> Error {
        Error error{Code::Io, std::move(m)};
        error.ioKind = kind;
        return error;
    }

    // Generic failure with no better classification.
    [[nodiscard]] static auto other(std::string m) -> Error {
        return io(std::errc::io_error, std::move(m));
    }

    [[nodiscard]] auto isEof() const -> bool {
        return code == Code::Unexpected;
    }

    Code                       code;
    std::optional<std::string> message;
    std::errc                  ioKind{};
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::FileNotFound:
        return "file_not_found";
    case Error::Code::FileVersionNotFound:
        return "file_version_not_found";
    case Error::Code::VolumeNotFound:
        return "volume_not_found";
    case Error::Code::FileCorrupt:
        return "file_corrupt";
    case Error::Code::DoneForNow:
        return "done_for_now";
    case Error::Code::MethodNotAllowed:
        return "method_not_allowed";
    case Error::Code::Unexpected:
        return "unexpected_eof";
    case Error::Code::Io:
        return "io_error";
    case Error::Code::UnsupportedVersion:
        return "unsupported_version";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Io errors compare kind and text; every other code compares by code alone.
[[nodiscard]] inline auto operator==(Error const& lhs, Error const& rhs) -> bool {
    if (lhs.code != rhs.code) {
        return false;
    }
    if (lhs.code == Error::Code::Io) {
        return lhs.ioKind == rhs.ioKind && lhs.message.value_or("") == rhs.message.value_or("");
    }
    return true;
}

} // namespace MQ
