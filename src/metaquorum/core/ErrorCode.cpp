#include "metaquorum/core/ErrorCode.hpp"

#include <cstdio>

namespace MQ {

auto ErrorCode::typeName() const -> std::string_view {
    switch (this->type()) {
    case ErrorTypes::System:
        return "System";
    case ErrorTypes::FileMeta:
        return "FileMeta";
    case ErrorTypes::Storage:
        return "Storage";
    case ErrorTypes::Disk:
        return "Disk";
    case ErrorTypes::Iam:
        return "IAM";
    case ErrorTypes::Policy:
        return "Policy";
    case ErrorTypes::Crypto:
        return "Crypto";
    case ErrorTypes::Notify:
        return "Notify";
    case ErrorTypes::Api:
        return "API";
    case ErrorTypes::Network:
        return "Network";
    case ErrorTypes::Config:
        return "Config";
    case ErrorTypes::Auth:
        return "Auth";
    case ErrorTypes::Bucket:
        return "Bucket";
    case ErrorTypes::Object:
        return "Object";
    case ErrorTypes::Query:
        return "Query";
    case ErrorTypes::Admin:
        return "Admin";
    default:
        return "Unknown";
    }
}

auto ErrorCode::isSystemError() const -> bool {
    return this->type() == ErrorTypes::System;
}

auto ErrorCode::isStorageError() const -> bool {
    auto const t = this->type();
    return t == ErrorTypes::Storage || t == ErrorTypes::Disk || t == ErrorTypes::FileMeta;
}

auto ErrorCode::isAuthError() const -> bool {
    auto const t = this->type();
    return t == ErrorTypes::Iam || t == ErrorTypes::Policy || t == ErrorTypes::Auth;
}

auto ErrorCode::toString() const -> std::string {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), ":%04X:%04X", this->type(), this->specific());
    std::string text{this->typeName()};
    text.append(buffer);
    return text;
}

auto toErrorCode(Error const& error) -> ErrorCode {
    for (auto const& [code, specific] : kFileMetaCodes) {
        if (code == error.code) {
            return ErrorCode{ErrorTypes::FileMeta, specific};
        }
    }
    return ErrorCode{};
}

auto errorFromCode(std::uint32_t raw, std::string message) -> std::optional<Error> {
    if (raw == 0) {
        return std::nullopt;
    }
    auto const code = ErrorCode::fromU32(raw);
    if (code.type() == ErrorTypes::FileMeta) {
        for (auto const& [errorCode, specific] : kFileMetaCodes) {
            if (specific != code.specific()) {
                continue;
            }
            if (errorCode == Error::Code::Io) {
                break;
            }
            return Error{errorCode, std::move(message)};
        }
    }
    return Error::other(std::move(message));
}

} // namespace MQ
