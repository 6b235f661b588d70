#include "core/JsonFields.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace MQ::JsonFields {
namespace {

[[nodiscard]] auto make_error(std::string_view key, std::string_view detail) -> Error {
    std::string message{key};
    message.push_back(' ');
    message.append(detail);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

} // namespace

auto readBool(Json const& json, char const* key, bool defaultValue) -> Expected<bool> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(make_error(key, "must be a bool"));
        }
        return it->get<bool>();
    }
    return defaultValue;
}

auto readUint(Json const& json, char const* key, std::uint64_t defaultValue) -> Expected<std::uint64_t> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number_unsigned()) {
            return it->get<std::uint64_t>();
        }
        if (it->is_number_integer()) {
            auto value = it->get<std::int64_t>();
            if (value < 0) {
                return std::unexpected(make_error(key, "must be non-negative"));
            }
            return static_cast<std::uint64_t>(value);
        }
        return std::unexpected(make_error(key, "must be an integer"));
    }
    return defaultValue;
}

auto readString(Json const& json, char const* key, std::string defaultValue) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return defaultValue;
}

auto readMillis(Json const& json, char const* key, std::chrono::milliseconds defaultValue) -> Expected<std::chrono::milliseconds> {
    auto value = readUint(json, key, static_cast<std::uint64_t>(defaultValue.count()));
    if (!value) {
        return std::unexpected(value.error());
    }
    if (*value > static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        return std::unexpected(make_error(key, "is too large"));
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(*value)};
}

auto parseObject(std::string_view text, std::string_view context) -> Expected<Json> {
    auto json = Json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(make_error(context, "is not valid JSON"));
    }
    if (!json.is_object()) {
        return std::unexpected(make_error(context, "must be a JSON object"));
    }
    return json;
}

auto readFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(Error{Error::Code::FileNotFound, "cannot open " + path.string()});
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(Error::io(std::errc::io_error, "failed reading " + path.string()));
    }
    return contents.str();
}

auto writeFile(std::filesystem::path const& path, std::string_view text) -> Expected<void> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(Error::io(std::errc::permission_denied, "cannot create " + path.string()));
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!file) {
        return std::unexpected(Error::io(std::errc::io_error, "failed writing " + path.string()));
    }
    return {};
}

} // namespace MQ::JsonFields
