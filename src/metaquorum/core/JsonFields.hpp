#pragma once
#include "metaquorum/core/Error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace MQ::JsonFields {

using Json = nlohmann::json;

// Missing keys yield the default; present keys of the wrong type are MalformedInput.
[[nodiscard]] auto readBool(Json const& json, char const* key, bool defaultValue) -> Expected<bool>;
[[nodiscard]] auto readUint(Json const& json, char const* key, std::uint64_t defaultValue) -> Expected<std::uint64_t>;
[[nodiscard]] auto readString(Json const& json, char const* key, std::string defaultValue) -> Expected<std::string>;
[[nodiscard]] auto readMillis(Json const& json, char const* key, std::chrono::milliseconds defaultValue)
    -> Expected<std::chrono::milliseconds>;

[[nodiscard]] auto parseObject(std::string_view text, std::string_view context) -> Expected<Json>;
[[nodiscard]] auto readFile(std::filesystem::path const& path) -> Expected<std::string>;
[[nodiscard]] auto writeFile(std::filesystem::path const& path, std::string_view text) -> Expected<void>;

} // namespace MQ::JsonFields
