#pragma once
#include "metaquorum/core/Error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace MQ::Scanner {

enum class ScannerMode {
    Disabled,
    LowLoadOnly, // scan only after sustained low load
    Normal,      // back off only when overloaded
    Aggressive,  // ignore load
};

[[nodiscard]] auto scannerModeToString(ScannerMode mode) -> std::string_view;
[[nodiscard]] auto scannerModeFromString(std::string_view text) -> std::optional<ScannerMode>;

struct ScannerPerfConfig {
    ScannerMode               mode               = ScannerMode::LowLoadOnly;
    std::uint64_t             writeLoadThreshold = 1000; // IOPS
    std::chrono::milliseconds pauseDuration{std::chrono::seconds{30}};
    std::size_t               batchSize = 100;
    std::chrono::milliseconds batchInterval{100};
    bool                      smartScheduling = true;
    std::chrono::milliseconds minScanInterval{std::chrono::minutes{5}};
    std::chrono::milliseconds skipRecentThreshold{std::chrono::minutes{1}};
    bool                      useReadLocks = true;
    std::uint8_t              priority     = 2;

    [[nodiscard]] static auto forHighWriteLoad() -> ScannerPerfConfig;
    [[nodiscard]] static auto forLowLatency() -> ScannerPerfConfig;

    auto operator==(ScannerPerfConfig const&) const -> bool = default;
};

/*
 * JSON form, durations in milliseconds:
 *   {"mode": "low_load_only", "writeLoadThreshold": 1000, "pauseDurationMs": 30000, ...}
 * Missing keys keep their defaults.
 */
[[nodiscard]] auto parseScannerPerfConfig(std::string_view json) -> Expected<ScannerPerfConfig>;
[[nodiscard]] auto scannerPerfConfigToJson(ScannerPerfConfig const& config) -> std::string;
[[nodiscard]] auto loadScannerPerfConfig(std::filesystem::path const& path) -> Expected<ScannerPerfConfig>;
[[nodiscard]] auto saveScannerPerfConfig(ScannerPerfConfig const& config, std::filesystem::path const& path) -> Expected<void>;

} // namespace MQ::Scanner
