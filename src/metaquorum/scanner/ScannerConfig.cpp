#include "metaquorum/scanner/ScannerConfig.hpp"
#include "core/JsonFields.hpp"
#include "log/TaggedLogger.hpp"

namespace MQ::Scanner {

using JsonFields::Json;
using namespace std::chrono_literals;

auto scannerModeToString(ScannerMode mode) -> std::string_view {
    switch (mode) {
    case ScannerMode::Disabled:
        return "disabled";
    case ScannerMode::LowLoadOnly:
        return "low_load_only";
    case ScannerMode::Normal:
        return "normal";
    case ScannerMode::Aggressive:
        return "aggressive";
    }
    return "unknown";
}

auto scannerModeFromString(std::string_view text) -> std::optional<ScannerMode> {
    for (auto mode : {ScannerMode::Disabled, ScannerMode::LowLoadOnly, ScannerMode::Normal, ScannerMode::Aggressive}) {
        if (scannerModeToString(mode) == text) {
            return mode;
        }
    }
    return std::nullopt;
}

auto ScannerPerfConfig::forHighWriteLoad() -> ScannerPerfConfig {
    ScannerPerfConfig config;
    config.mode                = ScannerMode::LowLoadOnly;
    config.writeLoadThreshold  = 500;
    config.pauseDuration       = 60s;
    config.batchSize           = 50;
    config.batchInterval       = 200ms;
    config.smartScheduling     = true;
    config.minScanInterval     = 600s;
    config.skipRecentThreshold = 300s;
    config.useReadLocks        = true;
    config.priority            = 1;
    return config;
}

auto ScannerPerfConfig::forLowLatency() -> ScannerPerfConfig {
    ScannerPerfConfig config;
    config.mode                = ScannerMode::Disabled;
    config.writeLoadThreshold  = 100;
    config.pauseDuration       = 120s;
    config.batchSize           = 10;
    config.batchInterval       = 500ms;
    config.smartScheduling     = true;
    config.minScanInterval     = 1800s;
    config.skipRecentThreshold = 600s;
    config.useReadLocks        = true;
    config.priority            = 0;
    return config;
}

auto parseScannerPerfConfig(std::string_view text) -> Expected<ScannerPerfConfig> {
    auto json = JsonFields::parseObject(text, "scanner config");
    if (!json) {
        return std::unexpected(json.error());
    }
    ScannerPerfConfig config;

    auto mode = JsonFields::readString(*json, "mode", std::string{scannerModeToString(config.mode)});
    if (!mode) {
        return std::unexpected(mode.error());
    }
    auto parsedMode = scannerModeFromString(*mode);
    if (!parsedMode) {
        return std::unexpected(Error{Error::Code::MalformedInput, "mode has unknown value '" + *mode + "'"});
    }
    config.mode = *parsedMode;

    auto threshold = JsonFields::readUint(*json, "writeLoadThreshold", config.writeLoadThreshold);
    if (!threshold) {
        return std::unexpected(threshold.error());
    }
    config.writeLoadThreshold = *threshold;

    auto pause = JsonFields::readMillis(*json, "pauseDurationMs", config.pauseDuration);
    if (!pause) {
        return std::unexpected(pause.error());
    }
    config.pauseDuration = *pause;

    auto batchSize = JsonFields::readUint(*json, "batchSize", config.batchSize);
    if (!batchSize) {
        return std::unexpected(batchSize.error());
    }
    config.batchSize = static_cast<std::size_t>(*batchSize);

    auto batchInterval = JsonFields::readMillis(*json, "batchIntervalMs", config.batchInterval);
    if (!batchInterval) {
        return std::unexpected(batchInterval.error());
    }
    config.batchInterval = *batchInterval;

    auto smart = JsonFields::readBool(*json, "smartScheduling", config.smartScheduling);
    if (!smart) {
        return std::unexpected(smart.error());
    }
    config.smartScheduling = *smart;

    auto minInterval = JsonFields::readMillis(*json, "minScanIntervalMs", config.minScanInterval);
    if (!minInterval) {
        return std::unexpected(minInterval.error());
    }
    config.minScanInterval = *minInterval;

    auto skipRecent = JsonFields::readMillis(*json, "skipRecentThresholdMs", config.skipRecentThreshold);
    if (!skipRecent) {
        return std::unexpected(skipRecent.error());
    }
    config.skipRecentThreshold = *skipRecent;

    auto readLocks = JsonFields::readBool(*json, "useReadLocks", config.useReadLocks);
    if (!readLocks) {
        return std::unexpected(readLocks.error());
    }
    config.useReadLocks = *readLocks;

    auto priority = JsonFields::readUint(*json, "priority", config.priority);
    if (!priority) {
        return std::unexpected(priority.error());
    }
    if (*priority > 0xff) {
        return std::unexpected(Error{Error::Code::MalformedInput, "priority must fit in 8 bits"});
    }
    config.priority = static_cast<std::uint8_t>(*priority);
    return config;
}

auto scannerPerfConfigToJson(ScannerPerfConfig const& config) -> std::string {
    Json json{{"mode", std::string{scannerModeToString(config.mode)}},
              {"writeLoadThreshold", config.writeLoadThreshold},
              {"pauseDurationMs", config.pauseDuration.count()},
              {"batchSize", config.batchSize},
              {"batchIntervalMs", config.batchInterval.count()},
              {"smartScheduling", config.smartScheduling},
              {"minScanIntervalMs", config.minScanInterval.count()},
              {"skipRecentThresholdMs", config.skipRecentThreshold.count()},
              {"useReadLocks", config.useReadLocks},
              {"priority", config.priority}};
    return json.dump(2);
}

auto loadScannerPerfConfig(std::filesystem::path const& path) -> Expected<ScannerPerfConfig> {
    auto text = JsonFields::readFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    mq_log("loading scanner config from " + path.string(), "Config");
    return parseScannerPerfConfig(*text);
}

auto saveScannerPerfConfig(ScannerPerfConfig const& config, std::filesystem::path const& path) -> Expected<void> {
    return JsonFields::writeFile(path, scannerPerfConfigToJson(config));
}

} // namespace MQ::Scanner
