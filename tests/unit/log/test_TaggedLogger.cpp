#ifdef MQ_LOG_DEBUG
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace {

// Sets or clears an environment variable and puts the old value back on exit.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            this->previous_ = old;
        }
        if (value != nullptr) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (this->previous_) {
            ::setenv(this->name_, this->previous_->c_str(), 1);
        } else {
            ::unsetenv(this->name_);
        }
    }

    ScopedEnv(const ScopedEnv&)            = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char*                name_;
    std::optional<std::string> previous_;
};

// The logger's destructor drains its queue, so output is complete once fn returns.
auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
    });

    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_and_thread") {
    auto output = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "TestTag");
    });

    CHECK(output.find("[TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("[Thread 0]") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_resolve_and_monitor_tags") {
    auto output = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("resolve noise", std::source_location::current(), "MetaCacheResolve");
        logger.log_impl("monitor noise", std::source_location::current(), "PerfMonitor");
    });

    CHECK(output.empty());

    auto cleared = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setSkipTags({});
        logger.log_impl("resolve detail", std::source_location::current(), "MetaCacheResolve");
    });

    CHECK(cleared.find("resolve detail") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    auto accepted = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"Focus"});
        logger.log_impl("keep me", std::source_location::current(), "Focus");
        logger.log_impl("drop me", std::source_location::current(), "Focus", "Other");
    });

    CHECK(accepted.find("keep me") != std::string::npos);
    CHECK(accepted.find("drop me") == std::string::npos);
}

TEST_CASE("thread_name_is_used_in_output") {
    auto output = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Scanner-3");
        logger.log_impl("with name", std::source_location::current(), "Test");
    });

    CHECK(output.find("[Scanner-3]") != std::string::npos);
}

TEST_CASE("multiple_tags_are_joined") {
    auto output = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("joined", std::source_location::current(), "Alpha", "Beta");
    });

    CHECK(output.find("[Alpha][Beta]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 139 "tests/unit/log/test_TaggedLogger.cpp"
    });

    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

TEST_CASE("environment_enables_and_filters_logging") {
    ScopedEnv enable("METAQUORUM_LOG", "1");
    ScopedEnv tags("METAQUORUM_LOG_TAGS", "Focus, Resolve");
    ScopedEnv skip("METAQUORUM_LOG_SKIP", "");

    auto output = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.configureFromEnv("metacache_dump");
        logger.log_impl("focused", std::source_location::current(), "Focus");
        logger.log_impl("merged", std::source_location::current(), "Resolve");
        logger.log_impl("elsewhere", std::source_location::current(), "Other");
    });

    CHECK(output.find("[metacache_dump]") != std::string::npos);
    CHECK(output.find("focused") != std::string::npos);
    CHECK(output.find("merged") != std::string::npos);
    CHECK(output.find("elsewhere") == std::string::npos);
}

TEST_CASE("environment_skip_list_replaces_the_default") {
    ScopedEnv enable("METAQUORUM_LOG", "yes");
    ScopedEnv tags("METAQUORUM_LOG_TAGS", nullptr);
    ScopedEnv skip("METAQUORUM_LOG_SKIP", "Noisy");

    auto output = captureStderr([] {
        MQ::TaggedLogger logger;
        logger.configureFromEnv("resolver");
        logger.log_impl("resolve detail", std::source_location::current(), "MetaCacheResolve");
        logger.log_impl("chatter", std::source_location::current(), "Noisy");
    });

    CHECK(output.find("resolve detail") != std::string::npos);
    CHECK(output.find("chatter") == std::string::npos);
}

TEST_CASE("environment_zero_or_unset_keeps_logging_off") {
    for (const char* value : {"0", static_cast<const char*>(nullptr)}) {
        ScopedEnv enable("METAQUORUM_LOG", value);
        auto      output = captureStderr([] {
            MQ::TaggedLogger logger;
            logger.setLoggingEnabled(true);
            logger.configureFromEnv("quiet");
            logger.log_impl("silenced", std::source_location::current(), "Test");
        });
        CHECK(output.empty());
    }
}

} // TEST_SUITE
#endif // MQ_LOG_DEBUG
