#include "metaquorum/core/Error.hpp"
#include "metaquorum/io/FdStream.hpp"
#include "metaquorum/metacache/MetacacheStream.hpp"
#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"
#include "tools/MetacacheJson.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

using MQ::Tools::CommandLine;

struct DumpOptions {
    std::string                          input = "-";
    std::size_t                          skip  = 0;
    std::size_t                          limit = std::numeric_limits<std::size_t>::max();
    bool                                 decode = false;
    int                                  indent = 2;
    std::optional<std::filesystem::path> outputPath;
};

auto parse_int(std::string_view text, int& target, std::string_view name) -> CommandLine::ParseError {
    if (text.empty()) {
        return std::string{name} + " requires a value";
    }
    int  value  = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::string{name} + " must be numeric";
    }
    target = value;
    return std::nullopt;
}

auto parse_cli(int argc, char** argv, CommandLine& cli) -> std::optional<DumpOptions> {
    DumpOptions options;

    cli.set_program_name("metacache_dump");
    cli.set_summary("Print the entries of a metacache stream as JSON.");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });

    cli.add_value("--input",
                  {.on_value =
                           [&](std::string_view value) -> CommandLine::ParseError {
                               if (value.empty()) {
                                   return std::string{"--input requires a file"};
                               }
                               options.input.assign(value.begin(), value.end());
                               return std::nullopt;
                           },
                   .help        = "Stream to read, '-' for stdin (default -)",
                   .placeholder = "FILE"});
    cli.add_alias("-i", "--input");
    cli.add_size("--skip", {.on_value = [&](std::size_t value) { options.skip = value; }, .help = "Entries to skip first"});
    cli.add_size("--limit", {.on_value = [&](std::size_t value) { options.limit = value; }, .help = "Maximum entries to print"});
    cli.add_flag("--decode", {.on_set = [&] { options.decode = true; }, .help = "Decode xl.meta and list versions"});
    cli.add_value("--indent",
                  {.on_value    = [&](std::string_view value) { return parse_int(value, options.indent, "--indent"); },
                   .help        = "JSON indent (default 2, -1 for compact)",
                   .placeholder = "N"});
    cli.add_value("--output",
                  {.on_value =
                           [&](std::string_view value) -> CommandLine::ParseError {
                               if (value.empty()) {
                                   return std::string{"--output requires a file"};
                               }
                               options.outputPath = std::filesystem::path(std::string{value});
                               return std::nullopt;
                           },
                   .help        = "Write JSON to file instead of stdout",
                   .placeholder = "FILE"});
    cli.add_alias("-o", "--output");
    cli.set_positional_handler([&](std::string_view token) -> CommandLine::ParseError {
        options.input.assign(token.begin(), token.end());
        return std::nullopt;
    });

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    return options;
}

auto open_input(std::string const& path) -> MQ::Expected<std::unique_ptr<MQ::IO::FdReader>> {
    if (path == "-") {
        return std::make_unique<MQ::IO::FdReader>(STDIN_FILENO);
    }
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        auto err = errno;
        if (err == ENOENT) {
            return std::unexpected(MQ::Error{MQ::Error::Code::FileNotFound, path});
        }
        return std::unexpected(MQ::Error::io(static_cast<std::errc>(err), path + ": " + std::strerror(err)));
    }
    return std::make_unique<MQ::IO::FdReader>(fd, true);
}

auto write_output(std::string const& jsonString, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output) {
        std::cout << jsonString << std::endl;
        return true;
    }
    std::ofstream stream(*output, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << output->string() << "'" << std::endl;
        return false;
    }
    stream << jsonString;
    if (!stream.good()) {
        std::cerr << "Failed to write JSON output" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
#ifdef MQ_LOG_DEBUG
    MQ::configure_logging_from_env("metacache_dump");
#endif

    CommandLine cli;
    auto        options = parse_cli(argc, argv, cli);
    if (cli.help_requested()) {
        std::cout << cli.usage();
        return EXIT_SUCCESS;
    }
    if (!options) {
        std::cerr << cli.usage();
        return EXIT_FAILURE;
    }

    auto input = open_input(options->input);
    if (!input) {
        std::cerr << "Open failed: " << MQ::describeError(input.error()) << std::endl;
        return EXIT_FAILURE;
    }

    MQ::MetaCache::MetacacheReader reader(**input);
    if (auto skipped = reader.skip(options->skip); !skipped) {
        std::cerr << "Read failed: " << MQ::describeError(skipped.error()) << std::endl;
        return EXIT_FAILURE;
    }

    auto                     entries = nlohmann::json::array();
    std::optional<MQ::Error> failure;
    for (std::size_t count = 0; count < options->limit; ++count) {
        auto entry = reader.next();
        if (!entry) {
            failure = entry.error();
            break;
        }
        if (!*entry) {
            break;
        }
        entries.push_back(MQ::Tools::entryToJson(**entry, options->decode));
    }

    nlohmann::json document{{"entries", std::move(entries)}, {"closed", reader.closed()}};
    if (failure) {
        document["error"] = MQ::describeError(*failure);
    }
    if (!write_output(document.dump(options->indent), options->outputPath)) {
        return EXIT_FAILURE;
    }
    if (failure) {
        std::cerr << "Read failed: " << MQ::describeError(*failure) << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
