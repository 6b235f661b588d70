#include "metaquorum/core/Error.hpp"
#include "metaquorum/io/FdStream.hpp"
#include "metaquorum/metacache/MetaCacheEntries.hpp"
#include "metaquorum/metacache/MetacacheMerger.hpp"
#include "metaquorum/metacache/MetacacheStream.hpp"
#include "metaquorum/metacache/ResolutionConfig.hpp"
#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using MQ::Tools::CommandLine;

struct ResolveOptions {
    std::vector<std::string>             inputs;
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> outputPath;
    std::optional<std::size_t>           dirQuorum;
    std::optional<std::size_t>           objQuorum;
    std::optional<std::size_t>           requestedVersions;
    std::optional<std::string>           bucket;
    bool                                 strict = false;
    bool                                 quiet  = false;
};

struct ResolveTotals {
    std::size_t groups   = 0;
    std::size_t resolved = 0;
    std::size_t dropped  = 0;
};

auto parse_cli(int argc, char** argv, CommandLine& cli) -> std::optional<ResolveOptions> {
    ResolveOptions options;

    cli.set_program_name("metacache_resolve");
    cli.set_summary("Merge per-disk metacache streams and write the quorum-resolved listing.\n"
                    "Positional arguments name the input streams, one per disk.");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });
    cli.set_positional_handler([&](std::string_view token) -> CommandLine::ParseError {
        options.inputs.emplace_back(token);
        return std::nullopt;
    });

    cli.add_value("--config",
                  {.on_value =
                           [&](std::string_view value) -> CommandLine::ParseError {
                               if (value.empty()) {
                                   return std::string{"--config requires a file"};
                               }
                               options.configPath = std::filesystem::path(std::string{value});
                               return std::nullopt;
                           },
                   .help        = "Resolution settings as JSON",
                   .placeholder = "FILE"});
    cli.add_size("--dir-quorum", {.on_value = [&](std::size_t value) { options.dirQuorum = value; }, .help = "Disks needed to keep a directory"});
    cli.add_size("--obj-quorum", {.on_value = [&](std::size_t value) { options.objQuorum = value; }, .help = "Disks needed to keep an object"});
    cli.add_size("--requested-versions",
                 {.on_value = [&](std::size_t value) { options.requestedVersions = value; }, .help = "Versions to keep per object (0 = all)"});
    cli.add_flag("--strict", {.on_set = [&] { options.strict = true; }, .help = "Require matching erasure settings"});
    cli.add_value("--bucket",
                  {.on_value =
                           [&](std::string_view value) -> CommandLine::ParseError {
                               options.bucket = std::string{value};
                               return std::nullopt;
                           },
                   .help        = "Bucket name used in log output",
                   .placeholder = "NAME"});
    cli.add_value("--output",
                  {.on_value =
                           [&](std::string_view value) -> CommandLine::ParseError {
                               if (value.empty()) {
                                   return std::string{"--output requires a file"};
                               }
                               options.outputPath = std::filesystem::path(std::string{value});
                               return std::nullopt;
                           },
                   .help        = "Write the resolved stream to file instead of stdout",
                   .placeholder = "FILE"});
    cli.add_alias("-o", "--output");
    cli.add_flag("--quiet", {.on_set = [&] { options.quiet = true; }, .help = "Do not print totals to stderr"});

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

auto open_output(std::optional<std::filesystem::path> const& path) -> MQ::Expected<std::unique_ptr<MQ::IO::FdWriter>> {
    if (!path) {
        return std::make_unique<MQ::IO::FdWriter>(STDOUT_FILENO);
    }
    int fd = ::open(path->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        auto err = errno;
        return std::unexpected(MQ::Error::io(static_cast<std::errc>(err), path->string() + ": " + std::strerror(err)));
    }
    return std::make_unique<MQ::IO::FdWriter>(fd, true);
}

auto build_config(ResolveOptions const& options) -> MQ::Expected<MQ::MetaCache::ResolutionConfig> {
    MQ::MetaCache::ResolutionConfig config;
    if (options.configPath) {
        auto loaded = MQ::MetaCache::loadResolutionConfig(*options.configPath);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (options.dirQuorum) {
        config.dirQuorum = *options.dirQuorum;
    }
    if (options.objQuorum) {
        config.objQuorum = *options.objQuorum;
    }
    if (options.requestedVersions) {
        config.requestedVersions = *options.requestedVersions;
    }
    if (options.bucket) {
        config.bucket = *options.bucket;
    }
    if (options.strict) {
        config.strict = true;
    }
    return config;
}

auto run_resolve(MQ::MetaCache::MetacacheMerger&       merger,
                 MQ::MetaCache::MetacacheWriter&       writer,
                 MQ::MetaCache::ResolutionConfig const& config,
                 ResolveTotals&                         totals) -> MQ::Expected<void> {
    auto params = config.toParams();
    while (true) {
        auto group = merger.next();
        if (!group) {
            return std::unexpected(group.error());
        }
        if (!*group) {
            break;
        }
        ++totals.groups;
        auto resolved = (*group)->resolve(params);
        if (!resolved) {
            ++totals.dropped;
            continue;
        }
        if (auto written = writer.writeObj(*resolved); !written) {
            return written;
        }
        ++totals.resolved;
    }
    return writer.close();
}

} // namespace

int main(int argc, char** argv) {
#ifdef MQ_LOG_DEBUG
    MQ::configure_logging_from_env("metacache_resolve");
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
    if (options->inputs.empty()) {
        std::cerr << "metacache_resolve: at least one input stream is required\n" << cli.usage();
        return EXIT_FAILURE;
    }

    auto config = build_config(*options);
    if (!config) {
        std::cerr << "Config failed: " << MQ::describeError(config.error()) << std::endl;
        return EXIT_FAILURE;
    }

    std::vector<std::unique_ptr<MQ::IO::FdReader>>               sources;
    std::vector<std::unique_ptr<MQ::MetaCache::MetacacheReader>> readers;
    std::vector<MQ::MetaCache::MetacacheReader*>                 borrowed;
    for (auto const& path : options->inputs) {
        auto source = open_input(path);
        if (!source) {
            std::cerr << "Open failed: " << MQ::describeError(source.error()) << std::endl;
            return EXIT_FAILURE;
        }
        sources.push_back(std::move(*source));
        readers.push_back(std::make_unique<MQ::MetaCache::MetacacheReader>(*sources.back()));
        borrowed.push_back(readers.back().get());
    }

    auto sink = open_output(options->outputPath);
    if (!sink) {
        std::cerr << "Open failed: " << MQ::describeError(sink.error()) << std::endl;
        return EXIT_FAILURE;
    }

    MQ::MetaCache::MetacacheMerger merger(std::move(borrowed));
    MQ::MetaCache::MetacacheWriter writer(**sink);
    ResolveTotals                  totals;
    if (auto result = run_resolve(merger, writer, *config, totals); !result) {
        std::cerr << "Resolve failed: " << MQ::describeError(result.error()) << std::endl;
        return EXIT_FAILURE;
    }

    if (!options->quiet) {
        std::cerr << "groups=" << totals.groups << " resolved=" << totals.resolved << " dropped=" << totals.dropped << std::endl;
    }
    return EXIT_SUCCESS;
}
