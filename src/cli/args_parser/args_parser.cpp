#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace shootsync::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    CLI::App app{"shootsync - copy a photoshoot to every configured share, organized by date"};
    // --version обрабатываем сами, чтобы вывести git-метаданные
    app.add_flag("--version", args.version, "Print build information and exit");

    app.add_option("-s,--source", args.source, "Card mount point (source directory)");
    app.add_option("-n,--name", args.name, "Photoshoot name; the folder becomes '<year> - <name>'");
    app.add_option("-c,--config", args.config_path, "Path to destinations YAML file");
    app.add_option("-w,--workers", args.workers, "Number of parallel transfer workers")
        ->check(CLI::PositiveNumber);
    app.add_option("--queue-capacity", args.queue_capacity, "Pending jobs buffered ahead of the workers")
        ->check(CLI::PositiveNumber);
    app.add_option("--timeout", args.timeout_seconds, "Connection timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--only", args.only, "Copy only to the named destination (repeatable)");
    app.add_option("--log-dir", args.log_dir, "Directory for log files");
    app.add_flag("--progress", args.progress, "Show a progress line");
    auto* verbose = app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("-q,--quiet", args.quiet, "Only warnings and errors")->excludes(verbose);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    if (args.version) {
        exit_code = 0;
        return args;
    }

    if (args.source.empty() || args.name.empty()) {
        exit_code = app.exit(CLI::ValidationError("--source/--name", "both options are required"));
        return std::nullopt;
    }

    exit_code = 0;
    return args;
}

} // namespace shootsync::args_parser
