#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace shootsync::args_parser {
    struct CLIArgs
{
    std::string source;                         // -s, --source (точка монтирования карты)
    std::string name;                           // -n, --name (название съёмки)
    std::optional<std::string> config_path;     // -c, --config
    std::optional<std::uint32_t> workers;       // -w, --workers=N
    std::optional<std::uint32_t> queue_capacity;// --queue-capacity=K
    std::optional<std::uint32_t> timeout_seconds; // --timeout=SECONDS
    std::vector<std::string> only;              // --only NAME (повторяемый)
    std::optional<std::string> log_dir;         // --log-dir
    bool progress{false};                       // --progress
    bool verbose{false};                        // -v, --verbose
    bool quiet{false};                          // -q, --quiet
    bool version{false};                        // --version
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns nullopt after printing help or a usage error; `exit_code` receives
/// the code the process should terminate with in that case.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace shootsync::args_parser
