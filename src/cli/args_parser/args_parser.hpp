#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace hashdup::args_parser {

struct CLIArgs
{
    std::vector<std::string> paths;               // позиционные аргументы
    bool recursive{false};                        // -r, --recursive
    bool follow_symlinks{false};                  // --follow-symlinks
    bool images_only{false};                      // --images-only
    std::vector<std::string> exclude_patterns;    // --exclude REGEX
    std::optional<std::size_t> chunk_size;        // --chunk-size=N
    std::optional<std::string> algorithm;         // --algorithm=sha256|xxh64|xxh128
    std::optional<std::string> config_path;       // -c, --config
    std::string format{"text"};                   // --format=text|yaml
    bool progress{true};                          // --progress / --no-progress
    bool quiet{false};                            // -q, --quiet
    bool verbose{false};                          // -v, --verbose
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// nullopt: --help/--version или ошибка разбора (сообщение уже выведено).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

/// Код выхода для случая, когда parse_args вернул nullopt.
int last_parse_exit_code();

} // namespace hashdup::args_parser
