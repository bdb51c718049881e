#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <git_info.hpp>

namespace hashdup::args_parser {

namespace {
int g_exit_code = 0;
} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    CLI::App app{"hashdup - find duplicate files by content hash"};
    app.set_version_flag("--version", std::string(build_info::version));

    app.add_option("paths", args.paths, "Files or directories to scan")
        ->required()
        ->check(CLI::ExistingPath);

    app.add_flag("-r,--recursive", args.recursive, "Descend into subdirectories");
    app.add_flag("--follow-symlinks", args.follow_symlinks, "Follow symbolic links");
    app.add_flag("--images-only", args.images_only, "Only consider image/* files");
    app.add_option("--exclude", args.exclude_patterns, "Skip files whose name matches REGEX")
        ->type_name("REGEX");

    app.add_option("--chunk-size", args.chunk_size, "Files hashed between yields (default 50)")
        ->check(CLI::PositiveNumber);
    app.add_option("--algorithm", args.algorithm, "Digest algorithm")
        ->check(CLI::IsMember({"sha256", "xxh64", "xxh128"}));
    app.add_option("-c,--config", args.config_path, "Explicit config file")
        ->check(CLI::ExistingFile);
    app.add_option("--format", args.format, "Output format")
        ->check(CLI::IsMember({"text", "yaml"}))
        ->capture_default_str();

    app.add_flag("--progress,!--no-progress", args.progress, "Render a progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only print results");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        g_exit_code = app.exit(e);
        return std::nullopt;
    }

    g_exit_code = 0;
    return args;
}

int last_parse_exit_code()
{
    return g_exit_code;
}

} // namespace hashdup::args_parser
