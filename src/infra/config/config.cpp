#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>

#include "config.hpp"
#include "../hash/digest_engine.hpp"
#include "../logging/logging.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace hashdup::infra {

    void Config::merge_with(const Config& other) {
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.algorithm) algorithm = other.algorithm;
        if (other.recursive) recursive = true;
        if (other.follow_symlinks) follow_symlinks = true;
        if (other.images_only) images_only = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.log_level) log_level = other.log_level;

        if (!other.exclude_patterns.empty()) exclude_patterns = other.exclude_patterns;
    }

    auto Config::validate() const -> std::expected<void, std::string> {
        if (chunk_size && *chunk_size == 0) {
            return std::unexpected(std::string("chunk_size must be greater than zero"));
        }
        if (algorithm) {
            if (auto parsed = parse_digest_algorithm(*algorithm); !parsed) {
                return std::unexpected(parsed.error().message);
            }
        }
        if (log_level) {
            if (auto parsed = parse_log_level(*log_level); !parsed) {
                return std::unexpected(parsed.error().message);
            }
        }
        return {};
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".hashdup.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "hashdup" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "hashdup" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["chunk_size"]) cfg.chunk_size = config["chunk_size"].as<std::size_t>();
            if (config["algorithm"]) cfg.algorithm = config["algorithm"].as<std::string>();

            if (config["recursive"]) cfg.recursive = config["recursive"].as<bool>();
            if (config["follow_symlinks"]) cfg.follow_symlinks = config["follow_symlinks"].as<bool>();
            if (config["images_only"]) cfg.images_only = config["images_only"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (config["exclude"]) {
                for (const auto& pat : config["exclude"]) {
                    cfg.exclude_patterns.push_back(pat.as<std::string>());
                }
            }

            if (auto valid = cfg.validate(); !valid) {
                return std::unexpected(fmt::format("Invalid config {}: {}", path.string(), valid.error()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config(path);
        }

        // Файл не найден — возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    auto config_from_cli(const hashdup::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.chunk_size = args.chunk_size;
        cfg.algorithm = args.algorithm;
        cfg.recursive = args.recursive;
        cfg.follow_symlinks = args.follow_symlinks;
        cfg.images_only = args.images_only;
        cfg.exclude_patterns = args.exclude_patterns;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

} // namespace hashdup::infra
