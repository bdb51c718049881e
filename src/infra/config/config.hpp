#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace hashdup::args_parser {
    struct CLIArgs;
}

namespace hashdup::infra {

struct Config {
    // Pipeline
    std::optional<std::size_t> chunk_size;
    std::optional<std::string> algorithm;   // sha256 | xxh64 | xxh128

    // Acquisition
    bool recursive = false;
    bool follow_symlinks = false;
    bool images_only = false;
    std::vector<std::string> exclude_patterns;

    // Output
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    // Проверка значений: chunk_size > 0, известный алгоритм и уровень логирования
    [[nodiscard]] auto validate() const -> std::expected<void, std::string>;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.hashdup.yaml
///   2. $XDG_CONFIG_HOME/hashdup/config.yaml или ~/.config/hashdup/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает конфигурацию из конкретного файла.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const hashdup::args_parser::CLIArgs& args) -> Config;

} // namespace hashdup::infra
