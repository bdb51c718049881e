#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"
#include "infra/hash/digest_engine.hpp"
#include "core/pipeline/types.hpp"

namespace hashdup::adapters::fs {

struct ScanOptions {
    bool recursive = false;
    bool follow_symlinks = false;
    bool images_only = false;
    std::vector<std::string> exclude_patterns; // regex по имени файла
};

/// MIME-тип по расширению; неизвестное -> application/octet-stream
[[nodiscard]] auto guess_mime_type(const std::filesystem::path& path) -> std::string;

// image/jpeg, image/png, image/gif, image/bmp, image/webp
[[nodiscard]] auto is_supported_image(std::string_view mime_type) -> bool;

/// Обходит корни и возвращает обычные файлы в порядке обхода (внутри каталога по имени).
/// Каждый файл и каталог (по устройству и inode) попадает в обход не более одного раза.
/// Ошибки доступа к отдельным каталогам пропускаются с предупреждением.
[[nodiscard]] auto collect_files(const std::vector<std::filesystem::path>& roots,
                                 const ScanOptions& options)
    -> std::expected<std::vector<std::filesystem::path>, infra::Error>;

// Стратегия чтения по размеру файла
enum class ReadStrategy {
    Buffered,   // < 1 MB
    MMap,       // 1 MB – 100 MB
    Uring       // > 100 MB (Linux, liburing)
};

[[nodiscard]] auto select_read_strategy(std::uintmax_t file_size) -> ReadStrategy;

[[nodiscard]] auto read_file_buffered(const std::filesystem::path& path)
    -> std::expected<infra::Bytes, infra::Error>;
[[nodiscard]] auto read_file_mmap(const std::filesystem::path& path)
    -> std::expected<infra::Bytes, infra::Error>;

// Содержимое целиком, стратегия выбирается через select_read_strategy
[[nodiscard]] auto read_file(const std::filesystem::path& path)
    -> std::expected<infra::Bytes, infra::Error>;

/// Загружает файл целиком; ошибка чтения не прерывает загрузку,
/// а оставляет content пустым с причиной в content_error.
[[nodiscard]] auto load_candidate(const std::filesystem::path& path) -> core::CandidateFile;

[[nodiscard]] auto load_candidates(const std::vector<std::filesystem::path>& paths)
    -> std::vector<core::CandidateFile>;

} // namespace hashdup::adapters::fs
