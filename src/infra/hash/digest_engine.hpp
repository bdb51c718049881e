#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "../error_handler/error.hpp"

namespace hashdup::infra {

using Bytes = std::vector<std::uint8_t>;

enum class DigestAlgorithm {
    Sha256,  // OpenSSL EVP
    XXH64,   // xxHash64, seed = 0
    XXH128,  // XXH3 128-bit
};

[[nodiscard]] auto to_string(DigestAlgorithm algorithm) -> std::string_view;

/// Разбирает имя алгоритма ("sha256", "xxh64", "xxh128").
[[nodiscard]] auto parse_digest_algorithm(std::string_view name)
    -> Result<DigestAlgorithm>;

/// Lowercase hex of raw digest bytes.
[[nodiscard]] auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;

/// Детерминированный хеш всего содержимого файла.
/// Ошибки возвращаются как ErrorCode::HashComputationFailed, исключения не бросаются.
class DigestEngine {
public:
    explicit DigestEngine(DigestAlgorithm algorithm = DigestAlgorithm::Sha256);

    // stop проверяется перед каждым блоком; остановка -> ErrorCode::Cancelled
    [[nodiscard]] auto hash(std::span<const std::uint8_t> content, std::stop_token stop = {}) const
        -> Result<std::string>;

    [[nodiscard]] auto hash(const Bytes& content, std::stop_token stop = {}) const -> Result<std::string> {
        return hash(std::span<const std::uint8_t>(content), std::move(stop));
    }

    // nullopt = содержимое не удалось получить
    [[nodiscard]] auto hash(const std::optional<Bytes>& content, std::stop_token stop = {}) const
        -> Result<std::string>;

    [[nodiscard]] auto algorithm() const -> DigestAlgorithm { return algorithm_; }

    // Длина hex-строки для текущего алгоритма
    [[nodiscard]] auto hex_length() const -> std::size_t;

private:
    static auto hash_sha256(std::span<const std::uint8_t> content, const std::stop_token& stop)
        -> Result<std::string>;
    static auto hash_xxh64(std::span<const std::uint8_t> content, const std::stop_token& stop)
        -> Result<std::string>;
    static auto hash_xxh128(std::span<const std::uint8_t> content, const std::stop_token& stop)
        -> Result<std::string>;

    static constexpr std::size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB block

    DigestAlgorithm algorithm_;
};

} // namespace hashdup::infra
