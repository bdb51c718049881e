#include "digest_engine.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <fmt/core.h>
#include <openssl/evp.h>
#include <xxhash.h>

namespace hashdup::infra {

namespace {

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct XXH64StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

struct XXH3StateDeleter {
    void operator()(XXH3_state_t* state) const { XXH3_freeState(state); }
};

// Подаёт буфер блоками, как при потоковом чтении файла.
// false, если до конца не дошли из-за запроса остановки.
template<typename F>
bool for_each_block(std::span<const std::uint8_t> content, std::size_t block,
                    const std::stop_token& stop, F&& f) {
    for (std::size_t offset = 0; offset < content.size(); offset += block) {
        if (stop.stop_requested()) {
            return false;
        }
        f(content.subspan(offset, std::min(block, content.size() - offset)));
    }
    return true;
}

auto cancelled() -> Error {
    return make_error(ErrorCode::Cancelled, "Hashing cancelled");
}

} // namespace

std::string_view to_string(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Sha256: return "sha256";
        case DigestAlgorithm::XXH64:  return "xxh64";
        case DigestAlgorithm::XXH128: return "xxh128";
    }
    return "sha256";
}

auto parse_digest_algorithm(std::string_view name) -> Result<DigestAlgorithm> {
    if (name == "sha256") return DigestAlgorithm::Sha256;
    if (name == "xxh64")  return DigestAlgorithm::XXH64;
    if (name == "xxh128") return DigestAlgorithm::XXH128;
    return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                                      fmt::format("Unknown digest algorithm: '{}'", name)));
}

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

DigestEngine::DigestEngine(DigestAlgorithm algorithm)
    : algorithm_(algorithm) {}

auto DigestEngine::hex_length() const -> std::size_t {
    switch (algorithm_) {
        case DigestAlgorithm::Sha256: return 64;
        case DigestAlgorithm::XXH64:  return 16;
        case DigestAlgorithm::XXH128: return 32;
    }
    return 0;
}

auto DigestEngine::hash(const std::optional<Bytes>& content, std::stop_token stop) const
    -> Result<std::string>
{
    if (!content) {
        return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                          "Failed to hash file: content buffer is unavailable"));
    }
    return hash(std::span<const std::uint8_t>(*content), std::move(stop));
}

auto DigestEngine::hash(std::span<const std::uint8_t> content, std::stop_token stop) const
    -> Result<std::string>
{
    switch (algorithm_) {
        case DigestAlgorithm::Sha256: return hash_sha256(content, stop);
        case DigestAlgorithm::XXH64:  return hash_xxh64(content, stop);
        case DigestAlgorithm::XXH128: return hash_xxh128(content, stop);
    }
    return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                      "Failed to hash file: unsupported algorithm"));
}

auto DigestEngine::hash_sha256(std::span<const std::uint8_t> content, const std::stop_token& stop)
    -> Result<std::string>
{
    const EVP_MD* md = EVP_get_digestbyname("sha256");
    if (md == nullptr) {
        return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                          "Failed to hash file: sha256 is not available"));
    }

    std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                          "Failed to hash file: cannot initialise digest context"));
    }

    bool ok = true;
    const bool finished = for_each_block(content, BUFFER_SIZE, stop, [&](std::span<const std::uint8_t> block) {
        if (ok && EVP_DigestUpdate(ctx.get(), block.data(), block.size()) != 1) {
            ok = false;
        }
    });
    if (!finished) {
        return std::unexpected(cancelled());
    }
    if (!ok) {
        return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                          "Failed to hash file: digest update failed"));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                          "Failed to hash file: digest finalisation failed"));
    }

    return to_hex(std::span<const std::uint8_t>(digest, digest_len));
}

auto DigestEngine::hash_xxh64(std::span<const std::uint8_t> content, const std::stop_token& stop)
    -> Result<std::string>
{
    std::unique_ptr<XXH64_state_t, XXH64StateDeleter> state(XXH64_createState());
    if (!state) {
        return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                          "Failed to create XXH64 state"));
    }

    XXH64_reset(state.get(), 0); // seed = 0
    if (!for_each_block(content, BUFFER_SIZE, stop, [&](std::span<const std::uint8_t> block) {
            XXH64_update(state.get(), block.data(), block.size());
        })) {
        return std::unexpected(cancelled());
    }

    XXH64_canonical_t canonical;
    XXH64_canonicalFromHash(&canonical, XXH64_digest(state.get()));
    return to_hex(std::span<const std::uint8_t>(canonical.digest, sizeof(canonical.digest)));
}

auto DigestEngine::hash_xxh128(std::span<const std::uint8_t> content, const std::stop_token& stop)
    -> Result<std::string>
{
    std::unique_ptr<XXH3_state_t, XXH3StateDeleter> state(XXH3_createState());
    if (!state || XXH3_128bits_reset(state.get()) == XXH_ERROR) {
        return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                          "Failed to create XXH3 state"));
    }

    bool ok = true;
    const bool finished = for_each_block(content, BUFFER_SIZE, stop, [&](std::span<const std::uint8_t> block) {
        if (ok && XXH3_128bits_update(state.get(), block.data(), block.size()) == XXH_ERROR) {
            ok = false;
        }
    });
    if (!finished) {
        return std::unexpected(cancelled());
    }
    if (!ok) {
        return std::unexpected(make_error(ErrorCode::HashComputationFailed,
                                          "Failed to hash file: XXH3 update failed"));
    }

    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, XXH3_128bits_digest(state.get()));
    return to_hex(std::span<const std::uint8_t>(canonical.digest, sizeof(canonical.digest)));
}

} // namespace hashdup::infra
