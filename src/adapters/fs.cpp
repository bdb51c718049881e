#include "fs.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <optional>
#include <regex>
#include <set>
#include <system_error>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <liburing.h>
#endif

namespace hashdup::adapters::fs {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 16> MIME_TYPES{{
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png",  "image/png"},
    {".gif",  "image/gif"},
    {".bmp",  "image/bmp"},
    {".webp", "image/webp"},
    {".tif",  "image/tiff"},
    {".tiff", "image/tiff"},
    {".svg",  "image/svg+xml"},
    {".txt",  "text/plain"},
    {".pdf",  "application/pdf"},
    {".zip",  "application/zip"},
    {".mp3",  "audio/mpeg"},
    {".mp4",  "video/mp4"},
    {".json", "application/json"},
    {".html", "text/html"},
}};

constexpr std::uintmax_t MMAP_THRESHOLD = 1024 * 1024;          // 1 MB
constexpr std::uintmax_t URING_THRESHOLD = 100 * 1024 * 1024;   // 100 MB
constexpr unsigned RING_SIZE = 8;
constexpr std::size_t URING_CHUNK_SIZE = 4 * 1024 * 1024;      // 4 MB

auto open_error(const std::filesystem::path& path, int err) -> infra::Error {
    if (err == EACCES || err == EPERM) {
        return infra::make_error(infra::ErrorCode::PermissionDenied,
                                 fmt::format("Permission denied: {}", path.string()));
    }
    return infra::make_error(infra::ErrorCode::FileNotFound,
                             fmt::format("Cannot open file: {}", path.string()));
}

auto compile_patterns(const std::vector<std::string>& patterns) -> std::vector<std::regex> {
    std::vector<std::regex> compiled;
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            spdlog::warn("Invalid exclude pattern '{}': {}", pattern, e.what());
        }
    }
    return compiled;
}

bool should_exclude(const std::filesystem::path& path, const std::vector<std::regex>& patterns) {
    const auto name = path.filename().string();
    return std::any_of(patterns.begin(), patterns.end(),
        [&](const std::regex& re) { return std::regex_match(name, re); });
}

class Collector {
public:
    Collector(const ScanOptions& options, std::vector<std::filesystem::path>& out)
        : options_(options), patterns_(compile_patterns(options.exclude_patterns)), out_(out) {}

    void visit(const std::filesystem::path& path, bool is_root) {
        if (!is_root && should_exclude(path, patterns_)) {
            spdlog::debug("Excluded: {}", path.string());
            return;
        }

        std::error_code ec;
        const auto status = options_.follow_symlinks ? std::filesystem::status(path, ec)
                                                     : std::filesystem::symlink_status(path, ec);
        if (ec) {
            spdlog::warn("Cannot stat {}: {}", path.string(), ec.message());
            return;
        }

        if (std::filesystem::is_regular_file(status) || std::filesystem::is_directory(status)) {
            // Один физический объект (симлинк, жёсткая ссылка, цикл) посещается один раз
            if (!first_visit_(path)) {
                spdlog::debug("Already visited: {}", path.string());
                return;
            }
        }

        if (std::filesystem::is_regular_file(status)) {
            if (options_.images_only && !is_supported_image(guess_mime_type(path))) {
                return;
            }
            out_.push_back(path);
        } else if (std::filesystem::is_directory(status)) {
            if (is_root || options_.recursive) {
                visit_directory(path);
            }
        } else {
            spdlog::debug("Skipping non-file: {}", path.string());
        }
    }

private:
    void visit_directory(const std::filesystem::path& dir) {
        std::error_code ec;
        std::vector<std::filesystem::path> entries;
        for (std::filesystem::directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            spdlog::warn("Cannot list {}: {}", dir.string(), ec.message());
        }

        // Стабильный порядок, не зависящий от файловой системы
        std::sort(entries.begin(), entries.end());
        for (const auto& entry : entries) {
            visit(entry, false);
        }
    }

    bool first_visit_(const std::filesystem::path& path) {
        struct stat sb;
        const int rc = options_.follow_symlinks ? ::stat(path.c_str(), &sb) : ::lstat(path.c_str(), &sb);
        if (rc != 0) {
            return true; // идентичность неизвестна, ошибку сообщит чтение
        }
        return visited_.emplace(sb.st_dev, sb.st_ino).second;
    }

    const ScanOptions& options_;
    std::vector<std::regex> patterns_;
    std::vector<std::filesystem::path>& out_;
    std::set<std::pair<dev_t, ino_t>> visited_;
};

} // namespace

auto guess_mime_type(const std::filesystem::path& path) -> std::string {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [suffix, mime] : MIME_TYPES) {
        if (ext == suffix) {
            return std::string(mime);
        }
    }
    return "application/octet-stream";
}

auto is_supported_image(std::string_view mime_type) -> bool {
    return mime_type == "image/jpeg" || mime_type == "image/png" || mime_type == "image/gif"
        || mime_type == "image/bmp" || mime_type == "image/webp";
}

auto collect_files(const std::vector<std::filesystem::path>& roots,
                   const ScanOptions& options)
    -> std::expected<std::vector<std::filesystem::path>, infra::Error>
{
    std::vector<std::filesystem::path> files;
    Collector collector(options, files);

    for (const auto& root : roots) {
        std::error_code ec;
        if (!std::filesystem::exists(root, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                                   fmt::format("Path does not exist: {}", root.string())));
        }
        collector.visit(root, true);
    }
    return files;
}

auto select_read_strategy(std::uintmax_t file_size) -> ReadStrategy {
    if (file_size < MMAP_THRESHOLD) {
        return ReadStrategy::Buffered;
    }
#ifdef __linux__
    if (file_size >= URING_THRESHOLD) {
        return ReadStrategy::Uring;
    }
#endif
    return ReadStrategy::MMap;
}

auto read_file_buffered(const std::filesystem::path& path)
    -> std::expected<infra::Bytes, infra::Error>
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return std::unexpected(open_error(path, errno));
    }

    infra::Bytes content;
    constexpr std::size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);
    while (ifs.read(buffer.data(), buffer_size) || ifs.gcount() > 0) {
        content.insert(content.end(), buffer.begin(), buffer.begin() + ifs.gcount());
    }

    if (ifs.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                               fmt::format("Error reading file: {}", path.string())));
    }
    return content;
}

auto read_file_mmap(const std::filesystem::path& path)
    -> std::expected<infra::Bytes, infra::Error>
{
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return std::unexpected(open_error(path, errno));
    }

    struct stat sb;
    if (fstat(fd, &sb) < 0) {
        ::close(fd);
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                               fmt::format("fstat failed: {}", path.string())));
    }
    if (sb.st_size == 0) {
        ::close(fd);
        return infra::Bytes{};
    }

    void* addr = mmap(nullptr, static_cast<std::size_t>(sb.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    ::close(fd);
    if (addr == MAP_FAILED) {
        spdlog::debug("mmap failed for {}, falling back to buffered read", path.string());
        return read_file_buffered(path);
    }

    madvise(addr, static_cast<std::size_t>(sb.st_size), MADV_SEQUENTIAL);
    const auto* begin = static_cast<const std::uint8_t*>(addr);
    infra::Bytes content(begin, begin + sb.st_size);
    munmap(addr, static_cast<std::size_t>(sb.st_size));
    return content;
}

#ifdef __linux__
static auto read_file_uring(const std::filesystem::path& path)
    -> std::expected<infra::Bytes, infra::Error>
{
    io_uring ring;
    if (io_uring_queue_init(RING_SIZE, &ring, 0) < 0) {
        return read_file_mmap(path); // fallback
    }

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        const int err = errno;
        io_uring_queue_exit(&ring);
        return std::unexpected(open_error(path, err));
    }

    struct stat sb;
    if (fstat(fd, &sb) < 0) {
        ::close(fd);
        io_uring_queue_exit(&ring);
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                               fmt::format("fstat failed: {}", path.string())));
    }

    infra::Bytes content(static_cast<std::size_t>(sb.st_size));
    std::size_t offset = 0;
    std::optional<infra::Error> failure;

    while (offset < content.size()) {
        const auto to_read = static_cast<unsigned>(std::min(content.size() - offset, URING_CHUNK_SIZE));

        io_uring_sqe* sqe = io_uring_get_sqe(&ring);
        io_uring_prep_read(sqe, fd, content.data() + offset, to_read, offset);

        io_uring_cqe* cqe = nullptr;
        if (io_uring_submit(&ring) < 0 || io_uring_wait_cqe(&ring, &cqe) < 0) {
            failure = infra::make_error(infra::ErrorCode::Unknown,
                                        fmt::format("io_uring read failed: {}", path.string()));
            break;
        }

        const int res = cqe->res;
        io_uring_cqe_seen(&ring, cqe);
        if (res < 0) {
            failure = infra::make_error(res == -EACCES ? infra::ErrorCode::PermissionDenied
                                                       : infra::ErrorCode::Unknown,
                fmt::format("Error reading file {}: {}", path.string(), std::generic_category().message(-res)));
            break;
        }
        if (res == 0) {
            content.resize(offset); // файл укоротился во время чтения
            break;
        }
        offset += static_cast<std::size_t>(res);
    }

    ::close(fd);
    io_uring_queue_exit(&ring);
    if (failure) {
        return std::unexpected(std::move(*failure));
    }
    return content;
}
#endif

auto read_file(const std::filesystem::path& path)
    -> std::expected<infra::Bytes, infra::Error>
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(open_error(path, ec.value()));
    }

    switch (select_read_strategy(size)) {
#ifdef __linux__
        case ReadStrategy::Uring:
            return read_file_uring(path);
#endif
        case ReadStrategy::MMap:
            return read_file_mmap(path);
        case ReadStrategy::Buffered:
        default:
            return read_file_buffered(path);
    }
}

auto load_candidate(const std::filesystem::path& path) -> core::CandidateFile {
    core::CandidateFile file;
    file.path = path.string();
    file.name = path.filename().string();
    file.mime_type = guess_mime_type(path);

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
        file.size = size;
    }

    auto content = read_file(path);
    if (content) {
        file.size = content->size();
        file.content = std::move(*content);
    } else {
        spdlog::warn("Error reading file {}: {}", file.name, content.error().message);
        file.content_error = content.error().message;
    }
    return file;
}

auto load_candidates(const std::vector<std::filesystem::path>& paths)
    -> std::vector<core::CandidateFile>
{
    std::vector<core::CandidateFile> files;
    files.reserve(paths.size());
    for (const auto& path : paths) {
        files.push_back(load_candidate(path));
    }
    return files;
}

} // namespace hashdup::adapters::fs
