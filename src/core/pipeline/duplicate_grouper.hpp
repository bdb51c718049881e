#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

namespace hashdup::core {

/// Группирует успешно захешированные файлы по хешу.
///
/// Порядок групп определяется первым появлением хеша, порядок файлов внутри
/// группы совпадает с порядком входа. finalize() возвращает только хеши с двумя
/// и более файлами; идентификаторы "group-N" назначаются там же.
class DuplicateGrouper {
public:
    void add(HashedFile file);

    [[nodiscard]] auto finalize() const -> std::vector<DuplicateGroup>;

    [[nodiscard]] auto file_count() const -> std::size_t { return file_count_; }

    // Хеши, встреченные ровно один раз
    [[nodiscard]] auto unique_count() const -> std::size_t;

private:
    std::unordered_map<std::string, std::size_t> index_; // hash -> позиция в buckets_
    std::vector<std::vector<HashedFile>> buckets_;
    std::size_t file_count_ = 0;
};

[[nodiscard]] auto summarize(const std::vector<DuplicateGroup>& groups) -> GroupSummary;

} // namespace hashdup::core
