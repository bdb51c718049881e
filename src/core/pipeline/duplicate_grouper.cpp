#include "duplicate_grouper.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace hashdup::core {

void DuplicateGrouper::add(HashedFile file) {
    auto [it, inserted] = index_.try_emplace(file.hash, buckets_.size());
    if (inserted) {
        buckets_.emplace_back();
    }
    buckets_[it->second].push_back(std::move(file));
    ++file_count_;
}

auto DuplicateGrouper::finalize() const -> std::vector<DuplicateGroup> {
    std::vector<DuplicateGroup> groups;
    std::size_t group_id = 0;

    for (const auto& bucket : buckets_) {
        if (bucket.size() < 2) continue;

        groups.push_back(DuplicateGroup{
            .id = fmt::format("group-{}", group_id++),
            .hash = bucket.front().hash,
            .size = bucket.front().size,
            .files = bucket
        });
    }
    return groups;
}

auto DuplicateGrouper::unique_count() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(buckets_.begin(), buckets_.end(),
        [](const auto& bucket) { return bucket.size() == 1; }));
}

auto summarize(const std::vector<DuplicateGroup>& groups) -> GroupSummary {
    GroupSummary summary{};
    summary.group_count = groups.size();
    for (const auto& group : groups) {
        const auto extra = group.files.size() - 1;
        summary.duplicate_file_count += extra;
        summary.wasted_bytes += extra * group.size;
    }
    return summary;
}

} // namespace hashdup::core
