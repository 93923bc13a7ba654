#pragma once

#include "cache.h"
#include "filter.h"
#include "store.h"
#include "tree_rewriter.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace vista {

/// Counters accumulated by a HistoryRewriter.
struct HistoryStats {
    uint64_t traversals      = 0; ///< rewrite() calls that missed the cache at the tip.
    uint64_t cache_hits      = 0; ///< Nodes resolved from the cache.
    uint64_t commits_written = 0; ///< New commits created.
    uint64_t commits_elided  = 0; ///< Nodes rewritten to their parent.
};

/// Rewrites commit graphs under a filter.
///
/// The traversal is post-order over the DAG with an explicit work-list, so
/// long linear histories do not recurse. Every rewritten node is recorded
/// in the cache, which is flushed before rewrite() returns.
///
/// Merges whose rewritten parents are redundant (equal, one an ancestor of
/// another, or a parentless empty-tree root beside a real parent) collapse
/// to the remaining parent. A commit whose filtered
/// tree equals its only rewritten parent's tree is elided.
///
/// Thread-safe; concurrent rewrites share the tree memo and the cache.
class HistoryRewriter {
public:
    HistoryRewriter(Store store, RewriteCache& cache,
                    size_t memo_capacity = TreeRewriter::kDefaultMemoCapacity);

    /// Rewrite `commit` and its ancestry under `filter` (normalized).
    /// @return the id of the rewritten tip.
    std::string rewrite(const Filter& filter, const std::string& commit);

    HistoryStats stats() const;

    TreeRewriter& trees() { return trees_; }

private:
    bool is_empty_root(const std::string& commit) const;

    std::string rewrite_squashed(const Filter& filter,
                                 const std::string& filter_id,
                                 const std::string& commit);

    Store         store_;
    RewriteCache& cache_;
    TreeRewriter  trees_;

    std::atomic<uint64_t> traversals_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> commits_written_{0};
    std::atomic<uint64_t> commits_elided_{0};
};

} // namespace vista
