#pragma once

#include "filter.h"
#include "lru.h"
#include "store.h"

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace vista {

/// Applies filters to single trees.
///
/// All results are written to the store; blobs are relocated but never
/// read. Results of apply() are memoized per (filter, tree) in a bounded
/// LRU. Safe to share between threads.
class TreeRewriter {
public:
    static constexpr size_t kDefaultMemoCapacity = 1 << 16;

    explicit TreeRewriter(Store store,
                          size_t memo_capacity = kDefaultMemoCapacity);

    /// Return the id of `filter` applied to `tree_id`. Absent paths yield
    /// the empty tree; this never fails on a well-formed tree.
    std::string apply(const Filter& filter, const std::string& tree_id);

    /// Inverse tree mapping: place `filtered_tree` back into `base_tree`
    /// at the locations `filter` reads from. Paths outside the filter's
    /// reach are taken from `base_tree`.
    std::string unapply(const Filter& filter,
                        const std::string& filtered_tree,
                        const std::string& base_tree);

    /// Source paths that can produce the view path `path`. An empty result
    /// means the path is unreachable, more than one means it is ambiguous.
    std::vector<std::string> map_back(const Filter& filter,
                                      const std::string& path) const;

    /// Leaf-level changes turning `from` into `to`. Removals carry no oid.
    std::vector<TreeChange> diff(const std::string& from,
                                 const std::string& to) const;

    /// Number of apply() results served from the memo.
    uint64_t memo_hits() const;

    /// Number of apply() results currently memoized.
    size_t memo_size() const;

private:
    std::string apply_node(const Filter& filter, const std::string& tree_id);

    std::string wrap(const std::string& prefix, const std::string& tree_id);
    std::string select_file(const std::string& path, const std::string& tree_id);
    std::string overlay(const std::string& lower, const std::string& upper);
    /// Keep the leaves of `tree_id` (at `dir`) for which `keep` holds.
    std::string select_leaves(const std::string& tree_id,
                              const std::string& dir,
                              const std::function<bool(const std::string&)>& keep);
    std::string replace_at(const std::string& base_tree,
                           const std::string& path,
                           const std::string& tree_id);

    std::vector<std::pair<std::string, TreeEntry>>
    leaves(const std::string& tree_id, const std::string& dir = {}) const;

    /// True if `filter` reads the source path `path`.
    bool reads(const Filter& filter, const std::string& path) const;

    /// View paths `filter` maps the source path `path` to.
    std::vector<std::string> forward(const Filter& filter,
                                     const std::string& path) const;

    Store store_;
    mutable std::mutex memo_mutex_;
    LruMap<std::pair<std::string, std::string>, std::string> memo_;
    uint64_t memo_hits_ = 0;
};

} // namespace vista
