#pragma once

#include "lru.h"
#include "store.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vista {

/// A cache lookup result. `valid` is false when the recorded result object
/// is missing from the store; such an entry is treated as a miss.
struct CacheEntry {
    std::string result;
    bool        valid = false;
};

/// Persistent memo of (filter id, source commit) -> rewritten commit.
///
/// Entries are staged in memory by put() and persisted by flush() as a
/// bookkeeping commit under `refs/vista/cache/<filter_id>`, whose tree maps
/// each source commit id to a blob holding the result id. Writes use the
/// 2/38 fanout layout; the flat layout is accepted on read. Entries are
/// append-only: mapping an existing key to a different result throws
/// CacheConsistencyViolation. Another RewriteCache over the same repository
/// sees everything flushed. Persisted entries already looked up are kept
/// in a bounded in-memory LRU.
///
/// Thread-safe.
class RewriteCache {
public:
    static constexpr size_t kDefaultMemoryCapacity = 1 << 16;

    explicit RewriteCache(Store store,
                          size_t memory_capacity = kDefaultMemoryCapacity);

    /// The reserved ref holding entries for `filter_id`.
    static std::string ref_name(const std::string& filter_id);

    /// Return the rewritten commit, or nullopt on a miss or invalid entry.
    std::optional<std::string> get(const std::string& filter_id,
                                   const std::string& commit) const;

    /// Return the raw entry including its validity, or nullopt if absent.
    std::optional<CacheEntry> lookup(const std::string& filter_id,
                                     const std::string& commit) const;

    /// Record a mapping. Re-putting the same mapping is a no-op.
    /// @throws CacheConsistencyViolation if `commit` maps elsewhere.
    void put(const std::string& filter_id,
             const std::string& commit,
             const std::string& result);

    /// Persist staged entries, one bookkeeping commit per filter.
    void flush();

    /// Number of staged, not yet flushed entries.
    size_t pending() const;

    /// Source commits known to be rewritten under `filter_id` (sorted).
    std::vector<std::string> frontier(const std::string& filter_id) const;

    /// Number of persisted entries held in memory.
    size_t remembered() const;

private:
    using Table = std::map<std::string, std::string>;

    std::optional<std::string> find(const std::string& filter_id,
                                    const std::string& commit) const;
    std::optional<std::string> find_persisted(const std::string& tree_id,
                                              const std::string& commit) const;
    std::optional<std::string> persisted_tree(const std::string& filter_id) const;
    void iter_persisted(const std::string& tree_id, Table& out) const;
    void flush_filter(const std::string& filter_id, const Table& entries);

    Store store_;
    mutable std::mutex mutex_;
    std::mutex         flush_mutex_;
    std::map<std::string, Table> pending_;     ///< filter id -> staged entries
    /// (filter id, commit) -> result of persisted entries seen
    mutable LruMap<std::pair<std::string, std::string>, std::string> known_;
};

} // namespace vista
