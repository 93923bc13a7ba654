#include "vista/cache.h"
#include "vista/logging.h"
#include "internal.h"

#include <chrono>
#include <string>
#include <vector>

namespace vista {

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

namespace {

constexpr int kMaxFlushAttempts = 8;

bool is_hex40(const std::string& s) {
    if (s.size() != 40) return false;
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
            return false;
    }
    return true;
}

/// "ab/cdef..." for commit "abcdef...".
std::string fanout_path(const std::string& commit) {
    return commit.substr(0, 2) + "/" + commit.substr(2);
}

void validate_hash(const std::string& hash) {
    if (!is_hex40(hash))
        throw InvalidHashError(hash);
}

[[noreturn]] void violation(const std::string& filter_id,
                            const std::string& commit,
                            const std::string& existing,
                            const std::string& attempted) {
    std::string key = filter_id + "/" + commit;
    Logger::Log(LogLevel::Error,
                "cache consistency violation for {}: have {}, refusing {}",
                key, existing, attempted);
    throw CacheConsistencyViolation(key, existing, attempted);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RewriteCache
// ---------------------------------------------------------------------------

RewriteCache::RewriteCache(Store store, size_t memory_capacity)
    : store_(std::move(store)), known_(memory_capacity) {}

std::string RewriteCache::ref_name(const std::string& filter_id) {
    return "refs/vista/cache/" + filter_id;
}

std::optional<std::string>
RewriteCache::persisted_tree(const std::string& filter_id) const {
    auto tip = store_.read_ref(ref_name(filter_id));
    if (!tip) return std::nullopt;
    return store_.read_commit(*tip).tree;
}

std::optional<std::string>
RewriteCache::find_persisted(const std::string& tree_id,
                             const std::string& commit) const {
    auto e = store_.lookup(tree_id, fanout_path(commit));
    if (!e || e->is_tree()) e = store_.lookup(tree_id, commit);
    if (!e || e->is_tree()) return std::nullopt;

    auto bytes = store_.read_blob(e->oid);
    return std::string(bytes.begin(), bytes.end());
}

void RewriteCache::iter_persisted(const std::string& tree_id, Table& out) const {
    for (auto& entry : store_.list_tree(tree_id)) {
        if (entry.is_tree() && entry.name.size() == 2) {
            for (auto& sub : store_.list_tree(entry.oid)) {
                std::string full = entry.name + sub.name;
                if (!is_hex40(full) || sub.is_tree()) continue;
                auto bytes = store_.read_blob(sub.oid);
                out.emplace(full, std::string(bytes.begin(), bytes.end()));
            }
        } else if (is_hex40(entry.name) && !entry.is_tree()) {
            auto bytes = store_.read_blob(entry.oid);
            out.emplace(entry.name, std::string(bytes.begin(), bytes.end()));
        }
    }
}

std::optional<std::string> RewriteCache::find(const std::string& filter_id,
                                              const std::string& commit) const {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto t = pending_.find(filter_id);
        if (t != pending_.end()) {
            auto it = t->second.find(commit);
            if (it != t->second.end()) return it->second;
        }
        if (auto* hit = known_.find({filter_id, commit})) return *hit;
    }

    auto tree = persisted_tree(filter_id);
    if (!tree) return std::nullopt;
    auto result = find_persisted(*tree, commit);
    if (!result) return std::nullopt;

    std::lock_guard<std::mutex> lk(mutex_);
    known_.insert({filter_id, commit}, *result);
    return result;
}

std::optional<CacheEntry> RewriteCache::lookup(const std::string& filter_id,
                                               const std::string& commit) const {
    validate_hash(commit);
    auto result = find(filter_id, commit);
    if (!result) return std::nullopt;

    CacheEntry entry;
    entry.result = *result;
    entry.valid  = is_hex40(*result) && store_.has_object(*result);
    return entry;
}

std::optional<std::string> RewriteCache::get(const std::string& filter_id,
                                             const std::string& commit) const {
    auto entry = lookup(filter_id, commit);
    if (!entry) return std::nullopt;
    if (!entry->valid) {
        Logger::Log(LogLevel::Warn, "ignoring invalid cache entry {}/{} -> {}",
                    filter_id, commit, entry->result);
        return std::nullopt;
    }
    return entry->result;
}

void RewriteCache::put(const std::string& filter_id,
                       const std::string& commit,
                       const std::string& result) {
    validate_hash(commit);
    validate_hash(result);

    auto existing = find(filter_id, commit);
    if (existing) {
        if (*existing != result) violation(filter_id, commit, *existing, result);
        return;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    auto& table = pending_[filter_id];
    auto it = table.find(commit);
    if (it != table.end() && it->second != result) {
        violation(filter_id, commit, it->second, result);
    }
    table.emplace(commit, result);
}

size_t RewriteCache::pending() const {
    std::lock_guard<std::mutex> lk(mutex_);
    size_t n = 0;
    for (auto& kv : pending_) n += kv.second.size();
    return n;
}

void RewriteCache::flush() {
    std::lock_guard<std::mutex> flk(flush_mutex_);

    std::map<std::string, Table> snapshot;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        snapshot = pending_;
    }

    for (auto& [filter_id, entries] : snapshot) {
        if (entries.empty()) continue;
        flush_filter(filter_id, entries);

        std::lock_guard<std::mutex> lk(mutex_);
        auto& staged = pending_[filter_id];
        for (auto& [commit, result] : entries) {
            staged.erase(commit);
            known_.insert({filter_id, commit}, result);
        }
        if (staged.empty()) pending_.erase(filter_id);
    }
}

void RewriteCache::flush_filter(const std::string& filter_id,
                                const Table& entries) {
    std::string ref = ref_name(filter_id);

    for (int attempt = 0; ; ++attempt) {
        auto tip = store_.read_ref(ref);
        std::string base_tree = tip ? store_.read_commit(*tip).tree : EMPTY_TREE;

        // Re-merge onto the current tip; it may hold entries another
        // writer added since we last looked.
        std::vector<TreeChange> changes;
        for (auto& [commit, result] : entries) {
            auto existing = find_persisted(base_tree, commit);
            if (existing) {
                if (*existing != result) violation(filter_id, commit, *existing, result);
                continue;
            }
            changes.push_back(TreeChange::upsert(fanout_path(commit),
                                                 store_.write_blob(result),
                                                 MODE_BLOB));
        }
        if (changes.empty()) return;

        Signature sig = store_.signature();
        sig.time = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        Commit c;
        c.tree      = store_.rebuild_tree(base_tree, changes);
        c.author    = sig;
        c.committer = sig;
        c.message   = fmt::format("vista cache: {} entries\n", changes.size());
        if (tip) c.parents.push_back(*tip);
        std::string id = store_.write_commit(c);

        if (store_.compare_and_swap_ref(ref, tip, id)) {
            Logger::Log(LogLevel::Debug, "flushed {} cache entries to {}",
                        changes.size(), ref);
            return;
        }
        if (attempt + 1 >= kMaxFlushAttempts) {
            throw StoreIoError("cache ref " + ref + " kept moving during flush",
                               /*transient=*/true);
        }
        Logger::Log(LogLevel::Debug, "cache ref {} moved, re-merging", ref);
    }
}

size_t RewriteCache::remembered() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return known_.size();
}

std::vector<std::string>
RewriteCache::frontier(const std::string& filter_id) const {
    Table all;
    auto tree = persisted_tree(filter_id);
    if (tree) iter_persisted(*tree, all);

    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = pending_.find(filter_id);
        if (it != pending_.end()) {
            for (auto& kv : it->second) all.emplace(kv.first, kv.second);
        }
    }
    out.reserve(all.size());
    for (auto& kv : all) out.push_back(kv.first);
    return out;
}

} // namespace vista
