#include "vista/tree_rewriter.h"
#include "vista/logging.h"
#include "internal.h"

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace vista {

namespace {

void append_unique(std::vector<std::string>& out, const std::string& p) {
    if (std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
}

} // anonymous namespace

TreeRewriter::TreeRewriter(Store store, size_t memo_capacity)
    : store_(std::move(store)), memo_(memo_capacity) {}

uint64_t TreeRewriter::memo_hits() const {
    std::lock_guard<std::mutex> lk(memo_mutex_);
    return memo_hits_;
}

size_t TreeRewriter::memo_size() const {
    std::lock_guard<std::mutex> lk(memo_mutex_);
    return memo_.size();
}

// ---------------------------------------------------------------------------
// apply
// ---------------------------------------------------------------------------

std::string TreeRewriter::apply(const Filter& filter, const std::string& tree_id) {
    if (filter.is<ops::Nop>() || filter.is<ops::Squash>()) return tree_id;
    if (filter.is<ops::Empty>() || tree_id == EMPTY_TREE) {
        // Every operator maps the empty tree to itself.
        return EMPTY_TREE;
    }

    auto key = std::make_pair(to_string(filter), tree_id);
    {
        std::lock_guard<std::mutex> lk(memo_mutex_);
        if (auto* hit = memo_.find(key)) {
            ++memo_hits_;
            return *hit;
        }
    }

    std::string out = apply_node(filter, tree_id);
    Logger::Log(LogLevel::Trace, "apply {} to {} -> {}", key.first, tree_id, out);

    std::lock_guard<std::mutex> lk(memo_mutex_);
    memo_.insert(key, out);
    return out;
}

std::string TreeRewriter::apply_node(const Filter& filter,
                                     const std::string& tree_id) {
    const auto& n = filter.node();

    if (auto* s = std::get_if<ops::Subdir>(&n)) {
        auto e = store_.lookup(tree_id, s->path);
        if (!e || !e->is_tree()) return EMPTY_TREE;
        return e->oid;
    }
    if (auto* p = std::get_if<ops::Prefix>(&n)) {
        return wrap(p->path, tree_id);
    }
    if (auto* f = std::get_if<ops::File>(&n)) {
        return select_file(f->path, tree_id);
    }
    if (auto* g = std::get_if<ops::Pattern>(&n)) {
        return select_leaves(tree_id, {}, [&](const std::string& path) {
            return glob::path_match(g->glob, path);
        });
    }
    if (auto* c = std::get_if<ops::Chain>(&n)) {
        std::string cur = tree_id;
        for (auto& item : c->items) {
            cur = apply(item, cur);
            if (cur == EMPTY_TREE) break;
        }
        return cur;
    }
    if (auto* c = std::get_if<ops::Combine>(&n)) {
        std::string out = EMPTY_TREE;
        for (auto& item : c->items) {
            out = overlay(out, apply(item, tree_id));
        }
        return out;
    }
    if (auto* e = std::get_if<ops::Exclude>(&n)) {
        if (!e->inner) return tree_id;
        // Drop every leaf the inner filter reads.
        return select_leaves(tree_id, {}, [&](const std::string& path) {
            return !reads(*e->inner, path);
        });
    }
    return tree_id;
}

std::string TreeRewriter::wrap(const std::string& prefix,
                               const std::string& tree_id) {
    if (tree_id == EMPTY_TREE) return EMPTY_TREE;
    auto segs = paths::split(prefix);
    std::string cur = tree_id;
    for (auto it = segs.rbegin(); it != segs.rend(); ++it) {
        cur = store_.write_tree({TreeEntry{*it, cur, MODE_TREE}});
    }
    return cur;
}

std::string TreeRewriter::select_file(const std::string& path,
                                      const std::string& tree_id) {
    auto e = store_.lookup(tree_id, path);
    if (!e) return EMPTY_TREE;
    return store_.rebuild_tree(EMPTY_TREE,
                               {TreeChange::upsert(path, e->oid, e->mode)});
}

std::string TreeRewriter::select_leaves(
        const std::string& tree_id, const std::string& dir,
        const std::function<bool(const std::string&)>& keep) {
    if (tree_id == EMPTY_TREE) return EMPTY_TREE;
    std::vector<TreeEntry> kept;
    bool changed = false;
    for (auto& e : store_.list_tree(tree_id)) {
        std::string full = paths::join(dir, e.name);
        if (e.is_tree()) {
            std::string sub = select_leaves(e.oid, full, keep);
            if (sub != e.oid) changed = true;
            if (sub != EMPTY_TREE) kept.push_back(TreeEntry{e.name, sub, MODE_TREE});
        } else if (keep(full)) {
            kept.push_back(e);
        } else {
            changed = true;
        }
    }
    if (!changed) return tree_id;
    if (kept.empty()) return EMPTY_TREE;
    return store_.write_tree(kept);
}

/// Recursive merge: entries of `upper` win, directories present on both
/// sides are merged.
std::string TreeRewriter::overlay(const std::string& lower,
                                  const std::string& upper) {
    if (lower == EMPTY_TREE || lower == upper) return upper;
    if (upper == EMPTY_TREE) return lower;

    std::map<std::string, TreeEntry> merged;
    for (auto& e : store_.list_tree(lower)) merged[e.name] = e;
    for (auto& e : store_.list_tree(upper)) {
        auto it = merged.find(e.name);
        if (it != merged.end() && it->second.is_tree() && e.is_tree()) {
            it->second.oid = overlay(it->second.oid, e.oid);
        } else {
            merged[e.name] = e;
        }
    }

    std::vector<TreeEntry> entries;
    entries.reserve(merged.size());
    for (auto& kv : merged) entries.push_back(kv.second);
    return store_.write_tree(entries);
}

std::string TreeRewriter::replace_at(const std::string& base_tree,
                                     const std::string& path,
                                     const std::string& tree_id) {
    if (tree_id == EMPTY_TREE) {
        return store_.rebuild_tree(base_tree, {TreeChange::remove(path)});
    }
    return store_.rebuild_tree(base_tree,
                               {TreeChange::upsert(path, tree_id, MODE_TREE)});
}

// ---------------------------------------------------------------------------
// unapply
// ---------------------------------------------------------------------------

std::string TreeRewriter::unapply(const Filter& filter,
                                  const std::string& filtered_tree,
                                  const std::string& base_tree) {
    const auto& n = filter.node();

    if (std::holds_alternative<ops::Nop>(n) ||
        std::holds_alternative<ops::Squash>(n)) {
        return filtered_tree;
    }
    if (std::holds_alternative<ops::Empty>(n)) return base_tree;

    if (auto* s = std::get_if<ops::Subdir>(&n)) {
        return replace_at(base_tree, s->path, filtered_tree);
    }
    if (auto* p = std::get_if<ops::Prefix>(&n)) {
        auto e = store_.lookup(filtered_tree, p->path);
        if (!e || !e->is_tree()) return EMPTY_TREE;
        return e->oid;
    }
    if (auto* f = std::get_if<ops::File>(&n)) {
        auto e = store_.lookup(filtered_tree, f->path);
        if (!e) return store_.rebuild_tree(base_tree, {TreeChange::remove(f->path)});
        return store_.rebuild_tree(base_tree,
                                   {TreeChange::upsert(f->path, e->oid, e->mode)});
    }
    if (auto* g = std::get_if<ops::Pattern>(&n)) {
        std::vector<TreeChange> changes;
        for (auto& [path, e] : leaves(base_tree)) {
            if (glob::path_match(g->glob, path)) {
                changes.push_back(TreeChange::remove(path));
            }
        }
        for (auto& [path, e] : leaves(filtered_tree)) {
            if (glob::path_match(g->glob, path)) {
                changes.push_back(TreeChange::upsert(path, e.oid, e.mode));
            }
        }
        return store_.rebuild_tree(base_tree, changes);
    }
    if (auto* c = std::get_if<ops::Chain>(&n)) {
        // bases[i] is the input of items[i] when run forward from base_tree.
        std::vector<std::string> bases{base_tree};
        for (size_t i = 0; i + 1 < c->items.size(); ++i) {
            bases.push_back(apply(c->items[i], bases.back()));
        }
        std::string cur = filtered_tree;
        for (size_t i = c->items.size(); i-- > 0;) {
            cur = unapply(c->items[i], cur, bases[i]);
        }
        return cur;
    }
    if (auto* c = std::get_if<ops::Combine>(&n)) {
        std::string cur = base_tree;
        for (auto& item : c->items) {
            cur = unapply(item, filtered_tree, cur);
        }
        return cur;
    }

    // Exclude: the view holds everything the inner filter does not read;
    // what it does read is kept from the base.
    const auto& e = std::get<ops::Exclude>(n);
    if (!e.inner) return filtered_tree;
    auto is_read = [&](const std::string& path) { return reads(*e.inner, path); };
    std::string read = select_leaves(base_tree, {}, is_read);
    std::string unread = select_leaves(filtered_tree, {}, [&](const std::string& path) {
        return !is_read(path);
    });
    return overlay(unread, read);
}

// ---------------------------------------------------------------------------
// Path mapping
// ---------------------------------------------------------------------------

std::vector<std::string> TreeRewriter::forward(const Filter& filter,
                                               const std::string& path) const {
    const auto& n = filter.node();

    if (std::holds_alternative<ops::Nop>(n) ||
        std::holds_alternative<ops::Squash>(n)) {
        return {path};
    }
    if (std::holds_alternative<ops::Empty>(n)) return {};

    if (auto* s = std::get_if<ops::Subdir>(&n)) {
        if (path == s->path || !paths::is_within(path, s->path)) return {};
        return {paths::strip(path, s->path)};
    }
    if (auto* p = std::get_if<ops::Prefix>(&n)) {
        return {paths::join(p->path, path)};
    }
    if (auto* f = std::get_if<ops::File>(&n)) {
        if (!paths::is_within(path, f->path)) return {};
        return {path};
    }
    if (auto* g = std::get_if<ops::Pattern>(&n)) {
        if (!glob::path_match(g->glob, path)) return {};
        return {path};
    }
    if (auto* c = std::get_if<ops::Chain>(&n)) {
        std::vector<std::string> cur{path};
        for (auto& item : c->items) {
            std::vector<std::string> next;
            for (auto& p : cur) {
                for (auto& q : forward(item, p)) append_unique(next, q);
            }
            cur = std::move(next);
            if (cur.empty()) break;
        }
        return cur;
    }
    if (auto* c = std::get_if<ops::Combine>(&n)) {
        std::vector<std::string> out;
        for (auto& item : c->items) {
            for (auto& q : forward(item, path)) append_unique(out, q);
        }
        return out;
    }

    const auto& e = std::get<ops::Exclude>(n);
    if (e.inner && reads(*e.inner, path)) return {};
    return {path};
}

bool TreeRewriter::reads(const Filter& filter, const std::string& path) const {
    return !forward(filter, path).empty();
}

std::vector<std::string> TreeRewriter::map_back(const Filter& filter,
                                                const std::string& path) const {
    const auto& n = filter.node();

    if (std::holds_alternative<ops::Nop>(n) ||
        std::holds_alternative<ops::Squash>(n)) {
        return {path};
    }
    if (std::holds_alternative<ops::Empty>(n)) return {};

    if (auto* s = std::get_if<ops::Subdir>(&n)) {
        return {paths::join(s->path, path)};
    }
    if (auto* p = std::get_if<ops::Prefix>(&n)) {
        if (path == p->path || !paths::is_within(path, p->path)) return {};
        return {paths::strip(path, p->path)};
    }
    if (auto* f = std::get_if<ops::File>(&n)) {
        if (!paths::is_within(path, f->path)) return {};
        return {path};
    }
    if (auto* g = std::get_if<ops::Pattern>(&n)) {
        if (!glob::path_match(g->glob, path)) return {};
        return {path};
    }
    if (auto* c = std::get_if<ops::Chain>(&n)) {
        std::vector<std::string> cur{path};
        for (auto it = c->items.rbegin(); it != c->items.rend(); ++it) {
            std::vector<std::string> next;
            for (auto& p : cur) {
                for (auto& q : map_back(*it, p)) append_unique(next, q);
            }
            cur = std::move(next);
            if (cur.empty()) break;
        }
        return cur;
    }
    if (auto* c = std::get_if<ops::Combine>(&n)) {
        std::vector<std::string> out;
        for (auto& item : c->items) {
            for (auto& q : map_back(item, path)) append_unique(out, q);
        }
        return out;
    }

    const auto& e = std::get<ops::Exclude>(n);
    if (e.inner && reads(*e.inner, path)) return {};
    return {path};
}

// ---------------------------------------------------------------------------
// Leaves / diff
// ---------------------------------------------------------------------------

std::vector<std::pair<std::string, TreeEntry>>
TreeRewriter::leaves(const std::string& tree_id, const std::string& dir) const {
    std::vector<std::pair<std::string, TreeEntry>> out;
    if (tree_id == EMPTY_TREE) return out;
    for (auto& e : store_.list_tree(tree_id)) {
        std::string full = paths::join(dir, e.name);
        if (e.is_tree()) {
            auto sub = leaves(e.oid, full);
            out.insert(out.end(), sub.begin(), sub.end());
        } else {
            out.emplace_back(std::move(full), e);
        }
    }
    return out;
}

std::vector<TreeChange> TreeRewriter::diff(const std::string& from,
                                           const std::string& to) const {
    std::vector<TreeChange> out;
    if (from == to) return out;

    std::map<std::string, TreeEntry> old_map, new_map;
    for (auto& [p, e] : leaves(from)) old_map.emplace(p, e);
    for (auto& [p, e] : leaves(to)) new_map.emplace(p, e);

    for (auto& [p, e] : old_map) {
        if (!new_map.count(p)) out.push_back(TreeChange::remove(p));
    }
    for (auto& [p, e] : new_map) {
        auto it = old_map.find(p);
        if (it == old_map.end() || it->second != e) {
            out.push_back(TreeChange::upsert(p, e.oid, e.mode));
        }
    }
    return out;
}

} // namespace vista
