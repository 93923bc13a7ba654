#include "vista/inverse.h"
#include "vista/logging.h"

#include <algorithm>
#include <string>
#include <vector>

namespace vista {

InverseRewriter::InverseRewriter(Store store)
    : store_(store), trees_(store) {}

std::string InverseRewriter::unapply(const Filter& filter,
                                     const std::string& edited,
                                     const std::string& base) {
    Commit edited_c = store_.read_commit(edited);
    Commit base_c   = store_.read_commit(base);
    Filter tree_filter = without_squash(filter);

    std::string view_base = trees_.apply(tree_filter, base_c.tree);

    std::vector<TreeChange> changes;
    for (auto& change : trees_.diff(view_base, edited_c.tree)) {
        auto sources = trees_.map_back(tree_filter, change.path);
        if (sources.empty()) {
            throw ConflictError("path is not produced by the filter", change.path);
        }
        if (sources.size() > 1) {
            throw ConflictError("path maps to " + std::to_string(sources.size()) +
                                " source locations", change.path);
        }
        Logger::Log(LogLevel::Trace, "{} {} -> {}",
                    change.oid ? "update" : "remove", change.path, sources[0]);
        change.path = sources[0];
        changes.push_back(std::move(change));
    }

    std::string new_tree = store_.rebuild_tree(base_c.tree, changes);
    if (trees_.apply(tree_filter, new_tree) != edited_c.tree) {
        throw ConflictError("edited tree cannot be reproduced through the filter");
    }

    Commit out;
    out.tree      = new_tree;
    out.parents   = {base};
    out.author    = edited_c.author;
    out.committer = edited_c.committer;
    out.message   = edited_c.message;
    out.encoding  = edited_c.encoding;
    std::string id = store_.write_commit(out);

    Logger::Log(LogLevel::Debug, "unapplied {} onto {} -> {} ({} paths)",
                edited, base, id, changes.size());
    return id;
}

std::string InverseRewriter::unapply_range(const Filter& filter,
                                           const std::string& old_view_tip,
                                           const std::string& new_view_tip,
                                           const std::string& base) {
    if (old_view_tip == new_view_tip) return base;
    if (!store_.is_ancestor(old_view_tip, new_view_tip)) {
        throw ConflictError(new_view_tip + " does not descend from " + old_view_tip);
    }

    std::vector<std::string> range;
    std::string cur = new_view_tip;
    while (cur != old_view_tip) {
        Commit c = store_.read_commit(cur);
        if (c.parents.size() > 1) {
            throw ConflictError("cannot replay merge commit " + cur);
        }
        if (c.parents.empty()) {
            throw ConflictError(new_view_tip + " does not descend from " +
                                old_view_tip + " along first parents");
        }
        range.push_back(cur);
        cur = c.parents[0];
    }
    std::reverse(range.begin(), range.end());

    std::string tip = base;
    for (auto& commit : range) {
        tip = unapply(filter, commit, tip);
    }
    return tip;
}

} // namespace vista
