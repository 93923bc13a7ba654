#include "vista/history.h"
#include "vista/logging.h"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace vista {

namespace {

enum class NodeState { Pending, InProgress, Done };

struct Node {
    NodeState   state = NodeState::Pending;
    Commit      commit;
    std::string result;
};

} // anonymous namespace

HistoryRewriter::HistoryRewriter(Store store, RewriteCache& cache,
                                 size_t memo_capacity)
    : store_(store), cache_(cache), trees_(store, memo_capacity) {}

bool HistoryRewriter::is_empty_root(const std::string& commit) const {
    Commit c = store_.read_commit(commit);
    return c.tree == EMPTY_TREE && c.parents.empty();
}

HistoryStats HistoryRewriter::stats() const {
    HistoryStats s;
    s.traversals      = traversals_.load();
    s.cache_hits      = cache_hits_.load();
    s.commits_written = commits_written_.load();
    s.commits_elided  = commits_elided_.load();
    return s;
}

std::string HistoryRewriter::rewrite_squashed(const Filter& filter,
                                              const std::string& filter_id,
                                              const std::string& commit) {
    ++traversals_;
    Commit src = store_.read_commit(commit);

    Commit out;
    out.tree      = trees_.apply(without_squash(filter), src.tree);
    out.author    = src.author;
    out.committer = src.committer;
    out.message   = src.message;
    out.encoding  = src.encoding;
    std::string id = store_.write_commit(out);
    ++commits_written_;

    cache_.put(filter_id, commit, id);
    cache_.flush();
    Logger::Log(LogLevel::Debug, "squashed {} under {} -> {}", commit, filter_id, id);
    return id;
}

std::string HistoryRewriter::rewrite(const Filter& filter, const std::string& commit) {
    std::string fid = filter_id(filter);

    if (auto hit = cache_.get(fid, commit)) {
        ++cache_hits_;
        return *hit;
    }
    if (is_squash(filter)) return rewrite_squashed(filter, fid, commit);

    ++traversals_;
    uint64_t visited = 0, written = 0, elided = 0;

    std::unordered_map<std::string, Node> nodes;
    std::vector<std::string> work{commit};

    while (!work.empty()) {
        std::string id = work.back();
        Node& node = nodes[id];

        if (node.state == NodeState::Done) {
            work.pop_back();
            continue;
        }

        if (node.state == NodeState::Pending) {
            if (id != commit) {
                if (auto hit = cache_.get(fid, id)) {
                    node.result = *hit;
                    node.state  = NodeState::Done;
                    ++cache_hits_;
                    work.pop_back();
                    continue;
                }
            }
            node.commit = store_.read_commit(id);
            node.state  = NodeState::InProgress;
            // Reverse order so the first parent is processed first.
            for (auto it = node.commit.parents.rbegin();
                 it != node.commit.parents.rend(); ++it) {
                if (nodes[*it].state != NodeState::Done) work.push_back(*it);
            }
            continue;
        }

        // InProgress with every parent Done.
        work.pop_back();
        ++visited;

        std::string tree = trees_.apply(filter, node.commit.tree);

        std::vector<std::string> rewritten;
        for (auto& p : node.commit.parents) {
            const std::string& r = nodes.at(p).result;
            if (std::find(rewritten.begin(), rewritten.end(), r) == rewritten.end()) {
                rewritten.push_back(r);
            }
        }

        // A parentless empty-tree commit carries nothing of the filter;
        // drop it as long as another parent remains.
        if (rewritten.size() > 1) {
            std::vector<std::string> substantive;
            for (auto& r : rewritten) {
                if (!is_empty_root(r)) substantive.push_back(r);
            }
            if (!substantive.empty()) rewritten.swap(substantive);
        }

        // Drop parents already reachable through another parent.
        std::vector<std::string> parents;
        for (size_t i = 0; i < rewritten.size(); ++i) {
            bool redundant = false;
            for (size_t j = 0; j < rewritten.size() && !redundant; ++j) {
                if (i != j && store_.is_ancestor(rewritten[i], rewritten[j])) {
                    redundant = true;
                }
            }
            if (!redundant) parents.push_back(rewritten[i]);
        }

        if (parents.size() == 1 && store_.read_commit(parents[0]).tree == tree) {
            node.result = parents[0];
            ++elided;
            Logger::Log(LogLevel::Trace, "{} elided into {}", id, node.result);
        } else {
            Commit out;
            out.tree      = tree;
            out.parents   = parents;
            out.author    = node.commit.author;
            out.committer = node.commit.committer;
            out.message   = node.commit.message;
            out.encoding  = node.commit.encoding;
            node.result = store_.write_commit(out);
            ++written;
            Logger::Log(LogLevel::Trace, "{} -> {} ({} parents)",
                        id, node.result, parents.size());
        }

        node.state = NodeState::Done;
        cache_.put(fid, id, node.result);
    }

    cache_.flush();

    commits_written_ += written;
    commits_elided_  += elided;
    Logger::Log(LogLevel::Debug,
                "rewrote {} under {}: {} visited, {} written, {} elided",
                commit, fid, visited, written, elided);
    return nodes.at(commit).result;
}

} // namespace vista
