#pragma once

#include <vista/vista.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Shared test helpers
// ---------------------------------------------------------------------------

/// Return a fresh path for a temporary bare repository (not yet created).
inline fs::path make_temp_repo() {
    static std::atomic<unsigned> counter{0};
    auto tmp = fs::temp_directory_path() /
               ("vista_test_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())) +
                "_" + std::to_string(counter++));
    return tmp;
}

inline vista::Store open_store(const fs::path& path) {
    vista::OpenOptions opts;
    opts.create = true;
    return vista::Store::open(path, opts);
}

/// Build a tree from path -> content pairs.
inline std::string make_tree(vista::Store& store,
                             const std::map<std::string, std::string>& files) {
    std::vector<vista::TreeChange> changes;
    for (auto& [path, content] : files) {
        changes.push_back(vista::TreeChange::upsert(
            path, store.write_blob(content), vista::MODE_BLOB));
    }
    return store.rebuild_tree(vista::EMPTY_TREE, changes);
}

/// Write a commit with deterministic metadata.
inline std::string make_commit(vista::Store& store,
                               const std::string& tree,
                               const std::vector<std::string>& parents,
                               const std::string& message,
                               int64_t time = 1700000000) {
    vista::Commit c;
    c.tree    = tree;
    c.parents = parents;
    c.author  = vista::Signature{"Alice", "alice@example.com", time, 60};
    c.committer = vista::Signature{"Bob", "bob@example.com", time + 1, 0};
    c.message = message + "\n";
    return store.write_commit(c);
}

/// Read every leaf of a tree as path -> content.
inline std::map<std::string, std::string>
read_files(const vista::Store& store, const std::string& tree,
           const std::string& dir = {}) {
    std::map<std::string, std::string> out;
    for (auto& e : store.list_tree(tree)) {
        std::string full = dir.empty() ? e.name : dir + "/" + e.name;
        if (e.is_tree()) {
            auto sub = read_files(store, e.oid, full);
            out.insert(sub.begin(), sub.end());
        } else {
            auto bytes = store.read_blob(e.oid);
            out.emplace(full, std::string(bytes.begin(), bytes.end()));
        }
    }
    return out;
}

inline std::string tree_of(const vista::Store& store, const std::string& commit) {
    return store.read_commit(commit).tree;
}
