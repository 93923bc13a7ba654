#pragma once
/// Internal helpers shared between vista source files.
/// Not part of the public API.

#include "vista/error.h"
#include "vista/types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct git_repository;

namespace vista {

// ---------------------------------------------------------------------------
// paths: path normalization and validation
// ---------------------------------------------------------------------------

namespace paths {

std::string              normalize(const std::string& path);
std::vector<std::string> split(const std::string& norm_path);
std::string              join(const std::string& a, const std::string& b);
void                     validate_ref_name(const std::string& name);

/// True if `path` equals `dir` or lies below it. The root ("") contains
/// every path.
bool is_within(const std::string& path, const std::string& dir);

/// Strip `dir/` from the front of `path` (which must be within `dir`).
std::string strip(const std::string& path, const std::string& dir);

} // namespace paths

// ---------------------------------------------------------------------------
// lock: advisory file lock
// ---------------------------------------------------------------------------

namespace lock {

/// Exclusive advisory lock on `<gitdir>/vista.lock`, held for the lifetime
/// of the object. Waits up to 30 s; a lock still held after that is a
/// transient IoError.
class RepoLock {
public:
    explicit RepoLock(const std::filesystem::path& gitdir);
    ~RepoLock();

    RepoLock(const RepoLock&) = delete;
    RepoLock& operator=(const RepoLock&) = delete;

private:
    int fd_ = -1;
};

} // namespace lock

// ---------------------------------------------------------------------------
// tree: libgit2-based tree and commit operations
// ---------------------------------------------------------------------------

namespace tree {

std::optional<TreeEntry>
lookup(git_repository* repo,
       const std::string& tree_oid_hex,
       const std::string& norm_path);

std::vector<TreeEntry>
list_tree(git_repository* repo, const std::string& tree_oid_hex);

std::string write_tree(git_repository* repo,
                       const std::vector<TreeEntry>& entries);

std::string rebuild_tree(git_repository* repo,
                         const std::string& base_tree_oid_hex,
                         const std::vector<TreeChange>& changes);

Commit read_commit(git_repository* repo, const std::string& commit_oid_hex);

std::string write_commit(git_repository* repo, const Commit& commit);

} // namespace tree

// ---------------------------------------------------------------------------
// glob: pattern matching helpers
// ---------------------------------------------------------------------------

namespace glob {

/// Match a glob pattern segment against a name.
bool fnmatch(const std::string& pattern, const std::string& name);

/// Match a glob pattern against a name (dot-awareness).
bool glob_match(const std::string& pattern, const std::string& name);

/// Match a slash-separated pattern (with `**` segments) against a path.
bool path_match(const std::string& pattern, const std::string& path);

/// True if the segment contains glob metacharacters.
bool has_magic(const std::string& segment);

} // namespace glob

} // namespace vista
