#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vista {

// ---------------------------------------------------------------------------
// Mode constants (mirror git filemode integers)
// ---------------------------------------------------------------------------

constexpr uint32_t MODE_BLOB      = 0100644; ///< Regular file.
constexpr uint32_t MODE_BLOB_EXEC = 0100755; ///< Executable file.
constexpr uint32_t MODE_LINK      = 0120000; ///< Symbolic link.
constexpr uint32_t MODE_TREE      = 0040000; ///< Directory / subtree.
constexpr uint32_t MODE_COMMIT    = 0160000; ///< Submodule (gitlink).

/// Id of the tree with no entries. Every store contains it.
inline const std::string EMPTY_TREE = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

// ---------------------------------------------------------------------------
// ObjectKind / RawObject
// ---------------------------------------------------------------------------

/// The type of a stored object.
enum class ObjectKind : uint8_t {
    Blob,
    Tree,
    Commit,
    Tag,
};

/// Undecoded object content as returned by Store::read_object.
struct RawObject {
    ObjectKind           kind;
    std::vector<uint8_t> data;
};

// ---------------------------------------------------------------------------
// TreeEntry / TreeChange
// ---------------------------------------------------------------------------

/// A single entry of a tree object.
struct TreeEntry {
    std::string name; ///< Basename of the entry.
    std::string oid;  ///< 40-char hex SHA of the child object.
    uint32_t    mode; ///< Raw git filemode.

    bool is_tree() const { return mode == MODE_TREE; }

    bool operator==(const TreeEntry& o) const {
        return name == o.name && oid == o.oid && mode == o.mode;
    }
    bool operator!=(const TreeEntry& o) const { return !(*this == o); }
};

/// A per-path edit applied by Store::rebuild_tree.
/// `oid` unset means "remove the path".
struct TreeChange {
    std::string                path;   ///< Normalized slash-separated path.
    std::optional<std::string> oid;    ///< Object to place at `path`.
    uint32_t                   mode = MODE_BLOB;

    static TreeChange upsert(std::string p, std::string id, uint32_t m) {
        return TreeChange{std::move(p), std::move(id), m};
    }
    static TreeChange remove(std::string p) {
        return TreeChange{std::move(p), std::nullopt, MODE_BLOB};
    }
};

// ---------------------------------------------------------------------------
// Signature / Commit
// ---------------------------------------------------------------------------

/// Author/committer identity used for commits.
struct Signature {
    std::string name   = "vista";
    std::string email  = "vista@localhost";
    int64_t     time   = 0; ///< POSIX epoch seconds.
    int         offset = 0; ///< Timezone offset in minutes.

    bool operator==(const Signature& o) const {
        return name == o.name && email == o.email &&
               time == o.time && offset == o.offset;
    }
};

/// A decoded commit object.
struct Commit {
    std::string              tree;     ///< Root tree id.
    std::vector<std::string> parents;  ///< Ordered parent commit ids.
    Signature                author;
    Signature                committer;
    std::string              message;  ///< Raw message, trailing newline kept.
    std::string              encoding; ///< Message encoding header, or empty.
};

// ---------------------------------------------------------------------------
// StoreStats
// ---------------------------------------------------------------------------

/// Counters kept by a Store (shared across copies of the handle).
struct StoreStats {
    uint64_t objects_written = 0; ///< Blob/tree/commit writes issued.
    uint64_t ref_updates     = 0; ///< Successful compare-and-swap updates.
};

// ---------------------------------------------------------------------------
// OpenOptions
// ---------------------------------------------------------------------------

/// Options for opening or creating a Store.
struct OpenOptions {
    bool                       create = false; ///< Create if not found.
    std::optional<std::string> author;         ///< Bookkeeping author name.
    std::optional<std::string> email;          ///< Bookkeeping author email.
};

// ---------------------------------------------------------------------------
// DispatchOptions
// ---------------------------------------------------------------------------

/// Options for the Dispatcher.
struct DispatchOptions {
    /// Wall-clock limit of a single top-level request.
    std::chrono::milliseconds timeout{30000};

    /// Retries of transient store errors before giving up.
    int max_retries = 5;

    /// Reserved namespace where resolved view tips are recorded.
    std::string view_ref_prefix = "refs/vista/views/";

    /// Upper bound on memoized tree rewrites kept in memory.
    size_t tree_memo_capacity = 1 << 16;

    /// Upper bound on persisted cache entries kept in memory.
    size_t cache_memory_capacity = 1 << 16;

    /// Invoked inside a flight before the source ref is read, e.g. to let
    /// an upstream mirror finish populating the store.
    std::function<void(const std::string& ref_name)> prefetch;
};

} // namespace vista
