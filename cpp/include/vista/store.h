#pragma once

#include "error.h"
#include "types.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare libgit2 types to avoid pulling the header into every TU.
struct git_repository;

namespace vista {

// ---------------------------------------------------------------------------
// StoreInner: shared state
// ---------------------------------------------------------------------------

/// Internal state shared via shared_ptr across Store copies.
/// Not part of the public API.
struct StoreInner {
    git_repository*       repo;      ///< Raw libgit2 handle (owned).
    std::filesystem::path path;      ///< Path to the bare repository.
    Signature             signature; ///< Identity for bookkeeping commits.
    std::mutex            mutex;     ///< Serializes every libgit2 call.

    std::atomic<uint64_t> objects_written{0};
    std::atomic<uint64_t> ref_updates{0};

    // Non-copyable / non-movable: always accessed via shared_ptr.
    StoreInner(const StoreInner&) = delete;
    StoreInner& operator=(const StoreInner&) = delete;

    ~StoreInner();
    StoreInner(git_repository* r, std::filesystem::path p, Signature sig);
};

// ---------------------------------------------------------------------------
// Store
// ---------------------------------------------------------------------------

/// Content-addressed object store backed by a bare git repository.
///
/// Cheap to copy: internally holds a shared_ptr<StoreInner>. Objects are
/// immutable and identified by 40-char hex ids; references are the only
/// mutable state and are updated exclusively by compare-and-swap.
///
/// Usage:
/// @code
///     auto store = vista::Store::open("/srv/mirror.git");
///     auto tip   = store.read_ref("refs/heads/main");
///     auto c     = store.read_commit(*tip);
/// @endcode
class Store {
public:
    // -- Construction -------------------------------------------------------

    /// Open (or create) a bare git repository at `path`.
    ///
    /// @throws NotFoundError if the repo does not exist and opts.create is false.
    /// @throws GitError on libgit2 failures.
    static Store open(const std::filesystem::path& path, OpenOptions opts = {});

    // -- Raw objects --------------------------------------------------------

    /// Read an object's undecoded content.
    /// @throws NotFoundError if the object is absent.
    RawObject read_object(const std::string& id) const;

    /// Write an object and return its id. Idempotent.
    std::string write_object(ObjectKind kind, const std::vector<uint8_t>& data);

    /// Return true if the object is present.
    bool has_object(const std::string& id) const;

    // -- References ---------------------------------------------------------

    /// Resolve `name` to a commit id, or nullopt if the ref does not exist.
    std::optional<std::string> read_ref(const std::string& name) const;

    /// Atomically point `name` at `new_id` if it currently points at
    /// `expected` (nullopt: the ref must not exist yet).
    /// @return false if the ref did not match `expected`.
    bool compare_and_swap_ref(const std::string& name,
                              const std::optional<std::string>& expected,
                              const std::string& new_id);

    /// Atomically delete `name` if it points at `expected`.
    /// @return false if the ref was missing or did not match.
    bool delete_ref(const std::string& name, const std::string& expected);

    /// Return all ref names starting with `prefix` (full names, sorted).
    std::vector<std::string> list_refs(const std::string& prefix) const;

    // -- Blobs / trees ------------------------------------------------------

    /// Write a blob and return its id.
    std::string write_blob(const std::vector<uint8_t>& data);
    std::string write_blob(const std::string& text);

    /// Read a blob's content.
    std::vector<uint8_t> read_blob(const std::string& id) const;

    /// List the entries of a tree (git order).
    std::vector<TreeEntry> list_tree(const std::string& tree_id) const;

    /// Return the entry at `path` inside `tree_id`, or nullopt.
    /// An empty path yields the tree itself.
    std::optional<TreeEntry> lookup(const std::string& tree_id,
                                    const std::string& path) const;

    /// Write a tree from a flat entry list (names must be unique).
    std::string write_tree(const std::vector<TreeEntry>& entries);

    /// Apply per-path upserts and removals to `base_tree` and return the new
    /// root tree id. Directories left empty are pruned.
    std::string rebuild_tree(const std::string& base_tree,
                             const std::vector<TreeChange>& changes);

    // -- Commits ------------------------------------------------------------

    Commit read_commit(const std::string& id) const;

    /// Write a commit object (no ref is updated).
    std::string write_commit(const Commit& commit);

    /// Return true if `ancestor` is reachable from `descendant`
    /// (a commit is not its own ancestor).
    bool is_ancestor(const std::string& ancestor,
                     const std::string& descendant) const;

    // -- Metadata -----------------------------------------------------------

    /// Path to the bare repository on disk.
    const std::filesystem::path& path() const;

    /// The identity used for bookkeeping commits.
    const Signature& signature() const;

    /// Write counters since the store was opened.
    StoreStats stats() const;

    /// Access the shared inner state.
    std::shared_ptr<StoreInner> inner() const { return inner_; }

private:
    explicit Store(std::shared_ptr<StoreInner> inner);

    std::shared_ptr<StoreInner> inner_;
};

} // namespace vista
