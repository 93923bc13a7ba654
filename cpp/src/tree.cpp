#include "internal.h"
#include "vista/error.h"
#include "vista/types.h"

#include <git2.h>

#include <map>
#include <string>
#include <vector>

namespace vista {

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

namespace {

/// Convert a 20-byte raw OID to a 40-char lowercase hex string.
std::string oid_to_hex(const git_oid* oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), oid);
    return std::string(buf, GIT_OID_HEXSZ);
}

/// Parse a 40-char hex string into a git_oid.
/// @throws InvalidHashError on failure.
git_oid hex_to_oid(const std::string& hex) {
    git_oid oid;
    if (hex.size() != GIT_OID_HEXSZ || git_oid_fromstr(&oid, hex.c_str()) != 0) {
        throw InvalidHashError(hex);
    }
    return oid;
}

/// Throw GitError with the last libgit2 error message.
[[noreturn]] void throw_git_error(const std::string& context, int rc = 0) {
    const git_error* err = git_error_last();
    std::string msg = context;
    if (err && err->message) {
        msg += ": ";
        msg += err->message;
    }
    if (rc == GIT_ENOTFOUND) throw NotFoundError(msg);
    throw GitError(msg, rc == GIT_ELOCKED);
}

/// RAII wrapper for git_tree*.
struct TreeGuard {
    git_tree* t = nullptr;
    ~TreeGuard() { if (t) git_tree_free(t); }
};

/// RAII wrapper for git_commit*.
struct CommitGuard {
    git_commit* c = nullptr;
    ~CommitGuard() { if (c) git_commit_free(c); }
};

/// RAII wrapper for git_treebuilder*.
struct BuilderGuard {
    git_treebuilder* tb = nullptr;
    ~BuilderGuard() { if (tb) git_treebuilder_free(tb); }
};

/// RAII wrapper for git_signature*.
struct SigGuard {
    git_signature* s = nullptr;
    ~SigGuard() { if (s) git_signature_free(s); }
};

TreeEntry to_entry(const git_tree_entry* e) {
    TreeEntry te;
    te.name = git_tree_entry_name(e);
    te.oid  = oid_to_hex(git_tree_entry_id(e));
    te.mode = static_cast<uint32_t>(git_tree_entry_filemode(e));
    return te;
}

Signature from_git(const git_signature* s) {
    Signature sig;
    if (!s) return sig;
    sig.name   = s->name  ? s->name  : "";
    sig.email  = s->email ? s->email : "";
    sig.time   = static_cast<int64_t>(s->when.time);
    sig.offset = s->when.offset;
    return sig;
}

void to_git(SigGuard& out, const Signature& sig) {
    int rc = git_signature_new(&out.s, sig.name.c_str(), sig.email.c_str(),
                               static_cast<git_time_t>(sig.time), sig.offset);
    if (rc != 0) throw_git_error("git_signature_new", rc);
}

/// A change with its path pre-split into segments.
struct PendingChange {
    std::vector<std::string> segs;
    const TreeChange*        change;
};

/// Rebuild one tree level. `base` is the existing tree id at this level or
/// nullopt if there is none. Returns the id of the written tree, which is
/// EMPTY_TREE when nothing is left.
std::string rebuild_level(git_repository* repo,
                          const std::optional<std::string>& base,
                          const std::vector<PendingChange>& changes,
                          size_t depth) {
    BuilderGuard bg;
    {
        TreeGuard tg;
        if (base) {
            git_oid base_oid = hex_to_oid(*base);
            int rc = git_tree_lookup(&tg.t, repo, &base_oid);
            if (rc != 0) throw_git_error("git_tree_lookup (rebuild)", rc);
        }
        if (git_treebuilder_new(&bg.tb, repo, tg.t) != 0) {
            throw_git_error("git_treebuilder_new");
        }
    }

    // Leaf edits at this level first, so that a removed file can be replaced
    // by a directory of the same name below.
    std::map<std::string, std::vector<PendingChange>> deeper;
    for (auto& pc : changes) {
        const std::string& name = pc.segs[depth];
        if (pc.segs.size() > depth + 1) {
            deeper[name].push_back(pc);
            continue;
        }
        if (!pc.change->oid) {
            git_treebuilder_remove(bg.tb, name.c_str()); // absent is fine
            continue;
        }
        git_oid ins_oid = hex_to_oid(*pc.change->oid);
        auto fm = static_cast<git_filemode_t>(pc.change->mode);
        if (git_treebuilder_insert(nullptr, bg.tb, name.c_str(),
                                   &ins_oid, fm) != 0) {
            throw_git_error("git_treebuilder_insert");
        }
    }

    for (auto& [name, sub_changes] : deeper) {
        std::optional<std::string> sub_base;
        const git_tree_entry* e = git_treebuilder_get(bg.tb, name.c_str());
        bool existing_is_tree = e && static_cast<uint32_t>(
            git_tree_entry_filemode(e)) == MODE_TREE;
        if (existing_is_tree) sub_base = oid_to_hex(git_tree_entry_id(e));

        std::string sub = rebuild_level(repo, sub_base, sub_changes, depth + 1);
        if (sub == EMPTY_TREE) {
            // Prune directories that became empty, but leave a non-tree
            // entry of the same name alone.
            if (existing_is_tree) git_treebuilder_remove(bg.tb, name.c_str());
            continue;
        }
        git_oid sub_oid = hex_to_oid(sub);
        if (git_treebuilder_insert(nullptr, bg.tb, name.c_str(),
                                   &sub_oid, GIT_FILEMODE_TREE) != 0) {
            throw_git_error("git_treebuilder_insert subtree");
        }
    }

    git_oid new_tree_oid;
    if (git_treebuilder_write(&new_tree_oid, bg.tb) != 0) {
        throw_git_error("git_treebuilder_write");
    }
    return oid_to_hex(&new_tree_oid);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Tree / commit API (used by Store)
// ---------------------------------------------------------------------------

namespace tree {

/// Return the entry at `norm_path`, or nullopt if missing.
/// The root path yields a synthetic tree entry with an empty name.
std::optional<TreeEntry>
lookup(git_repository* repo,
       const std::string& tree_oid_hex,
       const std::string& norm_path) {
    if (norm_path.empty()) {
        return TreeEntry{"", tree_oid_hex, MODE_TREE};
    }

    auto segs = paths::split(norm_path);
    git_oid cur_oid = hex_to_oid(tree_oid_hex);

    for (size_t i = 0; i < segs.size(); ++i) {
        TreeGuard tg;
        int rc = git_tree_lookup(&tg.t, repo, &cur_oid);
        if (rc != 0) throw_git_error("git_tree_lookup", rc);

        const git_tree_entry* entry =
            git_tree_entry_byname(tg.t, segs[i].c_str());
        if (!entry) return std::nullopt;

        if (i == segs.size() - 1) return to_entry(entry);

        // Intermediate must be a tree
        if (static_cast<uint32_t>(git_tree_entry_filemode(entry)) != MODE_TREE) {
            return std::nullopt;
        }
        cur_oid = *git_tree_entry_id(entry);
    }

    return std::nullopt; // unreachable
}

/// List immediate children of a tree given its OID hex.
std::vector<TreeEntry>
list_tree(git_repository* repo, const std::string& tree_oid_hex) {
    git_oid oid = hex_to_oid(tree_oid_hex);
    TreeGuard tg;
    int rc = git_tree_lookup(&tg.t, repo, &oid);
    if (rc != 0) throw_git_error("git_tree_lookup", rc);

    size_t n = git_tree_entrycount(tg.t);
    std::vector<TreeEntry> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(to_entry(git_tree_entry_byindex(tg.t, i)));
    }
    return out;
}

/// Write a tree from a flat entry list.
std::string write_tree(git_repository* repo,
                       const std::vector<TreeEntry>& entries) {
    BuilderGuard bg;
    if (git_treebuilder_new(&bg.tb, repo, nullptr) != 0) {
        throw_git_error("git_treebuilder_new");
    }
    for (auto& e : entries) {
        git_oid oid = hex_to_oid(e.oid);
        if (git_treebuilder_insert(nullptr, bg.tb, e.name.c_str(), &oid,
                                   static_cast<git_filemode_t>(e.mode)) != 0) {
            throw_git_error("git_treebuilder_insert " + e.name);
        }
    }
    git_oid out;
    if (git_treebuilder_write(&out, bg.tb) != 0) {
        throw_git_error("git_treebuilder_write");
    }
    return oid_to_hex(&out);
}

/// Rebuild the tree rooted at `base_tree_oid_hex`, applying every change.
/// Returns the new root tree OID as a 40-char hex string.
std::string rebuild_tree(git_repository* repo,
                         const std::string& base_tree_oid_hex,
                         const std::vector<TreeChange>& changes) {
    std::vector<PendingChange> pending;
    pending.reserve(changes.size());
    for (auto& c : changes) {
        auto segs = paths::split(c.path);
        if (segs.empty()) {
            throw InvalidPathError("cannot replace the root with a change");
        }
        pending.push_back({std::move(segs), &c});
    }
    return rebuild_level(repo, base_tree_oid_hex, pending, 0);
}

Commit read_commit(git_repository* repo, const std::string& commit_oid_hex) {
    git_oid commit_oid = hex_to_oid(commit_oid_hex);
    CommitGuard cg;
    int rc = git_commit_lookup(&cg.c, repo, &commit_oid);
    if (rc != 0) throw_git_error("git_commit_lookup " + commit_oid_hex, rc);

    Commit c;
    c.tree = oid_to_hex(git_commit_tree_id(cg.c));
    unsigned n = git_commit_parentcount(cg.c);
    c.parents.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        c.parents.push_back(oid_to_hex(git_commit_parent_id(cg.c, i)));
    }
    c.author    = from_git(git_commit_author(cg.c));
    c.committer = from_git(git_commit_committer(cg.c));

    const char* msg = git_commit_message_raw(cg.c);
    c.message = msg ? msg : "";
    const char* enc = git_commit_message_encoding(cg.c);
    c.encoding = enc ? enc : "";
    return c;
}

/// Write a new commit and return its 40-char hex SHA.
/// No ref is updated here; callers do CAS separately.
std::string write_commit(git_repository* repo, const Commit& commit) {
    git_oid tree_oid = hex_to_oid(commit.tree);
    TreeGuard tg;
    int rc = git_tree_lookup(&tg.t, repo, &tree_oid);
    if (rc != 0) throw_git_error("git_tree_lookup (write_commit)", rc);

    SigGuard author, committer;
    to_git(author, commit.author);
    to_git(committer, commit.committer);

    std::vector<CommitGuard> parent_guards(commit.parents.size());
    std::vector<const git_commit*> parents_vec;
    parents_vec.reserve(commit.parents.size());
    for (size_t i = 0; i < commit.parents.size(); ++i) {
        git_oid parent_oid = hex_to_oid(commit.parents[i]);
        rc = git_commit_lookup(&parent_guards[i].c, repo, &parent_oid);
        if (rc != 0) throw_git_error("git_commit_lookup (parent)", rc);
        parents_vec.push_back(parent_guards[i].c);
    }

    git_oid new_commit_oid;
    rc = git_commit_create(
        &new_commit_oid,
        repo,
        nullptr,
        author.s,
        committer.s,
        commit.encoding.empty() ? nullptr : commit.encoding.c_str(),
        commit.message.c_str(),
        tg.t,
        parents_vec.size(),
        parents_vec.empty() ? nullptr : parents_vec.data());
    if (rc != 0) throw_git_error("git_commit_create", rc);

    return oid_to_hex(&new_commit_oid);
}

} // namespace tree
} // namespace vista
