#include "vista/store.h"
#include "internal.h"

#include <git2.h>

#include <algorithm>
#include <string>

namespace vista {

// ---------------------------------------------------------------------------
// libgit2 lifecycle: initialise once per process
// ---------------------------------------------------------------------------

namespace {
struct LibGit2Init {
    LibGit2Init()  { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};
static LibGit2Init s_libgit2;

[[noreturn]] void throw_git(const std::string& ctx, int rc = 0) {
    const git_error* e = git_error_last();
    std::string msg = ctx;
    if (e && e->message) { msg += ": "; msg += e->message; }
    throw GitError(msg, rc == GIT_ELOCKED);
}

std::string oid_hex(const git_oid* o) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), o);
    return std::string(buf, GIT_OID_HEXSZ);
}

git_oid parse_oid(const std::string& hex) {
    git_oid oid;
    if (hex.size() != GIT_OID_HEXSZ || git_oid_fromstr(&oid, hex.c_str()) != 0)
        throw InvalidHashError(hex);
    return oid;
}

struct OdbGuard {
    git_odb* db = nullptr;
    ~OdbGuard() { if (db) git_odb_free(db); }
};

struct RefGuard {
    git_reference* r = nullptr;
    ~RefGuard() { if (r) git_reference_free(r); }
};

git_object_t to_git_type(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Blob:   return GIT_OBJECT_BLOB;
        case ObjectKind::Tree:   return GIT_OBJECT_TREE;
        case ObjectKind::Commit: return GIT_OBJECT_COMMIT;
        case ObjectKind::Tag:    return GIT_OBJECT_TAG;
    }
    return GIT_OBJECT_INVALID;
}

ObjectKind from_git_type(git_object_t type) {
    switch (type) {
        case GIT_OBJECT_BLOB:   return ObjectKind::Blob;
        case GIT_OBJECT_TREE:   return ObjectKind::Tree;
        case GIT_OBJECT_COMMIT: return ObjectKind::Commit;
        case GIT_OBJECT_TAG:    return ObjectKind::Tag;
        default: break;
    }
    throw GitError("unsupported object type " +
                   std::string(git_object_type2string(type)));
}

void open_odb(OdbGuard& og, git_repository* repo) {
    if (git_repository_odb(&og.db, repo) != 0) throw_git("git_repository_odb");
}

/// Make sure the well-known empty tree is present in the object database.
void ensure_empty_tree(git_repository* repo) {
    git_treebuilder* tb = nullptr;
    if (git_treebuilder_new(&tb, repo, nullptr) != 0)
        throw_git("git_treebuilder_new");
    git_oid tree_oid;
    int rc = git_treebuilder_write(&tree_oid, tb);
    git_treebuilder_free(tb);
    if (rc != 0) throw_git("git_treebuilder_write", rc);
}

/// Peel `ref` to its commit id; nullopt when the target is not a commit.
std::optional<std::string> peel_commit(git_reference* ref) {
    git_object* obj = nullptr;
    if (git_reference_peel(&obj, ref, GIT_OBJECT_COMMIT) != 0) return std::nullopt;
    std::string hex = oid_hex(git_object_id(obj));
    git_object_free(obj);
    return hex;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// StoreInner
// ---------------------------------------------------------------------------

StoreInner::StoreInner(git_repository* r,
                       std::filesystem::path p,
                       Signature sig)
    : repo(r), path(std::move(p)), signature(std::move(sig)) {}

StoreInner::~StoreInner() {
    if (repo) git_repository_free(repo);
}

// ---------------------------------------------------------------------------
// Store::open
// ---------------------------------------------------------------------------

Store Store::open(const std::filesystem::path& path, OpenOptions opts) {
    Signature sig;
    if (opts.author) sig.name  = *opts.author;
    if (opts.email)  sig.email = *opts.email;

    git_repository* repo = nullptr;
    bool existed = std::filesystem::exists(path);

    if (existed) {
        if (git_repository_open_bare(&repo, path.string().c_str()) != 0) {
            throw_git("git_repository_open_bare");
        }
    } else if (opts.create) {
        std::filesystem::create_directories(path);
        if (git_repository_init(&repo, path.string().c_str(), 1 /*bare*/) != 0) {
            throw_git("git_repository_init");
        }
    } else {
        throw NotFoundError("repository " + path.string());
    }

    try {
        ensure_empty_tree(repo);
    } catch (...) {
        git_repository_free(repo);
        throw;
    }

    auto inner = std::make_shared<StoreInner>(repo, path, sig);
    return Store(std::move(inner));
}

Store::Store(std::shared_ptr<StoreInner> inner)
    : inner_(std::move(inner)) {}

// ---------------------------------------------------------------------------
// Raw objects
// ---------------------------------------------------------------------------

RawObject Store::read_object(const std::string& id) const {
    git_oid oid = parse_oid(id);
    std::lock_guard<std::mutex> lk(inner_->mutex);

    OdbGuard og;
    open_odb(og, inner_->repo);

    git_odb_object* obj = nullptr;
    int rc = git_odb_read(&obj, og.db, &oid);
    if (rc == GIT_ENOTFOUND) throw NotFoundError("object " + id);
    if (rc != 0) throw_git("git_odb_read", rc);

    git_object_t type = git_odb_object_type(obj);
    auto ptr = static_cast<const uint8_t*>(git_odb_object_data(obj));
    std::vector<uint8_t> data(ptr, ptr + git_odb_object_size(obj));
    git_odb_object_free(obj);

    RawObject out;
    out.kind = from_git_type(type);
    out.data = std::move(data);
    return out;
}

std::string Store::write_object(ObjectKind kind, const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lk(inner_->mutex);

    OdbGuard og;
    open_odb(og, inner_->repo);

    git_oid oid;
    int rc = git_odb_write(&oid, og.db, data.data(), data.size(), to_git_type(kind));
    if (rc != 0) throw_git("git_odb_write", rc);
    ++inner_->objects_written;
    return oid_hex(&oid);
}

bool Store::has_object(const std::string& id) const {
    git_oid oid = parse_oid(id);
    std::lock_guard<std::mutex> lk(inner_->mutex);

    OdbGuard og;
    open_odb(og, inner_->repo);
    return git_odb_exists(og.db, &oid) == 1;
}

// ---------------------------------------------------------------------------
// References
// ---------------------------------------------------------------------------

std::optional<std::string> Store::read_ref(const std::string& name) const {
    std::lock_guard<std::mutex> lk(inner_->mutex);

    RefGuard rg;
    int rc = git_reference_lookup(&rg.r, inner_->repo, name.c_str());
    if (rc == GIT_ENOTFOUND || rc == GIT_EINVALIDSPEC) return std::nullopt;
    if (rc != 0) throw_git("git_reference_lookup " + name, rc);

    auto hex = peel_commit(rg.r);
    if (!hex) throw_git("git_reference_peel " + name);
    return hex;
}

bool Store::compare_and_swap_ref(const std::string& name,
                                 const std::optional<std::string>& expected,
                                 const std::string& new_id) {
    paths::validate_ref_name(name);
    git_oid new_oid = parse_oid(new_id);
    git_oid old_oid;
    if (expected) old_oid = parse_oid(*expected);

    lock::RepoLock file_lock(inner_->path);
    std::lock_guard<std::mutex> lk(inner_->mutex);

    RefGuard out;
    int rc;
    if (expected) {
        rc = git_reference_create_matching(&out.r, inner_->repo, name.c_str(),
                                           &new_oid, 1 /*force*/, &old_oid,
                                           "vista: update");
    } else {
        rc = git_reference_create(&out.r, inner_->repo, name.c_str(),
                                  &new_oid, 0 /*no force*/, "vista: create");
    }

    // Lost the race, or the ref was created/removed under us.
    if (rc == GIT_EMODIFIED || rc == GIT_EEXISTS || rc == GIT_ENOTFOUND) {
        git_error_clear();
        return false;
    }
    if (rc != 0) throw_git("ref update " + name, rc);

    ++inner_->ref_updates;
    return true;
}

bool Store::delete_ref(const std::string& name, const std::string& expected) {
    paths::validate_ref_name(name);

    lock::RepoLock file_lock(inner_->path);
    std::lock_guard<std::mutex> lk(inner_->mutex);

    RefGuard rg;
    int rc = git_reference_lookup(&rg.r, inner_->repo, name.c_str());
    if (rc == GIT_ENOTFOUND) return false;
    if (rc != 0) throw_git("git_reference_lookup " + name, rc);

    auto cur = peel_commit(rg.r);
    if (!cur || *cur != expected) return false;

    rc = git_reference_delete(rg.r);
    if (rc == GIT_EMODIFIED) return false;
    if (rc != 0) throw_git("git_reference_delete " + name, rc);

    ++inner_->ref_updates;
    return true;
}

std::vector<std::string> Store::list_refs(const std::string& prefix) const {
    std::lock_guard<std::mutex> lk(inner_->mutex);

    git_reference_iterator* iter = nullptr;
    int rc = git_reference_iterator_glob_new(&iter, inner_->repo,
                                             (prefix + "*").c_str());
    if (rc != 0) throw_git("git_reference_iterator_glob_new " + prefix, rc);

    std::vector<std::string> result;
    git_reference* ref = nullptr;
    while ((rc = git_reference_next(&ref, iter)) == 0) {
        result.emplace_back(git_reference_name(ref));
        git_reference_free(ref);
    }
    git_reference_iterator_free(iter);
    if (rc != GIT_ITEROVER) throw_git("git_reference_next", rc);

    std::sort(result.begin(), result.end());
    return result;
}

// ---------------------------------------------------------------------------
// Blobs / trees
// ---------------------------------------------------------------------------

std::string Store::write_blob(const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    git_oid blob_oid;
    int rc = git_blob_create_from_buffer(&blob_oid, inner_->repo,
                                         data.data(), data.size());
    if (rc != 0) throw_git("git_blob_create_from_buffer", rc);
    ++inner_->objects_written;
    return oid_hex(&blob_oid);
}

std::string Store::write_blob(const std::string& text) {
    return write_blob(std::vector<uint8_t>(text.begin(), text.end()));
}

std::vector<uint8_t> Store::read_blob(const std::string& id) const {
    auto obj = read_object(id);
    if (obj.kind != ObjectKind::Blob) throw NotFoundError("blob " + id);
    return std::move(obj.data);
}

std::vector<TreeEntry> Store::list_tree(const std::string& tree_id) const {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return tree::list_tree(inner_->repo, tree_id);
}

std::optional<TreeEntry> Store::lookup(const std::string& tree_id,
                                       const std::string& path) const {
    std::string norm = paths::normalize(path);
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return tree::lookup(inner_->repo, tree_id, norm);
}

std::string Store::write_tree(const std::vector<TreeEntry>& entries) {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    auto id = tree::write_tree(inner_->repo, entries);
    ++inner_->objects_written;
    return id;
}

std::string Store::rebuild_tree(const std::string& base_tree,
                                const std::vector<TreeChange>& changes) {
    if (changes.empty()) return base_tree;

    std::vector<TreeChange> normalized;
    normalized.reserve(changes.size());
    for (auto& c : changes) {
        TreeChange n = c;
        n.path = paths::normalize(c.path);
        normalized.push_back(std::move(n));
    }

    std::lock_guard<std::mutex> lk(inner_->mutex);
    auto id = tree::rebuild_tree(inner_->repo, base_tree, normalized);
    ++inner_->objects_written;
    return id;
}

// ---------------------------------------------------------------------------
// Commits
// ---------------------------------------------------------------------------

Commit Store::read_commit(const std::string& id) const {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    return tree::read_commit(inner_->repo, id);
}

std::string Store::write_commit(const Commit& commit) {
    std::lock_guard<std::mutex> lk(inner_->mutex);
    auto id = tree::write_commit(inner_->repo, commit);
    ++inner_->objects_written;
    return id;
}

bool Store::is_ancestor(const std::string& ancestor,
                        const std::string& descendant) const {
    git_oid a = parse_oid(ancestor);
    git_oid d = parse_oid(descendant);
    std::lock_guard<std::mutex> lk(inner_->mutex);
    int rc = git_graph_descendant_of(inner_->repo, &d, &a);
    if (rc < 0) throw_git("git_graph_descendant_of", rc);
    return rc == 1;
}

// ---------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------

const std::filesystem::path& Store::path() const {
    return inner_->path;
}

const Signature& Store::signature() const {
    return inner_->signature;
}

StoreStats Store::stats() const {
    StoreStats s;
    s.objects_written = inner_->objects_written.load();
    s.ref_updates     = inner_->ref_updates.load();
    return s;
}

} // namespace vista
