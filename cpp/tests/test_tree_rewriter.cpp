#include <catch2/catch_test_macros.hpp>
#include "helpers.h"

#include <future>
#include <vector>

using vista::compile;
using Files = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// apply: single operators
// ---------------------------------------------------------------------------

TEST_CASE("TreeRewriter: subdir selects the subtree", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/x.txt", "ax"}, {"b/y.txt", "by"}});
    auto out = trees.apply(compile(":/a"), tree);
    CHECK(read_files(store, out) == Files{{"x.txt", "ax"}});
    CHECK(out == store.lookup(tree, "a")->oid);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: subdir of an absent path is the empty tree", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"b/y.txt", "by"}, {"f", "blob"}});
    CHECK(trees.apply(compile(":/a"), tree) == vista::EMPTY_TREE);
    CHECK(trees.apply(compile(":/f"), tree) == vista::EMPTY_TREE);
    CHECK(trees.apply(compile(":/a"), vista::EMPTY_TREE) == vista::EMPTY_TREE);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: prefix wraps the tree", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/x.txt", "ax"}});
    auto out = trees.apply(compile(":prefix=lib/sub"), tree);
    CHECK(read_files(store, out) == Files{{"lib/sub/a/x.txt", "ax"}});
    CHECK(trees.apply(compile(":prefix=lib"), vista::EMPTY_TREE) == vista::EMPTY_TREE);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: file keeps a single path in place", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/x.txt", "ax"}, {"a/z.txt", "az"}, {"b/y.txt", "by"}});
    auto out = trees.apply(compile("::a/x.txt"), tree);
    CHECK(read_files(store, out) == Files{{"a/x.txt", "ax"}});
    CHECK(trees.apply(compile("::nope.txt"), tree) == vista::EMPTY_TREE);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: pattern keeps matching leaves", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {
        {"src/a.h", "1"}, {"src/a.cpp", "2"}, {"src/sub/b.h", "3"}, {"README", "4"}});

    auto shallow = trees.apply(compile("::src/*.h"), tree);
    CHECK(read_files(store, shallow) == Files{{"src/a.h", "1"}});

    auto deep = trees.apply(compile("::src/**/*.h"), tree);
    CHECK(read_files(store, deep) == Files{{"src/a.h", "1"}, {"src/sub/b.h", "3"}});

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: pattern classes and hidden names", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {
        {"a.c", "1"}, {"a.h", "2"}, {"a.o", "3"}, {".hidden.md", "4"},
        {"docs/x.md", "5"}, {".github/y.md", "6"}, {"z.md", "7"}});

    CHECK(read_files(store, trees.apply(compile("::*.[ch]"), tree)) ==
          Files{{"a.c", "1"}, {"a.h", "2"}});
    CHECK(read_files(store, trees.apply(compile("::*.[!ch]"), tree)) ==
          Files{{"a.o", "3"}});
    CHECK(read_files(store, trees.apply(compile("::**/*.md"), tree)) ==
          Files{{"docs/x.md", "5"}, {"z.md", "7"}});
    CHECK(read_files(store, trees.apply(compile("::.github/*.md"), tree)) ==
          Files{{".github/y.md", "6"}});
    CHECK(read_files(store, trees.apply(compile("::a.?"), tree)) ==
          Files{{"a.c", "1"}, {"a.h", "2"}, {"a.o", "3"}});

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: nop and squash are identity on trees", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/x.txt", "ax"}});
    CHECK(trees.apply(compile(""), tree) == tree);
    CHECK(trees.apply(compile(":SQUASH"), tree) == tree);
    CHECK(trees.apply(compile(":empty"), tree) == vista::EMPTY_TREE);

    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// apply: composition
// ---------------------------------------------------------------------------

TEST_CASE("TreeRewriter: chains apply left to right", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/b/x.txt", "x"}});
    auto sel_then_move = trees.apply(compile(":/a:prefix=q"), tree);
    CHECK(read_files(store, sel_then_move) == Files{{"q/b/x.txt", "x"}});

    auto move_then_sel = trees.apply(compile(":prefix=q:/a"), tree);
    CHECK(move_then_sel == vista::EMPTY_TREE);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: combine places branches under their prefixes", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/f", "1"}, {"b/f", "2"}, {"c/f", "3"}});
    auto out = trees.apply(compile(":[x = :/a, y = :/b]"), tree);
    CHECK(read_files(store, out) == Files{{"x/f", "1"}, {"y/f", "2"}});

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: combine overlap is won by the later branch", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/f", "1"}, {"b/f", "2"}});
    CHECK(read_files(store, trees.apply(compile(":[:/a,:/b]"), tree)) == Files{{"f", "2"}});
    CHECK(read_files(store, trees.apply(compile(":[:/b,:/a]"), tree)) == Files{{"f", "1"}});

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: combine merges directories recursively", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/d/1", "one"}, {"b/d/2", "two"}});
    auto out = trees.apply(compile(":[:/a,:/b]"), tree);
    CHECK(read_files(store, out) == Files{{"d/1", "one"}, {"d/2", "two"}});

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: exclude removes what the inner filter reads", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/x.txt", "ax"}, {"a/z.md", "az"}, {"b/y.txt", "by"}});

    CHECK(read_files(store, trees.apply(compile(":exclude[::a/x.txt]"), tree)) ==
          Files{{"a/z.md", "az"}, {"b/y.txt", "by"}});
    CHECK(read_files(store, trees.apply(compile(":exclude[:/a]"), tree)) ==
          Files{{"b/y.txt", "by"}});
    CHECK(read_files(store, trees.apply(compile(":exclude[::**/*.txt]"), tree)) ==
          Files{{"a/z.md", "az"}});
    CHECK(read_files(store, trees.apply(compile(":exclude[:/a, ::b/y.txt]"), tree)).empty());
    CHECK(trees.apply(compile(":exclude[:/nothing]"), tree) == tree);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: exclude of a combine drops what any branch reads", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    // `:/y` yields a directory `f` that shadows the blob `:/x` yields.
    auto tree = make_tree(store, {{"x/f", "blob"}, {"y/f/g", "g"}, {"z", "z"}});
    auto filter = compile(":exclude[:[:/x,:/y]]");

    auto out = trees.apply(filter, tree);
    CHECK(read_files(store, out) == Files{{"z", "z"}});
    CHECK(trees.map_back(filter, "x/f").empty());
    CHECK(trees.map_back(filter, "z") == std::vector<std::string>{"z"});
    CHECK(trees.unapply(filter, out, tree) == tree);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: blobs are relocated, not rewritten", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/x.txt", "content"}});
    auto out = trees.apply(compile(":/a:prefix=deep/er"), tree);
    CHECK(store.lookup(out, "deep/er/x.txt")->oid == store.lookup(tree, "a/x.txt")->oid);

    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// Determinism and memoization
// ---------------------------------------------------------------------------

TEST_CASE("TreeRewriter: results are deterministic across rewriters and threads", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);

    auto tree = make_tree(store, {{"a/x", "1"}, {"b/y", "2"}, {"c/z.txt", "3"}});
    auto filter = compile(":[p = :/a, q = :exclude[::**/*.txt]]");

    vista::TreeRewriter first(store);
    auto expected = first.apply(filter, tree);

    vista::TreeRewriter shared(store);
    std::vector<std::future<std::string>> results;
    for (int i = 0; i < 4; ++i) {
        results.push_back(std::async(std::launch::async, [&]() {
            return shared.apply(filter, tree);
        }));
    }
    for (auto& r : results) CHECK(r.get() == expected);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: repeated apply is served from the memo", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto tree = make_tree(store, {{"a/x", "1"}});
    auto filter = compile(":/a:prefix=z");
    auto first = trees.apply(filter, tree);

    auto writes = store.stats().objects_written;
    auto hits = trees.memo_hits();
    CHECK(trees.apply(filter, tree) == first);
    CHECK(trees.memo_hits() == hits + 1);
    CHECK(store.stats().objects_written == writes);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: the memo is bounded", "[tree_rewriter]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store, 2);

    auto tree = make_tree(store, {{"a/x", "1"}, {"b/y", "2"}, {"c/z", "3"}});
    auto first = trees.apply(compile(":/a"), tree);
    trees.apply(compile(":/b"), tree);
    trees.apply(compile(":/c"), tree);
    CHECK(trees.memo_size() == 2);

    // The oldest entry was evicted; recomputing it gives the same tree.
    auto hits = trees.memo_hits();
    CHECK(trees.apply(compile(":/a"), tree) == first);
    CHECK(trees.memo_hits() == hits);
    CHECK(trees.apply(compile(":/c"), tree) == store.lookup(tree, "c")->oid);
    CHECK(trees.memo_hits() == hits + 1);

    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// map_back / unapply / diff
// ---------------------------------------------------------------------------

TEST_CASE("TreeRewriter: map_back", "[tree_rewriter][map_back]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    using V = std::vector<std::string>;
    CHECK(trees.map_back(compile(":/a"), "x.txt") == V{"a/x.txt"});
    CHECK(trees.map_back(compile(":prefix=lib"), "lib/x.txt") == V{"x.txt"});
    CHECK(trees.map_back(compile(":prefix=lib"), "other/x.txt").empty());
    CHECK(trees.map_back(compile("::a/x.txt"), "a/x.txt") == V{"a/x.txt"});
    CHECK(trees.map_back(compile("::a/x.txt"), "a/y.txt").empty());
    CHECK(trees.map_back(compile("::**/*.h"), "src/a.h") == V{"src/a.h"});
    CHECK(trees.map_back(compile("::**/*.h"), "src/a.c").empty());
    CHECK(trees.map_back(compile(":empty"), "x").empty());
    CHECK(trees.map_back(compile(":/a:prefix=b"), "b/x") == V{"a/x"});

    auto combine = compile(":[x = :/a, y = :/b]");
    CHECK(trees.map_back(combine, "x/f") == V{"a/f"});
    CHECK(trees.map_back(combine, "y/f") == V{"b/f"});
    CHECK(trees.map_back(combine, "z/f").empty());

    // Overlapping branches are ambiguous.
    CHECK(trees.map_back(compile(":[:/a,:/b]"), "f").size() == 2);

    auto exclude = compile(":exclude[:/secret]");
    CHECK(trees.map_back(exclude, "src/x") == V{"src/x"});
    CHECK(trees.map_back(exclude, "secret/x").empty());

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: unapply places the view back into the base", "[tree_rewriter][unapply]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto base = make_tree(store, {{"a/x.txt", "ax"}, {"b/y.txt", "by"}});

    auto edited = make_tree(store, {{"x.txt", "changed"}, {"new.txt", "n"}});
    auto out = trees.unapply(compile(":/a"), edited, base);
    CHECK(read_files(store, out) ==
          Files{{"a/x.txt", "changed"}, {"a/new.txt", "n"}, {"b/y.txt", "by"}});

    auto moved = make_tree(store, {{"lib/a/x.txt", "ax"}, {"lib/b/y.txt", "by"}});
    CHECK(trees.unapply(compile(":prefix=lib"), moved, vista::EMPTY_TREE) == base);

    auto chain = compile(":/a:prefix=v");
    auto view = trees.apply(chain, base);
    CHECK(trees.unapply(chain, view, base) == base);

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: unapply of an empty view removes the selection", "[tree_rewriter][unapply]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto base = make_tree(store, {{"a/x.txt", "ax"}, {"b/y.txt", "by"}});
    auto out = trees.unapply(compile(":/a"), vista::EMPTY_TREE, base);
    CHECK(read_files(store, out) == Files{{"b/y.txt", "by"}});

    fs::remove_all(path);
}

TEST_CASE("TreeRewriter: diff lists leaf changes", "[tree_rewriter][diff]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::TreeRewriter trees(store);

    auto from = make_tree(store, {{"a", "1"}, {"d/b", "2"}, {"d/c", "3"}});
    auto to   = make_tree(store, {{"a", "1"}, {"d/b", "changed"}, {"e", "4"}});

    auto changes = trees.diff(from, to);
    REQUIRE(changes.size() == 3);

    std::map<std::string, bool> upserts;
    for (auto& c : changes) upserts[c.path] = c.oid.has_value();
    CHECK(upserts["d/c"] == false);
    CHECK(upserts["d/b"] == true);
    CHECK(upserts["e"] == true);

    CHECK(trees.diff(from, from).empty());

    fs::remove_all(path);
}
