#include <catch2/catch_test_macros.hpp>
#include "helpers.h"

#include <algorithm>

using vista::compile;
using Files = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// Basic rewriting
// ---------------------------------------------------------------------------

TEST_CASE("History: subdir view of a single commit", "[history]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto c = make_commit(store, make_tree(store, {{"a/x.txt", "ax"}, {"b/y.txt", "by"}}),
                         {}, "init");
    auto view = history.rewrite(compile(":/a"), c);

    auto vc = store.read_commit(view);
    CHECK(read_files(store, vc.tree) == Files{{"x.txt", "ax"}});
    CHECK(vc.parents.empty());
    CHECK(vc.message == "init\n");
    CHECK(vc.author.name == "Alice");
    CHECK(vc.author.time == 1700000000);
    CHECK(vc.author.offset == 60);
    CHECK(vc.committer.name == "Bob");

    fs::remove_all(path);
}

TEST_CASE("History: root without the selected path has the empty tree", "[history]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto c = make_commit(store, make_tree(store, {{"b/y.txt", "by"}}), {}, "init");
    auto view = history.rewrite(compile(":/a"), c);
    CHECK(tree_of(store, view) == vista::EMPTY_TREE);

    fs::remove_all(path);
}

TEST_CASE("History: commits that do not touch the view are elided", "[history]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto c1 = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b/y", "1"}}), {}, "c1", 1);
    auto c2 = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b/y", "2"}}), {c1}, "c2", 2);
    auto c3 = make_commit(store, make_tree(store, {{"a/x", "2"}, {"b/y", "2"}}), {c2}, "c3", 3);

    auto filter = compile(":/a");
    auto v3 = history.rewrite(filter, c3);
    auto v1 = history.rewrite(filter, c1);
    auto v2 = history.rewrite(filter, c2);

    CHECK(v2 == v1);
    auto c = store.read_commit(v3);
    REQUIRE(c.parents.size() == 1);
    CHECK(c.parents[0] == v1);
    CHECK(c.message == "c3\n");
    CHECK(read_files(store, c.tree) == Files{{"x", "2"}});

    auto s = history.stats();
    CHECK(s.commits_written == 2);
    CHECK(s.commits_elided == 1);

    fs::remove_all(path);
}

TEST_CASE("History: long linear histories do not recurse", "[history]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    std::string tip;
    for (int i = 0; i < 300; ++i) {
        auto tree = make_tree(store, {{"a/n", std::to_string(i)}, {"b/m", "same"}});
        tip = make_commit(store, tree, tip.empty() ? std::vector<std::string>{}
                                                   : std::vector<std::string>{tip},
                          "commit " + std::to_string(i), 1000 + i);
    }

    auto view = history.rewrite(compile(":/a"), tip);
    size_t depth = 1;
    auto c = store.read_commit(view);
    while (!c.parents.empty()) {
        c = store.read_commit(c.parents[0]);
        ++depth;
    }
    CHECK(depth == 300);
    CHECK(history.stats().commits_written == 300);

    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// Merges
// ---------------------------------------------------------------------------

TEST_CASE("History: a merge bringing nothing into the view collapses", "[history][merge]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto base = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b/y", "1"}}), {}, "base", 1);
    auto main = make_commit(store, make_tree(store, {{"a/x", "2"}, {"b/y", "1"}}), {base}, "main", 2);
    auto side = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b/y", "2"}}), {base}, "side", 3);
    auto merge = make_commit(store, make_tree(store, {{"a/x", "2"}, {"b/y", "2"}}),
                             {main, side}, "merge", 4);

    auto filter = compile(":/a");
    auto vm = history.rewrite(filter, merge);
    auto vmain = history.rewrite(filter, main);

    CHECK(vm == vmain);
    auto c = store.read_commit(vm);
    CHECK(c.parents.size() == 1);
    CHECK(c.parents[0] == history.rewrite(filter, base));

    fs::remove_all(path);
}

TEST_CASE("History: a merge with changes on both sides is preserved", "[history][merge]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto base = make_commit(store, make_tree(store, {{"a/x", "1"}, {"a/z", "1"}}), {}, "base", 1);
    auto main = make_commit(store, make_tree(store, {{"a/x", "2"}, {"a/z", "1"}}), {base}, "main", 2);
    auto side = make_commit(store, make_tree(store, {{"a/x", "1"}, {"a/z", "2"}}), {base}, "side", 3);
    auto merge = make_commit(store, make_tree(store, {{"a/x", "2"}, {"a/z", "2"}}),
                             {main, side}, "merge", 4);

    auto filter = compile(":/a");
    auto vm = history.rewrite(filter, merge);

    auto c = store.read_commit(vm);
    REQUIRE(c.parents.size() == 2);
    CHECK(c.parents[0] == history.rewrite(filter, main));
    CHECK(c.parents[1] == history.rewrite(filter, side));
    CHECK(c.message == "merge\n");
    CHECK(read_files(store, c.tree) == Files{{"x", "2"}, {"z", "2"}});

    fs::remove_all(path);
}

TEST_CASE("History: a merge with identical rewritten parents keeps one", "[history][merge]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto base = make_commit(store, make_tree(store, {{"a/x", "1"}}), {}, "base", 1);
    auto left = make_commit(store, make_tree(store, {{"a/x", "1"}, {"l", "1"}}), {base}, "left", 2);
    auto right = make_commit(store, make_tree(store, {{"a/x", "1"}, {"r", "1"}}), {base}, "right", 3);
    auto merge = make_commit(store, make_tree(store, {{"a/x", "1"}, {"l", "1"}, {"r", "1"}}),
                             {left, right}, "merge", 4);

    auto filter = compile(":/a");
    CHECK(history.rewrite(filter, merge) == history.rewrite(filter, base));

    fs::remove_all(path);
}

TEST_CASE("History: merging an unrelated history outside the view collapses", "[history][merge]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto ours = make_commit(store, make_tree(store, {{"a/x", "1"}}), {}, "ours", 1);
    auto theirs = make_commit(store, make_tree(store, {{"b/y", "1"}}), {}, "theirs", 2);
    auto theirs2 = make_commit(store, make_tree(store, {{"b/y", "2"}}), {theirs}, "theirs2", 3);
    auto merge = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b/y", "2"}}),
                             {ours, theirs2}, "merge", 4);
    auto swapped = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b/y", "2"}}),
                               {theirs2, ours}, "swapped", 5);

    auto filter = compile(":/a");
    auto vours = history.rewrite(filter, ours);
    CHECK(history.rewrite(filter, merge) == vours);
    CHECK(history.rewrite(filter, swapped) == vours);
    CHECK(store.read_commit(vours).parents.empty());

    // On its own the unrelated root is still materialised.
    auto vtheirs = history.rewrite(filter, theirs2);
    CHECK(tree_of(store, vtheirs) == vista::EMPTY_TREE);

    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// Squash
// ---------------------------------------------------------------------------

TEST_CASE("History: SQUASH yields a single parentless commit", "[history][squash]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto c1 = make_commit(store, make_tree(store, {{"a/x", "1"}}), {}, "c1", 1);
    auto c2 = make_commit(store, make_tree(store, {{"a/x", "2"}}), {c1}, "c2", 2);

    auto view = history.rewrite(compile(":/a:SQUASH"), c2);
    auto c = store.read_commit(view);
    CHECK(c.parents.empty());
    CHECK(c.message == "c2\n");
    CHECK(read_files(store, c.tree) == Files{{"x", "2"}});

    fs::remove_all(path);
}

// ---------------------------------------------------------------------------
// Caching
// ---------------------------------------------------------------------------

TEST_CASE("History: rewriting again performs no writes", "[history][cache]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto c1 = make_commit(store, make_tree(store, {{"a/x", "1"}}), {}, "c1", 1);
    auto c2 = make_commit(store, make_tree(store, {{"a/x", "2"}}), {c1}, "c2", 2);

    auto filter = compile(":/a");
    auto first = history.rewrite(filter, c2);

    auto before = store.stats();
    CHECK(history.rewrite(filter, c2) == first);
    auto after = store.stats();
    CHECK(after.objects_written == before.objects_written);
    CHECK(after.ref_updates == before.ref_updates);
    CHECK(history.stats().traversals == 1);

    fs::remove_all(path);
}

TEST_CASE("History: incremental rewrite stops at cached ancestors", "[history][cache]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto c1 = make_commit(store, make_tree(store, {{"a/x", "1"}}), {}, "c1", 1);
    auto c2 = make_commit(store, make_tree(store, {{"a/x", "2"}}), {c1}, "c2", 2);
    auto filter = compile(":/a");
    auto v2 = history.rewrite(filter, c2);

    auto c3 = make_commit(store, make_tree(store, {{"a/x", "3"}}), {c2}, "c3", 3);
    auto hits = history.stats().cache_hits;
    auto v3 = history.rewrite(filter, c3);

    CHECK(store.read_commit(v3).parents == std::vector<std::string>{v2});
    CHECK(history.stats().cache_hits == hits + 1);
    CHECK(history.stats().commits_written == 3);

    fs::remove_all(path);
}

TEST_CASE("History: every rewritten commit is recorded in the cache", "[history][cache]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto c1 = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b", "1"}}), {}, "c1", 1);
    auto c2 = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b", "2"}}), {c1}, "c2", 2);

    auto filter = compile(":/a");
    auto v2 = history.rewrite(filter, c2);
    auto fid = vista::filter_id(filter);

    auto frontier = cache.frontier(fid);
    std::vector<std::string> expected{c1, c2};
    std::sort(expected.begin(), expected.end());
    CHECK(frontier == expected);
    CHECK(cache.get(fid, c2) == v2);
    CHECK(cache.pending() == 0);

    fs::remove_all(path);
}

TEST_CASE("History: a restarted rewriter reuses the persisted cache", "[history][cache]") {
    auto path = make_temp_repo();
    std::string c2, first;
    {
        auto store = open_store(path);
        vista::RewriteCache cache(store);
        vista::HistoryRewriter history(store, cache);
        auto c1 = make_commit(store, make_tree(store, {{"a/x", "1"}}), {}, "c1", 1);
        c2 = make_commit(store, make_tree(store, {{"a/x", "2"}}), {c1}, "c2", 2);
        first = history.rewrite(compile(":/a"), c2);
    }
    {
        auto store = vista::Store::open(path);
        vista::RewriteCache cache(store);
        vista::HistoryRewriter history(store, cache);
        auto writes = store.stats().objects_written;
        CHECK(history.rewrite(compile(":/a/"), c2) == first);
        CHECK(store.stats().objects_written == writes);
        CHECK(history.stats().traversals == 0);
    }
    fs::remove_all(path);
}

TEST_CASE("History: different filters keep separate cache entries", "[history][cache]") {
    auto path = make_temp_repo();
    auto store = open_store(path);
    vista::RewriteCache cache(store);
    vista::HistoryRewriter history(store, cache);

    auto c = make_commit(store, make_tree(store, {{"a/x", "1"}, {"b/y", "2"}}), {}, "c");
    auto va = history.rewrite(compile(":/a"), c);
    auto vb = history.rewrite(compile(":/b"), c);
    CHECK(va != vb);
    CHECK(read_files(store, tree_of(store, vb)) == Files{{"y", "2"}});

    fs::remove_all(path);
}
