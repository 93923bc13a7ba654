#pragma once

#include "filter.h"
#include "store.h"
#include "tree_rewriter.h"

#include <string>

namespace vista {

/// Maps edits made in a filtered view back onto the unfiltered history.
class InverseRewriter {
public:
    explicit InverseRewriter(Store store);

    /// Rebuild `edited` (a commit in the view of `filter`) as an unfiltered
    /// commit on top of `base`.
    ///
    /// The leaf-level delta between the view of `base` and the tree of
    /// `edited` is mapped back path by path and applied to the tree of
    /// `base`. The result has `base` as its only parent and carries the
    /// author, committer and message of `edited`.
    ///
    /// @throws ConflictError if a changed path is unreachable or ambiguous
    ///         under `filter`, or if the rebuilt tree does not filter back
    ///         to the edited tree.
    std::string unapply(const Filter& filter,
                        const std::string& edited,
                        const std::string& base);

    /// Replay every commit on the first-parent path from `old_view_tip`
    /// (exclusive) to `new_view_tip` onto `base`, oldest first.
    ///
    /// @return the last rebuilt commit, or `base` if the range is empty.
    /// @throws ConflictError if the range contains a merge or does not
    ///         descend from `old_view_tip`.
    std::string unapply_range(const Filter& filter,
                              const std::string& old_view_tip,
                              const std::string& new_view_tip,
                              const std::string& base);

private:
    Store        store_;
    TreeRewriter trees_;
};

} // namespace vista
