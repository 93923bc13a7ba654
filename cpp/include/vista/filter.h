#pragma once

/// @file filter.h
/// Filter specifications: parsing, canonicalisation and identity.

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace vista {

class Filter;

// ---------------------------------------------------------------------------
// Operators
// ---------------------------------------------------------------------------

namespace ops {

/// Identity. Written `:nop`, or the empty specification.
struct Nop {};

/// Always the empty tree. Written `:empty`.
struct Empty {};

/// Select `path` as the new root. Written `:/path`.
struct Subdir { std::string path; };

/// Move the whole tree under `path`. Written `:prefix=path`.
struct Prefix { std::string path; };

/// Keep only `path`, at its own location. Written `::path`.
struct File { std::string path; };

/// Keep only leaves whose path matches `glob`. Written `::glob`.
struct Pattern { std::string glob; };

/// Sequential composition, applied left to right.
struct Chain { std::vector<Filter> items; };

/// Union of branches evaluated against the same input. Later branches
/// overwrite earlier ones at identical paths.
struct Combine { std::vector<Filter> items; };

/// Remove every source path `inner` reads. Written `:exclude[...]`.
struct Exclude { std::shared_ptr<const Filter> inner; };

/// Collapse history to a single commit. Written `:SQUASH`.
struct Squash {};

bool operator==(const Nop&, const Nop&);
bool operator==(const Empty&, const Empty&);
bool operator==(const Subdir& a, const Subdir& b);
bool operator==(const Prefix& a, const Prefix& b);
bool operator==(const File& a, const File& b);
bool operator==(const Pattern& a, const Pattern& b);
bool operator==(const Chain& a, const Chain& b);
bool operator==(const Combine& a, const Combine& b);
bool operator==(const Exclude& a, const Exclude& b);
bool operator==(const Squash&, const Squash&);

} // namespace ops

// ---------------------------------------------------------------------------
// Filter
// ---------------------------------------------------------------------------

/// An immutable filter AST node. Cheap to copy for leaf operators; chains
/// and combines own their children by value.
class Filter {
public:
    using Node = std::variant<ops::Nop, ops::Empty, ops::Subdir, ops::Prefix,
                              ops::File, ops::Pattern, ops::Chain,
                              ops::Combine, ops::Exclude, ops::Squash>;

    Filter() : node_(ops::Nop{}) {}
    Filter(Node node) : node_(std::move(node)) {}

    const Node& node() const { return node_; }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(node_); }

    template <typename T>
    const T& as() const { return std::get<T>(node_); }

    /// Structural equality.
    bool operator==(const Filter& o) const;
    bool operator!=(const Filter& o) const { return !(*this == o); }

private:
    Node node_;
};

// ---------------------------------------------------------------------------
// Construction helpers
// ---------------------------------------------------------------------------

Filter make_subdir(const std::string& path);
Filter make_prefix(const std::string& path);
Filter make_chain(std::vector<Filter> items);
Filter make_combine(std::vector<Filter> items);
Filter make_exclude(Filter inner);

// ---------------------------------------------------------------------------
// Text <-> AST
// ---------------------------------------------------------------------------

/// Parse `text` into a raw (unnormalized) AST.
///
/// Grammar, informally:
/// @code
///     filter  := element*                  (whitespace allowed between)
///     element := ':/' path | ':prefix=' path | '::' path-or-glob
///              | ':[' list ']' | ':exclude[' list ']'
///              | ':SQUASH' | ':nop' | ':empty'
///     list    := entry ((',' | whitespace) entry)*
///     entry   := element+ | path '=' element+
/// @endcode
/// `#` starts a comment that runs to the end of the line.
///
/// @throws MalformedSpecError with the byte offset of the first bad byte.
Filter parse(const std::string& text);

/// Canonicalise a filter so that equivalent expressions compare equal.
Filter normalize(const Filter& filter);

/// parse() followed by normalize().
Filter compile(const std::string& text);

/// Canonical text. For a normalized filter `f`,
/// `compile(to_string(f)) == f`.
std::string to_string(const Filter& filter);

/// Identity of a filter: the git blob id of its canonical text.
/// Callers should pass a normalized filter.
std::string filter_id(const Filter& filter);

/// True if the filter collapses history (ends in `:SQUASH`).
bool is_squash(const Filter& filter);

/// The filter with a trailing `:SQUASH` removed.
Filter without_squash(const Filter& filter);

} // namespace vista
