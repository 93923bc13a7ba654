#include "vista/filter.h"
#include "vista/error.h"
#include "internal.h"

#include <git2.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace vista {

// ---------------------------------------------------------------------------
// Equality
// ---------------------------------------------------------------------------

namespace ops {

bool operator==(const Nop&, const Nop&) { return true; }
bool operator==(const Empty&, const Empty&) { return true; }
bool operator==(const Squash&, const Squash&) { return true; }
bool operator==(const Subdir& a, const Subdir& b) { return a.path == b.path; }
bool operator==(const Prefix& a, const Prefix& b) { return a.path == b.path; }
bool operator==(const File& a, const File& b) { return a.path == b.path; }
bool operator==(const Pattern& a, const Pattern& b) { return a.glob == b.glob; }
bool operator==(const Chain& a, const Chain& b) { return a.items == b.items; }
bool operator==(const Combine& a, const Combine& b) { return a.items == b.items; }

bool operator==(const Exclude& a, const Exclude& b) {
    if (a.inner == b.inner) return true;
    if (!a.inner || !b.inner) return false;
    return *a.inner == *b.inner;
}

} // namespace ops

bool Filter::operator==(const Filter& o) const {
    return node_ == o.node_;
}

Filter make_subdir(const std::string& path) {
    return Filter{ops::Subdir{paths::normalize(path)}};
}

Filter make_prefix(const std::string& path) {
    return Filter{ops::Prefix{paths::normalize(path)}};
}

Filter make_chain(std::vector<Filter> items) {
    return Filter{ops::Chain{std::move(items)}};
}

Filter make_combine(std::vector<Filter> items) {
    return Filter{ops::Combine{std::move(items)}};
}

Filter make_exclude(Filter inner) {
    return Filter{ops::Exclude{std::make_shared<const Filter>(std::move(inner))}};
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

namespace {

/// Offset of the first segment of `raw` that is exactly "..".
size_t dotdot_offset(const std::string& raw) {
    size_t start = 0;
    while (start <= raw.size()) {
        size_t slash = raw.find('/', start);
        if (slash == std::string::npos) slash = raw.size();
        if (raw.compare(start, slash - start, "..") == 0) return start;
        start = slash + 1;
    }
    return 0;
}

class Parser {
public:
    explicit Parser(const std::string& text) : s_(text) {}

    Filter parse_top() {
        std::vector<Filter> items;
        while (true) {
            skip_blank();
            if (eof()) break;
            if (s_[pos_] != ':') fail("expected ':'");
            items.push_back(parse_element());
        }
        if (items.empty()) return Filter{};
        if (items.size() == 1) return items.front();
        return make_chain(std::move(items));
    }

private:
    [[noreturn]] void fail(const std::string& msg) const { fail_at(msg, pos_); }

    [[noreturn]] void fail_at(const std::string& msg, size_t at) const {
        throw MalformedSpecError(msg, at);
    }

    bool eof() const { return pos_ >= s_.size(); }

    /// Skip whitespace and `#` comments.
    void skip_blank() {
        while (!eof()) {
            char c = s_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '#') {
                while (!eof() && s_[pos_] != '\n') ++pos_;
            } else {
                break;
            }
        }
    }

    void expect(char c) {
        if (eof() || s_[pos_] != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    std::string read_ident() {
        size_t start = pos_;
        while (!eof() && (std::isalpha(static_cast<unsigned char>(s_[pos_])) ||
                          s_[pos_] == '_')) {
            ++pos_;
        }
        return s_.substr(start, pos_ - start);
    }

    static bool ends_path(char c) {
        return c == ':' || c == ',' || c == ']' || c == '[' || c == '=' ||
               c == '#' || std::isspace(static_cast<unsigned char>(c));
    }

    /// Read a path up to the next delimiter. With `glob` set, bracket
    /// expressions are read whole.
    std::string read_path(bool glob) {
        size_t start = pos_;
        while (!eof()) {
            char c = s_[pos_];
            if (glob && c == '[') {
                size_t open = pos_;
                while (!eof() && s_[pos_] != ']') ++pos_;
                if (eof()) fail_at("unterminated character class", open);
                ++pos_;
                continue;
            }
            if (ends_path(c)) break;
            ++pos_;
        }
        std::string raw = s_.substr(start, pos_ - start);
        if (raw.empty()) fail_at("expected a path", start);

        std::string norm;
        try {
            norm = paths::normalize(raw);
        } catch (const InvalidPathError&) {
            fail_at("'..' is not allowed in paths", start + dotdot_offset(raw));
        }
        if (norm.empty()) fail_at("path must not be empty", start);
        return norm;
    }

    Filter parse_element() {
        size_t start = pos_;
        expect(':');
        if (eof()) fail("unexpected end of filter");

        char c = s_[pos_];
        if (c == '/') {
            ++pos_;
            return Filter{ops::Subdir{read_path(false)}};
        }
        if (c == ':') {
            ++pos_;
            std::string p = read_path(true);
            bool magic = false;
            for (auto& seg : paths::split(p)) {
                if (glob::has_magic(seg)) magic = true;
            }
            if (magic) return Filter{ops::Pattern{p}};
            return Filter{ops::File{p}};
        }
        if (c == '[') {
            ++pos_;
            return make_combine(parse_list());
        }

        size_t ident_at = pos_;
        std::string ident = read_ident();
        if (ident == "prefix") {
            expect('=');
            return Filter{ops::Prefix{read_path(false)}};
        }
        if (ident == "exclude") {
            expect('[');
            return make_exclude(make_combine(parse_list()));
        }
        if (ident == "SQUASH") {
            if (depth_ > 0) {
                fail_at(":SQUASH is only allowed at the top level", start);
            }
            return Filter{ops::Squash{}};
        }
        if (ident == "nop") return Filter{};
        if (ident == "empty") return Filter{ops::Empty{}};

        if (ident.empty()) fail_at("expected an operator", ident_at);
        fail_at("unknown operator '" + ident + "'", ident_at);
    }

    /// Elements directly following each other, without separators.
    Filter parse_contiguous() {
        std::vector<Filter> items;
        do {
            items.push_back(parse_element());
        } while (!eof() && s_[pos_] == ':');
        if (items.size() == 1) return items.front();
        return make_chain(std::move(items));
    }

    Filter parse_entry() {
        if (s_[pos_] == ':') return parse_contiguous();

        std::string dst = read_path(false);
        skip_blank();
        expect('=');
        skip_blank();
        if (eof() || s_[pos_] != ':') fail("expected a filter after '='");
        Filter f = parse_contiguous();
        return make_chain({std::move(f), Filter{ops::Prefix{dst}}});
    }

    /// Entries up to and including the closing ']'.
    std::vector<Filter> parse_list() {
        ++depth_;
        std::vector<Filter> items;
        while (true) {
            skip_blank();
            if (eof()) fail("unterminated list");
            char c = s_[pos_];
            if (c == ']') {
                ++pos_;
                break;
            }
            if (c == ',') fail("empty list entry");
            items.push_back(parse_entry());
            skip_blank();
            if (!eof() && s_[pos_] == ',') ++pos_;
        }
        --depth_;
        return items;
    }

    const std::string& s_;
    size_t pos_ = 0;
    int depth_ = 0;
};

} // anonymous namespace

Filter parse(const std::string& text) {
    return Parser(text).parse_top();
}

// ---------------------------------------------------------------------------
// normalize
// ---------------------------------------------------------------------------

namespace {

Filter empty_filter() { return Filter{ops::Empty{}}; }

/// Rewrite one adjacent pair inside a chain. Returns true and fills `out`
/// (possibly empty) if the pair simplifies.
bool fold_pair(const Filter& a, const Filter& b, std::vector<Filter>& out) {
    if (a.is<ops::Subdir>() && b.is<ops::Subdir>()) {
        out.push_back(Filter{ops::Subdir{
            paths::join(a.as<ops::Subdir>().path, b.as<ops::Subdir>().path)}});
        return true;
    }
    if (a.is<ops::Prefix>() && b.is<ops::Prefix>()) {
        out.push_back(Filter{ops::Prefix{
            paths::join(b.as<ops::Prefix>().path, a.as<ops::Prefix>().path)}});
        return true;
    }
    if (a.is<ops::Prefix>() && b.is<ops::Subdir>()) {
        const std::string& p = a.as<ops::Prefix>().path;
        const std::string& q = b.as<ops::Subdir>().path;
        if (p == q) return true;
        if (paths::is_within(q, p)) {
            out.push_back(Filter{ops::Subdir{paths::strip(q, p)}});
        } else if (paths::is_within(p, q)) {
            out.push_back(Filter{ops::Prefix{paths::strip(p, q)}});
        } else {
            out.push_back(empty_filter());
        }
        return true;
    }
    return false;
}

Filter normalize_chain(const std::vector<Filter>& raw) {
    std::vector<Filter> items;
    bool squash = false;
    for (auto& r : raw) {
        Filter f = normalize(r);
        if (f.is<ops::Chain>()) {
            for (auto& sub : f.as<ops::Chain>().items) {
                if (sub.is<ops::Squash>()) squash = true;
                else items.push_back(sub);
            }
        } else if (f.is<ops::Squash>()) {
            squash = true;
        } else if (!f.is<ops::Nop>()) {
            items.push_back(std::move(f));
        }
    }

    bool changed = true;
    while (changed) {
        changed = false;
        for (size_t i = 0; i + 1 < items.size(); ++i) {
            std::vector<Filter> repl;
            if (!fold_pair(items[i], items[i + 1], repl)) continue;
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(i),
                        items.begin() + static_cast<std::ptrdiff_t>(i) + 2);
            items.insert(items.begin() + static_cast<std::ptrdiff_t>(i),
                         repl.begin(), repl.end());
            changed = true;
            break;
        }
    }

    bool has_empty = std::any_of(items.begin(), items.end(),
        [](const Filter& f) { return f.is<ops::Empty>(); });
    if (has_empty) items = {empty_filter()};

    if (squash) items.push_back(Filter{ops::Squash{}});
    if (items.empty()) return Filter{};
    if (items.size() == 1) return items.front();
    return make_chain(std::move(items));
}

Filter normalize_combine(const std::vector<Filter>& raw) {
    std::vector<Filter> flat;
    for (auto& r : raw) {
        Filter f = normalize(r);
        if (f.is<ops::Combine>()) {
            for (auto& sub : f.as<ops::Combine>().items) flat.push_back(sub);
        } else if (!f.is<ops::Empty>()) {
            flat.push_back(std::move(f));
        }
    }

    // A later duplicate overrides every earlier one; keep the last.
    std::vector<Filter> items;
    for (size_t i = 0; i < flat.size(); ++i) {
        bool later = std::find(flat.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                               flat.end(), flat[i]) != flat.end();
        if (!later) items.push_back(flat[i]);
    }

    if (items.empty()) return empty_filter();
    if (items.size() == 1) return items.front();
    return make_combine(std::move(items));
}

} // anonymous namespace

Filter normalize(const Filter& filter) {
    const auto& n = filter.node();
    if (auto* s = std::get_if<ops::Subdir>(&n)) {
        if (s->path.empty()) return Filter{};
        return filter;
    }
    if (auto* p = std::get_if<ops::Prefix>(&n)) {
        if (p->path.empty()) return Filter{};
        return filter;
    }
    if (auto* c = std::get_if<ops::Chain>(&n)) return normalize_chain(c->items);
    if (auto* c = std::get_if<ops::Combine>(&n)) return normalize_combine(c->items);
    if (auto* e = std::get_if<ops::Exclude>(&n)) {
        Filter inner = e->inner ? normalize(*e->inner) : empty_filter();
        if (inner.is<ops::Empty>()) return Filter{};
        if (inner.is<ops::Nop>()) return empty_filter();
        return make_exclude(std::move(inner));
    }
    return filter;
}

Filter compile(const std::string& text) {
    return normalize(parse(text));
}

// ---------------------------------------------------------------------------
// to_string / identity
// ---------------------------------------------------------------------------

namespace {

std::string join_items(const std::vector<Filter>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += to_string(items[i]);
    }
    return out;
}

} // anonymous namespace

std::string to_string(const Filter& filter) {
    const auto& n = filter.node();
    if (std::holds_alternative<ops::Nop>(n)) return ":nop";
    if (std::holds_alternative<ops::Empty>(n)) return ":empty";
    if (std::holds_alternative<ops::Squash>(n)) return ":SQUASH";
    if (auto* s = std::get_if<ops::Subdir>(&n)) return ":/" + s->path;
    if (auto* p = std::get_if<ops::Prefix>(&n)) return ":prefix=" + p->path;
    if (auto* f = std::get_if<ops::File>(&n)) return "::" + f->path;
    if (auto* g = std::get_if<ops::Pattern>(&n)) return "::" + g->glob;
    if (auto* c = std::get_if<ops::Chain>(&n)) {
        std::string out;
        for (auto& item : c->items) out += to_string(item);
        return out;
    }
    if (auto* c = std::get_if<ops::Combine>(&n)) {
        return ":[" + join_items(c->items) + "]";
    }
    const auto& e = std::get<ops::Exclude>(n);
    if (!e.inner) return ":exclude[]";
    if (e.inner->is<ops::Combine>()) {
        return ":exclude[" + join_items(e.inner->as<ops::Combine>().items) + "]";
    }
    return ":exclude[" + to_string(*e.inner) + "]";
}

std::string filter_id(const Filter& filter) {
    static const struct Init {
        Init()  { git_libgit2_init(); }
        ~Init() { git_libgit2_shutdown(); }
    } init;

    std::string text = to_string(filter);
    git_oid oid;
    if (git_odb_hash(&oid, text.data(), text.size(), GIT_OBJECT_BLOB) != 0) {
        throw GitError("git_odb_hash (filter id)");
    }
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return std::string(buf, GIT_OID_HEXSZ);
}

bool is_squash(const Filter& filter) {
    if (filter.is<ops::Squash>()) return true;
    if (!filter.is<ops::Chain>()) return false;
    const auto& items = filter.as<ops::Chain>().items;
    return !items.empty() && items.back().is<ops::Squash>();
}

Filter without_squash(const Filter& filter) {
    if (filter.is<ops::Squash>()) return Filter{};
    if (!is_squash(filter)) return filter;
    auto items = filter.as<ops::Chain>().items;
    items.pop_back();
    if (items.size() == 1) return items.front();
    return make_chain(std::move(items));
}

} // namespace vista
