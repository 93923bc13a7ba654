#include "internal.h"
#include "vista/error.h"

#include <cstring>
#include <string>
#include <vector>

namespace vista {
namespace paths {

std::vector<std::string> split(const std::string& norm_path) {
    std::vector<std::string> segs;
    size_t start = 0;
    while (start <= norm_path.size()) {
        size_t slash = norm_path.find('/', start);
        if (slash == std::string::npos) slash = norm_path.size();
        if (slash > start) segs.push_back(norm_path.substr(start, slash - start));
        start = slash + 1;
    }
    return segs;
}

/// Canonical form of a tree path: no leading, trailing or doubled slashes
/// and no `.` segments. The root is "". `..` throws InvalidPathError.
std::string normalize(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (auto& seg : split(path)) {
        if (seg == ".") continue;
        if (seg == "..") {
            throw InvalidPathError("'..' in " + path);
        }
        if (!out.empty()) out += '/';
        out += seg;
    }
    return out;
}

std::string join(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    return a + "/" + b;
}

bool is_within(const std::string& path, const std::string& dir) {
    if (dir.empty()) return true;
    if (path.compare(0, dir.size(), dir) != 0) return false;
    return path.size() == dir.size() || path[dir.size()] == '/';
}

std::string strip(const std::string& path, const std::string& dir) {
    if (dir.empty()) return path;
    if (path.size() == dir.size()) return {};
    return path.substr(dir.size() + 1);
}

/// Enforce git's reference naming rules (see git-check-ref-format).
void validate_ref_name(const std::string& name) {
    auto reject = [&](const std::string& why) {
        throw InvalidRefNameError("'" + name + "' " + why);
    };

    if (name.empty()) reject("is empty");
    if (name == "@") reject("is '@'");

    for (unsigned char ch : name) {
        if (ch < 0x20 || ch == 0x7f || std::strchr(" ~^:?*[\\", ch)) {
            reject("contains a forbidden character");
        }
    }
    if (name.find("..") != std::string::npos) reject("contains '..'");
    if (name.find("@{") != std::string::npos) reject("contains '@{'");
    if (name.find("//") != std::string::npos) reject("contains '//'");
    if (name.front() == '/' || name.back() == '/') reject("starts or ends with '/'");
    if (name.back() == '.') reject("ends with '.'");

    for (auto& seg : split(name)) {
        if (seg.front() == '.') reject("has a component starting with '.'");
        if (seg.size() >= 5 && seg.compare(seg.size() - 5, 5, ".lock") == 0) {
            reject("has a component ending with '.lock'");
        }
    }
}

} // namespace paths
} // namespace vista
