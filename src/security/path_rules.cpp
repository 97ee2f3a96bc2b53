#include "execbox/security/path_rules.hpp"

#include "execbox/core/utils.hpp"

#include <cctype>

namespace execbox::security {

namespace {

auto is_separator(char c, PathStyle style) -> bool {
    return c == '/' || (style == PathStyle::Windows && c == '\\');
}

auto has_drive_prefix(std::string_view p) -> bool {
    return p.size() >= 2 && std::isalpha(static_cast<unsigned char>(p[0])) && p[1] == ':';
}

auto has_unc_prefix(std::string_view p) -> bool {
    return p.size() >= 2 &&
           (p[0] == '\\' || p[0] == '/') &&
           (p[1] == '\\' || p[1] == '/');
}

/// Drive-letter paths count as absolute even without a separator after the
/// colon: there is no per-drive current directory to resolve "C:foo" against.
auto is_absolute_text(std::string_view p, PathStyle style) -> bool {
    if (style == PathStyle::Windows) {
        return has_drive_prefix(p) || has_unc_prefix(p);
    }
    return !p.empty() && p[0] == '/';
}

auto split_segments(std::string_view p, PathStyle style) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::string current;
    for (char c : p) {
        if (is_separator(c, style)) {
            parts.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(std::move(current));
    return parts;
}

/// Drops empty and "." segments and lets ".." consume its parent. ".." at
/// the root stays at the root.
void collapse_into(std::vector<std::string>& out, std::vector<std::string> raw) {
    for (auto& seg : raw) {
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            continue;
        }
        out.push_back(std::move(seg));
    }
}

auto segment_equal(const std::string& a, const std::string& b, PathStyle style) -> bool {
    return style == PathStyle::Windows ? utils::iequals(a, b) : a == b;
}

auto normalize_absolute(std::string_view p, PathStyle style) -> Result<NormalizedPath> {
    NormalizedPath out;
    out.style = style;

    if (style == PathStyle::Posix) {
        out.root = "/";
        collapse_into(out.segments, split_segments(p.substr(1), style));
        return out;
    }

    if (has_drive_prefix(p)) {
        out.root = std::string(1, static_cast<char>(
            std::toupper(static_cast<unsigned char>(p[0])))) + ":\\";
        collapse_into(out.segments, split_segments(p.substr(2), style));
        return out;
    }

    // UNC: \\server\share is the root; traversal cannot climb above it.
    auto parts = split_segments(p.substr(2), style);
    if (parts.size() < 2 || parts[0].empty() || parts[1].empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Malformed UNC path", std::string(p)));
    }
    out.root = "\\\\" + parts[0] + "\\" + parts[1] + "\\";
    collapse_into(out.segments,
        std::vector<std::string>(parts.begin() + 2, parts.end()));
    return out;
}

} // anonymous namespace

auto NormalizedPath::str() const -> std::string {
    const char sep = style == PathStyle::Windows ? '\\' : '/';
    std::string out = root;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += sep;
        out += segments[i];
    }
    return out;
}

auto NormalizedPath::same_as(const NormalizedPath& other) const -> bool {
    if (style != other.style || segments.size() != other.segments.size()) {
        return false;
    }
    return contains(other);
}

auto NormalizedPath::contains(const NormalizedPath& other) const -> bool {
    if (style != other.style) return false;
    if (!segment_equal(root, other.root, style)) return false;
    if (other.segments.size() < segments.size()) return false;

    for (size_t i = 0; i < segments.size(); ++i) {
        if (!segment_equal(segments[i], other.segments[i], style)) {
            return false;
        }
    }
    return true;
}

auto host_path_style() -> PathStyle {
#ifdef _WIN32
    return PathStyle::Windows;
#else
    return PathStyle::Posix;
#endif
}

auto detect_path_style(std::string_view path) -> PathStyle {
    if (has_drive_prefix(path)) return PathStyle::Windows;
    if (path.size() >= 2 && path[0] == '\\' && path[1] == '\\') return PathStyle::Windows;
    return host_path_style();
}

auto normalize_path(std::string_view path) -> Result<NormalizedPath> {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot determine current directory", ec.message()));
    }
    return normalize_path(path, cwd);
}

auto normalize_path(std::string_view path, const std::filesystem::path& base)
    -> Result<NormalizedPath> {
    if (path.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Empty path"));
    }
    if (path.find('\0') != std::string_view::npos) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Path contains a NUL character"));
    }

    auto style = detect_path_style(path);
    if (is_absolute_text(path, style)) {
        return normalize_absolute(path, style);
    }

    auto base_text = base.string();
    auto base_style = detect_path_style(base_text);
    if (base_style != style || !is_absolute_text(base_text, base_style)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Cannot resolve relative path", std::string(path)));
    }

    auto resolved = normalize_absolute(base_text, base_style);
    if (!resolved) return resolved;

    // "\foo" on Windows is rooted on the base's drive.
    if (style == PathStyle::Windows && is_separator(path[0], style)) {
        resolved->segments.clear();
    }
    collapse_into(resolved->segments, split_segments(path, style));
    return resolved;
}

auto DirectoryRule::matches(const NormalizedPath& path) const -> bool {
    return subtree ? root.contains(path) : root.same_as(path);
}

auto parse_directory_rule(std::string_view pattern) -> Result<DirectoryRule> {
    auto text = utils::trim(pattern);
    if (text.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Empty directory pattern"));
    }

    DirectoryRule rule;
    rule.pattern = std::string(pattern);

    if (text.back() == '*') {
        rule.subtree = true;
        text.pop_back();
        while (text.size() > 1 && (text.back() == '/' || text.back() == '\\')) {
            text.pop_back();
        }
    }

    if (text.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Directory pattern has no path before the wildcard", rule.pattern));
    }
    if (text.find('*') != std::string::npos) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Wildcard marker is only allowed at the end of a directory pattern",
            rule.pattern));
    }

    auto style = detect_path_style(text);
    if (!is_absolute_text(text, style)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Directory pattern must be an absolute path", rule.pattern));
    }

    auto root = normalize_absolute(text, style);
    if (!root) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Invalid directory pattern", rule.pattern + ": " + root.error().what()));
    }
    rule.root = std::move(*root);
    return rule;
}

} // namespace execbox::security
