#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "execbox/core/error.hpp"

namespace execbox::security {

enum class PathStyle {
    Posix,
    Windows,
};

/// An absolute path with every "." and ".." segment collapsed.
///
/// Normalization is purely lexical: symlinks are not resolved and the path
/// need not exist. Windows-style paths compare case-insensitively.
struct NormalizedPath {
    PathStyle style = PathStyle::Posix;
    std::string root;                   // "/", "C:\", or "\\server\share\"
    std::vector<std::string> segments;

    [[nodiscard]] auto str() const -> std::string;

    /// True if both paths name the same location.
    [[nodiscard]] auto same_as(const NormalizedPath& other) const -> bool;

    /// True if `other` is this path or lies beneath it, on segment boundaries.
    [[nodiscard]] auto contains(const NormalizedPath& other) const -> bool;
};

/// Path style of the running host.
auto host_path_style() -> PathStyle;

/// Drive-letter and UNC paths are Windows-style on every host; anything
/// else follows the host.
auto detect_path_style(std::string_view path) -> PathStyle;

/// Resolves `path` against the current directory and collapses traversal.
auto normalize_path(std::string_view path) -> Result<NormalizedPath>;

/// Resolves `path` against `base` (which must be absolute) and collapses
/// traversal.
auto normalize_path(std::string_view path, const std::filesystem::path& base)
    -> Result<NormalizedPath>;

/// One entry of allowed_directories. A trailing '*' turns the entry into a
/// subtree rule: the root itself and everything beneath it.
struct DirectoryRule {
    std::string pattern;
    NormalizedPath root;
    bool subtree = false;

    [[nodiscard]] auto matches(const NormalizedPath& path) const -> bool;
};

/// Parses a directory pattern. The pattern must be absolute and may carry
/// the wildcard marker only as its final character.
auto parse_directory_rule(std::string_view pattern) -> Result<DirectoryRule>;

} // namespace execbox::security
