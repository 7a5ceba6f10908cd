#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Mapping between absolute filesystem paths and the canonical root-relative
// path space ("/" is the root, "/src/a.txt" a file below it).
namespace pathUtils
{
    // std::nullopt when 'absolutePath' lies outside 'root'.
    std::optional<std::string> toCanonical(const fs::path &root, const fs::path &absolutePath);

    fs::path toAbsolute(const fs::path &root, const std::string &canonicalPath);

    // std::nullopt for the root itself.
    std::optional<std::string> parentOf(const std::string &canonicalPath);

    int depthOf(const std::string &canonicalPath);

    std::string baseName(const std::string &canonicalPath);

    // Lower-cased, without the leading dot. Empty when there is none.
    std::string extensionOf(const std::string &canonicalPath);

    // True when 'path' equals 'base' or lies below it. Works for canonical
    // and absolute paths alike.
    bool isSelfOrDescendant(const std::string &base, const std::string &path);

    // True when any segment of the path is ".git".
    bool isGitInternal(const std::string &canonicalPath);

    // Repository directory owning a path inside a ".git" directory:
    // "/.git/HEAD" -> "/", "/a/.git/refs" -> "/a", "/a/b.txt" -> std::nullopt.
    std::optional<std::string> repoRootForInternalPath(const std::string &canonicalPath);
}
