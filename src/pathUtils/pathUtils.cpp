#include "pathUtils.hpp"

#include <algorithm>
#include <cctype>

namespace pathUtils
{
    std::optional<std::string> toCanonical(const fs::path &root, const fs::path &absolutePath)
    {
        fs::path base = root.lexically_normal();
        fs::path target = absolutePath.lexically_normal();
        if (!base.empty() && base.filename().empty())
            base = base.parent_path();
        if (!target.empty() && target.filename().empty() && target != target.root_path())
            target = target.parent_path();

        fs::path relative = target.lexically_relative(base);
        if (relative.empty())
            return std::nullopt;
        if (relative == ".")
            return std::string("/");

        std::string canonical;
        for (const auto &segment : relative)
        {
            if (segment == "..")
                return std::nullopt;
            if (segment == "." || segment.empty())
                continue;
            canonical += '/';
            canonical += segment.string();
        }
        if (canonical.empty())
            return std::string("/");
        return canonical;
    }

    fs::path toAbsolute(const fs::path &root, const std::string &canonicalPath)
    {
        if (canonicalPath.empty() || canonicalPath == "/")
            return root;
        fs::path result = root;
        std::size_t start = canonicalPath[0] == '/' ? 1 : 0;
        while (start < canonicalPath.size())
        {
            std::size_t end = canonicalPath.find('/', start);
            if (end == std::string::npos)
                end = canonicalPath.size();
            if (end > start)
                result /= canonicalPath.substr(start, end - start);
            start = end + 1;
        }
        return result;
    }

    std::optional<std::string> parentOf(const std::string &canonicalPath)
    {
        if (canonicalPath.empty() || canonicalPath == "/")
            return std::nullopt;
        auto idx = canonicalPath.find_last_of('/');
        if (idx == std::string::npos || idx == 0)
            return std::string("/");
        return canonicalPath.substr(0, idx);
    }

    int depthOf(const std::string &canonicalPath)
    {
        if (canonicalPath.empty() || canonicalPath == "/")
            return 0;
        return static_cast<int>(std::count(canonicalPath.begin(), canonicalPath.end(), '/'));
    }

    std::string baseName(const std::string &canonicalPath)
    {
        auto idx = canonicalPath.find_last_of('/');
        if (idx == std::string::npos)
            return canonicalPath;
        return canonicalPath.substr(idx + 1);
    }

    std::string extensionOf(const std::string &canonicalPath)
    {
        std::string name = baseName(canonicalPath);
        auto dot = name.find_last_of('.');
        // Dotfiles such as ".bashrc" carry no extension.
        if (dot == std::string::npos || dot == 0)
            return "";
        std::string ext = name.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    bool isSelfOrDescendant(const std::string &base, const std::string &path)
    {
        if (base == path || base == "/")
            return true;
        if (!base.empty() && base.back() == '/')
            return path.compare(0, base.size(), base) == 0;
        return path.size() > base.size() &&
               path.compare(0, base.size(), base) == 0 &&
               path[base.size()] == '/';
    }

    bool isGitInternal(const std::string &canonicalPath)
    {
        return repoRootForInternalPath(canonicalPath).has_value();
    }

    std::optional<std::string> repoRootForInternalPath(const std::string &canonicalPath)
    {
        const std::string marker = "/.git";
        auto idx = canonicalPath.find(marker);
        while (idx != std::string::npos)
        {
            auto after = idx + marker.size();
            if (after == canonicalPath.size() || canonicalPath[after] == '/')
            {
                if (idx == 0)
                    return std::string("/");
                return canonicalPath.substr(0, idx);
            }
            idx = canonicalPath.find(marker, after);
        }
        return std::nullopt;
    }
}
