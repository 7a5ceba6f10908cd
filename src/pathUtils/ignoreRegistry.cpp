#include "ignoreRegistry.hpp"
#include "pathUtils.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <mutex>

namespace pathUtils
{
    namespace
    {
        bool hasSocketSuffix(const std::string &path)
        {
            const std::string suffix = ".sock";
            if (path.size() < suffix.size())
                return false;
            return std::equal(suffix.rbegin(), suffix.rend(), path.rbegin(),
                              [](char a, char b)
                              { return a == std::tolower(static_cast<unsigned char>(b)); });
        }
    }

    IgnoreRegistry::IgnoreRegistry(fs::path root)
        : root_(std::move(root))
    {
    }

    void IgnoreRegistry::markUnsupported(const fs::path &absolutePath)
    {
        auto canonical = toCanonical(root_, absolutePath);
        if (absolutePath.empty() || !canonical)
            return;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            paths_.insert(*canonical);
        }
        MyLogger::warning("Skipping unsupported filesystem entry: " + absolutePath.string());
    }

    bool IgnoreRegistry::shouldIgnore(const std::string &absolutePath) const
    {
        if (absolutePath.empty())
            return false;
        if (hasSocketSuffix(absolutePath))
            return true;
        auto canonical = toCanonical(root_, fs::path(absolutePath));
        if (!canonical)
            return false;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return paths_.count(*canonical) > 0;
    }

    std::size_t IgnoreRegistry::size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return paths_.size();
    }

    bool IgnoreRegistry::isUnsupportedError(const std::error_code &ec)
    {
        if (!ec || (ec.category() != std::generic_category() && ec.category() != std::system_category()))
            return false;
        switch (ec.value())
        {
        case EACCES:
        case EPERM:
        case ENOTSUP:
#if EOPNOTSUPP != ENOTSUP
        case EOPNOTSUPP:
#endif
        case ENAMETOOLONG:
            return true;
        default:
            return false;
        }
    }

    bool IgnoreRegistry::isSpecialFile(const fs::file_status &status)
    {
        switch (status.type())
        {
        case fs::file_type::socket:
        case fs::file_type::fifo:
        case fs::file_type::character:
        case fs::file_type::block:
            return true;
        default:
            return false;
        }
    }
}
