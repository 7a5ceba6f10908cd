#include "fuzzy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace search
{
    std::string toLower(const std::string &s)
    {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    namespace
    {
        // Both arguments already lower-cased.
        std::size_t minSubstringDistance(const std::string &p, const std::string &t, std::size_t cap)
        {
            const std::size_t m = p.size();
            const std::size_t n = t.size();
            if (m == 0)
                return 0;
            if (t.find(p) != std::string::npos)
                return 0;

            // Rows i-2, i-1 and i of the Sellers matrix, restricted
            // Damerau-Levenshtein. Row 0 is all zeros: the match may start anywhere.
            std::vector<std::size_t> prev2(n + 1, 0), prev(n + 1, 0), cur(n + 1, 0);
            for (std::size_t i = 1; i <= m; ++i)
            {
                cur[0] = i;
                std::size_t rowMin = cur[0];
                for (std::size_t j = 1; j <= n; ++j)
                {
                    std::size_t cost = p[i - 1] == t[j - 1] ? 0 : 1;
                    std::size_t best = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
                    if (i > 1 && j > 1 && p[i - 1] == t[j - 2] && p[i - 2] == t[j - 1])
                        best = std::min(best, prev2[j - 2] + 1);
                    cur[j] = best;
                    rowMin = std::min(rowMin, best);
                }
                if (rowMin > cap)
                    return rowMin;
                std::swap(prev2, prev);
                std::swap(prev, cur);
            }
            return *std::min_element(prev.begin(), prev.end());
        }
    }

    std::optional<double> fuzzyScore(const std::string &pattern, const std::string &text, double threshold)
    {
        if (pattern.empty())
            return std::nullopt;
        std::string p = toLower(pattern);
        std::string t = toLower(text);
        auto cap = static_cast<std::size_t>(std::floor(threshold * static_cast<double>(p.size())));
        std::size_t errors = minSubstringDistance(p, t, cap);
        if (errors > cap)
            return std::nullopt;
        return static_cast<double>(errors) / static_cast<double>(p.size());
    }

    void FuzzyIndex::add(const std::vector<std::string> &keys)
    {
        items_.push_back(keys);
    }

    std::vector<FuzzyHit> FuzzyIndex::search(const std::string &query, std::size_t limit) const
    {
        std::vector<FuzzyHit> hits;
        if (query.empty() || limit == 0)
            return hits;
        for (std::size_t i = 0; i < items_.size(); ++i)
        {
            std::optional<double> best;
            for (const auto &key : items_[i])
            {
                auto score = fuzzyScore(query, key, threshold_);
                if (score && (!best || *score < *best))
                    best = score;
                if (best && *best == 0.0)
                    break;
            }
            if (best)
                hits.push_back(FuzzyHit{i, *best});
        }
        std::stable_sort(hits.begin(), hits.end(), [](const FuzzyHit &a, const FuzzyHit &b)
                         { return a.score < b.score; });
        if (hits.size() > limit)
            hits.resize(limit);
        return hits;
    }
}
