#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace search
{
    // Approximate substring score of 'pattern' inside 'text': the minimum
    // number of edits (insertions, deletions, substitutions, adjacent
    // transpositions) needed to find the pattern anywhere in the text,
    // divided by the pattern length. 0 is an exact, case-insensitive hit.
    // std::nullopt when the score exceeds 'threshold'.
    std::optional<double> fuzzyScore(const std::string &pattern, const std::string &text, double threshold);

    std::string toLower(const std::string &s);

    struct FuzzyHit
    {
        std::size_t index; // position of the item in insertion order
        double score;
    };

    // Fuzzy index over items described by one or more searchable keys.
    // An item's score is the best score of any of its keys.
    class FuzzyIndex
    {
    public:
        explicit FuzzyIndex(double threshold = 0.3) : threshold_(threshold) {}

        void add(const std::vector<std::string> &keys);
        std::size_t size() const { return items_.size(); }

        // Best matches first; equal scores keep insertion order.
        std::vector<FuzzyHit> search(const std::string &query, std::size_t limit) const;

    private:
        double threshold_;
        std::vector<std::vector<std::string>> items_;
    };
}
