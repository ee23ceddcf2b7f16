#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <string_view>
#include <vector>
#include "chromatic.hpp"

namespace Util
{
    template<typename Pred, typename First, typename... Others>
    bool compareOr( First base, Others... others)
    {
        return ( ... || Pred()( base, others));
    }

    double clamp( double x, double lowerlimit, double upperlimit);

    /*
     * ASCII lower casing, keywords and hex digits never need more.
     */
    std::string toLower( std::string_view given);

    /*
     * Shortest decimal form that reads back to the same double ( e.g. 0.5, 1, 20.078431372549026).
     */
    std::string formatNumber( double value);

    /*
     * Reads at most `max_digits` digits of the given base and advances `ctx` past them.
     */
    uint64_t getNumber( const char *&ctx, uint8_t base = 10, size_t max_digits = SIZE_MAX);

    /*
     * Build a BKTree with the given word.
     */
    void insert( std::shared_ptr<BKNode> &node, std::string_view word);

    /*
     * Build a KDTree keyed on red, green and blue in turn.
     */
    void insert( std::shared_ptr<KDNode> &node, std::array<uint8_t, 3> rgb, size_t index, uint8_t depth = 0);

    /*
     * Get the closest color to the one specified in `search`.
     */
    KDNode *approximate( KDNode *node, const std::array<uint8_t, 3>& search, double &ldist,
                         KDNode *best = nullptr, uint8_t depth = 0);

    /*
     * Calculate the Levenshtein distance. Used as the norm in BKTrees.
     */
    uint32_t editDistance( std::string_view main, std::string_view ref);

    /*
     * Search for a collection of the closest word match to the word.
     */
    std::vector<std::string> findWordMatch( BKNode *node, std::string_view word, int threshold);
}

#endif
