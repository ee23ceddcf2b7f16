#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "chromatic.hpp"
#include "utils/utils.hpp"

namespace Util
{
    namespace
    {
        // Channel weights of the perceptual distance ( red, green, blue).
        constexpr double channel_weight[] = { 2., 4., 3.};

        void findWordMatch( BKNode *node, std::string_view word, int threshold,
                            std::vector<std::pair<uint32_t, std::string>> &matches)
        {
            if( node == nullptr)
                return;

            int dist = INT_CAST( editDistance( node->word, word)),
                mindist = std::max( dist - threshold, 1),
                maxdist = std::min( dist + threshold, MAX_DIFF_TOLERANCE - 1);

            if( dist <= threshold)
                matches.emplace_back( dist, node->word);

            for( int i = mindist; i <= maxdist; ++i)
                findWordMatch( node->next[ i].get(), word, threshold, matches);
        }
    }

    double clamp( double x, double lowerlimit, double upperlimit)
    {
        return x < lowerlimit ? lowerlimit : x > upperlimit ? upperlimit : x;
    }

    std::string toLower( std::string_view given)
    {
        std::string lowered( given);
        std::transform( lowered.begin(), lowered.end(), lowered.begin(),
                        []( unsigned char c){ return static_cast<char>( std::tolower( c)); });
        return lowered;
    }

    std::string formatNumber( double value)
    {
        char buffer[ 32];
        auto [ end, error] = std::to_chars( std::begin( buffer), std::end( buffer), value);
        if( error != std::errc{})
            return std::to_string( value);
        return { buffer, end};
    }

    uint64_t getNumber( const char *&ctx, uint8_t base, size_t max_digits)
    {
        uint64_t weight = 0;
        while( max_digits-- && isxdigit( *ctx))
        {
            uint8_t character = tolower( *( ctx++));
            int value = character >= 'a' && character <= 'f' ? character - 'a' + 10
                    : isdigit( character) ? character - '0' : 0;
            weight = weight * base + value;
        }

        return weight;
    }

    void insert( std::shared_ptr<BKNode> &node, std::string_view word)
    {
        if( node == nullptr)
        {
            node = std::make_shared<BKNode>( word);
            return;
        }

        auto dist = editDistance( node->word, word);

        // Duplicates and words beyond the tolerance are never indexed.
        if( dist == 0 || dist >= MAX_DIFF_TOLERANCE)
            return;

        insert( node->next[ dist], word);
    }

    void insert( std::shared_ptr<KDNode> &node, std::array<uint8_t, 3> rgb, size_t index, uint8_t depth)
    {
        if( node == nullptr)
        {
            node = std::make_shared<KDNode>( rgb, index);
            return;
        }

        uint8_t ndepth = ( depth + 1) % 3;
        if( rgb[ depth] < node->rgb[ depth])
            insert( node->left, rgb, index, ndepth);
        else
            insert( node->right, rgb, index, ndepth);
    }

    KDNode *approximate( KDNode *node, const std::array<uint8_t, 3>& search, double &ldist,
                         KDNode *best, uint8_t depth)
    {
        if( node == nullptr)
            return best;

        uint8_t nchannel = search[ depth],
                cchannel = node->rgb[ depth],
                ndepth   = ( depth + 1) % 3;

        int r = search[ 0] - node->rgb[ 0],
            g = search[ 1] - node->rgb[ 1],
            b = search[ 2] - node->rgb[ 2];

        double ndist = std::sqrt( channel_weight[ 0] * r * r + channel_weight[ 1] * g * g
                                  + channel_weight[ 2] * b * b);
        if( ndist < ldist)
        {
            ldist = ndist;
            best = node;
        }

        bool left = nchannel < cchannel;
        best = approximate( left ? node->left.get() : node->right.get(), search, ldist, best, ndepth);

        // The far side can only hold something closer if the splitting plane is within reach.
        double plane = std::sqrt( channel_weight[ depth]) * std::abs( nchannel - cchannel);
        if( plane < ldist)
            best = approximate( left ? node->right.get() : node->left.get(), search, ldist, best, ndepth);

        return best;
    }

    uint32_t editDistance( std::string_view main, std::string_view ref)
    {
        auto mlength = main.size() + 1, rlength = ref.size() + 1;
        std::vector<uint32_t> lookup( mlength * rlength);
        auto at = [ rlength, &lookup]( size_t i, size_t j) -> uint32_t& { return lookup[ i * rlength + j]; };

        for( size_t i = 0; i < mlength; ++i)
            at( i, 0) = i;
        for( size_t j = 0; j < rlength; ++j)
            at( 0, j) = j;

        for( size_t i = 1; i < mlength; ++i)
        {
            for( size_t j = 1; j < rlength; ++j)
            {
                uint32_t substitution = at( i - 1, j - 1) + ( main[ i - 1] != ref[ j - 1]);
                at( i, j) = std::min( { at( i - 1, j) + 1, at( i, j - 1) + 1, substitution});
            }
        }

        return at( mlength - 1, rlength - 1);
    }

    std::vector<std::string> findWordMatch( BKNode *node, std::string_view word, int threshold)
    {
        std::vector<std::pair<uint32_t, std::string>> matches;
        findWordMatch( node, word, threshold, matches);
        std::stable_sort( matches.begin(), matches.end(),
                          []( const auto& left, const auto& right){ return left.first < right.first; });

        std::vector<std::string> words;
        words.reserve( matches.size());
        for( auto& match : matches)
            words.emplace_back( std::move( match.second));
        return words;
    }
}
