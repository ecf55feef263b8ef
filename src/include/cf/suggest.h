#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace cf {
namespace suggest {

// Compute Levenshtein distance between two strings
// This measures how many single-character edits are needed to change one string into another
inline int levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size();
    const size_t n = s2.size();

    std::vector<std::vector<int>> dp(m + 1, std::vector<int>(n + 1));

    for (size_t i = 0; i <= m; ++i) {
        dp[i][0] = static_cast<int>(i);
    }
    for (size_t j = 0; j <= n; ++j) {
        dp[0][j] = static_cast<int>(j);
    }

    for (size_t i = 1; i <= m; ++i) {
        for (size_t j = 1; j <= n; ++j) {
            if (s1[i - 1] == s2[j - 1]) {
                dp[i][j] = dp[i - 1][j - 1];
            } else {
                dp[i][j] = 1 + std::min({
                    dp[i - 1][j],      // deletion
                    dp[i][j - 1],      // insertion
                    dp[i - 1][j - 1]   // substitution
                });
            }
        }
    }

    return dp[m][n];
}

// Closest known key to `unknown`, or an empty string when nothing is close.
inline std::string closest_key(const std::string& unknown, const std::vector<std::string>& known) {
    int min_distance = std::numeric_limits<int>::max();
    std::string best_match;

    for (const auto& key : known) {
        int dist = levenshtein_distance(unknown, key);
        if (dist < min_distance) {
            min_distance = dist;
            best_match = key;
        }
    }

    // within 2 edits or a third of the key length, whichever is larger
    int threshold = std::max(2, static_cast<int>(unknown.length() / 3));
    if (!best_match.empty() && min_distance <= threshold) {
        return best_match;
    }

    return "";
}

// Message for a key the schema does not declare, with a hint when a declared key is close.
inline std::string unknown_key_message(const std::string& unknown, const std::vector<std::string>& known) {
    std::string message = "extra fields not permitted";

    std::string suggestion = closest_key(unknown, known);
    if (!suggestion.empty()) {
        message += "; did you mean '" + suggestion + "'?";
    }

    return message;
}

}  // namespace suggest
}  // namespace cf
