//! # Error Explanations
//!
//! Long-form explanation for every catalogue code, shown by
//! `tyfix explain <code>`, and the edit-distance helpers used to suggest a
//! code when the requested one is unknown.

#ifndef TYFIX_DIAG_EXPLAIN_HPP
#define TYFIX_DIAG_EXPLAIN_HPP

#include "diag/error_code.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace tyfix::diag {

/// Code string ("E0308") to explanation text.
const std::unordered_map<std::string, std::string>& get_explanations();

/// Explanation for a code, if one is recorded.
auto explanation_for(ErrorCode error) -> const std::string*;

/**
 * Compute Levenshtein (edit) distance between two strings.
 * Comparison is case-insensitive.
 */
size_t levenshtein_distance(const std::string& s1, const std::string& s2);

/**
 * Find multiple similar candidates, sorted by distance.
 *
 * @param input The misspelled input string
 * @param candidates List of valid candidates to match against
 * @param max_results Maximum number of suggestions to return
 * @param max_distance Maximum edit distance to consider
 * @return Vector of matching candidates, sorted by similarity
 */
std::vector<std::string> find_similar_candidates(const std::string& input,
                                                 const std::vector<std::string>& candidates,
                                                 size_t max_results = 3, size_t max_distance = 3);

} // namespace tyfix::diag

#endif // TYFIX_DIAG_EXPLAIN_HPP
