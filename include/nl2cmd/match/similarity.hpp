// String similarity scores in [0, 100], weighted-ratio family.
#pragma once
#include <string>

namespace nl2cmd::match {

// Indel-normalized similarity: 100 * (1 - indel_distance / (|a| + |b|)).
double ratio(const std::string& a, const std::string& b);

// Best ratio of the shorter string against equally long windows of the longer one.
double partial_ratio(const std::string& a, const std::string& b);

double token_sort_ratio(const std::string& a, const std::string& b);
double token_set_ratio(const std::string& a, const std::string& b);
double partial_token_sort_ratio(const std::string& a, const std::string& b);
double partial_token_set_ratio(const std::string& a, const std::string& b);

// Combination of the above weighted by the length ratio of the inputs.
double weighted_ratio(const std::string& a, const std::string& b);

size_t lcs_length(const std::string& a, const std::string& b);

} // namespace nl2cmd::match
