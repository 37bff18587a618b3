#include <nl2cmd/match/similarity.hpp>
#include <nl2cmd/text/strings.hpp>
#include <algorithm>
#include <iterator>
#include <set>
#include <vector>

namespace nl2cmd::match {

namespace {

constexpr double kUnbaseScale = 0.95;

std::string sorted_tokens(const std::string& s) {
    auto toks = text::split_ws(s);
    std::sort(toks.begin(), toks.end());
    return text::join(toks, " ");
}

struct TokenSets {
    std::string intersection, diff_ab, diff_ba;
    bool common = false;
};

TokenSets token_sets(const std::string& a, const std::string& b) {
    auto va = text::split_ws(a), vb = text::split_ws(b);
    std::set<std::string> sa(va.begin(), va.end()), sb(vb.begin(), vb.end());
    std::vector<std::string> inter, dab, dba;
    std::set_intersection(sa.begin(), sa.end(), sb.begin(), sb.end(), std::back_inserter(inter));
    std::set_difference(sa.begin(), sa.end(), sb.begin(), sb.end(), std::back_inserter(dab));
    std::set_difference(sb.begin(), sb.end(), sa.begin(), sa.end(), std::back_inserter(dba));
    TokenSets ts;
    ts.common = !inter.empty();
    ts.intersection = text::join(inter, " ");
    ts.diff_ab = text::join(dab, " ");
    ts.diff_ba = text::join(dba, " ");
    return ts;
}

} // namespace

size_t lcs_length(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0;
    std::vector<size_t> prev(b.size() + 1, 0), cur(b.size() + 1, 0);
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j)
            cur[j] = a[i - 1] == b[j - 1] ? prev[j - 1] + 1 : std::max(prev[j], cur[j - 1]);
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

double ratio(const std::string& a, const std::string& b) {
    size_t total = a.size() + b.size();
    if (total == 0) return 100.0;
    return 100.0 * (2.0 * static_cast<double>(lcs_length(a, b))) / static_cast<double>(total);
}

double partial_ratio(const std::string& a, const std::string& b) {
    const std::string& shorter = a.size() <= b.size() ? a : b;
    const std::string& longer = a.size() <= b.size() ? b : a;
    if (shorter.empty()) return longer.empty() ? 100.0 : 0.0;
    double best = 0.0;
    for (size_t i = 0; i + shorter.size() <= longer.size(); ++i) {
        best = std::max(best, ratio(shorter, longer.substr(i, shorter.size())));
        if (best >= 100.0) break;
    }
    return best;
}

double token_sort_ratio(const std::string& a, const std::string& b) {
    return ratio(sorted_tokens(a), sorted_tokens(b));
}

double partial_token_sort_ratio(const std::string& a, const std::string& b) {
    return partial_ratio(sorted_tokens(a), sorted_tokens(b));
}

double token_set_ratio(const std::string& a, const std::string& b) {
    auto ts = token_sets(a, b);
    if (ts.common && (ts.diff_ab.empty() || ts.diff_ba.empty())) return 100.0;
    std::string combined_ab = text::trim(ts.intersection + " " + ts.diff_ab);
    std::string combined_ba = text::trim(ts.intersection + " " + ts.diff_ba);
    double best = ratio(combined_ab, combined_ba);
    if (ts.common) {
        best = std::max(best, ratio(ts.intersection, combined_ab));
        best = std::max(best, ratio(ts.intersection, combined_ba));
    }
    return best;
}

double partial_token_set_ratio(const std::string& a, const std::string& b) {
    auto ts = token_sets(a, b);
    if (ts.common) return 100.0;
    return partial_ratio(ts.diff_ab, ts.diff_ba);
}

double weighted_ratio(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0.0;
    double la = static_cast<double>(a.size()), lb = static_cast<double>(b.size());
    double len_ratio = std::max(la, lb) / std::min(la, lb);
    double best = ratio(a, b);
    if (len_ratio < 1.5) {
        double tok = std::max(token_sort_ratio(a, b), token_set_ratio(a, b));
        return std::max(best, tok * kUnbaseScale);
    }
    double partial_scale = len_ratio < 8.0 ? 0.9 : 0.6;
    best = std::max(best, partial_ratio(a, b) * partial_scale);
    double ptok = std::max(partial_token_sort_ratio(a, b), partial_token_set_ratio(a, b));
    return std::max(best, ptok * kUnbaseScale * partial_scale);
}

} // namespace nl2cmd::match
