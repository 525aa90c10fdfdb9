#include "transcript/similarity.hpp"

#include <cctype>
#include <set>

namespace similarity {

namespace {

std::set<std::string_view> bigrams(std::string_view s) {
    std::set<std::string_view> out;
    if (s.size() <= 1) {
        out.insert(s);
        return out;
    }
    for (size_t i = 0; i + 1 < s.size(); i++) {
        out.insert(s.substr(i, 2));
    }
    return out;
}

} // namespace

std::string normalize(std::string_view text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r");

    std::string out(text.substr(start, end - start + 1));
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

double dice(std::string_view a, std::string_view b) {
    auto na = normalize(a);
    auto nb = normalize(b);
    if (na.empty() || nb.empty()) return 0.0;
    if (na == nb) return 1.0;

    auto ba = bigrams(na);
    auto bb = bigrams(nb);

    size_t common = 0;
    for (const auto& g : ba) {
        if (bb.contains(g)) common++;
    }
    return 2.0 * static_cast<double>(common) / static_cast<double>(ba.size() + bb.size());
}

} // namespace similarity
