#pragma once

#include <string>
#include <string_view>

namespace similarity {

// Trimmed, lower-cased copy (ASCII case folding).
std::string normalize(std::string_view text);

// Sørensen–Dice coefficient over character-bigram sets of the normalised
// strings. 1.0 for identical input, 0.0 if either side is empty.
double dice(std::string_view a, std::string_view b);

} // namespace similarity
