#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace paperscout {

constexpr double kDefaultLexicalWeight = 0.3;
constexpr double kDefaultVectorWeight = 0.7;

// Scalar multipliers for each relevance signal in a hybrid query. They scale
// contributions and are never renormalized, so they need not sum to 1.
struct FusionWeights {
    double lexical_weight = kDefaultLexicalWeight;
    double vector_weight = kDefaultVectorWeight;
};

// Returns an error message when a weight is negative or not finite.
// Zero is a valid weight (it silences that signal).
std::optional<std::string> validate_weights(const FusionWeights& weights);

// Read weights from tool arguments. Absent keys keep the defaults;
// "bm25_weight" is accepted as an alias of "lexical_weight".
// Returns an error message for mistyped or invalid values; `out` is only
// written when the result is valid.
std::optional<std::string> weights_from_args(const nlohmann::json& args,
                                             FusionWeights& out);

} // namespace paperscout
