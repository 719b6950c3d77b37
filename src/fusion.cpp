#include "fusion.hpp"
#include <cmath>

namespace paperscout {

std::optional<std::string> validate_weights(const FusionWeights& weights) {
    if (!std::isfinite(weights.lexical_weight) || weights.lexical_weight < 0.0) {
        return "lexical_weight must be a non-negative number";
    }
    if (!std::isfinite(weights.vector_weight) || weights.vector_weight < 0.0) {
        return "vector_weight must be a non-negative number";
    }
    return std::nullopt;
}

static std::optional<std::string> read_weight(const nlohmann::json& args,
                                              const char* key, double& out) {
    if (!args.contains(key) || args[key].is_null()) return std::nullopt;
    if (!args[key].is_number()) {
        return std::string(key) + " must be a number";
    }
    out = args[key].get<double>();
    return std::nullopt;
}

std::optional<std::string> weights_from_args(const nlohmann::json& args,
                                             FusionWeights& out) {
    FusionWeights weights = out;
    if (!args.is_object()) return validate_weights(weights);

    if (args.contains("lexical_weight")) {
        if (auto err = read_weight(args, "lexical_weight", weights.lexical_weight)) return err;
    } else if (auto err = read_weight(args, "bm25_weight", weights.lexical_weight)) {
        return err;
    }
    if (auto err = read_weight(args, "vector_weight", weights.vector_weight)) return err;

    if (auto err = validate_weights(weights)) return err;
    out = weights;
    return std::nullopt;
}

} // namespace paperscout
