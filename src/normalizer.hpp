#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace paperscout {

// Canonical passage record. text is never empty.
struct SearchHit {
    std::string paper_id;
    std::string text;
    double score = 0.0;
};

// The shapes a tool's raw result is observed to take
namespace raw {

struct HitList {        // a JSON array, taken as-is
    nlohmann::json items;
};

struct EncodedText {    // a string, possibly a JSON-encoded hit list
    std::string text;
};

struct Wrapper {        // an envelope holding the real value one level down
    nlohmann::json inner;
};

struct ErrorPayload {   // an object carrying an "error" key
    std::string message;
};

struct Unrecognized {
    std::string type_name;
};

} // namespace raw

using RawResult = std::variant<raw::HitList, raw::EncodedText, raw::Wrapper,
                               raw::ErrorPayload, raw::Unrecognized>;

// Decide which shape a raw value has. Never throws.
RawResult classify(const nlohmann::json& value);

struct NormalizedResult {
    std::vector<SearchHit> hits;          // backend order, never re-sorted
    std::vector<std::string> warnings;    // one per skipped element
    std::optional<std::string> error;     // error payload or unparseable text
};

// Total over every raw shape: malformed input yields an empty hit list
// (with error set where there is something to report), never an exception.
NormalizedResult normalize(const nlohmann::json& value);

// Shape one element of a hit list. Tries a "_source" wrapper, then a
// "source" wrapper, then flat text keys. Returns nullopt and sets warning
// when no shape yields non-empty text.
std::optional<SearchHit> extract_hit(const nlohmann::json& element, std::string& warning);

} // namespace paperscout
