#include "normalizer.hpp"
#include "util.hpp"
#include <iostream>

namespace paperscout {

using json = nlohmann::json;

namespace {

// Wrappers nest at most this deep before the value is given up on
constexpr int kMaxUnwrapDepth = 4;

bool is_content_item(const json& v) {
    return v.is_object() && v.contains("text") && v["text"].is_string() &&
           (!v.contains("type") || v["type"] == "text");
}

// {"content":[{"type":"text","text":...}, ...]}
bool is_content_envelope(const json& v) {
    if (!v.is_object() || !v.contains("content") || !v["content"].is_array()) return false;
    const auto& content = v["content"];
    return !content.empty() && is_content_item(content.front());
}

std::string error_text(const json& err) {
    if (err.is_string()) return err.get<std::string>();
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
    }
    return err.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string text_of(const json& obj) {
    for (const char* key : {"full_text", "text"}) {
        if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    }
    return {};
}

double score_of(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_number()) return obj[key].get<double>();
    return 0.0;
}

std::string id_of(const json& source, const json& hit) {
    if (source.contains("paper_id") && source["paper_id"].is_string()) {
        return source["paper_id"].get<std::string>();
    }
    if (hit.contains("paper_id") && hit["paper_id"].is_string()) {
        return hit["paper_id"].get<std::string>();
    }
    if (hit.contains("_id") && hit["_id"].is_string()) return hit["_id"].get<std::string>();
    return {};
}

void collect_hits(const json& items, NormalizedResult& out) {
    size_t index = 0;
    for (const auto& element : items) {
        ++index;
        std::string warning;
        auto hit = extract_hit(element, warning);
        if (hit) {
            out.hits.push_back(std::move(*hit));
        } else {
            warning = "element " + std::to_string(index) + ": " + warning;
            std::cerr << "[normalizer] warning: " << warning << "\n";
            out.warnings.push_back(std::move(warning));
        }
    }
}

NormalizedResult normalize_at(const json& value, int depth);

struct Normalize {
    int depth;

    NormalizedResult operator()(const raw::HitList& list) const {
        NormalizedResult out;
        collect_hits(list.items, out);
        return out;
    }

    NormalizedResult operator()(const raw::EncodedText& encoded) const {
        NormalizedResult out;
        if (!looks_like_json(encoded.text)) {
            // A bare message in place of data
            out.error = encoded.text;
            return out;
        }
        json parsed = json::parse(encoded.text, nullptr, false);
        if (parsed.is_discarded()) {
            out.error = encoded.text;
            return out;
        }
        if (parsed.is_string()) {
            out.error = parsed.get<std::string>();
            return out;
        }
        return normalize_at(parsed, depth + 1);
    }

    NormalizedResult operator()(const raw::Wrapper& wrapper) const {
        return normalize_at(wrapper.inner, depth + 1);
    }

    NormalizedResult operator()(const raw::ErrorPayload& err) const {
        NormalizedResult out;
        out.error = err.message;
        return out;
    }

    NormalizedResult operator()(const raw::Unrecognized& u) const {
        NormalizedResult out;
        out.warnings.push_back("unrecognized result shape: " + u.type_name);
        std::cerr << "[normalizer] warning: unrecognized result shape: " << u.type_name << "\n";
        return out;
    }
};

NormalizedResult normalize_at(const json& value, int depth) {
    if (depth > kMaxUnwrapDepth) {
        NormalizedResult out;
        out.warnings.push_back("result nested too deeply");
        return out;
    }
    return std::visit(Normalize{depth}, classify(value));
}

} // namespace

RawResult classify(const json& value) {
    if (value.is_string()) {
        return raw::EncodedText{value.get<std::string>()};
    }
    if (value.is_array()) {
        // FastMCP-style list of one holding the real payload
        if (value.size() == 1 && (value[0].is_string() || is_content_item(value[0]))) {
            return raw::Wrapper{value[0].is_string() ? value[0] : value[0]["text"]};
        }
        return raw::HitList{value};
    }
    if (value.is_object()) {
        if (value.contains("error")) {
            return raw::ErrorPayload{error_text(value["error"])};
        }
        if (is_content_envelope(value)) {
            const auto it = value.find("isError");
            if (it != value.end() && it->is_boolean() && it->get<bool>()) {
                return raw::ErrorPayload{value["content"][0]["text"].get<std::string>()};
            }
            return raw::Wrapper{value["content"][0]["text"]};
        }
        if (value.contains("text") && value["text"].is_string()) {
            return raw::Wrapper{value["text"]};
        }
    }
    return raw::Unrecognized{value.type_name()};
}

std::optional<SearchHit> extract_hit(const json& element, std::string& warning) {
    if (!element.is_object()) {
        warning = std::string("expected an object, got ") + element.type_name();
        return std::nullopt;
    }

    SearchHit hit;
    if (element.contains("_source") && element["_source"].is_object()) {
        const auto& source = element["_source"];
        hit.text = text_of(source);
        hit.score = score_of(element, "_score");
        hit.paper_id = id_of(source, element);
    } else if (element.contains("source") && element["source"].is_object()) {
        const auto& source = element["source"];
        hit.text = text_of(source);
        hit.score = score_of(element, "score");
        hit.paper_id = id_of(source, element);
    } else {
        hit.text = text_of(element);
        hit.score = score_of(element, "score");
        hit.paper_id = id_of(json::object(), element);
    }

    if (hit.text.empty()) {
        warning = "no text field in " + truncate_display(
            element.dump(-1, ' ', false, json::error_handler_t::replace), 120);
        return std::nullopt;
    }
    return hit;
}

NormalizedResult normalize(const json& value) {
    return normalize_at(value, 0);
}

} // namespace paperscout
