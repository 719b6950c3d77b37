#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace paperscout {

nlohmann::json Config::defaults_json() {
    return {
        {"backend", "opensearch"},
        {"server", {
            {"command", "paperscout-server"},
            {"args", nlohmann::json::array()},
            {"settle_delay_ms", 1000},
            {"response_timeout_ms", 30000},
            {"shutdown_grace_ms", 3000},
            {"forward_stderr", true}
        }},
        {"client", {
            {"name", "paperscout"},
            {"version", "1.0.0"},
            {"protocol_version", "2024-11-05"}
        }},
        {"search", {
            {"size", 3},
            {"lexical_weight", 0.3},
            {"vector_weight", 0.7}
        }},
        {"opensearch", {
            {"url", "http://localhost:9200"},
            {"index", "arxiv_papers"},
            {"text_field", "full_text"},
            {"timeout_seconds", 60}
        }},
        {"embeddings", {
            {"provider", "ollama"},
            {"base_url", ""},
            {"model", ""},
            {"api_key", ""},
            {"query_prefix", ""},
            {"dimensions", 768},
            {"timeout_seconds", 30}
        }},
        {"llm", {
            {"base_url", "http://localhost:4000"},
            {"model", "local-llama"},
            {"api_key", "demo-key-123"},
            {"max_tokens", 200},
            {"temperature", 0.2},
            {"timeout_seconds", 300}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int64_t>() >= 0)
        out = obj[key].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_string(j, "backend", cfg.backend);

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        read_string(s, "command", cfg.server.command);
        if (s.contains("args") && s["args"].is_array()) {
            cfg.server.args.clear();
            for (const auto& a : s["args"]) {
                if (a.is_string()) cfg.server.args.push_back(a.get<std::string>());
            }
        }
        read_u32(s, "settle_delay_ms", cfg.server.settle_delay_ms);
        read_u32(s, "response_timeout_ms", cfg.server.response_timeout_ms);
        read_u32(s, "shutdown_grace_ms", cfg.server.shutdown_grace_ms);
        if (s.contains("forward_stderr") && s["forward_stderr"].is_boolean())
            cfg.server.forward_stderr = s["forward_stderr"].get<bool>();
    }

    if (j.contains("client") && j["client"].is_object()) {
        auto& c = j["client"];
        read_string(c, "name", cfg.client.name);
        read_string(c, "version", cfg.client.version);
        read_string(c, "protocol_version", cfg.client.protocol_version);
    }

    if (j.contains("search") && j["search"].is_object()) {
        auto& s = j["search"];
        read_u32(s, "size", cfg.search.size);
        read_double(s, "lexical_weight", cfg.search.lexical_weight);
        read_double(s, "vector_weight", cfg.search.vector_weight);
    }

    if (j.contains("opensearch") && j["opensearch"].is_object()) {
        auto& o = j["opensearch"];
        read_string(o, "url", cfg.opensearch.url);
        read_string(o, "index", cfg.opensearch.index);
        read_string(o, "text_field", cfg.opensearch.text_field);
        read_u32(o, "timeout_seconds", cfg.opensearch.timeout_seconds);
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        read_string(e, "provider", cfg.embeddings.provider);
        read_string(e, "base_url", cfg.embeddings.base_url);
        read_string(e, "model", cfg.embeddings.model);
        read_string(e, "api_key", cfg.embeddings.api_key);
        read_string(e, "query_prefix", cfg.embeddings.query_prefix);
        read_u32(e, "dimensions", cfg.embeddings.dimensions);
        read_u32(e, "timeout_seconds", cfg.embeddings.timeout_seconds);
    }

    if (j.contains("llm") && j["llm"].is_object()) {
        auto& l = j["llm"];
        read_string(l, "base_url", cfg.llm.base_url);
        read_string(l, "model", cfg.llm.model);
        read_string(l, "api_key", cfg.llm.api_key);
        read_u32(l, "max_tokens", cfg.llm.max_tokens);
        read_double(l, "temperature", cfg.llm.temperature);
        read_u32(l, "timeout_seconds", cfg.llm.timeout_seconds);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.paperscout/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("OPENSEARCH_URL"))
        opensearch.url = v;
    if (const char* v = std::getenv("PAPERSCOUT_INDEX"))
        opensearch.index = v;
    if (const char* v = std::getenv("PAPERSCOUT_SERVER_CMD"))
        server.command = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (embeddings.provider == "ollama") embeddings.base_url = v;
    }
    if (const char* v = std::getenv("OPENAI_API_KEY")) {
        if (embeddings.api_key.empty()) embeddings.api_key = v;
    }
    if (const char* v = std::getenv("LLM_BASE_URL"))
        llm.base_url = v;
    if (const char* v = std::getenv("LLM_API_KEY"))
        llm.api_key = v;
    if (const char* v = std::getenv("LLM_MODEL"))
        llm.model = v;
}

} // namespace paperscout
