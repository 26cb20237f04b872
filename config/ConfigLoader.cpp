//
// Created by Revhome on 19.10.2026.
//

#include "ConfigLoader.hpp"
#include <iostream>
#include <simdjson.h>

bool parseTokenizerMode(const std::string_view name, TokenizerMode &mode) {
    if (name == "space") {
        mode = TokenizerMode::Space;
        return true;
    }
    if (name == "whitespace") {
        mode = TokenizerMode::Whitespace;
        return true;
    }
    return false;
}

// Применяет поля документа к копии и только при успехе отдаёт её наружу
static bool applyConfig(const simdjson::dom::element &doc, Config &config) {
    simdjson::dom::object root;
    if (doc.get_object().get(root)) {
        std::cerr << "Config root must be a JSON object\n";
        return false;
    }

    Config result = config;

    for (auto kv : root) {
        const std::string_view key = kv.key;

        if (key == "punctuation") {
            std::string_view value;
            if (kv.value.get_string().get(value)) {
                std::cerr << "Config: \"punctuation\" must be a string\n";
                return false;
            }
            result.punctuation = std::string(value);
        } else if (key == "lowercase") {
            bool value = true;
            if (kv.value.get_bool().get(value)) {
                std::cerr << "Config: \"lowercase\" must be a boolean\n";
                return false;
            }
            result.lowercase = value;
        } else if (key == "tokenizer") {
            std::string_view value;
            if (kv.value.get_string().get(value)) {
                std::cerr << "Config: \"tokenizer\" must be a string\n";
                return false;
            }
            if (!parseTokenizerMode(value, result.tokenizer)) {
                std::cerr << "Config: unknown tokenizer \"" << value << "\" (expected space or whitespace)\n";
                return false;
            }
        } else {
            std::cerr << "Config: ignoring unknown key \"" << key << "\"\n";
        }
    }

    config = result;
    return true;
}

bool loadConfigFile(const std::string &filename, Config &config) {
    try {
        simdjson::dom::parser parser;
        const simdjson::dom::element doc = parser.load(filename);
        return applyConfig(doc, config);
    } catch (const simdjson::simdjson_error &e) {
        std::cerr << "Error reading config " << filename << ": " << e.what() << "\n";
        return false;
    }
}

bool parseConfig(const std::string_view json, Config &config) {
    try {
        simdjson::dom::parser parser;
        const simdjson::padded_string padded(json);
        const simdjson::dom::element doc = parser.parse(padded);
        return applyConfig(doc, config);
    } catch (const simdjson::simdjson_error &e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}
