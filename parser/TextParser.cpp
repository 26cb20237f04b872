//
// Created by Revhome on 19.10.2026.
//

#include "TextParser.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <cctype>

// Конец строки: "\n", "\r\n" или одиночный "\r"
static bool readLine(std::istream &in, std::string &line) {
    line.clear();
    bool any = false;
    char c;
    while (in.get(c)) {
        any = true;
        if (c == '\n') return true;
        if (c == '\r') {
            if (in.peek() == '\n') in.get();
            return true;
        }
        line.push_back(c);
    }
    return any;
}

bool TextParser::loadTextFile(const std::string &filename, WordTree &tree) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        std::cerr << "Cannot open text file: " << filename << "\n";
        return false;
    }

    linesRead = 0;
    std::string line;
    while (readLine(in, line)) {
        parseLine(line, ++linesRead, tree);
    }

    if (in.bad()) {
        std::cerr << "Error reading text file: " << filename << " (stopped after line " << linesRead << ")\n";
        return false;
    }
    return true;
}

void TextParser::parseLine(const std::string &line, const int lineNumber, WordTree &tree) const {
    for (const auto &token : tokenize(line)) {
        const std::string word = normalize(token);
        if (!word.empty()) {
            tree.insert(word, lineNumber);
        }
    }
}

std::vector<std::string> TextParser::tokenize(const std::string &line) const {
    std::vector<std::string> tokens;

    if (config.tokenizer == TokenizerMode::Whitespace) {
        std::istringstream stream(line);
        std::string token;
        while (stream >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    // Space: каждый ' ' разделитель, "a  b" даёт пустой токен посередине
    size_t start = 0;
    while (true) {
        const auto pos = line.find(' ', start);
        if (pos == std::string::npos) {
            tokens.push_back(line.substr(start));
            break;
        }
        tokens.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

std::string TextParser::normalize(const std::string &token) const {
    std::string word = token;

    if (config.lowercase) {
        for (char &c : word) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    // trim: всё, что <= ' ', по краям
    size_t first = 0;
    while (first < word.size() && static_cast<unsigned char>(word[first]) <= ' ') ++first;
    size_t last = word.size();
    while (last > first && static_cast<unsigned char>(word[last - 1]) <= ' ') --last;

    std::string cleaned;
    cleaned.reserve(last - first);
    for (size_t i = first; i < last; ++i) {
        if (config.punctuation.find(word[i]) == std::string::npos) {
            cleaned.push_back(word[i]);
        }
    }
    return cleaned;
}
