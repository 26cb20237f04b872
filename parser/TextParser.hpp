//
// Created by Revhome on 19.10.2026.
//

#ifndef WORD_INDEX_APP_TEXT_PARSER_HPP
#define WORD_INDEX_APP_TEXT_PARSER_HPP

#include <string>
#include <vector>
#include <utility>
#include "../include/Config.hpp"
#include "../index/WordTree.hpp"

// 📄 Читает текстовый файл построчно и складывает слова в WordTree
class TextParser {
public:
    TextParser() = default;
    explicit TextParser(Config config) : config(std::move(config)) {}

    // 🔹 Загружает файл в дерево. Строки нумеруются с 1
    bool loadTextFile(const std::string &filename, WordTree &tree);

    // 🔹 Разбор одной строки: токены -> нормализация -> вставка непустых слов
    void parseLine(const std::string &line, int lineNumber, WordTree &tree) const;

    // 🔹 Разбиение строки на токены (пустые токены возможны в режиме Space)
    std::vector<std::string> tokenize(const std::string &line) const;

    // 🔹 Нижний регистр, trim, удаление пунктуации. Может вернуть пустую строку
    std::string normalize(const std::string &token) const;

    // Сколько строк прочитано последним loadTextFile
    int lineCount() const { return linesRead; }

private:
    Config config;
    int linesRead = 0;
};

#endif //WORD_INDEX_APP_TEXT_PARSER_HPP
