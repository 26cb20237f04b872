//
// Created by Revhome on 19.10.2026.
//

#ifndef WORD_INDEX_APP_WORD_INDEX_APP_HPP
#define WORD_INDEX_APP_WORD_INDEX_APP_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../index/WordTree.hpp"
#include "../parser/TextParser.hpp"

// 🔹 Запуск CLI: args без имени программы. Результаты в out, диагностика в err.
// Возвращает код выхода: 0 успех, 1 ошибка использования, файла или конфига
int runWordIndex(const std::string &program, const std::vector<std::string> &args,
                 std::ostream &out, std::ostream &err);

// 🔹 Ответ на каждый запрос: "word: [1, 3]" или "word: not found".
// Запрос нормализуется тем же парсером, что и текст
void printQueries(const WordTree &tree, const TextParser &parser,
                  const std::vector<std::string> &queries, std::ostream &out);

#endif //WORD_INDEX_APP_WORD_INDEX_APP_HPP
