//
// Created by Revhome on 19.10.2026.
//

#ifndef WORD_INDEX_APP_ENTRY_HPP
#define WORD_INDEX_APP_ENTRY_HPP

#include <string>
#include "Occurrence.hpp"

// 📦 Одна запись индекса при обходе дерева: слово и его строки.
// Ссылки живут, пока живёт дерево
struct Entry {
    const std::string &word;            // Нормализованное слово
    const OccurrenceList &occurrences;  // Строки, где слово встречается
};

#endif //WORD_INDEX_APP_ENTRY_HPP
