//
// Created by Revhome on 19.10.2026.
//

#ifndef WORD_INDEX_APP_OCCURRENCE_HPP
#define WORD_INDEX_APP_OCCURRENCE_HPP

#include <vector>
#include <algorithm>

// 🕵️‍♂️ Номера строк, на которых встречается слово (в порядке добавления)
class OccurrenceList {
public:
    using const_iterator = std::vector<int>::const_iterator;

    OccurrenceList() = default;
    explicit OccurrenceList(int lineNumber) { lines_.push_back(lineNumber); }

    // 🔹 Добавляет номер строки в конец. Дубликаты отсекает вызывающий код
    void append(const int lineNumber) { lines_.push_back(lineNumber); }

    // 🔹 Линейный поиск
    bool contains(const int lineNumber) const {
        return std::find(lines_.begin(), lines_.end(), lineNumber) != lines_.end();
    }

    size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }

    const_iterator begin() const { return lines_.begin(); }
    const_iterator end() const { return lines_.end(); }

    const std::vector<int> &lines() const { return lines_; }

private:
    std::vector<int> lines_;
};

#endif //WORD_INDEX_APP_OCCURRENCE_HPP
