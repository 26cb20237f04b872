//
// Created by Revhome on 19.10.2026.
//

#ifndef WORD_INDEX_APP_WORD_TREE_HPP
#define WORD_INDEX_APP_WORD_TREE_HPP

#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include <iterator>
#include <utility>
#include <functional>
#include <ostream>
#include "../include/Entry.hpp"
#include "../include/Occurrence.hpp"

// 🌳 AVL-дерево: слово -> номера строк, где оно встречается
class WordTree {
    struct Node {
        std::string word;
        OccurrenceList occurrences;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
        int height = 0; // лист = 0, пустое поддерево = -1

        Node(std::string w, int lineNumber) : word(std::move(w)), occurrences(lineNumber) {}
    };

public:
    // 🔹 Ленивый in-order обход с явным стеком. Итератор остаётся валидным,
    // пока дерево не меняется
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Entry;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Entry;

        const_iterator() = default;

        Entry operator*() const;
        const_iterator &operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator &other) const;
        bool operator!=(const const_iterator &other) const { return !(*this == other); }

    private:
        friend class WordTree;
        explicit const_iterator(const Node *root);
        void pushLeft(const Node *node);

        std::vector<const Node *> stack;
    };

    WordTree() = default;
    WordTree(const WordTree &) = delete;
    WordTree &operator=(const WordTree &) = delete;
    WordTree(WordTree &&) noexcept = default;
    WordTree &operator=(WordTree &&) noexcept = default;

    // 🔹 Индексирует слово с номером строки. Пустое слово или line <= 0 -> std::invalid_argument
    void insert(const std::string &word, int lineNumber);

    // 🔹 Номера строк слова; пустой вектор, если слова нет
    std::vector<int> lookup(const std::string &word) const;

    // 🔹 То же без копирования; nullptr, если слова нет
    const OccurrenceList *find(const std::string &word) const;

    bool contains(const std::string &word) const { return find(word) != nullptr; }

    const_iterator begin() const { return const_iterator(root.get()); }
    const_iterator end() const { return const_iterator(); }

    void forEach(const std::function<void(const std::string &, const OccurrenceList &)> &callback) const;

    // 🔹 Печатает весь индекс: "word: [1, 3]" по строке на слово
    void printIndex(std::ostream &out) const;

    size_t size() const { return wordCount; }
    bool empty() const { return root == nullptr; }

    // Высота корня, -1 для пустого дерева
    int height() const { return height(root); }

    // 🔹 Проверка инвариантов BST + AVL + кэшированных высот
    bool validate() const;

private:
    std::unique_ptr<Node> root;
    size_t wordCount = 0;

    static int height(const std::unique_ptr<Node> &node) { return node ? node->height : -1; }
    static void updateHeight(Node &node);

    void insert(std::unique_ptr<Node> &slot, const std::string &word, int lineNumber);
    static std::unique_ptr<Node> balance(std::unique_ptr<Node> node);

    static std::unique_ptr<Node> rotateWithLeftChild(std::unique_ptr<Node> k2);
    static std::unique_ptr<Node> rotateWithRightChild(std::unique_ptr<Node> k1);
    static std::unique_ptr<Node> doubleWithLeftChild(std::unique_ptr<Node> k3);
    static std::unique_ptr<Node> doubleWithRightChild(std::unique_ptr<Node> k1);

    static void forEach(const Node *node,
                        const std::function<void(const std::string &, const OccurrenceList &)> &callback);
    static bool validate(const Node *node, const std::string *lower, const std::string *upper, int &outHeight);
};

std::ostream &operator<<(std::ostream &out, const OccurrenceList &occurrences);

#endif //WORD_INDEX_APP_WORD_TREE_HPP
