//
// Created by Revhome on 19.10.2026.
//

#include "WordTree.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

static constexpr int ALLOWED_IMBALANCE = 1;

void WordTree::insert(const std::string &word, const int lineNumber) {
    // Проверяем до спуска, чтобы дерево не менялось частично
    if (word.empty()) {
        throw std::invalid_argument("WordTree::insert: empty word");
    }
    if (lineNumber <= 0) {
        throw std::invalid_argument("WordTree::insert: line number must be positive, got "
                                    + std::to_string(lineNumber));
    }
    insert(root, word, lineNumber);
}

// Рекурсивная вставка: слот родителя получает корень сбалансированного поддерева.
// Повтор (слово, строка) не добавляется: одно слово дважды в строке = одна запись
void WordTree::insert(std::unique_ptr<Node> &slot, const std::string &word, const int lineNumber) {
    if (!slot) {
        slot = std::make_unique<Node>(word, lineNumber);
        ++wordCount;
        return;
    }

    const int cmp = word.compare(slot->word);
    if (cmp < 0) {
        insert(slot->left, word, lineNumber);
    } else if (cmp > 0) {
        insert(slot->right, word, lineNumber);
    } else {
        if (!slot->occurrences.contains(lineNumber)) {
            slot->occurrences.append(lineNumber);
        }
        return;
    }

    slot = balance(std::move(slot));
}

void WordTree::updateHeight(Node &node) {
    node.height = std::max(height(node.left), height(node.right)) + 1;
}

// Поддерево сбалансировано или нарушение ровно на 1 сверх допустимого
std::unique_ptr<WordTree::Node> WordTree::balance(std::unique_ptr<Node> node) {
    if (!node) {
        return node;
    }

    if (height(node->left) - height(node->right) > ALLOWED_IMBALANCE) {
        if (height(node->left->left) >= height(node->left->right)) {
            node = rotateWithLeftChild(std::move(node));
        } else {
            node = doubleWithLeftChild(std::move(node));
        }
    } else if (height(node->right) - height(node->left) > ALLOWED_IMBALANCE) {
        if (height(node->right->right) >= height(node->right->left)) {
            node = rotateWithRightChild(std::move(node));
        } else {
            node = doubleWithRightChild(std::move(node));
        }
    }

    updateHeight(*node);
    return node;
}

// ---------------------------
// Повороты. Сначала пересчитывается высота опустившегося узла, затем нового корня

std::unique_ptr<WordTree::Node> WordTree::rotateWithLeftChild(std::unique_ptr<Node> k2) {
    std::unique_ptr<Node> k1 = std::move(k2->left);
    k2->left = std::move(k1->right);
    updateHeight(*k2);
    const int k2Height = k2->height;
    k1->right = std::move(k2);
    k1->height = std::max(height(k1->left), k2Height) + 1;
    return k1;
}

std::unique_ptr<WordTree::Node> WordTree::rotateWithRightChild(std::unique_ptr<Node> k1) {
    std::unique_ptr<Node> k2 = std::move(k1->right);
    k1->right = std::move(k2->left);
    updateHeight(*k1);
    const int k1Height = k1->height;
    k2->left = std::move(k1);
    k2->height = std::max(height(k2->right), k1Height) + 1;
    return k2;
}

std::unique_ptr<WordTree::Node> WordTree::doubleWithLeftChild(std::unique_ptr<Node> k3) {
    k3->left = rotateWithRightChild(std::move(k3->left));
    return rotateWithLeftChild(std::move(k3));
}

std::unique_ptr<WordTree::Node> WordTree::doubleWithRightChild(std::unique_ptr<Node> k1) {
    k1->right = rotateWithLeftChild(std::move(k1->right));
    return rotateWithRightChild(std::move(k1));
}

// ---------------------------
// Поиск

const OccurrenceList *WordTree::find(const std::string &word) const {
    const Node *node = root.get();
    while (node) {
        const int cmp = word.compare(node->word);
        if (cmp < 0) {
            node = node->left.get();
        } else if (cmp > 0) {
            node = node->right.get();
        } else {
            return &node->occurrences;
        }
    }
    return nullptr;
}

std::vector<int> WordTree::lookup(const std::string &word) const {
    const OccurrenceList *occurrences = find(word);
    if (!occurrences) return {};
    return occurrences->lines();
}

// ---------------------------
// Обход

void WordTree::forEach(const std::function<void(const std::string &, const OccurrenceList &)> &callback) const {
    forEach(root.get(), callback);
}

void WordTree::forEach(const Node *node,
                       const std::function<void(const std::string &, const OccurrenceList &)> &callback) {
    if (!node) return;
    forEach(node->left.get(), callback);
    callback(node->word, node->occurrences);
    forEach(node->right.get(), callback);
}

void WordTree::printIndex(std::ostream &out) const {
    for (const Entry entry : *this) {
        out << entry.word << ": " << entry.occurrences << "\n";
    }
}

std::ostream &operator<<(std::ostream &out, const OccurrenceList &occurrences) {
    out << '[';
    bool first = true;
    for (const int line : occurrences) {
        if (!first) out << ", ";
        out << line;
        first = false;
    }
    return out << ']';
}

WordTree::const_iterator::const_iterator(const Node *root) {
    pushLeft(root);
}

void WordTree::const_iterator::pushLeft(const Node *node) {
    while (node) {
        stack.push_back(node);
        node = node->left.get();
    }
}

Entry WordTree::const_iterator::operator*() const {
    const Node *node = stack.back();
    return Entry{node->word, node->occurrences};
}

WordTree::const_iterator &WordTree::const_iterator::operator++() {
    const Node *node = stack.back();
    stack.pop_back();
    pushLeft(node->right.get());
    return *this;
}

WordTree::const_iterator WordTree::const_iterator::operator++(int) {
    const_iterator copy = *this;
    ++*this;
    return copy;
}

bool WordTree::const_iterator::operator==(const const_iterator &other) const {
    if (stack.empty() || other.stack.empty()) {
        return stack.empty() == other.stack.empty();
    }
    return stack.back() == other.stack.back();
}

// ---------------------------
// Проверка инвариантов

bool WordTree::validate() const {
    int rootHeight = -1;
    return validate(root.get(), nullptr, nullptr, rootHeight);
}

bool WordTree::validate(const Node *node, const std::string *lower, const std::string *upper, int &outHeight) {
    if (!node) {
        outHeight = -1;
        return true;
    }
    if ((lower && node->word <= *lower) || (upper && node->word >= *upper)) {
        return false;
    }
    if (node->word.empty() || node->occurrences.empty()) {
        return false;
    }

    int leftHeight = -1;
    int rightHeight = -1;
    if (!validate(node->left.get(), lower, &node->word, leftHeight) ||
        !validate(node->right.get(), &node->word, upper, rightHeight)) {
        return false;
    }
    if (std::abs(leftHeight - rightHeight) > ALLOWED_IMBALANCE) {
        return false;
    }

    outHeight = std::max(leftHeight, rightHeight) + 1;
    return node->height == outHeight;
}
