//
// Created by Revhome on 19.10.2026.
//

#ifndef WORD_INDEX_APP_CONFIG_HPP
#define WORD_INDEX_APP_CONFIG_HPP

#include <string>

// ✂️ Как резать строку на токены
enum class TokenizerMode {
    Space,      // Только по одиночному пробелу ' '
    Whitespace  // По любой последовательности пробельных символов
};

// ⚙️ Настройки нормализации и разбиения текста
struct Config {
    std::string punctuation = "!\"#$%&()*+,-./:;<=>?@^_`{|}~[]"; // Удаляются из каждого токена
    bool lowercase = true;                                      // Приводить ASCII к нижнему регистру
    TokenizerMode tokenizer = TokenizerMode::Space;
};

#endif //WORD_INDEX_APP_CONFIG_HPP
