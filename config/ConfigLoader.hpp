//
// Created by Revhome on 19.10.2026.
//

#ifndef WORD_INDEX_APP_CONFIG_LOADER_HPP
#define WORD_INDEX_APP_CONFIG_LOADER_HPP

#include <string>
#include <string_view>
#include "../include/Config.hpp"

// 🔹 Загружает JSON-конфиг. Отсутствующие ключи оставляют значения по умолчанию.
// При ошибке пишет в std::cerr и возвращает false, config не трогается
bool loadConfigFile(const std::string &filename, Config &config);

// 🔹 То же из строки с JSON
bool parseConfig(std::string_view json, Config &config);

// 🔹 "space" / "whitespace"
bool parseTokenizerMode(std::string_view name, TokenizerMode &mode);

#endif //WORD_INDEX_APP_CONFIG_LOADER_HPP
