//
// Created by Revhome on 19.10.2026.
//

#include "WordIndexApp.hpp"
#include "../config/ConfigLoader.hpp"
#include <exception>

static void printUsage(const std::string &program, std::ostream &err) {
    err << "Usage: " << program << " <file.txt> [--config <cfg.json>] [word ...]\n";
}

void printQueries(const WordTree &tree, const TextParser &parser,
                  const std::vector<std::string> &queries, std::ostream &out) {
    for (const auto &query : queries) {
        const std::string word = parser.normalize(query);
        const OccurrenceList *lines = word.empty() ? nullptr : tree.find(word);
        if (lines) {
            out << word << ": " << *lines << "\n";
        } else {
            out << (word.empty() ? query : word) << ": not found\n";
        }
    }
}

int runWordIndex(const std::string &program, const std::vector<std::string> &args,
                 std::ostream &out, std::ostream &err) {
    std::string textFile;
    std::string configFile;
    std::vector<std::string> queries;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                printUsage(program, err);
                return 1;
            }
            configFile = args[++i];
        } else if (textFile.empty()) {
            textFile = args[i];
        } else {
            queries.push_back(args[i]);
        }
    }

    if (textFile.empty()) {
        printUsage(program, err);
        return 1;
    }

    try {
        Config config;
        if (!configFile.empty() && !loadConfigFile(configFile, config)) {
            err << "Failed to load config: " << configFile << "\n";
            return 1;
        }

        TextParser parser(config);
        WordTree tree;
        if (!parser.loadTextFile(textFile, tree)) {
            err << "Failed to load text file: " << textFile << "\n";
            return 1;
        }

        err << "Indexed " << tree.size() << " words from " << parser.lineCount()
            << " lines of " << textFile << "\n";

        if (queries.empty()) {
            tree.printIndex(out);
        } else {
            printQueries(tree, parser, queries, out);
        }
    } catch (const std::exception &e) {
        err << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
