#include "command_line.hpp"
#include "settings.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <cctype>

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void check_quotes(const std::string& line) {
    bool in_single = false;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (c == '\'') {
            in_single = !in_single;
        } else if (c == '"' && !in_single) {
            if (i + 1 < line.size() && line[i + 1] == '"') {
                i++;  // doubled: an escaped quote
            } else {
                throw BadQuotes('"');
            }
        }
    }
}

std::vector<std::string> shell_split(const std::string& line) {
    std::vector<std::string> words;
    std::string word;
    bool in_word = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];

        if (is_space(c)) {
            if (in_word) {
                words.push_back(word);
                word.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\\') {
            if (i + 1 >= line.size()) throw BadQuotes('\\');
            word += line[++i];
        } else if (c == '\'') {
            size_t close = line.find('\'', i + 1);
            if (close == std::string::npos) throw BadQuotes('\'');
            word += line.substr(i + 1, close - i - 1);
            i = close;
        } else if (c == '"') {
            size_t j = i + 1;
            for (; j < line.size() && line[j] != '"'; j++) {
                if (line[j] == '\\' && j + 1 < line.size() &&
                    (line[j + 1] == '"' || line[j + 1] == '\\' ||
                     line[j + 1] == '$' || line[j + 1] == '`')) {
                    j++;
                }
                word += line[j];
            }
            if (j >= line.size()) throw BadQuotes('"');
            i = j;
        } else {
            word += c;
        }
    }
    if (in_word) words.push_back(word);
    return words;
}

// Index just past the first shell word of `line` (which starts non-blank).
static size_t first_word_end(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && !is_space(line[i])) {
        char c = line[i];
        if (c == '\\') {
            i += 2;
        } else if (c == '\'' || c == '"') {
            size_t close = line.find(c, i + 1);
            if (close == std::string::npos) throw BadQuotes(c);
            i = close + 1;
        } else {
            i++;
        }
    }
    return std::min(i, line.size());
}

CommandParts split_command_line(const std::string& line) {
    std::string cmd = trimmed(line);
    if (cmd.empty()) throw RequiredSetting(setting_keys::EXECUTABLE);

    check_quotes(cmd);

    size_t end = first_word_end(cmd);
    auto words = shell_split(cmd.substr(0, end));

    CommandParts parts;
    parts.executable = words.empty() ? std::string() : words.front();
    parts.arguments = trimmed(cmd.substr(end));
    return parts;
}
