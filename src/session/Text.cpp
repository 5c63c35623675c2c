/**
 * Text.cpp - Word-level helpers for transcribed text
 */

#include "sui/session/Text.hpp"

#include <cctype>
#include <cstring>

namespace sui::session {

namespace {

// UTF-8 capital -> lower-case pairs for the French alphabet
const char* const ACCENT_FOLD[][2] = {
    {"À", "à"}, {"Â", "â"}, {"Ä", "ä"}, {"Ç", "ç"}, {"É", "é"}, {"È", "è"},
    {"Ê", "ê"}, {"Ë", "ë"}, {"Î", "î"}, {"Ï", "ï"}, {"Ô", "ô"}, {"Ö", "ö"},
    {"Ù", "ù"}, {"Û", "û"}, {"Ü", "ü"}, {"Œ", "œ"}
};

bool isSeparator(char c) {
    if (std::isspace(static_cast<unsigned char>(c))) return true;
    return std::strchr(",.;:!?\"()[]{}<>/", c) != nullptr && c != '\0';
}

std::string lower(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            out += static_cast<char>(std::tolower(c));
            ++i;
            continue;
        }
        bool folded = false;
        for (const auto& pair : ACCENT_FOLD) {
            size_t len = std::strlen(pair[0]);
            if (text.compare(i, len, pair[0]) == 0) {
                out += pair[1];
                i += len;
                folded = true;
                break;
            }
        }
        if (!folded) {
            out += text[i];
            ++i;
        }
    }
    return out;
}

// Multi-byte punctuation: guillemets, ellipsis, typographic apostrophe
bool isMarkAt(const std::string& text, size_t i, size_t& len) {
    static const char* const marks[] = {"«", "»", "…", "’"};
    for (const char* mark : marks) {
        size_t l = std::strlen(mark);
        if (text.compare(i, l, mark) == 0) {
            len = l;
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<std::string> tokenizeWords(const std::string& input) {
    const std::string text = lower(input);
    std::vector<std::string> words;
    std::string current;

    auto flush = [&]() {
        // Drop apostrophes and hyphens left at the edges
        while (!current.empty() && (current.front() == '\'' || current.front() == '-')) {
            current.erase(current.begin());
        }
        while (!current.empty() && (current.back() == '\'' || current.back() == '-')) {
            current.pop_back();
        }
        if (!current.empty()) {
            words.push_back(current);
        }
        current.clear();
    };

    for (size_t i = 0; i < text.size();) {
        size_t len = 0;
        if (isMarkAt(text, i, len)) {
            // Typographic apostrophe joins like a plain one
            if (text.compare(i, len, "’") == 0) {
                current += '\'';
            } else {
                flush();
            }
            i += len;
            continue;
        }
        if (isSeparator(text[i])) {
            flush();
        } else {
            current += text[i];
        }
        ++i;
    }
    flush();
    return words;
}

std::set<std::string> wordSet(const std::string& text) {
    auto words = tokenizeWords(text);
    return std::set<std::string>(words.begin(), words.end());
}

std::string stripElision(const std::string& word) {
    size_t apostrophe = word.find('\'');
    if (apostrophe == std::string::npos || apostrophe == 0 || apostrophe > 2) {
        return word;
    }
    std::string prefix = word.substr(0, apostrophe);
    static const char* const elisions[] = {"l", "t", "d", "j", "m", "s", "n", "c", "qu"};
    for (const char* e : elisions) {
        if (prefix == e) {
            return word.substr(apostrophe + 1);
        }
    }
    return word;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string joinFragments(const std::vector<std::string>& fragments) {
    std::string joined;
    for (const auto& fragment : fragments) {
        std::string part = trim(fragment);
        if (part.empty()) continue;
        if (!joined.empty()) joined += ' ';
        joined += part;
    }
    return joined;
}

} // namespace sui::session
