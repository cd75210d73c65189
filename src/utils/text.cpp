#include "call_engine/utils/text.hpp"

#include <cstdint>
#include <cctype>
#include <sstream>

namespace call_engine::utils {

namespace {

const std::set<std::string>& stopwords() {
    static const std::set<std::string> words = {
        "a", "an", "the", "and", "or", "but", "to", "of", "in", "on", "at", "for",
        "is", "are", "was", "were", "be", "it", "its", "it's", "i", "you", "we",
        "me", "my", "your", "this", "that", "so", "do", "can", "with", "just",
        "um", "uh", "oh", "well", "will", "would", "have", "has", "there"};
    return words;
}

bool is_emoji_codepoint(uint32_t codepoint) {
    return (codepoint >= 0x1F600 && codepoint <= 0x1F64F) ||
           (codepoint >= 0x1F300 && codepoint <= 0x1F5FF) ||
           (codepoint >= 0x1F680 && codepoint <= 0x1F6FF) ||
           (codepoint >= 0x1F700 && codepoint <= 0x1F77F) ||
           (codepoint >= 0x1F780 && codepoint <= 0x1F7FF) ||
           (codepoint >= 0x1F800 && codepoint <= 0x1F8FF) ||
           (codepoint >= 0x1F900 && codepoint <= 0x1F9FF) ||
           (codepoint >= 0x1FA00 && codepoint <= 0x1FA6F) ||
           (codepoint >= 0x1FA70 && codepoint <= 0x1FAFF) ||
           (codepoint >= 0x2702 && codepoint <= 0x27B0) ||
           (codepoint >= 0x24C2 && codepoint <= 0x1F251);
}

bool decode_utf8(const std::string& text, size_t index, uint32_t& codepoint, size_t& length) {
    const auto byte = static_cast<unsigned char>(text[index]);
    if (byte < 0x80) {
        codepoint = byte;
        length = 1;
        return true;
    }
    if ((byte & 0xE0) == 0xC0 && index + 1 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        if ((b1 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x1F) << 6) | (b1 & 0x3F);
        length = 2;
        return codepoint >= 0x80;
    }
    if ((byte & 0xF0) == 0xE0 && index + 2 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
        length = 3;
        return codepoint >= 0x800;
    }
    if ((byte & 0xF8) == 0xF0 && index + 3 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        const auto b3 = static_cast<unsigned char>(text[index + 3]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x07) << 18) |
                    ((b1 & 0x3F) << 12) |
                    ((b2 & 0x3F) << 6) |
                    (b3 & 0x3F);
        length = 4;
        return codepoint >= 0x10000 && codepoint <= 0x10FFFF;
    }
    return false;
}

bool is_word_char(unsigned char ch) {
    return std::isalnum(ch) || ch == '\'' || ch >= 0x80;
}

}

std::string remove_emojis(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        uint32_t codepoint = 0;
        size_t length = 1;
        if (!decode_utf8(text, i, codepoint, length)) {
            result.push_back(text[i]);
            ++i;
            continue;
        }
        if (!is_emoji_codepoint(codepoint)) {
            result.append(text, i, length);
        }
        i += length;
    }
    return result;
}

std::string normalize_text(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    bool in_space = false;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            if (!in_space && !normalized.empty()) {
                normalized.push_back(' ');
                in_space = true;
            }
        } else {
            normalized.push_back(static_cast<char>(std::tolower(ch)));
            in_space = false;
        }
    }
    if (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
    }
    return normalized;
}

std::string normalize_utterance(const std::string& text) {
    std::string stripped;
    stripped.reserve(text.size());
    for (unsigned char ch : remove_emojis(text)) {
        stripped.push_back(is_word_char(ch) ? static_cast<char>(ch) : ' ');
    }
    return normalize_text(stripped);
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(normalize_utterance(text));
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

size_t count_words(const std::string& text) {
    return split_words(text).size();
}

std::set<std::string> word_trigrams(const std::vector<std::string>& words) {
    std::set<std::string> trigrams;
    if (words.size() < 3) {
        return trigrams;
    }
    for (size_t i = 0; i + 2 < words.size(); ++i) {
        trigrams.insert(words[i] + " " + words[i + 1] + " " + words[i + 2]);
    }
    return trigrams;
}

std::set<std::string> content_tokens(const std::string& text) {
    std::set<std::string> tokens;
    for (auto& word : split_words(text)) {
        if (stopwords().count(word) == 0) {
            tokens.insert(std::move(word));
        }
    }
    return tokens;
}

bool starts_with_phrase(const std::string& normalized, const std::string& phrase) {
    if (phrase.empty() || normalized.size() < phrase.size()) {
        return false;
    }
    if (normalized.compare(0, phrase.size(), phrase) != 0) {
        return false;
    }
    return normalized.size() == phrase.size() || normalized[phrase.size()] == ' ';
}

bool contains_phrase(const std::string& normalized, const std::string& phrase) {
    if (phrase.empty()) {
        return false;
    }
    size_t pos = normalized.find(phrase);
    while (pos != std::string::npos) {
        const bool left_ok = pos == 0 || normalized[pos - 1] == ' ';
        const size_t end = pos + phrase.size();
        const bool right_ok = end == normalized.size() || normalized[end] == ' ';
        if (left_ok && right_ok) {
            return true;
        }
        pos = normalized.find(phrase, pos + 1);
    }
    return false;
}

std::string render_template(const std::string& text, const nlohmann::json& variables) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find("{{", pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        const auto close = text.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);
        std::string name = text.substr(open + 2, close - open - 2);
        while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front()))) {
            name.erase(name.begin());
        }
        while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
            name.pop_back();
        }
        if (variables.is_object() && variables.contains(name)) {
            const auto& value = variables.at(name);
            if (value.is_string()) {
                out += value.get<std::string>();
            } else if (!value.is_null()) {
                out += value.dump();
            }
        }
        pos = close + 2;
    }
    return out;
}

}
