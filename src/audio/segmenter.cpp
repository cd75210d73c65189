#include "call_engine/audio/segmenter.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace call_engine::audio {

namespace {

const std::set<std::string>& abbreviations() {
    static const std::set<std::string> words = {
        "mr", "mrs", "ms", "dr", "st", "jr", "sr", "vs", "etc", "inc", "ltd",
        "co", "e.g", "i.e", "a.m", "p.m", "approx", "dept"};
    return words;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool is_space(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool is_digit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

// Moves a cut forward past closing quotes and brackets.
size_t extend_closers(const std::string& text, size_t cut) {
    while (cut < text.size() && (text[cut] == '"' || text[cut] == '\'' || text[cut] == ')')) {
        ++cut;
    }
    return cut;
}

}

TextSegmenter::TextSegmenter(size_t max_fragment_chars)
    : max_chars_(std::max<size_t>(max_fragment_chars, 16)) {}

bool TextSegmenter::is_strong_boundary(size_t index, bool final) const {
    const char ch = buffer_[index];
    if (ch != '.' && ch != '!' && ch != '?') {
        return false;
    }
    const auto after = extend_closers(buffer_, index + 1);
    if (after >= buffer_.size()) {
        // Needs a following character to rule out "3.5" or "..." mid-stream.
        return final;
    }
    if (!is_space(buffer_[after])) {
        return false;
    }
    if (ch == '.') {
        if (index > 0 && is_digit(buffer_[index - 1]) && index + 1 < buffer_.size() &&
            is_digit(buffer_[index + 1])) {
            return false;
        }
        size_t start = index;
        while (start > 0 && !is_space(buffer_[start - 1])) {
            --start;
        }
        std::string word = buffer_.substr(start, index - start);
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (abbreviations().count(word) != 0) {
            return false;
        }
        if (word.size() == 1 && std::isalpha(static_cast<unsigned char>(word[0]))) {
            return false;
        }
    }
    return true;
}

size_t TextSegmenter::next_cut(bool final) const {
    const size_t window = std::min(buffer_.size(), max_chars_);
    for (size_t i = 0; i < window; ++i) {
        if (is_strong_boundary(i, final)) {
            return extend_closers(buffer_, i + 1);
        }
    }
    if (buffer_.size() <= max_chars_) {
        return 0;
    }

    // Too long without a sentence end: latest secondary break inside the window.
    size_t best = 0;
    for (size_t i = 0; i < window; ++i) {
        const char ch = buffer_[i];
        if ((ch == ',' || ch == ';' || ch == ':') && i + 1 < buffer_.size() && is_space(buffer_[i + 1])) {
            best = i + 1;
        } else if (ch == '-' && i > 0 && is_space(buffer_[i - 1]) && i + 1 < buffer_.size() &&
                   is_space(buffer_[i + 1])) {
            best = i + 1;
        }
    }
    for (const char* dash : {"\xE2\x80\x94", "\xE2\x80\x93"}) {
        size_t pos = buffer_.find(dash);
        while (pos != std::string::npos && pos + 3 <= window) {
            best = std::max(best, pos + 3);
            pos = buffer_.find(dash, pos + 3);
        }
    }
    if (best > 0) {
        return best;
    }
    for (size_t i = window; i > 0; --i) {
        if (is_space(buffer_[i - 1])) {
            return i;
        }
    }
    // Avoid splitting inside a UTF-8 sequence.
    size_t cut = window;
    while (cut > 0 && (static_cast<unsigned char>(buffer_[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut > 0 ? cut : window;
}

std::vector<std::string> TextSegmenter::push(const std::string& delta) {
    buffer_ += delta;
    std::vector<std::string> fragments;
    while (true) {
        const auto cut = next_cut(false);
        if (cut == 0) {
            break;
        }
        auto fragment = trim(buffer_.substr(0, cut));
        buffer_.erase(0, cut);
        if (!fragment.empty()) {
            fragments.push_back(std::move(fragment));
        }
    }
    return fragments;
}

std::vector<std::string> TextSegmenter::flush() {
    std::vector<std::string> fragments;
    while (!buffer_.empty()) {
        auto cut = next_cut(true);
        if (cut == 0) {
            cut = buffer_.size();
        }
        auto fragment = trim(buffer_.substr(0, cut));
        buffer_.erase(0, cut);
        if (!fragment.empty()) {
            fragments.push_back(std::move(fragment));
        }
    }
    return fragments;
}

void TextSegmenter::reset() {
    buffer_.clear();
}

std::vector<std::string> TextSegmenter::split(const std::string& text, size_t max_fragment_chars) {
    TextSegmenter segmenter(max_fragment_chars);
    auto fragments = segmenter.push(text);
    for (auto& fragment : segmenter.flush()) {
        fragments.push_back(std::move(fragment));
    }
    return fragments;
}

}
