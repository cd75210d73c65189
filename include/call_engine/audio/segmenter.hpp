#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace call_engine::audio {

// Splits streamed text into speakable fragments. Strong sentence ends win;
// past max_fragment_chars the split falls back to commas, semicolons,
// colons and dashes, then whitespace.
class TextSegmenter {
public:
    explicit TextSegmenter(size_t max_fragment_chars);

    std::vector<std::string> push(const std::string& delta);
    // Emits whatever is buffered, sentence end or not.
    std::vector<std::string> flush();
    void reset();

    static std::vector<std::string> split(const std::string& text, size_t max_fragment_chars);

private:
    // Length of the next complete fragment in buffer_, 0 when none yet.
    size_t next_cut(bool final) const;
    bool is_strong_boundary(size_t index, bool final) const;

    size_t max_chars_;
    std::string buffer_;
};

}
