#pragma once

#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace call_engine::utils {

std::string remove_emojis(const std::string& text);

// Lowercases and collapses whitespace runs.
std::string normalize_text(const std::string& text);

// normalize_text plus punctuation removal; apostrophes survive ("don't").
std::string normalize_utterance(const std::string& text);

std::vector<std::string> split_words(const std::string& text);
size_t count_words(const std::string& text);

std::set<std::string> word_trigrams(const std::vector<std::string>& words);

// Words of the normalized utterance minus common function words.
std::set<std::string> content_tokens(const std::string& text);

// True when the normalized utterance is phrase or begins with "phrase ".
bool starts_with_phrase(const std::string& normalized, const std::string& phrase);
// Whole-word containment of phrase inside normalized.
bool contains_phrase(const std::string& normalized, const std::string& phrase);

// Replaces {{name}} with variables[name]; unknown names render empty.
std::string render_template(const std::string& text, const nlohmann::json& variables);

}
