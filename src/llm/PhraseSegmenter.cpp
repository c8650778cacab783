/**
 * PhraseSegmenter.cpp - Phrase commit predicate and markdown cleanup
 */

#include "emv/llm/PhraseSegmenter.hpp"

#include <regex>

namespace emv::llm {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

bool endsSentence(const std::string& buffer) {
    const std::string s = trim(buffer);
    if (s.empty()) return false;
    const char last = s.back();
    return last == '.' || last == '!' || last == '?';
}

std::string stripMarkdownForSpeech(const std::string& text) {
    static const std::regex link_re(R"(\[([^\]]*)\]\([^)]*\))");
    static const std::regex bold_re(R"(\*\*)");
    static const std::regex underline_re(R"(__)");
    static const std::regex star_re(R"(\*)");
    static const std::regex underscore_re(R"(_)");
    static const std::regex backtick_re(R"(`)");
    static const std::regex header_re(R"((^|\n)#+[ \t]*)");
    static const std::regex space_re(R"(\s+)");

    std::string s = trim(text);
    if (s.empty()) return s;

    s = std::regex_replace(s, link_re, "$1");
    s = std::regex_replace(s, bold_re, "");
    s = std::regex_replace(s, underline_re, "");
    s = std::regex_replace(s, star_re, "");
    s = std::regex_replace(s, underscore_re, " ");
    s = std::regex_replace(s, backtick_re, "");
    s = std::regex_replace(s, header_re, "$1");
    s = std::regex_replace(s, space_re, " ");
    return trim(s);
}

PhraseSegmenter::PhraseSegmenter(PhraseConfig config)
    : config_(config), last_token_(Clock::now()) {
}

bool PhraseSegmenter::commitNeeded(const std::string& buffer, Clock::time_point last_token,
                                   Clock::time_point now) const {
    const size_t len = trim(buffer).size();
    if (len >= config_.max_chars) return true;
    if (len < config_.min_chars) return false;
    if (endsSentence(buffer)) return true;

    const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_token);
    return idle.count() > config_.commit_pause_ms;
}

std::optional<std::string> PhraseSegmenter::feed(const std::string& token, Clock::time_point now) {
    if (buffer_.empty()) last_token_ = now;
    buffer_ += token;

    // The pause is measured against the previous token
    const bool commit = commitNeeded(buffer_, last_token_, now);
    last_token_ = now;
    if (!commit) return std::nullopt;
    return flush();
}

std::optional<std::string> PhraseSegmenter::poll(Clock::time_point now) {
    if (!commitNeeded(buffer_, last_token_, now)) return std::nullopt;
    return flush();
}

std::optional<std::string> PhraseSegmenter::flush() {
    std::string phrase = trim(buffer_);
    buffer_.clear();
    if (phrase.empty()) return std::nullopt;
    return phrase;
}

void PhraseSegmenter::reset() {
    buffer_.clear();
    last_token_ = Clock::now();
}

} // namespace emv::llm
