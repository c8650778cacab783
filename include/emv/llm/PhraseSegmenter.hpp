/**
 * PhraseSegmenter.hpp - Streamed LLM tokens -> speakable phrases
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace emv::llm {

struct PhraseConfig {
    size_t min_chars = 28;
    size_t max_chars = 120;
    int commit_pause_ms = 180;
};

class PhraseSegmenter {
public:
    using Clock = std::chrono::steady_clock;

    explicit PhraseSegmenter(PhraseConfig config = {});

    /**
     * True when `buffer` should be committed now:
     *  - trimmed length >= max_chars, or
     *  - trimmed length >= min_chars and it ends a sentence, or
     *  - trimmed length >= min_chars and more than commit_pause_ms passed
     *    since `last_token`.
     */
    bool commitNeeded(const std::string& buffer, Clock::time_point last_token,
                      Clock::time_point now = Clock::now()) const;

    /**
     * Append a token. Returns the committed phrase (trimmed, non-empty) when
     * the commit predicate fires; the buffer then starts over.
     */
    std::optional<std::string> feed(const std::string& token, Clock::time_point now = Clock::now());

    /// Commit on a model pause while no token is arriving.
    std::optional<std::string> poll(Clock::time_point now = Clock::now());

    /// Remaining text at end of stream, if any.
    std::optional<std::string> flush();

    void reset();
    const std::string& pending() const { return buffer_; }

private:
    PhraseConfig config_;
    std::string buffer_;
    Clock::time_point last_token_;
};

/// Trimmed buffer ends in '.', '!' or '?'.
bool endsSentence(const std::string& buffer);

/// Strip markdown markup so TTS reads plain prose.
std::string stripMarkdownForSpeech(const std::string& text);

} // namespace emv::llm
