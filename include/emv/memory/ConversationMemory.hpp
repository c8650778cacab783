/**
 * ConversationMemory.hpp - Rolling, time-windowed transcript buffer
 *
 * Entries older than the window are evicted lazily on every add / query.
 * Tags are keyword heuristics for annotation only.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace emv::memory {

struct MemoryEntry {
    double ts_start = 0.0;  // seconds since the Unix epoch
    double ts_end = 0.0;
    std::string text;
    std::vector<std::string> tags;
    std::string speaker = "user";  // "user" | "assistant"

    nlohmann::json toJson() const;
};

class ConversationMemory {
public:
    static constexpr double DEFAULT_WINDOW_MINUTES = 30.0;

    using Clock = std::function<double()>;

    explicit ConversationMemory(double window_minutes = DEFAULT_WINDOW_MINUTES,
                                Clock clock = {});

    /**
     * Append one utterance. Throws std::invalid_argument for blank text.
     * @param tags explicit tags; heuristics are used when empty
     * @param ts   start (and end) time; defaults to now
     */
    const MemoryEntry& addText(const std::string& text,
                               const std::string& speaker = "user",
                               const std::vector<std::string>& tags = {},
                               double ts = 0.0);

    /// Entries whose ts_end falls within the last `minutes`.
    std::vector<MemoryEntry> queryLast(double minutes);

    /// Entries containing any word of `keywords` (case-insensitive).
    std::vector<MemoryEntry> queryTopic(const std::string& keywords);

    /// "[HH:MM] Speaker: text" lines for the last `minutes`, oldest first.
    std::string summarizeLast(double minutes);

    /// summarizeLast() capped to the last `max_chars` characters.
    std::string contextFor(double minutes, size_t max_chars = 4000);

    void clear();
    size_t size();

    double windowMinutes() const { return window_minutes_; }
    void setDebugLog(std::function<void(const std::string&)> log) { debug_log_ = std::move(log); }

    static std::vector<std::string> heuristicTags(const std::string& text);
    static std::string formatClock(double ts);

private:
    double now() const;
    void evictOld(double now);
    void log(const std::string& msg) const;

    double window_minutes_;
    Clock clock_;
    std::vector<MemoryEntry> entries_;
    std::function<void(const std::string&)> debug_log_;
};

} // namespace emv::memory
