/**
 * ConversationMemory.cpp - Rolling window storage, retrieval and tagging
 */

#include "emv/memory/ConversationMemory.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace emv::memory {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string capitalize(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

} // anonymous namespace

json MemoryEntry::toJson() const {
    return {
        {"ts_start", ts_start},
        {"ts_end", ts_end},
        {"text", text},
        {"tags", tags},
        {"speaker", speaker}
    };
}

ConversationMemory::ConversationMemory(double window_minutes, Clock clock)
    : window_minutes_(std::max(0.1, window_minutes))
    , clock_(std::move(clock)) {
}

double ConversationMemory::now() const {
    if (clock_) return clock_();
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

void ConversationMemory::log(const std::string& msg) const {
    if (debug_log_) debug_log_(msg);
}

void ConversationMemory::evictOld(double now) {
    const double cutoff = now - window_minutes_ * 60.0;
    const size_t before = entries_.size();
    entries_.erase(
        std::remove_if(entries_.begin(), entries_.end(),
                       [cutoff](const MemoryEntry& e) { return e.ts_end < cutoff; }),
        entries_.end());
    if (before != entries_.size()) {
        log("ConversationMemory: evicted " + std::to_string(before - entries_.size()) + " old entries");
    }
}

std::vector<std::string> ConversationMemory::heuristicTags(const std::string& text) {
    static const std::regex fact_re(R"(\b(fact|check|verify|true|false|claim)\b)");
    static const std::regex summary_re(R"(\b(summarize|summary|recap)\b)");
    static const std::regex temporal_re(R"(\b(when|time|minute|hour|last)\b)");
    static const std::regex recall_re(R"(\b(what did i say|what did we discuss)\b)");

    const std::string t = toLower(text);
    std::vector<std::string> tags;
    if (std::regex_search(t, fact_re)) tags.push_back("fact_check");
    if (std::regex_search(t, summary_re)) tags.push_back("summary");
    if (std::regex_search(t, temporal_re)) tags.push_back("temporal");
    if (std::regex_search(t, recall_re)) tags.push_back("recall");
    return tags;
}

std::string ConversationMemory::formatClock(double ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[8];
    std::strftime(buf, sizeof(buf), "%H:%M", &local);
    return buf;
}

const MemoryEntry& ConversationMemory::addText(const std::string& text,
                                               const std::string& speaker,
                                               const std::vector<std::string>& tags,
                                               double ts) {
    std::string cleaned = trim(text);
    if (cleaned.empty()) {
        throw std::invalid_argument("addText requires non-empty text");
    }

    const double stamp = ts > 0.0 ? ts : now();

    MemoryEntry entry;
    entry.ts_start = stamp;
    entry.ts_end = stamp;
    entry.text = std::move(cleaned);
    entry.tags = tags.empty() ? heuristicTags(entry.text) : tags;
    entry.speaker = speaker.empty() ? "user" : speaker;

    evictOld(std::max(stamp, now()));
    entries_.push_back(std::move(entry));

    const auto& added = entries_.back();
    log("ConversationMemory: addText speaker=" + added.speaker +
        " len=" + std::to_string(added.text.size()) +
        " tags=" + std::to_string(added.tags.size()));
    return added;
}

std::vector<MemoryEntry> ConversationMemory::queryLast(double minutes) {
    const double t = now();
    evictOld(t);
    const double cutoff = t - minutes * 60.0;

    std::vector<MemoryEntry> out;
    for (const auto& e : entries_) {
        if (e.ts_end >= cutoff) out.push_back(e);
    }
    log("ConversationMemory: queryLast(" + std::to_string(minutes) + ") -> " +
        std::to_string(out.size()) + " entries");
    return out;
}

std::vector<MemoryEntry> ConversationMemory::queryTopic(const std::string& keywords) {
    if (trim(keywords).empty()) return {};
    evictOld(now());

    static const std::regex word_re(R"(\w+)");
    const std::string q = toLower(keywords);
    std::set<std::string> words;
    for (auto it = std::sregex_iterator(q.begin(), q.end(), word_re); it != std::sregex_iterator(); ++it) {
        words.insert(it->str());
    }
    if (words.empty()) return entries_;

    std::vector<MemoryEntry> out;
    for (const auto& e : entries_) {
        const std::string lower = toLower(e.text);
        for (const auto& w : words) {
            if (lower.find(w) != std::string::npos) {
                out.push_back(e);
                break;
            }
        }
    }
    log("ConversationMemory: queryTopic(" + keywords + ") -> " + std::to_string(out.size()) + " entries");
    return out;
}

std::string ConversationMemory::summarizeLast(double minutes) {
    auto entries = queryLast(minutes);
    if (entries.empty()) return "";

    std::stable_sort(entries.begin(), entries.end(),
                     [](const MemoryEntry& a, const MemoryEntry& b) { return a.ts_start < b.ts_start; });

    std::ostringstream out;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) out << "\n";
        out << "[" << formatClock(entries[i].ts_start) << "] "
            << capitalize(entries[i].speaker) << ": " << entries[i].text;
    }
    return out.str();
}

std::string ConversationMemory::contextFor(double minutes, size_t max_chars) {
    std::string s = summarizeLast(minutes);
    if (s.size() <= max_chars) return s;
    return trim(s.substr(s.size() - max_chars));
}

void ConversationMemory::clear() {
    entries_.clear();
}

size_t ConversationMemory::size() {
    evictOld(now());
    return entries_.size();
}

} // namespace emv::memory
