/**
 * test_conversation_memory.cpp - Rolling window, retrieval and tags
 */

#include "emv/memory/ConversationMemory.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using namespace emv::memory;

namespace {

// Manually advanced clock, seconds since the epoch
struct FakeClock {
    double now = 1'700'000'000.0;
    ConversationMemory::Clock fn() {
        return [this]() { return now; };
    }
};

bool hasTag(const MemoryEntry& e, const std::string& tag) {
    return std::find(e.tags.begin(), e.tags.end(), tag) != e.tags.end();
}

} // anonymous namespace

void test_add_and_query_last() {
    FakeClock clock;
    ConversationMemory memory(30.0, clock.fn());

    memory.addText("first thing");
    clock.now += 120;
    memory.addText("second thing", "assistant");
    clock.now += 60;

    assert(memory.size() == 2);
    assert(memory.queryLast(2).size() == 1);
    assert(memory.queryLast(5).size() == 2);
    assert(memory.queryLast(5)[1].speaker == "assistant");

    std::cout << "[PASS] test_add_and_query_last" << std::endl;
}

void test_blank_text_rejected() {
    ConversationMemory memory;
    bool threw = false;
    try {
        memory.addText("   \n");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(memory.size() == 0);

    std::cout << "[PASS] test_blank_text_rejected" << std::endl;
}

void test_window_eviction() {
    FakeClock clock;
    ConversationMemory memory(1.0, clock.fn());

    memory.addText("old news");
    clock.now += 61;
    memory.addText("fresh news");

    assert(memory.size() == 1);
    assert(memory.queryLast(10).front().text == "fresh news");

    clock.now += 3600;
    assert(memory.size() == 0);

    std::cout << "[PASS] test_window_eviction" << std::endl;
}

void test_query_topic() {
    FakeClock clock;
    ConversationMemory memory(30.0, clock.fn());

    memory.addText("We talked about the Budget for next year");
    memory.addText("Then lunch plans");
    memory.addText("Hiking on Saturday");

    assert(memory.queryTopic("budget").size() == 1);
    assert(memory.queryTopic("lunch saturday").size() == 2);
    assert(memory.queryTopic("spaceships").empty());
    assert(memory.queryTopic("   ").empty());

    std::cout << "[PASS] test_query_topic" << std::endl;
}

void test_summarize_format() {
    FakeClock clock;
    ConversationMemory memory(30.0, clock.fn());

    assert(memory.summarizeLast(5).empty());

    memory.addText("hello there", "user");
    memory.addText("hi, how can I help?", "assistant");

    const std::string summary = memory.summarizeLast(5);
    const std::string clock_text = ConversationMemory::formatClock(clock.now);
    assert(summary == "[" + clock_text + "] User: hello there\n[" + clock_text +
                      "] Assistant: hi, how can I help?");

    std::cout << "[PASS] test_summarize_format" << std::endl;
}

void test_context_keeps_tail() {
    FakeClock clock;
    ConversationMemory memory(30.0, clock.fn());

    memory.addText(std::string(200, 'a'));
    memory.addText("the latest words");

    const std::string ctx = memory.contextFor(5, 40);
    assert(ctx.size() <= 40);
    assert(ctx.find("the latest words") != std::string::npos);

    std::cout << "[PASS] test_context_keeps_tail" << std::endl;
}

void test_heuristic_tags() {
    FakeClock clock;
    ConversationMemory memory(30.0, clock.fn());

    const auto& e = memory.addText("Can you fact check the last claim?");
    assert(hasTag(e, "fact_check"));
    assert(hasTag(e, "temporal"));
    assert(!hasTag(e, "summary"));

    const auto& r = memory.addText("What did we discuss? Give me a recap");
    assert(hasTag(r, "recall"));
    assert(hasTag(r, "summary"));

    const auto& explicit_tags = memory.addText("plain words", "user", {"custom"});
    assert(explicit_tags.tags.size() == 1 && explicit_tags.tags[0] == "custom");

    std::cout << "[PASS] test_heuristic_tags" << std::endl;
}

void test_entry_json() {
    MemoryEntry e;
    e.ts_start = 10.0;
    e.ts_end = 12.0;
    e.text = "hi";
    e.tags = {"temporal"};
    e.speaker = "assistant";

    const auto j = e.toJson();
    assert(j["ts_start"] == 10.0);
    assert(j["text"] == "hi");
    assert(j["speaker"] == "assistant");
    assert(j["tags"].size() == 1);

    std::cout << "[PASS] test_entry_json" << std::endl;
}

void test_clear_and_debug_log() {
    FakeClock clock;
    ConversationMemory memory(30.0, clock.fn());
    int lines = 0;
    memory.setDebugLog([&](const std::string&) { lines++; });

    memory.addText("something");
    assert(lines > 0);
    memory.clear();
    assert(memory.size() == 0);

    std::cout << "[PASS] test_clear_and_debug_log" << std::endl;
}

int main() {
    std::cout << "=== EMV Conversation Memory Tests ===" << std::endl;

    test_add_and_query_last();
    test_blank_text_rejected();
    test_window_eviction();
    test_query_topic();
    test_summarize_format();
    test_context_keeps_tail();
    test_heuristic_tags();
    test_entry_json();
    test_clear_and_debug_log();

    std::cout << "\nAll memory tests passed!" << std::endl;
    return 0;
}
