#include <catch2/catch_test_macros.hpp>

#include "toolmux/client/tool_cache.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace toolmux;

namespace {

std::vector<ToolSchema> tools_named(std::initializer_list<const char*> names) {
    std::vector<ToolSchema> tools;
    for (const char* name : names) {
        ToolSchema tool;
        tool.name = name;
        tools.push_back(std::move(tool));
    }
    return tools;
}

}  // namespace

TEST_CASE("Empty cache answers with nothing", "[cache]") {
    ToolCache cache;

    REQUIRE(cache.tools("fs").empty());
    REQUIRE(cache.entry("fs").has_value() == false);
    REQUIRE(cache.contains("fs", "read") == false);
    REQUIRE(cache.is_stale("fs") == false);
}

TEST_CASE("Replace stores a snapshot in discovery order", "[cache]") {
    ToolCache cache;

    REQUIRE(cache.replace("fs", tools_named({"write", "read", "list"}), 1));

    auto tools = cache.tools("fs");
    REQUIRE(tools.size() == 3);
    REQUIRE(tools[0].name == "write");
    REQUIRE(tools[2].name == "list");
    REQUIRE(cache.contains("fs", "read"));
    REQUIRE(cache.find("fs", "list")->name == "list");
    REQUIRE(cache.find("fs", "delete").has_value() == false);
}

TEST_CASE("Replace swaps the whole list", "[cache]") {
    ToolCache cache;
    cache.replace("fs", tools_named({"a", "b"}), 1);
    cache.replace("fs", tools_named({"c"}), 1);

    REQUIRE(cache.tools("fs").size() == 1);
    REQUIRE(cache.contains("fs", "a") == false);
}

TEST_CASE("Older generations cannot overwrite newer ones", "[cache]") {
    ToolCache cache;

    REQUIRE(cache.replace("fs", tools_named({"new"}), 5));
    REQUIRE(cache.replace("fs", tools_named({"old"}), 4) == false);
    REQUIRE(cache.tools("fs")[0].name == "new");
    REQUIRE(cache.entry("fs")->generation == 5);
}

TEST_CASE("Stale flag is set by mark_stale and cleared by the next discovery", "[cache]") {
    ToolCache cache;
    cache.mark_stale("fs");  // no entry: no-op
    REQUIRE(cache.is_stale("fs") == false);

    cache.replace("fs", tools_named({"a"}), 1);
    cache.mark_stale("fs");
    REQUIRE(cache.is_stale("fs"));
    REQUIRE(cache.tools("fs").size() == 1);

    cache.replace("fs", tools_named({"a"}), 2);
    REQUIRE(cache.is_stale("fs") == false);
}

TEST_CASE("Invalidate and clear drop entries", "[cache]") {
    ToolCache cache;
    cache.replace("a", tools_named({"x"}), 1);
    cache.replace("b", tools_named({"y"}), 1);

    cache.invalidate("a");
    REQUIRE(cache.tools("a").empty());
    REQUIRE(cache.server_ids() == std::vector<std::string>{"b"});

    cache.clear();
    REQUIRE(cache.server_ids().empty());
}

TEST_CASE("Readers never observe a partial list", "[cache][concurrency]") {
    ToolCache cache;
    cache.replace("fs", tools_named({"a", "b", "c"}), 0);

    std::atomic<bool> done{false};
    std::atomic<bool> torn{false};

    std::thread writer([&] {
        for (std::uint64_t generation = 1; generation < 2000; ++generation) {
            if ((generation % 2) == 0) {
                cache.replace("fs", tools_named({"a", "b", "c"}), generation);
            } else {
                cache.replace("fs", tools_named({"x", "y", "z", "w"}), generation);
            }
        }
        done = true;
    });

    while (done == false) {
        const auto tools = cache.tools("fs");
        const bool first = (tools.size() == 3) && (tools[0].name == "a");
        const bool second = (tools.size() == 4) && (tools[0].name == "x");
        if ((first || second) == false) {
            torn = true;
        }
    }
    writer.join();

    REQUIRE(torn == false);
}
