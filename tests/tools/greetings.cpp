#include "greetmcp/exceptions.hpp"
#include "greetmcp/server/context.hpp"
#include "greetmcp/tools/greetings.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace greetmcp;
using namespace greetmcp::tools;

struct Recorder
{
    std::vector<Json> notifications;
    std::vector<std::chrono::milliseconds> pauses;
    bool session_open{true};

    server::Context context(LogLevel min_level = LogLevel::Debug)
    {
        return server::Context(
            "session-1", 7, min_level, [this](const Json& n) { notifications.push_back(n); },
            [this](std::chrono::milliseconds d)
            {
                pauses.push_back(d);
                return session_open;
            });
    }
};

void test_single_greet_name()
{
    std::cout << "  test_single_greet_name... " << std::flush;
    auto a = next_single_greet_name();
    auto b = next_single_greet_name();
    const std::string prefix = SINGLE_GREET_TOOL_PREFIX;
    assert(a.rfind(prefix, 0) == 0);
    assert(a.size() == prefix.size() + 36); // uuid 8-4-4-4-12
    assert(a != b);
    std::cout << "PASSED\n";
}

void test_single_greet()
{
    std::cout << "  test_single_greet... " << std::flush;
    auto tool = make_single_greet_tool("single-greeting-x");
    assert(tool.name() == "single-greeting-x");
    assert(tool.description() == "Greet the user once.");
    assert(tool.input_schema()["required"] == Json::array({"name"}));

    Recorder rec;
    auto ctx = rec.context();
    auto out = tool.invoke(Json{{"name", "arjun"}}, ctx);
    assert(out["content"].size() == 1);
    assert(out["content"][0]["type"] == "text");
    assert(out["content"][0]["text"] == "Hey arjun! Welcome to itsuki's world!");
    assert(rec.notifications.empty());
    std::cout << "PASSED\n";
}

void test_single_greet_missing_name()
{
    std::cout << "  test_single_greet_missing_name... " << std::flush;
    auto tool = make_single_greet_tool("single-greeting-x");
    Recorder rec;
    auto ctx = rec.context();
    try
    {
        tool.invoke(Json::object(), ctx);
        assert(false && "expected MissingArgumentError");
    }
    catch (const MissingArgumentError& e)
    {
        assert(std::string(e.what()) == "Name to greet undefined.");
    }
    std::cout << "PASSED\n";
}

void test_multi_greet_sequence()
{
    std::cout << "  test_multi_greet_sequence... " << std::flush;
    auto tool = make_multi_greet_tool(std::chrono::milliseconds(1000));
    assert(tool.name() == "multi-great");

    Recorder rec;
    auto ctx = rec.context();
    auto out = tool.invoke(Json{{"name", "arjun"}}, ctx);

    assert(rec.notifications.size() == 2);
    assert(rec.notifications[0]["method"] == "notifications/message");
    assert(rec.notifications[0]["params"]["level"] == "info");
    assert(rec.notifications[0]["params"]["data"] == "First greet to arjun");
    assert(rec.notifications[1]["params"]["data"] == "Second greet to arjun");
    assert(!rec.notifications[0].contains("id"));

    // One pause after each greeting
    assert(rec.pauses.size() == 2);
    assert(rec.pauses[0] == std::chrono::milliseconds(1000));

    assert(out["content"][0]["text"] == "Hope you enjoy your day!");
    std::cout << "PASSED\n";
}

void test_multi_greet_respects_log_level()
{
    std::cout << "  test_multi_greet_respects_log_level... " << std::flush;
    auto tool = make_multi_greet_tool(std::chrono::milliseconds(0));
    Recorder rec;
    auto ctx = rec.context(LogLevel::Warning);
    auto out = tool.invoke(Json{{"name", "arjun"}}, ctx);
    assert(rec.notifications.empty());
    assert(out["content"][0]["text"] == "Hope you enjoy your day!");
    std::cout << "PASSED\n";
}

void test_multi_greet_stops_when_session_closes()
{
    std::cout << "  test_multi_greet_stops_when_session_closes... " << std::flush;
    auto tool = make_multi_greet_tool(std::chrono::milliseconds(5));
    Recorder rec;
    rec.session_open = false;
    auto ctx = rec.context();
    bool threw = false;
    try
    {
        tool.invoke(Json{{"name", "arjun"}}, ctx);
    }
    catch (const DeliveryFailedError&)
    {
        threw = true;
    }
    assert(threw);
    assert(rec.notifications.size() == 1);
    std::cout << "PASSED\n";
}

void test_tool_set()
{
    std::cout << "  test_tool_set... " << std::flush;
    auto set = make_greeting_tools("single-greeting-abc", std::chrono::milliseconds(1));
    assert(set.size() == 2);
    assert(set[0].name() == "single-greeting-abc");
    assert(set[1].name() == MULTI_GREET_TOOL_NAME);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Greeting Tool Tests\n";
    std::cout << "===================\n";
    test_single_greet_name();
    test_single_greet();
    test_single_greet_missing_name();
    test_multi_greet_sequence();
    test_multi_greet_respects_log_level();
    test_multi_greet_stops_when_session_closes();
    test_tool_set();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
