/// @file streamable_http_integration.cpp
/// @brief End-to-end tests of the greeting server over Streamable HTTP
/// @details Starts the full App on an ephemeral port and talks to it with a plain
///          httplib::Client: initialize, tools/list, both greeting tools, tool
///          rotation seen on the GET stream, termination and session errors.

#include "greetmcp.hpp"
#include "server/sse_frames.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <httplib.h>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace greetmcp;
using namespace std::chrono_literals;

namespace
{
const char* const HOST = "127.0.0.1";
const int STEP_DELAY_MS = 200;

Settings test_settings()
{
    Settings s;
    s.host = HOST;
    s.port = 0;
    s.log_level = "WARN";
    s.rotation_interval_ms = 3600 * 1000; // rotations are triggered by hand
    s.greet_step_delay_ms = STEP_DELAY_MS;
    return s;
}

httplib::Client make_client(int port)
{
    httplib::Client cli(HOST, port);
    cli.set_connection_timeout(5, 0);
    cli.set_read_timeout(10, 0);
    return cli;
}

Json rpc(int id, const std::string& method, const Json& params = Json::object())
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

Json initialize_request()
{
    return rpc(0, "initialize",
               {{"protocolVersion", "2025-03-26"},
                {"capabilities", Json::object()},
                {"clientInfo", {{"name", "integration-test"}, {"version", "1.0.0"}}}});
}

httplib::Headers session_headers(const std::string& sid)
{
    return httplib::Headers{{"Mcp-Session-Id", sid},
                            {"Accept", "application/json, text/event-stream"}};
}

std::string initialize(httplib::Client& cli)
{
    auto res = cli.Post("/mcp", initialize_request().dump(), "application/json");
    assert(res && "initialize got no response");
    assert(res->status == 200);
    auto sid = res->get_header_value("Mcp-Session-Id");
    assert(!sid.empty());
    return sid;
}

Json post(httplib::Client& cli, const std::string& sid, const Json& message, int expect_status)
{
    httplib::Headers headers{{"Mcp-Session-Id", sid}};
    auto res = cli.Post("/mcp", headers, message.dump(), "application/json");
    assert(res);
    assert(res->status == expect_status);
    if (res->body.empty())
        return Json();
    return Json::parse(res->body);
}

std::string single_greet_name(const Json& list_response)
{
    for (const auto& tool : list_response["result"]["tools"])
    {
        auto name = tool["name"].get<std::string>();
        if (name.rfind(tools::SINGLE_GREET_TOOL_PREFIX, 0) == 0)
            return name;
    }
    return "";
}
} // namespace

void test_initialize_and_list(App& app)
{
    std::cout << "  test_initialize_and_list... " << std::flush;
    auto cli = make_client(app.port());

    auto res = cli.Post("/mcp", initialize_request().dump(), "application/json");
    assert(res && res->status == 200);
    auto sid = res->get_header_value("Mcp-Session-Id");
    assert(sid.size() == 32);
    auto init = Json::parse(res->body);
    assert(init["result"]["serverInfo"]["name"] == "arjun-mcp-server");
    assert(init["result"]["capabilities"]["tools"]["listChanged"] == true);

    post(cli, sid, Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, 202);

    auto list = post(cli, sid, rpc(1, "tools/list"), 200);
    const auto& listed = list["result"]["tools"];
    assert(listed.size() == 2);
    assert(!single_greet_name(list).empty());
    assert(listed[1]["name"] == "multi-great");
    std::cout << "PASSED\n";
}

void test_single_greet(App& app)
{
    std::cout << "  test_single_greet... " << std::flush;
    auto cli = make_client(app.port());
    auto sid = initialize(cli);
    auto name = single_greet_name(post(cli, sid, rpc(1, "tools/list"), 200));

    auto out = post(cli, sid,
                    rpc(2, "tools/call", {{"name", name}, {"arguments", {{"name", "arjun"}}}}),
                    200);
    assert(out["id"] == 2);
    assert(out["result"]["content"][0]["type"] == "text");
    assert(out["result"]["content"][0]["text"] == "Hey arjun! Welcome to itsuki's world!");

    auto unknown = post(cli, sid,
                        rpc(3, "tools/call", {{"name", "nope"}, {"arguments", Json::object()}}),
                        200);
    assert(unknown["error"]["code"] == -32601);
    std::cout << "PASSED\n";
}

void test_multi_greet_streams_notifications(App& app)
{
    std::cout << "  test_multi_greet_streams_notifications... " << std::flush;
    auto cli = make_client(app.port());
    auto sid = initialize(cli);

    auto start = std::chrono::steady_clock::now();
    auto res = cli.Post("/mcp", session_headers(sid),
                        rpc(7, "tools/call",
                            {{"name", "multi-great"}, {"arguments", {{"name", "arjun"}}}})
                            .dump(),
                        "application/json");
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(res && res->status == 200);
    assert(res->get_header_value("Content-Type").find("text/event-stream") != std::string::npos);

    auto messages = test::parse_sse_messages(res->body);
    assert(messages.size() == 3);
    assert(messages[0]["method"] == "notifications/message");
    assert(messages[0]["params"]["level"] == "info");
    assert(messages[0]["params"]["data"] == "First greet to arjun");
    assert(messages[1]["params"]["data"] == "Second greet to arjun");
    // Final response comes after its interim notifications
    assert(messages[2]["id"] == 7);
    assert(messages[2]["result"]["content"][0]["text"] == "Hope you enjoy your day!");

    assert(elapsed >= std::chrono::milliseconds(2 * STEP_DELAY_MS - 10));
    std::cout << "PASSED\n";
}

void test_rotation_reaches_get_stream(App& app)
{
    std::cout << "  test_rotation_reaches_get_stream... " << std::flush;
    auto cli = make_client(app.port());
    auto sid = initialize(cli);
    auto before = single_greet_name(post(cli, sid, rpc(1, "tools/list"), 200));

    std::mutex m;
    std::string received;
    std::atomic<int> list_changed{0};
    std::atomic<bool> stream_done{false};

    std::thread reader(
        [&]()
        {
            auto stream_cli = make_client(app.port());
            stream_cli.set_read_timeout(30, 0);
            auto res = stream_cli.Get("/mcp", session_headers(sid),
                                      [&](const char* data, size_t len)
                                      {
                                          std::lock_guard<std::mutex> lock(m);
                                          received.append(data, len);
                                          int count = 0;
                                          for (const auto& msg : test::parse_sse_messages(received))
                                              if (msg.value("method", "") ==
                                                  "notifications/tools/list_changed")
                                                  ++count;
                                          list_changed = count;
                                          return true;
                                      });
            assert(res);
            stream_done = true;
        });

    auto session = app.sessions().lookup(sid);
    assert(session);
    for (int i = 0; i < 400 && !session->transport()->has_subscriber(); ++i)
        std::this_thread::sleep_for(5ms);
    assert(session->transport()->has_subscriber());

    // A second stream for the same session is refused
    auto second = cli.Get("/mcp", session_headers(sid));
    assert(second && second->status == 409);

    app.rotator().rotate_now();

    for (int i = 0; i < 400 && list_changed == 0; ++i)
        std::this_thread::sleep_for(5ms);
    std::this_thread::sleep_for(100ms);
    assert(list_changed == 1);

    auto after = single_greet_name(post(cli, sid, rpc(2, "tools/list"), 200));
    assert(!after.empty());
    assert(after != before);

    // Terminating the session ends the open stream
    auto del = cli.Delete("/mcp", session_headers(sid));
    assert(del && del->status == 200);
    reader.join();
    assert(stream_done);
    std::cout << "PASSED\n";
}

void test_delete_is_idempotent(App& app)
{
    std::cout << "  test_delete_is_idempotent... " << std::flush;
    auto cli = make_client(app.port());
    auto sid = initialize(cli);

    auto first = cli.Delete("/mcp", session_headers(sid));
    assert(first && first->status == 200);
    auto again = cli.Delete("/mcp", session_headers(sid));
    assert(again && again->status == 200);

    auto gone = post(cli, sid, rpc(1, "tools/list"), 400);
    assert(gone["error"]["code"] == -32000);

    auto never = cli.Delete("/mcp", session_headers("never-issued"));
    assert(never && never->status == 400);
    std::cout << "PASSED\n";
}

void test_invalid_requests(App& app)
{
    std::cout << "  test_invalid_requests... " << std::flush;
    auto cli = make_client(app.port());

    // Not initialize and no session id
    auto res = cli.Post("/mcp", rpc(1, "tools/list").dump(), "application/json");
    assert(res && res->status == 400);
    auto body = Json::parse(res->body);
    assert(body["error"]["code"] == -32000);
    assert(body["error"]["message"] == "Bad Request: invalid session ID or method.");
    assert(body["id"].is_null());

    // Unknown session id on GET
    auto get = cli.Get("/mcp", session_headers("bogus"));
    assert(get && get->status == 400);

    // Malformed JSON
    auto bad = cli.Post("/mcp", "{ nope", "application/json");
    assert(bad && bad->status == 400);
    assert(Json::parse(bad->body)["error"]["code"] == -32700);

    // Streamed call on an unknown session is rejected before any stream opens
    auto streamed = cli.Post(
        "/mcp", session_headers("bogus"),
        rpc(2, "tools/call", {{"name", "multi-great"}, {"arguments", {{"name", "x"}}}}).dump(),
        "application/json");
    assert(streamed && streamed->status == 400);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Streamable HTTP Integration Tests\n";
    std::cout << "==================================\n";

    Settings settings = test_settings();
    init_logging(settings);

    App app(settings);
    app.start();
    std::cout << "(listening on port " << app.port() << ")\n";

    try
    {
        test_initialize_and_list(app);
        test_single_greet(app);
        test_multi_greet_streams_notifications(app);
        test_rotation_reaches_get_stream(app);
        test_delete_is_idempotent(app);
        test_invalid_requests(app);
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        app.stop();
        return 1;
    }

    app.stop();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
