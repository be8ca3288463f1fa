#include "greetmcp/exceptions.hpp"
#include "greetmcp/server/dispatcher.hpp"
#include "greetmcp/tools/greetings.hpp"
#include "greetmcp/transport/stream_writer_transport.hpp"
#include "greetmcp/util/json.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace greetmcp;
using namespace greetmcp::server;
using namespace std::chrono_literals;

namespace
{
const std::string SINGLE = "single-greeting-test";

struct Fixture
{
    SessionTable sessions;
    tools::ToolRegistry registry{tools::make_greeting_tools(SINGLE, std::chrono::milliseconds(5))};
    NotificationBroadcaster broadcaster{sessions};
    Dispatcher dispatcher{sessions, registry, broadcaster, options()};

    static Dispatcher::Options options()
    {
        Dispatcher::Options opts;
        opts.server_name = "arjun-mcp-server";
        opts.server_version = "1.0.0";
        return opts;
    }

    std::string initialize(const std::string& protocol = "2025-03-26")
    {
        Reply r = dispatcher.handle_post(
            Json{{"jsonrpc", "2.0"},
                 {"id", 0},
                 {"method", "initialize"},
                 {"params",
                  {{"protocolVersion", protocol},
                   {"capabilities", Json::object()},
                   {"clientInfo", {{"name", "test-client"}, {"version", "0.1"}}}}}},
            std::nullopt);
        assert(r.status == ReplyStatus::Ok);
        assert(!r.session_id.empty());
        return r.session_id;
    }

    Reply request(const std::string& sid, int id, const std::string& method,
                  const Json& params = Json::object())
    {
        return dispatcher.handle_post(
            Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}}, sid);
    }
};

Json call_params(const std::string& tool, const Json& args)
{
    return Json{{"name", tool}, {"arguments", args}};
}
} // namespace

void test_initialize_creates_session()
{
    std::cout << "  test_initialize_creates_session... " << std::flush;
    Fixture f;
    Reply r = f.dispatcher.handle_post(
        Json{{"jsonrpc", "2.0"},
             {"id", 1},
             {"method", "initialize"},
             {"params",
              {{"protocolVersion", "2024-11-05"},
               {"capabilities", Json::object()},
               {"clientInfo", {{"name", "c"}, {"version", "1"}}}}}},
        std::nullopt);

    assert(r.status == ReplyStatus::Ok);
    assert(r.body["id"] == 1);
    const auto& result = r.body["result"];
    assert(result["protocolVersion"] == "2024-11-05");
    assert(result["serverInfo"]["name"] == "arjun-mcp-server");
    assert(result["capabilities"]["tools"]["listChanged"] == true);
    assert(result["capabilities"].contains("logging"));

    auto session = f.sessions.lookup(r.session_id);
    assert(session && session->is_active());
    assert(session->client_info().name == "c");
    std::cout << "PASSED\n";
}

void test_unknown_protocol_version_negotiates_latest()
{
    std::cout << "  test_unknown_protocol_version_negotiates_latest... " << std::flush;
    Fixture f;
    auto sid = f.initialize("1999-01-01");
    assert(f.sessions.lookup(sid)->protocol_version() == LATEST_PROTOCOL_VERSION);
    std::cout << "PASSED\n";
}

void test_invalid_session_rejected()
{
    std::cout << "  test_invalid_session_rejected... " << std::flush;
    Fixture f;

    // No id, not initialize
    Reply r = f.dispatcher.handle_post(
        Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}, std::nullopt);
    assert(r.status == ReplyStatus::BadRequest);
    assert(r.body["error"]["code"] == -32000);
    assert(r.body["error"]["message"] == "Bad Request: invalid session ID or method.");

    // Unknown id
    r = f.request("does-not-exist", 2, "tools/list");
    assert(r.status == ReplyStatus::BadRequest);
    assert(r.body["error"]["code"] == -32000);

    // Nothing was created
    assert(f.sessions.size() == 0);
    std::cout << "PASSED\n";
}

void test_repeated_initialize_rejected()
{
    std::cout << "  test_repeated_initialize_rejected... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    Reply r = f.request(sid, 9, "initialize");
    assert(r.status == ReplyStatus::Ok);
    assert(r.body["error"]["code"] == -32600);
    assert(r.body["error"]["message"] == "Invalid Request: Server already initialized");
    assert(f.sessions.size() == 1);
    std::cout << "PASSED\n";
}

void test_non_object_and_notification()
{
    std::cout << "  test_non_object_and_notification... " << std::flush;
    Fixture f;
    auto sid = f.initialize();

    Reply batch = f.dispatcher.handle_post(Json::array({Json::object()}), sid);
    assert(batch.status == ReplyStatus::BadRequest);
    assert(batch.body["error"]["code"] == -32600);

    Reply note = f.dispatcher.handle_post(
        Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, sid);
    assert(note.status == ReplyStatus::Accepted);
    assert(note.body.is_null());
    assert(f.sessions.lookup(sid)->client_initialized());
    std::cout << "PASSED\n";
}

void test_ping_and_unknown_method()
{
    std::cout << "  test_ping_and_unknown_method... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    Reply ping = f.request(sid, 3, "ping");
    assert(ping.body["result"] == Json::object());

    Reply unknown = f.request(sid, 4, "resources/list");
    assert(unknown.status == ReplyStatus::Ok);
    assert(unknown.body["error"]["code"] == -32601);
    std::cout << "PASSED\n";
}

void test_tools_list()
{
    std::cout << "  test_tools_list... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    Reply r = f.request(sid, 2, "tools/list");
    assert(r.status == ReplyStatus::Ok);
    const auto& tools = r.body["result"]["tools"];
    assert(tools.size() == 2);
    assert(tools[0]["name"] == SINGLE);
    assert(tools[1]["name"] == "multi-great");
    assert(tools[0].contains("inputSchema"));
    std::cout << "PASSED\n";
}

void test_malformed_initialize_params()
{
    std::cout << "  test_malformed_initialize_params... " << std::flush;
    Fixture f;
    const Json bad_params[] = {
        Json("x"),
        Json{{"clientInfo", "x"}},
        Json{{"clientInfo", {{"name", 42}, {"version", "1"}}}},
        Json{{"clientInfo", {{"name", "c"}, {"version", Json::array()}}}},
        Json{{"capabilities", "x"}},
    };
    for (const auto& params : bad_params)
    {
        Reply r = f.dispatcher.handle_post(
            Json{{"jsonrpc", "2.0"}, {"id", 5}, {"method", "initialize"}, {"params", params}},
            std::nullopt);
        assert(r.status == ReplyStatus::BadRequest);
        assert(r.session_id.empty());
        assert(r.body["id"] == 5);
        assert(r.body["error"]["code"] == -32602);
    }
    // Rejected handshakes leave nothing behind
    assert(f.sessions.size() == 0);
    std::cout << "PASSED\n";
}

void test_delete_racing_initialize()
{
    std::cout << "  test_delete_racing_initialize... " << std::flush;
    Fixture f;
    std::atomic<bool> done{false};

    // Terminates every session it can see, including ones still initializing
    std::thread terminator(
        [&]()
        {
            while (!done)
            {
                std::vector<std::string> ids;
                f.sessions.for_each([&](const std::shared_ptr<Session>& s)
                                    { ids.push_back(s->session_id()); });
                for (const auto& id : ids)
                    f.dispatcher.handle_delete(id);
            }
        });

    for (int i = 0; i < 300; ++i)
    {
        Reply r = f.dispatcher.handle_post(
            Json{{"jsonrpc", "2.0"},
                 {"id", i},
                 {"method", "initialize"},
                 {"params", {{"protocolVersion", "2025-03-26"}}}},
            std::nullopt);
        if (r.status == ReplyStatus::Ok)
        {
            assert(!r.session_id.empty());
            continue;
        }
        // A session closed mid-handshake is reported as gone, never as a server fault
        assert(r.status == ReplyStatus::BadRequest);
        assert(r.session_id.empty());
        assert(r.body["error"]["code"] == -32000);
        assert(r.body["id"].is_null());
    }

    done = true;
    terminator.join();
    std::cout << "PASSED\n";
}

void test_tools_list_between_rotation_and_broadcast()
{
    std::cout << "  test_tools_list_between_rotation_and_broadcast... " << std::flush;
    Fixture f;
    auto listed = f.sessions.lookup(f.initialize());

    uint64_t v = f.registry.replace(
        tools::make_greeting_tools("single-greeting-next", std::chrono::milliseconds(5)));

    // Both see the new set before the change notice goes out
    Reply r = f.request(listed->session_id(), 1, "tools/list");
    assert(r.body["result"]["tools"][0]["name"] == "single-greeting-next");
    auto late = f.sessions.lookup(f.initialize());

    assert(f.broadcaster.broadcast_tools_changed(v) == 2);
    assert(f.broadcaster.broadcast_tools_changed(v) == 0);
    for (const auto& s : {listed, late})
    {
        assert(s->transport()->pending() == 1);
        auto n = s->transport()->next(10ms).value();
        assert(n["method"] == "notifications/tools/list_changed");
    }
    std::cout << "PASSED\n";
}

void test_single_greet_call()
{
    std::cout << "  test_single_greet_call... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    Reply r = f.request(sid, 5, "tools/call", call_params(SINGLE, {{"name", "arjun"}}));
    assert(r.status == ReplyStatus::Ok);
    assert(r.body["id"] == 5);
    assert(r.body["result"]["content"][0]["text"] == "Hey arjun! Welcome to itsuki's world!");
    std::cout << "PASSED\n";
}

void test_call_errors()
{
    std::cout << "  test_call_errors... " << std::flush;
    Fixture f;
    auto sid = f.initialize();

    Reply no_args = f.request(sid, 1, "tools/call", Json{{"name", SINGLE}});
    assert(no_args.body["error"]["code"] == -32602);
    assert(no_args.body["error"]["message"] == "arguments undefined");

    Reply no_name = f.request(sid, 2, "tools/call", Json{{"arguments", Json::object()}});
    assert(no_name.body["error"]["code"] == -32602);
    assert(no_name.body["error"]["message"] == "tool name undefined");

    Reply unknown = f.request(sid, 3, "tools/call", call_params("nope", Json::object()));
    assert(unknown.status == ReplyStatus::Ok);
    assert(unknown.body["error"]["code"] == -32601);
    assert(unknown.body["error"]["message"] == "Tool not found: nope");

    Reply missing = f.request(sid, 4, "tools/call", call_params(SINGLE, Json::object()));
    assert(missing.body["error"]["code"] == -32602);
    assert(missing.body["error"]["message"] == "Name to greet undefined.");
    std::cout << "PASSED\n";
}

void test_multi_greet_without_request_stream()
{
    std::cout << "  test_multi_greet_without_request_stream... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    auto session = f.sessions.lookup(sid);

    Reply r = f.request(sid, 6, "tools/call", call_params("multi-great", {{"name", "arjun"}}));
    assert(r.body["result"]["content"][0]["text"] == "Hope you enjoy your day!");

    // Interim notifications went to the standalone stream, in order
    auto first = session->transport()->next(10ms);
    auto second = session->transport()->next(10ms);
    assert(first && second);
    assert((*first)["method"] == "notifications/message");
    assert((*first)["params"]["data"] == "First greet to arjun");
    assert((*second)["params"]["data"] == "Second greet to arjun");
    std::cout << "PASSED\n";
}

void test_multi_greet_on_request_stream()
{
    std::cout << "  test_multi_greet_on_request_stream... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    auto session = f.sessions.lookup(sid);

    std::vector<std::string> frames;
    auto response = std::make_shared<transport::StreamWriterTransport>(
        [&](const std::string& frame)
        {
            frames.push_back(frame);
            return true;
        });

    Reply r = f.dispatcher.handle_post(Json{{"jsonrpc", "2.0"},
                                            {"id", "call-1"},
                                            {"method", "tools/call"},
                                            {"params", call_params("multi-great", {{"name", "arjun"}})}},
                                       sid, response);
    assert(r.body["result"]["content"][0]["text"] == "Hope you enjoy your day!");
    assert(frames.size() == 2);
    assert(frames[0].find("First greet to arjun") != std::string::npos);
    assert(frames[1].find("Second greet to arjun") != std::string::npos);
    assert(session->transport()->pending() == 0);
    std::cout << "PASSED\n";
}

void test_set_log_level_filters_notifications()
{
    std::cout << "  test_set_log_level_filters_notifications... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    auto session = f.sessions.lookup(sid);

    Reply bad = f.request(sid, 1, "logging/setLevel", Json{{"level", "chatty"}});
    assert(bad.body["error"]["code"] == -32602);

    Reply ok = f.request(sid, 2, "logging/setLevel", Json{{"level", "warning"}});
    assert(ok.body["result"] == Json::object());
    assert(session->log_level() == LogLevel::Warning);

    f.request(sid, 3, "tools/call", call_params("multi-great", {{"name", "arjun"}}));
    assert(session->transport()->pending() == 0);
    std::cout << "PASSED\n";
}

void test_sessions_are_isolated()
{
    std::cout << "  test_sessions_are_isolated... " << std::flush;
    Fixture f;
    auto a = f.initialize();
    auto b = f.initialize();
    assert(a != b);

    f.request(a, 1, "tools/call", call_params("multi-great", {{"name", "a"}}));
    assert(f.sessions.lookup(a)->transport()->pending() == 2);
    assert(f.sessions.lookup(b)->transport()->pending() == 0);
    std::cout << "PASSED\n";
}

void test_delete_is_idempotent()
{
    std::cout << "  test_delete_is_idempotent... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    auto session = f.sessions.lookup(sid);

    Reply first = f.dispatcher.handle_delete(sid);
    assert(first.status == ReplyStatus::Ok);
    assert(session->is_closed());
    assert(f.sessions.lookup(sid) == nullptr);

    Reply again = f.dispatcher.handle_delete(sid);
    assert(again.status == ReplyStatus::Ok);

    Reply never = f.dispatcher.handle_delete(std::string("never-issued"));
    assert(never.status == ReplyStatus::BadRequest);

    Reply missing = f.dispatcher.handle_delete(std::nullopt);
    assert(missing.status == ReplyStatus::BadRequest);

    // A terminated session cannot be used anymore
    Reply after = f.request(sid, 1, "tools/list");
    assert(after.status == ReplyStatus::BadRequest);
    std::cout << "PASSED\n";
}

void test_transport_failure_removes_session()
{
    std::cout << "  test_transport_failure_removes_session... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    auto session = f.sessions.lookup(sid);
    session->transport()->fail("socket reset");
    assert(session->is_closed());
    assert(f.sessions.lookup(sid) == nullptr);
    assert(f.sessions.was_removed(sid));
    std::cout << "PASSED\n";
}

void test_subscribe()
{
    std::cout << "  test_subscribe... " << std::flush;
    Fixture f;
    auto sid = f.initialize();
    auto session = f.sessions.lookup(sid);

    assert(f.dispatcher.check_subscribe(std::string("bogus")).status == ReplyStatus::BadRequest);
    assert(f.dispatcher.check_subscribe(sid).status == ReplyStatus::Ok);

    session->send(jsonrpc::notification("notifications/tools/list_changed"));

    std::string written;
    std::thread subscriber(
        [&]()
        {
            Reply r = f.dispatcher.handle_subscribe(sid,
                                                    [&](const std::string& chunk)
                                                    {
                                                        written += chunk;
                                                        return true;
                                                    });
            assert(r.status == ReplyStatus::Ok);
        });

    for (int i = 0; i < 200 && !session->transport()->has_subscriber(); ++i)
        std::this_thread::sleep_for(5ms);
    assert(f.dispatcher.check_subscribe(sid).status == ReplyStatus::Conflict);

    f.dispatcher.handle_delete(sid);
    subscriber.join();
    assert(written.find("notifications/tools/list_changed") != std::string::npos);
    std::cout << "PASSED\n";
}

void test_close_all()
{
    std::cout << "  test_close_all... " << std::flush;
    Fixture f;
    auto a = f.sessions.lookup(f.initialize());
    auto b = f.sessions.lookup(f.initialize());
    f.dispatcher.close_all();
    assert(a->is_closed() && b->is_closed());
    assert(f.sessions.size() == 0);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Dispatcher Tests\n";
    std::cout << "================\n";
    test_initialize_creates_session();
    test_unknown_protocol_version_negotiates_latest();
    test_invalid_session_rejected();
    test_repeated_initialize_rejected();
    test_malformed_initialize_params();
    test_delete_racing_initialize();
    test_non_object_and_notification();
    test_ping_and_unknown_method();
    test_tools_list();
    test_tools_list_between_rotation_and_broadcast();
    test_single_greet_call();
    test_call_errors();
    test_multi_greet_without_request_stream();
    test_multi_greet_on_request_stream();
    test_set_log_level_filters_notifications();
    test_sessions_are_isolated();
    test_delete_is_idempotent();
    test_transport_failure_removes_session();
    test_subscribe();
    test_close_all();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
