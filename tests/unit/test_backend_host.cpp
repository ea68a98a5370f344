#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "core/event_loop.hpp"
#include "daemon/backend_host.hpp"
#include "ipc/codec.hpp"

using namespace xplorer;
using namespace xplorer::ipc;
using namespace std::chrono_literals;

namespace
{

class BackendHostTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto [shell, backend] = Connection::make_pair();
        ASSERT_TRUE(shell && backend);
        requests = std::move(shell);
        host.adopt_request_connection(std::move(backend));
    }

    void pump(int rounds = 4)
    {
        for (int i = 0; i < rounds; ++i)
            loop.run_once(5ms);
    }

    void send(const std::string& id, const std::string& action, Value params = Value::object())
    {
        ASSERT_TRUE(requests->send(
            make_message(MessageType::REQUEST, encode_request(Request{id, action, std::move(params)}))));
    }

    // Pumps the host and collects whatever responses reached the shell end.
    std::vector<Response> responses()
    {
        pump();
        std::vector<Message> frames;
        requests->read_available(frames);
        std::vector<Response> out;
        for (const auto& f : frames)
        {
            if (auto r = decode_response(f.payload))
                out.push_back(std::move(*r));
        }
        return out;
    }

    std::unique_ptr<Connection> subscribe_client(const std::string& topic)
    {
        auto [shell, backend] = Connection::make_pair();
        host.adopt_event_connection(std::move(backend));
        shell->send(make_message(MessageType::SUBSCRIBE, encode_topic(topic)));
        pump();
        return std::move(shell);
    }

    core::EventLoop             loop;
    daemon::BackendHost         host{loop};
    std::unique_ptr<Connection> requests;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Routing
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BackendHostTest, RoutesToRegisteredHandler)
{
    host.register_action("fs.list",
                         [](const Request& req, daemon::Reply reply)
                         {
                             Value data = Value::object();
                             data.set("path", req.params.get_string("path"));
                             reply.success(std::move(data));
                         });

    send("r1", "fs.list", Value::object({{"path", "/srv"}}));
    auto got = responses();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].id, "r1");
    EXPECT_TRUE(got[0].success);
    EXPECT_EQ(got[0].data.get_string("path"), "/srv");
    EXPECT_EQ(host.requests_handled(), 1u);
}

TEST_F(BackendHostTest, UnknownActionAnsweredWithInvalidRequest)
{
    send("r1", "fs.bogus");
    auto got = responses();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_FALSE(got[0].success);
    EXPECT_EQ(got[0].error.code, error_code::INVALID_REQUEST);
    EXPECT_EQ(got[0].error.message, "Unknown action: fs.bogus");
}

TEST_F(BackendHostTest, ThrowingHandlerBecomesOperationFailed)
{
    host.register_action("fs.copy",
                         [](const Request&, daemon::Reply) { throw std::runtime_error("disk on fire"); });
    send("r1", "fs.copy");
    auto got = responses();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].error.code, error_code::OPERATION_FAILED);
    EXPECT_EQ(got[0].error.message, "disk on fire");
}

TEST_F(BackendHostTest, OnlyFirstAnswerIsSent)
{
    host.register_action("fs.info",
                         [](const Request&, daemon::Reply reply)
                         {
                             reply.success(Value(1));
                             reply.failure(error_code::UNKNOWN, "again");
                             EXPECT_TRUE(reply.sent());
                         });
    send("r1", "fs.info");
    auto got = responses();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_TRUE(got[0].success);
}

TEST_F(BackendHostTest, DeferredRepliesGoOutInAnyOrder)
{
    std::vector<daemon::Reply> held;
    host.register_action("fs.list", [&](const Request&, daemon::Reply reply) { held.push_back(reply); });

    send("r1", "fs.list");
    send("r2", "fs.list");
    EXPECT_TRUE(responses().empty());
    ASSERT_EQ(held.size(), 2u);
    EXPECT_EQ(held[1].request_id(), "r2");

    held[1].success();
    held[0].success();
    auto got = responses();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].id, "r2");
    EXPECT_EQ(got[1].id, "r1");
}

TEST_F(BackendHostTest, ReplyOutlivingHostIsHarmless)
{
    daemon::Reply late;
    {
        core::EventLoop     other_loop;
        daemon::BackendHost other(other_loop);
        auto [shell, backend] = Connection::make_pair();
        other.register_action("fs.list", [&](const Request&, daemon::Reply reply) { late = reply; });
        other.adopt_request_connection(std::move(backend));
        shell->send(make_message(MessageType::REQUEST,
                                 encode_request(Request{"r1", "fs.list", Value::object()})));
        other_loop.run_once(20ms);
    }
    EXPECT_FALSE(late.sent());
    late.success();
    EXPECT_TRUE(late.sent());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Cancel
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BackendHostTest, CancelRecordsOperation)
{
    EXPECT_TRUE(host.has_action("cancel"));
    send("r1", "cancel", Value::object({{"operation_id", "op-9"}}));
    auto got = responses();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_TRUE(got[0].success);
    EXPECT_TRUE(got[0].data.get_bool("cancelled"));
    EXPECT_TRUE(host.is_cancelled("op-9"));

    host.clear_cancelled("op-9");
    EXPECT_FALSE(host.is_cancelled("op-9"));
}

TEST_F(BackendHostTest, CancelWithoutOperationIdFails)
{
    send("r1", "cancel");
    auto got = responses();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_FALSE(got[0].success);
    EXPECT_EQ(got[0].error.code, error_code::INVALID_REQUEST);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Events
// ═══════════════════════════════════════════════════════════════════════════════

TEST(BackendHostTopics, TopicMatching)
{
    using daemon::BackendHost;
    EXPECT_TRUE(BackendHost::topic_matches("/home", "/home"));
    EXPECT_TRUE(BackendHost::topic_matches("/home", "/home/me/file"));
    EXPECT_FALSE(BackendHost::topic_matches("/home", "/homework"));
    EXPECT_TRUE(BackendHost::topic_matches("C:\\Data", "c:\\data\\x.txt"));
}

TEST_F(BackendHostTest, PublishReachesMatchingSubscribersOnly)
{
    auto docs  = subscribe_client("/home/docs");
    auto music = subscribe_client("/home/music");
    EXPECT_EQ(host.event_client_count(), 2u);
    EXPECT_EQ(host.subscriber_count("/home/docs"), 1u);

    Event e;
    e.type = "fs.changed";
    e.path = "/home/docs/report.txt";
    EXPECT_EQ(host.publish(e), 1u);

    auto msg = docs->recv();
    ASSERT_TRUE(msg.has_value());
    auto event = decode_event(msg->payload);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->path, "/home/docs/report.txt");
    EXPECT_GT(event->timestamp, 0);

    std::vector<Message> none;
    music->read_available(none);
    EXPECT_TRUE(none.empty());
}

TEST_F(BackendHostTest, UnsubscribeStopsDelivery)
{
    auto client = subscribe_client("/data");
    client->send(make_message(MessageType::UNSUBSCRIBE, encode_topic("/data")));
    pump();

    Event e;
    e.type = "fs.changed";
    e.path = "/data";
    EXPECT_EQ(host.publish(e), 0u);
}

TEST_F(BackendHostTest, ClosedClientsAreDropped)
{
    auto client = subscribe_client("/x");
    EXPECT_EQ(host.event_client_count(), 1u);
    client.reset();
    pump();
    EXPECT_EQ(host.event_client_count(), 0u);

    requests.reset();
    pump();
    EXPECT_EQ(host.request_client_count(), 0u);
}

TEST(BackendHostSockets, ListenAndAccept)
{
    std::string req_path = "/tmp/xplorer-host-req-" + std::to_string(::getpid()) + ".sock";
    std::string evt_path = "/tmp/xplorer-host-evt-" + std::to_string(::getpid()) + ".sock";

    core::EventLoop     loop;
    daemon::BackendHost host(loop);
    ASSERT_TRUE(host.listen(req_path, evt_path));

    auto req = Client::connect(req_path);
    auto evt = Client::connect(evt_path);
    ASSERT_TRUE(req && evt);
    for (int i = 0; i < 4; ++i)
        loop.run_once(5ms);

    EXPECT_EQ(host.request_client_count(), 1u);
    EXPECT_EQ(host.event_client_count(), 1u);

    host.close();
    EXPECT_EQ(host.request_client_count(), 0u);
}
