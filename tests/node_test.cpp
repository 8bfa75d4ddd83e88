#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "cad/lavalink/node.hpp"
#include "support/frames.hpp"
#include "support/manual_scheduler.hpp"
#include "support/node_rig.hpp"

using namespace cad;
using namespace cad::lavalink;
using namespace std::chrono_literals;
using cad::test::manual_scheduler;
using cad::test::node_rig;

namespace {

// Records listener calls in order, as short strings.
class recording_listener : public node_listener {
public:
    void on_node_ready(node&, bool resumed) override
    {
        calls.push_back(resumed ? "ready:resumed" : "ready:new");
    }
    void on_node_session_lost(node&) override { calls.push_back("session_lost"); }
    void on_node_unhealthy(node&) override { calls.push_back("unhealthy"); }
    void on_player_update(node&, const player_update_message& msg) override
    {
        calls.push_back("update:" + std::to_string(msg.position_ms));
    }
    void on_player_event(node&, const event_message&) override { calls.push_back("event"); }

    std::size_t count(const std::string& call) const
    {
        return static_cast<std::size_t>(std::count(calls.begin(), calls.end(), call));
    }

    std::vector<std::string> calls;
};

reconnect_policy test_policy()
{
    reconnect_policy p;
    p.base_delay        = 1000ms;
    p.max_delay         = 8000ms;
    p.multiplier        = 2.0;
    p.failure_threshold = 3;
    p.resume_window     = 10s;
    p.connect_timeout   = 60000ms;
    return p;
}

} // namespace

class NodeTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        rig.node->set_listener(&listener);
    }

    manual_scheduler   sched;
    recording_listener listener;
    node_rig           rig{sched, "main", test_policy()};
};

TEST_F(NodeTest, ConnectHandshakeAndReady)
{
    EXPECT_EQ(node_state::disconnected, rig.node->state());

    rig.node->connect();
    EXPECT_EQ(node_state::connecting, rig.node->state());
    ASSERT_EQ(1u, rig.socket.requests.size());
    EXPECT_EQ("main.audio.example", rig.socket.requests[0].host);
    EXPECT_EQ(2333, rig.socket.requests[0].port);
    EXPECT_EQ("/v4/websocket", rig.socket.requests[0].path);
    EXPECT_EQ("secret", rig.socket.header(0, "Authorization"));
    EXPECT_EQ("42", rig.socket.header(0, "User-Id"));
    EXPECT_EQ("cadence-test", rig.socket.header(0, "Client-Name"));
    EXPECT_EQ("", rig.socket.header(0, "Session-Id"));

    rig.socket.accept();
    EXPECT_EQ(node_state::authenticated, rig.node->state());

    rig.socket.receive(cad::test::ready_frame("abc"));
    EXPECT_EQ(node_state::ready, rig.node->state());
    EXPECT_EQ("abc", rig.node->session_id());
    EXPECT_EQ(std::vector<std::string>{"ready:new"}, listener.calls);
}

TEST_F(NodeTest, ConnectTwiceOpensOneSession)
{
    rig.node->connect();
    rig.node->connect();
    EXPECT_EQ(1u, rig.socket.requests.size());
}

TEST_F(NodeTest, ReadyMakesSessionResumable)
{
    rig.bring_up("abc");
    sched.run_due();

    ASSERT_EQ(1u, rig.http.requests.size());
    EXPECT_EQ(dpp::m_patch, rig.http.requests[0].method);
    EXPECT_EQ("http://main.audio.example:2333/v4/sessions/abc", rig.http.requests[0].url);
    auto body = dpp::json::parse(rig.http.requests[0].body);
    EXPECT_EQ(true, body["resuming"]);
    EXPECT_EQ(10, body["timeout"]);
}

TEST_F(NodeTest, ResumeConfigurationFailureIsTolerated)
{
    rig.http.script(404, R"({"message":"Session not found"})");
    rig.bring_up("abc");
    sched.run_due();
    EXPECT_EQ(node_state::ready, rig.node->state());
}

TEST_F(NodeTest, SendOnlyWhenReady)
{
    rig.node->connect();
    rig.socket.accept();
    EXPECT_FALSE(rig.node->send(stop_command{dpp::snowflake(7)}));
    EXPECT_TRUE(rig.socket.sent.empty());

    rig.socket.receive(cad::test::ready_frame("abc"));
    EXPECT_TRUE(rig.node->send(stop_command{dpp::snowflake(7)}));
    EXPECT_EQ(std::vector<std::string>{"stop"}, rig.socket.ops());
}

TEST_F(NodeTest, FailedAttemptsBackOffExponentially)
{
    rig.node->connect();
    rig.socket.drop();
    EXPECT_EQ(node_state::disconnected, rig.node->state());
    EXPECT_EQ(1u, rig.node->snapshot().failures);

    // base * 2^1
    sched.advance(1999ms);
    EXPECT_EQ(1u, rig.socket.requests.size());
    sched.advance(1ms);
    EXPECT_EQ(2u, rig.socket.requests.size());
    EXPECT_EQ(node_state::connecting, rig.node->state());

    // base * 2^2
    rig.socket.drop();
    sched.advance(3999ms);
    EXPECT_EQ(2u, rig.socket.requests.size());
    sched.advance(1ms);
    EXPECT_EQ(3u, rig.socket.requests.size());
}

TEST_F(NodeTest, BackoffIsCapped)
{
    rig.node->connect();
    for (int i = 0; i < 5; ++i) {
        rig.socket.drop();
        sched.advance(8000ms);
    }
    const auto opened = rig.socket.requests.size();
    rig.socket.drop();
    sched.advance(8000ms);
    EXPECT_EQ(opened + 1, rig.socket.requests.size());
}

TEST_F(NodeTest, UnhealthyOnceAtThresholdAndHealedByReady)
{
    rig.node->connect();
    for (int i = 0; i < 5; ++i) {
        rig.socket.drop();
        sched.advance(8000ms);
    }
    EXPECT_FALSE(rig.node->healthy());
    EXPECT_EQ(1u, listener.count("unhealthy"));

    rig.socket.accept();
    rig.socket.receive(cad::test::ready_frame("later"));
    EXPECT_TRUE(rig.node->healthy());
    EXPECT_EQ(0u, rig.node->snapshot().failures);
}

TEST_F(NodeTest, ConnectTimeoutClosesAndCountsFailure)
{
    rig.node->connect();
    rig.socket.accept();
    EXPECT_EQ(node_state::authenticated, rig.node->state());

    sched.advance(60000ms);
    EXPECT_EQ(1u, rig.socket.close_calls);
    EXPECT_FALSE(rig.socket.live());
    EXPECT_EQ(node_state::disconnected, rig.node->state());
    EXPECT_EQ(1u, rig.node->snapshot().failures);
}

TEST_F(NodeTest, ReadyCancelsConnectTimeout)
{
    rig.bring_up();
    sched.advance(120000ms);
    EXPECT_EQ(0u, rig.socket.close_calls);
    EXPECT_EQ(node_state::ready, rig.node->state());
}

TEST_F(NodeTest, ResumeWithinWindow)
{
    rig.bring_up("abc");
    rig.socket.drop(1006, "");
    EXPECT_EQ(node_state::reconnecting, rig.node->state());

    sched.advance(1000ms);
    ASSERT_EQ(2u, rig.socket.requests.size());
    EXPECT_EQ("abc", rig.socket.header(1, "Session-Id"));
    EXPECT_EQ("abc", rig.socket.header(1, "Resume-Key"));

    rig.socket.accept();
    rig.socket.receive(cad::test::ready_frame("abc", true));
    EXPECT_EQ(node_state::ready, rig.node->state());
    EXPECT_EQ((std::vector<std::string>{"ready:new", "ready:resumed"}), listener.calls);
}

TEST_F(NodeTest, ResumeRejectedLosesSessionFirst)
{
    rig.bring_up("abc");
    rig.socket.drop();
    sched.advance(1000ms);
    rig.socket.accept();
    rig.socket.receive(cad::test::ready_frame("fresh", false));

    EXPECT_EQ("fresh", rig.node->session_id());
    EXPECT_EQ((std::vector<std::string>{"ready:new", "session_lost", "ready:new"}), listener.calls);
}

TEST_F(NodeTest, ResumeWindowExpiryStartsNewSession)
{
    rig.bring_up("abc");
    rig.socket.drop();

    sched.jump(11000ms);
    sched.run_due();

    EXPECT_EQ(1u, listener.count("session_lost"));
    EXPECT_EQ(node_state::connecting, rig.node->state());
    EXPECT_EQ("", rig.node->session_id());
    ASSERT_EQ(2u, rig.socket.requests.size());
    EXPECT_EQ("", rig.socket.header(1, "Session-Id"));
}

TEST_F(NodeTest, FailedResumeAttemptsKeepReconnecting)
{
    rig.bring_up("abc");
    rig.socket.drop();
    sched.advance(1000ms);
    rig.socket.drop();

    EXPECT_EQ(node_state::reconnecting, rig.node->state());
    sched.advance(2000ms);
    ASSERT_EQ(3u, rig.socket.requests.size());
    EXPECT_EQ("abc", rig.socket.header(2, "Session-Id"));
}

TEST_F(NodeTest, MalformedFramesAreDropped)
{
    rig.bring_up();
    rig.socket.receive("{ this is not json");
    rig.socket.receive(R"({"op":"playerUpdate","guildId":"1","state":{"position":"soon"}})");
    rig.socket.receive(R"({"op":"somethingNew"})");

    EXPECT_EQ(node_state::ready, rig.node->state());
    EXPECT_TRUE(rig.socket.live());

    rig.socket.receive(cad::test::player_update_frame(dpp::snowflake(1), 1234));
    rig.socket.receive(cad::test::track_start_frame(dpp::snowflake(1), "enc-a"));
    EXPECT_EQ((std::vector<std::string>{"ready:new", "update:1234", "event"}), listener.calls);
}

TEST_F(NodeTest, StatsUpdateLoad)
{
    rig.bring_up();
    EXPECT_FALSE(rig.node->stats().has_value());

    rig.socket.receive(cad::test::stats_frame(4, 3, 0.75));
    ASSERT_TRUE(rig.node->stats().has_value());
    EXPECT_EQ(3u, rig.node->stats()->playing_players);
    EXPECT_DOUBLE_EQ(0.75, rig.node->snapshot().stats->system_load);
}

TEST_F(NodeTest, PlayerCountTracksAttachments)
{
    rig.node->attach_player(dpp::snowflake(1));
    rig.node->attach_player(dpp::snowflake(2));
    rig.node->attach_player(dpp::snowflake(2));
    EXPECT_EQ(2u, rig.node->player_count());
    rig.node->detach_player(dpp::snowflake(1));
    EXPECT_EQ(1u, rig.node->snapshot().players);
}

TEST_F(NodeTest, ShutdownIsTerminal)
{
    rig.bring_up();
    sched.run_due();

    rig.node->shutdown();
    EXPECT_EQ(node_state::disconnected, rig.node->state());
    EXPECT_FALSE(rig.node->healthy());
    EXPECT_FALSE(rig.socket.live());
    EXPECT_EQ(0u, sched.pending());

    rig.node->connect();
    EXPECT_EQ(1u, rig.socket.requests.size());
}

TEST_F(NodeTest, LateCallbacksFromOldSessionAreIgnored)
{
    rig.node->connect();
    rig.socket.drop();
    sched.advance(2000ms);
    ASSERT_EQ(2u, rig.socket.requests.size());
    rig.socket.accept();
    rig.socket.receive(cad::test::ready_frame("abc"));

    rig.socket.replay_close(0);
    EXPECT_EQ(node_state::ready, rig.node->state());
    EXPECT_EQ(0u, rig.node->snapshot().failures);
    EXPECT_TRUE(rig.node->send(stop_command{dpp::snowflake(7)}));
}
