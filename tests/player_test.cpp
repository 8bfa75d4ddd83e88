#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "cad/player/player.hpp"
#include "support/frames.hpp"
#include "support/manual_scheduler.hpp"
#include "support/node_rig.hpp"

using namespace cad;
using namespace cad::lavalink;
using namespace std::chrono_literals;
using cad::player::loop_mode;
using cad::player::notification;
using cad::player::player_state;
using cad::test::make_session;
using cad::test::make_track;

class PlayerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        rig.bring_up();
        p = make_player(policy);
        p->update_voice_session(make_session(guild));
        rig.socket.clear_sent();
    }

    std::shared_ptr<player::player> make_player(const player_policy& pol)
    {
        return std::make_shared<player::player>(
            guild, rig.node, pol, sched,
            [this](const notification& n) { notes.push_back(n); },
            logger());
    }

    // Fresh player with a custom policy, voice session set, sent frames cleared.
    void reset_with(const player_policy& pol)
    {
        p = make_player(pol);
        p->update_voice_session(make_session(guild));
        rig.socket.clear_sent();
    }

    void enqueue(std::initializer_list<const char*> ids)
    {
        for (const char* id : ids) {
            ASSERT_EQ(status::ok, p->enqueue(make_track(id)));
        }
    }

    void finish(const std::string& id)
    {
        p->on_event(track_end{"enc-" + id, end_reason::finished});
    }

    // The socket drops; the node keeps its session for resuming.
    void drop_node()
    {
        rig.socket.drop();
    }

    // Reconnects and resumes the session dropped by drop_node().
    void resume_node()
    {
        sched.advance(1000ms);
        rig.socket.accept();
        rig.socket.receive(cad::test::ready_frame("session-1", true));
        sched.run_due();
        rig.socket.clear_sent();
    }

    std::size_t current() const
    {
        auto s = p->snapshot();
        return s.current.value_or(static_cast<std::size_t>(-1));
    }

    // Encoded tracks of every play frame sent so far.
    std::vector<std::string> played() const
    {
        std::vector<std::string> out;
        for (const auto& j : rig.socket.frames()) {
            if (j["op"] == "play") {
                out.push_back(j["track"].get<std::string>());
            }
        }
        return out;
    }

    std::size_t count(notification::kind what) const
    {
        return static_cast<std::size_t>(std::count_if(notes.begin(), notes.end(),
            [what](const notification& n) { return n.what == what; }));
    }

    const dpp::snowflake                 guild{1001};
    cad::test::manual_scheduler          sched;
    cad::test::node_rig                  rig{sched};
    player_policy                        policy;
    std::vector<notification>            notes;
    std::shared_ptr<player::player>      p;
};

// ---------- queue ----------

TEST_F(PlayerTest, EnqueueWhenIdleStartsPlaying)
{
    EXPECT_EQ(player_state::idle, p->state());
    enqueue({"a"});

    EXPECT_EQ(player_state::playing, p->state());
    EXPECT_EQ(0u, current());
    auto frames = rig.socket.frames();
    ASSERT_EQ(1u, frames.size());
    EXPECT_EQ("play", frames[0]["op"]);
    EXPECT_EQ("enc-a", frames[0]["track"]);
    EXPECT_EQ(100, frames[0]["volume"]);
    EXPECT_FALSE(frames[0].contains("startTimeMs"));
}

TEST_F(PlayerTest, QueueIsFirstInFirstOut)
{
    enqueue({"a", "b", "c"});
    EXPECT_EQ(std::vector<std::string>{"enc-a"}, played());

    auto s = p->snapshot();
    ASSERT_EQ(3u, s.queue.size());
    EXPECT_EQ("a", s.queue[0].identifier);
    EXPECT_EQ("b", s.queue[1].identifier);
    EXPECT_EQ("c", s.queue[2].identifier);

    finish("a");
    EXPECT_EQ(1u, current());
    finish("b");
    EXPECT_EQ(2u, current());
}

TEST_F(PlayerTest, FullQueueRejectsWithoutChange)
{
    policy.max_queue_length = 2;
    reset_with(policy);
    enqueue({"a", "b"});

    EXPECT_EQ(status::queue_full, p->enqueue(make_track("c")));
    auto s = p->snapshot();
    EXPECT_EQ(2u, s.queue.size());
    EXPECT_EQ(0u, *s.current);
    EXPECT_EQ(player_state::playing, s.state);
    EXPECT_EQ(1u, rig.socket.sent.size());
}

TEST_F(PlayerTest, PlaylistEnqueueIsAllOrNothing)
{
    policy.max_queue_length = 3;
    reset_with(policy);
    enqueue({"a"});

    EXPECT_EQ(status::queue_full, p->enqueue_all({make_track("b"), make_track("c"), make_track("d")}));
    EXPECT_EQ(1u, p->snapshot().queue.size());

    EXPECT_EQ(status::no_matches, p->enqueue_all({}));
    EXPECT_EQ(status::ok, p->enqueue_all({make_track("b"), make_track("c")}));
    EXPECT_EQ(3u, p->snapshot().queue.size());
    EXPECT_EQ(0u, current());
}

TEST_F(PlayerTest, PlaylistStartsAtSelectedTrackWhenIdle)
{
    EXPECT_EQ(status::ok, p->enqueue_all({make_track("x"), make_track("y"), make_track("z")}, 1));
    EXPECT_EQ(1u, current());
    EXPECT_EQ(std::vector<std::string>{"enc-y"}, played());
}

// ---------- loop modes ----------

TEST_F(PlayerTest, NoLoopGoesIdleAfterLastTrack)
{
    enqueue({"a", "b", "c"});
    finish("a");
    finish("b");
    finish("c");

    EXPECT_EQ(player_state::idle, p->state());
    EXPECT_FALSE(p->snapshot().current.has_value());
    EXPECT_EQ((std::vector<std::string>{"enc-a", "enc-b", "enc-c"}), played());
    EXPECT_EQ(1u, count(notification::kind::queue_empty));

    // natural end: nothing more is sent
    EXPECT_EQ(3u, rig.socket.sent.size());
}

TEST_F(PlayerTest, TrackLoopReplaysSameIndex)
{
    EXPECT_EQ(status::ok, p->set_loop_mode(loop_mode::track));
    enqueue({"a", "b"});
    finish("a");
    finish("a");

    EXPECT_EQ(0u, current());
    EXPECT_EQ((std::vector<std::string>{"enc-a", "enc-a", "enc-a"}), played());
}

TEST_F(PlayerTest, SkipInTrackLoopMovesOn)
{
    p->set_loop_mode(loop_mode::track);
    enqueue({"a", "b"});
    EXPECT_EQ(status::ok, p->skip());
    EXPECT_EQ(1u, current());

    // last track: a skip in track mode ends the queue
    EXPECT_EQ(status::ok, p->skip());
    EXPECT_EQ(player_state::idle, p->state());
    EXPECT_EQ("stop", rig.socket.ops().back());
}

TEST_F(PlayerTest, QueueLoopWraps)
{
    p->set_loop_mode(loop_mode::queue);
    enqueue({"a", "b"});
    finish("a");
    EXPECT_EQ(1u, current());
    finish("b");
    EXPECT_EQ(0u, current());
    EXPECT_EQ(player_state::playing, p->state());
    EXPECT_EQ((std::vector<std::string>{"enc-a", "enc-b", "enc-a"}), played());
}

TEST_F(PlayerTest, RandomLoopWithOneTrackRepeatsIt)
{
    p->set_loop_mode(loop_mode::random);
    enqueue({"a"});
    finish("a");
    finish("a");

    EXPECT_EQ(player_state::playing, p->state());
    EXPECT_EQ(0u, current());
    EXPECT_EQ((std::vector<std::string>{"enc-a", "enc-a", "enc-a"}), played());
}

TEST_F(PlayerTest, RandomLoopNeverRepeatsWithSeveralTracks)
{
    p->set_loop_mode(loop_mode::random);
    enqueue({"a", "b", "c"});

    std::size_t previous = current();
    for (int i = 0; i < 30; ++i) {
        const auto id = p->snapshot().queue[previous].identifier;
        finish(id);
        const std::size_t now = current();
        ASSERT_LT(now, 3u);
        EXPECT_NE(previous, now);
        previous = now;
    }
    EXPECT_EQ(player_state::playing, p->state());
}

// ---------- events ----------

TEST_F(PlayerTest, StaleEndEventsAreIgnored)
{
    enqueue({"a", "b"});
    finish("b");
    EXPECT_EQ(0u, current());
    EXPECT_EQ(1u, rig.socket.sent.size());
}

TEST_F(PlayerTest, StopReplaceAndCleanupDoNotAdvance)
{
    enqueue({"a", "b"});
    p->on_event(track_end{"enc-a", end_reason::stopped});
    p->on_event(track_end{"enc-a", end_reason::replaced});
    p->on_event(track_end{"enc-a", end_reason::cleanup});
    EXPECT_EQ(0u, current());
    EXPECT_EQ(player_state::playing, p->state());
}

TEST_F(PlayerTest, UnknownEndReasonDoesNotAdvance)
{
    enqueue({"a", "b"});
    p->on_event(track_end{"enc-a", end_reason::unknown});
    EXPECT_EQ(0u, current());
    EXPECT_EQ(player_state::playing, p->state());
    EXPECT_EQ(std::vector<std::string>{"enc-a"}, played());

    finish("a");
    EXPECT_EQ(1u, current());
}

TEST_F(PlayerTest, TrackStartAnnouncesCurrentTrack)
{
    enqueue({"a"});
    p->on_event(track_start{"enc-a"});
    ASSERT_EQ(1u, count(notification::kind::now_playing));
    EXPECT_EQ("a", notes.back().track->identifier);

    p->on_event(track_start{"enc-other"});
    EXPECT_EQ(1u, count(notification::kind::now_playing));
}

TEST_F(PlayerTest, LoadFailureAdvances)
{
    enqueue({"a", "b"});
    p->on_event(track_end{"enc-a", end_reason::load_failed});
    EXPECT_EQ(1u, current());
    EXPECT_EQ(0u, count(notification::kind::track_failed));
}

TEST_F(PlayerTest, FailureCeilingStopsOnce)
{
    // ceiling 3
    enqueue({"1", "2", "3", "4", "5"});
    for (const char* id : {"1", "2", "3", "4", "5"}) {
        p->on_event(track_exception{std::string("enc-") + id, "boom", "fault", ""});
    }

    EXPECT_EQ(1u, count(notification::kind::track_failed));
    EXPECT_EQ(player_state::idle, p->state());
    EXPECT_EQ((std::vector<std::string>{"enc-1", "enc-2", "enc-3"}), played());
    EXPECT_EQ("stop", rig.socket.ops().back());
}

TEST_F(PlayerTest, StuckTracksCountAsFailures)
{
    policy.auto_skip_ceiling = 2;
    reset_with(policy);
    enqueue({"a", "b", "c"});
    p->on_event(track_stuck{"enc-a", 10000});
    EXPECT_EQ(1u, current());
    p->on_event(track_stuck{"enc-b", 10000});
    EXPECT_EQ(player_state::idle, p->state());
    EXPECT_EQ(1u, count(notification::kind::track_failed));
}

TEST_F(PlayerTest, FinishedTrackResetsFailureCount)
{
    policy.auto_skip_ceiling = 2;
    reset_with(policy);
    enqueue({"a", "b", "c", "d"});

    p->on_event(track_exception{"enc-a", "boom", "common", ""});
    finish("b");
    p->on_event(track_exception{"enc-c", "boom", "common", ""});

    EXPECT_EQ(3u, current());
    EXPECT_EQ(player_state::playing, p->state());
    EXPECT_EQ(0u, count(notification::kind::track_failed));
}

TEST_F(PlayerTest, FailureCountStartsOverAfterQueueEnds)
{
    // ceiling 3
    enqueue({"a", "b"});
    p->on_event(track_exception{"enc-a", "boom", "common", ""});
    p->on_event(track_exception{"enc-b", "boom", "common", ""});
    EXPECT_EQ(player_state::idle, p->state());
    EXPECT_EQ(1u, count(notification::kind::queue_empty));

    enqueue({"c"});
    EXPECT_EQ(2u, current());
    p->on_event(track_exception{"enc-c", "boom", "common", ""});

    EXPECT_EQ(player_state::idle, p->state());
    EXPECT_EQ(0u, count(notification::kind::track_failed));
    EXPECT_EQ(2u, count(notification::kind::queue_empty));
}

TEST_F(PlayerTest, TrailingEndOfFailureIsAbsorbed)
{
    enqueue({"a", "b", "c"});
    // events without a track blob cannot be told apart by track
    p->on_event(track_exception{"", "boom", "common", ""});
    EXPECT_EQ(1u, current());
    p->on_event(track_end{"", end_reason::load_failed});
    EXPECT_EQ(1u, current());
    p->on_event(track_end{"", end_reason::finished});
    EXPECT_EQ(2u, current());
}

TEST_F(PlayerTest, PlayerUpdatesTrackPositionAndVoiceLink)
{
    enqueue({"a"});
    player_update_message u;
    u.guild_id    = guild;
    u.position_ms = 42000;
    u.connected   = true;
    p->on_player_update(u);

    auto s = p->snapshot();
    EXPECT_EQ(42000, s.position_ms);
    EXPECT_TRUE(s.voice_connected);

    p->on_event(connection_closed{4014, "Disconnected", true});
    EXPECT_FALSE(p->snapshot().voice_connected);
    EXPECT_EQ(player_state::playing, p->state());
}

// ---------- commands ----------

TEST_F(PlayerTest, PauseAndResumeKeepPosition)
{
    enqueue({"a"});
    player_update_message u;
    u.position_ms = 42000;
    p->on_player_update(u);

    EXPECT_EQ(status::ok, p->pause());
    EXPECT_EQ(player_state::paused, p->state());
    EXPECT_EQ(status::ok, p->pause());  // already paused
    EXPECT_EQ(42000, p->snapshot().position_ms);

    EXPECT_EQ(status::ok, p->resume());
    EXPECT_EQ(player_state::playing, p->state());
    EXPECT_EQ(status::ok, p->resume());
    EXPECT_EQ(42000, p->snapshot().position_ms);

    auto frames = rig.socket.frames();
    ASSERT_EQ(3u, frames.size());
    EXPECT_EQ("pause", frames[1]["op"]);
    EXPECT_EQ(true, frames[1]["state"]);
    EXPECT_EQ("pause", frames[2]["op"]);
    EXPECT_EQ(false, frames[2]["state"]);
}

TEST_F(PlayerTest, CommandsNeedAnActiveTrack)
{
    EXPECT_EQ(status::not_active, p->pause());
    EXPECT_EQ(status::not_active, p->resume());
    EXPECT_EQ(status::not_active, p->skip());
    EXPECT_EQ(status::not_active, p->previous());
    EXPECT_EQ(status::not_active, p->seek(1000));
    EXPECT_TRUE(rig.socket.sent.empty());
}

TEST_F(PlayerTest, PreviousStopsAtFirstTrack)
{
    enqueue({"a", "b"});
    EXPECT_EQ(status::at_boundary, p->previous());
    EXPECT_EQ(0u, current());
    EXPECT_EQ(1u, rig.socket.sent.size());

    p->skip();
    EXPECT_EQ(status::ok, p->previous());
    EXPECT_EQ(0u, current());
    EXPECT_EQ((std::vector<std::string>{"enc-a", "enc-b", "enc-a"}), played());
}

TEST_F(PlayerTest, SkipWhilePausedPlaysNextTrack)
{
    enqueue({"a", "b"});
    p->pause();
    p->skip();
    EXPECT_EQ(player_state::playing, p->state());
    EXPECT_FALSE(rig.socket.frames().back().contains("pause"));
}

TEST_F(PlayerTest, SeekIsClampedToTrack)
{
    enqueue({"a"});
    EXPECT_EQ(status::ok, p->seek(500000));
    EXPECT_EQ(180000, p->snapshot().position_ms);
    EXPECT_EQ(status::ok, p->seek(-20));
    EXPECT_EQ(0, p->snapshot().position_ms);

    auto frames = rig.socket.frames();
    ASSERT_EQ(3u, frames.size());
    EXPECT_EQ("seek", frames[1]["op"]);
    EXPECT_EQ(180000, frames[1]["positionMs"]);
    EXPECT_EQ(0, frames[2]["positionMs"]);
}

TEST_F(PlayerTest, StreamsCannotSeek)
{
    auto live = make_track("radio", 0);
    live.is_stream   = true;
    live.is_seekable = false;
    ASSERT_EQ(status::ok, p->enqueue(live));
    EXPECT_EQ(status::command_rejected, p->seek(1000));
}

TEST_F(PlayerTest, VolumeIsClamped)
{
    EXPECT_EQ(status::ok, p->set_volume(5000));
    EXPECT_EQ(1000, p->snapshot().volume);
    EXPECT_TRUE(rig.socket.sent.empty());  // idle: stored for the next play

    enqueue({"a"});
    EXPECT_EQ(1000, rig.socket.frames()[0]["volume"]);

    EXPECT_EQ(status::ok, p->set_volume(-3));
    EXPECT_EQ(0, p->snapshot().volume);
    EXPECT_EQ("volume", rig.socket.ops().back());
    EXPECT_EQ(0, rig.socket.frames().back()["volume"]);
}

// ---------- voice sessions and node loss ----------

TEST_F(PlayerTest, PlayWaitsForVoiceSession)
{
    p = make_player(policy);
    enqueue({"a"});
    EXPECT_EQ(player_state::playing, p->state());
    EXPECT_TRUE(rig.socket.sent.empty());

    p->update_voice_session(make_session(guild));
    EXPECT_EQ((std::vector<std::string>{"voiceUpdate", "play"}), rig.socket.ops());
}

TEST_F(PlayerTest, NewVoiceSessionReplacesOldOne)
{
    p->update_voice_session(make_session(guild, "token-2"));
    auto frames = rig.socket.frames();
    ASSERT_EQ(1u, frames.size());
    EXPECT_EQ("voiceUpdate", frames[0]["op"]);
    EXPECT_EQ("token-2", frames[0]["event"]["token"]);
    EXPECT_EQ("voice-session", frames[0]["sessionId"]);
}

TEST_F(PlayerTest, StalledPlayerSendsNothing)
{
    enqueue({"a"});
    rig.socket.clear_sent();

    p->mark_stalled();
    EXPECT_EQ(player_state::stalled, p->state());
    EXPECT_EQ(1u, count(notification::kind::player_stalled));

    EXPECT_EQ(status::stalled, p->skip());
    EXPECT_EQ(status::stalled, p->pause());
    EXPECT_EQ(status::ok, p->enqueue(make_track("b")));
    p->on_event(track_end{"enc-a", end_reason::finished});
    p->update_voice_session(make_session(guild, "token-2"));
    p->resync();

    EXPECT_TRUE(rig.socket.sent.empty());
    EXPECT_EQ(2u, p->snapshot().queue.size());
}

TEST_F(PlayerTest, RebindReplaysCurrentTrackAtPosition)
{
    enqueue({"a", "b"});
    player_update_message u;
    u.position_ms = 30000;
    p->on_player_update(u);
    p->mark_stalled();
    rig.socket.clear_sent();

    auto moved = make_track("a");
    moved.encoded = "enc-a-elsewhere";
    p->rebind(rig.node, moved);

    EXPECT_EQ(player_state::playing, p->state());
    auto frames = rig.socket.frames();
    ASSERT_EQ(2u, frames.size());
    EXPECT_EQ("voiceUpdate", frames[0]["op"]);
    EXPECT_EQ("play", frames[1]["op"]);
    EXPECT_EQ("enc-a-elsewhere", frames[1]["track"]);
    EXPECT_EQ(30000, frames[1]["startTimeMs"]);
    EXPECT_EQ(2u, p->snapshot().queue.size());
}

TEST_F(PlayerTest, RebindOfIdlePlayerOnlyUpdatesVoice)
{
    p->mark_stalled();
    p->rebind(rig.node);
    EXPECT_EQ(player_state::idle, p->state());
    EXPECT_EQ(std::vector<std::string>{"voiceUpdate"}, rig.socket.ops());
}

TEST_F(PlayerTest, ResyncReissuesVoiceUpdate)
{
    enqueue({"a"});
    rig.socket.clear_sent();
    p->resync();
    EXPECT_EQ(std::vector<std::string>{"voiceUpdate"}, rig.socket.ops());
}

TEST_F(PlayerTest, PauseAndVolumeDuringReconnectAreReplayed)
{
    enqueue({"a"});
    drop_node();
    EXPECT_EQ(status::ok, p->pause());
    EXPECT_EQ(status::ok, p->set_volume(40));
    EXPECT_EQ(player_state::paused, p->state());

    resume_node();
    p->resync();

    auto frames = rig.socket.frames();
    ASSERT_EQ(3u, frames.size());
    EXPECT_EQ("voiceUpdate", frames[0]["op"]);
    EXPECT_EQ("pause", frames[1]["op"]);
    EXPECT_EQ(true, frames[1]["state"]);
    EXPECT_EQ("volume", frames[2]["op"]);
    EXPECT_EQ(40, frames[2]["volume"]);

    // replayed once only
    rig.socket.clear_sent();
    p->resync();
    EXPECT_EQ(std::vector<std::string>{"voiceUpdate"}, rig.socket.ops());
}

TEST_F(PlayerTest, SeekDuringReconnectIsReplayed)
{
    enqueue({"a"});
    drop_node();
    EXPECT_EQ(status::ok, p->seek(60000));

    resume_node();
    p->resync();

    auto frames = rig.socket.frames();
    ASSERT_EQ(2u, frames.size());
    EXPECT_EQ("seek", frames[1]["op"]);
    EXPECT_EQ(60000, frames[1]["positionMs"]);
}

TEST_F(PlayerTest, QueueEndDuringReconnectStopsOnResync)
{
    enqueue({"a"});
    drop_node();
    EXPECT_EQ(status::ok, p->skip());
    EXPECT_EQ(player_state::idle, p->state());

    resume_node();
    p->resync();
    EXPECT_EQ((std::vector<std::string>{"voiceUpdate", "stop"}), rig.socket.ops());
}

TEST_F(PlayerTest, SkipDuringReconnectPlaysNextOnResync)
{
    enqueue({"a", "b"});
    drop_node();
    EXPECT_EQ(status::ok, p->pause());
    EXPECT_EQ(status::ok, p->skip());

    resume_node();
    p->resync();

    auto frames = rig.socket.frames();
    ASSERT_EQ(2u, frames.size());
    EXPECT_EQ("play", frames[1]["op"]);
    EXPECT_EQ("enc-b", frames[1]["track"]);
    EXPECT_FALSE(frames[1].contains("pause"));
}

TEST_F(PlayerTest, DestroyIsTerminal)
{
    enqueue({"a"});
    rig.socket.clear_sent();

    EXPECT_TRUE(p->destroy("stopped"));
    EXPECT_EQ((std::vector<std::string>{"stop", "destroy"}), rig.socket.ops());
    ASSERT_EQ(1u, count(notification::kind::player_destroyed));
    EXPECT_EQ("stopped", notes.back().message);

    EXPECT_FALSE(p->destroy("again"));
    EXPECT_EQ(status::destroyed, p->enqueue(make_track("b")));
    EXPECT_EQ(status::destroyed, p->set_volume(10));
    p->on_event(track_end{"enc-a", end_reason::finished});
    EXPECT_EQ(2u, rig.socket.sent.size());
    EXPECT_EQ(player_state::destroyed, p->state());
}

TEST_F(PlayerTest, DestroyDuringReconnectRemovesPlayerOnceResumed)
{
    enqueue({"a"});
    drop_node();
    EXPECT_TRUE(p->destroy("left"));
    sched.run_due();
    EXPECT_EQ(0u, rig.http.count("/players/"));

    resume_node();
    ASSERT_EQ(1u, rig.http.count("/players/1001"));
    const auto& removal = rig.http.requests.back();
    EXPECT_EQ(dpp::m_delete, removal.method);
    EXPECT_EQ("http://main.audio.example:2333/v4/sessions/session-1/players/1001", removal.url);
    EXPECT_TRUE(rig.socket.sent.empty());
}

TEST_F(PlayerTest, DestroyAfterSessionExpiredRemovesNothing)
{
    enqueue({"a"});
    drop_node();
    EXPECT_TRUE(p->destroy("left"));

    sched.jump(61s);
    sched.run_due();
    rig.socket.accept();
    rig.socket.receive(cad::test::ready_frame("session-2"));
    sched.run_due();
    EXPECT_EQ(0u, rig.http.count("/players/"));
}
