#include <doctest/doctest.h>

#include <vector>

#include <convoy/stuck.hpp>

using namespace convoy;

namespace {

    const dp::Point kWall{3.0, 0.0, 0.0};

} // namespace

TEST_CASE("stuck: stationary agent with a command is stuck at the threshold") {
    StuckMonitor m;
    for (int t = 1; t <= 4; ++t) {
        CHECK_FALSE(m.tick(kWall, true).has_value());
        CHECK(m.state() == StuckState::Moving);
    }

    CHECK_FALSE(m.tick(kWall, true).has_value());
    CHECK(m.state() == StuckState::Stuck);
    REQUIRE(m.stuck_since().has_value());
    CHECK(*m.stuck_since() == 5);
    CHECK(m.stats().detections == 1);

    auto first = m.tick(kWall, true);
    REQUIRE(first.has_value());
    CHECK(m.ticks() == 6);
    CHECK(first->kind == RecoveryKind::Retreat);
    CHECK(first->attempt == 1);
    CHECK(first->cells == m.config().retreat_cells);
    CHECK(m.state() == StuckState::Recovering);
}

TEST_CASE("stuck: progress or no command keeps the agent out of Stuck") {
    SUBCASE("moving") {
        StuckMonitor m;
        for (int t = 0; t < 50; ++t) {
            m.tick(dp::Point{t * 0.1, 0.0, 0.0}, true);
        }
        CHECK(m.state() == StuckState::Moving);
        CHECK(m.stats().detections == 0);
    }
    SUBCASE("idle") {
        StuckMonitor m;
        for (int t = 0; t < 50; ++t) {
            m.tick(kWall, false);
        }
        CHECK(m.state() == StuckState::Idle);
        CHECK(m.idle_ticks() == 0);
    }
    SUBCASE("drift below epsilon counts as no progress") {
        StuckMonitor m;
        for (int t = 0; t < 5; ++t) {
            m.tick(dp::Point{t * 0.001, 0.0, 0.0}, true);
        }
        CHECK(m.state() == StuckState::Stuck);
    }
}

TEST_CASE("stuck: ladder runs in order and then escalates") {
    StuckConfig cfg;
    cfg.attempt_ticks = 3;
    StuckMonitor m(cfg);

    std::vector<RecoveryKind> seen;
    for (int t = 0; t < 200 && !m.terminal(); ++t) {
        auto a = m.tick(kWall, true);
        if (a.has_value()) {
            seen.push_back(a->kind);
        }
    }

    REQUIRE(seen.size() == 4);
    CHECK(seen[0] == RecoveryKind::Retreat);
    CHECK(seen[1] == RecoveryKind::VerticalBypass);
    CHECK(seen[2] == RecoveryKind::Replan);
    CHECK(seen[3] == RecoveryKind::RequestAssistance);
    CHECK(m.state() == StuckState::Escalated);
    CHECK(m.stats().attempts == 4);
    CHECK(m.stats().escalations == 1);
    CHECK_FALSE(m.tick(kWall, true).has_value());
}

TEST_CASE("stuck: each ladder step gets its attempt window") {
    StuckConfig cfg;
    cfg.attempt_ticks = 10;
    StuckMonitor m(cfg);
    for (int t = 0; t < 6; ++t) {
        m.tick(kWall, true);
    }
    REQUIRE(m.current_step().has_value());
    CHECK(*m.current_step() == RecoveryKind::Retreat);

    for (int t = 0; t < 9; ++t) {
        CHECK_FALSE(m.tick(kWall, true).has_value());
    }
    auto next = m.tick(kWall, true);
    REQUIRE(next.has_value());
    CHECK(next->kind == RecoveryKind::VerticalBypass);
    CHECK(next->cells == cfg.bypass_height);
}

TEST_CASE("stuck: failed step moves down the ladder on the next tick") {
    StuckMonitor m;
    for (int t = 0; t < 6; ++t) {
        m.tick(kWall, true);
    }
    m.attempt_failed();
    CHECK(m.state() == StuckState::Stuck);
    auto a = m.tick(kWall, true);
    REQUIRE(a.has_value());
    CHECK(a->kind == RecoveryKind::VerticalBypass);
}

TEST_CASE("stuck: total attempts are bounded across the ladder") {
    StuckConfig cfg;
    cfg.max_total_attempts = 2;
    StuckMonitor m(cfg);
    for (int t = 0; t < 6; ++t) {
        m.tick(kWall, true);
    }
    m.attempt_failed();
    CHECK(m.tick(kWall, true).has_value());
    m.attempt_failed();
    CHECK_FALSE(m.tick(kWall, true).has_value());
    CHECK(m.state() == StuckState::Escalated);
    CHECK(m.total_attempts() == 2);
}

TEST_CASE("stuck: advancing along the route closes the episode and alternates retreat side") {
    StuckMonitor m;
    for (int t = 0; t < 5; ++t) {
        m.tick(kWall, true);
    }
    auto first = m.tick(kWall, true);
    REQUIRE(first.has_value());
    CHECK(first->angle_deg == doctest::Approx(m.config().retreat_angle_deg));
    CHECK(m.in_episode());

    // Moving the body is not a recovery by itself.
    m.tick(dp::Point{2.0, 0.0, 0.0}, true);
    CHECK(m.state() == StuckState::Recovering);
    CHECK(m.stats().successes == 0);

    m.progressed();
    CHECK(m.state() == StuckState::Moving);
    CHECK_FALSE(m.in_episode());
    CHECK(m.stats().successes == 1);
    CHECK(m.stats().success_rate() == doctest::Approx(1.0));
    CHECK_FALSE(m.stuck_since().has_value());

    const dp::Point wedged{2.0, 0.0, 0.0};
    for (int t = 0; t < 5; ++t) {
        m.tick(wedged, true);
    }
    CHECK(m.state() == StuckState::Stuck);
    auto second = m.tick(wedged, true);
    REQUIRE(second.has_value());
    CHECK(second->kind == RecoveryKind::Retreat);
    CHECK(second->angle_deg == doctest::Approx(-m.config().retreat_angle_deg));
}

TEST_CASE("stuck: a body that backs away but never advances still climbs the whole ladder") {
    StuckConfig cfg;
    cfg.attempt_ticks = 3;
    StuckMonitor m(cfg);

    dp::Point body = kWall;
    std::vector<RecoveryKind> seen;
    for (int t = 0; t < 500 && !m.terminal(); ++t) {
        auto a = m.tick(body, true);
        if (a.has_value()) {
            seen.push_back(a->kind);
        }
        // Retreat and bypass move the body, route steps leave it wedged.
        const auto step = m.current_step();
        if (m.state() == StuckState::Recovering && step.has_value() &&
            (*step == RecoveryKind::Retreat || *step == RecoveryKind::VerticalBypass)) {
            body.x -= 0.2;
        }
    }

    REQUIRE(seen.size() == 4);
    CHECK(seen[0] == RecoveryKind::Retreat);
    CHECK(seen[1] == RecoveryKind::VerticalBypass);
    CHECK(seen[2] == RecoveryKind::Replan);
    CHECK(seen[3] == RecoveryKind::RequestAssistance);
    CHECK(m.state() == StuckState::Escalated);
    CHECK(m.stats().successes == 0);
    CHECK(m.stats().attempts == 4);
    CHECK(m.stats().detections == 3);
}

TEST_CASE("stuck: progress without an open episode changes nothing") {
    StuckMonitor m;
    m.tick(kWall, true);
    m.progressed();
    CHECK(m.state() == StuckState::Moving);
    CHECK(m.stats().successes == 0);
}

TEST_CASE("stuck: abort and reset") {
    StuckMonitor m;
    m.mark_path_stuck();
    CHECK(m.state() == StuckState::Stuck);
    m.abort();
    CHECK(m.state() == StuckState::Aborted);
    CHECK(m.terminal());
    CHECK_FALSE(m.tick(kWall, true).has_value());

    m.reset(kWall);
    CHECK(m.state() == StuckState::Idle);
    CHECK(m.total_attempts() == 0);
    CHECK(m.stats().detections == 1);
}
