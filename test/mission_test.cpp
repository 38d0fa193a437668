#include <doctest/doctest.h>

#include <mutex>
#include <vector>

#include <convoy/mission/mission.hpp>

using namespace convoy;
using namespace convoy::mission;

namespace {

    struct Recorder : public Listener {
        void report_stuck(AgentId id) override {
            std::lock_guard<std::mutex> lock(mu);
            stuck.push_back(id);
        }
        void report_escalated(AgentId id, const Incident &) override {
            std::lock_guard<std::mutex> lock(mu);
            escalated.push_back(id);
        }
        void report_abort(const Incident &i) override {
            std::lock_guard<std::mutex> lock(mu);
            aborts.push_back(i);
        }
        void report_status(MissionId, MissionStatus s) override {
            std::lock_guard<std::mutex> lock(mu);
            statuses.push_back(s);
        }

        std::mutex mu;
        std::vector<AgentId> stuck;
        std::vector<AgentId> escalated;
        std::vector<Incident> aborts;
        std::vector<MissionStatus> statuses;
    };

    Formation trio() {
        Formation f;
        f.leader = 1;
        f.followers.push_back(2);
        f.followers.push_back(3);
        f.type = FormationType::Column;
        f.spacing_tolerance = 5.0;
        return f;
    }

    Incident incident(Reason r, AgentId agent) {
        Incident i;
        i.reason = r;
        i.agent = agent;
        return i;
    }

} // namespace

TEST_CASE("mission: roles and participants") {
    Mission m(7, Position{50, 0, 0}, trio(), Config{});
    CHECK(m.id() == 7);
    CHECK(m.status() == MissionStatus::Planning);
    CHECK(m.leader() == 1);
    CHECK(m.role(1) == Role::Lead);
    CHECK(m.role(2) == Role::Support);
    CHECK(m.role(3) == Role::RearGuard);
    CHECK(m.participants().size() == 3);
    CHECK(m.participates(3));
    CHECK_FALSE(m.participates(4));

    m.assign_role(2, Role::Scout);
    CHECK(m.role(2) == Role::Scout);
}

TEST_CASE("mission: status transitions are reported") {
    Recorder rec;
    Mission m(1, Position{50, 0, 0}, trio(), Config{}, &rec);
    CHECK(m.begin());
    CHECK_FALSE(m.begin());
    CHECK(m.status() == MissionStatus::EnRoute);
    REQUIRE(rec.statuses.size() == 1);
    CHECK(rec.statuses[0] == MissionStatus::EnRoute);
}

TEST_CASE("mission: incident policy") {
    Mission m(1, Position{50, 0, 0}, trio(), Config{});
    CHECK(m.decide(incident(Reason::External, 0)) == Decision::Abort);
    CHECK(m.decide(incident(Reason::StuckTimeout, 2)) == Decision::Replan);
    CHECK(m.decide(incident(Reason::HazardCritical, 1)) == Decision::Regroup);
    CHECK(m.decide(incident(Reason::FormationBroken, 1)) == Decision::Regroup);
    CHECK(m.decide(incident(Reason::NoPathFound, 1)) == Decision::Abort);
    CHECK(m.decide(incident(Reason::AgentEscalated, 3)) == Decision::Regroup);

    m.add_reserve(9);
    CHECK(m.decide(incident(Reason::AgentEscalated, 3)) == Decision::Substitute);
    CHECK(m.decide(incident(Reason::NoPathFound, 1)) == Decision::Substitute);

    Formation solo;
    solo.leader = 1;
    Mission alone(2, Position{50, 0, 0}, solo, Config{});
    CHECK(alone.decide(incident(Reason::HazardCritical, 1)) == Decision::Replan);
}

TEST_CASE("mission: regroup waits for every participant") {
    Recorder rec;
    Mission m(1, Position{50, 0, 0}, trio(), Config{}, &rec);
    m.begin();
    CHECK_FALSE(m.report_arrival(1));

    m.report_position(1, dp::Point{4.2, 0.0, -0.3});
    CHECK(m.regroup());
    CHECK(m.status() == MissionStatus::Regrouping);
    REQUIRE(m.regroup_point().has_value());
    CHECK(*m.regroup_point() == Position{4, 0, 0});

    CHECK_FALSE(m.report_arrival(1));
    CHECK_FALSE(m.report_arrival(99));
    CHECK_FALSE(m.report_arrival(2));
    CHECK(m.report_arrival(3));
    CHECK(m.status() == MissionStatus::Planning);
    CHECK(rec.statuses.back() == MissionStatus::Planning);
}

TEST_CASE("mission: regroup quorum can be partial") {
    Config cfg;
    cfg.mission.regroup_quorum = 2;
    Mission m(1, Position{50, 0, 0}, trio(), cfg);
    m.set_regroup_point(Position{0, 0, 0});
    CHECK(m.regroup());
    CHECK_FALSE(m.report_arrival(2));
    CHECK(m.report_arrival(3));
    CHECK(m.status() == MissionStatus::Planning);
}

TEST_CASE("mission: regroup without any known position is refused") {
    Mission m(1, Position{50, 0, 0}, trio(), Config{});
    CHECK_FALSE(m.regroup());
    CHECK(m.status() == MissionStatus::Planning);
}

TEST_CASE("mission: regroup timeout aborts") {
    Recorder rec;
    Config cfg;
    cfg.mission.regroup_timeout_ticks = 3;
    Mission m(1, Position{50, 0, 0}, trio(), cfg, &rec);
    m.set_regroup_point(Position{0, 0, 0});
    REQUIRE(m.regroup());

    for (dp::u64 t = 1; t <= 3; ++t) {
        m.step(t);
        CHECK(m.status() == MissionStatus::Regrouping);
    }
    m.step(4);
    CHECK(m.status() == MissionStatus::Aborted);
    CHECK(m.cancel_token()->cancelled());
    REQUIRE(rec.aborts.size() == 1);
    CHECK(rec.aborts[0].reason == Reason::FormationBroken);
    CHECK(rec.aborts[0].tick == 4);
}

TEST_CASE("mission: a repeated regroup keeps the running timeout and arrivals") {
    Recorder rec;
    Config cfg;
    cfg.mission.regroup_timeout_ticks = 3;
    Mission m(1, Position{50, 0, 0}, trio(), cfg, &rec);
    m.set_regroup_point(Position{0, 0, 0});
    REQUIRE(m.regroup());
    CHECK_FALSE(m.report_arrival(1));
    m.step(1);
    m.step(2);

    const auto notified = rec.statuses.size();
    CHECK(m.regroup());
    CHECK(rec.statuses.size() == notified);
    CHECK_FALSE(m.report_arrival(2));
    m.step(3);
    CHECK(m.status() == MissionStatus::Regrouping);
    m.step(4);
    CHECK(m.status() == MissionStatus::Aborted);
}

TEST_CASE("mission: abort is one-way and cancels every agent") {
    Recorder rec;
    Mission m(1, Position{50, 0, 0}, trio(), Config{}, &rec);
    m.begin();
    auto token = m.cancel_token();
    CHECK_FALSE(token->cancelled());

    CHECK(m.abort(Reason::External, 0, dp::Optional<PathId>(12), "recalled"));
    CHECK(token->cancelled());
    CHECK(m.status() == MissionStatus::Aborted);
    CHECK_FALSE(m.abort(Reason::External, 0, dp::nullopt, "again"));
    CHECK_FALSE(m.begin());
    CHECK_FALSE(m.regroup());

    REQUIRE(rec.aborts.size() == 1);
    REQUIRE(rec.aborts[0].last_good_path.has_value());
    CHECK(*rec.aborts[0].last_good_path == 12);
    CHECK(rec.statuses.back() == MissionStatus::Aborted);

    auto log = m.incidents();
    REQUIRE(log.size() == 1);
    CHECK(log[0].reason == Reason::External);
}

TEST_CASE("mission: escalated follower is substituted from the reserve") {
    Recorder rec;
    Mission m(1, Position{50, 0, 0}, trio(), Config{}, &rec);
    m.add_reserve(9);
    m.begin();

    CHECK(m.raise(incident(Reason::AgentEscalated, 2)) == Decision::Substitute);
    CHECK(m.participates(9));
    CHECK_FALSE(m.participates(2));
    CHECK(m.role(9) == Role::Support);
    CHECK(m.reserves() == 0);
    CHECK(m.status() == MissionStatus::EnRoute);
    REQUIRE(rec.escalated.size() == 1);
    CHECK(rec.escalated[0] == 2);
    CHECK(m.incidents().size() == 1);
}

TEST_CASE("mission: leader with no path and no reserve aborts") {
    Recorder rec;
    Mission m(1, Position{50, 0, 0}, trio(), Config{}, &rec);
    CHECK(m.raise(incident(Reason::NoPathFound, 1)) == Decision::Abort);
    CHECK(m.status() == MissionStatus::Aborted);
    CHECK(m.cancel_token()->cancelled());
    REQUIRE(rec.aborts.size() == 1);
    CHECK(rec.aborts[0].reason == Reason::NoPathFound);
    CHECK(m.incidents().size() == 1);
}

TEST_CASE("mission: completes when the leader arrives with the formation intact") {
    Recorder rec;
    Mission m(1, Position{10, 0, 0}, trio(), Config{}, &rec);
    m.begin();
    for (dp::i32 x = 0; x <= 10; ++x) {
        m.report_position(1, dp::Point{static_cast<dp::f64>(x), 0.0, 0.0});
    }
    m.report_position(2, dp::Point{7.0, 0.0, 0.0});
    m.report_position(3, dp::Point{4.0, 0.0, 0.0});

    m.step(1);
    CHECK(m.status() == MissionStatus::EnRoute);

    m.report_goal(2);
    m.step(2);
    CHECK(m.status() == MissionStatus::EnRoute);

    m.report_goal(1);
    m.step(3);
    CHECK(m.status() == MissionStatus::Complete);
    CHECK(rec.statuses.back() == MissionStatus::Complete);
    CHECK(m.pace() == doctest::Approx(1.0));
}

TEST_CASE("mission: broken formation triggers a regroup") {
    Config cfg;
    cfg.formation.max_throttle_ticks = 2;
    Mission m(1, Position{50, 0, 0}, trio(), cfg);
    m.begin();
    for (dp::i32 x = 0; x <= 10; ++x) {
        m.report_position(1, dp::Point{static_cast<dp::f64>(x), 0.0, 0.0});
    }
    m.report_position(3, dp::Point{-30.0, 0.0, 0.0});

    m.step(1);
    CHECK(m.pace() < 1.0);
    CHECK(m.formation_status().throttled);
    m.step(2);
    CHECK(m.status() == MissionStatus::EnRoute);
    m.step(3);
    CHECK(m.status() == MissionStatus::Regrouping);
    REQUIRE(m.regroup_point().has_value());
    CHECK(*m.regroup_point() == Position{10, 0, 0});

    auto log = m.incidents();
    REQUIRE(log.size() == 1);
    CHECK(log[0].reason == Reason::FormationBroken);
    CHECK(log[0].tick == 3);
}

TEST_CASE("mission: assistance requests") {
    Mission m(1, Position{50, 0, 0}, trio(), Config{});
    CHECK(m.request_assistance(3) == 2);
    REQUIRE(m.assistance_requests().size() == 1);
    m.clear_assistance(3);
    CHECK(m.assistance_requests().empty());

    Recorder rec;
    Mission watched(2, Position{50, 0, 0}, trio(), Config{}, &rec);
    watched.report_stuck(2);
    REQUIRE(rec.stuck.size() == 1);
    CHECK(rec.stuck[0] == 2);
}
