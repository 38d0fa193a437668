#include <doctest/doctest.h>

#include <algorithm>

#include <convoy/mission/formation.hpp>

using namespace convoy;
using namespace convoy::mission;

namespace {

    Formation column(dp::usize followers) {
        Formation f;
        f.leader = 1;
        for (dp::usize i = 0; i < followers; ++i) {
            f.followers.push_back(static_cast<AgentId>(10 + i));
        }
        f.type = FormationType::Column;
        f.spacing_tolerance = 5.0;
        return f;
    }

    void drive_leader(FormationController &fc, dp::i32 from, dp::i32 to) {
        for (dp::i32 x = from; x <= to; ++x) {
            fc.publish_leader(dp::Point{static_cast<dp::f64>(x), 0.0, 0.0});
        }
    }

} // namespace

TEST_CASE("formation: column slots sit on the leader's trail") {
    FormationController fc(column(2), FormationConfig{});
    drive_leader(fc, 0, 20);

    auto s0 = fc.slot(10);
    auto s1 = fc.slot(11);
    REQUIRE(s0.has_value());
    REQUIRE(s1.has_value());
    CHECK(s0->x == doctest::Approx(17.0));
    CHECK(s1->x == doctest::Approx(14.0));
    CHECK_FALSE(fc.slot(99).has_value());

    fc.report(10, dp::Point{17.0, 0.0, 0.0});
    fc.report(11, dp::Point{14.0, 0.0, 1.0});
    CHECK(fc.deviation(10) == doctest::Approx(0.0));
    CHECK(fc.deviation(11) == doctest::Approx(1.0));
    CHECK(fc.cohesive());
}

TEST_CASE("formation: line and wedge offsets") {
    Formation f = column(3);
    f.type = FormationType::Line;
    FormationController line(f, FormationConfig{});
    CHECK(line.offset(0).lateral == doctest::Approx(-3.0));
    CHECK(line.offset(1).lateral == doctest::Approx(0.0));
    CHECK(line.offset(2).lateral == doctest::Approx(3.0));
    CHECK(line.offset(2).back == doctest::Approx(3.0));

    f.type = FormationType::Wedge;
    FormationController wedge(f, FormationConfig{});
    CHECK(wedge.offset(0).back == doctest::Approx(3.0));
    CHECK(wedge.offset(0).lateral == doctest::Approx(3.0));
    CHECK(wedge.offset(1).lateral == doctest::Approx(-3.0));
    CHECK(wedge.offset(2).back == doctest::Approx(6.0));

    drive_leader(wedge, 0, 20);
    auto right = wedge.slot(10);
    REQUIRE(right.has_value());
    CHECK(right->x == doctest::Approx(17.0));
    CHECK(right->z == doctest::Approx(3.0));
}

TEST_CASE("formation: circle slots ring the leader") {
    Formation f = column(4);
    f.type = FormationType::Circle;
    FormationController fc(f, FormationConfig{});
    drive_leader(fc, 0, 5);
    for (AgentId id = 10; id < 14; ++id) {
        auto s = fc.slot(id);
        REQUIRE(s.has_value());
        CHECK(separation(*s, dp::Point{5.0, 0.0, 0.0}) == doctest::Approx(3.0));
    }
}

TEST_CASE("formation: drifting follower throttles the leader until it closes up") {
    FormationController fc(column(1), FormationConfig{});
    dp::f64 leader_x = 20.0;
    dp::f64 follower_x = 11.0;
    drive_leader(fc, 0, 20);
    fc.report(10, dp::Point{follower_x, 0.0, 0.0});
    CHECK(fc.deviation(10) == doctest::Approx(6.0));

    const auto &first = fc.update();
    CHECK(first.throttled);
    CHECK(first.pace < 1.0);

    int ticks = 0;
    while (fc.deviation(10) > fc.tolerance() && ticks < 50) {
        ++ticks;
        leader_x += fc.pace();
        fc.publish_leader(dp::Point{leader_x, 0.0, 0.0});
        const auto target = *fc.slot(10);
        follower_x += std::min(1.0, std::max(0.0, target.x - follower_x));
        fc.report(10, dp::Point{follower_x, 0.0, 0.0});
        fc.update();
    }

    CHECK(fc.deviation(10) <= fc.tolerance());
    CHECK(ticks < 10);
    CHECK_FALSE(fc.status().broken);

    const dp::f64 throttled = fc.pace();
    fc.update();
    CHECK(fc.pace() > throttled);
    CHECK_FALSE(fc.status().throttled);
}

TEST_CASE("formation: throttling beyond the bound breaks the formation") {
    FormationConfig cfg;
    cfg.max_throttle_ticks = 5;
    FormationController fc(column(1), cfg);
    drive_leader(fc, 0, 20);
    fc.report(10, dp::Point{-20.0, 0.0, 0.0});

    for (int t = 0; t < 5; ++t) {
        CHECK_FALSE(fc.update().broken);
    }
    CHECK(fc.update().broken);
    CHECK(fc.pace() == doctest::Approx(cfg.min_pace));

    fc.reset();
    CHECK_FALSE(fc.status().broken);
    CHECK(fc.pace() == doctest::Approx(1.0));
}

TEST_CASE("formation: replacing a member keeps its slot") {
    FormationController fc(column(2), FormationConfig{});
    CHECK(fc.replace(11, 42));
    REQUIRE(fc.index_of(42).has_value());
    CHECK(*fc.index_of(42) == 1);
    CHECK_FALSE(fc.index_of(11).has_value());
    CHECK(fc.replace(1, 7));
    CHECK(fc.formation().leader == 7);
    CHECK_FALSE(fc.replace(99, 100));
}
