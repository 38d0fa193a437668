#include <doctest/doctest.h>

#include <convoy/terrain.hpp>

using namespace convoy;

TEST_CASE("terrain: base speeds on plain ground") {
    const auto ground = TerrainSample::of(Surface::Solid);

    auto walk = terrain::cost(ground, MovementMode::Walk);
    CHECK(walk.passable());
    CHECK(walk.speed == doctest::Approx(4.317));
    CHECK(walk.risk == doctest::Approx(0.0));

    auto sprint = terrain::cost(ground, MovementMode::Sprint);
    CHECK(sprint.speed == doctest::Approx(5.612));

    CHECK_FALSE(terrain::cost(ground, MovementMode::SwimSurface).passable());
    CHECK_FALSE(terrain::cost(TerrainSample::of(Surface::Obstruction), MovementMode::Walk).passable());
}

TEST_CASE("terrain: factors are clamped") {
    auto fast = terrain::cost(TerrainSample::of(Surface::Solid, 5.0), MovementMode::Walk);
    CHECK(fast.speed == doctest::Approx(4.317 * terrain::kMaxSpeedFactor));

    auto slow = terrain::cost(TerrainSample::of(Surface::Solid, 0.01), MovementMode::Walk);
    CHECK(slow.speed == doctest::Approx(4.317 * terrain::kMinSpeedFactor));

    CHECK(terrain::speed_ceiling() == doctest::Approx(11.0 * terrain::kMaxSpeedFactor));
}

TEST_CASE("terrain: risk grows with tags and slip") {
    auto icy = terrain::cost(TerrainSample::of(Surface::Solid, 1.5, tags::Slippery), MovementMode::Walk);
    CHECK(icy.risk == doctest::Approx(0.25 + 0.5 * 0.5));

    auto burning = TerrainSample::of(Surface::Liquid, 1.0, tags::LiquidDamage);
    CHECK_FALSE(terrain::cost(burning, MovementMode::SwimSurface).passable());
}

TEST_CASE("terrain: best mode picks the fastest capability") {
    const auto ground = TerrainSample::of(Surface::Solid);

    auto m = terrain::best_mode(ground, Capabilities::of({MovementMode::Walk, MovementMode::Sprint}));
    REQUIRE(m.has_value());
    CHECK(*m == MovementMode::Sprint);

    auto walker = terrain::best_mode(ground, Capabilities::of({MovementMode::Walk}));
    REQUIRE(walker.has_value());
    CHECK(*walker == MovementMode::Walk);

    auto water = TerrainSample::of(Surface::Liquid);
    CHECK_FALSE(terrain::best_mode(water, Capabilities::of({MovementMode::Walk})).has_value());
    auto swimmer = terrain::best_mode(water, Capabilities::of({MovementMode::Walk, MovementMode::SwimSubmerged}));
    REQUIRE(swimmer.has_value());
    CHECK(*swimmer == MovementMode::SwimSubmerged);
}

TEST_CASE("terrain: cost is deterministic") {
    const auto s = TerrainSample::of(Surface::Climbable, 0.7, tags::FallRisk);
    auto a = terrain::cost(s, MovementMode::Climb);
    auto b = terrain::cost(s, MovementMode::Climb);
    CHECK(a.speed == b.speed);
    CHECK(a.risk == b.risk);
}
