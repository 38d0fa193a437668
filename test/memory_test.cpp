#include <doctest/doctest.h>

#include <atomic>
#include <thread>
#include <vector>

#include <convoy/memory.hpp>
#include <convoy/planner/route_planner.hpp>
#include <convoy/world/grid_world.hpp>

using namespace convoy;

namespace {

    Path route(dp::i32 length, MovementMode mode = MovementMode::Walk) {
        Path p;
        p.origin = Position{0, 0, 0};
        p.destination = Position{length, 0, 0};
        for (dp::i32 x = 0; x <= length; ++x) {
            Waypoint w;
            w.position = Position{x, 0, 0};
            w.mode = mode;
            w.edge = x == 0 ? EdgeKind::Start : EdgeKind::Step;
            p.waypoints.push_back(w);
        }
        p.mode_sequence.push_back(mode);
        p.time_estimate = static_cast<dp::f64>(length) / terrain::base_speed(mode);
        return p;
    }

} // namespace

TEST_CASE("memory: record and look up") {
    PathMemoryStore store;
    const auto id = store.record(route(10));
    CHECK(id != kInvalidPath);

    auto found = store.find(id);
    REQUIRE(found);
    CHECK(found->status == PathStatus::Fresh);
    CHECK(found->confidence_rating == doctest::Approx(store.config().initial_rating));
    CHECK(found->origin_region == Region::of(Position{0, 0, 0}, store.config().region_size));

    auto hits = store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::of({MovementMode::Walk}));
    REQUIRE(hits.size() == 1);
    CHECK(hits[0]->id == id);
    CHECK(store.stats().hits == 1);

    auto other = store.lookup(Position{0, 0, 0}, Position{100, 0, 0}, Capabilities::of({MovementMode::Walk}));
    CHECK(other.empty());
    CHECK(store.stats().misses == 1);
}

TEST_CASE("memory: lookup honours capabilities") {
    PathMemoryStore store;
    store.record(route(10, MovementMode::SwimSurface));
    CHECK(store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::of({MovementMode::Walk})).empty());
    CHECK(store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::all()).size() == 1);
}

TEST_CASE("memory: ratings follow traversal outcomes") {
    PathMemoryStore store;
    const auto id = store.record(route(10));
    const auto before = store.find(id);

    TraversalOutcome ok;
    CHECK(store.report_traversal(id, ok));
    auto after = store.find(id);
    CHECK(after->confidence_rating == doctest::Approx(0.5 + 0.25 * 0.5));
    CHECK(after->validated_through == after->waypoints.size());

    // Readers holding the old snapshot keep seeing it unchanged.
    CHECK(before->confidence_rating == doctest::Approx(0.5));
    CHECK(before->validated_through == 0);
}

TEST_CASE("memory: failures on unproven ground decay, then deprecate at the floor") {
    PathMemoryStore store;
    const auto id = store.record(route(10));

    TraversalOutcome bad;
    bad.success = false;
    bad.failed_at = 3;
    CHECK(store.report_traversal(id, bad));
    CHECK(store.find(id)->confidence_rating == doctest::Approx(0.375));
    CHECK(store.find(id)->status == PathStatus::Fresh);

    store.report_traversal(id, bad);
    store.report_traversal(id, bad);
    CHECK(store.find(id)->status == PathStatus::Fresh);
    store.report_traversal(id, bad);
    CHECK(store.find(id)->status == PathStatus::Deprecated);
    CHECK_FALSE(store.report_traversal(id, bad));
}

TEST_CASE("memory: a validated path failing again is deprecated") {
    PathMemoryStore store;
    const auto id = store.record(route(10));

    TraversalOutcome ok;
    for (int i = 0; i < 6; ++i) {
        store.report_traversal(id, ok);
    }
    CHECK(store.find(id)->confidence_rating >= 0.9);

    TraversalOutcome bad;
    bad.success = false;
    bad.failed_at = 4;
    CHECK(store.report_traversal(id, bad));
    CHECK(store.find(id)->status == PathStatus::Deprecated);
    CHECK(store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::all()).empty());
}

TEST_CASE("memory: failed cached path is replaced by a fresh plan") {
    world::GridWorld w;
    w.floor(0, 0, 20, 0, 0);
    Config cfg;
    cfg.planner.smooth = false;
    PathMemoryStore store(cfg.memory);
    planner::RoutePlanner planner(w, &store, nullptr, cfg);
    const auto caps = Capabilities::of({MovementMode::Walk, MovementMode::Sprint});

    auto first = planner.request_path(Position{0, 0, 0}, Position{20, 0, 0}, caps);
    REQUIRE(first.is_ok());
    const auto old_id = first.value().id;
    REQUIRE(first.value().waypoints.size() > 4);

    TraversalOutcome ok;
    while (store.find(old_id)->confidence_rating < 0.9) {
        store.report_traversal(old_id, ok);
    }
    auto cached = planner.request_path(Position{0, 0, 0}, Position{20, 0, 0}, caps);
    REQUIRE(cached.is_ok());
    CHECK(cached.value().id == old_id);

    TraversalOutcome bad;
    bad.success = false;
    bad.failed_at = 4;
    store.report_traversal(old_id, bad);
    CHECK(store.find(old_id)->status == PathStatus::Deprecated);

    auto next = planner.request_path(Position{0, 0, 0}, Position{20, 0, 0}, caps);
    REQUIRE(next.is_ok());
    CHECK(next.value().id != old_id);
    CHECK(next.value().status == PathStatus::Fresh);
    CHECK(next.value().confidence_rating == doctest::Approx(cfg.memory.initial_rating));
}

TEST_CASE("memory: invalidate deprecates and compact reclaims") {
    PathMemoryStore store;
    const auto id = store.record(route(10));
    CHECK(store.invalidate(id, 2));
    CHECK(store.find(id)->status == PathStatus::Deprecated);
    CHECK(store.stats().invalidations == 1);
    CHECK(store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::all()).empty());

    {
        auto held = store.find(id);
        REQUIRE(held);
        CHECK(store.compact() == 0);
    }
    CHECK(store.compact() == 1);
    CHECK_FALSE(store.find(id));
    CHECK_FALSE(store.invalidate(id, 0));
}

TEST_CASE("memory: a leased path survives compact after its snapshot is copied away") {
    PathMemoryStore store;
    const auto id = store.record(route(10));
    // The holder keeps its own copy of the path, not the shared snapshot.
    const Path copy = *store.find(id);
    {
        auto lease = store.lease(id);
        CHECK(lease.held());
        CHECK(store.leased(id));
        CHECK(store.invalidate(id, 1));
        CHECK(store.compact() == 0);
        CHECK(store.find(id));

        PathLease moved = std::move(lease);
        CHECK_FALSE(lease.held());
        CHECK(store.leased(copy.id));
        CHECK(store.compact() == 0);
    }
    CHECK_FALSE(store.leased(id));
    CHECK(store.compact() == 1);
    CHECK_FALSE(store.find(id));
}

TEST_CASE("memory: full bucket deprecates its weakest path") {
    MemoryConfig cfg;
    cfg.max_candidates = 2;
    PathMemoryStore store(cfg);

    const auto a = store.record(route(10));
    const auto b = store.record(route(10));
    TraversalOutcome ok;
    store.report_traversal(a, ok);

    const auto c = store.record(route(10));
    CHECK(store.find(a)->status == PathStatus::Fresh);
    CHECK(store.find(b)->status == PathStatus::Deprecated);
    CHECK(store.find(c)->status == PathStatus::Fresh);

    auto hits = store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::all());
    REQUIRE(hits.size() == 2);
    CHECK(hits[0]->id == a);
    CHECK(hits[1]->id == c);
}

TEST_CASE("memory: unvalidated paths go stale and sort last") {
    MemoryConfig cfg;
    cfg.stale_after_ns = 1000;
    PathMemoryStore store(cfg);

    auto old_route = route(10);
    old_route.created_at = 1;
    const auto old_id = store.record(old_route);
    auto new_route = route(10);
    new_route.created_at = 5000;
    const auto new_id = store.record(new_route);

    CHECK(store.mark_stale(5500) == 1);
    CHECK(store.find(old_id)->status == PathStatus::Stale);
    CHECK(store.find(new_id)->status == PathStatus::Fresh);

    auto hits = store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::all());
    REQUIRE(hits.size() == 2);
    CHECK(hits[0]->id == new_id);
    CHECK(hits[1]->id == old_id);

    TraversalOutcome ok;
    ok.at_ns = 6000;
    store.report_traversal(old_id, ok);
    CHECK(store.find(old_id)->status == PathStatus::Fresh);
}

TEST_CASE("memory: concurrent writers and readers") {
    PathMemoryStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::atomic<dp::u64> folded{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, &folded, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const auto id = store.record(route(10 + (t % 3) * 20));
                TraversalOutcome ok;
                // Another writer may already have pushed this path out of its bucket.
                if (store.report_traversal(id, ok)) {
                    folded.fetch_add(1);
                }
                auto hits = store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::all());
                for (const auto &p : hits) {
                    CHECK(p->status != PathStatus::Deprecated);
                }
            }
        });
    }
    for (auto &th : threads) {
        th.join();
    }

    CHECK(store.stats().records == kThreads * kPerThread);
    CHECK(store.stats().traversals == folded.load());
    CHECK(folded.load() > 0);
    CHECK(store.lookup(Position{0, 0, 0}, Position{10, 0, 0}, Capabilities::all()).size() <=
          store.config().max_candidates);
}
