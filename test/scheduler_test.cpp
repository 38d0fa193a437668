#include <doctest/doctest.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

#include <convoy/scheduler.hpp>
#include <convoy/world/grid_world.hpp>
#include <convoy/world/sim_motion.hpp>

using namespace convoy;

namespace {

    const Capabilities kRunner = Capabilities::of({MovementMode::Walk, MovementMode::Sprint});

    /// World view whose terrain reads block while the gate is shut, like a slow chunk load.
    class GatedWorld : public WorldQuery {
      public:
        explicit GatedWorld(const WorldQuery &inner) : inner_(inner) {}

        TerrainSample sample(const Position &p) const override {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return open_; });
            lock.unlock();
            return inner_.sample(p);
        }

        dp::Vector<HazardRecord> hazards_near(const Position &center, dp::f64 radius) const override {
            return inner_.hazards_near(center, radius);
        }

        void shut() {
            std::lock_guard<std::mutex> lock(mu_);
            open_ = false;
        }

        void open() {
            {
                std::lock_guard<std::mutex> lock(mu_);
                open_ = true;
            }
            cv_.notify_all();
        }

      private:
        const WorldQuery &inner_;
        mutable std::mutex mu_;
        mutable std::condition_variable cv_;
        bool open_ = true;
    };

} // namespace

TEST_CASE("scheduler: ticks every agent concurrently until all arrive") {
    Config cfg;
    world::GridWorld w;
    w.floor(0, -12, 30, 12, 0);
    PathMemoryStore memory(cfg.memory);
    planner::RoutePlanner planner(w, &memory, nullptr, cfg);

    std::vector<std::unique_ptr<world::SimMotion>> bodies;
    std::vector<std::unique_ptr<Agent>> agents;
    Scheduler sched(4);
    CHECK(sched.threads() == 4);

    for (dp::i32 i = 0; i < 6; ++i) {
        const dp::i32 lane = -10 + 4 * i;
        const dp::Point start{0.0, 0.0, static_cast<dp::f64>(lane)};
        bodies.push_back(std::make_unique<world::SimMotion>(start));
        agents.push_back(
            std::make_unique<Agent>(static_cast<AgentId>(i + 1), kRunner, &planner, &memory, bodies.back().get()));
        agents.back()->place(start);
        REQUIRE(agents.back()->go_to(Position{20, 0, lane}).is_ok());
        sched.add(agents.back().get());
    }

    auto arrived = [&] {
        for (const auto &a : agents) {
            if (a->path().has_value()) {
                return false;
            }
        }
        return true;
    };
    const auto ran = sched.run_until(arrived, 2000);
    CHECK(arrived());
    CHECK(sched.tick() == ran);
    CHECK(sched.failures() == 0);

    for (dp::i32 i = 0; i < 6; ++i) {
        const dp::Point goal{20.0, 0.0, static_cast<dp::f64>(-10 + 4 * i)};
        CHECK(separation(bodies[i]->position(), goal) < 1e-6);
    }
    CHECK(memory.stats().traversals == 6);
}

TEST_CASE("scheduler: zero threads runs inline and expires board hazards") {
    Scheduler sched(0);
    CHECK(sched.threads() == 0);

    HazardBoard board;
    HazardRecord h;
    h.severity = Severity::Dangerous;
    board.inject(h, 3);
    sched.watch(&board);

    sched.step();
    sched.step();
    CHECK(board.size() == 1);
    sched.step();
    CHECK(board.size() == 0);
    CHECK(sched.tick() == 3);
}

TEST_CASE("scheduler: leader and follower complete a mission in formation") {
    Config cfg;
    world::GridWorld w;
    w.floor(0, -3, 30, 3, 0);
    PathMemoryStore memory(cfg.memory);
    planner::RoutePlanner planner(w, &memory, nullptr, cfg);

    world::SimMotion lead_body(dp::Point{3.0, 0.0, 0.0});
    world::SimMotion tail_body(dp::Point{0.0, 0.0, 0.0});
    Agent lead(1, kRunner, &planner, &memory, &lead_body, cfg.stuck);
    Agent tail(2, kRunner, &planner, &memory, &tail_body, cfg.stuck);
    lead.place(dp::Point{3.0, 0.0, 0.0});
    tail.place(dp::Point{0.0, 0.0, 0.0});

    mission::Formation f;
    f.leader = 1;
    f.followers.push_back(2);
    f.type = mission::FormationType::Column;
    f.spacing_tolerance = cfg.formation.spacing_tolerance;
    mission::Mission m(1, Position{25, 0, 0}, f, cfg);
    lead.join(&m);
    tail.join(&m);

    Scheduler sched(2);
    sched.set_lockstep(true);
    sched.add(&lead);
    sched.add(&tail);
    sched.add(&m);

    for (int t = 0; t < 3000 && m.status() != MissionStatus::Complete; ++t) {
        sched.step();
        REQUIRE(m.status() != MissionStatus::Aborted);
        CHECK_FALSE(m.formation_status().broken);
    }
    CHECK(m.status() == MissionStatus::Complete);
    CHECK(separation(lead_body.position(), dp::Point{25.0, 0.0, 0.0}) < 1e-6);
    CHECK(m.deviation(2) <= cfg.formation.spacing_tolerance);
    CHECK(sched.failures() == 0);
}

TEST_CASE("scheduler: a slow plan holds only its own agent") {
    Config cfg;
    world::GridWorld w;
    w.floor(0, -6, 30, 6, 0);
    GatedWorld gate(w);
    PathMemoryStore memory(cfg.memory);
    planner::RoutePlanner planner(gate, &memory, nullptr, cfg);

    world::SimMotion slow_body(dp::Point{0.0, 0.0, -4.0});
    world::SimMotion quick_body(dp::Point{0.0, 0.0, 4.0});
    Agent slow(1, kRunner, &planner, &memory, &slow_body, cfg.stuck);
    Agent quick(2, kRunner, &planner, &memory, &quick_body, cfg.stuck);
    slow.place(dp::Point{0.0, 0.0, -4.0});
    quick.place(dp::Point{0.0, 0.0, 4.0});
    REQUIRE(quick.go_to(Position{20, 0, 4}).is_ok());

    gate.shut();
    CHECK(slow.plan_to(Position{20, 0, -4}));
    CHECK_FALSE(slow.plan_to(Position{10, 0, -4}));

    Scheduler sched(2);
    sched.add(&slow);
    sched.add(&quick);
    for (int t = 0; t < 40; ++t) {
        sched.step();
    }
    CHECK(sched.tick() == 40);
    CHECK(slow.planning());
    CHECK_FALSE(slow.path().has_value());
    CHECK(separation(slow_body.position(), dp::Point{0.0, 0.0, -4.0}) < 1e-9);
    CHECK(quick_body.position().x > 5.0);

    gate.open();
    slow.await_plan();
    sched.step();
    CHECK_FALSE(slow.planning());
    REQUIRE(slow.path().has_value());

    auto arrived = [&] { return !slow.path().has_value() && !quick.path().has_value(); };
    sched.run_until(arrived, 2000);
    CHECK(separation(slow_body.position(), dp::Point{20.0, 0.0, -4.0}) < 1e-6);
    CHECK(separation(quick_body.position(), dp::Point{20.0, 0.0, 4.0}) < 1e-6);
    CHECK(sched.failures() == 0);
}
