#include <convoy.hpp>

#include <argu/argu.hpp>
#include <echo/echo.hpp>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace {

    class Console : public convoy::Listener {
      public:
        void report_stuck(convoy::AgentId id) override { echo::warn("agent ", id, " is stuck"); }

        void report_escalated(convoy::AgentId id, const convoy::Incident &i) override {
            echo::error("agent ", id, " escalated: ", i.detail.c_str());
        }

        void report_abort(const convoy::Incident &i) override {
            echo::error("mission aborted (", convoy::to_string(i.reason), "): ", i.detail.c_str());
        }

        void report_status(convoy::MissionId id, convoy::MissionStatus s) override {
            echo::info("mission ", id, " is now ", convoy::to_string(s));
        }
    };

} // namespace

int main(int argc, char *argv[]) {
    std::string followers_arg;
    std::string distance_arg;
    auto cmd = argu::Command("mission_demo")
                   .version("1.0.0")
                   .about("Leader and followers cross a small world in column formation")
                   .auto_exit()
                   .arg(argu::Arg("followers")
                            .positional()
                            .help("Number of followers")
                            .value_of(followers_arg)
                            .value_name("N")
                            .default_value("2"))
                   .arg(argu::Arg("distance")
                            .positional()
                            .help("Blocks from the start line to the goal")
                            .value_of(distance_arg)
                            .value_name("BLOCKS")
                            .default_value("40"));

    auto result = cmd.parse(argc, argv);
    if (!result) {
        return result.exit();
    }

    const long followers = std::strtol(followers_arg.c_str(), nullptr, 10);
    const long distance = std::strtol(distance_arg.c_str(), nullptr, 10);
    if (followers < 0 || followers > 8 || distance < 10 || distance > 200) {
        echo::error("followers must be in [0, 8] and distance in [10, 200]");
        return 1;
    }
    const auto goal_x = static_cast<dp::i32>(distance);

    convoy::Config cfg;
    auto valid = cfg.validate();
    if (valid.is_err()) {
        echo::error("bad configuration: ", valid.error().message.c_str());
        return 1;
    }

    // Open ground with a pond across the middle and a wall with a single gap further on.
    convoy::world::GridWorld world;
    world.floor(-30, -8, goal_x + 5, 8, 0);
    world.fill(convoy::Position{goal_x / 3, 0, -8}, convoy::Position{goal_x / 3 + 2, 0, 8},
               convoy::TerrainSample::of(convoy::Surface::Liquid));
    world.fill(convoy::Position{2 * goal_x / 3, 0, -8}, convoy::Position{2 * goal_x / 3, 3, 4},
               convoy::TerrainSample::of(convoy::Surface::Obstruction));

    convoy::HazardBoard board;
    convoy::PathMemoryStore memory(cfg.memory);
    convoy::planner::RoutePlanner planner(world, &memory, &board, cfg);

    const auto caps = convoy::Capabilities::of(
        {convoy::MovementMode::Walk, convoy::MovementMode::Sprint, convoy::MovementMode::SwimSurface});

    convoy::mission::Formation formation;
    formation.leader = 1;
    formation.type = convoy::mission::FormationType::Column;
    formation.spacing_tolerance = cfg.formation.spacing_tolerance;

    std::vector<std::unique_ptr<convoy::world::SimMotion>> bodies;
    std::vector<std::unique_ptr<convoy::Agent>> agents;
    for (long i = 0; i <= followers; ++i) {
        const auto id = static_cast<convoy::AgentId>(i + 1);
        const dp::Point start{static_cast<dp::f64>(-3 * i), 0.0, 0.0};
        bodies.push_back(std::make_unique<convoy::world::SimMotion>(start));
        agents.push_back(std::make_unique<convoy::Agent>(id, caps, &planner, &memory, bodies.back().get(), cfg.stuck));
        agents.back()->place(start);
        agents.back()->watch(&board);
        if (i > 0) {
            formation.followers.push_back(id);
        }
    }

    Console console;
    convoy::mission::Mission mission(1, convoy::Position{goal_x, 0, 0}, formation, cfg, &console);

    convoy::Scheduler scheduler;
    scheduler.watch(&board);
    for (auto &a : agents) {
        a->join(&mission);
        scheduler.add(a.get());
    }
    scheduler.add(&mission);
    echo::info("running ", agents.size(), " agents on ", scheduler.threads(), " threads");

    bool injected = false;
    auto done = [&] {
        const auto s = mission.status();
        if (!injected && scheduler.tick() == 60) {
            // Hostile patrol appears on the far side of the pond for a while.
            convoy::HazardRecord h;
            h.type = convoy::HazardType::HostilePresence;
            h.location = dp::Point{static_cast<dp::f64>(goal_x / 2), 0.0, 0.0};
            h.radius = 1.0;
            h.severity = convoy::Severity::Lethal;
            board.inject(h, scheduler.tick() + 400);
            injected = true;
        }
        return s == convoy::MissionStatus::Complete || s == convoy::MissionStatus::Aborted;
    };
    const auto ticks = scheduler.run_until(done, 20000);

    const auto stats = memory.stats();
    echo::info("finished in ", ticks, " ticks: ", convoy::to_string(mission.status()));
    echo::info("path memory: ", stats.records, " recorded, ", stats.hits, " hits, ", stats.misses, " misses, ",
               stats.invalidations, " invalidated");
    for (const auto &a : agents) {
        const auto &s = a->monitor().stats();
        echo::info("agent ", a->id(), ": ", s.detections, " stuck episodes, ", s.successes, "/", s.attempts,
                   " recoveries");
    }
    for (const auto &i : mission.incidents()) {
        echo::info("incident at tick ", i.tick, ": ", convoy::to_string(i.reason), " from agent ", i.agent);
    }
    return mission.status() == convoy::MissionStatus::Complete ? 0 : 2;
}
