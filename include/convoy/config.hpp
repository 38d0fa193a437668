#pragma once

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/result.hpp>

namespace convoy {

    struct PlannerConfig {
        // Search limits.
        dp::usize max_nodes = 40000;
        dp::f64 max_range = 256.0;
        dp::f64 heuristic_weight = 1.0;

        // Longer requests go through the region graph, split into legs of at most leg_length.
        dp::f64 max_hierarchical_range = 800.0;
        dp::f64 leg_length = 64.0;

        // Deadline: timeout_ms * (1 + min(distance / 100, 5)), capped at max_timeout_ms.
        dp::i64 timeout_ms = 500;
        dp::i64 max_timeout_ms = 5000;

        // Vertical movement.
        dp::i32 max_safe_drop = 3;
        dp::i32 max_glide_drop = 24;
        dp::i32 max_ascent = 12;
        dp::f64 ascent_seconds_per_block = 1.5;

        // Gaps and crossings.
        dp::f64 jump_success_probability = 0.85;
        bool allow_bridging = true;
        dp::i32 max_bridge_span = 8;
        dp::f64 bridge_seconds_per_block = 1.2;
        dp::i32 swim_threshold = 6;
        dp::f64 vessel_boarding_seconds = 3.0;

        // Edge weight = time * (1 + risk_weight * risk) + hazard penalty.
        dp::f64 risk_weight = 1.0;

        // Hazard filter / re-search loop bound.
        dp::usize max_reroutes = 8;
        // Radius added around the corridor when asking the world for hazards.
        dp::f64 hazard_margin = 24.0;

        // A cached path whose endpoints both lie this close to the request is extended, not replaced.
        dp::f64 splice_distance = 3.0;

        bool smooth = true;
    };

    struct HazardConfig {
        // Categorical clearance beyond a lethal hazard's radius.
        dp::f64 lethal_clearance = 3.0;
        // Penalty seconds per second of exposure inside a dangerous hazard.
        dp::f64 danger_weight = 4.0;
    };

    struct MemoryConfig {
        dp::i32 region_size = 16;
        dp::usize max_candidates = 4;
        dp::f64 initial_rating = 0.5;
        dp::f64 ema_alpha = 0.25;
        dp::f64 rating_floor = 0.2;
        dp::i64 stale_after_ns = 600LL * 1'000'000'000LL;
    };

    struct StuckConfig {
        dp::f64 epsilon = 0.05;
        dp::u32 stuck_ticks = 5;
        dp::u32 attempt_ticks = 20;
        dp::u32 max_total_attempts = 8;
        dp::i32 retreat_cells = 2;
        dp::f64 retreat_angle_deg = 30.0;
        dp::i32 bypass_height = 2;
    };

    struct FormationConfig {
        dp::f64 spacing = 3.0;
        dp::f64 spacing_tolerance = 5.0;
        dp::f64 pace_gain = 0.5;
        dp::f64 min_pace = 0.0;
        dp::f64 pace_recovery = 0.1;
        dp::u32 max_throttle_ticks = 200;
        dp::usize trail_capacity = 512;
    };

    struct MissionConfig {
        // 0 means every participant must reach the regroup point.
        dp::usize regroup_quorum = 0;
        dp::u32 regroup_timeout_ticks = 600;
        dp::f64 arrival_radius = 1.5;
    };

    struct Config {
        PlannerConfig planner;
        HazardConfig hazard;
        MemoryConfig memory;
        StuckConfig stuck;
        FormationConfig formation;
        MissionConfig mission;

        /// Reject values that would make a component misbehave.
        dp::Result<Config> validate() const {
            if (planner.max_nodes == 0 || planner.max_range <= 0.0 || planner.heuristic_weight <= 0.0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("planner limits must be positive"));
            }
            if (planner.max_hierarchical_range < planner.max_range || planner.leg_length <= 0.0 ||
                planner.leg_length > planner.max_range || planner.splice_distance < 0.0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("planner leg limits out of range"));
            }
            if (planner.timeout_ms <= 0 || planner.max_timeout_ms < planner.timeout_ms) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("planner timeout out of range"));
            }
            if (planner.jump_success_probability <= 0.0 || planner.jump_success_probability > 1.0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("jump success probability out of range"));
            }
            if (planner.max_safe_drop < 0 || planner.max_glide_drop < planner.max_safe_drop ||
                planner.max_ascent < 3 || planner.swim_threshold < 0 || planner.max_bridge_span < 0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("planner vertical/crossing limits invalid"));
            }
            if (hazard.lethal_clearance < 0.0 || hazard.danger_weight < 0.0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("hazard weights must be non-negative"));
            }
            if (memory.region_size <= 0 || memory.max_candidates == 0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("memory sizing must be positive"));
            }
            if (memory.ema_alpha <= 0.0 || memory.ema_alpha > 1.0 || memory.rating_floor < 0.0 ||
                memory.rating_floor >= 1.0 || memory.initial_rating < 0.0 || memory.initial_rating > 1.0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("memory rating parameters out of range"));
            }
            if (stuck.epsilon <= 0.0 || stuck.stuck_ticks == 0 || stuck.attempt_ticks == 0 ||
                stuck.max_total_attempts == 0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("stuck thresholds must be positive"));
            }
            if (formation.spacing_tolerance <= 0.0 || formation.spacing <= 0.0 || formation.min_pace < 0.0 ||
                formation.min_pace > 1.0 || formation.trail_capacity < 2) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("formation parameters out of range"));
            }
            if (mission.arrival_radius <= 0.0 || mission.regroup_timeout_ticks == 0) {
                return dp::Result<Config>::err(dp::Error::invalid_argument("mission parameters out of range"));
            }
            return dp::Result<Config>::ok(*this);
        }
    };

} // namespace convoy
