#pragma once

#include <algorithm>
#include <array>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>

#include "convoy/types.hpp"

namespace convoy {
    namespace terrain {

        /// Base speed per mode in blocks per second, indexed by MovementMode.
        static constexpr std::array<dp::f64, kModeCount> kBaseSpeed{
            4.317, // walk
            5.612, // sprint
            2.2,   // swim surface
            1.97,  // swim submerged
            2.35,  // climb
            8.0,   // ride
            11.0,  // glide
        };

        static constexpr std::array<dp::f64, kModeCount> kBaseRisk{0.0, 0.0, 0.05, 0.15, 0.1, 0.0, 0.2};

        // Terrain factors are clamped to this band so no cell can push a mode past the
        // physical speed ceiling.
        static constexpr dp::f64 kMinSpeedFactor = 0.1;
        static constexpr dp::f64 kMaxSpeedFactor = 2.0;

        // Risk added per unit of factor above 1.0 (reduced control precision).
        static constexpr dp::f64 kSlipRisk = 0.5;

        struct MoveCost {
            dp::f64 speed = 0.0;
            dp::f64 risk = 0.0;

            bool passable() const { return speed > 0.0; }
        };

        inline dp::f64 base_speed(MovementMode m) { return kBaseSpeed[static_cast<std::size_t>(m)]; }

        /// Fastest speed any agent can reach on any cell.
        inline dp::f64 speed_ceiling() {
            return *std::max_element(kBaseSpeed.begin(), kBaseSpeed.end()) * kMaxSpeedFactor;
        }

        inline bool admits(Surface s, MovementMode m) {
            switch (s) {
            case Surface::Solid:
                return m == MovementMode::Walk || m == MovementMode::Sprint || m == MovementMode::Ride;
            case Surface::Liquid:
                return m == MovementMode::SwimSurface || m == MovementMode::SwimSubmerged || m == MovementMode::Ride;
            case Surface::Climbable:
                return m == MovementMode::Climb || m == MovementMode::Walk;
            case Surface::Void:
                return m == MovementMode::Glide;
            case Surface::Obstruction:
                return false;
            }
            return false;
        }

        inline dp::f64 tag_risk(dp::u8 t) {
            dp::f64 r = 0.0;
            if (t & tags::FallRisk) {
                r += 0.5;
            }
            if (t & tags::Hostile) {
                r += 0.5;
            }
            if (t & tags::ThinIce) {
                r += 0.3;
            }
            if (t & tags::Slippery) {
                r += 0.25;
            }
            return r;
        }

        /// Speed and risk of moving through `sample` in `mode`.
        ///
        /// Pure and deterministic. A zero speed means the mode cannot use the cell.
        inline MoveCost cost(const TerrainSample &sample, MovementMode mode) {
            if (!admits(sample.surface, mode) || (sample.tags & tags::LiquidDamage)) {
                return MoveCost{};
            }
            const dp::f64 factor = std::clamp(sample.factor(mode), kMinSpeedFactor, kMaxSpeedFactor);
            MoveCost out;
            out.speed = base_speed(mode) * factor;
            out.risk = kBaseRisk[static_cast<std::size_t>(mode)] + tag_risk(sample.tags);
            if (factor > 1.0) {
                out.risk += (factor - 1.0) * kSlipRisk;
            }
            return out;
        }

        /// Fastest passable mode for `sample` among `caps`; ties go to the lower enum value.
        inline dp::Optional<MovementMode> best_mode(const TerrainSample &sample, Capabilities caps) {
            dp::Optional<MovementMode> best;
            dp::f64 best_speed = 0.0;
            for (std::size_t i = 0; i < kModeCount; ++i) {
                const auto m = static_cast<MovementMode>(i);
                if (!caps.has(m)) {
                    continue;
                }
                const auto c = cost(sample, m);
                if (c.passable() && c.speed > best_speed) {
                    best_speed = c.speed;
                    best = m;
                }
            }
            return best;
        }

        /// Clamped terrain factor for `mode` on `sample`.
        inline dp::f64 factor(const TerrainSample &sample, MovementMode mode) {
            return std::clamp(sample.factor(mode), kMinSpeedFactor, kMaxSpeedFactor);
        }

    } // namespace terrain
} // namespace convoy
