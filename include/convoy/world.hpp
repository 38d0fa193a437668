#pragma once

#include <datapod/adapters.hpp>

#include "convoy/types.hpp"

namespace convoy {

    /// Read-only view of the world consumed by the planner.
    ///
    /// Implementations must tolerate concurrent calls from every agent's tick.
    class WorldQuery {
      public:
        virtual ~WorldQuery() = default;

        virtual TerrainSample sample(const Position &p) const = 0;

        /// Hazards whose zone reaches within `radius` of `center`.
        virtual dp::Vector<HazardRecord> hazards_near(const Position &center, dp::f64 radius) const = 0;
    };

} // namespace convoy
