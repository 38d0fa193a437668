#pragma once

#include <datapod/adapters.hpp>

#include "convoy/types.hpp"

namespace convoy {
    namespace planner {

        /// Plain walking/sprinting steps are the only edges that can be folded together.
        inline bool mergeable(const Waypoint &w) { return w.edge == EdgeKind::Step && w.span == 0; }

        inline bool same_annotations(const Waypoint &a, const Waypoint &b) {
            if (a.mode != b.mode || a.edge != b.edge || a.terrain_factor != b.terrain_factor) {
                return false;
            }
            if (a.hazard_refs.size() != b.hazard_refs.size()) {
                return false;
            }
            for (dp::usize i = 0; i < a.hazard_refs.size(); ++i) {
                if (a.hazard_refs[i] != b.hazard_refs[i]) {
                    return false;
                }
            }
            return true;
        }

        /// True when a -> b and b -> c point the same way.
        inline bool collinear(const Position &a, const Position &b, const Position &c) {
            const dp::i64 ux = b.x - a.x, uy = b.y - a.y, uz = b.z - a.z;
            const dp::i64 vx = c.x - b.x, vy = c.y - b.y, vz = c.z - b.z;
            const bool cross_zero = uy * vz - uz * vy == 0 && uz * vx - ux * vz == 0 && ux * vy - uy * vx == 0;
            return cross_zero && ux * vx + uy * vy + uz * vz > 0;
        }

        /// Merge runs of collinear steps that share mode, edge kind, factor and hazard refs.
        ///
        /// The first and last waypoints are always kept.
        inline dp::Vector<Waypoint> smooth(const dp::Vector<Waypoint> &in) {
            dp::Vector<Waypoint> out;
            out.reserve(in.size());
            for (const auto &w : in) {
                const auto n = out.size();
                if (n >= 2) {
                    const auto &prev = out[n - 2];
                    const auto &last = out[n - 1];
                    if (mergeable(last) && mergeable(w) && same_annotations(last, w) &&
                        collinear(prev.position, last.position, w.position)) {
                        out[n - 1] = w;
                        continue;
                    }
                }
                out.push_back(w);
            }
            return out;
        }

    } // namespace planner
} // namespace convoy
