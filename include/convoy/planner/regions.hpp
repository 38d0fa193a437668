#pragma once

#include <algorithm>
#include <cmath>
#include <queue>
#include <unordered_map>
#include <vector>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/adapters/result.hpp>

#include "convoy/cancel.hpp"
#include "convoy/config.hpp"
#include "convoy/planner/search.hpp"
#include "convoy/types.hpp"
#include "convoy/world.hpp"

namespace convoy {
    namespace planner {

        // Region cells searched beyond the bounding box of the two endpoints.
        static constexpr dp::i32 kRegionPadding = 2;
        static constexpr dp::usize kMaxRegionExpansions = 4096;

        /// Coarse route over columns of `region_size` blocks, used for requests past the local
        /// search range.
        ///
        /// Each column is stood for by an anchor: the standable cell nearest its middle, searched
        /// within `max_ascent` blocks of the height the route arrives at. The returned anchors are
        /// only waypoints for the local search, which plans every leg between them.
        class RegionRouter {
          public:
            RegionRouter(const WorldQuery &world, PlannerConfig cfg, dp::i32 region_size)
                : world_(world), cfg_(cfg), size_(region_size) {}

            dp::i32 region_size() const { return size_; }

            /// Anchors from the region after `origin`'s up to `destination`, which comes last.
            dp::Result<dp::Vector<Position>> route(const Position &origin, const Position &destination,
                                                   const CancelToken *cancel = nullptr) const {
                const Cell start{column(origin.x), column(origin.z)};
                const Cell goal{column(destination.x), column(destination.z)};
                if (start == goal) {
                    dp::Vector<Position> direct;
                    direct.push_back(destination);
                    return dp::Result<dp::Vector<Position>>::ok(direct);
                }

                const dp::i32 lo_x = std::min(start.x, goal.x) - kRegionPadding;
                const dp::i32 hi_x = std::max(start.x, goal.x) + kRegionPadding;
                const dp::i32 lo_z = std::min(start.z, goal.z) - kRegionPadding;
                const dp::i32 hi_z = std::max(start.z, goal.z) + kRegionPadding;

                std::vector<Node> nodes;
                std::unordered_map<dp::i64, dp::usize> index;
                std::priority_queue<Open, std::vector<Open>, OpenOrder> open;

                nodes.push_back(Node{start, origin, 0.0, kNone, false});
                index[start.key()] = 0;
                open.push(Open{separation(origin, destination), 0});

                dp::usize expanded = 0;
                while (!open.empty()) {
                    const Open top = open.top();
                    open.pop();
                    if (nodes[top.node].closed) {
                        continue;
                    }
                    nodes[top.node].closed = true;
                    if (nodes[top.node].cell == goal) {
                        return dp::Result<dp::Vector<Position>>::ok(unwind(nodes, top.node, destination));
                    }
                    if (++expanded >= kMaxRegionExpansions) {
                        break;
                    }
                    if (is_cancelled(cancel)) {
                        return dp::Result<dp::Vector<Position>>::err(dp::Error::invalid_argument("planning cancelled"));
                    }

                    const Cell here = nodes[top.node].cell;
                    const Position from = nodes[top.node].anchor;
                    const dp::f64 g = nodes[top.node].g;
                    for (dp::i32 dx = -1; dx <= 1; ++dx) {
                        for (dp::i32 dz = -1; dz <= 1; ++dz) {
                            const Cell next{here.x + dx, here.z + dz};
                            if ((dx == 0 && dz == 0) || next.x < lo_x || next.x > hi_x || next.z < lo_z ||
                                next.z > hi_z) {
                                continue;
                            }
                            dp::Optional<Position> to;
                            if (next == goal) {
                                to = destination;
                            } else {
                                to = anchor(next, from.y);
                            }
                            if (!to.has_value() || std::abs(to->y - from.y) > cfg_.max_ascent) {
                                continue;
                            }
                            const dp::f64 cost = g + separation(from, *to);
                            auto it = index.find(next.key());
                            if (it != index.end()) {
                                Node &n = nodes[it->second];
                                if (n.closed || n.g <= cost) {
                                    continue;
                                }
                                n.g = cost;
                                n.anchor = *to;
                                n.parent = top.node;
                                open.push(Open{cost + separation(*to, destination), it->second});
                                continue;
                            }
                            index[next.key()] = nodes.size();
                            nodes.push_back(Node{next, *to, cost, top.node, false});
                            open.push(Open{cost + separation(*to, destination), nodes.size() - 1});
                        }
                    }
                }
                echo::warn("[regions] no region route after ", expanded, " expansions");
                return dp::Result<dp::Vector<Position>>::err(dp::Error::invalid_argument("no region route"));
            }

            /// Standable cell nearest the middle of column (cx, cz), within `max_ascent` of `near_y`.
            dp::Optional<Position> anchor(dp::i32 cx, dp::i32 cz, dp::i32 near_y) const {
                return anchor(Cell{cx, cz}, near_y);
            }

          private:
            static constexpr dp::usize kNone = static_cast<dp::usize>(-1);

            struct Cell {
                dp::i32 x = 0;
                dp::i32 z = 0;

                dp::i64 key() const {
                    return (static_cast<dp::i64>(x) << 32) ^ static_cast<dp::i64>(static_cast<dp::u32>(z));
                }
                friend bool operator==(const Cell &a, const Cell &b) { return a.x == b.x && a.z == b.z; }
            };

            struct Node {
                Cell cell;
                Position anchor;
                dp::f64 g = 0.0;
                dp::usize parent = kNone;
                bool closed = false;
            };

            struct Open {
                dp::f64 f = 0.0;
                dp::usize node = 0;
            };

            struct OpenOrder {
                bool operator()(const Open &a, const Open &b) const {
                    if (a.f != b.f) {
                        return a.f > b.f;
                    }
                    return a.node > b.node;
                }
            };

            dp::i32 column(dp::i32 v) const { return v >= 0 ? v / size_ : -((-v + size_ - 1) / size_); }

            dp::Optional<Position> anchor(const Cell &c, dp::i32 near_y) const {
                const dp::i32 x0 = c.x * size_;
                const dp::i32 z0 = c.z * size_;
                const dp::i32 mx = x0 + size_ / 2;
                const dp::i32 mz = z0 + size_ / 2;
                for (dp::i32 ring = 0; ring <= size_; ++ring) {
                    for (dp::i32 x = mx - ring; x <= mx + ring; ++x) {
                        for (dp::i32 z = mz - ring; z <= mz + ring; ++z) {
                            const bool edge = std::abs(x - mx) == ring || std::abs(z - mz) == ring;
                            if (!edge || x < x0 || x >= x0 + size_ || z < z0 || z >= z0 + size_) {
                                continue;
                            }
                            for (dp::i32 k = 0; k <= 2 * cfg_.max_ascent; ++k) {
                                // 0, +1, -1, +2, -2, ...
                                const dp::i32 dy = (k % 2 == 1) ? (k + 1) / 2 : -(k / 2);
                                const Position p{x, near_y + dy, z};
                                if (standable(world_.sample(p).surface)) {
                                    return p;
                                }
                            }
                        }
                    }
                }
                return dp::nullopt;
            }

            static dp::Vector<Position> unwind(const std::vector<Node> &nodes, dp::usize last,
                                               const Position &destination) {
                dp::Vector<Position> out;
                for (dp::usize i = last; nodes[i].parent != kNone; i = nodes[i].parent) {
                    out.push_back(nodes[i].anchor);
                }
                std::reverse(out.begin(), out.end());
                if (!out.empty()) {
                    out.back() = destination;
                }
                return out;
            }

            const WorldQuery &world_;
            PlannerConfig cfg_;
            dp::i32 size_;
        };

    } // namespace planner
} // namespace convoy
