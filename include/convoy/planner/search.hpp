#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/result.hpp>

#include "convoy/cancel.hpp"
#include "convoy/config.hpp"
#include "convoy/hazard.hpp"
#include "convoy/terrain.hpp"
#include "convoy/types.hpp"
#include "convoy/world.hpp"

namespace convoy {
    namespace planner {

        // Widest gap ever crossed by a jump. Anything wider is bridged or detoured.
        static constexpr dp::i32 kMaxJumpGap = 2;

        // Blocks per second squared, for fall time.
        static constexpr dp::f64 kGravity = 32.0;

        // Longest liquid run scanned for a single crossing edge.
        static constexpr dp::i32 kMaxCrossing = 128;

        using CellSet = std::unordered_set<Position, PositionHash>;
        using Clock = std::chrono::steady_clock;

        struct Edge {
            Position to{};
            MovementMode mode = MovementMode::Walk;
            EdgeKind kind = EdgeKind::Step;
            dp::f64 seconds = 0.0;
            dp::f64 risk = 0.0;
            dp::f64 factor = 1.0;
            dp::i32 span = 0;
        };

        struct SearchRequest {
            Position origin{};
            Position destination{};
            Capabilities caps{};

            dp::Vector<ClearanceConstraint> constraints;
            dp::Vector<HazardRecord> hazards;
            bool advisory_override = false;

            CellSet avoid;
            CellSet prefer;

            Clock::time_point deadline = Clock::time_point::max();
            const CancelToken *cancel = nullptr;
        };

        struct Step {
            Position position{};
            Edge edge{};
            dp::f64 exposure = 0.0;
        };

        struct SearchResult {
            dp::Vector<Step> steps;
            dp::f64 seconds = 0.0;
            dp::f64 exposure = 0.0;
            dp::f64 weight = 0.0;
            dp::usize expanded = 0;
        };

        /// A* over the waypoint graph the world exposes around each expanded cell.
        class GridSearch {
          public:
            GridSearch(const WorldQuery &world, PlannerConfig cfg, HazardConfig hcfg = {})
                : world_(world), cfg_(cfg), filter_(hcfg) {}

            const PlannerConfig &config() const { return cfg_; }

            /// Admissible estimate: straight-line distance at the fastest possible speed.
            dp::f64 heuristic(const Position &a, const Position &b) const {
                const dp::f64 dx = std::abs(a.x - b.x);
                const dp::f64 dy = std::abs(a.y - b.y);
                const dp::f64 dz = std::abs(a.z - b.z);
                return std::sqrt(dx * dx + dy * dy + dz * dz) / terrain::speed_ceiling() * cfg_.heuristic_weight;
            }

            dp::Result<SearchResult> run(const SearchRequest &req) const {
                const auto os = world_.sample(req.origin);
                if (!standable(os.surface)) {
                    return dp::Result<SearchResult>::err(dp::Error::invalid_argument("origin is not standable"));
                }
                const auto ds = world_.sample(req.destination);
                if (!standable(ds.surface)) {
                    return dp::Result<SearchResult>::err(dp::Error::invalid_argument("destination is not standable"));
                }

                std::vector<Node> nodes;
                std::unordered_map<Position, dp::usize, PositionHash> index;
                std::priority_queue<Open, std::vector<Open>, OpenOrder> open;
                dp::u64 seq = 0;

                Node start;
                start.position = req.origin;
                start.edge.to = req.origin;
                start.edge.kind = EdgeKind::Start;
                nodes.push_back(start);
                index[req.origin] = 0;
                open.push(Open{heuristic(req.origin, req.destination), 0.0, 0, 0.0, seq++, 0});

                std::vector<Edge> edges;
                dp::usize expanded = 0;

                while (!open.empty()) {
                    const Open top = open.top();
                    open.pop();
                    Node &cur = nodes[top.node];
                    if (cur.closed) {
                        continue;
                    }
                    cur.closed = true;

                    if (cur.position == req.destination) {
                        return dp::Result<SearchResult>::ok(build(nodes, top.node, expanded));
                    }

                    ++expanded;
                    if (expanded >= cfg_.max_nodes) {
                        echo::warn("[planner] node budget exhausted after ", expanded, " expansions");
                        return dp::Result<SearchResult>::err(dp::Error::invalid_argument("node budget exhausted"));
                    }
                    if ((expanded & 0xFF) == 0) {
                        if (is_cancelled(req.cancel)) {
                            return dp::Result<SearchResult>::err(dp::Error::invalid_argument("planning cancelled"));
                        }
                        if (Clock::now() > req.deadline) {
                            echo::warn("[planner] deadline exceeded after ", expanded, " expansions");
                            return dp::Result<SearchResult>::err(dp::Error::invalid_argument("planning deadline exceeded"));
                        }
                    }

                    edges.clear();
                    expand(cur.position, req, edges);

                    // `cur` may dangle once nodes grows.
                    const Node parent = nodes[top.node];
                    for (const auto &e : edges) {
                        if (violates(parent.position, e.to, req.constraints)) {
                            continue;
                        }
                        const auto a = parent.position.center();
                        const auto b = e.to.center();
                        const auto exp = filter_.assess(a, b, e.seconds, req.hazards, req.advisory_override);

                        dp::f64 w = e.seconds * (1.0 + cfg_.risk_weight * e.risk) + exp.penalty;
                        if (req.avoid.count(e.to) > 0) {
                            w *= 5.0;
                        } else if (req.prefer.count(e.to) > 0) {
                            w *= 0.5;
                        }

                        Node cand;
                        cand.position = e.to;
                        cand.g = parent.g + w;
                        cand.seconds = parent.seconds + e.seconds;
                        cand.exposure = parent.exposure + exp.exposure;
                        cand.transitions = parent.transitions;
                        if (parent.edge.kind != EdgeKind::Start && parent.edge.mode != e.mode) {
                            ++cand.transitions;
                        }
                        cand.parent = top.node;
                        cand.edge = e;
                        cand.step_exposure = exp.exposure;

                        auto it = index.find(e.to);
                        dp::usize slot = 0;
                        if (it == index.end()) {
                            slot = nodes.size();
                            nodes.push_back(cand);
                            index[e.to] = slot;
                        } else {
                            slot = it->second;
                            if (nodes[slot].closed || !better(cand, nodes[slot])) {
                                continue;
                            }
                            nodes[slot] = cand;
                        }
                        open.push(Open{cand.g + heuristic(e.to, req.destination), cand.exposure, cand.transitions,
                                       cand.seconds, seq++, slot});
                    }
                }

                echo::debug("[planner] open set exhausted after ", expanded, " expansions");
                return dp::Result<SearchResult>::err(dp::Error::invalid_argument("no path found"));
            }

            /// Every edge leaving `p`.
            void expand(const Position &p, const SearchRequest &req, std::vector<Edge> &out) const {
                const auto here = world_.sample(p);
                if (!standable(here.surface)) {
                    return;
                }
                const bool in_liquid = here.surface == Surface::Liquid;

                static constexpr dp::i32 kDirs[8][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1},
                                                        {1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
                for (const auto &d : kDirs) {
                    const dp::i32 dx = d[0];
                    const dp::i32 dz = d[1];
                    const bool cardinal = dx == 0 || dz == 0;
                    const Position q = p.offset(dx, 0, dz);
                    const auto ahead = world_.sample(q);

                    if (!cardinal) {
                        if (!in_liquid) {
                            diagonal(p, q, ahead, req.caps, out);
                        }
                        continue;
                    }

                    switch (ahead.surface) {
                    case Surface::Solid:
                    case Surface::Climbable:
                        step(q, ahead, 1.0, req.caps, out);
                        break;
                    case Surface::Liquid:
                        if (in_liquid) {
                            paddle(q, ahead, req.caps, out);
                        } else {
                            crossing(p, dx, dz, req, out);
                        }
                        break;
                    case Surface::Obstruction:
                        rise(p, dx, dz, req.caps, out);
                        break;
                    case Surface::Void:
                        drop(q, req.caps, out);
                        if (!in_liquid) {
                            gap(p, dx, dz, req.caps, out);
                        }
                        break;
                    }
                }

                if (req.caps.has(MovementMode::Climb) && !in_liquid) {
                    vertical(p, here, 1, out);
                    vertical(p, here, -1, out);
                }
            }

          private:
            struct Node {
                Position position{};
                dp::f64 g = 0.0;
                dp::f64 seconds = 0.0;
                dp::f64 exposure = 0.0;
                dp::f64 step_exposure = 0.0;
                dp::u32 transitions = 0;
                dp::usize parent = 0;
                Edge edge{};
                bool closed = false;
            };

            struct Open {
                dp::f64 f = 0.0;
                dp::f64 exposure = 0.0;
                dp::u32 transitions = 0;
                dp::f64 seconds = 0.0;
                dp::u64 seq = 0;
                dp::usize node = 0;
            };

            static constexpr dp::f64 kEps = 1e-9;

            // True when `a` should be popped after `b`.
            struct OpenOrder {
                bool operator()(const Open &a, const Open &b) const {
                    if (std::abs(a.f - b.f) > kEps) {
                        return a.f > b.f;
                    }
                    if (std::abs(a.exposure - b.exposure) > kEps) {
                        return a.exposure > b.exposure;
                    }
                    if (a.transitions != b.transitions) {
                        return a.transitions > b.transitions;
                    }
                    if (std::abs(a.seconds - b.seconds) > kEps) {
                        return a.seconds > b.seconds;
                    }
                    return a.seq > b.seq;
                }
            };

            static bool better(const Node &a, const Node &b) {
                if (std::abs(a.g - b.g) > kEps) {
                    return a.g < b.g;
                }
                if (std::abs(a.exposure - b.exposure) > kEps) {
                    return a.exposure < b.exposure;
                }
                if (a.transitions != b.transitions) {
                    return a.transitions < b.transitions;
                }
                return a.seconds < b.seconds - kEps;
            }

            static bool violates(const Position &a, const Position &b, const dp::Vector<ClearanceConstraint> &cs) {
                for (const auto &c : cs) {
                    if (segment_distance(c.center, a.center(), b.center()) < c.min_clearance) {
                        return true;
                    }
                }
                return false;
            }

            static SearchResult build(const std::vector<Node> &nodes, dp::usize goal, dp::usize expanded) {
                std::vector<dp::usize> chain;
                for (dp::usize i = goal;; i = nodes[i].parent) {
                    chain.push_back(i);
                    if (i == 0) {
                        break;
                    }
                }
                SearchResult out;
                out.steps.reserve(chain.size());
                for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
                    const auto &n = nodes[*it];
                    out.steps.push_back(Step{n.position, n.edge, n.step_exposure});
                }
                out.seconds = nodes[goal].seconds;
                out.exposure = nodes[goal].exposure;
                out.weight = nodes[goal].g;
                out.expanded = expanded;
                return out;
            }

            // ---------------------------------------------------------------------------
            // Edge generators
            // ---------------------------------------------------------------------------

            static bool land(Surface s) { return s == Surface::Solid || s == Surface::Climbable; }

            /// Fastest mode for arriving on `s`, with its cost.
            static bool arrive(const TerrainSample &s, Capabilities caps, MovementMode &mode, terrain::MoveCost &cost) {
                auto m = terrain::best_mode(s, caps);
                if (!m.has_value()) {
                    return false;
                }
                mode = *m;
                cost = terrain::cost(s, mode);
                return cost.passable();
            }

            void step(const Position &q, const TerrainSample &s, dp::f64 length, Capabilities caps,
                      std::vector<Edge> &out) const {
                MovementMode mode = MovementMode::Walk;
                terrain::MoveCost c;
                if (!arrive(s, caps, mode, c)) {
                    return;
                }
                out.push_back(Edge{q, mode, EdgeKind::Step, length / c.speed, c.risk, terrain::factor(s, mode), 0});
            }

            void diagonal(const Position &p, const Position &q, const TerrainSample &s, Capabilities caps,
                          std::vector<Edge> &out) const {
                if (!land(s.surface)) {
                    return;
                }
                // No corner cutting: both orthogonal cells must be walkable too.
                if (!land(world_.sample(Position{q.x, p.y, p.z}).surface) ||
                    !land(world_.sample(Position{p.x, p.y, q.z}).surface)) {
                    return;
                }
                step(q, s, std::sqrt(2.0), caps, out);
            }

            /// One cell of movement while already in liquid.
            void paddle(const Position &q, const TerrainSample &s, Capabilities caps, std::vector<Edge> &out) const {
                MovementMode mode = MovementMode::Walk;
                terrain::MoveCost c;
                if (!arrive(s, caps, mode, c)) {
                    return;
                }
                const auto kind = mode == MovementMode::Ride ? EdgeKind::Vessel : EdgeKind::Swim;
                out.push_back(Edge{q, mode, kind, 1.0 / c.speed, c.risk, terrain::factor(s, mode), 1});
            }

            void vertical(const Position &p, const TerrainSample &here, dp::i32 dir, std::vector<Edge> &out) const {
                const Position q = p.offset(0, dir, 0);
                const auto s = world_.sample(q);
                if (!land(s.surface)) {
                    return;
                }
                if (here.surface != Surface::Climbable && s.surface != Surface::Climbable) {
                    return;
                }
                const auto &ladder = here.surface == Surface::Climbable ? here : s;
                const auto c = terrain::cost(ladder, MovementMode::Climb);
                if (!c.passable()) {
                    return;
                }
                out.push_back(Edge{q, MovementMode::Climb, EdgeKind::Climb, 1.0 / c.speed, c.risk,
                                   terrain::factor(ladder, MovementMode::Climb), 1});
            }

            /// Obstruction ahead: look for the top of the wall.
            void rise(const Position &p, dp::i32 dx, dp::i32 dz, Capabilities caps, std::vector<Edge> &out) const {
                for (dp::i32 r = 1; r <= cfg_.max_ascent; ++r) {
                    // Headroom above the agent.
                    if (world_.sample(p.offset(0, r, 0)).surface == Surface::Obstruction) {
                        return;
                    }
                    const Position top = p.offset(dx, r, dz);
                    const auto s = world_.sample(top);
                    if (s.surface == Surface::Obstruction) {
                        continue;
                    }
                    if (!land(s.surface)) {
                        return;
                    }
                    MovementMode mode = MovementMode::Walk;
                    terrain::MoveCost c;
                    if (!arrive(s, caps, mode, c)) {
                        return;
                    }
                    const dp::f64 walk_on = 1.0 / c.speed;
                    if (r <= 2) {
                        const bool climber = caps.has(MovementMode::Climb);
                        const dp::f64 per_block =
                            climber ? 1.0 / terrain::base_speed(MovementMode::Climb) : cfg_.ascent_seconds_per_block;
                        out.push_back(Edge{top, climber ? MovementMode::Climb : mode, EdgeKind::Climb,
                                           walk_on + r * per_block, c.risk + 0.05 * r, terrain::factor(s, mode), r});
                    } else {
                        out.push_back(Edge{top, mode, EdgeKind::Ascent, walk_on + r * cfg_.ascent_seconds_per_block,
                                           c.risk + 0.05 * r, terrain::factor(s, mode), r});
                    }
                    return;
                }
            }

            /// Void ahead: fall (or glide) to the first surface below.
            void drop(const Position &q, Capabilities caps, std::vector<Edge> &out) const {
                const bool glider = caps.has(MovementMode::Glide);
                const dp::i32 limit = glider ? cfg_.max_glide_drop : cfg_.max_safe_drop;
                for (dp::i32 h = 1; h <= limit; ++h) {
                    const Position below = q.offset(0, -h, 0);
                    const auto s = world_.sample(below);
                    if (s.surface == Surface::Void) {
                        continue;
                    }
                    if (!standable(s.surface)) {
                        return;
                    }
                    MovementMode mode = MovementMode::Walk;
                    terrain::MoveCost c;
                    if (!arrive(s, caps, mode, c)) {
                        return;
                    }
                    if (h <= cfg_.max_safe_drop) {
                        const dp::f64 fall = std::sqrt(2.0 * h / kGravity);
                        out.push_back(Edge{below, mode, EdgeKind::Drop, 1.0 / c.speed + fall, c.risk + 0.1 * h,
                                           terrain::factor(s, mode), h});
                    } else {
                        const auto g = terrain::cost(TerrainSample::of(Surface::Void), MovementMode::Glide);
                        out.push_back(Edge{below, MovementMode::Glide, EdgeKind::Drop, h / g.speed + 1.0 / c.speed,
                                           g.risk + c.risk, 1.0, h});
                    }
                    return;
                }
            }

            /// Void ahead on a cardinal heading: look for the far lip at the same level.
            void gap(const Position &p, dp::i32 dx, dp::i32 dz, Capabilities caps, std::vector<Edge> &out) const {
                const dp::i32 reach = std::max(kMaxJumpGap, cfg_.allow_bridging ? cfg_.max_bridge_span : 0) + 1;
                for (dp::i32 k = 2; k <= reach; ++k) {
                    const Position lip = p.offset(k * dx, 0, k * dz);
                    const auto s = world_.sample(lip);
                    if (s.surface == Surface::Void) {
                        continue;
                    }
                    if (!land(s.surface)) {
                        return;
                    }
                    MovementMode mode = MovementMode::Walk;
                    terrain::MoveCost c;
                    if (!arrive(s, caps, mode, c)) {
                        return;
                    }
                    const dp::i32 width = k - 1;
                    const dp::f64 f = terrain::factor(s, mode);
                    if (width == 1) {
                        out.push_back(Edge{lip, mode, EdgeKind::Step, 2.0 / c.speed, c.risk + 0.1, f, width});
                        return;
                    }
                    if (width <= kMaxJumpGap && caps.has(MovementMode::Sprint)) {
                        const auto run = terrain::cost(s, MovementMode::Sprint);
                        if (run.passable()) {
                            const dp::f64 p_ok = cfg_.jump_success_probability;
                            out.push_back(Edge{lip, MovementMode::Sprint, EdgeKind::Jump, (k / run.speed) / p_ok,
                                               run.risk + (1.0 - p_ok), terrain::factor(s, MovementMode::Sprint),
                                               width});
                            return;
                        }
                    }
                    if (cfg_.allow_bridging && width <= cfg_.max_bridge_span) {
                        out.push_back(Edge{lip, mode, EdgeKind::Bridge,
                                           width * cfg_.bridge_seconds_per_block + k / c.speed, c.risk, f, width});
                    }
                    return;
                }
            }

            /// Liquid ahead from dry land: cross the whole run in one edge.
            void crossing(const Position &p, dp::i32 dx, dp::i32 dz, const SearchRequest &req,
                          std::vector<Edge> &out) const {
                const auto caps = req.caps;
                const auto swim = caps.has(MovementMode::SwimSurface) ? MovementMode::SwimSurface
                                                                       : MovementMode::SwimSubmerged;
                bool swim_ok = caps.can_swim();
                bool ride_ok = caps.has(MovementMode::Ride);
                dp::f64 swim_s = 0.0, swim_risk = 0.0;
                dp::f64 ride_s = 0.0, ride_risk = 0.0;
                dp::f64 swim_f = 0.0, ride_f = 0.0;

                dp::i32 width = 0;
                for (dp::i32 k = 1; k <= kMaxCrossing; ++k) {
                    const Position cell = p.offset(k * dx, 0, k * dz);
                    const auto s = world_.sample(cell);
                    if (s.surface == Surface::Liquid) {
                        width = k;
                        const auto sc = terrain::cost(s, swim);
                        const auto rc = terrain::cost(s, MovementMode::Ride);
                        swim_ok = swim_ok && sc.passable();
                        ride_ok = ride_ok && rc.passable();
                        if (sc.passable()) {
                            swim_s += 1.0 / sc.speed;
                            swim_risk = std::max(swim_risk, sc.risk);
                            swim_f += terrain::factor(s, swim);
                        }
                        if (rc.passable()) {
                            ride_s += 1.0 / rc.speed;
                            ride_risk = std::max(ride_risk, rc.risk);
                            ride_f += terrain::factor(s, MovementMode::Ride);
                        }
                        if (cell == req.destination) {
                            emit_crossing(cell, width, nullptr, swim, swim_ok, swim_s, swim_risk, swim_f / width,
                                          ride_ok, ride_s, ride_risk, ride_f / width, caps, out);
                            return;
                        }
                        continue;
                    }
                    if (!land(s.surface) || width == 0) {
                        return;
                    }
                    emit_crossing(cell, width, &s, swim, swim_ok, swim_s, swim_risk, swim_f / width, ride_ok, ride_s,
                                  ride_risk, ride_f / width, caps, out);
                    return;
                }
            }

            void emit_crossing(const Position &landing, dp::i32 width, const TerrainSample *shore, MovementMode swim,
                               bool swim_ok, dp::f64 swim_s, dp::f64 swim_risk, dp::f64 swim_f, bool ride_ok,
                               dp::f64 ride_s, dp::f64 ride_risk, dp::f64 ride_f, Capabilities caps,
                               std::vector<Edge> &out) const {
                dp::f64 ashore = 0.0;
                dp::f64 shore_risk = 0.0;
                MovementMode shore_mode = MovementMode::Walk;
                if (shore != nullptr) {
                    terrain::MoveCost c;
                    if (!arrive(*shore, caps, shore_mode, c)) {
                        return;
                    }
                    ashore = 1.0 / c.speed;
                    shore_risk = c.risk;
                }

                const bool bridge_ok = shore != nullptr && cfg_.allow_bridging && width <= cfg_.max_bridge_span;
                auto swim_edge = [&] {
                    out.push_back(Edge{landing, swim, EdgeKind::Swim, swim_s + ashore, std::max(swim_risk, shore_risk),
                                       swim_f, width});
                };

                if (swim_ok && width <= cfg_.swim_threshold) {
                    swim_edge();
                } else if (ride_ok) {
                    out.push_back(Edge{landing, MovementMode::Ride, EdgeKind::Vessel,
                                       cfg_.vessel_boarding_seconds + ride_s + ashore,
                                       std::max(ride_risk, shore_risk), ride_f, width});
                } else if (bridge_ok) {
                    out.push_back(Edge{landing, shore_mode, EdgeKind::Bridge,
                                       width * cfg_.bridge_seconds_per_block + (width + 1) * ashore, shore_risk, 1.0,
                                       width});
                } else if (swim_ok) {
                    swim_edge();
                }
            }

            const WorldQuery &world_;
            PlannerConfig cfg_;
            HazardFilter filter_;
        };

    } // namespace planner
} // namespace convoy
