#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <vector>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/result.hpp>
#include <datapod/pods/temporal/stamp.hpp>

#include "convoy/cancel.hpp"
#include "convoy/config.hpp"
#include "convoy/hazard.hpp"
#include "convoy/memory.hpp"
#include "convoy/planner/regions.hpp"
#include "convoy/planner/search.hpp"
#include "convoy/planner/smoother.hpp"
#include "convoy/types.hpp"
#include "convoy/world.hpp"

namespace convoy {
    namespace planner {

        struct PlanRequest {
            Position origin{};
            Position destination{};
            Capabilities caps{};

            // Treat advisory hazards as dangerous.
            bool advisory_override = false;
            // Skip the cache lookup (the result is still recorded).
            bool bypass_memory = false;

            CellSet avoid;
            CellSet prefer;

            const CancelToken *cancel = nullptr;
        };

        /// Planning entry point shared by every agent.
        ///
        /// Holds no per-call state, so concurrent `plan` calls from different agents are safe as
        /// long as the world, memory store and hazard board are.
        class RoutePlanner {
          public:
            RoutePlanner(const WorldQuery &world, PathMemoryStore *memory, const HazardBoard *board, Config cfg)
                : world_(world), memory_(memory), board_(board), cfg_(cfg), search_(world, cfg.planner, cfg.hazard),
                  regions_(world, cfg.planner, cfg.memory.region_size), filter_(cfg.hazard) {}

            const Config &config() const { return cfg_; }
            const HazardFilter &filter() const { return filter_; }

            /// Time allowed for one plan over `dist` blocks.
            std::chrono::milliseconds budget(dp::f64 dist) const {
                const dp::f64 scale = 1.0 + std::min(dist / 100.0, 5.0);
                const auto ms = static_cast<dp::i64>(static_cast<dp::f64>(cfg_.planner.timeout_ms) * scale);
                return std::chrono::milliseconds(std::min(ms, cfg_.planner.max_timeout_ms));
            }

            /// World hazards around the origin/destination corridor plus injected ones.
            dp::Vector<HazardRecord> hazards_between(const Position &a, const Position &b) const {
                const Position mid{(a.x + b.x) / 2, (a.y + b.y) / 2, (a.z + b.z) / 2};
                const dp::f64 radius = separation(a, b) / 2.0 + cfg_.planner.hazard_margin;
                auto out = world_.hazards_near(mid, radius);
                if (board_) {
                    for (const auto &h : board_->near(mid.center(), radius)) {
                        out.push_back(h);
                    }
                }
                return out;
            }

            /// Hazards that could touch any part of `path`: everything within lethal clearance of its
            /// bounding box.
            dp::Vector<HazardRecord> hazards_along(const Path &path) const {
                if (path.waypoints.empty()) {
                    return {};
                }
                Position lo = path.waypoints[0].position;
                Position hi = lo;
                for (const auto &w : path.waypoints) {
                    lo.x = std::min(lo.x, w.position.x);
                    lo.y = std::min(lo.y, w.position.y);
                    lo.z = std::min(lo.z, w.position.z);
                    hi.x = std::max(hi.x, w.position.x);
                    hi.y = std::max(hi.y, w.position.y);
                    hi.z = std::max(hi.z, w.position.z);
                }
                const Position mid{lo.x + (hi.x - lo.x) / 2, lo.y + (hi.y - lo.y) / 2, lo.z + (hi.z - lo.z) / 2};
                // +1 covers the rounding of `mid`.
                const dp::f64 radius = separation(lo, hi) / 2.0 + 1.0 + cfg_.hazard.lethal_clearance;
                auto out = world_.hazards_near(mid, radius);
                if (board_) {
                    absorb(out, board_->near(mid.center(), radius));
                }
                return out;
            }

            /// Add hazards not already in `into`. Returns true when anything was added.
            static bool absorb(dp::Vector<HazardRecord> &into, const dp::Vector<HazardRecord> &more) {
                bool grew = false;
                for (const auto &h : more) {
                    const bool known = std::any_of(into.begin(), into.end(), [&](const HazardRecord &k) {
                        return k.id == h.id && separation(k.location, h.location) < 1e-9;
                    });
                    if (!known) {
                        into.push_back(h);
                        grew = true;
                    }
                }
                return grew;
            }

            dp::Result<Path> request_path(const Position &origin, const Position &destination, Capabilities caps) {
                PlanRequest req;
                req.origin = origin;
                req.destination = destination;
                req.caps = caps;
                return plan(req);
            }

            dp::Result<Path> plan(const PlanRequest &req) {
                const dp::f64 dist = separation(req.origin, req.destination);
                if (dist > cfg_.planner.max_hierarchical_range) {
                    echo::warn("[planner] destination ", dist, " blocks away exceeds range ",
                               cfg_.planner.max_hierarchical_range);
                    return dp::Result<Path>::err(dp::Error::invalid_argument("destination out of range"));
                }
                if (is_cancelled(req.cancel)) {
                    return dp::Result<Path>::err(dp::Error::invalid_argument("planning cancelled"));
                }

                auto hazards = hazards_between(req.origin, req.destination);

                SearchRequest sreq;
                sreq.origin = req.origin;
                sreq.destination = req.destination;
                sreq.caps = req.caps;
                sreq.hazards = hazards;
                sreq.advisory_override = req.advisory_override;
                sreq.avoid = req.avoid;
                sreq.prefer = req.prefer;
                sreq.cancel = req.cancel;
                sreq.deadline = Clock::now() + budget(dist);

                if (memory_ && !req.bypass_memory) {
                    const auto candidates = memory_->lookup(req.origin, req.destination, req.caps);
                    for (const auto &cand : candidates) {
                        if (cand->status != PathStatus::Fresh || cand->origin != req.origin ||
                            cand->destination != req.destination) {
                            continue;
                        }
                        auto known = hazards;
                        absorb(known, hazards_along(*cand));
                        const auto v = filter_.filter(*cand, known, req.advisory_override);
                        if (v.accepted()) {
                            echo::debug("[planner] reusing cached path ", cand->id);
                            return dp::Result<Path>::ok(*cand);
                        }
                        echo::info("[planner] cached path ", cand->id, " failed hazard check: ", to_string(v.kind));
                    }
                    for (const auto &cand : candidates) {
                        if (cand->status != PathStatus::Fresh ||
                            separation(cand->origin, req.origin) > cfg_.planner.splice_distance ||
                            separation(cand->destination, req.destination) > cfg_.planner.splice_distance ||
                            (cand->origin == req.origin && cand->destination == req.destination)) {
                            continue;
                        }
                        auto spliced = splice(req, *cand, sreq, hazards);
                        if (spliced.is_ok()) {
                            return spliced;
                        }
                        echo::debug("[planner] cached path ", cand->id, " not spliced: ",
                                    spliced.error().message.c_str());
                    }
                }

                for (dp::usize attempt = 0; attempt <= cfg_.planner.max_reroutes; ++attempt) {
                    auto found = dist > cfg_.planner.max_range ? search_legs(sreq) : search_.run(sreq);
                    if (found.is_err()) {
                        echo::warn("[planner] no path: ", found.error().message.c_str());
                        return dp::Result<Path>::err(found.error());
                    }

                    Path path = assemble(req, found.value(), hazards);
                    // A detour can leave the corridor the hazards were first gathered for.
                    if (absorb(hazards, hazards_along(path))) {
                        sreq.hazards = hazards;
                        path = assemble(req, found.value(), hazards);
                    }
                    const auto v = filter_.filter(path, hazards, req.advisory_override);
                    if (v.kind == VerdictKind::Accept) {
                        path.hazard_exposure = v.exposure;
                        keep(path);
                        echo::debug("[planner] path ", path.id, ": ", path.waypoints.size(), " waypoints, ",
                                    path.time_estimate, " s, ", found.value().expanded, " expansions");
                        return dp::Result<Path>::ok(path);
                    }
                    if (v.kind == VerdictKind::Reject) {
                        return dp::Result<Path>::err(dp::Error::invalid_argument("lethal hazard covers an endpoint"));
                    }
                    for (const auto &c : v.constraints) {
                        echo::info("[planner] rerouting around lethal hazard ", c.hazard, " with clearance ",
                                   c.min_clearance);
                        sreq.constraints.push_back(c);
                    }
                }
                return dp::Result<Path>::err(dp::Error::invalid_argument("reroute limit reached"));
            }

          private:
            /// Record an accepted path, or just number it when there is no memory.
            void keep(Path &path) {
                if (memory_) {
                    path.id = memory_->record(path);
                    if (auto stored = memory_->find(path.id)) {
                        path = *stored;
                    }
                } else {
                    path.id = next_id_.fetch_add(1, std::memory_order_relaxed);
                }
            }

            /// Region route first, then one local search per leg of at most `leg_length`.
            dp::Result<SearchResult> search_legs(const SearchRequest &sreq) const {
                auto coarse = regions_.route(sreq.origin, sreq.destination, sreq.cancel);
                if (coarse.is_err()) {
                    return dp::Result<SearchResult>::err(coarse.error());
                }
                const auto &anchors = coarse.value();

                SearchResult out;
                Position from = sreq.origin;
                dp::usize next = 0;
                while (next < anchors.size()) {
                    if (Clock::now() > sreq.deadline) {
                        return dp::Result<SearchResult>::err(dp::Error::invalid_argument("planning deadline exceeded"));
                    }
                    // Furthest anchor within one leg first, then nearer ones, then further ones in range.
                    dp::usize far = next;
                    while (far + 1 < anchors.size() && separation(from, anchors[far + 1]) <= cfg_.planner.leg_length) {
                        ++far;
                    }
                    std::vector<dp::usize> order;
                    for (dp::usize k = far + 1; k-- > next;) {
                        order.push_back(k);
                    }
                    for (dp::usize k = far + 1; k < anchors.size(); ++k) {
                        if (separation(from, anchors[k]) > cfg_.planner.max_range) {
                            break;
                        }
                        order.push_back(k);
                    }

                    bool advanced = false;
                    for (auto k : order) {
                        if (separation(from, anchors[k]) > cfg_.planner.max_range) {
                            continue;
                        }
                        SearchRequest leg = sreq;
                        leg.origin = from;
                        leg.destination = anchors[k];
                        auto found = search_.run(leg);
                        if (found.is_err()) {
                            echo::debug("[planner] leg to ", anchors[k].x, ",", anchors[k].y, ",", anchors[k].z,
                                        " failed: ", found.error().message.c_str());
                            continue;
                        }
                        const auto &steps = found.value().steps;
                        for (dp::usize i = out.steps.empty() ? 0 : 1; i < steps.size(); ++i) {
                            out.steps.push_back(steps[i]);
                        }
                        out.seconds += found.value().seconds;
                        out.exposure += found.value().exposure;
                        out.weight += found.value().weight;
                        out.expanded += found.value().expanded;
                        from = anchors[k];
                        next = k + 1;
                        advanced = true;
                        break;
                    }
                    if (!advanced) {
                        return dp::Result<SearchResult>::err(dp::Error::invalid_argument("no leg between regions"));
                    }
                }
                echo::debug("[planner] stitched ", out.steps.size(), " steps over ", anchors.size(), " regions");
                return dp::Result<SearchResult>::ok(out);
            }

            /// Extend a cached path whose ends lie within `splice_distance` of the request.
            dp::Result<Path> splice(const PlanRequest &req, const Path &cached, const SearchRequest &sreq,
                                    dp::Vector<HazardRecord> hazards) {
                const auto n = cached.waypoints.size();
                if (n < 2) {
                    return dp::Result<Path>::err(dp::Error::invalid_argument("cached path has no segments"));
                }
                // Never double back: the request must start behind the cached route and end beyond it.
                const auto &second = cached.waypoints[1].position;
                const auto &penultimate = cached.waypoints[n - 2].position;
                if (separation(req.origin, second) < separation(cached.origin, second) ||
                    separation(req.destination, penultimate) < separation(cached.destination, penultimate)) {
                    return dp::Result<Path>::err(dp::Error::invalid_argument("splice would double back"));
                }

                dp::Vector<Waypoint> wps;
                dp::f64 seconds = cached.time_estimate;
                if (cached.origin != req.origin) {
                    SearchRequest head = sreq;
                    head.destination = cached.origin;
                    auto found = search_.run(head);
                    if (found.is_err()) {
                        return dp::Result<Path>::err(found.error());
                    }
                    wps = waypoints_of(found.value().steps, req.origin, hazards);
                    seconds += found.value().seconds;
                }
                for (dp::usize i = wps.empty() ? 0 : 1; i < cached.waypoints.size(); ++i) {
                    wps.push_back(cached.waypoints[i]);
                }
                if (cached.destination != req.destination) {
                    SearchRequest tail = sreq;
                    tail.origin = cached.destination;
                    auto found = search_.run(tail);
                    if (found.is_err()) {
                        return dp::Result<Path>::err(found.error());
                    }
                    const auto more = waypoints_of(found.value().steps, cached.destination, hazards);
                    for (dp::usize i = 1; i < more.size(); ++i) {
                        wps.push_back(more[i]);
                    }
                    seconds += found.value().seconds;
                }

                Path path = shell(req);
                path.time_estimate = seconds;
                finish(path, wps);
                absorb(hazards, hazards_along(path));
                const auto v = filter_.filter(path, hazards, req.advisory_override);
                if (!v.accepted()) {
                    return dp::Result<Path>::err(dp::Error::invalid_argument("spliced path failed hazard check"));
                }
                path.hazard_exposure = v.exposure;
                keep(path);
                echo::debug("[planner] spliced cached path ", cached.id, " into ", path.id);
                return dp::Result<Path>::ok(path);
            }

            Path shell(const PlanRequest &req) const {
                Path path;
                path.origin = req.origin;
                path.destination = req.destination;
                path.created_at = dp::Stamp<Path>::now();
                path.last_validated_at = path.created_at;
                path.origin_region = Region::of(req.origin, cfg_.memory.region_size);
                path.destination_region = Region::of(req.destination, cfg_.memory.region_size);
                path.confidence_rating = cfg_.memory.initial_rating;
                return path;
            }

            Path assemble(const PlanRequest &req, const SearchResult &found,
                          const dp::Vector<HazardRecord> &hazards) const {
                Path path = shell(req);
                path.time_estimate = found.seconds;
                path.hazard_exposure = found.exposure;
                finish(path, waypoints_of(found.steps, req.origin, hazards));
                return path;
            }

            dp::Vector<Waypoint> waypoints_of(const dp::Vector<Step> &steps, const Position &start,
                                              const dp::Vector<HazardRecord> &hazards) const {
                dp::Vector<Waypoint> wps;
                wps.reserve(steps.size());
                for (dp::usize i = 0; i < steps.size(); ++i) {
                    const auto &s = steps[i];
                    Waypoint w;
                    w.position = s.position;
                    w.mode = s.edge.mode;
                    w.edge = s.edge.kind;
                    w.span = s.edge.span;
                    w.terrain_factor = s.edge.factor;
                    if (i > 0) {
                        const auto &prev = steps[i - 1].position;
                        w.position.facing =
                            facing_of(s.position.x - prev.x, s.position.y - prev.y, s.position.z - prev.z);
                        w.hazard_refs = filter_.touching(prev.center(), s.position.center(), hazards);
                    } else {
                        w.position.facing = start.facing;
                    }
                    wps.push_back(w);
                }
                return wps;
            }

            void finish(Path &path, const dp::Vector<Waypoint> &wps) const {
                path.waypoints = cfg_.planner.smooth ? smooth(wps) : wps;
                path.mode_sequence.clear();
                for (dp::usize i = 1; i < path.waypoints.size(); ++i) {
                    const auto m = path.waypoints[i].mode;
                    const auto n = path.mode_sequence.size();
                    if (n == 0 || path.mode_sequence[n - 1] != m) {
                        path.mode_sequence.push_back(m);
                    }
                }
            }

            const WorldQuery &world_;
            PathMemoryStore *memory_;
            const HazardBoard *board_;
            Config cfg_;
            GridSearch search_;
            RegionRouter regions_;
            HazardFilter filter_;
            std::atomic<PathId> next_id_{1};
        };

    } // namespace planner
} // namespace convoy
