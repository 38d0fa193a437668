#pragma once

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>

#include "convoy/config.hpp"
#include "convoy/terrain.hpp"
#include "convoy/types.hpp"

namespace convoy {

    /// A lethal hazard the next search must keep `min_clearance` away from.
    struct ClearanceConstraint {
        HazardId hazard = 0;
        dp::Point center{};
        dp::f64 min_clearance = 0.0;
    };

    enum class VerdictKind : dp::u8 {
        Accept = 0,
        Reject = 1,
        Reroute = 2,
    };

    inline const char *to_string(VerdictKind k) {
        switch (k) {
        case VerdictKind::Accept:
            return "accept";
        case VerdictKind::Reject:
            return "reject";
        case VerdictKind::Reroute:
            return "reroute";
        }
        return "unknown";
    }

    struct Verdict {
        VerdictKind kind = VerdictKind::Accept;
        // Set for Reroute (violated zones) and Reject (zones covering an endpoint).
        dp::Vector<ClearanceConstraint> constraints;
        // Seconds spent inside dangerous zones and the penalty they add.
        dp::f64 exposure = 0.0;
        dp::f64 penalty = 0.0;
        dp::Vector<HazardId> dangerous;
        dp::Vector<HazardId> advisories;

        bool accepted() const { return kind == VerdictKind::Accept; }
    };

    /// Exposure of a single straight segment.
    struct SegmentExposure {
        dp::f64 exposure = 0.0;
        dp::f64 penalty = 0.0;
    };

    // =============================================================================================
    // Filter
    // =============================================================================================

    class HazardFilter {
      public:
        explicit HazardFilter(HazardConfig cfg = {}) : cfg_(cfg) {}

        const HazardConfig &config() const { return cfg_; }

        dp::f64 lethal_radius(const HazardRecord &h) const { return h.radius + cfg_.lethal_clearance; }

        bool counts_as_dangerous(const HazardRecord &h, bool advisory_override) const {
            return h.severity == Severity::Dangerous || (advisory_override && h.severity == Severity::Advisory);
        }

        /// Dangerous-zone exposure of a segment that takes `seconds` to traverse.
        ///
        /// Lethal hazards are not scored here; they are enforced through constraints.
        SegmentExposure assess(const dp::Point &a, const dp::Point &b, dp::f64 seconds,
                               const dp::Vector<HazardRecord> &hazards, bool advisory_override) const {
            SegmentExposure out;
            for (const auto &h : hazards) {
                if (!counts_as_dangerous(h, advisory_override)) {
                    continue;
                }
                if (segment_distance(h.location, a, b) < h.radius) {
                    out.exposure += seconds;
                }
            }
            out.penalty = out.exposure * cfg_.danger_weight;
            return out;
        }

        /// Ids of non-lethal hazards whose zone touches the segment.
        dp::Vector<HazardId> touching(const dp::Point &a, const dp::Point &b,
                                      const dp::Vector<HazardRecord> &hazards) const {
            dp::Vector<HazardId> out;
            for (const auto &h : hazards) {
                if (h.severity != Severity::Lethal && segment_distance(h.location, a, b) < h.radius) {
                    out.push_back(h.id);
                }
            }
            return out;
        }

        /// Judge a candidate path against the hazard set.
        Verdict filter(const Path &path, const dp::Vector<HazardRecord> &hazards,
                       bool advisory_override = false) const {
            Verdict v;
            if (path.waypoints.size() == 0) {
                return v;
            }
            const auto origin = path.waypoints[0].position.center();
            const auto dest = path.waypoints[path.waypoints.size() - 1].position.center();

            for (const auto &h : hazards) {
                if (h.severity != Severity::Lethal) {
                    continue;
                }
                const dp::f64 zone = lethal_radius(h);
                if (separation(origin, h.location) < zone || separation(dest, h.location) < zone) {
                    echo::warn("[hazard] lethal hazard ", h.id, " covers a path endpoint");
                    v.kind = VerdictKind::Reject;
                    v.constraints.push_back(ClearanceConstraint{h.id, h.location, zone});
                }
            }
            if (v.kind == VerdictKind::Reject) {
                return v;
            }

            for (dp::usize i = 1; i < path.waypoints.size(); ++i) {
                const auto &from = path.waypoints[i - 1];
                const auto &to = path.waypoints[i];
                const auto a = from.position.center();
                const auto b = to.position.center();

                for (const auto &h : hazards) {
                    const dp::f64 d = segment_distance(h.location, a, b);
                    switch (h.severity) {
                    case Severity::Lethal: {
                        const dp::f64 zone = lethal_radius(h);
                        if (d < zone && !has_constraint(v, h.id)) {
                            v.constraints.push_back(ClearanceConstraint{h.id, h.location, zone});
                        }
                        break;
                    }
                    case Severity::Dangerous:
                        if (d < h.radius) {
                            v.exposure += segment_seconds(from, to);
                            add_unique(v.dangerous, h.id);
                        }
                        break;
                    case Severity::Advisory:
                        if (d < h.radius) {
                            if (!contains(v.advisories, h.id)) {
                                echo::info("[hazard] path ", path.id, " passes advisory hazard ", h.id);
                                v.advisories.push_back(h.id);
                            }
                            if (advisory_override) {
                                v.exposure += segment_seconds(from, to);
                                add_unique(v.dangerous, h.id);
                            }
                        }
                        break;
                    }
                }
            }
            v.penalty = v.exposure * cfg_.danger_weight;
            if (v.constraints.size() > 0) {
                v.kind = VerdictKind::Reroute;
                echo::debug("[hazard] path ", path.id, " violates ", v.constraints.size(), " lethal zone(s)");
            }
            return v;
        }

        /// Nominal time for one waypoint segment at the mode's base speed.
        static dp::f64 segment_seconds(const Waypoint &from, const Waypoint &to) {
            const dp::f64 speed = terrain::base_speed(to.mode) * std::max(to.terrain_factor, terrain::kMinSpeedFactor);
            return separation(from.position, to.position) / speed;
        }

      private:
        HazardConfig cfg_;

        static bool contains(const dp::Vector<HazardId> &ids, HazardId id) {
            for (auto x : ids) {
                if (x == id) {
                    return true;
                }
            }
            return false;
        }

        static void add_unique(dp::Vector<HazardId> &ids, HazardId id) {
            if (!contains(ids, id)) {
                ids.push_back(id);
            }
        }

        static bool has_constraint(const Verdict &v, HazardId id) {
            for (const auto &c : v.constraints) {
                if (c.hazard == id) {
                    return true;
                }
            }
            return false;
        }
    };

    // =============================================================================================
    // Transient hazards
    // =============================================================================================

    /// Hazards injected at runtime by collaborators, merged with the world's at plan time.
    class HazardBoard {
      public:
        // Injected ids live above the range worlds hand out.
        static constexpr HazardId kFirstId = HazardId{1} << 48;

        HazardBoard() = default;
        HazardBoard(const HazardBoard &) = delete;
        HazardBoard &operator=(const HazardBoard &) = delete;

        /// Add a hazard that disappears once tick `expires_at` is reached (0 = never).
        HazardId inject(HazardRecord h, dp::u64 expires_at = 0) {
            std::lock_guard<std::mutex> lock(mu_);
            if (h.id == 0) {
                h.id = next_id_++;
            }
            entries_.push_back(Entry{h, expires_at});
            version_.fetch_add(1, std::memory_order_acq_rel);
            echo::info("[hazard] injected hazard ", h.id, " severity ", static_cast<int>(h.severity));
            return h.id;
        }

        bool retract(HazardId id) {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry &e) { return e.hazard.id == id; });
            if (it == entries_.end()) {
                return false;
            }
            entries_.erase(it);
            version_.fetch_add(1, std::memory_order_acq_rel);
            return true;
        }

        /// Drop every hazard whose expiry tick is at or before `tick`.
        dp::usize expire(dp::u64 tick) {
            std::lock_guard<std::mutex> lock(mu_);
            const auto before = entries_.size();
            entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                          [tick](const Entry &e) { return e.expires_at != 0 && e.expires_at <= tick; }),
                           entries_.end());
            const auto dropped = before - entries_.size();
            if (dropped > 0) {
                version_.fetch_add(1, std::memory_order_acq_rel);
            }
            return dropped;
        }

        dp::Vector<HazardRecord> near(const dp::Point &center, dp::f64 radius) const {
            std::lock_guard<std::mutex> lock(mu_);
            dp::Vector<HazardRecord> out;
            for (const auto &e : entries_) {
                if (separation(center, e.hazard.location) <= radius + e.hazard.radius) {
                    out.push_back(e.hazard);
                }
            }
            return out;
        }

        dp::usize size() const {
            std::lock_guard<std::mutex> lock(mu_);
            return entries_.size();
        }

        /// Bumped on every change; agents compare it to decide whether to re-check their path.
        dp::u64 version() const { return version_.load(std::memory_order_acquire); }

      private:
        struct Entry {
            HazardRecord hazard;
            dp::u64 expires_at = 0;
        };

        mutable std::mutex mu_;
        std::vector<Entry> entries_;
        HazardId next_id_ = kFirstId;
        std::atomic<dp::u64> version_{0};
    };

} // namespace convoy
