#pragma once

#include <algorithm>
#include <cmath>
#include <deque>
#include <numbers>
#include <unordered_map>
#include <utility>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>

#include "convoy/config.hpp"
#include "convoy/types.hpp"

namespace convoy {
    namespace mission {

        enum class FormationType : dp::u8 {
            Line = 0,
            Column = 1,
            Wedge = 2,
            Circle = 3,
        };

        inline const char *to_string(FormationType t) {
            switch (t) {
            case FormationType::Line:
                return "line";
            case FormationType::Column:
                return "column";
            case FormationType::Wedge:
                return "wedge";
            case FormationType::Circle:
                return "circle";
            }
            return "unknown";
        }

        struct Formation {
            AgentId leader = 0;
            dp::Vector<AgentId> followers;
            FormationType type = FormationType::Column;
            dp::f64 spacing_tolerance = 5.0;
        };

        /// Where a follower should be, relative to the leader's trail.
        struct SlotOffset {
            // Arc length behind the leader along the trail.
            dp::f64 back = 0.0;
            // Sideways offset, positive to the right of the heading.
            dp::f64 lateral = 0.0;
            // Circle slots sit around the anchor at this angle instead.
            dp::Optional<dp::f64> angle;
        };

        struct FormationStatus {
            dp::f64 pace = 1.0;
            dp::f64 max_deviation = 0.0;
            dp::u32 throttled_ticks = 0;
            bool throttled = false;
            bool broken = false;
        };

        /// Spacing control loop: followers track slots on the leader's trail, and the leader's pace
        /// drops while any follower is out of tolerance.
        class FormationController {
          public:
            FormationController(Formation f, FormationConfig cfg) : formation_(std::move(f)), cfg_(cfg) {
                if (formation_.spacing_tolerance <= 0.0) {
                    formation_.spacing_tolerance = cfg_.spacing_tolerance;
                }
            }

            const Formation &formation() const { return formation_; }
            dp::f64 tolerance() const { return formation_.spacing_tolerance; }
            dp::f64 pace() const { return status_.pace; }
            const FormationStatus &status() const { return status_; }

            /// Append the leader's position to the trail when it has moved.
            void publish_leader(const dp::Point &p) {
                leader_ = p;
                if (!trail_.empty() && separation(trail_.front(), p) < 0.25) {
                    return;
                }
                trail_.push_front(p);
                while (trail_.size() > cfg_.trail_capacity) {
                    trail_.pop_back();
                }
            }

            void report(AgentId follower, const dp::Point &p) { positions_[follower] = p; }

            dp::Optional<dp::usize> index_of(AgentId follower) const {
                for (dp::usize i = 0; i < formation_.followers.size(); ++i) {
                    if (formation_.followers[i] == follower) {
                        return i;
                    }
                }
                return dp::nullopt;
            }

            SlotOffset offset(dp::usize i) const {
                const dp::usize n = formation_.followers.size();
                const dp::f64 s = cfg_.spacing;
                SlotOffset o;
                switch (formation_.type) {
                case FormationType::Column:
                    o.back = static_cast<dp::f64>(i + 1) * s;
                    break;
                case FormationType::Line: {
                    o.back = s;
                    o.lateral = (static_cast<dp::f64>(i) - static_cast<dp::f64>(n - 1) / 2.0) * s;
                    break;
                }
                case FormationType::Wedge: {
                    const dp::f64 rank = static_cast<dp::f64>(i / 2 + 1);
                    o.back = rank * s;
                    o.lateral = (i % 2 == 0 ? 1.0 : -1.0) * rank * s;
                    break;
                }
                case FormationType::Circle:
                    o.back = 0.0;
                    o.angle = 2.0 * std::numbers::pi * static_cast<dp::f64>(i) / static_cast<dp::f64>(std::max<dp::usize>(n, 1));
                    break;
                }
                return o;
            }

            /// Trail point `back` blocks behind the leader, or the oldest point if the trail is short.
            dp::Point trail_point(dp::f64 back) const {
                if (trail_.empty()) {
                    return leader_;
                }
                dp::f64 walked = separation(leader_, trail_.front());
                if (walked >= back) {
                    return lerp(leader_, trail_.front(), back / std::max(walked, 1e-9));
                }
                for (dp::usize k = 1; k < trail_.size(); ++k) {
                    const dp::f64 seg = separation(trail_[k - 1], trail_[k]);
                    if (walked + seg >= back) {
                        return lerp(trail_[k - 1], trail_[k], (back - walked) / std::max(seg, 1e-9));
                    }
                    walked += seg;
                }
                return trail_.back();
            }

            /// Target point for a follower.
            dp::Optional<dp::Point> slot(AgentId follower) const {
                auto i = index_of(follower);
                if (!i.has_value()) {
                    return dp::nullopt;
                }
                const auto o = offset(*i);
                const auto anchor = trail_point(o.back);
                if (o.angle.has_value()) {
                    return dp::Point{anchor.x + cfg_.spacing * std::cos(*o.angle), anchor.y,
                                     anchor.z + cfg_.spacing * std::sin(*o.angle)};
                }
                if (o.lateral == 0.0) {
                    return anchor;
                }
                // Heading at the anchor, from the next older trail point towards the anchor.
                const auto behind = trail_point(o.back + 1.0);
                dp::f64 hx = anchor.x - behind.x;
                dp::f64 hz = anchor.z - behind.z;
                const dp::f64 len = std::sqrt(hx * hx + hz * hz);
                if (len < 1e-9) {
                    hx = 1.0;
                    hz = 0.0;
                } else {
                    hx /= len;
                    hz /= len;
                }
                return dp::Point{anchor.x - hz * o.lateral, anchor.y, anchor.z + hx * o.lateral};
            }

            /// Distance of a follower from its slot; 0 until it has reported a position.
            dp::f64 deviation(AgentId follower) const {
                auto it = positions_.find(follower);
                auto target = slot(follower);
                if (it == positions_.end() || !target.has_value()) {
                    return 0.0;
                }
                return separation(it->second, *target);
            }

            bool cohesive() const { return max_deviation() <= formation_.spacing_tolerance; }

            dp::f64 max_deviation() const {
                dp::f64 worst = 0.0;
                for (auto id : formation_.followers) {
                    worst = std::max(worst, deviation(id));
                }
                return worst;
            }

            /// One control step: recompute the leader's pace.
            const FormationStatus &update() {
                const dp::f64 tol = formation_.spacing_tolerance;
                status_.max_deviation = max_deviation();
                if (status_.max_deviation > tol) {
                    const dp::f64 excess = (status_.max_deviation - tol) / tol;
                    const dp::f64 target = std::clamp(1.0 - cfg_.pace_gain * excess, cfg_.min_pace, 1.0);
                    // Keep stepping down while out of tolerance so the gap always closes.
                    status_.pace = std::max(cfg_.min_pace, std::min(target, status_.pace - cfg_.pace_recovery));
                    if (!status_.throttled) {
                        echo::debug("[formation] follower ", status_.max_deviation, " from slot, throttling leader");
                    }
                    status_.throttled = true;
                    ++status_.throttled_ticks;
                    if (status_.throttled_ticks > cfg_.max_throttle_ticks && !status_.broken) {
                        status_.broken = true;
                        echo::warn("[formation] throttled for ", status_.throttled_ticks, " ticks, formation broken");
                    }
                } else {
                    status_.pace = std::min(1.0, status_.pace + cfg_.pace_recovery);
                    status_.throttled = false;
                    status_.throttled_ticks = 0;
                }
                return status_;
            }

            /// Forget throttling history, e.g. after a regroup.
            void reset() {
                status_ = FormationStatus{};
                trail_.clear();
                positions_.clear();
            }

            bool replace(AgentId old_id, AgentId new_id) {
                if (formation_.leader == old_id) {
                    formation_.leader = new_id;
                    return true;
                }
                for (auto &f : formation_.followers) {
                    if (f == old_id) {
                        f = new_id;
                        positions_.erase(old_id);
                        return true;
                    }
                }
                return false;
            }

          private:
            static dp::Point lerp(const dp::Point &a, const dp::Point &b, dp::f64 t) {
                return dp::Point{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t, a.z + (b.z - a.z) * t};
            }

            Formation formation_;
            FormationConfig cfg_;
            FormationStatus status_;

            dp::Point leader_{};
            // Newest first.
            std::deque<dp::Point> trail_;
            std::unordered_map<AgentId, dp::Point> positions_;
        };

    } // namespace mission
} // namespace convoy
