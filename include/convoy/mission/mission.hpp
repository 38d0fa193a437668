#pragma once

#include <algorithm>
#include <cmath>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>

#include "convoy/cancel.hpp"
#include "convoy/config.hpp"
#include "convoy/listener.hpp"
#include "convoy/mission/formation.hpp"
#include "convoy/types.hpp"

namespace convoy {
    namespace mission {

        enum class Decision : dp::u8 {
            Replan = 0,
            Regroup = 1,
            Substitute = 2,
            Abort = 3,
        };

        inline const char *to_string(Decision d) {
            switch (d) {
            case Decision::Replan:
                return "replan";
            case Decision::Regroup:
                return "regroup";
            case Decision::Substitute:
                return "substitute";
            case Decision::Abort:
                return "abort";
            }
            return "unknown";
        }

        /// Mission controller: status machine, formation loop, regroup protocol and incident policy.
        ///
        /// Every method is safe to call from agent worker threads. Listener callbacks run after the
        /// internal lock is released.
        class Mission {
          public:
            Mission(MissionId id, Position goal, Formation formation, const Config &cfg, Listener *listener = nullptr)
                : id_(id), goal_(goal), cfg_(cfg.mission), formation_(formation, cfg.formation), listener_(listener),
                  cancel_(std::make_shared<CancelToken>()) {
                roles_[formation.leader] = Role::Lead;
                const auto n = formation.followers.size();
                for (dp::usize i = 0; i < n; ++i) {
                    roles_[formation.followers[i]] = (i + 1 == n) ? Role::RearGuard : Role::Support;
                }
            }

            Mission(const Mission &) = delete;
            Mission &operator=(const Mission &) = delete;

            MissionId id() const { return id_; }
            const Position &goal() const { return goal_; }
            CancelTokenPtr cancel_token() const { return cancel_; }
            dp::f64 arrival_radius() const { return cfg_.arrival_radius; }

            MissionStatus status() const {
                std::lock_guard<std::mutex> lock(mu_);
                return status_;
            }

            AgentId leader() const {
                std::lock_guard<std::mutex> lock(mu_);
                return formation_.formation().leader;
            }

            bool is_leader(AgentId id) const { return leader() == id; }

            bool participates(AgentId id) const {
                std::lock_guard<std::mutex> lock(mu_);
                return participates_locked(id);
            }

            std::vector<AgentId> participants() const {
                std::lock_guard<std::mutex> lock(mu_);
                std::vector<AgentId> out{formation_.formation().leader};
                for (auto f : formation_.formation().followers) {
                    out.push_back(f);
                }
                return out;
            }

            Role role(AgentId id) const {
                std::lock_guard<std::mutex> lock(mu_);
                auto it = roles_.find(id);
                return it == roles_.end() ? Role::Support : it->second;
            }

            void assign_role(AgentId id, Role r) {
                std::lock_guard<std::mutex> lock(mu_);
                roles_[id] = r;
            }

            void add_reserve(AgentId id) {
                std::lock_guard<std::mutex> lock(mu_);
                reserves_.push_back(id);
            }

            dp::usize reserves() const {
                std::lock_guard<std::mutex> lock(mu_);
                return reserves_.size();
            }

            void set_regroup_point(const Position &p) {
                std::lock_guard<std::mutex> lock(mu_);
                regroup_point_ = p;
            }

            dp::Optional<Position> regroup_point() const {
                std::lock_guard<std::mutex> lock(mu_);
                return regroup_point_;
            }

            // ---------------------------------------------------------------------------
            // Status transitions
            // ---------------------------------------------------------------------------

            /// Planning -> EnRoute, once the leader holds a path.
            bool begin() { return transition(MissionStatus::Planning, MissionStatus::EnRoute); }

            /// Enter Regrouping. The regroup point defaults to the leader's last known cell.
            bool regroup() {
                bool entered = false;
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    const bool was = status_ == MissionStatus::Regrouping;
                    if (!regroup_locked()) {
                        return false;
                    }
                    entered = !was;
                }
                if (entered) {
                    notify_status(MissionStatus::Regrouping);
                }
                return true;
            }

            /// Record that an agent reached the regroup point. Returns true once quorum is reached.
            bool report_arrival(AgentId id) {
                bool reached = false;
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    if (status_ != MissionStatus::Regrouping || !participates_locked(id)) {
                        return false;
                    }
                    arrived_.insert(id);
                    const dp::usize n = formation_.formation().followers.size() + 1;
                    const dp::usize need = cfg_.regroup_quorum == 0 ? n : std::min(cfg_.regroup_quorum, n);
                    echo::debug("[mission] ", id_, ": agent ", id, " regrouped (", arrived_.size(), "/", need, ")");
                    if (arrived_.size() >= need) {
                        status_ = MissionStatus::Planning;
                        arrived_.clear();
                        formation_.reset();
                        reached = true;
                        echo::info("[mission] ", id_, ": regroup quorum reached");
                    }
                }
                if (reached) {
                    notify_status(MissionStatus::Planning);
                }
                return reached;
            }

            /// Abort the mission. One-way; every agent sees the cancel token on its next tick.
            bool abort(const Incident &incident) {
                bool done = false;
                Incident logged;
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    done = abort_locked(incident, logged);
                }
                if (done) {
                    if (listener_) {
                        listener_->report_abort(logged);
                    }
                    notify_status(MissionStatus::Aborted);
                }
                return done;
            }

            bool abort(Reason reason, AgentId agent, dp::Optional<PathId> last_good, const char *detail) {
                Incident i;
                i.reason = reason;
                i.agent = agent;
                i.last_good_path = last_good;
                i.detail = dp::String(detail);
                return abort(i);
            }

            // ---------------------------------------------------------------------------
            // Reports from agents
            // ---------------------------------------------------------------------------

            void report_position(AgentId id, const dp::Point &p) {
                std::lock_guard<std::mutex> lock(mu_);
                positions_[id] = p;
                if (id == formation_.formation().leader) {
                    formation_.publish_leader(p);
                } else {
                    formation_.report(id, p);
                }
            }

            void report_goal(AgentId id) {
                std::lock_guard<std::mutex> lock(mu_);
                if (id == formation_.formation().leader) {
                    leader_at_goal_ = true;
                }
            }

            void report_stuck(AgentId id) {
                echo::warn("[mission] ", id_, ": agent ", id, " stuck");
                if (listener_) {
                    listener_->report_stuck(id);
                }
            }

            /// Ask the other participants for help; returns how many were asked.
            dp::usize request_assistance(AgentId id) {
                std::lock_guard<std::mutex> lock(mu_);
                assistance_.insert(id);
                echo::info("[mission] ", id_, ": agent ", id, " requests assistance");
                return formation_.formation().followers.size();
            }

            std::vector<AgentId> assistance_requests() const {
                std::lock_guard<std::mutex> lock(mu_);
                return std::vector<AgentId>(assistance_.begin(), assistance_.end());
            }

            void clear_assistance(AgentId id) {
                std::lock_guard<std::mutex> lock(mu_);
                assistance_.erase(id);
            }

            /// Surface an incident and apply the controller's decision.
            Decision raise(Incident incident) {
                Decision d;
                Incident logged;
                bool aborted = false;
                bool regrouped = false;
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    incident.tick = tick_;
                    incidents_.push_back(incident);
                    d = decide_locked(incident);
                    echo::warn("[mission] ", id_, ": ", to_string(incident.reason), " from agent ", incident.agent,
                               " -> ", to_string(d));
                    switch (d) {
                    case Decision::Abort:
                        aborted = abort_locked(incident, logged);
                        break;
                    case Decision::Regroup: {
                        const bool was = status_ == MissionStatus::Regrouping;
                        regrouped = regroup_locked() && !was;
                        break;
                    }
                    case Decision::Substitute:
                        substitute_locked(incident.agent);
                        break;
                    case Decision::Replan:
                        break;
                    }
                }
                if (incident.reason == Reason::AgentEscalated && listener_) {
                    listener_->report_escalated(incident.agent, incident);
                }
                if (aborted) {
                    if (listener_) {
                        listener_->report_abort(logged);
                    }
                    notify_status(MissionStatus::Aborted);
                } else if (regrouped) {
                    notify_status(MissionStatus::Regrouping);
                }
                return d;
            }

            /// Policy only: what the controller would do about `incident` right now.
            Decision decide(const Incident &incident) const {
                std::lock_guard<std::mutex> lock(mu_);
                return decide_locked(incident);
            }

            // ---------------------------------------------------------------------------
            // Formation
            // ---------------------------------------------------------------------------

            dp::f64 pace() const {
                std::lock_guard<std::mutex> lock(mu_);
                return status_ == MissionStatus::EnRoute ? formation_.pace() : 1.0;
            }

            dp::Optional<dp::Point> slot(AgentId id) const {
                std::lock_guard<std::mutex> lock(mu_);
                return formation_.slot(id);
            }

            dp::f64 deviation(AgentId id) const {
                std::lock_guard<std::mutex> lock(mu_);
                return formation_.deviation(id);
            }

            FormationStatus formation_status() const {
                std::lock_guard<std::mutex> lock(mu_);
                return formation_.status();
            }

            /// Once per tick, after every agent has ticked.
            void step(dp::u64 tick) {
                bool broken = false;
                bool timed_out = false;
                bool complete = false;
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    tick_ = tick;
                    switch (status_) {
                    case MissionStatus::EnRoute: {
                        const auto &fs = formation_.update();
                        broken = fs.broken;
                        if (!broken && leader_at_goal_ && formation_.cohesive()) {
                            status_ = MissionStatus::Complete;
                            complete = true;
                            echo::info("[mission] ", id_, ": complete at tick ", tick);
                        }
                        break;
                    }
                    case MissionStatus::Regrouping:
                        if (++regroup_ticks_ > cfg_.regroup_timeout_ticks) {
                            timed_out = true;
                        }
                        break;
                    case MissionStatus::Planning:
                    case MissionStatus::Aborted:
                    case MissionStatus::Complete:
                        break;
                    }
                }
                if (complete) {
                    notify_status(MissionStatus::Complete);
                }
                if (broken) {
                    Incident i;
                    i.reason = Reason::FormationBroken;
                    i.agent = leader();
                    i.detail = dp::String("leader throttled beyond the bound");
                    raise(i);
                }
                if (timed_out) {
                    Incident i;
                    i.reason = Reason::FormationBroken;
                    i.agent = leader();
                    i.detail = dp::String("regroup timed out");
                    abort(i);
                }
            }

            std::vector<Incident> incidents() const {
                std::lock_guard<std::mutex> lock(mu_);
                return incidents_;
            }

          private:
            bool participates_locked(AgentId id) const {
                if (formation_.formation().leader == id) {
                    return true;
                }
                return formation_.index_of(id).has_value();
            }

            bool transition(MissionStatus from, MissionStatus to) {
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    if (status_ != from) {
                        return false;
                    }
                    status_ = to;
                    echo::info("[mission] ", id_, ": ", convoy::to_string(from), " -> ", convoy::to_string(to));
                }
                notify_status(to);
                return true;
            }

            bool terminal_locked() const {
                return status_ == MissionStatus::Aborted || status_ == MissionStatus::Complete;
            }

            bool regroup_locked() {
                if (terminal_locked()) {
                    return false;
                }
                if (!regroup_point_.has_value()) {
                    auto it = positions_.find(formation_.formation().leader);
                    if (it == positions_.end()) {
                        return false;
                    }
                    const auto &p = it->second;
                    regroup_point_ = Position{static_cast<dp::i32>(std::lround(p.x)), static_cast<dp::i32>(std::lround(p.y)),
                                              static_cast<dp::i32>(std::lround(p.z))};
                }
                if (status_ == MissionStatus::Regrouping) {
                    // Arrivals and the timeout keep counting for the regroup already under way.
                    return true;
                }
                echo::info("[mission] ", id_, ": regrouping at ", regroup_point_->x, ",", regroup_point_->y, ",",
                           regroup_point_->z);
                status_ = MissionStatus::Regrouping;
                arrived_.clear();
                regroup_ticks_ = 0;
                leader_at_goal_ = false;
                return true;
            }

            bool abort_locked(const Incident &incident, Incident &logged) {
                if (status_ == MissionStatus::Aborted) {
                    return false;
                }
                status_ = MissionStatus::Aborted;
                cancel_->cancel();
                logged = incident;
                logged.tick = tick_;
                if (incidents_.empty() || incidents_.back().reason != logged.reason ||
                    incidents_.back().agent != logged.agent || incidents_.back().tick != logged.tick) {
                    incidents_.push_back(logged);
                }
                echo::error("[mission] ", id_, ": aborted (", to_string(logged.reason), ") by agent ", logged.agent,
                            ", last good path ", logged.last_good_path.has_value() ? *logged.last_good_path : 0);
                return true;
            }

            Decision decide_locked(const Incident &incident) const {
                const bool lead = incident.agent == formation_.formation().leader;
                const bool has_followers = formation_.formation().followers.size() > 0;
                switch (incident.reason) {
                case Reason::External:
                    return Decision::Abort;
                case Reason::StuckTimeout:
                    return Decision::Replan;
                case Reason::HazardCritical:
                    return has_followers ? Decision::Regroup : Decision::Replan;
                case Reason::FormationBroken:
                    return Decision::Regroup;
                case Reason::NoPathFound:
                case Reason::AgentEscalated:
                    if (!reserves_.empty()) {
                        return Decision::Substitute;
                    }
                    return lead ? Decision::Abort : Decision::Regroup;
                }
                return Decision::Abort;
            }

            void substitute_locked(AgentId out) {
                if (reserves_.empty()) {
                    return;
                }
                const AgentId in = reserves_.front();
                reserves_.erase(reserves_.begin());
                if (!formation_.replace(out, in)) {
                    return;
                }
                auto it = roles_.find(out);
                if (it != roles_.end()) {
                    roles_[in] = it->second;
                    roles_.erase(it);
                }
                positions_.erase(out);
                echo::info("[mission] ", id_, ": agent ", in, " substitutes for agent ", out);
            }

            void notify_status(MissionStatus s) {
                if (listener_) {
                    listener_->report_status(id_, s);
                }
            }

            MissionId id_;
            Position goal_;
            MissionConfig cfg_;

            mutable std::mutex mu_;
            MissionStatus status_ = MissionStatus::Planning;
            FormationController formation_;
            Listener *listener_;
            CancelTokenPtr cancel_;

            std::unordered_map<AgentId, Role> roles_;
            std::unordered_map<AgentId, dp::Point> positions_;
            std::vector<AgentId> reserves_;
            std::unordered_set<AgentId> arrived_;
            std::unordered_set<AgentId> assistance_;
            dp::Optional<Position> regroup_point_;
            std::vector<Incident> incidents_;

            dp::u64 tick_ = 0;
            dp::u32 regroup_ticks_ = 0;
            bool leader_at_goal_ = false;
        };

    } // namespace mission
} // namespace convoy
