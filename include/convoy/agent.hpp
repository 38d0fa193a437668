#pragma once

#include <chrono>
#include <cmath>
#include <future>
#include <memory>

#include <echo/echo.hpp>

#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/adapters/result.hpp>

#include <datapod/pods/temporal/stamp.hpp>

#include "convoy/cancel.hpp"
#include "convoy/hazard.hpp"
#include "convoy/memory.hpp"
#include "convoy/mission/mission.hpp"
#include "convoy/motion.hpp"
#include "convoy/planner/route_planner.hpp"
#include "convoy/stuck.hpp"
#include "convoy/types.hpp"

namespace convoy {

    /// What a requested plan is for; decides how it is applied when it lands.
    enum class PlanPurpose : dp::u8 {
        Direct = 0,
        Goal = 1,
        Slot = 2,
        Regroup = 3,
        Reroute = 4,
        Hazard = 5,
        Recovery = 6,
    };

    inline const char *to_string(PlanPurpose p) {
        switch (p) {
        case PlanPurpose::Direct:
            return "direct";
        case PlanPurpose::Goal:
            return "goal";
        case PlanPurpose::Slot:
            return "slot";
        case PlanPurpose::Regroup:
            return "regroup";
        case PlanPurpose::Reroute:
            return "reroute";
        case PlanPurpose::Hazard:
            return "hazard";
        case PlanPurpose::Recovery:
            return "recovery";
        }
        return "unknown";
    }

    inline Position cell_of(const dp::Point &p) {
        return Position{static_cast<dp::i32>(std::lround(p.x)), static_cast<dp::i32>(std::lround(p.y)),
                        static_cast<dp::i32>(std::lround(p.z))};
    }

    class Agent {
      public:
        /// Construct an agent around a shared planner and an optional motion backend.
        ///
        /// Planner, memory and motion controller are non-owning and must outlive the Agent.
        /// Plans requested from `tick` run on their own task; the agent holds, or keeps to its
        /// current path, until the result lands on a later tick.
        Agent(AgentId id, Capabilities caps, planner::RoutePlanner *planner, PathMemoryStore *memory,
              MotionController *motion, StuckConfig cfg = {})
            : id_(id), caps_(caps), planner_(planner), memory_(memory), monitor_(cfg) {
            if (motion) {
                motion_ = std::shared_ptr<MotionController>(motion, [](MotionController *) {
                    // Non-owning: do not delete.
                });
            }
        }

        ~Agent() { await_plan(); }

        Agent(const Agent &) = delete;
        Agent &operator=(const Agent &) = delete;

        AgentId id() const { return id_; }
        Capabilities capabilities() const { return caps_; }
        const dp::Point &position() const { return position_; }
        const StuckMonitor &monitor() const { return monitor_; }
        const dp::Optional<Path> &path() const { return path_; }
        dp::usize cursor() const { return cursor_; }
        dp::Optional<PathId> last_good_path() const { return last_good_; }

        /// Join a mission; its cancel token aborts this agent.
        void join(mission::Mission *m) {
            mission_ = m;
            cancel_ = m ? m->cancel_token() : nullptr;
        }

        void watch(const HazardBoard *board) {
            board_ = board;
            seen_hazards_ = board ? board->version() : 0;
        }

        void place(const dp::Point &p) {
            position_ = p;
            monitor_.reset(p);
        }

        /// Plan from the current cell to `dest` on the calling thread and start following it.
        dp::Result<Path> go_to(const Position &dest) {
            auto res = planner_->plan(request_to(dest));
            if (res.is_err()) {
                warn_no_path(dest, res.error());
                return res;
            }
            assign(res.value());
            return res;
        }

        /// Start planning to `dest` in the background. False while another plan is in flight.
        bool plan_to(const Position &dest) { return request(request_to(dest), PlanPurpose::Direct); }

        bool planning() const { return pending_.valid(); }
        dp::Optional<PlanPurpose> planning_for() const {
            if (!planning()) {
                return dp::nullopt;
            }
            return plan_purpose_;
        }

        /// Block until the plan in flight, if any, has finished. It is applied on the next tick.
        void await_plan() const {
            if (pending_.valid()) {
                pending_.wait();
            }
        }

        void assign(const Path &p) {
            set_path(p);
            monitor_.reset(position_);
            echo::debug("[agent ", id_, "] following path ", p.id, " (", p.waypoints.size(), " waypoints)");
        }

        /// Pull progress from the motion controller, tick, and send the resulting command.
        inline dp::Result<dp::Stamp<Command>> tick() {
            dp::Stamp<ProgressEvent> ev;
            bool have_ev = false;
            if (motion_) {
                have_ev = motion_->recv(ev);
            }
            if (!have_ev) {
                ev.timestamp = dp::Stamp<ProgressEvent>::now();
                ev.value.position = position_;
            }
            auto result = tick(ev);

            echo::trace("[agent ", id_, "] at ", ev.value.position.x, ",", ev.value.position.y, ",",
                        ev.value.position.z);

            if (motion_ && result.is_ok()) {
                motion_->send(result.value());
            }
            return result;
        }

        inline dp::Result<dp::Stamp<Command>> tick(const dp::Stamp<ProgressEvent> &ev) {
            position_ = ev.value.position;
            auto reply = [&ev](const Command &c) {
                return dp::Result<dp::Stamp<Command>>::ok(dp::Stamp<Command>{ev.timestamp, c});
            };

            if (cancel_ && cancel_->cancelled()) {
                if (monitor_.state() != StuckState::Aborted) {
                    monitor_.abort();
                    drop_path();
                    echo::warn("[agent ", id_, "] mission aborted, cancelling motion");
                    Command c;
                    c.kind = CommandKind::Cancel;
                    return reply(c);
                }
                return reply(Command{});
            }

            if (mission_) {
                if (!mission_->participates(id_)) {
                    return reply(Command{});
                }
                mission_->report_position(id_, position_);
            }

            bool advanced = false;
            if (path_.has_value()) {
                if (ev.value.reached.has_value() && *ev.value.reached >= cursor_) {
                    cursor_ = *ev.value.reached + 1;
                    advanced = true;
                    monitor_.progressed();
                }
                if (cursor_ >= path_->waypoints.size()) {
                    arrive();
                }
            }

            if (path_.has_value() && ev.value.segment_failed && !planning()) {
                segment_failed();
            }

            land_plan();

            if (!planning()) {
                check_hazards(advanced);
            }

            if (mission_ && !planning()) {
                steer_by_mission();
            }

            // Nothing to follow until the plan lands; the stuck clock does not run meanwhile.
            if (planning() && (!path_.has_value() || holds_while_planning(plan_purpose_))) {
                return reply(Command{});
            }

            // A leader held at zero pace by the formation is waiting, not stuck.
            bool outstanding = path_.has_value();
            if (outstanding && mission_ && mission_->is_leader(id_) && mission_->pace() <= 0.0) {
                outstanding = false;
            }
            auto action = monitor_.tick(position_, outstanding);
            if (!monitor_.in_episode()) {
                stuck_reported_ = false;
            }
            if (monitor_.state() == StuckState::Stuck && !stuck_reported_) {
                stuck_reported_ = true;
                if (mission_) {
                    mission_->report_stuck(id_);
                }
            }
            if (monitor_.state() == StuckState::Escalated) {
                return reply(escalate());
            }
            if (action.has_value()) {
                recovery_ = action;
                begin_recovery(*action);
                if (planning()) {
                    return reply(Command{});
                }
            }
            if (monitor_.state() == StuckState::Recovering && recovery_.has_value() &&
                (recovery_->kind == RecoveryKind::Retreat || recovery_->kind == RecoveryKind::VerticalBypass)) {
                Command c;
                c.kind = CommandKind::Recover;
                c.recovery = recovery_;
                return reply(c);
            }
            if (monitor_.state() != StuckState::Recovering) {
                recovery_.reset();
            }

            return reply(follow());
        }

      private:
        // World hazards are re-checked against the rest of the path at least this often.
        static constexpr dp::u32 kHazardRecheckTicks = 20;
        static constexpr dp::f64 kSlotSlack = 2.0;

        Command follow() const {
            Command c;
            if (!path_.has_value() || cursor_ == 0 || cursor_ >= path_->waypoints.size()) {
                return c;
            }
            Segment s;
            s.path = path_->id;
            s.index = cursor_;
            s.from = path_->waypoints[cursor_ - 1];
            s.to = path_->waypoints[cursor_];
            c.kind = CommandKind::Follow;
            c.segment = s;
            if (mission_ && mission_->is_leader(id_)) {
                c.pace = mission_->pace();
            }
            return c;
        }

        // ---------------------------------------------------------------------------
        // Path ownership
        // ---------------------------------------------------------------------------

        void set_path(const Path &p) {
            path_ = p;
            cursor_ = p.waypoints.size() > 1 ? 1 : p.waypoints.size();
            lease_ = memory_ ? memory_->lease(p.id) : PathLease{};
            since_check_ = 0;
        }

        void drop_path() {
            path_.reset();
            lease_ = PathLease{};
        }

        // ---------------------------------------------------------------------------
        // Background planning
        // ---------------------------------------------------------------------------

        planner::PlanRequest request_to(const Position &dest) const {
            planner::PlanRequest req;
            req.origin = cell_of(position_);
            req.destination = dest;
            req.caps = caps_;
            req.cancel = cancel_.get();
            return req;
        }

        bool request(planner::PlanRequest req, PlanPurpose purpose) {
            if (planning()) {
                return false;
            }
            plan_purpose_ = purpose;
            plan_destination_ = req.destination;
            plan_status_ = mission_ ? mission_->status() : MissionStatus::Planning;
            auto *planner = planner_;
            auto token = cancel_;
            req.cancel = token.get();
            echo::debug("[agent ", id_, "] planning (", to_string(purpose), ") to ", req.destination.x, ",",
                        req.destination.y, ",", req.destination.z);
            pending_ = std::async(std::launch::async, [planner, token, req]() { return planner->plan(req); });
            return true;
        }

        static bool holds_while_planning(PlanPurpose p) { return p != PlanPurpose::Slot && p != PlanPurpose::Regroup; }

        /// Apply a finished plan, if there is one.
        void land_plan() {
            if (!pending_.valid() || pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                return;
            }
            auto res = pending_.get();
            const auto purpose = plan_purpose_;
            if (cancel_ && cancel_->cancelled()) {
                return;
            }
            if (res.is_err()) {
                warn_no_path(plan_destination_, res.error());
                plan_failed(purpose);
                return;
            }
            if (!still_wanted(purpose)) {
                echo::debug("[agent ", id_, "] dropping stale ", to_string(purpose), " plan ", res.value().id);
                return;
            }
            if (purpose == PlanPurpose::Recovery) {
                // Same stuck episode: the ladder keeps its place.
                set_path(res.value());
                return;
            }
            assign(res.value());
            if (purpose == PlanPurpose::Goal && mission_ && mission_->status() == MissionStatus::Planning) {
                mission_->begin();
            }
        }

        bool still_wanted(PlanPurpose purpose) const {
            if (monitor_.terminal()) {
                return false;
            }
            if (purpose == PlanPurpose::Recovery) {
                const auto step = monitor_.current_step();
                if (monitor_.state() != StuckState::Recovering || !step.has_value() || *step != RecoveryKind::Replan) {
                    return false;
                }
            }
            if (!mission_) {
                return true;
            }
            if (mission_->status() != plan_status_) {
                return false;
            }
            if (purpose == PlanPurpose::Regroup) {
                const auto rp = mission_->regroup_point();
                return rp.has_value() && *rp == plan_destination_;
            }
            return true;
        }

        void plan_failed(PlanPurpose purpose) {
            switch (purpose) {
            case PlanPurpose::Goal:
                surface_no_path("no path to mission goal");
                break;
            case PlanPurpose::Slot:
                surface_no_path("no path to formation slot");
                break;
            case PlanPurpose::Regroup:
                surface_no_path("no path to regroup point");
                break;
            case PlanPurpose::Hazard:
                monitor_.reset(position_);
                if (!mission_) {
                    monitor_.mark_path_stuck();
                }
                break;
            case PlanPurpose::Recovery:
                monitor_.attempt_failed();
                break;
            case PlanPurpose::Direct:
            case PlanPurpose::Reroute:
                break;
            }
        }

        void warn_no_path(const Position &dest, const dp::Error &e) const {
            echo::warn("[agent ", id_, "] no path to ", dest.x, ",", dest.y, ",", dest.z, ": ", e.message.c_str());
        }

        // ---------------------------------------------------------------------------
        // Path events
        // ---------------------------------------------------------------------------

        void arrive() {
            if (memory_) {
                TraversalOutcome ok;
                ok.success = true;
                memory_->report_traversal(path_->id, ok);
            }
            last_good_ = path_->id;
            const Position dest = path_->destination;
            echo::debug("[agent ", id_, "] reached end of path ", path_->id);
            drop_path();
            monitor_.reset(position_);

            if (!mission_) {
                return;
            }
            if (mission_->status() == MissionStatus::Regrouping) {
                auto rp = mission_->regroup_point();
                if (rp.has_value() && *rp == dest) {
                    mission_->report_arrival(id_);
                }
            } else if (dest == mission_->goal()) {
                mission_->report_goal(id_);
            }
        }

        void segment_failed() {
            if (memory_) {
                TraversalOutcome bad;
                bad.success = false;
                bad.failed_at = cursor_;
                memory_->report_traversal(path_->id, bad);
            }
            echo::warn("[agent ", id_, "] segment ", cursor_, " of path ", path_->id, " failed");
            replan(PlanPurpose::Reroute);
        }

        /// Re-plan from the current cell to the current destination, avoiding the blocked waypoint.
        bool replan(PlanPurpose purpose) {
            if (!path_.has_value()) {
                return false;
            }
            auto req = request_to(path_->destination);
            req.bypass_memory = true;
            if (cursor_ < path_->waypoints.size() && path_->waypoints[cursor_].position != req.destination) {
                req.avoid.insert(path_->waypoints[cursor_].position);
            }
            return request(req, purpose);
        }

        /// Check the rest of the path against current hazards: on a board change, on reaching a
        /// waypoint, and every `kHazardRecheckTicks` otherwise.
        void check_hazards(bool advanced) {
            const dp::u64 version = board_ ? board_->version() : 0;
            const bool board_changed = board_ && version != seen_hazards_;
            seen_hazards_ = version;
            ++since_check_;
            if (!board_changed && !advanced && since_check_ < kHazardRecheckTicks) {
                return;
            }
            since_check_ = 0;
            if (!path_.has_value() || cursor_ == 0 || cursor_ >= path_->waypoints.size()) {
                return;
            }

            Path rest = *path_;
            rest.waypoints.clear();
            for (dp::usize i = cursor_ - 1; i < path_->waypoints.size(); ++i) {
                rest.waypoints.push_back(path_->waypoints[i]);
            }
            const auto hazards = planner_->hazards_along(rest);
            const auto v = planner_->filter().filter(rest, hazards);
            if (v.accepted()) {
                return;
            }

            echo::error("[agent ", id_, "] lethal hazard on active path ", path_->id);
            if (memory_) {
                memory_->invalidate(path_->id, cursor_);
            }
            bool steered = false;
            if (mission_) {
                const auto before = mission_->status();
                Incident i;
                i.reason = Reason::HazardCritical;
                i.agent = id_;
                i.last_good_path = last_good_;
                i.detail = dp::String("lethal hazard on active path");
                mission_->raise(i);
                // A regroup picks its own destination.
                steered = mission_->status() != before;
            }
            auto req = request_to(path_->destination);
            req.bypass_memory = true;
            // The old path is unsafe to keep following while the new one is planned.
            drop_path();
            monitor_.reset(position_);
            if (!steered) {
                request(req, PlanPurpose::Hazard);
            }
        }

        // ---------------------------------------------------------------------------
        // Mission steering
        // ---------------------------------------------------------------------------

        /// Pick the current destination from the mission's state.
        void steer_by_mission() {
            const auto status = mission_->status();
            if (!last_status_.has_value() || *last_status_ != status) {
                // A failed plan is reported once per mission phase.
                last_status_ = status;
                no_path_raised_ = false;
            }
            const bool lead = mission_->is_leader(id_);
            switch (status) {
            case MissionStatus::Planning:
                if (lead && !path_.has_value() && !no_path_raised_) {
                    request(request_to(mission_->goal()), PlanPurpose::Goal);
                } else if (!lead && path_.has_value()) {
                    drop_path();
                    monitor_.reset(position_);
                }
                break;

            case MissionStatus::EnRoute:
                if (lead) {
                    if (!path_.has_value() && cell_of(position_) != mission_->goal() && !no_path_raised_) {
                        request(request_to(mission_->goal()), PlanPurpose::Goal);
                    }
                } else {
                    track_slot();
                }
                break;

            case MissionStatus::Regrouping: {
                auto rp = mission_->regroup_point();
                if (!rp.has_value()) {
                    break;
                }
                const bool there = separation(position_, rp->center()) <= mission_->arrival_radius();
                if (there) {
                    if (path_.has_value()) {
                        drop_path();
                        monitor_.reset(position_);
                    }
                    mission_->report_arrival(id_);
                } else if ((!path_.has_value() || path_->destination != *rp) && !no_path_raised_) {
                    request(request_to(*rp), PlanPurpose::Regroup);
                }
                break;
            }

            case MissionStatus::Aborted:
            case MissionStatus::Complete:
                if (path_.has_value()) {
                    drop_path();
                    monitor_.reset(position_);
                }
                break;
            }
        }

        void track_slot() {
            if (no_path_raised_) {
                return;
            }
            auto target = mission_->slot(id_);
            if (!target.has_value()) {
                return;
            }
            if (separation(position_, *target) <= mission_->arrival_radius()) {
                return;
            }
            const Position cell = cell_of(*target);
            if (path_.has_value() && separation(path_->destination, cell) <= kSlotSlack) {
                return;
            }
            request(request_to(cell), PlanPurpose::Slot);
        }

        void surface_no_path(const char *detail) {
            if (no_path_raised_ || !mission_) {
                return;
            }
            no_path_raised_ = true;
            drop_path();
            monitor_.reset(position_);
            Incident i;
            i.reason = Reason::NoPathFound;
            i.agent = id_;
            i.last_good_path = last_good_;
            i.detail = dp::String(detail);
            mission_->raise(i);
        }

        // ---------------------------------------------------------------------------
        // Recovery
        // ---------------------------------------------------------------------------

        void begin_recovery(const RecoveryAction &a) {
            echo::info("[agent ", id_, "] recovery step ", a.attempt, ": ", to_string(a.kind));
            switch (a.kind) {
            case RecoveryKind::Retreat:
            case RecoveryKind::VerticalBypass:
                break;
            case RecoveryKind::Replan:
                if (path_.has_value() && memory_) {
                    memory_->invalidate(path_->id, cursor_);
                }
                if (!replan(PlanPurpose::Recovery)) {
                    monitor_.attempt_failed();
                }
                break;
            case RecoveryKind::RequestAssistance:
                if (!mission_ || mission_->request_assistance(id_) == 0) {
                    monitor_.attempt_failed();
                }
                break;
            }
        }

        Command escalate() {
            Command c;
            if (escalated_) {
                return c;
            }
            escalated_ = true;
            echo::error("[agent ", id_, "] escalating after ", monitor_.total_attempts(), " recovery attempts");
            if (!mission_) {
                return c;
            }
            Incident i;
            i.reason = Reason::AgentEscalated;
            i.agent = id_;
            i.last_good_path = last_good_;
            i.detail = dp::String("recovery ladder exhausted");
            const auto d = mission_->raise(i);
            mission_->clear_assistance(id_);
            if (d == mission::Decision::Regroup || d == mission::Decision::Replan) {
                // Give the agent another bounded ladder on the new leg.
                escalated_ = false;
                drop_path();
                monitor_.reset(position_);
            }
            return c;
        }

        AgentId id_;
        Capabilities caps_;
        planner::RoutePlanner *planner_;
        PathMemoryStore *memory_;
        std::shared_ptr<MotionController> motion_;
        mission::Mission *mission_ = nullptr;
        const HazardBoard *board_ = nullptr;
        CancelTokenPtr cancel_;

        StuckMonitor monitor_;
        dp::Point position_{};
        dp::Optional<Path> path_;
        PathLease lease_;
        dp::usize cursor_ = 0;
        dp::Optional<PathId> last_good_;
        dp::Optional<RecoveryAction> recovery_;
        dp::u64 seen_hazards_ = 0;
        dp::u32 since_check_ = 0;

        std::future<dp::Result<Path>> pending_;
        PlanPurpose plan_purpose_ = PlanPurpose::Direct;
        Position plan_destination_{};
        MissionStatus plan_status_ = MissionStatus::Planning;

        dp::Optional<MissionStatus> last_status_;
        bool stuck_reported_ = false;
        bool escalated_ = false;
        bool no_path_raised_ = false;
    };

} // namespace convoy
