#pragma once

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>

#include "convoy/config.hpp"
#include "convoy/motion.hpp"
#include "convoy/types.hpp"

namespace convoy {

    enum class StuckState : dp::u8 {
        Idle = 0,
        Moving = 1,
        Stuck = 2,
        Recovering = 3,
        Escalated = 4,
        Aborted = 5,
    };

    inline const char *to_string(StuckState s) {
        switch (s) {
        case StuckState::Idle:
            return "idle";
        case StuckState::Moving:
            return "moving";
        case StuckState::Stuck:
            return "stuck";
        case StuckState::Recovering:
            return "recovering";
        case StuckState::Escalated:
            return "escalated";
        case StuckState::Aborted:
            return "aborted";
        }
        return "unknown";
    }

    struct StuckStats {
        dp::u32 detections = 0;
        dp::u32 attempts = 0;
        dp::u32 successes = 0;
        dp::u32 escalations = 0;

        dp::f64 success_rate() const {
            return attempts == 0 ? 0.0 : static_cast<dp::f64>(successes) / static_cast<dp::f64>(attempts);
        }
    };

    /// Per-agent no-progress detector driving the recovery ladder.
    ///
    /// Feed it one sample per tick. While a movement command is outstanding, `stuck_ticks`
    /// consecutive ticks without `epsilon` of displacement enter Stuck on that tick; the ladder
    /// starts on the next one. Each ladder step gets `attempt_ticks`. Moving the body during that
    /// window only lets the agent resume its route; the episode stays open, and the ladder carries
    /// on from the next step, until `progressed` reports real progress along the path.
    class StuckMonitor {
      public:
        explicit StuckMonitor(StuckConfig cfg = {}) : cfg_(cfg) {}

        const StuckConfig &config() const { return cfg_; }

        StuckState state() const { return state_; }
        const StuckStats &stats() const { return stats_; }
        dp::u64 ticks() const { return tick_; }
        dp::u32 idle_ticks() const { return no_progress_; }
        dp::u32 total_attempts() const { return total_attempts_; }
        dp::Optional<dp::u64> stuck_since() const { return stuck_since_; }
        dp::Optional<RecoveryKind> current_step() const { return current_; }

        /// A stuck episode is open until the route advances or the monitor is reset.
        bool in_episode() const { return episode_; }

        bool terminal() const { return state_ == StuckState::Escalated || state_ == StuckState::Aborted; }

        /// Returns the recovery action to start on this tick, if any.
        dp::Optional<RecoveryAction> tick(const dp::Point &position, bool command_outstanding) {
            ++tick_;
            if (terminal()) {
                return dp::nullopt;
            }

            if (!anchor_.has_value()) {
                anchor_ = position;
            }
            const bool progress = separation(position, *anchor_) >= cfg_.epsilon;
            if (progress) {
                anchor_ = position;
            }

            switch (state_) {
            case StuckState::Idle:
            case StuckState::Moving:
                if (!command_outstanding) {
                    state_ = StuckState::Idle;
                    no_progress_ = 0;
                    anchor_ = position;
                    return dp::nullopt;
                }
                state_ = StuckState::Moving;
                if (progress) {
                    no_progress_ = 0;
                    return dp::nullopt;
                }
                if (++no_progress_ >= cfg_.stuck_ticks) {
                    enter_stuck();
                }
                return dp::nullopt;

            case StuckState::Stuck:
                return next_step();

            case StuckState::Recovering:
                if (progress) {
                    moved_ = true;
                }
                if (++attempt_elapsed_ >= cfg_.attempt_ticks) {
                    if (moved_) {
                        echo::debug("[stuck] ", to_string(*current_), " moved the body, resuming the route");
                        state_ = StuckState::Moving;
                        no_progress_ = 0;
                        anchor_ = position;
                        current_.reset();
                        return dp::nullopt;
                    }
                    echo::debug("[stuck] ", to_string(*current_), " showed no progress");
                    return next_step();
                }
                return dp::nullopt;

            case StuckState::Escalated:
            case StuckState::Aborted:
                break;
            }
            return dp::nullopt;
        }

        /// The agent advanced along its route. Closes an open episode as a recovery.
        void progressed() {
            if (!episode_ || terminal()) {
                return;
            }
            if (stats_.attempts > attempts_at_open_) {
                ++stats_.successes;
                echo::info("[stuck] recovered after ", tick_ - opened_at_, " ticks and ",
                           stats_.attempts - attempts_at_open_, " attempts");
            }
            close_episode();
            if (state_ == StuckState::Stuck || state_ == StuckState::Recovering) {
                state_ = StuckState::Moving;
            }
        }

        /// The current step failed outright; the next tick moves down the ladder.
        void attempt_failed() {
            if (state_ == StuckState::Recovering) {
                echo::debug("[stuck] ", to_string(*current_), " failed immediately");
                state_ = StuckState::Stuck;
            }
        }

        /// Enter Stuck without waiting for the no-progress window (e.g. no path from here).
        void mark_path_stuck() {
            if (state_ == StuckState::Idle || state_ == StuckState::Moving) {
                enter_stuck();
            }
        }

        void abort() {
            if (state_ != StuckState::Aborted) {
                echo::warn("[stuck] aborted in state ", to_string(state_));
                state_ = StuckState::Aborted;
            }
        }

        /// Start over for a new movement leg. Statistics are kept.
        void reset(const dp::Point &position) {
            state_ = StuckState::Idle;
            no_progress_ = 0;
            attempt_elapsed_ = 0;
            total_attempts_ = 0;
            close_episode();
            anchor_ = position;
        }

      private:
        void enter_stuck() {
            state_ = StuckState::Stuck;
            ++stats_.detections;
            if (!episode_) {
                episode_ = true;
                ++episodes_;
                next_ = 0;
                opened_at_ = tick_;
                attempts_at_open_ = stats_.attempts;
                stuck_since_ = tick_;
                echo::warn("[stuck] no progress for ", no_progress_, " ticks");
            } else {
                echo::warn("[stuck] still no progress, continuing with step ", next_ + 1);
            }
        }

        void close_episode() {
            episode_ = false;
            moved_ = false;
            next_ = 0;
            no_progress_ = 0;
            current_.reset();
            stuck_since_.reset();
        }

        dp::Optional<RecoveryAction> next_step() {
            if (next_ >= kRecoverySteps || total_attempts_ >= cfg_.max_total_attempts) {
                state_ = StuckState::Escalated;
                current_.reset();
                ++stats_.escalations;
                echo::error("[stuck] recovery exhausted after ", total_attempts_, " attempts");
                return dp::nullopt;
            }

            RecoveryAction a;
            a.kind = static_cast<RecoveryKind>(next_);
            a.attempt = total_attempts_ + 1;
            switch (a.kind) {
            case RecoveryKind::Retreat:
                a.cells = cfg_.retreat_cells;
                // Alternate sides across episodes.
                a.angle_deg = (episodes_ % 2 == 0) ? -cfg_.retreat_angle_deg : cfg_.retreat_angle_deg;
                break;
            case RecoveryKind::VerticalBypass:
                a.cells = cfg_.bypass_height;
                break;
            case RecoveryKind::Replan:
            case RecoveryKind::RequestAssistance:
                break;
            }

            ++next_;
            ++total_attempts_;
            ++stats_.attempts;
            attempt_elapsed_ = 0;
            moved_ = false;
            current_ = a.kind;
            state_ = StuckState::Recovering;
            echo::info("[stuck] attempt ", a.attempt, ": ", to_string(a.kind));
            return a;
        }

        StuckConfig cfg_;
        StuckState state_ = StuckState::Idle;
        StuckStats stats_;

        dp::u64 tick_ = 0;
        dp::u32 no_progress_ = 0;
        dp::u32 attempt_elapsed_ = 0;
        dp::usize next_ = 0;
        dp::u32 total_attempts_ = 0;

        bool episode_ = false;
        bool moved_ = false;
        dp::u32 episodes_ = 0;
        dp::u64 opened_at_ = 0;
        dp::u32 attempts_at_open_ = 0;

        dp::Optional<dp::Point> anchor_;
        dp::Optional<RecoveryKind> current_;
        dp::Optional<dp::u64> stuck_since_;
    };

} // namespace convoy
