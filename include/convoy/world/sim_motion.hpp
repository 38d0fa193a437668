#pragma once

#include <cmath>
#include <mutex>
#include <numbers>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/temporal/stamp.hpp>

#include "convoy/motion.hpp"
#include "convoy/terrain.hpp"

namespace convoy {
    namespace world {

        /// Kinematic motion backend: moves a point along commanded segments at mode speed.
        ///
        /// Each `recv` advances the simulation by one tick of `dt` seconds.
        class SimMotion : public MotionController {
          public:
            explicit SimMotion(const dp::Point &start, dp::f64 dt = 0.05) : position_(start), dt_(dt) {}

            SimMotion(const SimMotion &) = delete;
            SimMotion &operator=(const SimMotion &) = delete;

            bool send(const dp::Stamp<Command> &cmd) override {
                std::lock_guard<std::mutex> lock(mu_);
                const auto &c = cmd.value;
                if (c.kind == CommandKind::Recover && c.recovery.has_value()) {
                    if (!recovery_.has_value() || recovery_->attempt != c.recovery->attempt) {
                        recovery_ = c.recovery;
                        recovery_target_ = recovery_target(*c.recovery);
                    }
                } else {
                    recovery_.reset();
                }
                cmd_ = c;
                return true;
            }

            bool recv(dp::Stamp<ProgressEvent> &ev) override {
                std::lock_guard<std::mutex> lock(mu_);
                ++tick_;
                ev.timestamp = static_cast<dp::i64>(static_cast<dp::f64>(tick_) * dt_ * 1e9);
                ev.value = ProgressEvent{};

                if (!jammed_) {
                    advance(ev.value);
                }
                ev.value.position = position_;
                return true;
            }

            /// Freeze the body in place, as if wedged against the world.
            void jam(bool on) {
                std::lock_guard<std::mutex> lock(mu_);
                jammed_ = on;
            }

            /// A solid ball the body cannot move into. Moving out of it is allowed.
            void block(const dp::Point &center, dp::f64 radius) {
                std::lock_guard<std::mutex> lock(mu_);
                block_ = Ball{center, radius};
            }

            void unblock() {
                std::lock_guard<std::mutex> lock(mu_);
                block_.reset();
            }

            void fail_next_segment() {
                std::lock_guard<std::mutex> lock(mu_);
                fail_next_ = true;
            }

            /// Scale every speed, e.g. to model a slower follower.
            void set_speed_scale(dp::f64 s) {
                std::lock_guard<std::mutex> lock(mu_);
                speed_scale_ = s;
            }

            void teleport(const dp::Point &p) {
                std::lock_guard<std::mutex> lock(mu_);
                position_ = p;
            }

            dp::Point position() const {
                std::lock_guard<std::mutex> lock(mu_);
                return position_;
            }

            const Command &last_command() const { return cmd_; }

          private:
            void advance(ProgressEvent &ev) {
                switch (cmd_.kind) {
                case CommandKind::Follow: {
                    if (!cmd_.segment.has_value()) {
                        return;
                    }
                    if (fail_next_) {
                        fail_next_ = false;
                        ev.segment_failed = true;
                        return;
                    }
                    const auto &seg = *cmd_.segment;
                    const dp::f64 speed =
                        terrain::base_speed(seg.to.mode) * seg.to.terrain_factor * cmd_.pace * speed_scale_;
                    if (move_towards(seg.to.position.center(), speed * dt_)) {
                        ev.reached = seg.index;
                    }
                    break;
                }
                case CommandKind::Recover:
                    if (recovery_target_.has_value()) {
                        move_towards(*recovery_target_, terrain::base_speed(MovementMode::Walk) * speed_scale_ * dt_);
                    }
                    break;
                case CommandKind::Hold:
                case CommandKind::Cancel:
                    break;
                }
            }

            /// Returns true once `target` is reached.
            bool move_towards(const dp::Point &target, dp::f64 step) {
                const dp::f64 dx = target.x - position_.x;
                const dp::f64 dy = target.y - position_.y;
                const dp::f64 dz = target.z - position_.z;
                const dp::f64 d = std::sqrt(dx * dx + dy * dy + dz * dz);
                if (d <= step || d < 1e-9) {
                    position_ = target;
                    return true;
                }
                if (step <= 0.0) {
                    return false;
                }
                heading_x_ = dx / d;
                heading_z_ = dz / d;
                const dp::Point next{position_.x + dx / d * step, position_.y + dy / d * step,
                                     position_.z + dz / d * step};
                if (block_.has_value() && distance(next, block_->center) < block_->radius &&
                    distance(next, block_->center) < distance(position_, block_->center)) {
                    return false;
                }
                position_ = next;
                return false;
            }

            static dp::f64 distance(const dp::Point &a, const dp::Point &b) {
                const dp::f64 dx = a.x - b.x;
                const dp::f64 dy = a.y - b.y;
                const dp::f64 dz = a.z - b.z;
                return std::sqrt(dx * dx + dy * dy + dz * dz);
            }

            dp::Optional<dp::Point> recovery_target(const RecoveryAction &a) const {
                const dp::f64 cells = static_cast<dp::f64>(a.cells);
                if (a.kind == RecoveryKind::VerticalBypass) {
                    return dp::Point{position_.x, position_.y + cells, position_.z};
                }
                if (a.kind != RecoveryKind::Retreat) {
                    return dp::nullopt;
                }
                const dp::f64 rad = a.angle_deg * std::numbers::pi / 180.0;
                const dp::f64 bx = -heading_x_;
                const dp::f64 bz = -heading_z_;
                const dp::f64 rx = bx * std::cos(rad) - bz * std::sin(rad);
                const dp::f64 rz = bx * std::sin(rad) + bz * std::cos(rad);
                return dp::Point{position_.x + rx * cells, position_.y, position_.z + rz * cells};
            }

            struct Ball {
                dp::Point center;
                dp::f64 radius = 0.0;
            };

            mutable std::mutex mu_;
            dp::Point position_;
            dp::f64 dt_;
            dp::u64 tick_ = 0;
            dp::f64 speed_scale_ = 1.0;
            dp::f64 heading_x_ = 1.0;
            dp::f64 heading_z_ = 0.0;
            bool jammed_ = false;
            bool fail_next_ = false;
            dp::Optional<Ball> block_;

            Command cmd_;
            dp::Optional<RecoveryAction> recovery_;
            dp::Optional<dp::Point> recovery_target_;
        };

    } // namespace world
} // namespace convoy
