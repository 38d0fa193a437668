#pragma once

#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>

#include "convoy/agent.hpp"
#include "convoy/hazard.hpp"
#include "convoy/mission/mission.hpp"

namespace convoy {

    /// Runs every agent's tick on a worker pool and waits for all of them before returning.
    ///
    /// Agents, missions and the hazard board are non-owning and must outlive the Scheduler.
    /// Registration must not overlap with `step`. Route planning runs off the tick: an agent
    /// waiting on a plan holds, and the barrier never waits for it unless lockstep is on.
    class Scheduler {
      public:
        explicit Scheduler(dp::usize threads = std::thread::hardware_concurrency()) {
            for (dp::usize i = 0; i < threads; ++i) {
                workers_.emplace_back([this] { work(); });
            }
        }

        ~Scheduler() {
            {
                std::lock_guard<std::mutex> lock(mu_);
                stop_ = true;
            }
            work_cv_.notify_all();
            for (auto &t : workers_) {
                t.join();
            }
        }

        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        void add(Agent *agent) {
            std::lock_guard<std::mutex> lock(mu_);
            agents_.push_back(agent);
        }

        void add(mission::Mission *m) {
            std::lock_guard<std::mutex> lock(mu_);
            missions_.push_back(m);
        }

        void watch(HazardBoard *board) { board_ = board; }

        /// Land every requested plan before each tick. Gives reproducible runs for replays and tests.
        void set_lockstep(bool on) { lockstep_ = on; }
        bool lockstep() const { return lockstep_; }

        dp::u64 tick() const { return tick_; }
        dp::usize threads() const { return workers_.size(); }
        dp::usize failures() const { return failures_; }

        /// One tick: every agent, then every mission's control step.
        dp::u64 step() {
            ++tick_;
            if (board_) {
                board_->expire(tick_);
            }
            if (lockstep_) {
                for (auto *a : agents_) {
                    a->await_plan();
                }
            }

            if (workers_.empty()) {
                for (auto *a : agents_) {
                    run(a);
                }
            } else {
                std::unique_lock<std::mutex> lock(mu_);
                next_ = 0;
                pending_ = agents_.size();
                ++generation_;
                work_cv_.notify_all();
                done_cv_.wait(lock, [this] { return pending_ == 0; });
            }

            for (auto *m : missions_) {
                m->step(tick_);
            }
            return tick_;
        }

        /// Step until `done` returns true or `max_ticks` have run. Returns the ticks run.
        template <typename Pred> dp::u64 run_until(Pred done, dp::u64 max_ticks) {
            dp::u64 n = 0;
            while (n < max_ticks && !done()) {
                step();
                ++n;
            }
            return n;
        }

      private:
        void run(Agent *a) {
            auto res = a->tick();
            if (res.is_err()) {
                echo::warn("[scheduler] agent ", a->id(), " tick failed: ", res.error().message.c_str());
                std::lock_guard<std::mutex> lock(fail_mu_);
                ++failures_;
            }
        }

        void work() {
            dp::u64 seen = 0;
            std::unique_lock<std::mutex> lock(mu_);
            while (true) {
                work_cv_.wait(lock, [&] { return stop_ || generation_ != seen; });
                if (stop_) {
                    return;
                }
                seen = generation_;
                while (next_ < agents_.size()) {
                    Agent *a = agents_[next_++];
                    lock.unlock();
                    run(a);
                    lock.lock();
                    if (--pending_ == 0) {
                        done_cv_.notify_one();
                    }
                }
            }
        }

        std::vector<std::thread> workers_;
        std::vector<Agent *> agents_;
        std::vector<mission::Mission *> missions_;
        HazardBoard *board_ = nullptr;
        bool lockstep_ = false;

        std::mutex mu_;
        std::condition_variable work_cv_;
        std::condition_variable done_cv_;
        dp::u64 generation_ = 0;
        dp::usize next_ = 0;
        dp::usize pending_ = 0;
        bool stop_ = false;

        std::mutex fail_mu_;
        dp::usize failures_ = 0;

        dp::u64 tick_ = 0;
    };

} // namespace convoy
