#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/temporal/stamp.hpp>

#include "convoy/config.hpp"
#include "convoy/types.hpp"

namespace convoy {

    using PathSnapshot = std::shared_ptr<const Path>;

    struct TraversalOutcome {
        bool success = true;
        // Waypoint index the traversal failed at (ignored on success).
        dp::usize failed_at = 0;
        // Zero means "now".
        dp::i64 at_ns = 0;
    };

    struct MemoryStats {
        dp::u64 hits = 0;
        dp::u64 misses = 0;
        dp::u64 records = 0;
        dp::u64 invalidations = 0;
        dp::u64 traversals = 0;
    };

    class PathMemoryStore;

    /// Keeps one recorded path from being reclaimed by `PathMemoryStore::compact` while it is in use.
    class PathLease {
      public:
        PathLease() = default;
        PathLease(PathMemoryStore *store, PathId id) : store_(store), id_(id) {}
        ~PathLease() { release(); }

        PathLease(const PathLease &) = delete;
        PathLease &operator=(const PathLease &) = delete;

        PathLease(PathLease &&other) noexcept : store_(other.store_), id_(other.id_) { other.store_ = nullptr; }
        PathLease &operator=(PathLease &&other) noexcept {
            if (this != &other) {
                release();
                store_ = other.store_;
                id_ = other.id_;
                other.store_ = nullptr;
            }
            return *this;
        }

        bool held() const { return store_ != nullptr; }
        PathId id() const { return id_; }

        inline void release();

      private:
        PathMemoryStore *store_ = nullptr;
        PathId id_ = 0;
    };

    /// Shared cache of validated routes keyed by coarse region pair.
    ///
    /// Every bucket is an immutable snapshot. Writers copy the bucket under that key's mutex and
    /// publish the new one atomically, so readers never take a lock on a bucket and never see a
    /// half-updated path. Deprecated paths are only erased by `compact`, and never while leased.
    class PathMemoryStore {
      public:
        explicit PathMemoryStore(MemoryConfig cfg = {}) : cfg_(cfg) {}

        PathMemoryStore(const PathMemoryStore &) = delete;
        PathMemoryStore &operator=(const PathMemoryStore &) = delete;

        const MemoryConfig &config() const { return cfg_; }

        RegionPair key_for(const Position &origin, const Position &destination) const {
            return RegionPair{Region::of(origin, cfg_.region_size), Region::of(destination, cfg_.region_size)};
        }

        /// Usable candidates for a region pair: Fresh before Stale, then by rating.
        std::vector<PathSnapshot> lookup(const Region &origin, const Region &destination, Capabilities caps) const {
            std::vector<PathSnapshot> out;
            auto bucket = load(RegionPair{origin, destination});
            if (bucket) {
                for (const auto &p : bucket->paths) {
                    if (p->status != PathStatus::Deprecated && caps.contains(p->required())) {
                        out.push_back(p);
                    }
                }
            }
            std::sort(out.begin(), out.end(), [](const PathSnapshot &a, const PathSnapshot &b) {
                if (a->status != b->status) {
                    return a->status == PathStatus::Fresh;
                }
                if (a->confidence_rating != b->confidence_rating) {
                    return a->confidence_rating > b->confidence_rating;
                }
                return a->id < b->id;
            });
            if (out.empty()) {
                misses_.fetch_add(1, std::memory_order_relaxed);
            } else {
                hits_.fetch_add(1, std::memory_order_relaxed);
            }
            return out;
        }

        std::vector<PathSnapshot> lookup(const Position &origin, const Position &destination, Capabilities caps) const {
            const auto key = key_for(origin, destination);
            return lookup(key.origin, key.destination, caps);
        }

        /// Store a newly planned path and return its id.
        PathId record(Path path) {
            path.id = next_id_.fetch_add(1, std::memory_order_relaxed);
            path.origin_region = Region::of(path.origin, cfg_.region_size);
            path.destination_region = Region::of(path.destination, cfg_.region_size);
            path.confidence_rating = cfg_.initial_rating;
            path.status = PathStatus::Fresh;
            path.validated_through = 0;
            if (path.created_at == 0) {
                path.created_at = dp::Stamp<Path>::now();
            }
            path.last_validated_at = path.created_at;

            const RegionPair key{path.origin_region, path.destination_region};
            Slot &slot = slot_for(key);
            {
                std::unique_lock<std::shared_mutex> lock(index_mu_);
                index_[path.id] = key;
            }

            std::lock_guard<std::mutex> lock(slot.write_mu);
            auto next = std::make_shared<Bucket>();
            auto cur = slot.bucket.load();
            if (cur) {
                next->paths = cur->paths;
            }

            dp::usize live = 0;
            dp::usize weakest = next->paths.size();
            for (dp::usize i = 0; i < next->paths.size(); ++i) {
                const auto &p = next->paths[i];
                if (p->status == PathStatus::Deprecated) {
                    continue;
                }
                ++live;
                if (weakest == next->paths.size() || p->confidence_rating < next->paths[weakest]->confidence_rating) {
                    weakest = i;
                }
            }
            if (live >= cfg_.max_candidates && weakest < next->paths.size()) {
                auto evicted = std::make_shared<Path>(*next->paths[weakest]);
                evicted->status = PathStatus::Deprecated;
                echo::debug("[memory] bucket full, deprecating path ", evicted->id);
                next->paths[weakest] = evicted;
            }

            const PathId id = path.id;
            next->paths.push_back(std::make_shared<const Path>(std::move(path)));
            slot.bucket.store(std::shared_ptr<const Bucket>(std::move(next)));
            records_.fetch_add(1, std::memory_order_relaxed);
            echo::debug("[memory] recorded path ", id);
            return id;
        }

        /// Mark a path unusable after an observed failure at `failing_waypoint`.
        bool invalidate(PathId id, dp::usize failing_waypoint) {
            const bool ok = update(id, [](Path &p) {
                p.status = PathStatus::Deprecated;
                return true;
            });
            if (ok) {
                invalidations_.fetch_add(1, std::memory_order_relaxed);
                echo::warn("[memory] path ", id, " invalidated at waypoint ", failing_waypoint);
            }
            return ok;
        }

        /// Fold a traversal outcome into the path's rating and status.
        bool report_traversal(PathId id, const TraversalOutcome &outcome) {
            const dp::i64 at = outcome.at_ns != 0 ? outcome.at_ns : dp::Stamp<Path>::now();
            const auto alpha = cfg_.ema_alpha;
            const auto floor = cfg_.rating_floor;
            bool deprecated = false;
            const bool ok = update(id, [&](Path &p) {
                if (p.status == PathStatus::Deprecated) {
                    return false;
                }
                if (outcome.success) {
                    p.confidence_rating += alpha * (1.0 - p.confidence_rating);
                    p.last_validated_at = at;
                    p.status = PathStatus::Fresh;
                    p.validated_through = p.waypoints.size();
                    return true;
                }
                if (outcome.failed_at < p.validated_through) {
                    p.status = PathStatus::Deprecated;
                    deprecated = true;
                    return true;
                }
                p.confidence_rating *= (1.0 - alpha);
                if (p.confidence_rating < floor) {
                    p.status = PathStatus::Deprecated;
                    deprecated = true;
                }
                return true;
            });
            if (ok) {
                traversals_.fetch_add(1, std::memory_order_relaxed);
                if (deprecated) {
                    invalidations_.fetch_add(1, std::memory_order_relaxed);
                    echo::warn("[memory] path ", id, " deprecated after failing at waypoint ", outcome.failed_at);
                }
            }
            return ok;
        }

        /// Turn Fresh paths not validated within `stale_after_ns` of `now_ns` into Stale.
        dp::usize mark_stale(dp::i64 now_ns) {
            dp::usize count = 0;
            std::shared_lock<std::shared_mutex> dir(dir_mu_);
            for (auto &entry : slots_) {
                Slot &slot = *entry.second;
                std::lock_guard<std::mutex> lock(slot.write_mu);
                auto cur = slot.bucket.load();
                if (!cur) {
                    continue;
                }
                auto next = std::make_shared<Bucket>();
                next->paths = cur->paths;
                dp::usize changed = 0;
                for (auto &p : next->paths) {
                    if (p->status == PathStatus::Fresh && now_ns - p->last_validated_at > cfg_.stale_after_ns) {
                        auto copy = std::make_shared<Path>(*p);
                        copy->status = PathStatus::Stale;
                        p = copy;
                        ++changed;
                    }
                }
                if (changed > 0) {
                    slot.bucket.store(std::shared_ptr<const Bucket>(std::move(next)));
                    count += changed;
                }
            }
            return count;
        }

        /// Pin a recorded path for as long as the returned lease lives.
        PathLease lease(PathId id) {
            {
                std::lock_guard<std::mutex> lock(pins_mu_);
                ++pins_[id];
            }
            return PathLease(this, id);
        }

        bool leased(PathId id) const {
            std::lock_guard<std::mutex> lock(pins_mu_);
            auto it = pins_.find(id);
            return it != pins_.end() && it->second > 0;
        }

        void unpin(PathId id) {
            std::lock_guard<std::mutex> lock(pins_mu_);
            auto it = pins_.find(id);
            if (it != pins_.end() && --it->second == 0) {
                pins_.erase(it);
            }
        }

        /// Drop deprecated paths that are neither leased nor held as a snapshot.
        dp::usize compact() {
            dp::usize dropped = 0;
            std::shared_lock<std::shared_mutex> dir(dir_mu_);
            for (auto &entry : slots_) {
                Slot &slot = *entry.second;
                std::lock_guard<std::mutex> lock(slot.write_mu);
                auto cur = slot.bucket.load();
                if (!cur) {
                    continue;
                }
                auto next = std::make_shared<Bucket>();
                std::vector<PathId> gone;
                for (const auto &p : cur->paths) {
                    if (p->status == PathStatus::Deprecated && p.use_count() == 1 && !leased(p->id)) {
                        gone.push_back(p->id);
                    } else {
                        next->paths.push_back(p);
                    }
                }
                if (!gone.empty()) {
                    cur.reset();
                    slot.bucket.store(std::shared_ptr<const Bucket>(std::move(next)));
                    std::unique_lock<std::shared_mutex> idx(index_mu_);
                    for (auto id : gone) {
                        index_.erase(id);
                    }
                    dropped += gone.size();
                }
            }
            return dropped;
        }

        PathSnapshot find(PathId id) const {
            RegionPair key;
            if (!key_of(id, key)) {
                return nullptr;
            }
            auto bucket = load(key);
            if (!bucket) {
                return nullptr;
            }
            for (const auto &p : bucket->paths) {
                if (p->id == id) {
                    return p;
                }
            }
            return nullptr;
        }

        MemoryStats stats() const {
            MemoryStats s;
            s.hits = hits_.load(std::memory_order_relaxed);
            s.misses = misses_.load(std::memory_order_relaxed);
            s.records = records_.load(std::memory_order_relaxed);
            s.invalidations = invalidations_.load(std::memory_order_relaxed);
            s.traversals = traversals_.load(std::memory_order_relaxed);
            return s;
        }

      private:
        struct Bucket {
            std::vector<PathSnapshot> paths;
        };

        struct Slot {
            std::mutex write_mu;
            std::atomic<std::shared_ptr<const Bucket>> bucket;
        };

        std::shared_ptr<const Bucket> load(const RegionPair &key) const {
            std::shared_lock<std::shared_mutex> dir(dir_mu_);
            auto it = slots_.find(key);
            if (it == slots_.end()) {
                return nullptr;
            }
            return it->second->bucket.load();
        }

        Slot &slot_for(const RegionPair &key) {
            {
                std::shared_lock<std::shared_mutex> dir(dir_mu_);
                auto it = slots_.find(key);
                if (it != slots_.end()) {
                    return *it->second;
                }
            }
            std::unique_lock<std::shared_mutex> dir(dir_mu_);
            auto &slot = slots_[key];
            if (!slot) {
                slot = std::make_unique<Slot>();
            }
            return *slot;
        }

        bool key_of(PathId id, RegionPair &key) const {
            std::shared_lock<std::shared_mutex> lock(index_mu_);
            auto it = index_.find(id);
            if (it == index_.end()) {
                return false;
            }
            key = it->second;
            return true;
        }

        /// Copy-on-write edit of one path. `mutate` returns false to leave it untouched.
        template <typename F> bool update(PathId id, F &&mutate) {
            RegionPair key;
            if (!key_of(id, key)) {
                return false;
            }
            Slot *slot = nullptr;
            {
                std::shared_lock<std::shared_mutex> dir(dir_mu_);
                auto it = slots_.find(key);
                if (it == slots_.end()) {
                    return false;
                }
                slot = it->second.get();
            }
            std::lock_guard<std::mutex> lock(slot->write_mu);
            auto cur = slot->bucket.load();
            if (!cur) {
                return false;
            }
            for (dp::usize i = 0; i < cur->paths.size(); ++i) {
                if (cur->paths[i]->id != id) {
                    continue;
                }
                auto edited = std::make_shared<Path>(*cur->paths[i]);
                if (!mutate(*edited)) {
                    return false;
                }
                auto next = std::make_shared<Bucket>();
                next->paths = cur->paths;
                next->paths[i] = std::move(edited);
                slot->bucket.store(std::shared_ptr<const Bucket>(std::move(next)));
                return true;
            }
            return false;
        }

        MemoryConfig cfg_;

        // Guards the key -> slot directory; slots are never removed, so a Slot& stays valid.
        mutable std::shared_mutex dir_mu_;
        std::unordered_map<RegionPair, std::unique_ptr<Slot>, RegionPairHash> slots_;

        mutable std::shared_mutex index_mu_;
        std::unordered_map<PathId, RegionPair> index_;

        mutable std::mutex pins_mu_;
        std::unordered_map<PathId, dp::usize> pins_;

        std::atomic<PathId> next_id_{1};

        mutable std::atomic<dp::u64> hits_{0};
        mutable std::atomic<dp::u64> misses_{0};
        std::atomic<dp::u64> records_{0};
        std::atomic<dp::u64> invalidations_{0};
        std::atomic<dp::u64> traversals_{0};
    };

    inline void PathLease::release() {
        if (store_ != nullptr) {
            store_->unpin(id_);
            store_ = nullptr;
        }
    }

} // namespace convoy
