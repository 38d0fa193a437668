#pragma once

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <datapod/adapters.hpp>

#include "convoy/world.hpp"

namespace convoy {
    namespace world {

        /// Sparse in-memory voxel world.
        ///
        /// A cell's surface describes what an agent finds when it occupies that cell: Solid and
        /// Climbable cells can be stood in, Liquid cells are swum or sailed through, Obstruction
        /// cells block, and Void cells (the default) have nothing to stand on.
        class GridWorld : public WorldQuery {
          public:
            GridWorld() = default;
            explicit GridWorld(TerrainSample background) : background_(background) {}

            GridWorld(const GridWorld &) = delete;
            GridWorld &operator=(const GridWorld &) = delete;

            void set(const Position &p, const TerrainSample &s) {
                std::unique_lock<std::shared_mutex> lock(mu_);
                cells_[p] = s;
            }

            /// Fill the inclusive box [a, b] with `s`.
            void fill(const Position &a, const Position &b, const TerrainSample &s) {
                std::unique_lock<std::shared_mutex> lock(mu_);
                for (dp::i32 x = std::min(a.x, b.x); x <= std::max(a.x, b.x); ++x) {
                    for (dp::i32 y = std::min(a.y, b.y); y <= std::max(a.y, b.y); ++y) {
                        for (dp::i32 z = std::min(a.z, b.z); z <= std::max(a.z, b.z); ++z) {
                            cells_[Position{x, y, z}] = s;
                        }
                    }
                }
            }

            /// Flat walkable floor at level `y` over the inclusive rectangle.
            void floor(dp::i32 x0, dp::i32 z0, dp::i32 x1, dp::i32 z1, dp::i32 y, dp::f64 factor = 1.0) {
                fill(Position{x0, y, z0}, Position{x1, y, z1}, TerrainSample::of(Surface::Solid, factor));
            }

            /// Block the column at (x, z) from `y0` up to, but not including, `top`, and make `top`
            /// the standable cell.
            void raise_column(dp::i32 x, dp::i32 z, dp::i32 y0, dp::i32 top) {
                if (top > y0) {
                    fill(Position{x, y0, z}, Position{x, top - 1, z}, TerrainSample::of(Surface::Obstruction));
                }
                set(Position{x, top, z}, TerrainSample::of(Surface::Solid));
            }

            void clear(const Position &p) {
                std::unique_lock<std::shared_mutex> lock(mu_);
                cells_.erase(p);
            }

            HazardId add_hazard(HazardRecord h) {
                std::unique_lock<std::shared_mutex> lock(mu_);
                if (h.id == 0) {
                    h.id = next_hazard_++;
                }
                hazards_.push_back(h);
                return h.id;
            }

            bool remove_hazard(HazardId id) {
                std::unique_lock<std::shared_mutex> lock(mu_);
                auto it = std::find_if(hazards_.begin(), hazards_.end(),
                                       [id](const HazardRecord &h) { return h.id == id; });
                if (it == hazards_.end()) {
                    return false;
                }
                hazards_.erase(it);
                return true;
            }

            TerrainSample sample(const Position &p) const override {
                std::shared_lock<std::shared_mutex> lock(mu_);
                auto it = cells_.find(p);
                return it == cells_.end() ? background_ : it->second;
            }

            dp::Vector<HazardRecord> hazards_near(const Position &center, dp::f64 radius) const override {
                std::shared_lock<std::shared_mutex> lock(mu_);
                dp::Vector<HazardRecord> out;
                const auto c = center.center();
                for (const auto &h : hazards_) {
                    if (separation(c, h.location) <= radius + h.radius) {
                        out.push_back(h);
                    }
                }
                return out;
            }

          private:
            mutable std::shared_mutex mu_;
            TerrainSample background_{};
            std::unordered_map<Position, TerrainSample, PositionHash> cells_;
            std::vector<HazardRecord> hazards_;
            HazardId next_hazard_ = 1;
        };

    } // namespace world
} // namespace convoy
