#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/spatial.hpp>

namespace convoy {

    using AgentId = dp::u32;
    using PathId = dp::u64;
    using HazardId = dp::u64;
    using MissionId = dp::u32;

    static constexpr PathId kInvalidPath = 0;

    // =============================================================================================
    // Positions and regions
    // =============================================================================================

    enum class Facing : dp::u8 {
        North = 0,
        East = 1,
        South = 2,
        West = 3,
        Up = 4,
        Down = 5,
    };

    /// Integer block coordinate plus facing.
    ///
    /// Equality and hashing only look at the coordinate: two records of the same
    /// block with different facings are the same graph node.
    struct Position {
        dp::i32 x = 0;
        dp::i32 y = 0;
        dp::i32 z = 0;
        Facing facing = Facing::North;

        Position offset(dp::i32 dx, dp::i32 dy, dp::i32 dz) const { return Position{x + dx, y + dy, z + dz, facing}; }

        dp::Point center() const {
            return dp::Point{static_cast<dp::f64>(x), static_cast<dp::f64>(y), static_cast<dp::f64>(z)};
        }

        friend bool operator==(const Position &a, const Position &b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
        friend bool operator!=(const Position &a, const Position &b) { return !(a == b); }
    };

    struct PositionHash {
        std::size_t operator()(const Position &p) const {
            std::size_t h = std::hash<dp::i32>{}(p.x);
            h ^= std::hash<dp::i32>{}(p.y) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            h ^= std::hash<dp::i32>{}(p.z) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            return h;
        }
    };

    inline Facing facing_of(dp::i32 dx, dp::i32 dy, dp::i32 dz) {
        if (dx == 0 && dz == 0) {
            return dy >= 0 ? Facing::Up : Facing::Down;
        }
        if (std::abs(dx) >= std::abs(dz)) {
            return dx > 0 ? Facing::East : Facing::West;
        }
        return dz > 0 ? Facing::South : Facing::North;
    }

    inline dp::f64 separation(const dp::Point &a, const dp::Point &b) {
        const dp::f64 dx = a.x - b.x;
        const dp::f64 dy = a.y - b.y;
        const dp::f64 dz = a.z - b.z;
        return std::sqrt(dx * dx + dy * dy + dz * dz);
    }

    inline dp::f64 separation(const Position &a, const Position &b) { return separation(a.center(), b.center()); }

    /// Distance from `p` to the segment [a, b].
    inline dp::f64 segment_distance(const dp::Point &p, const dp::Point &a, const dp::Point &b) {
        const dp::f64 abx = b.x - a.x;
        const dp::f64 aby = b.y - a.y;
        const dp::f64 abz = b.z - a.z;
        const dp::f64 len2 = abx * abx + aby * aby + abz * abz;
        if (len2 <= 0.0) {
            return separation(p, a);
        }
        dp::f64 t = ((p.x - a.x) * abx + (p.y - a.y) * aby + (p.z - a.z) * abz) / len2;
        t = t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
        return separation(p, dp::Point{a.x + abx * t, a.y + aby * t, a.z + abz * t});
    }

    /// Coarse cell of the region grid used to key Path Memory.
    struct Region {
        dp::i32 x = 0;
        dp::i32 y = 0;
        dp::i32 z = 0;

        static Region of(const Position &p, dp::i32 size) {
            auto floor_div = [size](dp::i32 v) {
                return v >= 0 ? v / size : -((-v + size - 1) / size);
            };
            return Region{floor_div(p.x), floor_div(p.y), floor_div(p.z)};
        }

        friend bool operator==(const Region &a, const Region &b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
        friend bool operator!=(const Region &a, const Region &b) { return !(a == b); }
    };

    struct RegionPair {
        Region origin;
        Region destination;

        friend bool operator==(const RegionPair &a, const RegionPair &b) {
            return a.origin == b.origin && a.destination == b.destination;
        }
    };

    struct RegionPairHash {
        std::size_t operator()(const RegionPair &k) const {
            std::size_t h = 0;
            for (dp::i32 v : {k.origin.x, k.origin.y, k.origin.z, k.destination.x, k.destination.y, k.destination.z}) {
                h ^= std::hash<dp::i32>{}(v) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            }
            return h;
        }
    };

    // =============================================================================================
    // Movement modes and capabilities
    // =============================================================================================

    enum class MovementMode : dp::u8 {
        Walk = 0,
        Sprint = 1,
        SwimSurface = 2,
        SwimSubmerged = 3,
        Climb = 4,
        Ride = 5,
        Glide = 6,
    };

    static constexpr std::size_t kModeCount = 7;

    inline const char *to_string(MovementMode m) {
        switch (m) {
        case MovementMode::Walk:
            return "walk";
        case MovementMode::Sprint:
            return "sprint";
        case MovementMode::SwimSurface:
            return "swim-surface";
        case MovementMode::SwimSubmerged:
            return "swim-submerged";
        case MovementMode::Climb:
            return "climb";
        case MovementMode::Ride:
            return "ride";
        case MovementMode::Glide:
            return "glide";
        }
        return "unknown";
    }

    /// Set of movement modes an agent can use.
    struct Capabilities {
        dp::u32 bits = 0;

        static Capabilities of(std::initializer_list<MovementMode> modes) {
            Capabilities c;
            for (auto m : modes) {
                c.bits |= (1U << static_cast<dp::u32>(m));
            }
            return c;
        }

        static Capabilities all() { return Capabilities{(1U << kModeCount) - 1U}; }

        bool has(MovementMode m) const { return (bits & (1U << static_cast<dp::u32>(m))) != 0; }
        bool can_swim() const { return has(MovementMode::SwimSurface) || has(MovementMode::SwimSubmerged); }

        Capabilities with(MovementMode m) const { return Capabilities{bits | (1U << static_cast<dp::u32>(m))}; }

        /// True if every mode in `other` is also in this set.
        bool contains(Capabilities other) const { return (bits & other.bits) == other.bits; }

        friend bool operator==(Capabilities a, Capabilities b) { return a.bits == b.bits; }
    };

    // =============================================================================================
    // Terrain and hazards
    // =============================================================================================

    enum class Surface : dp::u8 {
        Solid = 0,
        Liquid = 1,
        Climbable = 2,
        Void = 3,
        Obstruction = 4,
    };

    /// A cell the agent can occupy and move from.
    inline bool standable(Surface s) { return s == Surface::Solid || s == Surface::Climbable || s == Surface::Liquid; }

    namespace tags {
        static constexpr dp::u8 None = 0;
        static constexpr dp::u8 FallRisk = 1U << 0;
        static constexpr dp::u8 LiquidDamage = 1U << 1;
        static constexpr dp::u8 Hostile = 1U << 2;
        static constexpr dp::u8 ThinIce = 1U << 3;
        static constexpr dp::u8 Slippery = 1U << 4;
    } // namespace tags

    /// Classification of one cell, produced by the world query collaborator.
    struct TerrainSample {
        Surface surface = Surface::Void;
        std::array<dp::f64, kModeCount> speed_factor{1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
        dp::u8 tags = tags::None;

        dp::f64 factor(MovementMode m) const { return speed_factor[static_cast<std::size_t>(m)]; }

        static TerrainSample of(Surface s, dp::f64 factor = 1.0, dp::u8 t = tags::None) {
            TerrainSample out;
            out.surface = s;
            out.speed_factor.fill(factor);
            out.tags = t;
            return out;
        }
    };

    enum class HazardType : dp::u8 {
        Fall = 0,
        LiquidDamage = 1,
        HostilePresence = 2,
        BlockedGap = 3,
    };

    enum class Severity : dp::u8 {
        Advisory = 0,
        Dangerous = 1,
        Lethal = 2,
    };

    struct HazardRecord {
        HazardId id = 0;
        HazardType type = HazardType::Fall;
        dp::Point location{};
        dp::f64 radius = 0.0;
        Severity severity = Severity::Advisory;
    };

    // =============================================================================================
    // Waypoints and paths
    // =============================================================================================

    /// How the segment ending at a waypoint is traversed.
    enum class EdgeKind : dp::u8 {
        Start = 0,
        Step = 1,
        Climb = 2,
        Ascent = 3,
        Drop = 4,
        Jump = 5,
        Bridge = 6,
        Swim = 7,
        Vessel = 8,
    };

    inline const char *to_string(EdgeKind e) {
        switch (e) {
        case EdgeKind::Start:
            return "start";
        case EdgeKind::Step:
            return "step";
        case EdgeKind::Climb:
            return "climb";
        case EdgeKind::Ascent:
            return "ascent";
        case EdgeKind::Drop:
            return "drop";
        case EdgeKind::Jump:
            return "jump";
        case EdgeKind::Bridge:
            return "bridge";
        case EdgeKind::Swim:
            return "swim";
        case EdgeKind::Vessel:
            return "vessel";
        }
        return "unknown";
    }

    struct Waypoint {
        Position position{};
        dp::f64 terrain_factor = 1.0;
        dp::Vector<HazardId> hazard_refs;

        MovementMode mode = MovementMode::Walk;
        EdgeKind edge = EdgeKind::Start;
        // Gap width for Jump/Bridge edges, crossing width for Swim/Vessel, rise for Ascent.
        dp::i32 span = 0;
    };

    enum class PathStatus : dp::u8 {
        Fresh = 0,
        Stale = 1,
        Deprecated = 2,
    };

    struct Path {
        PathId id = kInvalidPath;
        Position origin{};
        Position destination{};
        Region origin_region{};
        Region destination_region{};

        dp::Vector<Waypoint> waypoints;
        dp::Vector<MovementMode> mode_sequence;

        dp::f64 time_estimate = 0.0;
        dp::f64 hazard_exposure = 0.0;
        dp::f64 confidence_rating = 0.5;

        dp::i64 created_at = 0;
        dp::i64 last_validated_at = 0;
        // Waypoints [0, validated_through) have been traversed successfully before.
        dp::usize validated_through = 0;
        PathStatus status = PathStatus::Fresh;

        Capabilities required() const {
            Capabilities c;
            for (auto m : mode_sequence) {
                c = c.with(m);
            }
            return c;
        }

        dp::usize segments() const { return waypoints.size() > 0 ? waypoints.size() - 1 : 0; }
    };

    // =============================================================================================
    // Roles and mission status
    // =============================================================================================

    /// Specialist role exposed to task/combat collaborators; the core does not interpret it.
    enum class Role : dp::u8 {
        Lead = 0,
        Support = 1,
        RearGuard = 2,
        Scout = 3,
    };

    enum class MissionStatus : dp::u8 {
        Planning = 0,
        EnRoute = 1,
        Regrouping = 2,
        Aborted = 3,
        Complete = 4,
    };

    inline const char *to_string(MissionStatus s) {
        switch (s) {
        case MissionStatus::Planning:
            return "planning";
        case MissionStatus::EnRoute:
            return "en-route";
        case MissionStatus::Regrouping:
            return "regrouping";
        case MissionStatus::Aborted:
            return "aborted";
        case MissionStatus::Complete:
            return "complete";
        }
        return "unknown";
    }

} // namespace convoy
