#pragma once

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/temporal/stamp.hpp>

#include "convoy/types.hpp"

namespace convoy {

    // =============================================================================================
    // Motion vocabulary
    // =============================================================================================

    /// One leg of a path handed to the motion controller.
    struct Segment {
        PathId path = kInvalidPath;
        // Index of the waypoint this segment ends at.
        dp::usize index = 0;
        Waypoint from{};
        Waypoint to{};
    };

    /// What the motion controller observed since the last tick.
    struct ProgressEvent {
        dp::Point position{};
        // Index of the last waypoint reached on the active path, if any was reached.
        dp::Optional<dp::usize> reached;
        bool segment_failed = false;
    };

    enum class RecoveryKind : dp::u8 {
        Retreat = 0,
        VerticalBypass = 1,
        Replan = 2,
        RequestAssistance = 3,
    };

    static constexpr dp::usize kRecoverySteps = 4;

    inline const char *to_string(RecoveryKind k) {
        switch (k) {
        case RecoveryKind::Retreat:
            return "retreat";
        case RecoveryKind::VerticalBypass:
            return "vertical-bypass";
        case RecoveryKind::Replan:
            return "replan";
        case RecoveryKind::RequestAssistance:
            return "request-assistance";
        }
        return "unknown";
    }

    struct RecoveryAction {
        RecoveryKind kind = RecoveryKind::Retreat;
        dp::i32 cells = 0;
        // Approach angle shift for Retreat, in degrees.
        dp::f64 angle_deg = 0.0;
        dp::u32 attempt = 0;
    };

    enum class CommandKind : dp::u8 {
        Hold = 0,
        Follow = 1,
        Recover = 2,
        Cancel = 3,
    };

    struct Command {
        CommandKind kind = CommandKind::Hold;
        dp::Optional<Segment> segment;
        dp::Optional<RecoveryAction> recovery;
        // Speed scale applied to the segment's mode speed.
        dp::f64 pace = 1.0;
    };

    // =============================================================================================
    // Motion controller
    // =============================================================================================

    /// Executes commands and streams progress back, one event per tick.
    class MotionController {
      public:
        virtual ~MotionController() = default;

        virtual bool send(const dp::Stamp<Command> &cmd) = 0;
        virtual bool recv(dp::Stamp<ProgressEvent> &ev) = 0;
    };

} // namespace convoy
