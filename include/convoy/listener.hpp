#pragma once

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>

#include "convoy/types.hpp"

namespace convoy {

    enum class Reason : dp::u8 {
        NoPathFound = 0,
        StuckTimeout = 1,
        HazardCritical = 2,
        FormationBroken = 3,
        AgentEscalated = 4,
        External = 5,
    };

    inline const char *to_string(Reason r) {
        switch (r) {
        case Reason::NoPathFound:
            return "no-path-found";
        case Reason::StuckTimeout:
            return "stuck-timeout";
        case Reason::HazardCritical:
            return "hazard-critical";
        case Reason::FormationBroken:
            return "formation-broken";
        case Reason::AgentEscalated:
            return "agent-escalated";
        case Reason::External:
            return "external";
        }
        return "unknown";
    }

    /// Record attached to every escalation and abort.
    struct Incident {
        Reason reason = Reason::External;
        AgentId agent = 0;
        dp::Optional<PathId> last_good_path;
        dp::String detail;
        dp::u64 tick = 0;
    };

    /// Upstream telemetry hooks. Calls arrive from agent worker threads.
    class Listener {
      public:
        virtual ~Listener() = default;

        virtual void report_stuck(AgentId) {}
        virtual void report_escalated(AgentId, const Incident &) {}
        virtual void report_abort(const Incident &) {}
        virtual void report_status(MissionId, MissionStatus) {}
    };

} // namespace convoy
