#pragma once

// Single-include convenience header for convoy.

#include "convoy/agent.hpp"
#include "convoy/cancel.hpp"
#include "convoy/config.hpp"
#include "convoy/hazard.hpp"
#include "convoy/listener.hpp"
#include "convoy/memory.hpp"
#include "convoy/mission/formation.hpp"
#include "convoy/mission/mission.hpp"
#include "convoy/motion.hpp"
#include "convoy/planner/regions.hpp"
#include "convoy/planner/route_planner.hpp"
#include "convoy/planner/search.hpp"
#include "convoy/planner/smoother.hpp"
#include "convoy/scheduler.hpp"
#include "convoy/stuck.hpp"
#include "convoy/terrain.hpp"
#include "convoy/types.hpp"
#include "convoy/world.hpp"
#include "convoy/world/grid_world.hpp"
#include "convoy/world/sim_motion.hpp"
