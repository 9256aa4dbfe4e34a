#ifndef MECHC_HPP
#define MECHC_HPP

#include "mechc/v3d.hpp"
#include "mechc/log.hpp"
#include "mechc/scope_guard.hpp"
#include "mechc/interp.hpp"
#include "mechc/config.hpp"
#include "mechc/exceptions.hpp"
#include "mechc/pair.hpp"
#include "mechc/trajectory.hpp"
#include "mechc/buffer_trajectory.hpp"
#include "mechc/timer.hpp"
#include "mechc/solver.hpp"
#include "mechc/point.hpp"
#include "mechc/interaction_solver.hpp"

#endif // MECHC_HPP
