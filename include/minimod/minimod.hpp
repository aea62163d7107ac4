#ifndef MINIMOD_HPP
#define MINIMOD_HPP

// Umbrella header: simulators, fitter, data loading and the glucose model.
#include "minimod/continuous_simulator.hpp"
#include "minimod/diagnostics.hpp"
#include "minimod/discrete_simulator.hpp"
#include "minimod/errors.hpp"
#include "minimod/fitter.hpp"
#include "minimod/glucose_model.hpp"
#include "minimod/interpolation/linear_interpolator.hpp"
#include "minimod/interpolation/pchip_interpolator.hpp"
#include "minimod/objective_function.hpp"
#include "minimod/observed_data.hpp"
#include "minimod/signal_table.hpp"
#include "minimod/state_vector.hpp"
#include "minimod/system_config.hpp"
#include "minimod/trajectory.hpp"

#endif // MINIMOD_HPP
