#pragma once

// lavamood - emotion-driven lava lamp simulation
// Umbrella header

#include <lavamood/vad.h>
#include <lavamood/color.h>
#include <lavamood/temporal_filter.h>
#include <lavamood/energy_model.h>
#include <lavamood/visual_mapping.h>
#include <lavamood/fluid_simulation.h>
#include <lavamood/config.h>
#include <lavamood/status.h>
#include <lavamood/engine.h>

namespace lavamood {

constexpr const char* VERSION = "0.3.0";

} // namespace lavamood
