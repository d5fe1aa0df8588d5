// =============================================================================
// NeuroField - NeuroField.h
// =============================================================================
// Main include header for the NeuroField simulation library.
// =============================================================================

#pragma once

// Version information
#define NEUROFIELD_VERSION_MAJOR 0
#define NEUROFIELD_VERSION_MINOR 1
#define NEUROFIELD_VERSION_PATCH 0
#define NEUROFIELD_VERSION_STRING "0.1.0"

// =============================================================================
// Core Systems
// =============================================================================

#include "core/Types.h"
#include "core/Log.h"
#include "core/Profiler.h"

// =============================================================================
// Field Simulation
// =============================================================================

#include "field/Errors.h"
#include "field/Grid.h"
#include "field/Kernel.h"
#include "field/Convolution.h"
#include "field/FieldState.h"
#include "field/SimulationParameters.h"
#include "field/Integrator.h"
#include "field/EnergyFlow.h"
#include "field/Snapshot.h"
#include "field/SimulationController.h"

// For convenience, NF:: may be used instead of NeuroField::
namespace NF = NeuroField;
