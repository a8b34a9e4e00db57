// ==============================================================================
// NeedleDSP Lint Stub - Strict analysis of all public headers
// ==============================================================================
// This file exists solely to give compilers and clang-tidy a .cpp translation
// unit that includes every public DSP header under strict warnings.
//
// This file is NOT part of the NeedleDSP library itself; it is compiled as a
// separate OBJECT library target (dsp_lint_stub).
// ==============================================================================

// Layer 0: Core
#include <needle/dsp/core/pitch_utils.h>
#include <needle/dsp/core/pitch_mapper.h>
#include <needle/dsp/core/tuning_indicator.h>

// Layer 1: Primitives
#include <needle/dsp/primitives/pitch_detector.h>

// Layer 3: Systems
#include <needle/dsp/systems/tuner_engine.h>
