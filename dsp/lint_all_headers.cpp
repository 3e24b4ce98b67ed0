// ==============================================================================
// FourlabDSP Lint Stub - Standalone compile of every public header
// ==============================================================================
// Gives static analysis a translation unit that includes each public DSP
// header, so a header missing one of its own includes fails here first.
//
// Not part of the FourlabDSP library; built as the separate OBJECT target
// fourlab_dsp_lint_stub so it shows up in compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <fourlab/dsp/core/math_constants.h>
#include <fourlab/dsp/core/signal_types.h>
#include <fourlab/dsp/core/engine_error.h>
#include <fourlab/dsp/core/debug_log.h>
#include <fourlab/dsp/core/signal_validation.h>
#include <fourlab/dsp/core/axis_utils.h>
#include <fourlab/dsp/core/spectral_simd.h>

// Layer 1: Primitives
#include <fourlab/dsp/primitives/wave_generator.h>
#include <fourlab/dsp/primitives/wave_compositor.h>
#include <fourlab/dsp/primitives/fft.h>

// Layer 2: Processors
#include <fourlab/dsp/processors/frequency_projector.h>
#include <fourlab/dsp/processors/spectrum_deriver.h>
#include <fourlab/dsp/processors/centroid_summarizer.h>

// Layer 3: Systems
#include <fourlab/dsp/systems/spectral_scene.h>
