#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(WIRELINK_ENABLE_TELEMETRY_L1)
    #define WL_TL1(expr) expr
#else
    #define WL_TL1(expr) ((void)0)
#endif
