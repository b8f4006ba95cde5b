#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
//
// L1: lifecycle and decision counters (cheap, always safe to enable)
// L2: per-message counters on the data path
// -----------------------------------------------------------------------------

#if defined(BANDLINK_ENABLE_TELEMETRY_L1)
    #define BL_TL1(expr) expr
#else
    #define BL_TL1(expr) ((void)0)
#endif

#if defined(BANDLINK_ENABLE_TELEMETRY_L2)
    #define BL_TL2(expr) expr
#else
    #define BL_TL2(expr) ((void)0)
#endif
