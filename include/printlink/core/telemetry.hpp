#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1  mechanical counters (connect attempts, chunk writes, queue outcomes)
// L2  per-cycle detail (reserved)
// L3  per-chunk detail (reserved)
//
// Disabled levels compile to nothing.
// -----------------------------------------------------------------------------

#if defined(PRINTLINK_ENABLE_TELEMETRY_L1)
    #define PL_TL1(expr) expr
#else
    #define PL_TL1(expr) ((void)0)
#endif

#if defined(PRINTLINK_ENABLE_TELEMETRY_L2)
    #define PL_TL2(expr) expr
#else
    #define PL_TL2(expr) ((void)0)
#endif

#if defined(PRINTLINK_ENABLE_TELEMETRY_L3)
    #define PL_TL3(expr) expr
#else
    #define PL_TL3(expr) ((void)0)
#endif
