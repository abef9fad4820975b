#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(UMADB_ENABLE_TELEMETRY_L1)
    #define UMADB_TL1(expr) expr
#else
    #define UMADB_TL1(expr) ((void)0)
#endif

