#pragma once

#include <cstdint>

// Global inline controls for stderr diagnostics
inline bool gLogEnabled = true;           // master switch for [tag] lines
inline bool gProgressLogEnabled = false;  // per-milestone job progress lines
inline bool gSummaryEnabled = true;       // print job timing summary on completion
