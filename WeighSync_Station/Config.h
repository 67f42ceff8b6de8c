/*******************************************************************************
 * Config.h - Station-Specific Configuration
 *
 * Thin wrapper around the WeighSyncCore configuration. Shared definitions
 * live in WeighConfig.h; this file contains only station overrides and the
 * installed node table.
 ******************************************************************************/

#ifndef CONFIG_H
#define CONFIG_H

#include "WeighConfig.h"
#include "WeighLog.h"

// ============================================================================
// Station-Specific Configuration
// ============================================================================

#define STATION_NAME "WeighSync Station"

// Periodic consumer diagnostics
#define STATION_DIAG_INTERVAL_US 10000000

// Longest accepted command line on stdin
#define STATION_COMMAND_MAX_LEN 512

// ============================================================================
// Installed Platform
// ============================================================================
// Four load cells, one per corner. Upper/lower, left/right as seen from the
// operator position.

struct StationNodeEntry
{
  uint32_t nodeId;
  const char *name;
  float simulatedBaseKg; // Resting load used by the simulated source
};

static const StationNodeEntry STATION_DEFAULT_NODES[WEIGH_DEFAULT_NODE_COUNT] =
    {
        {11111, "celda_sup_izq", 163.2f},
        {22222, "celda_sup_der", 161.8f},
        {67890, "celda_inf_izq", 162.5f},
        {12345, "celda_inf_der", 162.1f},
};

// ============================================================================
// Simulated Source Defaults
// ============================================================================

#define SIM_NOISE_KG 0.05f        // Uniform noise amplitude (+/-)
#define SIM_MAX_SKEW_US 50        // Per-node timestamp skew (+/-)
#define SIM_SPIKE_KG 300.0f       // Added to a spiked sample
#define SIM_OUT_OF_RANGE_KG 99999.0f

#endif // CONFIG_H
