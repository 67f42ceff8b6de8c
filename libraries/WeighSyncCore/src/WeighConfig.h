/*******************************************************************************
 * WeighConfig.h - Shared Configuration Constants
 *
 * Part of WeighSyncCore library - shared by the station app and the tests.
 * Contains the compile-time defaults of the acquisition and processing
 * pipeline and the runtime WeighingConfig that is validated once at startup.
 *
 * USAGE:
 *   WeighingConfig cfg;              // defaults below, no nodes yet
 *   cfg.addNode(11111, "celda_sup_izq");
 *   ...
 *   ConfigError err = validateConfig(cfg);
 *
 ******************************************************************************/

#ifndef WEIGH_CONFIG_H
#define WEIGH_CONFIG_H

#include <stdint.h>

// ============================================================================
// Node Set
// ============================================================================

// Upper bound on configured nodes. All per-node tables are sized by this and
// indexed by the node's position in the configured set.
#define WEIGH_MAX_NODES 8

// Installed platform: four load cells, one per corner
#define WEIGH_DEFAULT_NODE_COUNT 4

#define WEIGH_NODE_NAME_LEN 24

// ============================================================================
// Acquisition Timing
// ============================================================================

// Nominal per-node sample rate
#define WEIGH_SAMPLE_RATE_HZ 32

// Two samples whose timestamps differ by at most this much belong to the
// same frame. At 32 Hz the period is 31.25ms, so 10ms cannot match adjacent
// samples of one node while absorbing the +/-50us cross-node clock skew and
// radio delivery jitter.
#define WEIGH_TIMESTAMP_TOLERANCE_US 10000

// Maximum time an open frame waits for missing nodes, measured on the
// consumer clock from the arrival of its first sample.
#define WEIGH_FRAME_TIMEOUT_US 50000

// Connection-level staleness (acquisition layer)
#define WEIGH_ACQ_NODE_TIMEOUT_US 5000000

// Signal-level staleness (processing layer). Gates the total.
#define WEIGH_PROC_NODE_TIMEOUT_US 3000000

// ============================================================================
// Filter Configuration
// ============================================================================

#define WEIGH_MEDIAN_WINDOW 5
#define WEIGH_MEDIAN_MAX_WINDOW 15

#define WEIGH_EMA_ALPHA 0.3f
#define WEIGH_EMA_ALPHA_MIN 0.001f

// ============================================================================
// Sample Validation
// ============================================================================

#define WEIGH_VALUE_MIN_KG -50000.0f
#define WEIGH_VALUE_MAX_KG 50000.0f

// ============================================================================
// Buffer Sizes
// ============================================================================

#define WEIGH_SAMPLE_QUEUE_SIZE 256
#define WEIGH_HEALTH_EVENT_SLOTS 16

// Consumer receive timeout. Bounds how late a frame timeout is noticed.
#define WEIGH_RX_TIMEOUT_MS 10

// Rate limit for hot-path warnings
#define WEIGH_WARN_INTERVAL_US 5000000

// ============================================================================
// Runtime Configuration
// ============================================================================

struct NodeConfig
{
  uint32_t nodeId;               // Radio address of the load-cell node
  char name[WEIGH_NODE_NAME_LEN]; // Logical position, e.g. "celda_sup_izq"
};

struct WeighingConfig
{
  NodeConfig nodes[WEIGH_MAX_NODES];
  uint8_t nodeCount;

  uint16_t sampleRateHz;
  uint32_t timestampToleranceUs;
  uint32_t frameTimeoutUs;
  uint32_t acquisitionTimeoutUs;
  uint32_t processingTimeoutUs;

  uint8_t medianWindow; // must be odd
  float emaAlpha;       // (0, 1]

  float valueMinKg;
  float valueMaxKg;

  WeighingConfig();

  /**
   * Append a node to the configured set
   * @param nodeId Radio address
   * @param name Logical name (truncated to WEIGH_NODE_NAME_LEN - 1)
   * @return false if the table is full
   */
  bool addNode(uint32_t nodeId, const char *name);

  /**
   * Position of a node in the configured set
   * @return index, or -1 if the node is not configured
   */
  int8_t indexOf(uint32_t nodeId) const;
};

enum ConfigError
{
  CONFIG_OK = 0,
  CONFIG_NO_NODES,
  CONFIG_TOO_MANY_NODES,
  CONFIG_DUPLICATE_NODE,
  CONFIG_BAD_SAMPLE_RATE,
  CONFIG_BAD_TOLERANCE,
  CONFIG_BAD_FRAME_TIMEOUT,
  CONFIG_BAD_NODE_TIMEOUT,
  CONFIG_BAD_WINDOW,
  CONFIG_EVEN_WINDOW,
  CONFIG_BAD_ALPHA,
  CONFIG_BAD_RANGE
};

ConfigError validateConfig(const WeighingConfig &cfg);
const char *configErrorName(ConfigError err);

#endif // WEIGH_CONFIG_H
