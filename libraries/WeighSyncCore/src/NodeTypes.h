/*******************************************************************************
 * NodeTypes.h - Sample and node status definitions
 *
 * Part of WeighSyncCore library. Types that cross the boundary between the
 * radio driver collaborator and the processing pipeline.
 ******************************************************************************/

#ifndef NODE_TYPES_H
#define NODE_TYPES_H

#include <stdint.h>

#include "WeighConfig.h"

// One calibrated reading from one load-cell node
struct RawSample
{
  uint32_t nodeId;      // Radio address of the node
  uint64_t timestampUs; // Monotonic sample time (microseconds)
  float valueKg;        // Calibrated weight
};

// Bit i set = configured node i. Node positions, not radio addresses.
typedef uint8_t NodeMask;

static_assert(WEIGH_MAX_NODES <= 8, "NodeMask holds at most 8 nodes");

inline NodeMask nodeBit(uint8_t nodeIndex)
{
  return (NodeMask)(1u << nodeIndex);
}

inline bool maskHas(NodeMask mask, uint8_t nodeIndex)
{
  return (mask & nodeBit(nodeIndex)) != 0;
}

enum NodeStatus
{
  NODE_UNSEEN = 0, // No sample accepted since startup
  NODE_ONLINE = 1, // Reporting within the timeout
  NODE_STALE = 2   // Silent for longer than the timeout
};

inline const char *nodeStatusName(NodeStatus status)
{
  switch (status)
  {
  case NODE_UNSEEN:
    return "UNSEEN";
  case NODE_ONLINE:
    return "ONLINE";
  case NODE_STALE:
    return "STALE";
  }
  return "UNKNOWN";
}

// The driver reports seconds with sub-millisecond resolution
inline uint64_t secondsToMicros(double seconds)
{
  if (seconds <= 0.0)
    return 0;
  return (uint64_t)(seconds * 1000000.0 + 0.5);
}

#endif // NODE_TYPES_H
