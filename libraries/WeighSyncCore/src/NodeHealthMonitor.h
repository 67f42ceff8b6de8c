/**
 * NodeHealthMonitor.h - Per-node liveness tracking
 *
 * State machine per node:
 *
 *   UNSEEN --sample--> ONLINE --(now - lastSeen > timeout)--> STALE
 *                        ^                                      |
 *                        +----------------sample----------------+
 *
 * lastSeen is refreshed by every accepted raw sample, never by filter output.
 * There is no terminal state. Every transition is queued once as a
 * NodeHealthEvent, so a disconnection episode produces exactly one
 * ONLINE->STALE event and one STALE->ONLINE event when the node resumes.
 *
 * Two instances run with independent timeouts: the acquisition layer
 * (connection-level, 5 s) and the processing layer (signal-level, 3 s, gates
 * the total). Single-threaded: owned by the ingestion consumer.
 */

#ifndef NODE_HEALTH_MONITOR_H
#define NODE_HEALTH_MONITOR_H

#include <stdint.h>

#include "NodeTypes.h"

struct NodeHealthEvent
{
  uint32_t nodeId;
  uint8_t nodeIndex;
  NodeStatus from;
  NodeStatus to;
  uint64_t atUs;
};

class NodeHealthMonitor
{
public:
  NodeHealthMonitor();

  /**
   * Configure the tracked node set
   * @param nodeIds Radio addresses, indexed by node position
   * @param count Number of nodes (clamped to WEIGH_MAX_NODES)
   * @param timeoutUs Silence after which an ONLINE node becomes STALE
   * @param layerTag Short name used in log lines, e.g. "proc"
   */
  void init(const uint32_t *nodeIds, uint8_t count, uint32_t timeoutUs,
            const char *layerTag);

  /**
   * Record an accepted sample
   * @return true if the node transitioned to ONLINE
   */
  bool markSeen(uint8_t nodeIndex, uint64_t nowUs);

  /**
   * Apply the timeout rule to every ONLINE node
   * @return number of ONLINE->STALE transitions
   */
  uint8_t check(uint64_t nowUs);

  NodeStatus getStatus(uint8_t nodeIndex) const;
  uint64_t getLastSeen(uint8_t nodeIndex) const;
  float offlineSeconds(uint8_t nodeIndex, uint64_t nowUs) const;

  NodeMask onlineMask() const;
  NodeMask staleMask() const;
  uint8_t onlineCount() const;

  // Oldest pending transition, if any
  bool popEvent(NodeHealthEvent &out);
  uint8_t pendingEvents() const { return eventCount; }
  uint32_t getDroppedEvents() const { return droppedEvents; }

  uint32_t getStaleTransitions() const { return staleTransitions; }

  // Back to UNSEEN for every node, events discarded
  void reset();

private:
  void transition(uint8_t nodeIndex, NodeStatus to, uint64_t nowUs);

  uint32_t nodeIds[WEIGH_MAX_NODES];
  NodeStatus status[WEIGH_MAX_NODES];
  uint64_t lastSeenUs[WEIGH_MAX_NODES];
  uint8_t nodeCount;
  uint32_t timeoutUs;
  const char *tag;

  // Event ring. When full the oldest event is overwritten.
  NodeHealthEvent events[WEIGH_HEALTH_EVENT_SLOTS];
  uint8_t eventHead;
  uint8_t eventCount;
  uint32_t droppedEvents;

  uint32_t staleTransitions;
};

#endif // NODE_HEALTH_MONITOR_H
