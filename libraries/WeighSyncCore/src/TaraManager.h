/**
 * TaraManager.h - Per-node tare offsets
 *
 * Each node keeps its own zero reference. A tare captured while one node is
 * offline leaves that node's previous offset untouched, so when the node
 * comes back its net value is still referenced to its own baseline instead of
 * a combined offset that no longer applies.
 *
 * THREAD SAFETY:
 * capture()/clear() are called from the control thread (operator action)
 * while the ingestion consumer reads offsets for every frame. All access goes
 * through one mutex and capture() writes every captured entry inside a
 * single critical section, so a reader sees either the whole old table or the
 * whole new one. The consumer takes one snapshot() per frame.
 */

#ifndef TARA_MANAGER_H
#define TARA_MANAGER_H

#include <mutex>
#include <stdint.h>

#include "NodeTypes.h"

class TaraManager
{
public:
  TaraManager();

  void init(uint8_t nodeCount);

  /**
   * Set tare[i] = values[i] for every node i in presentMask
   * @param values Smoothed values indexed by node position
   * @param presentMask Nodes to capture; others keep their tare
   * @return number of nodes captured
   */
  uint8_t capture(const float *values, NodeMask presentMask);

  // All offsets back to 0.0
  void clear();

  // smoothed - tare[nodeIndex]
  float net(uint8_t nodeIndex, float smoothed) const;

  float getTare(uint8_t nodeIndex) const;

  // Copy all offsets (nodeCount entries) under one lock
  void snapshot(float *out) const;

  // Sum of offsets over the nodes in mask
  float totalTare(NodeMask mask) const;

  uint32_t getCaptureCount() const;
  uint8_t getNodeCount() const { return nodeCount; }

private:
  mutable std::mutex _lock;
  float tares[WEIGH_MAX_NODES];
  uint8_t nodeCount;
  uint32_t captureCount;
};

#endif // TARA_MANAGER_H
