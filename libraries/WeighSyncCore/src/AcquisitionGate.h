/**
 * AcquisitionGate.h - Acquisition-layer sample validation
 *
 * First stage after the sample queue. Rejects samples from node IDs that are
 * not in the configured set and values that are non-finite or outside the
 * plausible range, keeps per-node packet and error counters, and tracks
 * connection-level liveness (default 5 s) with its own NodeHealthMonitor.
 *
 * A rejected sample leaves every downstream state untouched: it does not
 * refresh liveness, join a frame or reach the filters.
 */

#ifndef ACQUISITION_GATE_H
#define ACQUISITION_GATE_H

#include <stdint.h>

#include "NodeHealthMonitor.h"
#include "NodeTypes.h"
#include "WeighConfig.h"

enum SampleVerdict
{
  SAMPLE_ACCEPTED = 0,
  SAMPLE_UNKNOWN_NODE,
  SAMPLE_OUT_OF_RANGE
};

const char *sampleVerdictName(SampleVerdict verdict);

struct NodeLinkStats
{
  uint32_t packetsAccepted;
  uint32_t outOfRange;
  float lastValueKg;
};

class AcquisitionGate
{
public:
  AcquisitionGate();

  // cfg must already have passed validateConfig()
  void init(const WeighingConfig &cfg);

  /**
   * Validate one sample
   * @param sample Incoming sample
   * @param nowUs Consumer clock
   * @param nodeIndex Set to the node's position when accepted
   */
  SampleVerdict accept(const RawSample &sample, uint64_t nowUs,
                       uint8_t &nodeIndex);

  // Connection-level liveness sweep
  uint8_t check(uint64_t nowUs) { return link.check(nowUs); }

  NodeHealthMonitor &linkMonitor() { return link; }
  const NodeHealthMonitor &linkMonitor() const { return link; }

  const NodeLinkStats &getNodeStats(uint8_t nodeIndex) const;

  uint32_t getAcceptedCount() const { return acceptedCount; }
  uint32_t getUnknownNodeCount() const { return unknownNodeCount; }
  uint32_t getOutOfRangeCount() const { return outOfRangeCount; }

private:
  uint32_t nodeIds[WEIGH_MAX_NODES];
  uint8_t nodeCount;
  float valueMinKg;
  float valueMaxKg;

  NodeHealthMonitor link;
  NodeLinkStats stats[WEIGH_MAX_NODES];

  uint32_t acceptedCount;
  uint32_t unknownNodeCount;
  uint32_t outOfRangeCount;

  uint64_t lastUnknownLogUs;
  uint64_t lastRangeLogUs;
};

#endif // ACQUISITION_GATE_H
