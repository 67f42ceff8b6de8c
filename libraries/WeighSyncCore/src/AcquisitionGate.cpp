#include "AcquisitionGate.h"

#include <math.h>
#include <string.h>

#include "WeighLog.h"

const char *sampleVerdictName(SampleVerdict verdict)
{
  switch (verdict)
  {
  case SAMPLE_ACCEPTED:
    return "accepted";
  case SAMPLE_UNKNOWN_NODE:
    return "unknown_node";
  case SAMPLE_OUT_OF_RANGE:
    return "out_of_range";
  }
  return "unknown";
}

AcquisitionGate::AcquisitionGate()
    : nodeCount(0), valueMinKg(WEIGH_VALUE_MIN_KG),
      valueMaxKg(WEIGH_VALUE_MAX_KG), acceptedCount(0), unknownNodeCount(0),
      outOfRangeCount(0), lastUnknownLogUs(0), lastRangeLogUs(0)
{
  memset(nodeIds, 0, sizeof(nodeIds));
  memset(stats, 0, sizeof(stats));
}

void AcquisitionGate::init(const WeighingConfig &cfg)
{
  nodeCount = (cfg.nodeCount > WEIGH_MAX_NODES) ? WEIGH_MAX_NODES
                                                : cfg.nodeCount;
  memset(nodeIds, 0, sizeof(nodeIds));
  for (uint8_t i = 0; i < nodeCount; i++)
  {
    nodeIds[i] = cfg.nodes[i].nodeId;
  }
  valueMinKg = cfg.valueMinKg;
  valueMaxKg = cfg.valueMaxKg;

  link.init(nodeIds, nodeCount, cfg.acquisitionTimeoutUs, "acq");

  memset(stats, 0, sizeof(stats));
  acceptedCount = 0;
  unknownNodeCount = 0;
  outOfRangeCount = 0;
  lastUnknownLogUs = 0;
  lastRangeLogUs = 0;
}

SampleVerdict AcquisitionGate::accept(const RawSample &sample, uint64_t nowUs,
                                      uint8_t &nodeIndex)
{
  int8_t idx = -1;
  for (uint8_t i = 0; i < nodeCount; i++)
  {
    if (nodeIds[i] == sample.nodeId)
    {
      idx = (int8_t)i;
      break;
    }
  }

  if (idx < 0)
  {
    unknownNodeCount++;
    if (lastUnknownLogUs == 0 || nowUs - lastUnknownLogUs > WEIGH_WARN_INTERVAL_US)
    {
      SAFE_LOG("[Gate] WARNING: Node %lu rejected (%s, %lu so far)\n",
               (unsigned long)sample.nodeId,
               sampleVerdictName(SAMPLE_UNKNOWN_NODE),
               (unsigned long)unknownNodeCount);
      lastUnknownLogUs = nowUs;
    }
    return SAMPLE_UNKNOWN_NODE;
  }

  NodeLinkStats &s = stats[idx];
  if (!isfinite(sample.valueKg) || sample.valueKg < valueMinKg ||
      sample.valueKg > valueMaxKg)
  {
    s.outOfRange++;
    outOfRangeCount++;
    if (lastRangeLogUs == 0 || nowUs - lastRangeLogUs > WEIGH_WARN_INTERVAL_US)
    {
      SAFE_LOG("[Gate] WARNING: Node %lu rejected (%s, %.3f kg not in "
               "[%.0f, %.0f])\n",
               (unsigned long)sample.nodeId,
               sampleVerdictName(SAMPLE_OUT_OF_RANGE), (double)sample.valueKg,
               (double)valueMinKg, (double)valueMaxKg);
      lastRangeLogUs = nowUs;
    }
    return SAMPLE_OUT_OF_RANGE;
  }

  s.packetsAccepted++;
  s.lastValueKg = sample.valueKg;
  acceptedCount++;
  link.markSeen((uint8_t)idx, nowUs);

  nodeIndex = (uint8_t)idx;
  return SAMPLE_ACCEPTED;
}

const NodeLinkStats &AcquisitionGate::getNodeStats(uint8_t nodeIndex) const
{
  if (nodeIndex >= WEIGH_MAX_NODES)
    nodeIndex = 0;
  return stats[nodeIndex];
}
