/**
 * WeighConfig.cpp - Runtime configuration defaults and validation
 */

#include "WeighConfig.h"

#include <math.h>
#include <string.h>

WeighingConfig::WeighingConfig()
    : nodeCount(0), sampleRateHz(WEIGH_SAMPLE_RATE_HZ),
      timestampToleranceUs(WEIGH_TIMESTAMP_TOLERANCE_US),
      frameTimeoutUs(WEIGH_FRAME_TIMEOUT_US),
      acquisitionTimeoutUs(WEIGH_ACQ_NODE_TIMEOUT_US),
      processingTimeoutUs(WEIGH_PROC_NODE_TIMEOUT_US),
      medianWindow(WEIGH_MEDIAN_WINDOW), emaAlpha(WEIGH_EMA_ALPHA),
      valueMinKg(WEIGH_VALUE_MIN_KG), valueMaxKg(WEIGH_VALUE_MAX_KG)
{
  memset(nodes, 0, sizeof(nodes));
}

bool WeighingConfig::addNode(uint32_t nodeId, const char *name)
{
  if (nodeCount >= WEIGH_MAX_NODES)
  {
    return false;
  }

  NodeConfig &node = nodes[nodeCount];
  node.nodeId = nodeId;
  if (name != nullptr)
  {
    strncpy(node.name, name, sizeof(node.name) - 1);
    node.name[sizeof(node.name) - 1] = '\0';
  }
  else
  {
    node.name[0] = '\0';
  }
  nodeCount++;
  return true;
}

int8_t WeighingConfig::indexOf(uint32_t nodeId) const
{
  for (uint8_t i = 0; i < nodeCount; i++)
  {
    if (nodes[i].nodeId == nodeId)
    {
      return (int8_t)i;
    }
  }
  return -1;
}

ConfigError validateConfig(const WeighingConfig &cfg)
{
  if (cfg.nodeCount == 0)
    return CONFIG_NO_NODES;
  if (cfg.nodeCount > WEIGH_MAX_NODES)
    return CONFIG_TOO_MANY_NODES;

  for (uint8_t i = 0; i < cfg.nodeCount; i++)
  {
    for (uint8_t j = i + 1; j < cfg.nodeCount; j++)
    {
      if (cfg.nodes[i].nodeId == cfg.nodes[j].nodeId)
        return CONFIG_DUPLICATE_NODE;
    }
  }

  if (cfg.sampleRateHz == 0)
    return CONFIG_BAD_SAMPLE_RATE;

  // A tolerance of a full sample period or more would merge adjacent
  // samples of the same node into one frame.
  uint32_t periodUs = 1000000UL / cfg.sampleRateHz;
  if (cfg.timestampToleranceUs == 0 || cfg.timestampToleranceUs >= periodUs)
    return CONFIG_BAD_TOLERANCE;

  if (cfg.frameTimeoutUs == 0)
    return CONFIG_BAD_FRAME_TIMEOUT;

  if (cfg.acquisitionTimeoutUs <= cfg.frameTimeoutUs ||
      cfg.processingTimeoutUs <= cfg.frameTimeoutUs)
    return CONFIG_BAD_NODE_TIMEOUT;

  if (cfg.medianWindow == 0 || cfg.medianWindow > WEIGH_MEDIAN_MAX_WINDOW)
    return CONFIG_BAD_WINDOW;
  if ((cfg.medianWindow % 2) == 0)
    return CONFIG_EVEN_WINDOW;

  if (!isfinite(cfg.emaAlpha) || cfg.emaAlpha <= 0.0f || cfg.emaAlpha > 1.0f)
    return CONFIG_BAD_ALPHA;

  if (!isfinite(cfg.valueMinKg) || !isfinite(cfg.valueMaxKg) ||
      cfg.valueMinKg >= cfg.valueMaxKg)
    return CONFIG_BAD_RANGE;

  return CONFIG_OK;
}

const char *configErrorName(ConfigError err)
{
  switch (err)
  {
  case CONFIG_OK:
    return "OK";
  case CONFIG_NO_NODES:
    return "NO_NODES";
  case CONFIG_TOO_MANY_NODES:
    return "TOO_MANY_NODES";
  case CONFIG_DUPLICATE_NODE:
    return "DUPLICATE_NODE";
  case CONFIG_BAD_SAMPLE_RATE:
    return "BAD_SAMPLE_RATE";
  case CONFIG_BAD_TOLERANCE:
    return "BAD_TOLERANCE";
  case CONFIG_BAD_FRAME_TIMEOUT:
    return "BAD_FRAME_TIMEOUT";
  case CONFIG_BAD_NODE_TIMEOUT:
    return "BAD_NODE_TIMEOUT";
  case CONFIG_BAD_WINDOW:
    return "BAD_WINDOW";
  case CONFIG_EVEN_WINDOW:
    return "EVEN_WINDOW";
  case CONFIG_BAD_ALPHA:
    return "BAD_ALPHA";
  case CONFIG_BAD_RANGE:
    return "BAD_RANGE";
  }
  return "UNKNOWN";
}
