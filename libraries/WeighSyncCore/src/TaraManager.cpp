#include "TaraManager.h"

#include <string.h>

#include "WeighLog.h"

TaraManager::TaraManager() : nodeCount(0), captureCount(0)
{
  memset(tares, 0, sizeof(tares));
}

void TaraManager::init(uint8_t count)
{
  if (count > WEIGH_MAX_NODES)
  {
    count = WEIGH_MAX_NODES;
  }

  std::lock_guard<std::mutex> guard(_lock);
  nodeCount = count;
  captureCount = 0;
  memset(tares, 0, sizeof(tares));
}

uint8_t TaraManager::capture(const float *values, NodeMask presentMask)
{
  if (values == nullptr)
    return 0;

  uint8_t captured = 0;
  {
    std::lock_guard<std::mutex> guard(_lock);
    for (uint8_t i = 0; i < nodeCount; i++)
    {
      if (maskHas(presentMask, i))
      {
        tares[i] = values[i];
        captured++;
      }
    }
    if (captured > 0)
    {
      captureCount++;
    }
  }

  // Log OUTSIDE the tare lock
  SAFE_LOG("[Tara] Captured %u of %u nodes (mask=0x%02X)\n", captured,
           nodeCount, presentMask);
  return captured;
}

void TaraManager::clear()
{
  {
    std::lock_guard<std::mutex> guard(_lock);
    memset(tares, 0, sizeof(tares));
  }
  SAFE_PRINTLN("[Tara] All offsets cleared");
}

float TaraManager::net(uint8_t nodeIndex, float smoothed) const
{
  return smoothed - getTare(nodeIndex);
}

float TaraManager::getTare(uint8_t nodeIndex) const
{
  if (nodeIndex >= WEIGH_MAX_NODES)
    return 0.0f;
  std::lock_guard<std::mutex> guard(_lock);
  return tares[nodeIndex];
}

void TaraManager::snapshot(float *out) const
{
  std::lock_guard<std::mutex> guard(_lock);
  memcpy(out, tares, sizeof(float) * nodeCount);
}

float TaraManager::totalTare(NodeMask mask) const
{
  std::lock_guard<std::mutex> guard(_lock);
  float total = 0.0f;
  for (uint8_t i = 0; i < nodeCount; i++)
  {
    if (maskHas(mask, i))
      total += tares[i];
  }
  return total;
}

uint32_t TaraManager::getCaptureCount() const
{
  std::lock_guard<std::mutex> guard(_lock);
  return captureCount;
}
