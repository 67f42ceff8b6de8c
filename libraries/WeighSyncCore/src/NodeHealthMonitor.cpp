#include "NodeHealthMonitor.h"

#include <string.h>

#include "WeighLog.h"

NodeHealthMonitor::NodeHealthMonitor()
    : nodeCount(0), timeoutUs(WEIGH_PROC_NODE_TIMEOUT_US), tag("health"),
      eventHead(0), eventCount(0), droppedEvents(0), staleTransitions(0)
{
  memset(nodeIds, 0, sizeof(nodeIds));
  memset(lastSeenUs, 0, sizeof(lastSeenUs));
  memset(events, 0, sizeof(events));
  for (uint8_t i = 0; i < WEIGH_MAX_NODES; i++)
  {
    status[i] = NODE_UNSEEN;
  }
}

void NodeHealthMonitor::init(const uint32_t *ids, uint8_t count,
                             uint32_t timeout, const char *layerTag)
{
  if (count > WEIGH_MAX_NODES)
  {
    count = WEIGH_MAX_NODES;
  }
  nodeCount = count;
  memset(nodeIds, 0, sizeof(nodeIds));
  if (ids != nullptr)
  {
    memcpy(nodeIds, ids, sizeof(uint32_t) * count);
  }
  timeoutUs = timeout;
  tag = (layerTag != nullptr) ? layerTag : "health";
  reset();
}

bool NodeHealthMonitor::markSeen(uint8_t nodeIndex, uint64_t nowUs)
{
  if (nodeIndex >= nodeCount)
    return false;

  lastSeenUs[nodeIndex] = nowUs;
  if (status[nodeIndex] != NODE_ONLINE)
  {
    transition(nodeIndex, NODE_ONLINE, nowUs);
    return true;
  }
  return false;
}

uint8_t NodeHealthMonitor::check(uint64_t nowUs)
{
  uint8_t wentStale = 0;
  for (uint8_t i = 0; i < nodeCount; i++)
  {
    if (status[i] != NODE_ONLINE)
      continue;

    // A sample stamped after nowUs (clock handoff between threads) is fresh
    if (nowUs <= lastSeenUs[i])
      continue;

    if (nowUs - lastSeenUs[i] > timeoutUs)
    {
      transition(i, NODE_STALE, nowUs);
      staleTransitions++;
      wentStale++;
    }
  }
  return wentStale;
}

NodeStatus NodeHealthMonitor::getStatus(uint8_t nodeIndex) const
{
  if (nodeIndex >= nodeCount)
    return NODE_UNSEEN;
  return status[nodeIndex];
}

uint64_t NodeHealthMonitor::getLastSeen(uint8_t nodeIndex) const
{
  if (nodeIndex >= nodeCount)
    return 0;
  return lastSeenUs[nodeIndex];
}

float NodeHealthMonitor::offlineSeconds(uint8_t nodeIndex,
                                        uint64_t nowUs) const
{
  if (nodeIndex >= nodeCount || status[nodeIndex] == NODE_ONLINE)
    return 0.0f;
  if (status[nodeIndex] == NODE_UNSEEN || nowUs <= lastSeenUs[nodeIndex])
    return 0.0f;
  return (float)(nowUs - lastSeenUs[nodeIndex]) / 1000000.0f;
}

NodeMask NodeHealthMonitor::onlineMask() const
{
  NodeMask mask = 0;
  for (uint8_t i = 0; i < nodeCount; i++)
  {
    if (status[i] == NODE_ONLINE)
      mask |= nodeBit(i);
  }
  return mask;
}

NodeMask NodeHealthMonitor::staleMask() const
{
  NodeMask mask = 0;
  for (uint8_t i = 0; i < nodeCount; i++)
  {
    if (status[i] == NODE_STALE)
      mask |= nodeBit(i);
  }
  return mask;
}

uint8_t NodeHealthMonitor::onlineCount() const
{
  uint8_t n = 0;
  for (uint8_t i = 0; i < nodeCount; i++)
  {
    if (status[i] == NODE_ONLINE)
      n++;
  }
  return n;
}

bool NodeHealthMonitor::popEvent(NodeHealthEvent &out)
{
  if (eventCount == 0)
    return false;

  uint8_t oldest =
      (uint8_t)((eventHead + WEIGH_HEALTH_EVENT_SLOTS - eventCount) %
                WEIGH_HEALTH_EVENT_SLOTS);
  out = events[oldest];
  eventCount--;
  return true;
}

void NodeHealthMonitor::reset()
{
  for (uint8_t i = 0; i < WEIGH_MAX_NODES; i++)
  {
    status[i] = NODE_UNSEEN;
    lastSeenUs[i] = 0;
  }
  eventHead = 0;
  eventCount = 0;
  droppedEvents = 0;
  staleTransitions = 0;
}

void NodeHealthMonitor::transition(uint8_t nodeIndex, NodeStatus to,
                                   uint64_t nowUs)
{
  NodeStatus from = status[nodeIndex];
  status[nodeIndex] = to;

  NodeHealthEvent &ev = events[eventHead];
  ev.nodeId = nodeIds[nodeIndex];
  ev.nodeIndex = nodeIndex;
  ev.from = from;
  ev.to = to;
  ev.atUs = nowUs;
  eventHead = (uint8_t)((eventHead + 1) % WEIGH_HEALTH_EVENT_SLOTS);
  if (eventCount < WEIGH_HEALTH_EVENT_SLOTS)
  {
    eventCount++;
  }
  else
  {
    droppedEvents++;
  }

  if (to == NODE_STALE)
  {
    SAFE_LOG("[Health:%s] WARNING: Node %lu stale (no data for %lu ms)\n", tag,
             (unsigned long)nodeIds[nodeIndex],
             (unsigned long)(timeoutUs / 1000));
  }
  else if (from == NODE_STALE)
  {
    SAFE_LOG("[Health:%s] Node %lu back online\n", tag,
             (unsigned long)nodeIds[nodeIndex]);
  }
  else
  {
    SAFE_LOG("[Health:%s] Node %lu online\n", tag,
             (unsigned long)nodeIds[nodeIndex]);
  }
}
