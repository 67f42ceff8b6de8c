/**
 * WeighingEngine.cpp - Per-frame weighing pipeline
 */

#include "WeighingEngine.h"

#include <string.h>

#include "WeighLog.h"

// ============================================================================
// Constructor
// ============================================================================

WeighingEngine::WeighingEngine()
    : configError(CONFIG_NO_NODES), initialized(false), samplesSubmitted(0),
      framesEmitted(0), filterResetCount(0), filterResetRequested(false),
      hasOutput(false), publishedCapturable(0)
{
  memset(lastRawKg, 0, sizeof(lastRawKg));
  memset(&lastOutput, 0, sizeof(lastOutput));
  memset(publishedSmoothed, 0, sizeof(publishedSmoothed));
  memset(publishedFilters, 0, sizeof(publishedFilters));
  memset(publishedHealth, 0, sizeof(publishedHealth));
  memset(&publishedStats, 0, sizeof(publishedStats));
}

// ============================================================================
// Initialization
// ============================================================================

bool WeighingEngine::init(const WeighingConfig &cfg)
{
  configError = validateConfig(cfg);
  if (configError != CONFIG_OK)
  {
    SAFE_LOG("[Engine] CRITICAL: Invalid configuration (%s)\n",
             configErrorName(configError));
    initialized = false;
    return false;
  }

  config = cfg;

  uint32_t nodeIds[WEIGH_MAX_NODES] = {0};
  for (uint8_t i = 0; i < config.nodeCount; i++)
  {
    nodeIds[i] = config.nodes[i].nodeId;
  }

  gate.init(config);
  aggregator.init(config.nodeCount, config.timestampToleranceUs,
                  config.frameTimeoutUs);
  for (uint8_t i = 0; i < WEIGH_MAX_NODES; i++)
  {
    medians[i].init(config.medianWindow);
    smoothers[i].setAlpha(config.emaAlpha);
    smoothers[i].reset();
  }
  tara.init(config.nodeCount);
  signalHealth.init(nodeIds, config.nodeCount, config.processingTimeoutUs,
                    "proc");

  memset(lastRawKg, 0, sizeof(lastRawKg));
  samplesSubmitted = 0;
  framesEmitted = 0;
  filterResetCount = 0;
  filterResetRequested.store(false);

  {
    std::lock_guard<std::mutex> guard(publishLock);
    hasOutput = false;
    memset(&lastOutput, 0, sizeof(lastOutput));
  }
  initialized = true;
  publishState();

  SAFE_LOG("[Engine] Ready: %u nodes, window=%u, alpha=%.3f "
           "(tau=%.0f ms at %u Hz)\n",
           config.nodeCount, config.medianWindow, (double)config.emaAlpha,
           (double)(ExponentialSmoother::timeConstantSeconds(
                        config.emaAlpha, 1.0f / config.sampleRateHz) *
                    1000.0f),
           config.sampleRateHz);
  for (uint8_t i = 0; i < config.nodeCount; i++)
  {
    SAFE_LOG("[Engine]   node %u: %lu (%s)\n", i,
             (unsigned long)config.nodes[i].nodeId, config.nodes[i].name);
  }
  return true;
}

// ============================================================================
// Consumer Thread
// ============================================================================

SampleVerdict WeighingEngine::submit(const RawSample &sample, uint64_t nowUs)
{
  if (!initialized)
    return SAMPLE_UNKNOWN_NODE;

  applyPendingReset();
  samplesSubmitted++;

  uint8_t nodeIndex = 0;
  SampleVerdict verdict = gate.accept(sample, nowUs, nodeIndex);
  if (verdict != SAMPLE_ACCEPTED)
  {
    publishState();
    return verdict;
  }

  ClosedFrame frame;
  bool closed = aggregator.ingest(nodeIndex, sample, nowUs, frame);

  // A sample that closed the previous window opens the next one, so its
  // liveness update must not reach the frame it closed
  if (closed && frame.reason != FRAME_CLOSE_COMPLETE)
  {
    processFrame(frame, nowUs);
    closed = false;
  }

  signalHealth.markSeen(nodeIndex, nowUs);

  if (closed)
  {
    processFrame(frame, nowUs);
  }

  publishState();
  return SAMPLE_ACCEPTED;
}

void WeighingEngine::tick(uint64_t nowUs)
{
  if (!initialized)
    return;

  applyPendingReset();

  gate.check(nowUs);
  signalHealth.check(nowUs);

  ClosedFrame frame;
  if (aggregator.update(nowUs, frame))
  {
    processFrame(frame, nowUs);
  }

  publishState();
}

void WeighingEngine::resetFilters()
{
  for (uint8_t i = 0; i < WEIGH_MAX_NODES; i++)
  {
    medians[i].reset();
    smoothers[i].reset();
  }
  filterResetCount++;
  SAFE_PRINTLN("[Engine] Filters reset (median windows and EMA cleared)");
  publishState();
}

void WeighingEngine::shutdown()
{
  aggregator.reset();
  publishState();
}

void WeighingEngine::applyPendingReset()
{
  if (filterResetRequested.exchange(false))
  {
    resetFilters();
  }
}

void WeighingEngine::processFrame(const ClosedFrame &frame, uint64_t nowUs)
{
  // Decide liveness at frame time, not at the last idle tick
  signalHealth.check(nowUs);

  float tares[WEIGH_MAX_NODES] = {0};
  tara.snapshot(tares);

  WeighingOutput out;
  memset(&out, 0, sizeof(out));
  out.frameNumber = frame.frameNumber;
  out.frameTimestampUs = frame.timestampUs;
  out.complete = frame.complete;
  out.closeReason = frame.reason;
  out.nodeCount = config.nodeCount;

  for (uint8_t i = 0; i < config.nodeCount; i++)
  {
    NodeReading &r = out.nodes[i];
    r.nodeId = config.nodes[i].nodeId;
    strncpy(r.name, config.nodes[i].name, sizeof(r.name) - 1);
    r.present = frame.has(i);

    if (r.present)
    {
      float despiked = medians[i].push(frame.values[i]);
      smoothers[i].update(despiked);
      r.rawKg = frame.values[i];
      lastRawKg[i] = frame.values[i];
    }
    else
    {
      r.rawKg = lastRawKg[i];
    }

    r.hasValue = smoothers[i].isInitialized();
    r.tareKg = tares[i];
    if (r.hasValue)
    {
      r.filteredKg = smoothers[i].value();
      r.netKg = r.filteredKg - tares[i];
    }
    r.status = signalHealth.getStatus(i);

    if (r.status == NODE_STALE)
    {
      out.staleNodes |= nodeBit(i);
    }
    if (r.status == NODE_ONLINE && r.hasValue)
    {
      out.totalNetKg += r.netKg;
      out.totalTareKg += r.tareKg;
      out.contributing |= nodeBit(i);
    }
  }

  framesEmitted++;

  {
    std::lock_guard<std::mutex> guard(publishLock);
    lastOutput = out;
    hasOutput = true;
  }

  SAFE_LOG_VERBOSE("[Engine] Frame #%lu total=%.3f kg (mask=0x%02X)\n",
                   (unsigned long)out.frameNumber, (double)out.totalNetKg,
                   out.contributing);

  if (outputCallback)
  {
    outputCallback(out);
  }
}

void WeighingEngine::publishState()
{
  float smoothed[WEIGH_MAX_NODES] = {0};
  NodeMask capturable = 0;
  NodeFilterSnapshot filters[WEIGH_MAX_NODES];
  NodeHealthSnapshot health[WEIGH_MAX_NODES];
  memset(filters, 0, sizeof(filters));
  memset(health, 0, sizeof(health));

  const NodeHealthMonitor &link = gate.linkMonitor();
  for (uint8_t i = 0; i < config.nodeCount; i++)
  {
    bool online = signalHealth.getStatus(i) == NODE_ONLINE;
    if (smoothers[i].isInitialized())
    {
      smoothed[i] = smoothers[i].value();
      if (online)
        capturable |= nodeBit(i);
    }

    NodeFilterSnapshot &f = filters[i];
    f.nodeId = config.nodes[i].nodeId;
    f.windowSize = medians[i].getWindowSize();
    f.windowCount = medians[i].copyWindow(f.window, WEIGH_MEDIAN_MAX_WINDOW);
    f.emaInitialized = smoothers[i].isInitialized();
    f.emaValue = smoothers[i].value();
    f.alpha = smoothers[i].getAlpha();

    NodeHealthSnapshot &h = health[i];
    const NodeLinkStats &ls = gate.getNodeStats(i);
    h.nodeId = config.nodes[i].nodeId;
    h.linkStatus = link.getStatus(i);
    h.signalStatus = signalHealth.getStatus(i);
    h.lastSeenUs = signalHealth.getLastSeen(i);
    h.packetsAccepted = ls.packetsAccepted;
    h.outOfRange = ls.outOfRange;
  }

  EngineStatistics stats;
  memset(&stats, 0, sizeof(stats));
  stats.samplesSubmitted = samplesSubmitted;
  stats.samplesAccepted = gate.getAcceptedCount();
  stats.unknownNode = gate.getUnknownNodeCount();
  stats.outOfRange = gate.getOutOfRangeCount();
  stats.framesEmitted = framesEmitted;
  stats.framesComplete = aggregator.getCompleteFrames();
  stats.framesIncomplete = aggregator.getIncompleteFrames();
  stats.timeoutCloses = aggregator.getTimeoutCloses();
  stats.toleranceCloses = aggregator.getToleranceCloses();
  stats.duplicateSamples = aggregator.getDuplicateSamples();
  stats.tareCaptures = tara.getCaptureCount();
  stats.filterResets = filterResetCount;
  stats.completeRate = aggregator.getCompleteRate();
  stats.nodeCount = config.nodeCount;
  stats.onlineNodes = signalHealth.onlineCount();
  stats.linkOnlineNodes = link.onlineCount();

  std::lock_guard<std::mutex> guard(publishLock);
  memcpy(publishedSmoothed, smoothed, sizeof(publishedSmoothed));
  publishedCapturable = capturable;
  memcpy(publishedFilters, filters, sizeof(publishedFilters));
  memcpy(publishedHealth, health, sizeof(publishedHealth));
  publishedStats = stats;
}

// ============================================================================
// Control Thread
// ============================================================================

uint8_t WeighingEngine::captureTare()
{
  float smoothed[WEIGH_MAX_NODES] = {0};
  NodeMask mask = 0;
  {
    std::lock_guard<std::mutex> guard(publishLock);
    memcpy(smoothed, publishedSmoothed, sizeof(smoothed));
    mask = publishedCapturable;
  }

  if (mask == 0)
  {
    SAFE_PRINTLN("[Engine] WARNING: Tare requested but no node has a value");
    return 0;
  }
  return tara.capture(smoothed, mask);
}

void WeighingEngine::clearTare() { tara.clear(); }

bool WeighingEngine::getFilterState(uint8_t nodeIndex,
                                    NodeFilterSnapshot &out) const
{
  if (nodeIndex >= config.nodeCount)
    return false;
  std::lock_guard<std::mutex> guard(publishLock);
  out = publishedFilters[nodeIndex];
  return true;
}

bool WeighingEngine::getNodeHealth(uint8_t nodeIndex,
                                   NodeHealthSnapshot &out) const
{
  if (nodeIndex >= config.nodeCount)
    return false;
  std::lock_guard<std::mutex> guard(publishLock);
  out = publishedHealth[nodeIndex];
  return true;
}

EngineStatistics WeighingEngine::getStatistics() const
{
  std::lock_guard<std::mutex> guard(publishLock);
  EngineStatistics stats = publishedStats;
  // The tare table has its own lock and may change between publishes
  stats.tareCaptures = tara.getCaptureCount();
  return stats;
}

bool WeighingEngine::getLastOutput(WeighingOutput &out) const
{
  std::lock_guard<std::mutex> guard(publishLock);
  if (!hasOutput)
    return false;
  out = lastOutput;
  return true;
}
