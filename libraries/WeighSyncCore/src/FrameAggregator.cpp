/**
 * FrameAggregator.cpp - Cross-Node Frame Assembly
 */

#include "FrameAggregator.h"

#include <string.h>

#include "WeighLog.h"

const char *frameCloseReasonName(FrameCloseReason reason)
{
  switch (reason)
  {
  case FRAME_CLOSE_COMPLETE:
    return "complete";
  case FRAME_CLOSE_TOLERANCE:
    return "tolerance";
  case FRAME_CLOSE_TIMEOUT:
    return "timeout";
  case FRAME_CLOSE_DUPLICATE:
    return "duplicate";
  }
  return "unknown";
}

// ============================================================================
// Constructor
// ============================================================================

FrameAggregator::FrameAggregator()
    : expectedNodeCount(0), toleranceUs(WEIGH_TIMESTAMP_TOLERANCE_US),
      timeoutUs(WEIGH_FRAME_TIMEOUT_US), open(false), nextFrameNumber(0),
      completeFrameCount(0), incompleteFrameCount(0), timeoutCloseCount(0),
      toleranceCloseCount(0), duplicateCount(0), discardedFrameCount(0),
      lastDuplicateLogUs(0), lastPartialLogUs(0)
{
  memset(&current, 0, sizeof(current));
}

// ============================================================================
// Initialization
// ============================================================================

void FrameAggregator::init(uint8_t expectedNodes, uint32_t tolerance,
                           uint32_t timeout)
{
  if (expectedNodes > WEIGH_MAX_NODES)
  {
    expectedNodes = WEIGH_MAX_NODES;
  }
  expectedNodeCount = expectedNodes;
  toleranceUs = tolerance;
  timeoutUs = timeout;

  open = false;
  memset(&current, 0, sizeof(current));
  nextFrameNumber = 0;
  completeFrameCount = 0;
  incompleteFrameCount = 0;
  timeoutCloseCount = 0;
  toleranceCloseCount = 0;
  duplicateCount = 0;
  discardedFrameCount = 0;

  SAFE_LOG("[FrameAgg] Expecting %u nodes, tolerance=%lu us, timeout=%lu us\n",
           expectedNodeCount, (unsigned long)toleranceUs,
           (unsigned long)timeoutUs);
}

// ============================================================================
// Sample Ingestion
// ============================================================================

bool FrameAggregator::ingest(uint8_t nodeIndex, const RawSample &sample,
                             uint64_t nowUs, ClosedFrame &out)
{
  if (nodeIndex >= expectedNodeCount)
    return false;

  bool closed = false;

  // 1. Timeout, independent of the new sample
  if (open && nowUs > current.openedAtUs &&
      nowUs - current.openedAtUs > timeoutUs)
  {
    closeFrame(FRAME_CLOSE_TIMEOUT, nowUs, out);
    closed = true;
  }

  if (open)
  {
    uint64_t distance = (sample.timestampUs >= current.timestampUs)
                            ? sample.timestampUs - current.timestampUs
                            : current.timestampUs - sample.timestampUs;

    // 2. Tolerance
    if (distance > toleranceUs)
    {
      closeFrame(FRAME_CLOSE_TOLERANCE, nowUs, out);
      closed = true;
    }
    // 3. Same node twice in one window
    else if (current.has(nodeIndex))
    {
      duplicateCount++;
      if (nowUs - lastDuplicateLogUs > WEIGH_WARN_INTERVAL_US ||
          lastDuplicateLogUs == 0)
      {
        SAFE_LOG("[FrameAgg] WARNING: Duplicate sample from node index %u "
                 "(frame ts=%llu, sample ts=%llu)\n",
                 nodeIndex, (unsigned long long)current.timestampUs,
                 (unsigned long long)sample.timestampUs);
        lastDuplicateLogUs = nowUs;
      }
      closeFrame(FRAME_CLOSE_DUPLICATE, nowUs, out);
      closed = true;
    }
    else
    {
      addToFrame(nodeIndex, sample.valueKg);
      if (current.presentCount >= expectedNodeCount)
      {
        closeFrame(FRAME_CLOSE_COMPLETE, nowUs, out);
        return true;
      }
      return closed;
    }
  }

  // The sample starts a new window
  openFrame(nodeIndex, sample, nowUs);
  if (!closed && current.presentCount >= expectedNodeCount)
  {
    closeFrame(FRAME_CLOSE_COMPLETE, nowUs, out);
    return true;
  }
  return closed;
}

bool FrameAggregator::update(uint64_t nowUs, ClosedFrame &out)
{
  if (!open)
    return false;

  if (nowUs > current.openedAtUs && nowUs - current.openedAtUs > timeoutUs)
  {
    closeFrame(FRAME_CLOSE_TIMEOUT, nowUs, out);
    return true;
  }
  return false;
}

void FrameAggregator::reset()
{
  if (open)
  {
    discardedFrameCount++;
    SAFE_LOG("[FrameAgg] Discarding open frame #%lu (%u/%u nodes)\n",
             (unsigned long)current.frameNumber, current.presentCount,
             expectedNodeCount);
  }
  open = false;
  memset(&current, 0, sizeof(current));
}

// ============================================================================
// Frame Handling
// ============================================================================

void FrameAggregator::openFrame(uint8_t nodeIndex, const RawSample &sample,
                                uint64_t nowUs)
{
  memset(&current, 0, sizeof(current));
  current.frameNumber = nextFrameNumber++;
  current.timestampUs = sample.timestampUs;
  current.openedAtUs = nowUs;
  open = true;
  addToFrame(nodeIndex, sample.valueKg);
}

void FrameAggregator::addToFrame(uint8_t nodeIndex, float valueKg)
{
  current.values[nodeIndex] = valueKg;
  current.presentMask |= nodeBit(nodeIndex);
  current.presentCount++;
}

void FrameAggregator::closeFrame(FrameCloseReason reason, uint64_t nowUs,
                                 ClosedFrame &out)
{
  current.complete = (current.presentCount >= expectedNodeCount);
  current.reason = reason;
  out = current;

  open = false;
  memset(&current, 0, sizeof(current));

  if (out.complete)
  {
    completeFrameCount++;
  }
  else
  {
    incompleteFrameCount++;
  }

  if (reason == FRAME_CLOSE_TIMEOUT)
  {
    timeoutCloseCount++;
  }
  else if (reason == FRAME_CLOSE_TOLERANCE)
  {
    toleranceCloseCount++;
  }

  if (!out.complete &&
      (nowUs - lastPartialLogUs > WEIGH_WARN_INTERVAL_US ||
       lastPartialLogUs == 0))
  {
    SAFE_LOG("[FrameAgg] Partial frame #%lu closed by %s (%u/%u nodes, "
             "mask=0x%02X)\n",
             (unsigned long)out.frameNumber, frameCloseReasonName(reason),
             out.presentCount, expectedNodeCount, out.presentMask);
    lastPartialLogUs = nowUs;
  }
}
