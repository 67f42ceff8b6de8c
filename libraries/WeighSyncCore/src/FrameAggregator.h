/**
 * FrameAggregator.h - Cross-Node Frame Assembly
 *
 * PURPOSE:
 * Groups near-simultaneous samples from the configured load-cell nodes into
 * one "frame" so the downstream filters see a coherent set of readings
 * instead of four independently timed streams.
 *
 * RULES:
 * - At most one frame is open at a time. Its timestamp is the timestamp of
 *   the sample that opened it.
 * - A sample joins the open frame when |sample.ts - frame.ts| <= tolerance.
 *   Otherwise the open frame is closed (even if incomplete) and the sample
 *   opens a new one.
 * - A frame is complete when every configured node has exactly one value.
 *   It closes as soon as it is complete.
 * - A frame that has been open longer than the timeout (consumer clock,
 *   measured from the arrival of its first sample) is closed as-is.
 * - A second sample from a node already present closes the open frame and
 *   opens a new one. Values are never overwritten.
 *
 * Close conditions are checked in a fixed order on every ingest(): timeout
 * first, then tolerance, then duplicate. update() applies only the timeout
 * and is called when the consumer's queue receive times out.
 *
 * One ingest() or update() closes at most one frame: an open frame always
 * lacks at least one node, so a frame opened by the current sample can only
 * be immediately complete for a single-node set, where no frame is ever left
 * open.
 *
 * Owned and driven by the single ingestion consumer; no internal locking.
 */

#ifndef FRAME_AGGREGATOR_H
#define FRAME_AGGREGATOR_H

#include <stdint.h>

#include "NodeTypes.h"

enum FrameCloseReason
{
  FRAME_CLOSE_COMPLETE = 0, // All configured nodes reported
  FRAME_CLOSE_TOLERANCE,    // Sample outside the tolerance window arrived
  FRAME_CLOSE_TIMEOUT,      // Open longer than the aggregation timeout
  FRAME_CLOSE_DUPLICATE     // Node reported twice before the frame closed
};

const char *frameCloseReasonName(FrameCloseReason reason);

// A closed frame, handed to the filter stage by value
struct ClosedFrame
{
  uint32_t frameNumber;
  uint64_t timestampUs; // Timestamp of the opening sample
  uint64_t openedAtUs;  // Consumer clock when the frame opened
  float values[WEIGH_MAX_NODES];
  NodeMask presentMask;
  uint8_t presentCount;
  bool complete;
  FrameCloseReason reason;

  bool has(uint8_t nodeIndex) const { return maskHas(presentMask, nodeIndex); }
};

class FrameAggregator
{
public:
  FrameAggregator();

  /**
   * Configure the aggregator and discard any open frame
   * @param expectedNodes Number of configured nodes (1..WEIGH_MAX_NODES)
   * @param toleranceUs Max timestamp distance to the frame timestamp
   * @param timeoutUs Max time a frame stays open
   */
  void init(uint8_t expectedNodes, uint32_t toleranceUs, uint32_t timeoutUs);

  /**
   * Add a validated sample
   * @param nodeIndex Position of the node in the configured set
   * @param sample The sample (timestamp and value are used)
   * @param nowUs Consumer clock
   * @param out Receives the closed frame when the call returns true
   * @return true if a frame was closed into out
   */
  bool ingest(uint8_t nodeIndex, const RawSample &sample, uint64_t nowUs,
              ClosedFrame &out);

  /**
   * Apply the aggregation timeout without a new sample
   * @return true if the open frame timed out and was closed into out
   */
  bool update(uint64_t nowUs, ClosedFrame &out);

  bool hasOpenFrame() const { return open; }
  uint8_t getOpenFrameCount() const { return open ? current.presentCount : 0; }

  // Discard the open frame without emitting it. Statistics are kept.
  void reset();

  uint32_t getCompleteFrames() const { return completeFrameCount; }
  uint32_t getIncompleteFrames() const { return incompleteFrameCount; }
  uint32_t getTimeoutCloses() const { return timeoutCloseCount; }
  uint32_t getToleranceCloses() const { return toleranceCloseCount; }
  uint32_t getDuplicateSamples() const { return duplicateCount; }
  uint32_t getDiscardedFrames() const { return discardedFrameCount; }

  /**
   * Percentage of emitted frames that were complete
   * Returns 0.0 if no frames emitted yet
   */
  float getCompleteRate() const
  {
    uint32_t total = completeFrameCount + incompleteFrameCount;
    if (total == 0)
      return 0.0f;
    return (float)completeFrameCount / (float)total * 100.0f;
  }

private:
  void openFrame(uint8_t nodeIndex, const RawSample &sample, uint64_t nowUs);
  void addToFrame(uint8_t nodeIndex, float valueKg);
  void closeFrame(FrameCloseReason reason, uint64_t nowUs, ClosedFrame &out);

  uint8_t expectedNodeCount;
  uint32_t toleranceUs;
  uint32_t timeoutUs;

  bool open;
  ClosedFrame current;
  uint32_t nextFrameNumber;

  // Statistics
  uint32_t completeFrameCount;
  uint32_t incompleteFrameCount;
  uint32_t timeoutCloseCount;
  uint32_t toleranceCloseCount;
  uint32_t duplicateCount;
  uint32_t discardedFrameCount;

  // Rate limiting for hot-path warnings
  uint64_t lastDuplicateLogUs;
  uint64_t lastPartialLogUs;
};

#endif // FRAME_AGGREGATOR_H
