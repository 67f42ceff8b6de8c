/**
 * WeighingEngine.h - Per-frame weighing pipeline
 *
 * PURPOSE:
 * Owns every stage between the sample queue and the output record:
 *
 *   RawSample -> AcquisitionGate -> FrameAggregator -> per node
 *   (MedianFilter -> ExponentialSmoother) -> TaraManager -> WeighingOutput
 *
 * and a processing-layer NodeHealthMonitor that decides which nodes count
 * towards the total. One WeighingOutput is emitted per closed frame through
 * the output callback.
 *
 * PER-FRAME RULES:
 * - Present nodes run the filter cascade and are netted against the tare.
 * - Absent nodes reuse their last smoothed value, netted against the
 *   current tare. A node without any value yet has no net.
 * - total_net sums the nodes that are ONLINE in the processing monitor and
 *   have a smoothed value. STALE nodes are excluded, never counted as zero.
 *
 * THREADING:
 * submit(), tick(), resetFilters() and shutdown() belong to the single
 * ingestion consumer thread. captureTare(), clearTare(),
 * requestFilterReset() and the get*() snapshot accessors may be called from
 * a control thread: they only touch the tare table (own mutex) and state the
 * consumer publishes under publishLock after every submit() and tick().
 */

#ifndef WEIGHING_ENGINE_H
#define WEIGHING_ENGINE_H

#include <atomic>
#include <functional>
#include <mutex>
#include <stdint.h>

#include "AcquisitionGate.h"
#include "ExponentialSmoother.h"
#include "FrameAggregator.h"
#include "MedianFilter.h"
#include "NodeHealthMonitor.h"
#include "NodeTypes.h"
#include "TaraManager.h"
#include "WeighConfig.h"

struct NodeReading
{
  uint32_t nodeId;
  char name[WEIGH_NODE_NAME_LEN];
  bool present;    // Node reported in this frame
  bool hasValue;   // Smoothed value defined (at least one sample seen)
  float rawKg;     // This frame's raw value, or the last one seen
  float filteredKg; // Smoothed value
  float tareKg;
  float netKg;
  NodeStatus status; // Processing-layer status at frame time
};

struct WeighingOutput
{
  uint32_t frameNumber;
  uint64_t frameTimestampUs;
  bool complete;
  FrameCloseReason closeReason;
  uint8_t nodeCount;
  NodeReading nodes[WEIGH_MAX_NODES];
  float totalNetKg;
  float totalTareKg;      // Tare of the contributing nodes
  NodeMask contributing;  // Nodes summed into totalNetKg
  NodeMask staleNodes;
};

struct NodeFilterSnapshot
{
  uint32_t nodeId;
  uint8_t windowSize;
  uint8_t windowCount;
  float window[WEIGH_MEDIAN_MAX_WINDOW]; // Oldest first
  bool emaInitialized;
  float emaValue;
  float alpha;
};

struct NodeHealthSnapshot
{
  uint32_t nodeId;
  NodeStatus linkStatus;   // Acquisition layer
  NodeStatus signalStatus; // Processing layer
  uint64_t lastSeenUs;
  uint32_t packetsAccepted;
  uint32_t outOfRange;
};

struct EngineStatistics
{
  uint32_t samplesSubmitted;
  uint32_t samplesAccepted;
  uint32_t unknownNode;
  uint32_t outOfRange;
  uint32_t framesEmitted;
  uint32_t framesComplete;
  uint32_t framesIncomplete;
  uint32_t timeoutCloses;
  uint32_t toleranceCloses;
  uint32_t duplicateSamples;
  uint32_t tareCaptures;
  uint32_t filterResets;
  float completeRate; // Percent of emitted frames that were complete
  uint8_t nodeCount;
  uint8_t onlineNodes;     // Processing layer
  uint8_t linkOnlineNodes; // Acquisition layer
};

typedef std::function<void(const WeighingOutput &)> OutputCallback;

class WeighingEngine
{
public:
  WeighingEngine();

  /**
   * Validate cfg and build the pipeline
   * @return false if the configuration is rejected; see getConfigError()
   */
  bool init(const WeighingConfig &cfg);
  ConfigError getConfigError() const { return configError; }
  bool isInitialized() const { return initialized; }

  void setOutputCallback(OutputCallback callback)
  {
    outputCallback = callback;
  }

  // ---- Consumer thread ----------------------------------------------------

  /**
   * Feed one sample through the pipeline
   * @param nowUs Consumer monotonic clock
   * @return the acquisition verdict; rejected samples change nothing else
   */
  SampleVerdict submit(const RawSample &sample, uint64_t nowUs);

  // Liveness sweep and aggregation timeout. Call when the queue is idle.
  void tick(uint64_t nowUs);

  // Clear every median window and EMA (tares are kept)
  void resetFilters();

  // Discard the in-flight frame
  void shutdown();

  // Processing-layer transitions (drives disconnect notifications)
  bool popHealthEvent(NodeHealthEvent &out)
  {
    return signalHealth.popEvent(out);
  }

  // Acquisition-layer transitions
  bool popLinkEvent(NodeHealthEvent &out)
  {
    return gate.linkMonitor().popEvent(out);
  }

  // ---- Any thread ---------------------------------------------------------

  /**
   * Capture the current smoothed value of every ONLINE node with a value as
   * its tare. Nodes that are offline keep their previous tare.
   * @return number of nodes captured
   */
  uint8_t captureTare();
  void clearTare();

  // Forwarded to the consumer, applied before its next sample or tick
  void requestFilterReset() { filterResetRequested.store(true); }

  bool getFilterState(uint8_t nodeIndex, NodeFilterSnapshot &out) const;
  bool getNodeHealth(uint8_t nodeIndex, NodeHealthSnapshot &out) const;
  EngineStatistics getStatistics() const;

  // false until the first frame has been emitted
  bool getLastOutput(WeighingOutput &out) const;

  float getTare(uint8_t nodeIndex) const { return tara.getTare(nodeIndex); }

  const WeighingConfig &getConfig() const { return config; }
  uint8_t getNodeCount() const { return config.nodeCount; }
  int8_t indexOf(uint32_t nodeId) const { return config.indexOf(nodeId); }

private:
  void applyPendingReset();
  void processFrame(const ClosedFrame &frame, uint64_t nowUs);
  void publishState();

  WeighingConfig config;
  ConfigError configError;
  bool initialized;

  AcquisitionGate gate;
  FrameAggregator aggregator;
  MedianFilter medians[WEIGH_MAX_NODES];
  ExponentialSmoother smoothers[WEIGH_MAX_NODES];
  TaraManager tara;
  NodeHealthMonitor signalHealth;

  float lastRawKg[WEIGH_MAX_NODES];
  uint32_t samplesSubmitted;
  uint32_t framesEmitted;
  uint32_t filterResetCount;

  OutputCallback outputCallback;
  std::atomic<bool> filterResetRequested;

  // ========================================================================
  // Published state, written by the consumer, read by the control thread
  // ========================================================================
  mutable std::mutex publishLock;
  bool hasOutput;
  WeighingOutput lastOutput;
  float publishedSmoothed[WEIGH_MAX_NODES];
  NodeMask publishedCapturable; // ONLINE and smoothed value defined
  NodeFilterSnapshot publishedFilters[WEIGH_MAX_NODES];
  NodeHealthSnapshot publishedHealth[WEIGH_MAX_NODES];
  EngineStatistics publishedStats;
};

#endif // WEIGHING_ENGINE_H
