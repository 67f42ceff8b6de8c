/*******************************************************************************
 * SimulatedNodeSource.h - Load-cell nodes without hardware
 *
 * Stands in for the radio driver: one producer thread per configured node
 * delivering a calibrated reading at the configured rate. Each reading is
 * the node's resting load plus uniform noise, stamped with the shared
 * sample schedule plus a fixed per-node skew.
 *
 * Fault injection (all off by default):
 *   - spikes:      a single sample with SIM_SPIKE_KG added
 *   - corruption:  a single sample outside the accepted range
 *   - dropout:     one node stops sending for a time window
 ******************************************************************************/

#ifndef SIMULATED_NODE_SOURCE_H
#define SIMULATED_NODE_SOURCE_H

#include <atomic>
#include <functional>
#include <stdint.h>
#include <thread>

#include "Config.h"
#include "NodeTypes.h"

struct SimulationOptions
{
  float noiseKg;
  uint32_t maxSkewUs;
  float spikeProbability;   // per sample, 0..1
  float corruptProbability; // per sample, 0..1
  int8_t dropoutNode;       // node index, -1 = none
  float dropoutStartS;      // seconds after begin()
  float dropoutDurationS;

  SimulationOptions()
      : noiseKg(SIM_NOISE_KG), maxSkewUs(SIM_MAX_SKEW_US),
        spikeProbability(0.0f), corruptProbability(0.0f), dropoutNode(-1),
        dropoutStartS(0.0f), dropoutDurationS(0.0f)
  {
  }
};

// Returns false if the sample was dropped
typedef std::function<bool(const RawSample &)> SampleSink;

class SimulatedNodeSource
{
public:
  SimulatedNodeSource();
  ~SimulatedNodeSource();

  SimulatedNodeSource(const SimulatedNodeSource &) = delete;
  SimulatedNodeSource &operator=(const SimulatedNodeSource &) = delete;

  /**
   * Start one producer thread per node
   * @param cfg Validated configuration (node set and sample rate)
   * @param baseKg Resting load per node, indexed by node position
   * @param options Noise and fault injection
   * @param sink Receives every generated sample
   * @return false if already running or cfg has no nodes
   */
  bool begin(const WeighingConfig &cfg, const float *baseKg,
             const SimulationOptions &options, SampleSink sink);

  // Stop and join every producer
  void stop();

  bool isRunning() const { return running.load(); }

  uint32_t getGeneratedCount() const { return generatedCount.load(); }
  uint32_t getRejectedCount() const { return rejectedCount.load(); }

  // Dropout window test, relative to begin()
  bool inDropout(uint8_t nodeIndex, uint64_t elapsedUs) const;

private:
  void nodeTask(uint8_t nodeIndex);

  WeighingConfig config;
  SimulationOptions options;
  float baseKg[WEIGH_MAX_NODES];
  int32_t skewUs[WEIGH_MAX_NODES];
  SampleSink sink;

  uint64_t startUs;
  uint64_t periodUs;

  std::thread producers[WEIGH_MAX_NODES];
  uint8_t producerCount;
  std::atomic<bool> running;
  std::atomic<uint32_t> generatedCount;
  std::atomic<uint32_t> rejectedCount;
};

#endif // SIMULATED_NODE_SOURCE_H
