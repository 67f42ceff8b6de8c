#include "SimulatedNodeSource.h"

#include <chrono>
#include <random>
#include <string.h>

#include "StationTasks.h"

SimulatedNodeSource::SimulatedNodeSource()
    : startUs(0), periodUs(0), producerCount(0), running(false),
      generatedCount(0), rejectedCount(0)
{
  memset(baseKg, 0, sizeof(baseKg));
  memset(skewUs, 0, sizeof(skewUs));
}

SimulatedNodeSource::~SimulatedNodeSource() { stop(); }

bool SimulatedNodeSource::begin(const WeighingConfig &cfg, const float *base,
                                const SimulationOptions &opts,
                                SampleSink sampleSink)
{
  if (running.load() || cfg.nodeCount == 0 || cfg.sampleRateHz == 0 ||
      base == nullptr)
  {
    return false;
  }

  config = cfg;
  options = opts;
  sink = sampleSink;
  memcpy(baseKg, base, sizeof(float) * config.nodeCount);

  // Fixed skew per node, spread over [-maxSkew, +maxSkew]
  std::mt19937 rng(config.nodes[0].nodeId);
  std::uniform_int_distribution<int32_t> skew(-(int32_t)options.maxSkewUs,
                                              (int32_t)options.maxSkewUs);
  for (uint8_t i = 0; i < config.nodeCount; i++)
  {
    skewUs[i] = skew(rng);
  }

  periodUs = 1000000ULL / config.sampleRateHz;
  startUs = stationMicros();
  generatedCount.store(0);
  rejectedCount.store(0);
  running.store(true);

  producerCount = config.nodeCount;
  for (uint8_t i = 0; i < producerCount; i++)
  {
    producers[i] = std::thread(&SimulatedNodeSource::nodeTask, this, i);
  }

  SAFE_LOG("[SimSource] %u simulated nodes at %u Hz (noise +/-%.3f kg, "
           "spikes %.1f%%, corrupt %.1f%%)\n",
           producerCount, config.sampleRateHz, (double)options.noiseKg,
           (double)(options.spikeProbability * 100.0f),
           (double)(options.corruptProbability * 100.0f));
  if (options.dropoutNode >= 0 && options.dropoutNode < config.nodeCount)
  {
    SAFE_LOG("[SimSource] Node %lu drops out at %.1f s for %.1f s\n",
             (unsigned long)config.nodes[options.dropoutNode].nodeId,
             (double)options.dropoutStartS, (double)options.dropoutDurationS);
  }
  return true;
}

void SimulatedNodeSource::stop()
{
  if (!running.exchange(false) && producerCount == 0)
    return;

  for (uint8_t i = 0; i < producerCount; i++)
  {
    if (producers[i].joinable())
    {
      producers[i].join();
    }
  }
  producerCount = 0;
  SAFE_LOG("[SimSource] Stopped (%lu generated, %lu rejected by sink)\n",
           (unsigned long)generatedCount.load(),
           (unsigned long)rejectedCount.load());
}

bool SimulatedNodeSource::inDropout(uint8_t nodeIndex,
                                    uint64_t elapsedUs) const
{
  if (options.dropoutNode < 0 || nodeIndex != (uint8_t)options.dropoutNode)
    return false;

  uint64_t from = secondsToMicros(options.dropoutStartS);
  uint64_t to = from + secondsToMicros(options.dropoutDurationS);
  return elapsedUs >= from && elapsedUs < to;
}

void SimulatedNodeSource::nodeTask(uint8_t nodeIndex)
{
  std::mt19937 rng(config.nodes[nodeIndex].nodeId);
  std::uniform_real_distribution<float> noise(-options.noiseKg,
                                              options.noiseKg);
  std::uniform_real_distribution<float> chance(0.0f, 1.0f);

  const std::chrono::steady_clock::time_point t0 =
      std::chrono::steady_clock::now();
  uint64_t k = 0;

  while (running.load())
  {
    uint64_t offsetUs = k * periodUs;
    std::this_thread::sleep_until(t0 + std::chrono::microseconds(offsetUs));
    if (!running.load())
      break;

    uint64_t slotUs = startUs + offsetUs;
    k++;

    if (inDropout(nodeIndex, offsetUs))
      continue;

    RawSample sample;
    sample.nodeId = config.nodes[nodeIndex].nodeId;
    sample.timestampUs = (uint64_t)((int64_t)slotUs + skewUs[nodeIndex]);
    sample.valueKg = baseKg[nodeIndex] + noise(rng);

    if (options.corruptProbability > 0.0f &&
        chance(rng) < options.corruptProbability)
    {
      sample.valueKg = SIM_OUT_OF_RANGE_KG;
    }
    else if (options.spikeProbability > 0.0f &&
             chance(rng) < options.spikeProbability)
    {
      sample.valueKg += SIM_SPIKE_KG;
    }

    generatedCount++;
    if (sink && !sink(sample))
    {
      rejectedCount++;
    }
  }
}
