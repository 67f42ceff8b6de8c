/*******************************************************************************
 * StationTasks.h - Station threads and status glue
 *
 * Contents:
 *   - stationMicros()        monotonic consumer clock
 *   - enqueueSample()        producer -> queue, drop on full
 *   - DataIngestionTask()    queue -> WeighingEngine (single consumer)
 *   - fillStatus()           GET_STATUS response body
 *   - fillNodeStatus()       GET_NODE_STATUS response body
 ******************************************************************************/

#ifndef STATION_TASKS_H
#define STATION_TASKS_H

#include <ArduinoJson.h>
#include <atomic>
#include <stdint.h>

#include "Config.h"
#include "OutputStream.h"
#include "SampleQueue.h"
#include "WeighingEngine.h"

typedef SampleQueue<RawSample, WEIGH_SAMPLE_QUEUE_SIZE> StationSampleQueue;

struct StationContext
{
  WeighingEngine *engine;
  StationSampleQueue *queue;
  OutputStream *output;
  std::atomic<uint32_t> processedCount;
};

// Microseconds on the steady clock. Shared by producers and the consumer.
uint64_t stationMicros();

/**
 * Hand a sample to the consumer without waiting
 * @return false if the queue was full or closed (sample dropped)
 */
bool enqueueSample(StationSampleQueue &queue, const RawSample &sample);

// Runs until the queue is closed. The in-flight frame is discarded on exit.
void DataIngestionTask(StationContext *ctx);

// Forward pending health transitions of both layers to the output stream
void drainHealthEvents(WeighingEngine &engine, OutputStream &output);

void fillStatus(const WeighingEngine &engine, JsonDocument &doc);

// false if nodeId is not configured
bool fillNodeStatus(const WeighingEngine &engine, uint32_t nodeId,
                    uint64_t nowUs, JsonDocument &doc);

#endif // STATION_TASKS_H
