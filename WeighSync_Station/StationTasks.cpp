/*******************************************************************************
 * StationTasks.cpp - Station threads and status glue
 ******************************************************************************/

#include "StationTasks.h"

#include <chrono>

uint64_t stationMicros()
{
  return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

// ============================================================================
// PRODUCER SIDE
// ============================================================================
// Called from the node producer threads. Never blocks: a full queue drops
// the sample and the drop is reported at most every WEIGH_WARN_INTERVAL_US.
// ============================================================================

bool enqueueSample(StationSampleQueue &queue, const RawSample &sample)
{
  if (queue.send(sample))
    return true;

  if (queue.isClosed())
    return false;

  static std::atomic<uint64_t> lastDropLogUs(0);
  uint64_t now = stationMicros();
  uint64_t last = lastDropLogUs.load();
  if (now - last > WEIGH_WARN_INTERVAL_US &&
      lastDropLogUs.compare_exchange_strong(last, now))
  {
    SAFE_LOG_NB("[Queue] WARNING: Sample queue full, %lu samples dropped\n",
                (unsigned long)queue.getDroppedCount());
  }
  return false;
}

// ============================================================================
// DATA INGESTION TASK
// ============================================================================
// Single consumer. Blocks on the queue for at most WEIGH_RX_TIMEOUT_MS so the
// aggregation timeout and the liveness sweep run even when every node is
// silent.
// ============================================================================

void DataIngestionTask(StationContext *ctx)
{
  WeighingEngine &engine = *ctx->engine;
  StationSampleQueue &queue = *ctx->queue;
  const uint64_t tickIntervalUs = (uint64_t)WEIGH_RX_TIMEOUT_MS * 1000;

  uint64_t lastTickUs = stationMicros();
  uint64_t lastDiagUs = lastTickUs;
  RawSample sample;

  SAFE_PRINTLN("[DataIngestion] Consumer started");

  while (!queue.isClosed())
  {
    bool received = queue.receive(sample, WEIGH_RX_TIMEOUT_MS);
    uint64_t now = stationMicros();

    if (received)
    {
      engine.submit(sample, now);
      ctx->processedCount++;
    }

    // Under continuous load receive() never times out, so the sweep also
    // runs on elapsed time
    if (!received || now - lastTickUs >= tickIntervalUs)
    {
      engine.tick(now);
      lastTickUs = now;
    }

    drainHealthEvents(engine, *ctx->output);

    if (now - lastDiagUs > STATION_DIAG_INTERVAL_US)
    {
      lastDiagUs = now;
      EngineStatistics s = engine.getStatistics();
      SAFE_LOG("[DataIngestion] Processed: %lu, Dropped: %lu, QueueFree: "
               "%u/%d\n",
               (unsigned long)ctx->processedCount.load(),
               (unsigned long)queue.getDroppedCount(),
               (unsigned)queue.spacesAvailable(), WEIGH_SAMPLE_QUEUE_SIZE);
      SAFE_LOG("[DataIngestion] Frames: %lu (complete %lu = %.1f%%, "
               "incomplete %lu, timeout %lu, tolerance %lu), online %u/%u\n",
               (unsigned long)s.framesEmitted, (unsigned long)s.framesComplete,
               (double)s.completeRate, (unsigned long)s.framesIncomplete,
               (unsigned long)s.timeoutCloses,
               (unsigned long)s.toleranceCloses, s.onlineNodes, s.nodeCount);
    }
  }

  engine.shutdown();
  SAFE_PRINTLN("[DataIngestion] Queue closed, consumer stopped");
}

void drainHealthEvents(WeighingEngine &engine, OutputStream &output)
{
  NodeHealthEvent ev;
  while (engine.popLinkEvent(ev))
  {
    output.writeHealthEvent(ev, "link");
  }
  while (engine.popHealthEvent(ev))
  {
    output.writeHealthEvent(ev, "signal");
  }
}

// ============================================================================
// STATUS RESPONSES
// ============================================================================

void fillStatus(const WeighingEngine &engine, JsonDocument &doc)
{
  EngineStatistics s = engine.getStatistics();
  WeighingOutput last;
  bool hasOutput = engine.getLastOutput(last);

  doc["node_count"] = s.nodeCount;
  doc["online_nodes"] = s.onlineNodes;
  doc["link_online_nodes"] = s.linkOnlineNodes;

  if (hasOutput)
  {
    doc["frame"] = last.frameNumber;
    doc["complete"] = last.complete;
    doc["total_net"] = OutputStream::roundKg(last.totalNetKg);
    doc["total_tare"] = OutputStream::roundKg(last.totalTareKg);
  }
  else
  {
    doc["frame"] = nullptr;
    doc["total_net"] = nullptr;
  }

  JsonArray tares = doc.createNestedArray("tares");
  for (uint8_t i = 0; i < engine.getNodeCount(); i++)
  {
    JsonObject t = tares.createNestedObject();
    t["id"] = engine.getConfig().nodes[i].nodeId;
    t["tare"] = OutputStream::roundKg(engine.getTare(i));
  }

  JsonObject stats = doc.createNestedObject("stats");
  stats["samples"] = s.samplesSubmitted;
  stats["accepted"] = s.samplesAccepted;
  stats["unknown_node"] = s.unknownNode;
  stats["out_of_range"] = s.outOfRange;
  stats["frames"] = s.framesEmitted;
  stats["frames_complete"] = s.framesComplete;
  stats["frames_incomplete"] = s.framesIncomplete;
  stats["complete_rate"] = s.completeRate;
  stats["timeout_closes"] = s.timeoutCloses;
  stats["tolerance_closes"] = s.toleranceCloses;
  stats["duplicates"] = s.duplicateSamples;
  stats["tare_captures"] = s.tareCaptures;
  stats["filter_resets"] = s.filterResets;
}

bool fillNodeStatus(const WeighingEngine &engine, uint32_t nodeId,
                    uint64_t nowUs, JsonDocument &doc)
{
  int8_t idx = engine.indexOf(nodeId);
  if (idx < 0)
    return false;

  NodeHealthSnapshot health;
  NodeFilterSnapshot filter;
  if (!engine.getNodeHealth((uint8_t)idx, health) ||
      !engine.getFilterState((uint8_t)idx, filter))
    return false;

  doc["node"] = nodeId;
  doc["name"] = (const char *)engine.getConfig().nodes[idx].name;
  doc["link_status"] = nodeStatusName(health.linkStatus);
  doc["signal_status"] = nodeStatusName(health.signalStatus);
  doc["packets"] = health.packetsAccepted;
  doc["out_of_range"] = health.outOfRange;

  if (health.signalStatus == NODE_UNSEEN)
  {
    doc["last_seen_ago_s"] = nullptr;
  }
  else
  {
    uint64_t ago = (nowUs > health.lastSeenUs) ? nowUs - health.lastSeenUs : 0;
    doc["last_seen_ago_s"] = (double)ago / 1000000.0;
  }

  float tare = engine.getTare((uint8_t)idx);
  doc["tare"] = OutputStream::roundKg(tare);
  if (filter.emaInitialized)
  {
    doc["filtered"] = OutputStream::roundKg(filter.emaValue);
    doc["net"] = OutputStream::roundKg(filter.emaValue - tare);
  }
  else
  {
    doc["filtered"] = nullptr;
    doc["net"] = nullptr;
  }

  JsonObject f = doc.createNestedObject("filter");
  f["window_size"] = filter.windowSize;
  JsonArray window = f.createNestedArray("window");
  for (uint8_t i = 0; i < filter.windowCount; i++)
  {
    window.add(OutputStream::roundKg(filter.window[i]));
  }
  f["ema_initialized"] = filter.emaInitialized;
  f["alpha"] = filter.alpha;
  return true;
}
