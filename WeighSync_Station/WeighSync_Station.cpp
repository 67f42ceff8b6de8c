/*******************************************************************************
 * WeighSync_Station.cpp - Weighing station entry point
 *
 * Threads:
 *   - one producer per node (SimulatedNodeSource)   -> sample queue
 *   - DataIngestionTask (single consumer)           -> WeighingEngine -> stdout
 *   - main thread: operator commands from stdin, or a fixed run time
 *
 * Usage:
 *   weighsync_station [--alpha A] [--window N] [--duration S]
 *                     [--spikes P] [--corrupt P]
 *                     [--dropout INDEX START_S DURATION_S] [--quiet]
 *
 * stdout carries JSON lines only (frames, health events, command responses).
 * Diagnostics go to stderr.
 ******************************************************************************/

#include <chrono>
#include <iostream>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <thread>

#include "CommandHandler.h"
#include "Config.h"
#include "OutputStream.h"
#include "SimulatedNodeSource.h"
#include "StationTasks.h"
#include "WeighSyncCore.h"

struct StationOptions
{
  float alpha;
  int window;
  double durationS; // 0 = run until stdin closes
  SimulationOptions sim;
  bool quiet;

  StationOptions()
      : alpha(WEIGH_EMA_ALPHA), window(WEIGH_MEDIAN_WINDOW), durationS(0.0),
        quiet(false)
  {
  }
};

static void printUsage(const char *prog)
{
  SAFE_LOG("Usage: %s [--alpha A] [--window N] [--duration S] [--spikes P]\n"
           "          [--corrupt P] [--dropout INDEX START_S DURATION_S] "
           "[--quiet]\n",
           prog);
}

// Returns false on a malformed argument list
static bool parseArgs(int argc, char **argv, StationOptions &opts)
{
  for (int i = 1; i < argc; i++)
  {
    const char *arg = argv[i];
    bool hasValue = (i + 1 < argc);

    if (strcmp(arg, "--alpha") == 0 && hasValue)
    {
      opts.alpha = strtof(argv[++i], nullptr);
    }
    else if (strcmp(arg, "--window") == 0 && hasValue)
    {
      opts.window = atoi(argv[++i]);
    }
    else if (strcmp(arg, "--duration") == 0 && hasValue)
    {
      opts.durationS = strtod(argv[++i], nullptr);
    }
    else if (strcmp(arg, "--spikes") == 0 && hasValue)
    {
      opts.sim.spikeProbability = strtof(argv[++i], nullptr);
    }
    else if (strcmp(arg, "--corrupt") == 0 && hasValue)
    {
      opts.sim.corruptProbability = strtof(argv[++i], nullptr);
    }
    else if (strcmp(arg, "--dropout") == 0 && i + 3 < argc)
    {
      opts.sim.dropoutNode = (int8_t)atoi(argv[++i]);
      opts.sim.dropoutStartS = strtof(argv[++i], nullptr);
      opts.sim.dropoutDurationS = strtof(argv[++i], nullptr);
    }
    else if (strcmp(arg, "--quiet") == 0)
    {
      opts.quiet = true;
    }
    else
    {
      SAFE_LOG("[Setup] ERROR: Unknown or incomplete argument '%s'\n", arg);
      return false;
    }
  }
  return true;
}

int main(int argc, char **argv)
{
  StationOptions opts;
  if (!parseArgs(argc, argv, opts))
  {
    printUsage(argv[0]);
    return 2;
  }
  suppressSerialLogs = opts.quiet;

  SAFE_LOG("[%s] WeighSyncCore %d.%d.%d\n", STATION_NAME,
           WEIGH_SYNC_CORE_VERSION_MAJOR, WEIGH_SYNC_CORE_VERSION_MINOR,
           WEIGH_SYNC_CORE_VERSION_PATCH);

  // ==========================================================================
  // Configuration
  // ==========================================================================
  WeighingConfig cfg;
  float baseKg[WEIGH_MAX_NODES] = {0};
  for (uint8_t i = 0; i < WEIGH_DEFAULT_NODE_COUNT; i++)
  {
    cfg.addNode(STATION_DEFAULT_NODES[i].nodeId, STATION_DEFAULT_NODES[i].name);
    baseKg[i] = STATION_DEFAULT_NODES[i].simulatedBaseKg;
  }
  cfg.emaAlpha = opts.alpha;
  cfg.medianWindow = (opts.window < 0 || opts.window > 255)
                         ? 0
                         : (uint8_t)opts.window;

  WeighingEngine engine;
  if (!engine.init(cfg))
  {
    SAFE_LOG("[Setup] CRITICAL: Configuration rejected (%s), exiting\n",
             configErrorName(engine.getConfigError()));
    return 1;
  }

  // ==========================================================================
  // Output + Commands
  // ==========================================================================
  OutputStream output(stdout);
  engine.setOutputCallback([&output](const WeighingOutput &frame)
                           { output.writeFrame(frame); });

  CommandHandler commandHandler;
  commandHandler.setTareCallback([&engine]() -> uint8_t
                                 { return engine.captureTare(); });
  commandHandler.setResetTareCallback([&engine]() { engine.clearTare(); });
  commandHandler.setResetFiltersCallback([&engine]()
                                         { engine.requestFilterReset(); });
  commandHandler.setStatusCallback([&engine](JsonDocument &response)
                                   { fillStatus(engine, response); });
  commandHandler.setNodeStatusCallback(
      [&engine](uint32_t nodeId, JsonDocument &response) -> bool
      { return fillNodeStatus(engine, nodeId, stationMicros(), response); });

  // ==========================================================================
  // Sample Queue + Data Ingestion Task
  // ==========================================================================
  StationSampleQueue queue;
  StationContext ctx;
  ctx.engine = &engine;
  ctx.queue = &queue;
  ctx.output = &output;
  ctx.processedCount.store(0);

  std::thread consumer(DataIngestionTask, &ctx);
  SAFE_LOG("[Setup] Sample queue created (%d entries), consumer started\n",
           WEIGH_SAMPLE_QUEUE_SIZE);

  SimulatedNodeSource source;
  if (!source.begin(cfg, baseKg, opts.sim,
                    [&queue](const RawSample &sample) -> bool
                    { return enqueueSample(queue, sample); }))
  {
    SAFE_PRINTLN("[Setup] CRITICAL: Simulated source failed to start");
    queue.close();
    consumer.join();
    return 1;
  }

  // ==========================================================================
  // Control Loop
  // ==========================================================================
  if (opts.durationS > 0.0)
  {
    std::this_thread::sleep_for(std::chrono::microseconds(
        secondsToMicros(opts.durationS)));
  }
  else
  {
    SAFE_PRINTLN("[Setup] Reading commands from stdin (EOF to stop)");
    std::string line;
    while (std::getline(std::cin, line))
    {
      if (line.empty())
        continue;
      if (line.size() > STATION_COMMAND_MAX_LEN)
      {
        SAFE_LOG("[Control] Command longer than %d bytes ignored\n",
                 STATION_COMMAND_MAX_LEN);
        continue;
      }
      output.writeLine(commandHandler.processCommand(line));
    }
  }

  // ==========================================================================
  // Shutdown: producers first, then the queue. Queued and in-flight samples
  // are discarded.
  // ==========================================================================
  source.stop();
  queue.close();
  consumer.join();

  EngineStatistics s = engine.getStatistics();
  SAFE_LOG("[%s] Stopped: %lu samples, %lu frames (%lu complete), %lu queue "
           "drops, %lu rejected by sink\n",
           STATION_NAME, (unsigned long)s.samplesSubmitted,
           (unsigned long)s.framesEmitted, (unsigned long)s.framesComplete,
           (unsigned long)queue.getDroppedCount(),
           (unsigned long)source.getRejectedCount());
  return 0;
}
