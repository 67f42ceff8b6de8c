/*******************************************************************************
 * OutputStream.h - JSON data stream for the presentation layer
 *
 * One JSON object per line on stdout:
 *   {"type":"weight", ...}       once per closed frame
 *   {"type":"node_health", ...}  once per node status transition
 *   command responses            as returned by CommandHandler
 *
 * Weights are rounded to 1 g. Lines are written under serialWriteMutex so
 * they never interleave with each other.
 ******************************************************************************/

#ifndef OUTPUT_STREAM_H
#define OUTPUT_STREAM_H

#include <stdio.h>
#include <string>

#include "Config.h"
#include "NodeHealthMonitor.h"
#include "WeighingEngine.h"

class OutputStream
{
public:
  explicit OutputStream(FILE *out = stdout);

  void writeFrame(const WeighingOutput &frame);
  void writeHealthEvent(const NodeHealthEvent &event, const char *layer);
  void writeLine(const std::string &line);

  uint32_t getLinesWritten() const { return linesWritten; }

  static void serializeFrame(const WeighingOutput &frame, std::string &out);
  static void serializeHealthEvent(const NodeHealthEvent &event,
                                   const char *layer, std::string &out);

  // Round to 3 decimals (1 g)
  static double roundKg(float kg);

private:
  FILE *stream;
  uint32_t linesWritten;
};

#endif // OUTPUT_STREAM_H
