#include "OutputStream.h"

#include <ArduinoJson.h>
#include <math.h>

OutputStream::OutputStream(FILE *out) : stream(out), linesWritten(0) {}

double OutputStream::roundKg(float kg)
{
  return round((double)kg * 1000.0) / 1000.0;
}

void OutputStream::serializeFrame(const WeighingOutput &frame,
                                  std::string &out)
{
  StaticJsonDocument<3072> doc;
  doc["type"] = "weight";
  doc["frame"] = frame.frameNumber;
  doc["ts"] = (double)frame.frameTimestampUs / 1000000.0;
  doc["complete"] = frame.complete;
  doc["reason"] = frameCloseReasonName(frame.closeReason);
  doc["total_net"] = roundKg(frame.totalNetKg);
  doc["total_tare"] = roundKg(frame.totalTareKg);

  JsonArray stale = doc.createNestedArray("stale_nodes");
  JsonArray nodes = doc.createNestedArray("nodes");
  for (uint8_t i = 0; i < frame.nodeCount; i++)
  {
    const NodeReading &r = frame.nodes[i];
    if (maskHas(frame.staleNodes, i))
    {
      stale.add(r.nodeId);
    }

    JsonObject n = nodes.createNestedObject();
    n["id"] = r.nodeId;
    n["name"] = (const char *)r.name;
    n["present"] = r.present;
    n["status"] = nodeStatusName(r.status);
    n["raw"] = roundKg(r.rawKg);
    n["tare"] = roundKg(r.tareKg);
    if (r.hasValue)
    {
      n["filtered"] = roundKg(r.filteredKg);
      n["net"] = roundKg(r.netKg);
    }
    else
    {
      // No sample seen yet: no smoothed value to report
      n["filtered"] = nullptr;
      n["net"] = nullptr;
    }
  }

  out.clear();
  serializeJson(doc, out);
}

void OutputStream::serializeHealthEvent(const NodeHealthEvent &event,
                                        const char *layer, std::string &out)
{
  StaticJsonDocument<256> doc;
  doc["type"] = "node_health";
  doc["layer"] = layer;
  doc["node"] = event.nodeId;
  doc["from"] = nodeStatusName(event.from);
  doc["to"] = nodeStatusName(event.to);
  doc["t"] = (double)event.atUs / 1000000.0;

  out.clear();
  serializeJson(doc, out);
}

void OutputStream::writeFrame(const WeighingOutput &frame)
{
  std::string line;
  serializeFrame(frame, line);
  writeLine(line);
}

void OutputStream::writeHealthEvent(const NodeHealthEvent &event,
                                    const char *layer)
{
  std::string line;
  serializeHealthEvent(event, layer, line);
  writeLine(line);
}

void OutputStream::writeLine(const std::string &line)
{
  std::lock_guard<std::mutex> guard(serialWriteMutex);
  ::fputs(line.c_str(), stream);
  ::fputc('\n', stream);
  ::fflush(stream);
  linesWritten++;
}
