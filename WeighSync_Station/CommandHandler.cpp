/*******************************************************************************
 * CommandHandler.cpp - Operator Command Processing Implementation
 *
 * Command Protocol (JSON):
 *
 * Commands:
 *   {"cmd": "TARE"}                           - Zero every online node
 *   {"cmd": "RESET_TARE"}                     - Clear all tare offsets
 *   {"cmd": "RESET_FILTERS"}                  - Clear median windows and EMA
 *   {"cmd": "GET_STATUS"}                     - Totals, counters, tares
 *   {"cmd": "GET_NODE_STATUS", "node": 11111} - One node's health and filter
 *
 * Responses:
 *   {"success": true, "message": "..."}
 *   {"success": false, "error": "..."}
 *   {"type": "status", ...}
 *   {"type": "node_status", ...}
 ******************************************************************************/

#include "CommandHandler.h"

#include <stdio.h>
#include <string.h>

CommandHandler::CommandHandler()
    : tareCallback(nullptr), resetTareCallback(nullptr),
      resetFiltersCallback(nullptr), statusCallback(nullptr),
      nodeStatusCallback(nullptr)
{
}

std::string CommandHandler::processCommand(const std::string &command)
{
  SAFE_LOG("[CmdHandler] Processing: %s\n", command.c_str());

  StaticJsonDocument<512> doc;
  DeserializationError error = deserializeJson(doc, command);

  if (error)
  {
    SAFE_LOG("[CmdHandler] JSON parse error: %s\n", error.c_str());
    return errorResponse("Invalid JSON");
  }

  const char *cmd = doc["cmd"];
  if (!cmd)
  {
    return errorResponse("Missing 'cmd' field");
  }

  // TARE - capture current smoothed values of online nodes
  if (strcmp(cmd, "TARE") == 0)
  {
    if (tareCallback)
    {
      uint8_t captured = tareCallback();
      if (captured == 0)
      {
        return errorResponse("No node has a value to tare");
      }
      char msg[50];
      snprintf(msg, sizeof(msg), "Tare captured for %u nodes", captured);
      return successResponse(msg);
    }
    return errorResponse("Tare callback not set");
  }

  // RESET_TARE
  if (strcmp(cmd, "RESET_TARE") == 0)
  {
    if (resetTareCallback)
    {
      resetTareCallback();
      return successResponse("Tare cleared");
    }
    return errorResponse("Reset tare callback not set");
  }

  // RESET_FILTERS - applied by the ingestion consumer before its next frame
  if (strcmp(cmd, "RESET_FILTERS") == 0)
  {
    if (resetFiltersCallback)
    {
      resetFiltersCallback();
      return successResponse("Filter reset requested");
    }
    return errorResponse("Reset filters callback not set");
  }

  // GET_STATUS
  if (strcmp(cmd, "GET_STATUS") == 0)
  {
    if (statusCallback)
    {
      StaticJsonDocument<2048> response;
      response["type"] = "status";
      statusCallback(response);

      std::string output;
      serializeJson(response, output);
      return output;
    }
    return errorResponse("Status callback not set");
  }

  // GET_NODE_STATUS
  if (strcmp(cmd, "GET_NODE_STATUS") == 0)
  {
    if (!doc["node"].is<uint32_t>())
    {
      return errorResponse("Missing or invalid 'node' field");
    }
    uint32_t nodeId = doc["node"].as<uint32_t>();

    if (nodeStatusCallback)
    {
      StaticJsonDocument<1024> response;
      response["type"] = "node_status";
      if (!nodeStatusCallback(nodeId, response))
      {
        char msg[50];
        snprintf(msg, sizeof(msg), "Unknown node: %lu",
                 (unsigned long)nodeId);
        return errorResponse(msg);
      }

      std::string output;
      serializeJson(response, output);
      return output;
    }
    return errorResponse("Node status callback not set");
  }

  // Unknown command
  char msg[100];
  snprintf(msg, sizeof(msg), "Unknown command: %s", cmd);
  return errorResponse(msg);
}

std::string CommandHandler::successResponse(const char *message)
{
  StaticJsonDocument<128> doc;
  doc["success"] = true;
  doc["message"] = message;

  std::string output;
  serializeJson(doc, output);
  return output;
}

std::string CommandHandler::errorResponse(const char *message)
{
  StaticJsonDocument<128> doc;
  doc["success"] = false;
  doc["error"] = message;

  std::string output;
  serializeJson(doc, output);
  return output;
}
