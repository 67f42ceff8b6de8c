/*******************************************************************************
 * CommandHandler.h - Operator Command Processing
 *
 * Handles operator commands read by the control thread with a JSON-based
 * protocol, one command per line.
 ******************************************************************************/

#ifndef COMMAND_HANDLER_H
#define COMMAND_HANDLER_H

#include "Config.h"
#include <ArduinoJson.h>
#include <functional>
#include <string>

// Command callback types
typedef std::function<void()> VoidCallback;
typedef std::function<uint8_t()> TareCallback; // returns nodes captured
typedef std::function<void(JsonDocument &)> StatusCallback;
typedef std::function<bool(uint32_t, JsonDocument &)> NodeStatusCallback;

class CommandHandler
{
public:
  CommandHandler();

  /**
   * Process a command string (JSON format)
   * @param command JSON command string
   * @return JSON response string
   */
  std::string processCommand(const std::string &command);

  // Callback setters
  void setTareCallback(TareCallback cb) { tareCallback = cb; }
  void setResetTareCallback(VoidCallback cb) { resetTareCallback = cb; }
  void setResetFiltersCallback(VoidCallback cb) { resetFiltersCallback = cb; }
  void setStatusCallback(StatusCallback cb) { statusCallback = cb; }
  void setNodeStatusCallback(NodeStatusCallback cb)
  {
    nodeStatusCallback = cb;
  }

private:
  TareCallback tareCallback;
  VoidCallback resetTareCallback;
  VoidCallback resetFiltersCallback;
  StatusCallback statusCallback;
  NodeStatusCallback nodeStatusCallback;

  std::string successResponse(const char *message);
  std::string errorResponse(const char *message);
};

#endif // COMMAND_HANDLER_H
