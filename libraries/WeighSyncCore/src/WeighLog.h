/*******************************************************************************
 * WeighLog.h - Safe Logging Macros
 *
 * Producer threads, the ingestion consumer and the control thread all log.
 * Every write takes serialWriteMutex so lines from different threads never
 * interleave. Diagnostics go to stderr; stdout is reserved for the JSON data
 * stream written by the station.
 ******************************************************************************/

#ifndef WEIGH_LOG_H
#define WEIGH_LOG_H

#include <mutex>
#include <stdio.h>

#ifndef WEIGH_DEBUG_LEVEL
#define WEIGH_DEBUG_LEVEL 3 // 0=Off, 1=Errors, 2=Warnings, 3=Info, 4=Verbose
#endif

extern volatile bool suppressSerialLogs;
extern std::mutex serialWriteMutex;

#define SAFE_LOG(fmt, ...)                                     \
  do                                                           \
  {                                                            \
    if (!suppressSerialLogs)                                   \
    {                                                          \
      std::lock_guard<std::mutex> _log_guard(serialWriteMutex); \
      ::fprintf(stderr, fmt, ##__VA_ARGS__);                   \
    }                                                          \
  } while (0)

#define SAFE_PRINTLN(msg)                                      \
  do                                                           \
  {                                                            \
    if (!suppressSerialLogs)                                   \
    {                                                          \
      std::lock_guard<std::mutex> _log_guard(serialWriteMutex); \
      ::fputs(msg, stderr);                                    \
      ::fputc('\n', stderr);                                   \
    }                                                          \
  } while (0)

// NON-BLOCKING variant: skip the line if another thread holds the mutex.
// Use on producer paths that must never stall.
#define SAFE_LOG_NB(fmt, ...)                                  \
  do                                                           \
  {                                                            \
    if (!suppressSerialLogs)                                   \
    {                                                          \
      std::unique_lock<std::mutex> _log_guard(serialWriteMutex, \
                                              std::try_to_lock); \
      if (_log_guard.owns_lock())                              \
        ::fprintf(stderr, fmt, ##__VA_ARGS__);                 \
    }                                                          \
  } while (0)

#if WEIGH_DEBUG_LEVEL >= 4
#define SAFE_LOG_VERBOSE(fmt, ...) SAFE_LOG(fmt, ##__VA_ARGS__)
#else
#define SAFE_LOG_VERBOSE(fmt, ...) \
  do                               \
  {                                \
  } while (0)
#endif

#endif // WEIGH_LOG_H
