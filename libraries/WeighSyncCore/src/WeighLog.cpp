#include "WeighLog.h"

volatile bool suppressSerialLogs = false;
std::mutex serialWriteMutex;
