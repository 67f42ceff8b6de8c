/*******************************************************************************
 * WeighSyncCore.h - Main Library Header
 *
 * WeighSyncCore Library
 * Synchronization, filtering and tare of the load-cell node streams.
 *
 * Include this single header to get all library components:
 *   - WeighConfig.h:         Configuration constants and validation
 *   - NodeTypes.h:           Sample and node status definitions
 *   - WeighingEngine.h:      The per-frame pipeline and its stages
 *   - SampleQueue.h:         Producer -> consumer channel
 *
 * USAGE:
 *   #include <WeighSyncCore.h>
 *
 * Or include individual headers as needed:
 *   #include <MedianFilter.h>
 *   #include <FrameAggregator.h>
 *
 ******************************************************************************/

#ifndef WEIGH_SYNC_CORE_H
#define WEIGH_SYNC_CORE_H

// Library version
#define WEIGH_SYNC_CORE_VERSION_MAJOR 1
#define WEIGH_SYNC_CORE_VERSION_MINOR 0
#define WEIGH_SYNC_CORE_VERSION_PATCH 0

#include "WeighConfig.h"
#include "WeighLog.h"
#include "NodeTypes.h"
#include "SampleQueue.h"
#include "WeighingEngine.h"

#endif // WEIGH_SYNC_CORE_H
