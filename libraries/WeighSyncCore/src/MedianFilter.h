/**
 * MedianFilter.h - Sliding-window median for one load-cell channel
 *
 * Removes single-sample spikes before the exponential smoother sees them.
 * The window holds the last N raw values (N odd, default 5); the oldest value
 * is discarded on overflow. Output lags the input by up to N/2 samples.
 *
 * Warm-up policy: the filter emits from the first sample. Until the window
 * is full the median of the samples seen so far is used - the middle element
 * for an odd count, the mean of the two middle elements for an even count.
 */

#ifndef MEDIAN_FILTER_H
#define MEDIAN_FILTER_H

#include <stdint.h>

#include "WeighConfig.h"

class MedianFilter
{
public:
  MedianFilter();

  /**
   * Set the window size and clear the history
   * @param windowSize Odd, 1..WEIGH_MEDIAN_MAX_WINDOW
   * @return false if the size is rejected (filter keeps its old size)
   */
  bool init(uint8_t windowSize);

  /**
   * Add a raw value and return the current median
   */
  float push(float value);

  /**
   * Median of the current window. Returns 0 when empty.
   */
  float median() const;

  void reset();

  uint8_t getWindowSize() const { return windowSize; }
  uint8_t getCount() const { return count; }
  bool isFull() const { return count == windowSize; }

  /**
   * Copy the window, oldest first
   * @return number of values written
   */
  uint8_t copyWindow(float *out, uint8_t maxLen) const;

private:
  float samples[WEIGH_MEDIAN_MAX_WINDOW]; // Ring buffer
  uint8_t windowSize;
  uint8_t count;
  uint8_t head; // Next write position
};

#endif // MEDIAN_FILTER_H
