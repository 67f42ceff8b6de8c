#include "MedianFilter.h"

#include <string.h>

MedianFilter::MedianFilter()
    : windowSize(WEIGH_MEDIAN_WINDOW), count(0), head(0)
{
  memset(samples, 0, sizeof(samples));
}

bool MedianFilter::init(uint8_t size)
{
  if (size == 0 || size > WEIGH_MEDIAN_MAX_WINDOW || (size % 2) == 0)
  {
    return false;
  }
  windowSize = size;
  reset();
  return true;
}

float MedianFilter::push(float value)
{
  samples[head] = value;
  head = (uint8_t)((head + 1) % windowSize);
  if (count < windowSize)
  {
    count++;
  }
  return median();
}

float MedianFilter::median() const
{
  if (count == 0)
    return 0.0f;

  float sorted[WEIGH_MEDIAN_MAX_WINDOW];
  uint8_t n = copyWindow(sorted, WEIGH_MEDIAN_MAX_WINDOW);

  // Insertion sort: stable, and n never exceeds 15
  for (uint8_t i = 1; i < n; i++)
  {
    float key = sorted[i];
    int8_t j = (int8_t)(i - 1);
    while (j >= 0 && sorted[j] > key)
    {
      sorted[j + 1] = sorted[j];
      j--;
    }
    sorted[j + 1] = key;
  }

  if (n % 2 == 1)
  {
    return sorted[n / 2];
  }
  return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0f;
}

void MedianFilter::reset()
{
  count = 0;
  head = 0;
  memset(samples, 0, sizeof(samples));
}

uint8_t MedianFilter::copyWindow(float *out, uint8_t maxLen) const
{
  uint8_t n = (count < maxLen) ? count : maxLen;
  // Oldest element sits at head once the ring has wrapped, at 0 before
  uint8_t start = (count == windowSize) ? head : 0;
  for (uint8_t i = 0; i < n; i++)
  {
    out[i] = samples[(start + i) % windowSize];
  }
  return n;
}
