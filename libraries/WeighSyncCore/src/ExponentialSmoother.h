/**
 * ExponentialSmoother.h - First-order low-pass (EMA) for one channel
 *
 *   ema = alpha * value + (1 - alpha) * ema_prev
 *
 * The first update initializes ema = value, so there is no start-up ramp.
 * alpha is clamped to (0, 1]; alpha = 1 passes values through unchanged.
 *
 * For tuning, the equivalent time constant at sample period Ts is
 *   tau = -Ts / ln(1 - alpha)
 * At 32 Hz and alpha = 0.3 that is about 88 ms.
 */

#ifndef EXPONENTIAL_SMOOTHER_H
#define EXPONENTIAL_SMOOTHER_H

#include "WeighConfig.h"

class ExponentialSmoother
{
public:
  explicit ExponentialSmoother(float alpha = WEIGH_EMA_ALPHA);

  void setAlpha(float alpha);
  float getAlpha() const { return alpha; }

  float update(float value);

  bool isInitialized() const { return initialized; }
  float value() const { return ema; }

  void reset();

  static float clampAlpha(float alpha);

  // Informational only, not used by the filter. Returns 0 for alpha = 1.
  static float timeConstantSeconds(float alpha, float samplePeriodS);

private:
  float alpha;
  float ema;
  bool initialized;
};

#endif // EXPONENTIAL_SMOOTHER_H
