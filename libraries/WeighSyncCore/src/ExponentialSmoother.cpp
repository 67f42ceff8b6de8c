#include "ExponentialSmoother.h"

#include <math.h>

ExponentialSmoother::ExponentialSmoother(float a)
    : alpha(clampAlpha(a)), ema(0.0f), initialized(false)
{
}

void ExponentialSmoother::setAlpha(float a) { alpha = clampAlpha(a); }

float ExponentialSmoother::update(float value)
{
  if (!initialized)
  {
    ema = value;
    initialized = true;
    return ema;
  }
  ema = alpha * value + (1.0f - alpha) * ema;
  return ema;
}

void ExponentialSmoother::reset()
{
  ema = 0.0f;
  initialized = false;
}

float ExponentialSmoother::clampAlpha(float a)
{
  if (!isfinite(a) || a < WEIGH_EMA_ALPHA_MIN)
    return WEIGH_EMA_ALPHA_MIN;
  if (a > 1.0f)
    return 1.0f;
  return a;
}

float ExponentialSmoother::timeConstantSeconds(float a, float samplePeriodS)
{
  a = clampAlpha(a);
  if (a >= 1.0f)
    return 0.0f;
  return -samplePeriodS / logf(1.0f - a);
}
