// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __AVERAGE_TRUE_RANGE_H
#define __AVERAGE_TRUE_RANGE_H 1

#include <vector>
#include <optional>
#include <string>
#include <algorithm>
#include "BarSeries.h"
#include "DecimalConstants.h"
#include "RiskStopsException.h"
#include "number.h"

namespace mkc_riskstops
{
  enum class AtrMethod
  {
    Wilder,
    SimpleAverage
  };

  /**
   * @brief Calculates the true range of every bar of a series.
   *
   * TR_t = max(high_t - low_t, |high_t - close_{t-1}|, |low_t - close_{t-1}|)
   * The first bar has no previous close and uses high_0 - low_0.
   *
   * @return A vector parallel to the bars of the series.
   */
  template <class Decimal>
  std::vector<Decimal> TrueRangeSeries (const BarSeries<Decimal>& series)
  {
    std::vector<Decimal> trueRanges;
    trueRanges.reserve(series.getNumBars());

    for (std::size_t t = 0; t < series.getNumBars(); ++t)
      {
	const PriceBar<Decimal>& bar = series.getBar(t);
	Decimal range = bar.getHighValue() - bar.getLowValue();

	if (t > 0)
	  {
	    const Decimal& prevClose = series.getBar(t - 1).getCloseValue();
	    range = std::max(range, num::abs(Decimal(bar.getHighValue() - prevClose)));
	    range = std::max(range, num::abs(Decimal(bar.getLowValue() - prevClose)));
	  }

	trueRanges.push_back(range);
      }

    return trueRanges;
  }

  /**
   * @brief Wilder smoothing of a true range sequence.
   *
   * The seed value at position period-1 is the arithmetic mean of the first
   * period true ranges. After that
   *   atr_t = (atr_{t-1} * (period - 1) + tr_t) / period
   * Positions before period-1 have no value.
   */
  template <class Decimal>
  struct WilderSmoothing
  {
    static std::vector<std::optional<Decimal>> smooth (const std::vector<Decimal>& trueRanges,
							unsigned int period)
    {
      std::vector<std::optional<Decimal>> result(trueRanges.size());
      if (trueRanges.size() < period)
	return result;

      const Decimal periodValue(static_cast<int>(period));
      const Decimal periodMinusOne(static_cast<int>(period - 1));

      Decimal sum(DecimalConstants<Decimal>::DecimalZero);
      for (unsigned int i = 0; i < period; ++i)
	sum = sum + trueRanges[i];

      Decimal atr = sum / periodValue;
      result[period - 1] = atr;

      for (std::size_t t = period; t < trueRanges.size(); ++t)
	{
	  atr = ((atr * periodMinusOne) + trueRanges[t]) / periodValue;
	  result[t] = atr;
	}

      return result;
    }
  };

  // Rolling arithmetic mean of the last period true ranges, same warmup as Wilder
  template <class Decimal>
  struct SimpleAverageSmoothing
  {
    static std::vector<std::optional<Decimal>> smooth (const std::vector<Decimal>& trueRanges,
							unsigned int period)
    {
      std::vector<std::optional<Decimal>> result(trueRanges.size());
      if (trueRanges.size() < period)
	return result;

      const Decimal periodValue(static_cast<int>(period));
      Decimal windowSum(DecimalConstants<Decimal>::DecimalZero);

      for (std::size_t t = 0; t < trueRanges.size(); ++t)
	{
	  windowSum = windowSum + trueRanges[t];
	  if (t >= period)
	    windowSum = windowSum - trueRanges[t - period];

	  if (t + 1 >= period)
	    result[t] = windowSum / periodValue;
	}

      return result;
    }
  };

  /**
   * @brief Returns a new series whose bars carry their true range and ATR.
   *
   * The computation is causal: the ATR of bar t only depends on bars 0..t.
   * When the series has fewer than period bars every ATR is absent.
   *
   * @tparam SmoothingPolicy WilderSmoothing or SimpleAverageSmoothing.
   * @throws ConfigException if period < 1.
   */
  template <class Decimal, template <class> class SmoothingPolicy = WilderSmoothing>
  BarSeries<Decimal> AverageTrueRangeSeries (const BarSeries<Decimal>& series, int period)
  {
    if (period < 1)
      throw ConfigException("AverageTrueRangeSeries: atr_period must be >= 1, got " + std::to_string(period));

    const std::vector<Decimal> trueRanges = TrueRangeSeries(series);
    const std::vector<std::optional<Decimal>> atrValues =
      SmoothingPolicy<Decimal>::smooth(trueRanges, static_cast<unsigned int>(period));

    std::vector<PriceBar<Decimal>> bars;
    bars.reserve(series.getNumBars());

    for (std::size_t t = 0; t < series.getNumBars(); ++t)
      bars.push_back(series.getBar(t).withVolatility(trueRanges[t], atrValues[t]));

    return BarSeries<Decimal>(std::move(bars));
  }

  template <class Decimal>
  BarSeries<Decimal> AverageTrueRangeSeries (const BarSeries<Decimal>& series,
					     int period,
					     AtrMethod method)
  {
    if (method == AtrMethod::SimpleAverage)
      return AverageTrueRangeSeries<Decimal, SimpleAverageSmoothing>(series, period);

    return AverageTrueRangeSeries<Decimal, WilderSmoothing>(series, period);
  }
} // namespace mkc_riskstops

#endif // __AVERAGE_TRUE_RANGE_H
