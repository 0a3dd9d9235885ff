// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __BAR_SERIES_H
#define __BAR_SERIES_H 1

#include <vector>
#include <string>
#include <optional>
#include <cstddef>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "PriceBar.h"
#include "RiskStopsException.h"

namespace mkc_riskstops
{
  /**
   * @class BarSeries
   * @brief Chronologically ordered sequence of price bars for one instrument.
   *
   * Bars are addressed by their zero-based position, which is the index a
   * signal refers to. Construction enforces the ordering invariant: every bar
   * must be strictly later than the bar before it, so dates are also unique.
   *
   * @tparam Decimal The numeric type used for prices and volume.
   */
  template <class Decimal> class BarSeries
  {
  public:
    typedef typename std::vector<PriceBar<Decimal>>::const_iterator ConstIterator;

    BarSeries()
      : mBars()
    {}

    /**
     * @throws BarSeriesException if the bars are not strictly ascending by date.
     */
    explicit BarSeries (std::vector<PriceBar<Decimal>> bars)
      : mBars(std::move(bars))
    {
      for (std::size_t i = 1; i < mBars.size(); ++i)
	{
	  if (mBars[i].getDateTime() == mBars[i - 1].getDateTime())
	    throw BarSeriesException("BarSeries: duplicate bar date " + mBars[i].getDate() +
				     " at positions " + std::to_string(i - 1) + " and " + std::to_string(i));

	  if (mBars[i].getDateTime() < mBars[i - 1].getDateTime())
	    throw BarSeriesException("BarSeries: bar " + mBars[i].getDate() + " at position " +
				     std::to_string(i) + " precedes bar " + mBars[i - 1].getDate());
	}
    }

    BarSeries (const BarSeries<Decimal>& rhs) = default;
    BarSeries& operator=(const BarSeries<Decimal>& rhs) = default;
    BarSeries (BarSeries<Decimal>&& rhs) = default;
    BarSeries& operator=(BarSeries<Decimal>&& rhs) = default;
    ~BarSeries() = default;

    std::size_t getNumBars() const
    {
      return mBars.size();
    }

    bool isEmpty() const
    {
      return mBars.empty();
    }

    /**
     * @throws SignalIndexOutOfRangeException if index does not address a bar.
     */
    const PriceBar<Decimal>& getBar (std::size_t index) const
    {
      if (index >= mBars.size())
	throw SignalIndexOutOfRangeException("BarSeries::getBar - index " + std::to_string(index) +
					     " is out of range for a series of " +
					     std::to_string(mBars.size()) + " bars");
      return mBars[index];
    }

    /**
     * @brief Finds the first bar whose date string equals dateString exactly.
     */
    std::optional<std::size_t> findIndexByDate (const std::string& dateString) const
    {
      for (std::size_t i = 0; i < mBars.size(); ++i)
	{
	  if (mBars[i].getDate() == dateString)
	    return i;
	}

      return std::nullopt;
    }

    ConstIterator begin() const
    {
      return mBars.begin();
    }

    ConstIterator end() const
    {
      return mBars.end();
    }

    const std::vector<PriceBar<Decimal>>& getBars() const
    {
      return mBars;
    }

  private:
    std::vector<PriceBar<Decimal>> mBars;
  };
} // namespace mkc_riskstops

#endif // __BAR_SERIES_H
