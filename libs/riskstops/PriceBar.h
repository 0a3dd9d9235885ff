// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __PRICE_BAR_H
#define __PRICE_BAR_H 1

#include <string>
#include <optional>
#include <algorithm>
#include <cctype>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "number.h"
#include "DecimalConstants.h"
#include "RiskStopsException.h"

namespace mkc_riskstops
{
  using boost::posix_time::ptime;

  // Price fields of a bar that can be addressed by name from configuration
  enum class PriceField
  {
    Open,
    High,
    Low,
    Close
  };

  /**
   * @brief Parses the date column of a bar into a timestamp used for ordering.
   *
   * Accepted forms are YYYY-MM-DD, YYYYMMDD and YYYY-MM-DD HH:MM[:SS] (a 'T'
   * may replace the space).
   *
   * @throws BarSeriesException if the string is not a recognizable date.
   */
  inline ptime parseBarTimestamp(const std::string& dateString)
  {
    try
      {
	if (dateString.size() == 8 &&
	    std::all_of(dateString.begin(), dateString.end(),
			[](unsigned char c) { return std::isdigit(c) != 0; }))
	  return ptime(boost::gregorian::from_undelimited_string(dateString));

	if (dateString.size() == 10)
	  return ptime(boost::gregorian::from_simple_string(dateString));

	if (dateString.size() > 10)
	  {
	    std::string normalized(dateString);
	    if (normalized[10] == 'T')
	      normalized[10] = ' ';

	    return boost::posix_time::time_from_string(normalized);
	  }
      }
    catch (const std::exception& e)
      {
	throw BarSeriesException("parseBarTimestamp - unrecognized bar date '" + dateString + "': " + e.what());
      }

    throw BarSeriesException("parseBarTimestamp - unrecognized bar date '" + dateString + "'");
  }

  /**
   * @brief One OHLCV price bar, optionally carrying its true range and ATR.
   *
   * A bar is immutable. The ATR calculator produces new bars through
   * withVolatility() rather than updating bars in place.
   */
  template <class Decimal> class PriceBar
  {
  public:
    PriceBar (const std::string& date,
	      const Decimal& open,
	      const Decimal& high,
	      const Decimal& low,
	      const Decimal& close,
	      const Decimal& volume)
      : mDate(date),
	mDateTime(parseBarTimestamp(date)),
	mOpen(open),
	mHigh(high),
	mLow(low),
	mClose(close),
	mVolume(volume),
	mTrueRange(),
	mAverageTrueRange()
    {
      if (volume < DecimalConstants<Decimal>::DecimalZero)
	throw BarSeriesException("PriceBar: on - " + date + " volume of " + num::toString (volume) + " is negative");

      if (high < low)
	throw BarSeriesException("PriceBar: on - " + date + " high of " + num::toString (high) + " is less than low of " + num::toString (low));
    }

    PriceBar (const PriceBar<Decimal>& rhs) = default;
    PriceBar& operator=(const PriceBar<Decimal>& rhs) = default;
    ~PriceBar() = default;

    /**
     * @brief Returns a copy of this bar with the given volatility values attached.
     */
    PriceBar<Decimal> withVolatility (const Decimal& trueRange,
				      const std::optional<Decimal>& averageTrueRange) const
    {
      PriceBar<Decimal> bar(*this);
      bar.mTrueRange = trueRange;
      bar.mAverageTrueRange = averageTrueRange;
      return bar;
    }

    const std::string& getDate() const
    {
      return mDate;
    }

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    const Decimal& getOpenValue() const
    {
      return mOpen;
    }

    const Decimal& getHighValue() const
    {
      return mHigh;
    }

    const Decimal& getLowValue() const
    {
      return mLow;
    }

    const Decimal& getCloseValue() const
    {
      return mClose;
    }

    const Decimal& getVolumeValue() const
    {
      return mVolume;
    }

    const Decimal& getPriceValue (PriceField field) const
    {
      switch (field)
	{
	case PriceField::Open:
	  return mOpen;
	case PriceField::High:
	  return mHigh;
	case PriceField::Low:
	  return mLow;
	case PriceField::Close:
	default:
	  return mClose;
	}
    }

    const std::optional<Decimal>& getTrueRange() const
    {
      return mTrueRange;
    }

    const std::optional<Decimal>& getAverageTrueRange() const
    {
      return mAverageTrueRange;
    }

  private:
    std::string mDate;
    ptime mDateTime;
    Decimal mOpen;
    Decimal mHigh;
    Decimal mLow;
    Decimal mClose;
    Decimal mVolume;
    std::optional<Decimal> mTrueRange;
    std::optional<Decimal> mAverageTrueRange;
  };

  template <class Decimal>
  inline bool operator==(const PriceBar<Decimal>& lhs, const PriceBar<Decimal>& rhs)
  {
    return ((lhs.getDate() == rhs.getDate()) &&
	    (lhs.getOpenValue() == rhs.getOpenValue()) &&
	    (lhs.getHighValue() == rhs.getHighValue()) &&
	    (lhs.getLowValue() == rhs.getLowValue()) &&
	    (lhs.getCloseValue() == rhs.getCloseValue()) &&
	    (lhs.getVolumeValue() == rhs.getVolumeValue()));
  }

  template <class Decimal>
  inline bool operator!=(const PriceBar<Decimal>& lhs, const PriceBar<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
} // namespace mkc_riskstops

#endif // __PRICE_BAR_H
