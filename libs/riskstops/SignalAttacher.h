// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __SIGNAL_ATTACHER_H
#define __SIGNAL_ATTACHER_H 1

#include <vector>
#include <optional>
#include <string>
#include "BarSeries.h"
#include "RiskConfiguration.h"
#include "RiskStopsException.h"
#include "SignalTypes.h"

namespace mkc_riskstops
{
  /**
   * @class SignalAttacher
   * @brief Binds raw signal requests to bars of a series.
   *
   * The series is expected to carry ATR values (see AverageTrueRangeSeries).
   * For every request the attacher resolves a bar index, reads the entry
   * price from the configured bar field and copies the bar's ATR. Requests
   * that cannot be resolved by date are returned with no index and the note
   * signal_date_not_in_data. An explicit index that does not address a bar is
   * a caller error and throws.
   */
  template <class Decimal> class SignalAttacher
  {
  public:
    explicit SignalAttacher (EntryPriceSource entrySource = EntryPriceSource::Close)
      : mEntrySource(entrySource)
    {}

    EntryPriceSource getEntryPriceSource() const
    {
      return mEntrySource;
    }

    /**
     * @throws SignalIndexOutOfRangeException for a negative index or one past
     * the last bar.
     */
    std::vector<AttachedSignal<Decimal>> attach (const BarSeries<Decimal>& series,
						 const std::vector<SignalRequest>& requests) const
    {
      std::vector<AttachedSignal<Decimal>> attached;
      attached.reserve(requests.size());

      for (const auto& request : requests)
	attached.push_back(attachOne(series, request));

      return attached;
    }

    AttachedSignal<Decimal> attachOne (const BarSeries<Decimal>& series,
				       const SignalRequest& request) const
    {
      SignalNotes notes;
      if (request.hasNote())
	notes.addText(*request.getNote());

      std::optional<std::size_t> barIndex = resolveIndex(series, request);
      if (!barIndex)
	{
	  notes.add(NoteCode::SignalDateNotInData);
	  return AttachedSignal<Decimal>(request.getType(), std::nullopt, request.getDate(),
					 std::nullopt, std::nullopt, request.hasNote(), notes);
	}

      const PriceBar<Decimal>& bar = series.getBar(*barIndex);
      std::optional<Decimal> entryPrice;

      if (mEntrySource == EntryPriceSource::NextOpen)
	{
	  if (*barIndex + 1 < series.getNumBars())
	    entryPrice = series.getBar(*barIndex + 1).getOpenValue();
	  else
	    notes.add(NoteCode::CannotUseNextOpen);
	}
      else
	entryPrice = bar.getPriceValue(toPriceField(mEntrySource));

      return AttachedSignal<Decimal>(request.getType(), barIndex, bar.getDate(),
				     entryPrice, bar.getAverageTrueRange(),
				     request.hasNote(), notes);
    }

  private:
    static std::optional<std::size_t> resolveIndex (const BarSeries<Decimal>& series,
						    const SignalRequest& request)
    {
      if (request.getIndex())
	{
	  const int64_t index = *request.getIndex();
	  if (index < 0 || static_cast<uint64_t>(index) >= series.getNumBars())
	    throw SignalIndexOutOfRangeException("SignalAttacher: signal index " + std::to_string(index) +
						 " is out of range for a series of " +
						 std::to_string(series.getNumBars()) + " bars");

	  return static_cast<std::size_t>(index);
	}

      if (request.getDate())
	return series.findIndexByDate(*request.getDate());

      return std::nullopt;
    }

    static PriceField toPriceField (EntryPriceSource source)
    {
      switch (source)
	{
	case EntryPriceSource::Open:
	  return PriceField::Open;
	case EntryPriceSource::High:
	  return PriceField::High;
	case EntryPriceSource::Low:
	  return PriceField::Low;
	default:
	  return PriceField::Close;
	}
    }

  private:
    EntryPriceSource mEntrySource;
  };
} // namespace mkc_riskstops

#endif // __SIGNAL_ATTACHER_H
