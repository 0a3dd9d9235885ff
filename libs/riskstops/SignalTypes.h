// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __SIGNAL_TYPES_H
#define __SIGNAL_TYPES_H 1

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include "RiskStopsException.h"

namespace mkc_riskstops
{
  enum class SignalType
  {
    Buy,
    Sell
  };

  inline std::string signalTypeToString (SignalType type)
  {
    return (type == SignalType::Buy) ? std::string("BUY") : std::string("SELL");
  }

  /**
   * @brief Parses BUY or SELL, ignoring case and surrounding blanks.
   * @throws CsvFormatException for any other value.
   */
  inline SignalType signalTypeFromString (const std::string& text)
  {
    const std::string upper = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(text));

    if (upper == "BUY")
      return SignalType::Buy;

    if (upper == "SELL")
      return SignalType::Sell;

    throw CsvFormatException("signalTypeFromString - unknown signal type '" + text + "'");
  }

  inline SignalType oppositeSignalType (SignalType type)
  {
    return (type == SignalType::Buy) ? SignalType::Sell : SignalType::Buy;
  }

  // Row level issue codes. None of them aborts a run.
  enum class NoteCode
  {
    SignalDateNotInData,
    CannotUseNextOpen,
    UnresolvedSignalIndex,
    OverlappingOpenSignal,
    NoCloseInHistoryBlockingFuture,
    MissingEntryOrAtrBlockingFuture,
    InsufficientDataForAtr,
    InvalidEntryOrAtr,
    StopLossNonPositive
  };

  inline std::string noteCodeToString (NoteCode code)
  {
    switch (code)
      {
      case NoteCode::SignalDateNotInData:
	return "signal_date_not_in_data";
      case NoteCode::CannotUseNextOpen:
	return "cannot_use_next_open";
      case NoteCode::UnresolvedSignalIndex:
	return "unresolved_signal_index";
      case NoteCode::OverlappingOpenSignal:
	return "overlapping_open_signal";
      case NoteCode::NoCloseInHistoryBlockingFuture:
	return "no_close_in_history_blocking_future";
      case NoteCode::MissingEntryOrAtrBlockingFuture:
	return "insufficient_data_for_atr_or_entry_blocking";
      case NoteCode::InsufficientDataForAtr:
	return "insufficient_data_for_atr";
      case NoteCode::InvalidEntryOrAtr:
	return "invalid_entry_or_atr";
      case NoteCode::StopLossNonPositive:
	return "sl_non_positive";
      }

    return "unknown_note";
  }

  /**
   * @brief Ordered, duplicate free list of notes attached to one signal.
   *
   * Notes accumulate as a signal moves through the pipeline and are rendered
   * joined by ';' so a later stage never overwrites an earlier issue.
   */
  class SignalNotes
  {
  public:
    static constexpr char Delimiter = ';';

    SignalNotes() = default;

    void add (NoteCode code)
    {
      addText(noteCodeToString(code));
    }

    // Free text note, e.g. a note carried over from the signal input
    void addText (const std::string& text)
    {
      if (text.empty())
	return;

      if (std::find(mNotes.begin(), mNotes.end(), text) == mNotes.end())
	mNotes.push_back(text);
    }

    bool contains (NoteCode code) const
    {
      return std::find(mNotes.begin(), mNotes.end(), noteCodeToString(code)) != mNotes.end();
    }

    bool empty() const
    {
      return mNotes.empty();
    }

    std::size_t size() const
    {
      return mNotes.size();
    }

    std::string toString() const
    {
      std::string joined;
      for (const auto& note : mNotes)
	{
	  if (!joined.empty())
	    joined.push_back(Delimiter);
	  joined += note;
	}

      return joined;
    }

  private:
    std::vector<std::string> mNotes;
  };

  /**
   * @brief A raw trade signal before it is bound to a bar.
   *
   * The bar is addressed by index when present, otherwise by an exact date
   * string match. The index is signed so that a negative value read from
   * input is reported as out of range instead of wrapping.
   */
  class SignalRequest
  {
  public:
    SignalRequest (SignalType type,
		   std::optional<int64_t> index,
		   std::optional<std::string> date,
		   std::optional<std::string> note = std::nullopt)
      : mType(type),
	mIndex(index),
	mDate(std::move(date)),
	mNote(std::move(note))
    {}

    static SignalRequest atIndex (SignalType type, int64_t index)
    {
      return SignalRequest(type, index, std::nullopt);
    }

    static SignalRequest atDate (SignalType type, const std::string& date)
    {
      return SignalRequest(type, std::nullopt, date);
    }

    SignalType getType() const
    {
      return mType;
    }

    const std::optional<int64_t>& getIndex() const
    {
      return mIndex;
    }

    const std::optional<std::string>& getDate() const
    {
      return mDate;
    }

    const std::optional<std::string>& getNote() const
    {
      return mNote;
    }

    bool hasNote() const
    {
      return mNote.has_value() && !boost::algorithm::trim_copy(*mNote).empty();
    }

  private:
    SignalType mType;
    std::optional<int64_t> mIndex;
    std::optional<std::string> mDate;
    std::optional<std::string> mNote;
  };

  /**
   * @brief A signal bound to a bar together with its entry price and ATR.
   *
   * barIndex is absent when the signal could not be resolved. entryPrice and
   * atrValue stay absent whenever the data does not provide them.
   */
  template <class Decimal> class AttachedSignal
  {
  public:
    AttachedSignal (SignalType type,
		    std::optional<std::size_t> barIndex,
		    std::optional<std::string> date,
		    std::optional<Decimal> entryPrice,
		    std::optional<Decimal> atrValue,
		    bool carriesInputNote,
		    SignalNotes notes)
      : mType(type),
	mBarIndex(barIndex),
	mDate(std::move(date)),
	mEntryPrice(std::move(entryPrice)),
	mAtrValue(std::move(atrValue)),
	mCarriesInputNote(carriesInputNote),
	mNotes(std::move(notes))
    {}

    AttachedSignal<Decimal> withNote (NoteCode code) const
    {
      AttachedSignal<Decimal> signal(*this);
      signal.mNotes.add(code);
      return signal;
    }

    SignalType getType() const
    {
      return mType;
    }

    const std::optional<std::size_t>& getBarIndex() const
    {
      return mBarIndex;
    }

    bool isResolved() const
    {
      return mBarIndex.has_value();
    }

    const std::optional<std::string>& getDate() const
    {
      return mDate;
    }

    const std::optional<Decimal>& getEntryPrice() const
    {
      return mEntryPrice;
    }

    const std::optional<Decimal>& getAtrValue() const
    {
      return mAtrValue;
    }

    // True when the signal input already carried a note for this row
    bool carriesInputNote() const
    {
      return mCarriesInputNote;
    }

    const SignalNotes& getNotes() const
    {
      return mNotes;
    }

  private:
    SignalType mType;
    std::optional<std::size_t> mBarIndex;
    std::optional<std::string> mDate;
    std::optional<Decimal> mEntryPrice;
    std::optional<Decimal> mAtrValue;
    bool mCarriesInputNote;
    SignalNotes mNotes;
  };

  /**
   * @brief One row of the output ledger.
   */
  template <class Decimal> class SignalLedgerRecord
  {
  public:
    SignalLedgerRecord (const AttachedSignal<Decimal>& signal,
			std::optional<Decimal> stopLoss,
			std::optional<Decimal> profitTarget,
			SignalNotes notes)
      : mSignal(signal),
	mStopLoss(std::move(stopLoss)),
	mProfitTarget(std::move(profitTarget)),
	mStopLossRounded(),
	mProfitTargetRounded(),
	mNotes(std::move(notes))
    {}

    SignalLedgerRecord<Decimal> withRoundedPrices (std::optional<Decimal> stopLossRounded,
						   std::optional<Decimal> profitTargetRounded) const
    {
      SignalLedgerRecord<Decimal> record(*this);
      record.mStopLossRounded = std::move(stopLossRounded);
      record.mProfitTargetRounded = std::move(profitTargetRounded);
      return record;
    }

    const AttachedSignal<Decimal>& getSignal() const
    {
      return mSignal;
    }

    const std::optional<Decimal>& getStopLoss() const
    {
      return mStopLoss;
    }

    const std::optional<Decimal>& getProfitTarget() const
    {
      return mProfitTarget;
    }

    const std::optional<Decimal>& getStopLossRounded() const
    {
      return mStopLossRounded;
    }

    const std::optional<Decimal>& getProfitTargetRounded() const
    {
      return mProfitTargetRounded;
    }

    bool hasRoundableField() const
    {
      return mStopLoss.has_value() || mProfitTarget.has_value();
    }

    const SignalNotes& getNotes() const
    {
      return mNotes;
    }

  private:
    AttachedSignal<Decimal> mSignal;
    std::optional<Decimal> mStopLoss;
    std::optional<Decimal> mProfitTarget;
    std::optional<Decimal> mStopLossRounded;
    std::optional<Decimal> mProfitTargetRounded;
    SignalNotes mNotes;
  };
} // namespace mkc_riskstops

#endif // __SIGNAL_TYPES_H
