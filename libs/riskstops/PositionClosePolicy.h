// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __POSITION_CLOSE_POLICY_H
#define __POSITION_CLOSE_POLICY_H 1

#include <memory>
#include <optional>
#include <string>
#include "BarSeries.h"
#include "RiskConfiguration.h"
#include "SignalTypes.h"

namespace mkc_riskstops
{
  /**
   * @brief The single position the filter holds open.
   *
   * closingBarIndex is set by policies that know in advance where the
   * position ends. openingNote is added to the signal that opened it.
   */
  struct OpenPosition
  {
    SignalType type;
    std::size_t entryBarIndex;
    std::optional<std::size_t> closingBarIndex;
    std::optional<NoteCode> openingNote;
  };

  /**
   * @class PositionClosePolicy
   * @brief Decides when the currently open position is considered closed.
   *
   * The position filter owns the sequencing (ascending bar order, one open
   * position). A policy is only asked two things: what position a kept
   * signal opens, and whether a later signal may replace it.
   */
  template <class Decimal> class PositionClosePolicy
  {
  public:
    virtual ~PositionClosePolicy() = default;

    // signal must be resolved
    virtual OpenPosition openPosition (const AttachedSignal<Decimal>& signal) const = 0;

    // candidate comes after the opening signal in bar order
    virtual bool closesPosition (const OpenPosition& position,
				 const AttachedSignal<Decimal>& candidate) const = 0;

    virtual ClosePolicyType getPolicyType() const = 0;

    std::string getName() const
    {
      return closePolicyTypeToString(getPolicyType());
    }
  };

  /**
   * @brief A position closes on the first later signal of the opposite type.
   *
   * The closing signal is kept and opens the next position, so an alternating
   * BUY/SELL sequence is kept entirely and repeated same-side signals are
   * suppressed.
   */
  template <class Decimal>
  class OppositeSignalClosePolicy : public PositionClosePolicy<Decimal>
  {
  public:
    OpenPosition openPosition (const AttachedSignal<Decimal>& signal) const override
    {
      return OpenPosition{signal.getType(), *signal.getBarIndex(), std::nullopt, std::nullopt};
    }

    bool closesPosition (const OpenPosition& position,
			 const AttachedSignal<Decimal>& candidate) const override
    {
      return candidate.getType() != position.type;
    }

    ClosePolicyType getPolicyType() const override
    {
      return ClosePolicyType::OppositeSignal;
    }
  };

  /**
   * @brief A position closes on the first bar that reaches its SL or TP.
   *
   * Raw (unrounded) levels are derived from the opening signal's entry price
   * and ATR with the SL/TP formulas; a zero ATR puts both levels at the entry
   * price. Bars after the entry bar are scanned in order; on each bar the
   * take-profit is checked before the stop-loss:
   *   BUY:  high >= tp, then low <= sl
   *   SELL: low <= tp,  then high >= sl
   * Signals on or before the exit bar are overlapping. The position stays
   * open for the rest of the series when the entry or ATR is missing
   * (insufficient_data_for_atr_or_entry_blocking) or when no bar reaches a
   * level (no_close_in_history_blocking_future).
   */
  template <class Decimal>
  class PriceLevelExitClosePolicy : public PositionClosePolicy<Decimal>
  {
  public:
    PriceLevelExitClosePolicy (const BarSeries<Decimal>& series,
			       const Decimal& slMultiplier,
			       const Decimal& tpMultiplier)
      : mSeries(series),
	mStopLossMultiplier(slMultiplier),
	mProfitTargetMultiplier(tpMultiplier)
    {}

    OpenPosition openPosition (const AttachedSignal<Decimal>& signal) const override
    {
      const std::size_t entryIndex = *signal.getBarIndex();
      OpenPosition position{signal.getType(), entryIndex, std::nullopt, std::nullopt};

      if (!signal.getEntryPrice() || !signal.getAtrValue())
	{
	  position.openingNote = NoteCode::MissingEntryOrAtrBlockingFuture;
	  return position;
	}

      const Decimal& entry = *signal.getEntryPrice();
      const Decimal stopOffset = mStopLossMultiplier * *signal.getAtrValue();
      const Decimal targetOffset = mProfitTargetMultiplier * *signal.getAtrValue();

      if (signal.getType() == SignalType::Buy)
	position.closingBarIndex = findExitBar(entryIndex, signal.getType(),
					       entry - stopOffset, entry + targetOffset);
      else
	position.closingBarIndex = findExitBar(entryIndex, signal.getType(),
					       entry + stopOffset, entry - targetOffset);

      if (!position.closingBarIndex)
	position.openingNote = NoteCode::NoCloseInHistoryBlockingFuture;

      return position;
    }

    bool closesPosition (const OpenPosition& position,
			 const AttachedSignal<Decimal>& candidate) const override
    {
      if (!position.closingBarIndex)
	return false;

      return *candidate.getBarIndex() > *position.closingBarIndex;
    }

    ClosePolicyType getPolicyType() const override
    {
      return ClosePolicyType::PriceLevelExit;
    }

  private:
    std::optional<std::size_t> findExitBar (std::size_t entryIndex,
					    SignalType type,
					    const Decimal& stopLoss,
					    const Decimal& profitTarget) const
    {
      for (std::size_t j = entryIndex + 1; j < mSeries.getNumBars(); ++j)
	{
	  const PriceBar<Decimal>& bar = mSeries.getBar(j);

	  if (type == SignalType::Buy)
	    {
	      if (bar.getHighValue() >= profitTarget || bar.getLowValue() <= stopLoss)
		return j;
	    }
	  else
	    {
	      if (bar.getLowValue() <= profitTarget || bar.getHighValue() >= stopLoss)
		return j;
	    }
	}

      return std::nullopt;
    }

  private:
    BarSeries<Decimal> mSeries;
    Decimal mStopLossMultiplier;
    Decimal mProfitTargetMultiplier;
  };

  /**
   * @brief Creates the close policy named by the configuration.
   */
  template <class Decimal>
  std::shared_ptr<PositionClosePolicy<Decimal>>
  createClosePolicy (const RiskConfiguration<Decimal>& config,
		     const BarSeries<Decimal>& series)
  {
    if (config.getClosePolicy() == ClosePolicyType::PriceLevelExit)
      return std::make_shared<PriceLevelExitClosePolicy<Decimal>>(series,
								   config.getStopLossMultiplier(),
								   config.getProfitTargetMultiplier());

    return std::make_shared<OppositeSignalClosePolicy<Decimal>>();
  }
} // namespace mkc_riskstops

#endif // __POSITION_CLOSE_POLICY_H
