// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __STOP_TARGET_CALCULATOR_H
#define __STOP_TARGET_CALCULATOR_H 1

#include <vector>
#include <optional>
#include <cstdint>
#include "ParallelFor.h"
#include "IParallelExecutor.h"
#include "DecimalConstants.h"
#include "SignalTypes.h"

namespace mkc_riskstops
{
  /**
   * @brief Stop-loss and take-profit levels derived for one signal.
   *
   * Both prices are absent when they could not be derived; in that case
   * note explains why. A derived pair may still carry a note
   * (sl_non_positive).
   */
  template <class Decimal>
  struct StopTargetLevels
  {
    std::optional<Decimal> stopLoss;
    std::optional<Decimal> profitTarget;
    std::optional<NoteCode> note;

    bool isDerived() const
    {
      return stopLoss.has_value() && profitTarget.has_value();
    }
  };

  /**
   * @brief Derives SL/TP from an entry price and an ATR value.
   *
   * BUY:  sl = entry - slMultiplier * atr, tp = entry + tpMultiplier * atr
   * SELL: sl = entry + slMultiplier * atr, tp = entry - tpMultiplier * atr
   *
   * Never throws. Missing ATR yields insufficient_data_for_atr, a missing
   * entry or a non-positive ATR yields invalid_entry_or_atr.
   */
  template <class Decimal>
  StopTargetLevels<Decimal> computeStopAndTarget (const std::optional<Decimal>& entry,
						  const std::optional<Decimal>& atr,
						  const Decimal& slMultiplier,
						  const Decimal& tpMultiplier,
						  SignalType type)
  {
    StopTargetLevels<Decimal> levels;
    const Decimal zero(DecimalConstants<Decimal>::DecimalZero);

    if (!atr)
      {
	levels.note = NoteCode::InsufficientDataForAtr;
	return levels;
      }

    if (!entry || !(*atr > zero))
      {
	levels.note = NoteCode::InvalidEntryOrAtr;
	return levels;
      }

    const Decimal stopOffset = slMultiplier * *atr;
    const Decimal targetOffset = tpMultiplier * *atr;

    if (type == SignalType::Buy)
      {
	levels.stopLoss = *entry - stopOffset;
	levels.profitTarget = *entry + targetOffset;
      }
    else
      {
	levels.stopLoss = *entry + stopOffset;
	levels.profitTarget = *entry - targetOffset;
      }

    if (!(*levels.stopLoss > zero))
      levels.note = NoteCode::StopLossNonPositive;

    return levels;
  }

  /**
   * @class StopTargetCalculator
   * @brief Turns attached signals into priced ledger records.
   *
   * Each record depends only on its own signal, so the work is spread over an
   * executor with parallel_for. Every task writes its own output slot and the
   * result keeps the input order.
   */
  template <class Decimal> class StopTargetCalculator
  {
  public:
    StopTargetCalculator (const Decimal& slMultiplier,
			  const Decimal& tpMultiplier)
      : mStopLossMultiplier(slMultiplier),
	mProfitTargetMultiplier(tpMultiplier)
    {}

    const Decimal& getStopLossMultiplier() const
    {
      return mStopLossMultiplier;
    }

    const Decimal& getProfitTargetMultiplier() const
    {
      return mProfitTargetMultiplier;
    }

    /**
     * @brief Prices one signal.
     *
     * A signal that already carries a note from its input is passed through
     * without SL/TP so that the input note is preserved verbatim.
     */
    SignalLedgerRecord<Decimal> price (const AttachedSignal<Decimal>& signal) const
    {
      SignalNotes notes(signal.getNotes());

      if (signal.carriesInputNote())
	return SignalLedgerRecord<Decimal>(signal, std::nullopt, std::nullopt, notes);

      StopTargetLevels<Decimal> levels = computeStopAndTarget(signal.getEntryPrice(),
							       signal.getAtrValue(),
							       mStopLossMultiplier,
							       mProfitTargetMultiplier,
							       signal.getType());
      if (levels.note)
	notes.add(*levels.note);

      return SignalLedgerRecord<Decimal>(signal, levels.stopLoss, levels.profitTarget, notes);
    }

    // Skipped signals keep their notes but are never priced
    static SignalLedgerRecord<Decimal> unpriced (const AttachedSignal<Decimal>& signal)
    {
      return SignalLedgerRecord<Decimal>(signal, std::nullopt, std::nullopt, signal.getNotes());
    }

    std::vector<SignalLedgerRecord<Decimal>> priceAll (const std::vector<AttachedSignal<Decimal>>& signals,
						       concurrency::IParallelExecutor& executor) const
    {
      std::vector<std::optional<SignalLedgerRecord<Decimal>>> slots(signals.size());

      concurrency::parallel_for(static_cast<uint32_t>(signals.size()), executor,
				[this, &signals, &slots](uint32_t i) {
				  slots[i] = price(signals[i]);
				});

      std::vector<SignalLedgerRecord<Decimal>> records;
      records.reserve(slots.size());
      for (auto& slot : slots)
	records.push_back(std::move(*slot));

      return records;
    }

  private:
    Decimal mStopLossMultiplier;
    Decimal mProfitTargetMultiplier;
  };
} // namespace mkc_riskstops

#endif // __STOP_TARGET_CALCULATOR_H
