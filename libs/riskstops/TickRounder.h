// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __TICK_ROUNDER_H
#define __TICK_ROUNDER_H 1

#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include "ParallelFor.h"
#include "IParallelExecutor.h"
#include "DecimalConstants.h"
#include "RiskConfiguration.h"
#include "RiskStopsException.h"
#include "SignalTypes.h"
#include "number.h"

namespace mkc_riskstops
{
  template <class Decimal>
  struct NoRounding
  {
    static Decimal round(const Decimal& price,
			 const Decimal& /*tick*/,
			 const Decimal& /*tickDiv2*/)
    {
      return price;
    }
  };

  // Nearest multiple of tick, exact half ticks away from zero
  template <class Decimal>
  struct TickRounding
  {
    static Decimal round(const Decimal& price,
			 const Decimal& tick,
			 const Decimal& tickDiv2)
    {
      return num::Round2Tick(price, tick, tickDiv2);
    }
  };

  template <class Decimal>
  struct TickRoundingResult
  {
    std::vector<SignalLedgerRecord<Decimal>> records;
    std::vector<std::string> warnings;
  };

  inline std::string invalidTickWarning (std::size_t row)
  {
    return "invalid tick_size: rounding skipped for row " + std::to_string(row);
  }

  /**
   * @class TickRounder
   * @brief Fills the rounded SL/TP fields of ledger records.
   *
   * With a strictly positive tick size each present price is rounded to the
   * nearest tick. With an absent or non-positive tick size the rounded fields
   * repeat the raw values and one warning is produced for every record that
   * has a price to round, unless the behavior is fail, which throws.
   * Rounding a value that is already on the tick grid returns it unchanged.
   */
  template <class Decimal> class TickRounder
  {
  public:
    TickRounder (const std::optional<Decimal>& tickSize,
		 InvalidTickBehavior invalidBehavior = InvalidTickBehavior::NoRound)
      : mTickSize(tickSize),
	mInvalidBehavior(invalidBehavior)
    {}

    bool hasValidTick() const
    {
      return mTickSize.has_value() && (*mTickSize > DecimalConstants<Decimal>::DecimalZero);
    }

    /**
     * @throws ConfigException if the tick size is invalid, the behavior is
     * fail and at least one record has a price to round.
     */
    TickRoundingResult<Decimal> round (const std::vector<SignalLedgerRecord<Decimal>>& records,
				       concurrency::IParallelExecutor& executor) const
    {
      if (hasValidTick())
	return roundAll<TickRounding<Decimal>>(records, executor);

      TickRoundingResult<Decimal> result = roundAll<NoRounding<Decimal>>(records, executor);

      for (std::size_t row = 0; row < records.size(); ++row)
	{
	  if (!records[row].hasRoundableField())
	    continue;

	  if (mInvalidBehavior == InvalidTickBehavior::Fail)
	    throw ConfigException("TickRounder: " + describeTick() + " is not a valid tick size for row " +
				  std::to_string(row));

	  result.warnings.push_back(invalidTickWarning(row));
	}

      return result;
    }

    template <class RoundingPolicy>
    SignalLedgerRecord<Decimal> roundRecord (const SignalLedgerRecord<Decimal>& record) const
    {
      const Decimal tick = mTickSize.value_or(DecimalConstants<Decimal>::DecimalZero);
      const Decimal tickDiv2 = tick / DecimalConstants<Decimal>::DecimalTwo;

      std::optional<Decimal> stopRounded;
      std::optional<Decimal> targetRounded;

      if (record.getStopLoss())
	stopRounded = RoundingPolicy::round(*record.getStopLoss(), tick, tickDiv2);

      if (record.getProfitTarget())
	targetRounded = RoundingPolicy::round(*record.getProfitTarget(), tick, tickDiv2);

      return record.withRoundedPrices(stopRounded, targetRounded);
    }

  private:
    template <class RoundingPolicy>
    TickRoundingResult<Decimal> roundAll (const std::vector<SignalLedgerRecord<Decimal>>& records,
					  concurrency::IParallelExecutor& executor) const
    {
      std::vector<std::optional<SignalLedgerRecord<Decimal>>> slots(records.size());

      concurrency::parallel_for(static_cast<uint32_t>(records.size()), executor,
				[this, &records, &slots](uint32_t i) {
				  slots[i] = this->template roundRecord<RoundingPolicy>(records[i]);
				});

      TickRoundingResult<Decimal> result;
      result.records.reserve(slots.size());
      for (auto& slot : slots)
	result.records.push_back(std::move(*slot));

      return result;
    }

    std::string describeTick() const
    {
      return mTickSize ? num::toString(*mTickSize) : std::string("absent");
    }

  private:
    std::optional<Decimal> mTickSize;
    InvalidTickBehavior mInvalidBehavior;
  };
} // namespace mkc_riskstops

#endif // __TICK_ROUNDER_H
