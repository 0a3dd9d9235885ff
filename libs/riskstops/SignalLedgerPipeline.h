// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __SIGNAL_LEDGER_PIPELINE_H
#define __SIGNAL_LEDGER_PIPELINE_H 1

#include <vector>
#include <string>
#include <memory>
#include <ostream>
#include <algorithm>
#include "ParallelExecutors.h"
#include "AverageTrueRange.h"
#include "BarSeries.h"
#include "PositionClosePolicy.h"
#include "PositionFilter.h"
#include "RiskConfiguration.h"
#include "SignalAttacher.h"
#include "SignalTypes.h"
#include "StopTargetCalculator.h"
#include "TickRounder.h"

namespace mkc_riskstops
{
  /**
   * @brief Output of one pipeline run.
   *
   * warnings are run level messages (tick rounding fallbacks) that the caller
   * reports once at the end of the run.
   */
  template <class Decimal>
  struct SignalLedger
  {
    std::vector<SignalLedgerRecord<Decimal>> records;
    std::vector<std::string> warnings;
    std::size_t numKept = 0;
    std::size_t numSkipped = 0;
  };

  /**
   * @class SignalLedgerPipeline
   * @brief Runs ATR, attach, filter, SL/TP and tick rounding in order.
   *
   * Records come out ordered by resolved bar index (kept before skipped on
   * the same bar), followed by unresolved signals. Skipped signals appear
   * unpriced when include_skipped_signals is set and are dropped otherwise.
   */
  template <class Decimal> class SignalLedgerPipeline
  {
  public:
    /**
     * @throws ConfigException if the configuration is invalid.
     */
    explicit SignalLedgerPipeline (const RiskConfiguration<Decimal>& config)
      : mConfig(config)
    {
      mConfig.throwIfInvalid();
    }

    const RiskConfiguration<Decimal>& getConfiguration() const
    {
      return mConfig;
    }

    SignalLedger<Decimal> run (const BarSeries<Decimal>& bars,
			       const std::vector<SignalRequest>& requests,
			       std::ostream& os) const
    {
      std::unique_ptr<concurrency::IParallelExecutor> executor = createExecutor();
      return run(bars, requests, *executor, os);
    }

    SignalLedger<Decimal> run (const BarSeries<Decimal>& bars,
			       const std::vector<SignalRequest>& requests,
			       concurrency::IParallelExecutor& executor,
			       std::ostream& os) const
    {
      const BarSeries<Decimal> withAtr = AverageTrueRangeSeries(bars, mConfig.getAtrPeriod(),
								mConfig.getAtrMethod());
      os << "ATR(" << mConfig.getAtrPeriod() << ", " << atrMethodToString(mConfig.getAtrMethod())
	 << ") computed over " << withAtr.getNumBars() << " bars\n";

      SignalAttacher<Decimal> attacher(mConfig.getEntryPriceSource());
      const std::vector<AttachedSignal<Decimal>> attached = attacher.attach(withAtr, requests);

      const std::size_t numUnresolved = std::count_if(attached.begin(), attached.end(),
						      [](const AttachedSignal<Decimal>& s) { return !s.isResolved(); });
      os << "Attached " << attached.size() << " signals (" << numUnresolved << " unresolved)\n";

      SingleOpenPositionFilter<Decimal> positionFilter(createClosePolicy(mConfig, withAtr));
      const PositionFilterResult<Decimal> filtered = positionFilter.filter(attached);
      os << "Position filter (" << positionFilter.getClosePolicy().getName() << "): kept "
	 << filtered.kept.size() << ", skipped " << filtered.skipped.size() << "\n";

      StopTargetCalculator<Decimal> calculator(mConfig.getStopLossMultiplier(),
					       mConfig.getProfitTargetMultiplier());
      std::vector<SignalLedgerRecord<Decimal>> priced = calculator.priceAll(filtered.kept, executor);

      std::vector<SignalLedgerRecord<Decimal>> ledgerRows = assembleRows(priced, filtered.skipped);

      TickRounder<Decimal> rounder(mConfig.getTickSize(), mConfig.getInvalidTickBehavior());
      TickRoundingResult<Decimal> rounded = rounder.round(ledgerRows, executor);
      if (!rounder.hasValidTick())
	os << "Tick rounding skipped: tick_size is absent or not positive\n";

      SignalLedger<Decimal> ledger;
      ledger.records = std::move(rounded.records);
      ledger.warnings = std::move(rounded.warnings);
      ledger.numKept = filtered.kept.size();
      ledger.numSkipped = filtered.skipped.size();

      os << "Ledger contains " << ledger.records.size() << " rows\n";
      return ledger;
    }

  private:
    std::vector<SignalLedgerRecord<Decimal>>
    assembleRows (const std::vector<SignalLedgerRecord<Decimal>>& priced,
		  const std::vector<AttachedSignal<Decimal>>& skipped) const
    {
      std::vector<SignalLedgerRecord<Decimal>> resolvedRows;
      std::vector<SignalLedgerRecord<Decimal>> unresolvedRows;

      for (const auto& record : priced)
	{
	  if (record.getSignal().isResolved())
	    resolvedRows.push_back(record);
	  else
	    unresolvedRows.push_back(record);
	}

      if (mConfig.getIncludeSkippedSignals())
	{
	  for (const auto& signal : skipped)
	    resolvedRows.push_back(StopTargetCalculator<Decimal>::unpriced(signal));
	}

      std::stable_sort(resolvedRows.begin(), resolvedRows.end(),
		       [](const SignalLedgerRecord<Decimal>& lhs, const SignalLedgerRecord<Decimal>& rhs) {
			 return *lhs.getSignal().getBarIndex() < *rhs.getSignal().getBarIndex();
		       });

      resolvedRows.insert(resolvedRows.end(), unresolvedRows.begin(), unresolvedRows.end());
      return resolvedRows;
    }

    std::unique_ptr<concurrency::IParallelExecutor> createExecutor() const
    {
      if (mConfig.getWorkerThreads() > 0)
	return std::make_unique<concurrency::ThreadPoolExecutor<>>(static_cast<std::size_t>(mConfig.getWorkerThreads()));

      return std::make_unique<concurrency::SingleThreadExecutor>();
    }

  private:
    RiskConfiguration<Decimal> mConfig;
  };
} // namespace mkc_riskstops

#endif // __SIGNAL_LEDGER_PIPELINE_H
