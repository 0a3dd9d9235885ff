// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __POSITION_FILTER_H
#define __POSITION_FILTER_H 1

#include <vector>
#include <memory>
#include <optional>
#include <algorithm>
#include "PositionClosePolicy.h"
#include "RiskStopsException.h"
#include "SignalTypes.h"

namespace mkc_riskstops
{
  template <class Decimal>
  struct PositionFilterResult
  {
    std::vector<AttachedSignal<Decimal>> kept;
    std::vector<AttachedSignal<Decimal>> skipped;
  };

  /**
   * @class SingleOpenPositionFilter
   * @brief Suppresses signals that would open a second concurrent position.
   *
   * Resolved signals are visited in ascending bar index, ties in input
   * order. The first signal opens a position; every later signal is either
   * accepted by the close policy, in which case it is kept and opens the next
   * position, or routed to skipped with overlapping_open_signal.
   *
   * Unresolved signals cannot be placed in time. They bypass the filter and
   * are appended to kept, after the resolved ones, tagged
   * unresolved_signal_index.
   */
  template <class Decimal> class SingleOpenPositionFilter
  {
  public:
    explicit SingleOpenPositionFilter (std::shared_ptr<PositionClosePolicy<Decimal>> policy)
      : mPolicy(std::move(policy))
    {
      if (!mPolicy)
	throw ConfigException("SingleOpenPositionFilter: close policy must not be null");
    }

    const PositionClosePolicy<Decimal>& getClosePolicy() const
    {
      return *mPolicy;
    }

    PositionFilterResult<Decimal> filter (const std::vector<AttachedSignal<Decimal>>& signals) const
    {
      std::vector<AttachedSignal<Decimal>> resolved;
      std::vector<AttachedSignal<Decimal>> unresolved;

      for (const auto& signal : signals)
	{
	  if (signal.isResolved())
	    resolved.push_back(signal);
	  else
	    unresolved.push_back(signal);
	}

      std::stable_sort(resolved.begin(), resolved.end(),
		       [](const AttachedSignal<Decimal>& lhs, const AttachedSignal<Decimal>& rhs) {
			 return *lhs.getBarIndex() < *rhs.getBarIndex();
		       });

      PositionFilterResult<Decimal> result;
      std::optional<OpenPosition> position;

      for (const auto& signal : resolved)
	{
	  if (position && !mPolicy->closesPosition(*position, signal))
	    {
	      result.skipped.push_back(signal.withNote(NoteCode::OverlappingOpenSignal));
	      continue;
	    }

	  position = mPolicy->openPosition(signal);
	  if (position->openingNote)
	    result.kept.push_back(signal.withNote(*position->openingNote));
	  else
	    result.kept.push_back(signal);
	}

      for (const auto& signal : unresolved)
	result.kept.push_back(signal.withNote(NoteCode::UnresolvedSignalIndex));

      return result;
    }

  private:
    std::shared_ptr<PositionClosePolicy<Decimal>> mPolicy;
  };
} // namespace mkc_riskstops

#endif // __POSITION_FILTER_H
