// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __RISK_CONFIGURATION_H
#define __RISK_CONFIGURATION_H 1

#include <string>
#include <vector>
#include <optional>
#include <boost/algorithm/string.hpp>
#include "AverageTrueRange.h"
#include "DecimalConstants.h"
#include "RiskStopsException.h"
#include "number.h"

namespace mkc_riskstops
{
  // Bar field used as the entry price of a signal
  enum class EntryPriceSource
  {
    Open,
    High,
    Low,
    Close,
    NextOpen
  };

  // Rule that decides when an open position counts as closed
  enum class ClosePolicyType
  {
    OppositeSignal,
    PriceLevelExit
  };

  // What the tick rounder does when tick_size is absent or not positive
  enum class InvalidTickBehavior
  {
    NoRound,
    Fail
  };

  inline std::string entryPriceSourceToString (EntryPriceSource source)
  {
    switch (source)
      {
      case EntryPriceSource::Open:
	return "open";
      case EntryPriceSource::High:
	return "high";
      case EntryPriceSource::Low:
	return "low";
      case EntryPriceSource::NextOpen:
	return "next_open";
      case EntryPriceSource::Close:
      default:
	return "close";
      }
  }

  inline EntryPriceSource entryPriceSourceFromString (const std::string& text)
  {
    const std::string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (name == "open")
      return EntryPriceSource::Open;
    if (name == "high")
      return EntryPriceSource::High;
    if (name == "low")
      return EntryPriceSource::Low;
    if (name == "close")
      return EntryPriceSource::Close;
    if (name == "next_open")
      return EntryPriceSource::NextOpen;

    throw ConfigException("entry_price_source must be one of open, high, low, close, next_open; got '" + text + "'");
  }

  inline std::string atrMethodToString (AtrMethod method)
  {
    return (method == AtrMethod::SimpleAverage) ? std::string("sma") : std::string("wilder");
  }

  inline AtrMethod atrMethodFromString (const std::string& text)
  {
    const std::string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (name == "wilder")
      return AtrMethod::Wilder;
    if (name == "sma")
      return AtrMethod::SimpleAverage;

    throw ConfigException("atr_method must be wilder or sma; got '" + text + "'");
  }

  inline std::string closePolicyTypeToString (ClosePolicyType type)
  {
    return (type == ClosePolicyType::PriceLevelExit) ? std::string("price_level_exit")
      : std::string("opposite_signal");
  }

  inline ClosePolicyType closePolicyTypeFromString (const std::string& text)
  {
    const std::string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (name == "opposite_signal")
      return ClosePolicyType::OppositeSignal;
    if (name == "price_level_exit")
      return ClosePolicyType::PriceLevelExit;

    throw ConfigException("position_close_policy must be opposite_signal or price_level_exit; got '" + text + "'");
  }

  inline std::string invalidTickBehaviorToString (InvalidTickBehavior behavior)
  {
    return (behavior == InvalidTickBehavior::Fail) ? std::string("fail") : std::string("no_round");
  }

  inline InvalidTickBehavior invalidTickBehaviorFromString (const std::string& text)
  {
    const std::string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (name == "no_round")
      return InvalidTickBehavior::NoRound;
    if (name == "fail")
      return InvalidTickBehavior::Fail;

    throw ConfigException("invalid_tick_behavior must be no_round or fail; got '" + text + "'");
  }

  /**
   * @class RiskConfiguration
   * @brief Parameters of one SL/TP pipeline run.
   *
   * A default constructed configuration holds the documented defaults:
   * atr_period 14, sl_multiplier 1.5, tp_multiplier 3.0, no tick size and
   * close as the entry price. Setters do not validate, call validate() or
   * throwIfInvalid() once the configuration is complete.
   *
   * @tparam Decimal The numeric type used for multipliers and tick size.
   */
  template <class Decimal> class RiskConfiguration
  {
  public:
    static constexpr int DefaultAtrPeriod = 14;
    static constexpr int MaxWorkerThreads = 256;

    RiskConfiguration()
      : mAtrPeriod(DefaultAtrPeriod),
	mStopLossMultiplier(DecimalConstants<Decimal>::DefaultStopLossMultiplier),
	mProfitTargetMultiplier(DecimalConstants<Decimal>::DefaultProfitTargetMultiplier),
	mTickSize(),
	mEntryPriceSource(EntryPriceSource::Close),
	mAtrMethod(AtrMethod::Wilder),
	mClosePolicy(ClosePolicyType::OppositeSignal),
	mInvalidTickBehavior(InvalidTickBehavior::NoRound),
	mIncludeSkippedSignals(true),
	mWorkerThreads(0)
    {}

    int getAtrPeriod() const
    {
      return mAtrPeriod;
    }

    void setAtrPeriod (int period)
    {
      mAtrPeriod = period;
    }

    const Decimal& getStopLossMultiplier() const
    {
      return mStopLossMultiplier;
    }

    void setStopLossMultiplier (const Decimal& multiplier)
    {
      mStopLossMultiplier = multiplier;
    }

    const Decimal& getProfitTargetMultiplier() const
    {
      return mProfitTargetMultiplier;
    }

    void setProfitTargetMultiplier (const Decimal& multiplier)
    {
      mProfitTargetMultiplier = multiplier;
    }

    /**
     * @brief Broker price increment. May hold a zero or negative value read
     * from input; such a value is treated as invalid by the tick rounder.
     */
    const std::optional<Decimal>& getTickSize() const
    {
      return mTickSize;
    }

    void setTickSize (const std::optional<Decimal>& tickSize)
    {
      mTickSize = tickSize;
    }

    bool hasValidTickSize() const
    {
      return mTickSize.has_value() && (*mTickSize > DecimalConstants<Decimal>::DecimalZero);
    }

    EntryPriceSource getEntryPriceSource() const
    {
      return mEntryPriceSource;
    }

    void setEntryPriceSource (EntryPriceSource source)
    {
      mEntryPriceSource = source;
    }

    AtrMethod getAtrMethod() const
    {
      return mAtrMethod;
    }

    void setAtrMethod (AtrMethod method)
    {
      mAtrMethod = method;
    }

    ClosePolicyType getClosePolicy() const
    {
      return mClosePolicy;
    }

    void setClosePolicy (ClosePolicyType policy)
    {
      mClosePolicy = policy;
    }

    InvalidTickBehavior getInvalidTickBehavior() const
    {
      return mInvalidTickBehavior;
    }

    void setInvalidTickBehavior (InvalidTickBehavior behavior)
    {
      mInvalidTickBehavior = behavior;
    }

    bool getIncludeSkippedSignals() const
    {
      return mIncludeSkippedSignals;
    }

    void setIncludeSkippedSignals (bool include)
    {
      mIncludeSkippedSignals = include;
    }

    // 0 runs the per record stages on the calling thread
    int getWorkerThreads() const
    {
      return mWorkerThreads;
    }

    void setWorkerThreads (int threads)
    {
      mWorkerThreads = threads;
    }

    /**
     * @brief Checks the range constraints of every parameter.
     * @return Vector of validation errors (empty if valid)
     */
    std::vector<std::string> validate() const
    {
      std::vector<std::string> errors;

      if (mAtrPeriod < 1)
	errors.push_back("atr_period must be >= 1, got " + std::to_string(mAtrPeriod));

      if (!(mStopLossMultiplier > DecimalConstants<Decimal>::DecimalZero))
	errors.push_back("sl_multiplier must be > 0, got " + num::toString(mStopLossMultiplier));

      if (!(mProfitTargetMultiplier > DecimalConstants<Decimal>::DecimalZero))
	errors.push_back("tp_multiplier must be > 0, got " + num::toString(mProfitTargetMultiplier));

      if (mWorkerThreads < 0 || mWorkerThreads > MaxWorkerThreads)
	errors.push_back("worker_threads must be between 0 and " + std::to_string(MaxWorkerThreads) +
			 ", got " + std::to_string(mWorkerThreads));

      return errors;
    }

    /**
     * @throws ConfigException listing every validation error.
     */
    void throwIfInvalid() const
    {
      const std::vector<std::string> errors = validate();
      if (errors.empty())
	return;

      std::string message("RiskConfiguration: ");
      for (std::size_t i = 0; i < errors.size(); ++i)
	{
	  if (i > 0)
	    message += "; ";
	  message += errors[i];
	}

      throw ConfigException(message);
    }

  private:
    int mAtrPeriod;
    Decimal mStopLossMultiplier;
    Decimal mProfitTargetMultiplier;
    std::optional<Decimal> mTickSize;
    EntryPriceSource mEntryPriceSource;
    AtrMethod mAtrMethod;
    ClosePolicyType mClosePolicy;
    InvalidTickBehavior mInvalidTickBehavior;
    bool mIncludeSkippedSignals;
    int mWorkerThreads;
  };
} // namespace mkc_riskstops

#endif // __RISK_CONFIGURATION_H
