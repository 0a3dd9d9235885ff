// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>
//

#ifndef __RISK_STOPS_EXCEPTION_H
#define __RISK_STOPS_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_riskstops
{
  // Base class for every fatal error raised by the pipeline. Data quality
  // problems that only affect one row are reported as notes instead.
  class RiskStopsException : public std::runtime_error
  {
  public:
    explicit RiskStopsException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~RiskStopsException() = default;
  };

  // Malformed configuration, e.g. atr_period < 1 or a non-positive multiplier
  class ConfigException : public RiskStopsException
  {
  public:
    explicit ConfigException(const std::string& msg)
      : RiskStopsException(msg) {}
  };

  // An explicit signal index that does not address a bar
  class SignalIndexOutOfRangeException : public RiskStopsException
  {
  public:
    explicit SignalIndexOutOfRangeException(const std::string& msg)
      : RiskStopsException(msg) {}
  };

  // Bars that are unsorted, duplicated or otherwise unusable as a series
  class BarSeriesException : public RiskStopsException
  {
  public:
    explicit BarSeriesException(const std::string& msg)
      : RiskStopsException(msg) {}
  };

  class MissingColumnException : public RiskStopsException
  {
  public:
    explicit MissingColumnException(const std::string& msg)
      : RiskStopsException(msg) {}
  };

  class CsvFormatException : public RiskStopsException
  {
  public:
    explicit CsvFormatException(const std::string& msg)
      : RiskStopsException(msg) {}
  };

} // namespace mkc_riskstops

#endif // __RISK_STOPS_EXCEPTION_H
