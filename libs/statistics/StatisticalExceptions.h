#pragma once

#include <stdexcept>
#include <string>

namespace stratvalidator
{
  // Fewer observations than a computation requires
  class InsufficientDataException : public std::runtime_error
  {
  public:
    explicit InsufficientDataException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };

  // Zero variance, all-NaN input, or too many non-finite bootstrap replicates
  class DegenerateInputException : public std::runtime_error
  {
  public:
    explicit DegenerateInputException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };
}
