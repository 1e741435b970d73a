/**
 * Exceptions raised by the backtest pipeline.
 */

#ifndef KALMAN_BASIS_CPP_ERRORS_HPP_
#define KALMAN_BASIS_CPP_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace kalman_basis {

/** Gain denominator vanished or an observation was not finite. Fatal for the run. */
class NumericalDegeneracy : public std::runtime_error {
 public:
  explicit NumericalDegeneracy(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class DataError : public std::runtime_error {
 public:
  explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_ERRORS_HPP_
