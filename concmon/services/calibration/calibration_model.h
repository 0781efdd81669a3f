#pragma once

#include <stdexcept>
#include <string>

namespace concmon {

// Thrown for a non-numeric (NaN / infinite) calibration input.
class InvalidInputError : public std::invalid_argument {
 public:
  explicit InvalidInputError(const std::string& what)
      : std::invalid_argument(what) {}
};

/**
 * @brief Conductivity (uS/cm) to sodium carbonate concentration (%).
 *
 *   concentration = slope * conductivity + intercept, floored at 0
 *
 * The coefficient pair comes from titration fits and must be refitted when
 * the sensor or the measured medium changes; it is loaded from the
 * "Calibration" section of the configuration.
 */
class CalibrationModel {
 public:
  static constexpr double DEFAULT_SLOPE = 0.000092;
  static constexpr double DEFAULT_INTERCEPT = -0.126115;

  CalibrationModel();
  // Throws InvalidInputError when a coefficient is not finite.
  CalibrationModel(double slope, double intercept);

  /**
   * @brief Negative conductivity is a measurement anomaly and yields 0.0,
   * as does any result below zero.
   * @throws InvalidInputError for NaN or infinite input.
   */
  double concentration(double conductivity) const;

  double slope() const { return slope_; }
  double intercept() const { return intercept_; }

 private:
  double slope_;
  double intercept_;
};

}  // namespace concmon
