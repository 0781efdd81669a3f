#include "services/calibration/calibration_model.h"

#include <cmath>

namespace concmon {

CalibrationModel::CalibrationModel()
    : slope_(DEFAULT_SLOPE), intercept_(DEFAULT_INTERCEPT) {}

CalibrationModel::CalibrationModel(double slope, double intercept)
    : slope_(slope), intercept_(intercept) {
  if (!std::isfinite(slope_) || !std::isfinite(intercept_)) {
    throw InvalidInputError("calibration coefficients must be finite numbers");
  }
}

double CalibrationModel::concentration(double conductivity) const {
  if (!std::isfinite(conductivity)) {
    throw InvalidInputError("conductivity '" + std::to_string(conductivity) +
                            "' is not a valid number");
  }

  // Conductivity cannot physically be negative
  if (conductivity < 0.0) return 0.0;

  double value = slope_ * conductivity + intercept_;

  // Below the sensor's lower range (near pure water)
  if (value < 0.0) return 0.0;

  return value;
}

}  // namespace concmon
