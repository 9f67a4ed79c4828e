#include "collide2d/core/settings.hpp"

#include <stdexcept>
#include <string>

namespace {

void requirePositive(double value, const char* name) {
  if (!(value > 0.0)) {
    throw std::invalid_argument(std::string("Settings: ") + name + " must be positive");
  }
}

void requireNonNegative(double value, const char* name) {
  if (!(value >= 0.0)) {
    throw std::invalid_argument(std::string("Settings: ") + name + " must be non-negative");
  }
}

} // namespace

void Settings::validate() const {
  requirePositive(StepFrequency, "StepFrequency");
  requireNonNegative(AABBExpansion, "AABBExpansion");
  if (VelocityIterations < 1) {
    throw std::invalid_argument("Settings: VelocityIterations must be at least 1");
  }
  if (PositionIterations < 0) {
    throw std::invalid_argument("Settings: PositionIterations must be non-negative");
  }
  requireNonNegative(WarmStartDistance, "WarmStartDistance");
  requireNonNegative(RestitutionVelocity, "RestitutionVelocity");
  requireNonNegative(LinearTolerance, "LinearTolerance");
  requireNonNegative(AngularTolerance, "AngularTolerance");
  requireNonNegative(MaxLinearCorrection, "MaxLinearCorrection");
  requireNonNegative(MaxAngularCorrection, "MaxAngularCorrection");
  if (!(Baumgarte >= 0.0 && Baumgarte <= 1.0)) {
    throw std::invalid_argument("Settings: Baumgarte must be in [0, 1]");
  }
  requirePositive(MaxTranslation, "MaxTranslation");
  requirePositive(MaxRotation, "MaxRotation");
}
