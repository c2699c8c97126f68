#include "asteria/telemetry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "asteria/jsonlite.hpp"

namespace asteria {

namespace {
constexpr double kRatioRelTol = 1e-9;
}  // namespace

std::optional<double> integrity(double kappa, Error* error) {
  if (!std::isfinite(kappa)) {
    if (error) *error = make_error(ErrorCode::invalid_metric, "kappa must be finite");
    return std::nullopt;
  }
  // exp underflows to 0 below roughly -745; clamp to the smallest positive
  // double so the result stays strictly positive.
  const double value = std::exp(kappa);
  if (value <= 0.0) return std::numeric_limits<double>::denorm_min();
  if (!std::isfinite(value)) {
    if (error) *error = make_error(ErrorCode::invalid_metric,
                                   "kappa " + jsonlite::format_double(kappa) + " overflows e^kappa");
    return std::nullopt;
  }
  return value;
}

std::optional<bool> weld_ok(double residual, double tol, Error* error) {
  if (!std::isfinite(residual) || residual < 0.0) {
    if (error) *error = make_error(ErrorCode::invalid_metric, "residual must be finite and non-negative");
    return std::nullopt;
  }
  if (!std::isfinite(tol) || tol < 0.0) {
    if (error) *error = make_error(ErrorCode::invalid_metric, "tol must be finite and non-negative");
    return std::nullopt;
  }
  return residual <= tol;
}

std::optional<TelemetrySample> make_sample(double kappa, double omega, double residual,
                                           double tol, Error* error) {
  const auto i = integrity(kappa, error);
  if (!i) return std::nullopt;
  if (!std::isfinite(omega)) {
    if (error) *error = make_error(ErrorCode::invalid_metric, "omega must be finite");
    return std::nullopt;
  }
  if (!weld_ok(residual, tol, error)) return std::nullopt;

  TelemetrySample s;
  s.kappa = kappa;
  s.integrity = *i;
  s.omega = omega;
  s.weld.residual = residual;
  s.weld.tol = tol;
  return s;
}

std::optional<Projection> project(const TelemetrySample& sample, double delta_kappa, Error* error) {
  if (!std::isfinite(delta_kappa)) {
    if (error) *error = make_error(ErrorCode::invalid_metric, "delta_kappa must be finite");
    return std::nullopt;
  }
  Projection p;
  p.kappa_t1 = sample.kappa + delta_kappa;
  const auto step = integrity(delta_kappa, error);
  if (!step) return std::nullopt;
  p.integrity_t1 = sample.integrity * *step;
  if (!std::isfinite(p.integrity_t1)) {
    if (error) *error = make_error(ErrorCode::invalid_metric, "projected integrity overflows");
    return std::nullopt;
  }
  return p;
}

bool ratio_consistent(double delta_kappa, double i_ratio) {
  if (!std::isfinite(delta_kappa) || !std::isfinite(i_ratio)) return false;
  const double expected = std::exp(delta_kappa);
  const double scale = std::max(std::fabs(expected), std::fabs(i_ratio));
  return std::fabs(expected - i_ratio) <= kRatioRelTol * scale;
}

}  // namespace asteria
