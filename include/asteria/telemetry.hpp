#pragma once

// asteria/telemetry.hpp — Pure derivations over raw integrity metrics.
//
// INVARIANTS:
//   - integrity(kappa) = e^kappa is strictly positive and strictly increasing
//     for every finite kappa; integrity(0) == 1.
//   - weld_ok(residual, tol) <=> residual <= tol, defined only for finite
//     non-negative inputs.
//   - Stateless: no smoothing, no history. omega is always a supplied value.

#include <optional>

#include "asteria/types.hpp"

namespace asteria {

// invalid_metric when kappa is NaN or infinite.
std::optional<double> integrity(double kappa, Error* error);

// invalid_metric when either argument is negative or not finite.
std::optional<bool> weld_ok(double residual, double tol, Error* error);

// Validated construction: kappa finite, omega finite, weld inputs valid.
std::optional<TelemetrySample> make_sample(double kappa, double omega, double residual,
                                           double tol, Error* error);

struct Projection {
  double kappa_t1{0.0};
  double integrity_t1{0.0};
};

// One-step projection: kappa_t1 = kappa + dk, I_t1 = I * e^dk.
std::optional<Projection> project(const TelemetrySample& sample, double delta_kappa, Error* error);

// True iff e^delta_kappa equals i_ratio within a relative tolerance of 1e-9.
bool ratio_consistent(double delta_kappa, double i_ratio);

}  // namespace asteria
