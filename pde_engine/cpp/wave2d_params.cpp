// wave2d_params.cpp
#include "wave2d_params.hpp"
#include "stability_controller.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

const char* error_kind_name(Wave2DErrorKind kind) {
    switch (kind) {
    case Wave2DErrorKind::InvalidResolution:        return "InvalidResolution";
    case Wave2DErrorKind::InvalidStepCount:         return "InvalidStepCount";
    case Wave2DErrorKind::InvalidMode:              return "InvalidMode";
    case Wave2DErrorKind::InvalidWaveSpeed:         return "InvalidWaveSpeed";
    case Wave2DErrorKind::InvalidCourantNumber:     return "InvalidCourantNumber";
    case Wave2DErrorKind::StabilityRisk:            return "StabilityRisk";
    case Wave2DErrorKind::InvalidRecordingInterval: return "InvalidRecordingInterval";
    }
    return "Unknown";
}

Wave2DParameterError::Wave2DParameterError(Wave2DErrorKind kind_,
                                           const std::string& message)
    : std::invalid_argument(std::string(error_kind_name(kind_)) + ": " + message),
      error_kind(kind_)
{
}

namespace {

[[noreturn]] void fail(Wave2DErrorKind kind, const std::string& name,
                       const std::string& constraint, double value)
{
    std::ostringstream os;
    os << name << " must satisfy " << constraint << " (got " << value << ")";
    throw Wave2DParameterError(kind, os.str());
}

} // namespace

int max_grid_resolution() {
    // floor(sqrt(INT_MAX)) = 46340 点まで -> N = 46339
    const double limit = std::sqrt(static_cast<double>(std::numeric_limits<int>::max()));
    return static_cast<int>(limit) - 1;
}

void validate_params(const Wave2DParams& p) {
    if (p.N < 2) {
        fail(Wave2DErrorKind::InvalidResolution, "N", "N >= 2", p.N);
    }
    if (p.N > max_grid_resolution()) {
        fail(Wave2DErrorKind::InvalidResolution, "N",
             "N <= " + std::to_string(max_grid_resolution())
             + " ((N+1)^2 grid points must fit in int)", p.N);
    }
    if (p.Nt < 1) {
        fail(Wave2DErrorKind::InvalidStepCount, "Nt", "Nt >= 1", p.Nt);
    }
    // mx = 0 や my = 0 は cos(0) で縮退するので不可
    if (p.mx < 1) {
        fail(Wave2DErrorKind::InvalidMode, "mx", "mx >= 1", p.mx);
    }
    if (p.my < 1) {
        fail(Wave2DErrorKind::InvalidMode, "my", "my >= 1", p.my);
    }
    if (!(p.c > 0.0)) {
        fail(Wave2DErrorKind::InvalidWaveSpeed, "c", "c > 0", p.c);
    }
    if (!(p.cfl > 0.0)) {
        fail(Wave2DErrorKind::InvalidCourantNumber, "cfl", "cfl > 0", p.cfl);
    }
    if (!StabilityController::is_stable(p.cfl)) {
        fail(Wave2DErrorKind::StabilityRisk, "cfl",
             "cfl <= 1/sqrt(2) (2D five-point stencil stability bound)", p.cfl);
    }
    if (p.store_every < 1) {
        fail(Wave2DErrorKind::InvalidRecordingInterval, "store_every",
             "store_every >= 1", p.store_every);
    }
}
