// stability_controller.cpp
#include "stability_controller.hpp"
#include <cmath>

StabilityController::StabilityController(double h_, double c_, double cfl_)
    : dt_value(cfl_ * h_ / c_),
      r_value(cfl_)  // dt を cfl から決めているので r = cfl そのもの
{
}

double StabilityController::stability_margin() const {
    return r_value * std::sqrt(2.0);
}

double StabilityController::max_stable_cfl() {
    return 1.0 / std::sqrt(2.0);
}

bool StabilityController::is_stable(double cfl) {
    return cfl <= max_stable_cfl();
}
