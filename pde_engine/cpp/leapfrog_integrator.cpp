// leapfrog_integrator.cpp
#include "leapfrog_integrator.hpp"
#include "neumann_boundary.hpp"

#include <stdexcept>
#include <string>
#include <vector>

LeapfrogIntegrator::LeapfrogIntegrator(double r_, int Nt_)
    : r(r_),
      r2(r_ * r_),
      Nt(Nt_),
      n_steps(0),
      current_state(State::Uninitialized)
{
}

void LeapfrogIntegrator::mark_ready() {
    n_steps = 0;
    current_state = State::Ready;
}

void LeapfrogIntegrator::update_interior(Wave2DGrid& grid) const {
    const int N = grid.n();
    const std::vector<double>& prev = grid.previous();
    const std::vector<double>& cur  = grid.current();
    std::vector<double>&       next = grid.next_mut();

    for (int j = 1; j < N; ++j) {
        for (int i = 1; i < N; ++i) {
            const std::size_t k = grid.idx(i, j);
            const std::size_t kL = grid.idx(i - 1, j);
            const std::size_t kR = grid.idx(i + 1, j);
            const std::size_t kD = grid.idx(i, j - 1);
            const std::size_t kU = grid.idx(i, j + 1);

            next[k] = 2.0 * cur[k] - prev[k]
                    + r2 * five_point(cur[k], cur[kL], cur[kR], cur[kD], cur[kU]);
        }
    }
}

void LeapfrogIntegrator::step(Wave2DGrid& grid) {
    if (current_state == State::Uninitialized) {
        throw std::logic_error("LeapfrogIntegrator::step: initial condition is not set");
    }
    if (current_state == State::Done) {
        throw std::logic_error("LeapfrogIntegrator::step: already advanced "
                               + std::to_string(Nt) + " steps");
    }

    update_interior(grid);
    NeumannBoundary::apply(grid, r2);

    // n -> n+1
    grid.rotate();

    ++n_steps;
    current_state = (n_steps >= Nt) ? State::Done : State::Stepping;
}

const char* state_name(LeapfrogIntegrator::State state) {
    switch (state) {
    case LeapfrogIntegrator::State::Uninitialized: return "Uninitialized";
    case LeapfrogIntegrator::State::Ready:         return "Ready";
    case LeapfrogIntegrator::State::Stepping:      return "Stepping";
    case LeapfrogIntegrator::State::Done:          return "Done";
    }
    return "Unknown";
}
