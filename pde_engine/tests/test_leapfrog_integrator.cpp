#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "leapfrog_integrator.hpp"
#include "neumann_boundary.hpp"
#include "standing_wave_initializer.hpp"
#include "wave2d_grid.hpp"

TEST(LeapfrogIntegrator, StateMachine) {
    Wave2DGrid grid(6);
    LeapfrogIntegrator integrator(0.5, 3);

    EXPECT_EQ(integrator.state(), LeapfrogIntegrator::State::Uninitialized);
    EXPECT_THROW(integrator.step(grid), std::logic_error);

    StandingWaveInitializer(1, 2).apply(grid, 0.25);
    integrator.mark_ready();
    EXPECT_EQ(integrator.state(), LeapfrogIntegrator::State::Ready);
    EXPECT_EQ(integrator.steps_taken(), 0);

    integrator.step(grid);
    EXPECT_EQ(integrator.state(), LeapfrogIntegrator::State::Stepping);
    integrator.step(grid);
    EXPECT_EQ(integrator.state(), LeapfrogIntegrator::State::Stepping);
    integrator.step(grid);
    EXPECT_EQ(integrator.state(), LeapfrogIntegrator::State::Done);
    EXPECT_TRUE(integrator.done());
    EXPECT_EQ(integrator.steps_taken(), 3);

    EXPECT_THROW(integrator.step(grid), std::logic_error);
    EXPECT_EQ(integrator.steps_taken(), 3);

    EXPECT_STREQ(state_name(integrator.state()), "Done");
}

TEST(LeapfrogIntegrator, InitializerSetsModeAndZeroVelocityStart) {
    const int N = 8;
    const double r = 0.5;
    Wave2DGrid grid(N);
    StandingWaveInitializer init(2, 1);
    init.apply(grid, r * r);

    for (int j = 0; j <= N; ++j) {
        for (int i = 0; i <= N; ++i) {
            const std::size_t k = grid.idx(i, j);
            EXPECT_DOUBLE_EQ(grid.current()[k], init.value(grid.get_x()[i], grid.get_y()[j]));
            EXPECT_NEAR(grid.previous()[k],
                        grid.current()[k]
                            + 0.5 * r * r * NeumannBoundary::laplacian(grid, grid.current(), i, j),
                        1e-14);
            EXPECT_EQ(grid.next()[k], 0.0);
        }
    }
}

// 初速度 0 なら u^1 = u^{-1} (中心差分で u_t(0) = 0)
TEST(LeapfrogIntegrator, FirstStepMatchesVirtualPreviousField) {
    const int N = 10;
    const double r = 0.6;
    Wave2DGrid grid(N);
    StandingWaveInitializer(3, 2).apply(grid, r * r);
    const std::vector<double> u_minus1 = grid.previous();
    const std::vector<double> u0 = grid.current();

    LeapfrogIntegrator integrator(r, 5);
    integrator.mark_ready();
    integrator.step(grid);

    for (std::size_t k = 0; k < grid.size(); ++k) {
        EXPECT_NEAR(grid.current()[k], u_minus1[k], 1e-14);
        EXPECT_EQ(grid.previous()[k], u0[k]);
    }
}

TEST(LeapfrogIntegrator, InteriorAndBoundaryFollowStencil) {
    const int N = 7;
    const double r = 0.4;
    Wave2DGrid grid(N);
    StandingWaveInitializer(1, 3).apply(grid, r * r);

    LeapfrogIntegrator integrator(r, 4);
    integrator.mark_ready();
    integrator.step(grid);

    const std::vector<double> prev = grid.previous();
    const std::vector<double> cur  = grid.current();
    integrator.step(grid);
    const std::vector<double>& next = grid.current();

    for (int j = 0; j <= N; ++j) {
        for (int i = 0; i <= N; ++i) {
            const std::size_t k = grid.idx(i, j);
            const double expected = 2.0 * cur[k] - prev[k]
                                  + r * r * NeumannBoundary::laplacian(grid, cur, i, j);
            EXPECT_NEAR(next[k], expected, 1e-14) << "at (" << i << ", " << j << ")";
        }
    }
}

TEST(LeapfrogIntegrator, BuffersRotateWithoutReallocation) {
    Wave2DGrid grid(4);
    StandingWaveInitializer(1, 1).apply(grid, 0.25);

    const double* p0 = grid.previous().data();
    const double* c0 = grid.current().data();
    const double* n0 = grid.next().data();

    LeapfrogIntegrator integrator(0.5, 3);
    integrator.mark_ready();
    integrator.step(grid);

    EXPECT_EQ(grid.previous().data(), c0);
    EXPECT_EQ(grid.current().data(), n0);
    EXPECT_EQ(grid.next().data(), p0);
}
