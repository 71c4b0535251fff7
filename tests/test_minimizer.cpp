#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <stdexcept>

#include <Eigen/Dense>
#include "minimizer.hpp"

// 0.5 x^T A x - b^T x with minimizer A^-1 b
static Objective MakeQuadratic(const Eigen::Matrix3d& A, const Eigen::Vector3d& b)
{
  Objective objective;
  objective.value = [A, b](const Eigen::VectorXd& x) {
    return 0.5*x.dot(A*x) - b.dot(x);
  };
  objective.value_and_gradient = [A, b](const Eigen::VectorXd& x, Eigen::VectorXd& g) {
    g = A*x - b;
    return 0.5*x.dot(A*x) - b.dot(x);
  };
  return objective;
}

static Eigen::VectorXd RosenbrockResiduals(const Eigen::VectorXd& x)
{
  Eigen::VectorXd r(2);
  r << 10.0*(x(1) - x(0)*x(0)), 1.0 - x(0);
  return r;
}

static Objective MakeRosenbrock()
{
  Objective objective;
  objective.value = [](const Eigen::VectorXd& x) { return RosenbrockResiduals(x).squaredNorm(); };
  objective.value_and_gradient = [](const Eigen::VectorXd& x, Eigen::VectorXd& g) {
    const Eigen::VectorXd r = RosenbrockResiduals(x);
    g.resize(2);
    g(0) = -40.0*x(0)*r(0) - 2.0*r(1);
    g(1) = 20.0*r(0);
    return r.squaredNorm();
  };
  objective.residuals = RosenbrockResiduals;
  return objective;
}

static Eigen::VectorXd RosenbrockStart()
{
  Eigen::VectorXd x0(2);
  x0 << -1.2, 1.0;
  return x0;
}

class QuadraticTest : public ::testing::Test {
protected:
  void SetUp() override {
    A << 4.0, 1.0, 0.0,
         1.0, 3.0, 0.5,
         0.0, 0.5, 2.0;
    b << 1.0, -2.0, 0.5;
    solution = A.ldlt().solve(b);
  }

  Eigen::Matrix3d A;
  Eigen::Vector3d b;
  Eigen::Vector3d solution;
};

// =============================================================================
// L-BFGS
// =============================================================================

TEST_F(QuadraticTest, LbfgsFindsMinimizer)
{
  MinimizerOptions options;
  options.ftol = 1e-13;
  options.gtol = 1e-8;
  const LbfgsMinimizer lbfgs(options);

  const MinimizeResult res = lbfgs.minimize(MakeQuadratic(A, b), Eigen::VectorXd::Zero(3));
  EXPECT_TRUE(res.success) << res.message;
  EXPECT_LT((res.x - solution).norm(), 1e-5);
  EXPECT_NEAR(res.fun, -0.5*b.dot(solution), 1e-9);
  EXPECT_GT(res.iterations, 0);
  EXPECT_GE(res.evaluations, res.iterations);
}

TEST_F(QuadraticTest, LbfgsWithFiniteDifferences)
{
  MinimizerOptions options;
  options.gradient = GradientSource::FINITE_DIFFERENCE;
  options.ftol = 1e-14;
  options.gtol = 1e-7;
  const LbfgsMinimizer lbfgs(options);

  Objective objective = MakeQuadratic(A, b);
  objective.value_and_gradient = nullptr;
  const MinimizeResult res = lbfgs.minimize(objective, Eigen::VectorXd::Ones(3));
  EXPECT_LT((res.x - solution).norm(), 1e-5);
}

TEST_F(QuadraticTest, LbfgsStopsAtStationaryStart)
{
  const LbfgsMinimizer lbfgs;
  const Eigen::VectorXd x0 = solution;

  const MinimizeResult res = lbfgs.minimize(MakeQuadratic(A, b), x0);
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.iterations, 0);
  EXPECT_EQ(res.x, x0);
}

TEST_F(QuadraticTest, MissingGradientThrows)
{
  const LbfgsMinimizer lbfgs;
  Objective objective = MakeQuadratic(A, b);
  objective.value_and_gradient = nullptr;
  EXPECT_THROW(lbfgs.minimize(objective, Eigen::VectorXd::Zero(3)), std::invalid_argument);

  objective.value = nullptr;
  MinimizerOptions options;
  options.gradient = GradientSource::FINITE_DIFFERENCE;
  const LbfgsMinimizer fd(options);
  EXPECT_THROW(fd.minimize(objective, Eigen::VectorXd::Zero(3)), std::invalid_argument);
}

TEST(Lbfgs, Rosenbrock)
{
  MinimizerOptions options;
  options.ftol = 1e-15;
  options.gtol = 1e-8;
  options.max_iterations = 2000;
  const LbfgsMinimizer lbfgs(options);

  const MinimizeResult res = lbfgs.minimize(MakeRosenbrock(), RosenbrockStart());
  EXPECT_NEAR(res.x(0), 1.0, 1e-3);
  EXPECT_NEAR(res.x(1), 1.0, 2e-3);
  EXPECT_LT(res.fun, 1e-6);
}

TEST(Lbfgs, IterationLimitIsReported)
{
  MinimizerOptions options;
  options.max_iterations = 1;
  const LbfgsMinimizer lbfgs(options);

  const MinimizeResult res = lbfgs.minimize(MakeRosenbrock(), RosenbrockStart());
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.iterations, 1);
  EXPECT_EQ(res.message, "Maximum number of iterations reached");
  // the last iterate is still an improvement
  EXPECT_LT(res.fun, RosenbrockResiduals(RosenbrockStart()).squaredNorm());
}

// =============================================================================
// Levenberg-Marquardt
// =============================================================================

TEST(LevenbergMarquardt, RosenbrockResiduals)
{
  const LevenbergMarquardtMinimizer lm;
  const MinimizeResult res = lm.minimize(MakeRosenbrock(), RosenbrockStart());

  EXPECT_NEAR(res.x(0), 1.0, 1e-4);
  EXPECT_NEAR(res.x(1), 1.0, 1e-4);
  EXPECT_LT(res.fun, 1e-8);
  EXPECT_FALSE(res.message.empty());
}

TEST(LevenbergMarquardt, MissingResidualsThrow)
{
  const LevenbergMarquardtMinimizer lm;
  Objective objective = MakeRosenbrock();
  objective.residuals = nullptr;
  EXPECT_THROW(lm.minimize(objective, RosenbrockStart()), std::invalid_argument);
}

// =============================================================================
// Factory and helpers
// =============================================================================

TEST(Minimizer, FactoryKeepsOptions)
{
  MinimizerOptions options;
  options.ftol = 1e-3;
  options.max_iterations = 7;

  const std::shared_ptr<Minimizer> lbfgs = Minimizer::make(MinimizerMethod::LBFGS, options);
  const std::shared_ptr<Minimizer> lm = Minimizer::make(MinimizerMethod::LEVENBERG_MARQUARDT, options);

  EXPECT_NE(dynamic_cast<LbfgsMinimizer*>(lbfgs.get()), nullptr);
  EXPECT_NE(dynamic_cast<LevenbergMarquardtMinimizer*>(lm.get()), nullptr);
  EXPECT_DOUBLE_EQ(lbfgs->options().ftol, 1e-3);
  EXPECT_EQ(lm->options().max_iterations, 7);
}

TEST(Minimizer, FiniteDifferenceGradient)
{
  Eigen::VectorXd x(2);
  x << 0.3, -1.1;
  const Eigen::VectorXd g = finite_difference_gradient([](const Eigen::VectorXd& v) {
      return std::sin(v(0)) + v(0)*v(1)*v(1);
    }, x);

  EXPECT_NEAR(g(0), std::cos(0.3) + 1.21, 1e-8);
  EXPECT_NEAR(g(1), 2.0*0.3*-1.1, 1e-8);
}
