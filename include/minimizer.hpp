#pragma once

#include <Eigen/Core>
#include <functional>
#include <memory>
#include <string>

enum class MinimizerMethod{
  LBFGS,
  LEVENBERG_MARQUARDT
};

enum class GradientSource{
  AUTODIFF,
  FINITE_DIFFERENCE
};

// Scalar objective over a flat vector. value is required; value_and_gradient
// is used with GradientSource::AUTODIFF, residuals by least-squares methods
// (value == residuals.squaredNorm()).
struct Objective{
  std::function<double(const Eigen::VectorXd&)> value;
  std::function<double(const Eigen::VectorXd&, Eigen::VectorXd&)> value_and_gradient;
  std::function<Eigen::VectorXd(const Eigen::VectorXd&)> residuals;
};

struct MinimizerOptions{
  GradientSource gradient = GradientSource::AUTODIFF;
  // stop when (f_k - f_k+1)/max(|f_k|, |f_k+1|, 1) <= ftol
  double ftol = 1e-5;
  // stop when max|g| <= gtol
  double gtol = 1e-5;
  int max_iterations = 15000;
  // number of correction pairs kept by L-BFGS
  int history = 10;
  bool verbose = false;
};

struct MinimizeResult{
  Eigen::VectorXd x;
  double fun;
  int iterations;
  int evaluations;
  bool success;
  std::string message;
};

class Minimizer{
public:
  virtual ~Minimizer() {}

  // Non-convergence is reported through MinimizeResult::success, the last
  // iterate is returned in any case.
  virtual MinimizeResult minimize(const Objective& objective, const Eigen::VectorXd& x0) const = 0;

  const MinimizerOptions& options() const { return opts; }

  static std::shared_ptr<Minimizer> make(MinimizerMethod method, const MinimizerOptions& options = MinimizerOptions());

protected:
  explicit Minimizer(const MinimizerOptions& options) : opts(options) {}

  MinimizerOptions opts;
};

// limited memory BFGS with Armijo backtracking
class LbfgsMinimizer : public Minimizer{
public:
  explicit LbfgsMinimizer(const MinimizerOptions& options = MinimizerOptions()) : Minimizer(options) {}

  MinimizeResult minimize(const Objective& objective, const Eigen::VectorXd& x0) const override;
};

// Eigen's Levenberg-Marquardt on Objective::residuals, forward difference Jacobian
class LevenbergMarquardtMinimizer : public Minimizer{
public:
  explicit LevenbergMarquardtMinimizer(const MinimizerOptions& options = MinimizerOptions()) : Minimizer(options) {}

  MinimizeResult minimize(const Objective& objective, const Eigen::VectorXd& x0) const override;
};

// central differences of f
Eigen::VectorXd finite_difference_gradient(const std::function<double(const Eigen::VectorXd&)>& f, const Eigen::VectorXd& x);
