#include "minimizer.hpp"

#include <iostream>
#include <stdexcept>
#include <unsupported/Eigen/LevenbergMarquardt>
#include <unsupported/Eigen/NumericalDiff>


struct ResidualFunctor : Eigen::DenseFunctor<double>{
  ResidualFunctor(const Objective& objective, int n_inputs, int n_values)
    : Eigen::DenseFunctor<double>(n_inputs, n_values), objective(objective) {}

  int operator()(const Eigen::VectorXd& x, Eigen::VectorXd& fvec) const {
    fvec = objective.residuals(x);
    return 0;
  }

  const Objective& objective;
};

static const char* status_message(Eigen::LevenbergMarquardtSpace::Status status)
{
  switch (status) {
    case Eigen::LevenbergMarquardtSpace::ImproperInputParameters:
      return "Improper input parameters (fewer residuals than unknowns)";
    case Eigen::LevenbergMarquardtSpace::RelativeReductionTooSmall:
      return "Relative reduction of f below ftol";
    case Eigen::LevenbergMarquardtSpace::RelativeErrorTooSmall:
      return "Relative change of x below xtol";
    case Eigen::LevenbergMarquardtSpace::RelativeErrorAndReductionTooSmall:
      return "Relative reduction of f and change of x below tolerance";
    case Eigen::LevenbergMarquardtSpace::CosinusTooSmall:
      return "Residuals orthogonal to the Jacobian columns";
    case Eigen::LevenbergMarquardtSpace::TooManyFunctionEvaluation:
      return "Maximum number of function evaluations reached";
    default:
      return "Tolerances too small, no further reduction possible";
  }
}

MinimizeResult LevenbergMarquardtMinimizer::minimize(const Objective& objective, const Eigen::VectorXd& x0) const
{
  if (!objective.residuals)
    throw std::invalid_argument("Levenberg-Marquardt needs an objective with residuals");

  const int n_values = objective.residuals(x0).size();
  ResidualFunctor functor(objective, x0.size(), n_values);
  Eigen::NumericalDiff<ResidualFunctor> numdiff(functor);
  Eigen::LevenbergMarquardt<Eigen::NumericalDiff<ResidualFunctor>> lm(numdiff);
  lm.setFtol(opts.ftol);
  lm.setGtol(opts.gtol);
  lm.setMaxfev(opts.max_iterations);

  MinimizeResult res;
  res.x = x0;
  const Eigen::LevenbergMarquardtSpace::Status status = lm.minimize(res.x);

  res.fun = objective.residuals(res.x).squaredNorm();
  res.iterations = lm.iterations();
  res.evaluations = lm.nfev();
  res.success = status == Eigen::LevenbergMarquardtSpace::RelativeReductionTooSmall
             || status == Eigen::LevenbergMarquardtSpace::RelativeErrorTooSmall
             || status == Eigen::LevenbergMarquardtSpace::RelativeErrorAndReductionTooSmall
             || status == Eigen::LevenbergMarquardtSpace::CosinusTooSmall;
  res.message = status_message(status);
  if (opts.verbose)
    std::cout << "levenberg-marquardt: " << res.message << " f = " << res.fun
              << " after " << res.iterations << " iterations" << std::endl;
  return res;
}
