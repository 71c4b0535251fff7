#include "minimizer.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <iostream>
#include <stdexcept>
#include <vector>


std::shared_ptr<Minimizer> Minimizer::make(MinimizerMethod method, const MinimizerOptions& options)
{
  switch (method) {
    case MinimizerMethod::LBFGS:
      return std::make_shared<LbfgsMinimizer>(options);
    case MinimizerMethod::LEVENBERG_MARQUARDT:
      return std::make_shared<LevenbergMarquardtMinimizer>(options);
  }
  throw std::invalid_argument("Method unknown");
}

Eigen::VectorXd finite_difference_gradient(const std::function<double(const Eigen::VectorXd&)>& f, const Eigen::VectorXd& x)
{
  Eigen::VectorXd g(x.size());
  Eigen::VectorXd xh = x;
  for (int i = 0; i < x.size(); i++) {
    const double h = 1e-6*std::max(1.0, std::abs(x(i)));
    xh(i) = x(i) + h;
    const double fp = f(xh);
    xh(i) = x(i) - h;
    const double fm = f(xh);
    xh(i) = x(i);
    g(i) = (fp - fm)/(2*h);
  }
  return g;
}

MinimizeResult LbfgsMinimizer::minimize(const Objective& objective, const Eigen::VectorXd& x0) const
{
  if (!objective.value)
    throw std::invalid_argument("Objective has no value function");
  if (opts.gradient == GradientSource::AUTODIFF && !objective.value_and_gradient)
    throw std::invalid_argument("Objective has no gradient, use GradientSource::FINITE_DIFFERENCE");

  int evaluations = 0;
  auto evaluate = [&](const Eigen::VectorXd& x, Eigen::VectorXd& g) -> double {
    evaluations++;
    if (opts.gradient == GradientSource::AUTODIFF)
      return objective.value_and_gradient(x, g);
    g = finite_difference_gradient(objective.value, x);
    evaluations += 2*x.size();
    return objective.value(x);
  };

  MinimizeResult res;
  res.x = x0;
  res.iterations = 0;
  res.success = false;
  res.message = "Maximum number of iterations reached";

  Eigen::VectorXd g;
  double f = evaluate(res.x, g);

  std::deque<Eigen::VectorXd> S, Y;
  std::deque<double> rho;

  if (g.lpNorm<Eigen::Infinity>() <= opts.gtol) {
    res.success = true;
    res.message = "Gradient norm below gtol";
  }

  for (int iter = 0; iter < opts.max_iterations && !res.success; iter++) {
    // two-loop recursion
    Eigen::VectorXd d = g;
    std::vector<double> alpha(S.size());
    for (int i = int(S.size()) - 1; i >= 0; i--) {
      alpha[i] = rho[i]*S[i].dot(d);
      d -= alpha[i]*Y[i];
    }
    if (!S.empty())
      d *= S.back().dot(Y.back())/Y.back().squaredNorm();
    for (size_t i = 0; i < S.size(); i++) {
      const double beta = rho[i]*Y[i].dot(d);
      d += (alpha[i] - beta)*S[i];
    }
    d = -d;

    double slope = g.dot(d);
    if (!(slope < 0)) {
      S.clear();
      Y.clear();
      rho.clear();
      d = -g;
      slope = -g.squaredNorm();
    }

    // Armijo backtracking, first step of a fresh memory has length <= 1
    double step = S.empty() ? std::min(1.0, 1.0/g.norm()) : 1.0;
    Eigen::VectorXd x_new, g_new;
    double f_new = f;
    bool accepted = false;
    for (int trial = 0; trial < 40; trial++) {
      x_new = res.x + step*d;
      f_new = evaluate(x_new, g_new);
      if (f_new <= f + 1e-4*step*slope) {
        accepted = true;
        break;
      }
      step *= 0.5;
    }
    if (!accepted) {
      res.message = "Line search failed";
      break;
    }

    const Eigen::VectorXd s = x_new - res.x;
    const Eigen::VectorXd y = g_new - g;
    const double sy = s.dot(y);
    if (sy > 1e-12) {
      S.push_back(s);
      Y.push_back(y);
      rho.push_back(1.0/sy);
      if (int(S.size()) > opts.history) {
        S.pop_front();
        Y.pop_front();
        rho.pop_front();
      }
    }

    const double reduction = (f - f_new)/std::max({std::abs(f), std::abs(f_new), 1.0});
    res.x = x_new;
    f = f_new;
    g = g_new;
    res.iterations = iter + 1;

    if (opts.verbose)
      std::cout << "lbfgs iter " << res.iterations << " f = " << f << " |g| = " << g.lpNorm<Eigen::Infinity>() << std::endl;

    if (reduction <= opts.ftol) {
      res.success = true;
      res.message = "Relative reduction of f below ftol";
    }
    else if (g.lpNorm<Eigen::Infinity>() <= opts.gtol) {
      res.success = true;
      res.message = "Gradient norm below gtol";
    }
  }

  res.fun = f;
  res.evaluations = evaluations;
  if (opts.verbose)
    std::cout << "lbfgs: " << res.message << " after " << res.iterations << " iterations" << std::endl;
  return res;
}
