// min_variance_optimizer.hpp
// Box-Constrained Minimum-Variance Optimizer for the Rolling Minimum-Variance Backtester
// Primal active-set QP: minimize 1/2 w'Sw - tilt * mu'w  s.t.  sum(w) = 1, lb <= w <= ub

#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "../core/exceptions.hpp"
#include "../core/types.hpp"

namespace minvar {

// ============================================================================
// Optimization Result
// ============================================================================

struct OptimizationResult {
    Eigen::VectorXd weights;
    double variance = 0.0;
    size_t iterations = 0;
    size_t active_constraints = 0;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    bool ok() const { return error == ErrorKind::NONE; }
};

// ============================================================================
// Minimum-Variance Optimizer
// ============================================================================

class MinVarianceOptimizer {
public:
    struct OptimizerConfig {
        size_t max_iterations;         // 0 means 50 * N + 100
        double step_tolerance;
        double multiplier_tolerance;
        double ridge;                  // Relative to mean variance
        double return_tilt;            // Weight on the expected-return term

        OptimizerConfig()
            : max_iterations(0)
            , step_tolerance(1e-12)
            , multiplier_tolerance(1e-12)
            , ridge(1e-10)
            , return_tilt(0.0) {}

        static OptimizerConfig getDefault() {
            return OptimizerConfig();
        }
    };

private:
    enum class Bound : int { FREE = 0, LOWER = 1, UPPER = 2 };

    OptimizerConfig config_;

    static OptimizationResult failure(ErrorKind kind, const std::string& msg, size_t iterations = 0) {
        OptimizationResult r;
        r.error = kind;
        r.message = msg;
        r.iterations = iterations;
        return r;
    }

    // Equality-constrained step over the free set:
    //   min 1/2 p'H_FF p + g_F'p  s.t.  sum(p_F) = 0
    //   p_F = -H^-1 (g_F + nu 1),  nu = -(1'H^-1 g_F) / (1'H^-1 1)
    static bool solveFreeStep(const Eigen::MatrixXd& H, const Eigen::VectorXd& g,
                              const std::vector<Eigen::Index>& free_idx,
                              Eigen::VectorXd& step, double& nu) {
        const Eigen::Index m = static_cast<Eigen::Index>(free_idx.size());
        Eigen::MatrixXd H_ff(m, m);
        Eigen::VectorXd g_f(m);
        for (Eigen::Index a = 0; a < m; ++a) {
            g_f(a) = g(free_idx[a]);
            for (Eigen::Index b = 0; b < m; ++b) {
                H_ff(a, b) = H(free_idx[a], free_idx[b]);
            }
        }

        Eigen::LDLT<Eigen::MatrixXd> ldlt(H_ff);
        if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) return false;

        Eigen::VectorXd ones = Eigen::VectorXd::Ones(m);
        Eigen::VectorXd h_inv_g = ldlt.solve(g_f);
        Eigen::VectorXd h_inv_1 = ldlt.solve(ones);
        double denom = ones.dot(h_inv_1);
        if (!std::isfinite(denom) || denom <= 0.0) return false;

        nu = -ones.dot(h_inv_g) / denom;
        Eigen::VectorXd p_f = -(h_inv_g + nu * h_inv_1);
        if (!p_f.allFinite()) return false;

        step = Eigen::VectorXd::Zero(g.size());
        for (Eigen::Index a = 0; a < m; ++a) step(free_idx[a]) = p_f(a);
        return true;
    }

public:
    MinVarianceOptimizer() : config_(OptimizerConfig::getDefault()) {}
    explicit MinVarianceOptimizer(const OptimizerConfig& config) : config_(config) {}

    const OptimizerConfig& config() const { return config_; }

    OptimizationResult optimize(const Eigen::MatrixXd& covariance,
                                const Constraints& constraints,
                                const std::optional<Eigen::VectorXd>& expected_returns = std::nullopt) const {
        const Eigen::Index n = covariance.rows();
        if (n == 0 || covariance.cols() != n) {
            return failure(ErrorKind::OPTIMIZATION_NON_CONVERGENCE, "Covariance matrix must be square and non-empty");
        }
        if (!covariance.allFinite()) {
            return failure(ErrorKind::OPTIMIZATION_NON_CONVERGENCE, "Covariance matrix has non-finite entries");
        }
        if (expected_returns && (expected_returns->size() != n || !expected_returns->allFinite())) {
            return failure(ErrorKind::OPTIMIZATION_NON_CONVERGENCE, "Expected-return vector is malformed");
        }

        const double lb = constraints.lowerBound();
        const double ub = constraints.upperBound();
        if (!constraints.feasibleFor(static_cast<size_t>(n))) {
            return failure(ErrorKind::INFEASIBLE,
                           "Bounds [" + std::to_string(lb) + ", " + std::to_string(ub) +
                           "] cannot sum to one over " + std::to_string(n) + " assets");
        }

        // Small relative ridge keeps the reduced Hessian factorizable on near-singular inputs
        Eigen::MatrixXd H = 0.5 * (covariance + covariance.transpose());
        double mean_var = std::max(H.diagonal().mean(), 0.0);
        double ridge = config_.ridge * (mean_var > 0.0 ? mean_var : 1.0);
        H.diagonal().array() += ridge;

        Eigen::VectorXd c = Eigen::VectorXd::Zero(n);
        if (expected_returns && config_.return_tilt != 0.0) {
            c = config_.return_tilt * (*expected_returns);
        }

        // Equal weight is feasible whenever the bounds are
        Eigen::VectorXd w = Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
        std::vector<Bound> state(static_cast<size_t>(n), Bound::FREE);
        const double bound_tol = 1e-12;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (std::abs(w(i) - lb) <= bound_tol) { state[i] = Bound::LOWER; w(i) = lb; }
            else if (std::abs(w(i) - ub) <= bound_tol) { state[i] = Bound::UPPER; w(i) = ub; }
        }

        const size_t max_iter = config_.max_iterations > 0
            ? config_.max_iterations
            : 50 * static_cast<size_t>(n) + 100;

        size_t iter = 0;
        bool at_subproblem_min = false;
        for (; iter < max_iter; ++iter) {
            Eigen::VectorXd g = H * w - c;

            std::vector<Eigen::Index> free_idx;
            for (Eigen::Index i = 0; i < n; ++i) {
                if (state[i] == Bound::FREE) free_idx.push_back(i);
            }

            Eigen::VectorXd p = Eigen::VectorXd::Zero(n);
            double nu = 0.0;

            if (!free_idx.empty()) {
                if (!solveFreeStep(H, g, free_idx, p, nu)) {
                    return failure(ErrorKind::OPTIMIZATION_NON_CONVERGENCE,
                                   "Reduced KKT system could not be factorized", iter);
                }
            } else {
                // Every variable sits on a bound: pick nu closest to satisfying all multipliers
                double nu_lo = -std::numeric_limits<double>::infinity();
                double nu_hi = std::numeric_limits<double>::infinity();
                for (Eigen::Index i = 0; i < n; ++i) {
                    if (state[i] == Bound::LOWER) nu_lo = std::max(nu_lo, -g(i));
                    else nu_hi = std::min(nu_hi, -g(i));
                }
                nu = std::isfinite(nu_lo) ? nu_lo : nu_hi;
            }

            // A full unblocked step lands on the working-set minimizer; recomputed steps there are round-off
            double step_scale = std::max(1.0, w.cwiseAbs().maxCoeff());
            if (at_subproblem_min || p.cwiseAbs().maxCoeff() <= config_.step_tolerance * step_scale) {
                at_subproblem_min = false;
                // Stationary on the working set: check bound multipliers z_i = g_i + nu
                Eigen::Index release = -1;
                double worst = config_.multiplier_tolerance *
                               std::max(1.0, g.cwiseAbs().maxCoeff());
                for (Eigen::Index i = 0; i < n; ++i) {
                    double z = g(i) + nu;
                    double violation = 0.0;
                    if (state[i] == Bound::LOWER) violation = -z;
                    else if (state[i] == Bound::UPPER) violation = z;
                    if (violation > worst) {
                        worst = violation;
                        release = i;
                    }
                }
                if (release < 0) break;  // KKT satisfied
                state[release] = Bound::FREE;
                continue;
            }

            // Longest feasible step along p; lowest index wins ties
            double alpha = 1.0;
            Eigen::Index blocking = -1;
            Bound blocking_bound = Bound::FREE;
            for (Eigen::Index i : free_idx) {
                if (p(i) < 0.0) {
                    double a = (lb - w(i)) / p(i);
                    if (a < alpha) { alpha = a; blocking = i; blocking_bound = Bound::LOWER; }
                } else if (p(i) > 0.0) {
                    double a = (ub - w(i)) / p(i);
                    if (a < alpha) { alpha = a; blocking = i; blocking_bound = Bound::UPPER; }
                }
            }
            alpha = std::max(alpha, 0.0);

            w += alpha * p;
            if (blocking >= 0) {
                state[blocking] = blocking_bound;
                w(blocking) = blocking_bound == Bound::LOWER ? lb : ub;
            } else {
                at_subproblem_min = true;
            }
        }

        if (iter >= max_iter) {
            return failure(ErrorKind::OPTIMIZATION_NON_CONVERGENCE,
                           "Active-set iteration limit reached (" + std::to_string(max_iter) + ")", iter);
        }

        // Remove round-off outside the box
        for (Eigen::Index i = 0; i < n; ++i) w(i) = std::min(ub, std::max(lb, w(i)));
        if (!w.allFinite() || std::abs(w.sum() - 1.0) > 1e-8) {
            return failure(ErrorKind::OPTIMIZATION_NON_CONVERGENCE,
                           "Solution violates the budget constraint", iter);
        }

        OptimizationResult result;
        result.weights = w;
        result.variance = w.dot(covariance * w);
        result.iterations = iter;
        result.active_constraints = static_cast<size_t>(
            std::count_if(state.begin(), state.end(), [](Bound b) { return b != Bound::FREE; }));
        return result;
    }

    // Unconstrained-box convenience: analytic GMV weights S^-1 1 / 1'S^-1 1
    static std::optional<Eigen::VectorXd> globalMinimumVariance(const Eigen::MatrixXd& covariance) {
        Eigen::LDLT<Eigen::MatrixXd> ldlt(covariance);
        if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) return std::nullopt;
        Eigen::VectorXd x = ldlt.solve(Eigen::VectorXd::Ones(covariance.rows()));
        double s = x.sum();
        if (!std::isfinite(s) || std::abs(s) < 1e-300) return std::nullopt;
        return Eigen::VectorXd(x / s);
    }
};

} // namespace minvar
