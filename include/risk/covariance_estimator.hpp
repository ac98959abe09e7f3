// covariance_estimator.hpp
// Covariance Estimators for the Rolling Minimum-Variance Backtester
// Sample and Ledoit-Wolf shrinkage estimators as a tagged variant with one shared contract

#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <variant>
#include <vector>
#include <Eigen/Dense>
#include "../core/exceptions.hpp"
#include "../core/types.hpp"
#include "../data/return_series.hpp"

namespace minvar {

// ============================================================================
// Estimate: matrix plus diagnostic (shrinkage intensity, 0 for Sample)
// ============================================================================

struct CovarianceEstimate {
    CovarianceMethod method = CovarianceMethod::SAMPLE;
    Eigen::MatrixXd matrix;
    double diagnostic = 0.0;
    double condition_number = std::numeric_limits<double>::infinity();
    ErrorKind error = ErrorKind::NONE;

    bool ok() const { return error == ErrorKind::NONE; }
};

namespace detail {

inline Eigen::MatrixXd demean(const Eigen::MatrixXd& returns) {
    Eigen::RowVectorXd means = returns.colwise().mean();
    return returns.rowwise() - means;
}

inline Eigen::MatrixXd symmetrize(const Eigen::MatrixXd& m) {
    return 0.5 * (m + m.transpose());
}

// Ratio of extreme eigenvalues; infinity when the smallest is not positive
inline double conditionNumber(const Eigen::MatrixXd& m, double& min_eig, double& max_eig) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(m, Eigen::EigenvaluesOnly);
    if (solver.info() != Eigen::Success) {
        min_eig = 0.0;
        max_eig = 0.0;
        return std::numeric_limits<double>::infinity();
    }
    min_eig = solver.eigenvalues().minCoeff();
    max_eig = solver.eigenvalues().maxCoeff();
    if (max_eig <= 0.0 || min_eig <= 1e-12 * max_eig) {
        return std::numeric_limits<double>::infinity();
    }
    return max_eig / min_eig;
}

} // namespace detail

// ============================================================================
// Sample Covariance (unbiased, T - 1 normalization)
// ============================================================================

struct SampleCovariance {
    static constexpr CovarianceMethod method = CovarianceMethod::SAMPLE;

    CovarianceEstimate estimate(const Eigen::MatrixXd& returns) const {
        CovarianceEstimate result;
        result.method = method;
        result.diagnostic = 0.0;

        const Eigen::Index T = returns.rows();
        const Eigen::Index N = returns.cols();
        if (T < 2 || N == 0 || !returns.allFinite()) {
            result.matrix = Eigen::MatrixXd::Zero(N, N);
            result.error = ErrorKind::SINGULAR_COVARIANCE;
            return result;
        }

        Eigen::MatrixXd centered = detail::demean(returns);
        result.matrix = detail::symmetrize(centered.transpose() * centered /
                                           static_cast<double>(T - 1));

        double min_eig = 0.0, max_eig = 0.0;
        result.condition_number = detail::conditionNumber(result.matrix, min_eig, max_eig);

        // Rank is at most T - 1, so T <= N is singular regardless of the data
        if (T <= N || !std::isfinite(result.condition_number)) {
            result.error = ErrorKind::SINGULAR_COVARIANCE;
        }
        return result;
    }
};

// ============================================================================
// Ledoit-Wolf Shrinkage toward mu * I
// ============================================================================

struct ShrinkageCovariance {
    static constexpr CovarianceMethod method = CovarianceMethod::SHRINKAGE;

    // lambda = min(beta, delta) / delta
    //   S     = X'X / T on demeaned X
    //   mu    = tr(S) / N
    //   delta = ||S - mu I||^2 / N
    //   beta  = sum_t ||x_t x_t' - S||^2 / (T^2 N)
    static double intensity(const Eigen::MatrixXd& centered, const Eigen::MatrixXd& S, double mu) {
        const double T = static_cast<double>(centered.rows());
        const double N = static_cast<double>(centered.cols());

        Eigen::MatrixXd target_gap = S;
        target_gap.diagonal().array() -= mu;
        double delta = target_gap.squaredNorm() / N;

        // sum_t ||x_t x_t' - S||^2 = sum_t ||x_t||^4 - T ||S||^2
        double fourth = centered.rowwise().squaredNorm().array().square().sum();
        double beta = (fourth - T * S.squaredNorm()) / (T * T * N);
        beta = std::max(0.0, std::min(beta, delta));

        if (delta <= 0.0) return 0.0;
        return std::max(0.0, std::min(1.0, beta / delta));
    }

    CovarianceEstimate estimate(const Eigen::MatrixXd& returns) const {
        CovarianceEstimate result;
        result.method = method;

        const Eigen::Index T = returns.rows();
        const Eigen::Index N = returns.cols();
        if (T < 1 || N == 0 || !returns.allFinite()) {
            result.matrix = Eigen::MatrixXd::Zero(N, N);
            result.error = ErrorKind::SINGULAR_COVARIANCE;
            return result;
        }

        Eigen::MatrixXd centered = detail::demean(returns);
        Eigen::MatrixXd S = detail::symmetrize(centered.transpose() * centered /
                                               static_cast<double>(T));
        double mu = S.trace() / static_cast<double>(N);

        double lambda = intensity(centered, S, mu);
        Eigen::MatrixXd shrunk = (1.0 - lambda) * S;
        shrunk.diagonal().array() += lambda * mu;

        result.matrix = detail::symmetrize(shrunk);
        result.diagnostic = lambda;

        double min_eig = 0.0, max_eig = 0.0;
        result.condition_number = detail::conditionNumber(result.matrix, min_eig, max_eig);
        // Only a window with no variance at all leaves the shrunk matrix singular
        if (mu <= 0.0 || !std::isfinite(result.condition_number)) {
            result.error = ErrorKind::SINGULAR_COVARIANCE;
        }
        return result;
    }
};

// ============================================================================
// Variant and Dispatch
// ============================================================================

using CovarianceEstimator = std::variant<SampleCovariance, ShrinkageCovariance>;

inline CovarianceEstimator makeEstimator(CovarianceMethod method) {
    if (method == CovarianceMethod::SHRINKAGE) return ShrinkageCovariance{};
    return SampleCovariance{};
}

class CovarianceDispatcher {
private:
    const Eigen::MatrixXd& returns_;

public:
    explicit CovarianceDispatcher(const Eigen::MatrixXd& returns) : returns_(returns) {}

    CovarianceEstimate operator()(const SampleCovariance& e) const { return e.estimate(returns_); }
    CovarianceEstimate operator()(const ShrinkageCovariance& e) const { return e.estimate(returns_); }
};

inline CovarianceEstimate estimateCovariance(const CovarianceEstimator& estimator,
                                             const Eigen::MatrixXd& returns) {
    return std::visit(CovarianceDispatcher(returns), estimator);
}

inline CovarianceEstimate estimateCovariance(CovarianceMethod method,
                                             const Eigen::MatrixXd& returns) {
    return estimateCovariance(makeEstimator(method), returns);
}

// ============================================================================
// Window Preparation
// ============================================================================

// Gather the eligible columns of a window; gaps are filled with the column's window mean
inline Eigen::MatrixXd completeWindow(const Eigen::MatrixXd& window,
                                      const std::vector<size_t>& columns) {
    Eigen::MatrixXd out(window.rows(), static_cast<Eigen::Index>(columns.size()));
    for (size_t j = 0; j < columns.size(); ++j) {
        const Eigen::Index c = static_cast<Eigen::Index>(columns[j]);
        double sum = 0.0;
        size_t count = 0;
        for (Eigen::Index r = 0; r < window.rows(); ++r) {
            double v = window(r, c);
            if (!ReturnSeries::isMissing(v)) {
                sum += v;
                ++count;
            }
        }
        double fill = count > 0 ? sum / static_cast<double>(count) : 0.0;
        for (Eigen::Index r = 0; r < window.rows(); ++r) {
            double v = window(r, c);
            out(r, static_cast<Eigen::Index>(j)) = ReturnSeries::isMissing(v) ? fill : v;
        }
    }
    return out;
}

} // namespace minvar
