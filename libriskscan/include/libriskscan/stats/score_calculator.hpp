#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace libriskscan {
namespace stats {

/**
 * Trailing window statistics for a series
 *
 * Entry i describes the `window` points ending at (and including) point i.
 * The first window - 1 entries are NaN.
 */
struct RollingStatistics {
	Eigen::VectorXd mean;
	Eigen::VectorXd std_dev;
	size_t window = 0;
};

/**
 * Standardized Score Calculator
 *
 * score = (x - mean) / stddev, using the sample standard deviation
 * (divisor n - 1) for both the whole-population and the rolling case.
 *
 * The two degenerate cases differ:
 * - ZScores(): a constant population scores every value 0
 *   ("no deviation observed").
 * - RollingScores(): a window without a usable deviation gives NaN
 *   ("cannot evaluate"), which callers must exclude from flagging.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class ScoreCalculator {
public:
	/// Arithmetic mean; NaN for an empty vector
	static double Mean(const Eigen::VectorXd &values);

	/// Sample standard deviation (n - 1); NaN when fewer than two values
	static double SampleStdDev(const Eigen::VectorXd &values);

	/**
	 * True when every value is identical
	 *
	 * Compares max and min; rounding in the mean can leave a tiny non-zero
	 * deviation for a constant column.
	 */
	static bool IsConstant(const Eigen::VectorXd &values);

	/// Non-NaN entries of `values`, in order
	static Eigen::VectorXd Observed(const Eigen::VectorXd &values);

	/**
	 * Standardized scores against the column's own population
	 *
	 * Missing values (NaN) are left out of the mean and deviation and score NaN.
	 *
	 * @param values Column (may be empty, giving an empty result)
	 * @return Scores, all 0 when the observed values are constant or only one
	 */
	static Eigen::VectorXd ZScores(const Eigen::VectorXd &values);

	/**
	 * Standardized scores against a reference population
	 *
	 * @param values Values to score
	 * @param population Reference population (size >= 1); NaN entries are ignored
	 * @return Same-length scores, 0 when the population is constant, NaN when
	 *         the population has no observed value
	 * @throws std::invalid_argument if the population is empty
	 */
	static Eigen::VectorXd ZScores(const Eigen::VectorXd &values, const Eigen::VectorXd &population);

	/**
	 * Trailing rolling mean and sample standard deviation
	 *
	 * A window containing a missing value has NaN statistics.
	 *
	 * @param values Series in chronological order
	 * @param window Number of points per window (>= 2)
	 * @throws std::invalid_argument if window < 2
	 */
	static RollingStatistics Rolling(const Eigen::VectorXd &values, size_t window);

	/**
	 * Scores against the trailing rolling baseline
	 *
	 * NaN where the window is incomplete or its standard deviation is zero.
	 */
	static Eigen::VectorXd RollingScores(const Eigen::VectorXd &values, size_t window);

	/// Scores from precomputed rolling statistics
	static Eigen::VectorXd RollingScores(const Eigen::VectorXd &values, const RollingStatistics &rolling);

	/**
	 * Largest |score| a trailing window can produce
	 *
	 * Because the scored point is part of its own window, the sample
	 * deviation bounds the score by (window - 1) / sqrt(window).
	 */
	static double MaxAttainableRollingScore(size_t window);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double ScoreCalculator::Mean(const Eigen::VectorXd &values) {
	if (values.size() == 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return values.mean();
}

inline double ScoreCalculator::SampleStdDev(const Eigen::VectorXd &values) {
	const Eigen::Index n = values.size();
	if (n < 2) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double mean = values.mean();
	const double ss = (values.array() - mean).square().sum();
	return std::sqrt(ss / static_cast<double>(n - 1));
}

inline bool ScoreCalculator::IsConstant(const Eigen::VectorXd &values) {
	if (values.size() < 2) {
		return true;
	}
	return values.maxCoeff() == values.minCoeff();
}

inline Eigen::VectorXd ScoreCalculator::Observed(const Eigen::VectorXd &values) {
	Eigen::VectorXd observed(values.size());
	Eigen::Index count = 0;
	for (Eigen::Index i = 0; i < values.size(); i++) {
		if (!std::isnan(values(i))) {
			observed(count++) = values(i);
		}
	}
	observed.conservativeResize(count);
	return observed;
}

inline Eigen::VectorXd ScoreCalculator::ZScores(const Eigen::VectorXd &values) {
	if (values.size() == 0) {
		return Eigen::VectorXd();
	}
	return ZScores(values, values);
}

inline Eigen::VectorXd ScoreCalculator::ZScores(const Eigen::VectorXd &values, const Eigen::VectorXd &population) {
	if (population.size() == 0) {
		throw std::invalid_argument("Reference population must contain at least one value");
	}

	const double nan = std::numeric_limits<double>::quiet_NaN();
	const Eigen::VectorXd observed = Observed(population);
	if (observed.size() == 0) {
		return Eigen::VectorXd::Constant(values.size(), nan);
	}

	const double mean = observed.mean();
	const double std_dev = IsConstant(observed) ? 0.0 : SampleStdDev(observed);

	// Constant population: no deviation observed, missing values stay missing
	if (std_dev == 0.0) {
		return values.unaryExpr([nan](double v) { return std::isnan(v) ? nan : 0.0; });
	}
	return ((values.array() - mean) / std_dev).matrix();
}

inline RollingStatistics ScoreCalculator::Rolling(const Eigen::VectorXd &values, size_t window) {
	if (window < 2) {
		throw std::invalid_argument("Rolling window must contain at least 2 points (got " + std::to_string(window) +
		                            ")");
	}

	const Eigen::Index n = values.size();
	const auto w = static_cast<Eigen::Index>(window);
	const double nan = std::numeric_limits<double>::quiet_NaN();

	RollingStatistics result;
	result.window = window;
	result.mean = Eigen::VectorXd::Constant(n, nan);
	result.std_dev = Eigen::VectorXd::Constant(n, nan);

	for (Eigen::Index i = w - 1; i < n; i++) {
		Eigen::VectorXd slice = values.segment(i - w + 1, w);
		if (slice.hasNaN()) {
			continue;
		}
		result.mean(i) = slice.mean();
		result.std_dev(i) = IsConstant(slice) ? 0.0 : SampleStdDev(slice);
	}
	return result;
}

inline Eigen::VectorXd ScoreCalculator::RollingScores(const Eigen::VectorXd &values, size_t window) {
	return RollingScores(values, Rolling(values, window));
}

inline Eigen::VectorXd ScoreCalculator::RollingScores(const Eigen::VectorXd &values,
                                                      const RollingStatistics &rolling) {
	const Eigen::Index n = values.size();
	if (rolling.mean.size() != n || rolling.std_dev.size() != n) {
		throw std::invalid_argument("Rolling statistics do not match the series length");
	}

	Eigen::VectorXd scores = Eigen::VectorXd::Constant(n, std::numeric_limits<double>::quiet_NaN());
	for (Eigen::Index i = 0; i < n; i++) {
		const double sd = rolling.std_dev(i);
		// Incomplete window (NaN) or flat window: not comparable
		if (std::isnan(sd) || sd == 0.0) {
			continue;
		}
		scores(i) = (values(i) - rolling.mean(i)) / sd;
	}
	return scores;
}

inline double ScoreCalculator::MaxAttainableRollingScore(size_t window) {
	if (window < 2) {
		return 0.0;
	}
	const auto w = static_cast<double>(window);
	return (w - 1.0) / std::sqrt(w);
}

} // namespace stats
} // namespace libriskscan
