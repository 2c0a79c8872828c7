#pragma once
#include <Eigen/Dense>
#include <limits>

namespace clumpfit {
	using Real    = double;
	using Vector  = Eigen::VectorXd;
	using Matrix  = Eigen::MatrixXd;
	using Vector6 = Eigen::Matrix<double, 6, 1>;
	using Matrix6 = Eigen::Matrix<double, 6, 6>;

	inline constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
} // namespace clumpfit
