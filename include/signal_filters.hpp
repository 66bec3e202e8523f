#ifndef SIGNAL_FILTERS_HPP
#define SIGNAL_FILTERS_HPP

#include <Eigen/Dense>

namespace pilab {

// Column-wise filters along the sample (row) axis. Each returns a new matrix
// of the same shape as its input.

/**
 * @brief Running median with a window of @p window rows, truncated at the edges.
 *
 * Odd windows are centred; even windows take one more row before the centre
 * than after it. Even-sized samples average the two middle values.
 * @throws std::invalid_argument if @p window < 1.
 */
Eigen::MatrixXd
median_filter(const Eigen::MatrixXd &data, int window);

/**
 * @brief Least-squares projection matrix of a Savitzky-Golay filter.
 *
 * Row r of the returned frame x frame matrix holds the weights that evaluate
 * the order-@p order polynomial fit of a frame at position r.
 * @throws std::invalid_argument if @p frame is not odd and positive, or
 *         @p order is negative or not below @p frame.
 */
Eigen::MatrixXd
savitzky_golay_projection(int order, int frame);

/**
 * @brief Savitzky-Golay smoothing of each column.
 *
 * The first and last (frame-1)/2 rows are evaluated from the polynomial fitted
 * to the first and last full frame respectively.
 * @throws std::invalid_argument on bad parameters or fewer than @p frame rows.
 */
Eigen::MatrixXd
savitzky_golay_filter(const Eigen::MatrixXd &data, int order, int frame);

/**
 * @brief Centres each column and scales it by its sample standard deviation
 * (n-1 normalisation). Columns with zero deviation become zero.
 */
Eigen::MatrixXd
zscore(const Eigen::MatrixXd &data);

} // namespace pilab

#endif // SIGNAL_FILTERS_HPP
