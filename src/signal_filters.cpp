#include "signal_filters.hpp"

#include <algorithm> // For std::sort
#include <cmath>     // For std::sqrt
#include <stdexcept>
#include <string>
#include <vector>

namespace pilab {

namespace {

double
median_of(std::vector<double> &values) {
    std::sort(values.begin(), values.end());
    const std::size_t n = values.size();
    if (n % 2 == 1) { return values[n / 2]; }
    return 0.5 * (values[n / 2 - 1] + values[n / 2]);
}

} // namespace

Eigen::MatrixXd
median_filter(const Eigen::MatrixXd &data, int window) {
    if (window < 1) {
        throw std::invalid_argument("Median filter window must be positive, got " + std::to_string(window) + ".");
    }

    const Eigen::Index n = data.rows();
    const Eigen::Index before = window / 2;
    const Eigen::Index after = window - 1 - before;

    Eigen::MatrixXd out(data.rows(), data.cols());
    std::vector<double> buffer;
    buffer.reserve(static_cast<std::size_t>(window));
    for (Eigen::Index c = 0; c < data.cols(); ++c) {
        for (Eigen::Index r = 0; r < n; ++r) {
            const Eigen::Index lo = std::max<Eigen::Index>(0, r - before);
            const Eigen::Index hi = std::min<Eigen::Index>(n - 1, r + after);
            buffer.clear();
            for (Eigen::Index k = lo; k <= hi; ++k) { buffer.push_back(data(k, c)); }
            out(r, c) = median_of(buffer);
        }
    }
    return out;
}

Eigen::MatrixXd
savitzky_golay_projection(int order, int frame) {
    if (frame < 1 || frame % 2 == 0) {
        throw std::invalid_argument("Savitzky-Golay frame size must be odd and positive, got " +
                                    std::to_string(frame) + ".");
    }
    if (order < 0 || order >= frame) {
        throw std::invalid_argument("Savitzky-Golay order must be in [0, frame), got " + std::to_string(order) + ".");
    }

    const int half = (frame - 1) / 2;
    Eigen::MatrixXd vandermonde(frame, order + 1);
    for (int i = 0; i < frame; ++i) {
        const double t = static_cast<double>(i - half);
        double p = 1.0;
        for (int j = 0; j <= order; ++j) {
            vandermonde(i, j) = p;
            p *= t;
        }
    }

    // pinv(V) via QR, then B = V * pinv(V)
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(vandermonde);
    Eigen::MatrixXd pseudo_inverse = qr.solve(Eigen::MatrixXd::Identity(frame, frame));
    return vandermonde * pseudo_inverse;
}

Eigen::MatrixXd
savitzky_golay_filter(const Eigen::MatrixXd &data, int order, int frame) {
    Eigen::MatrixXd projection = savitzky_golay_projection(order, frame);
    const Eigen::Index n = data.rows();
    if (n < frame) {
        throw std::invalid_argument("Savitzky-Golay filter needs at least " + std::to_string(frame) +
                                    " samples, got " + std::to_string(n) + ".");
    }
    const Eigen::Index half = (frame - 1) / 2;

    Eigen::MatrixXd out(data.rows(), data.cols());
    out.topRows(half) = projection.topRows(half) * data.topRows(frame);
    out.bottomRows(half) = projection.bottomRows(half) * data.bottomRows(frame);
    const Eigen::RowVectorXd centre = projection.row(half);
    for (Eigen::Index r = half; r < n - half; ++r) { out.row(r) = centre * data.middleRows(r - half, frame); }
    return out;
}

Eigen::MatrixXd
zscore(const Eigen::MatrixXd &data) {
    const Eigen::Index n = data.rows();
    Eigen::MatrixXd out(data.rows(), data.cols());
    if (n == 0) { return out; }

    for (Eigen::Index c = 0; c < data.cols(); ++c) {
        const double mean = data.col(c).mean();
        double sigma = 0.0;
        if (n > 1) { sigma = std::sqrt((data.col(c).array() - mean).square().sum() / static_cast<double>(n - 1)); }
        if (sigma == 0.0) { sigma = 1.0; }
        out.col(c) = (data.col(c).array() - mean) / sigma;
    }
    return out;
}

} // namespace pilab
