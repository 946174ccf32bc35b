#include "similarity.hpp"
#include <sstream>
#include <stdexcept>

namespace vid2slides {

namespace {

std::string describe(const cv::Mat& m) {
    std::ostringstream out;
    out << m.rows << "x" << m.cols << "x" << m.channels() << " (type " << m.type() << ")";
    return out.str();
}

} // namespace

double mean_squared_error(const cv::Mat& a, const cv::Mat& b) {
    if (a.empty() || b.empty()) {
        throw std::invalid_argument("mean_squared_error called with an empty frame");
    }
    if (a.size() != b.size() || a.type() != b.type()) {
        throw std::invalid_argument("mean_squared_error requires equally shaped frames, got " +
                                    describe(a) + " and " + describe(b));
    }

    // NORM_L2SQR accumulates in double over every channel
    double sum = cv::norm(a, b, cv::NORM_L2SQR);
    return sum / static_cast<double>(a.rows * a.cols);
}

} // namespace vid2slides
