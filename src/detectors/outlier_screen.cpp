#include "outlier_screen.h"
#include "utils/errors.h"
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <cmath>
#include <limits>
#include <sstream>

std::string toString(CriticalValueMethod method) {
    return method == CriticalValueMethod::StudentT ? "student_t" : "normal";
}

CriticalValueMethod parseCriticalValueMethod(const std::string& name) {
    if (name == "student_t" || name == "t") return CriticalValueMethod::StudentT;
    if (name == "normal") return CriticalValueMethod::NormalApprox;
    throw InvalidConfigurationError("screen method must be 'student_t' or 'normal', got '" + name + "'");
}

BaselineOutlierScreen::BaselineOutlierScreen(double alpha, CriticalValueMethod method)
    : alpha_(alpha), method_(method) {
    if (!(alpha_ > 0.0 && alpha_ < 1.0)) {
        std::ostringstream oss;
        oss << "Significance level must be in (0, 1), got " << alpha_;
        throw InvalidConfigurationError(oss.str());
    }
}

BaselineOutlierScreen::~BaselineOutlierScreen() {
}

double BaselineOutlierScreen::criticalValue(size_t degrees_of_freedom) const {
    if (method_ == CriticalValueMethod::StudentT) {
        boost::math::students_t dist(static_cast<double>(degrees_of_freedom));
        return boost::math::quantile(boost::math::complement(dist, alpha_ / 2.0));
    }
    boost::math::normal dist(0.0, 1.0);
    return boost::math::quantile(boost::math::complement(dist, alpha_ / 2.0));
}

double BaselineOutlierScreen::twoSidedPValue(double statistic, size_t degrees_of_freedom) const {
    double a = std::fabs(statistic);
    if (method_ == CriticalValueMethod::StudentT) {
        boost::math::students_t dist(static_cast<double>(degrees_of_freedom));
        return 2.0 * boost::math::cdf(boost::math::complement(dist, a));
    }
    boost::math::normal dist(0.0, 1.0);
    return 2.0 * boost::math::cdf(boost::math::complement(dist, a));
}

ScreenResult BaselineOutlierScreen::evaluate(const std::vector<double>& baseline, double candidate) const {
    const size_t n = baseline.size();
    if (n < 2) {
        std::ostringstream oss;
        oss << "Need at least 2 baseline points, got " << n;
        throw InsufficientDataError(oss.str());
    }
    if (!std::isfinite(candidate)) {
        std::ostringstream oss;
        oss << "Candidate value is not finite: " << candidate;
        throw InvalidInputError(oss.str());
    }

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(baseline[i])) {
            std::ostringstream oss;
            oss << "Baseline value at index " << i << " is not finite: " << baseline[i];
            throw InvalidInputError(oss.str());
        }
        sum += baseline[i];
    }
    const double mean = sum / static_cast<double>(n);

    double ss = 0.0;
    for (double v : baseline) {
        double d = v - mean;
        ss += d * d;
    }

    ScreenResult result;
    result.baseline_size = n;
    result.mean = mean;
    result.std_dev = std::sqrt(ss / static_cast<double>(n - 1));
    result.se_pred = result.std_dev * std::sqrt(1.0 + 1.0 / static_cast<double>(n));

    const size_t df = n - 1;
    result.critical_value = criticalValue(df);

    if (result.se_pred > 0.0) {
        result.statistic = (candidate - mean) / result.se_pred;
        result.p_value = twoSidedPValue(result.statistic, df);
    } else if (candidate == mean) {
        // Zero-spread baseline, candidate on the mean
        result.statistic = 0.0;
        result.p_value = 1.0;
    } else {
        result.statistic = candidate > mean ? std::numeric_limits<double>::infinity()
                                            : -std::numeric_limits<double>::infinity();
        result.p_value = 0.0;
    }

    result.lower = mean - result.critical_value * result.se_pred;
    result.upper = mean + result.critical_value * result.se_pred;
    result.outlier = (candidate < result.lower) || (candidate > result.upper);
    return result;
}
