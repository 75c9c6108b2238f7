#ifndef OUTLIER_SCREEN_H
#define OUTLIER_SCREEN_H

#include <cstddef>
#include <string>
#include <vector>

// Source of the critical value for the prediction interval.
enum class CriticalValueMethod {
    StudentT,      // t quantile with n-1 degrees of freedom
    NormalApprox   // standard normal quantile
};

std::string toString(CriticalValueMethod method);
CriticalValueMethod parseCriticalValueMethod(const std::string& name);

struct ScreenResult {
    double lower;
    double upper;
    double p_value;
    bool outlier;

    // Intermediate statistics, kept for logging
    double mean;
    double std_dev;          // sample standard deviation (n-1)
    double se_pred;          // prediction standard error
    double critical_value;
    double statistic;
    size_t baseline_size;

    ScreenResult() : lower(0.0), upper(0.0), p_value(1.0), outlier(false),
                     mean(0.0), std_dev(0.0), se_pred(0.0),
                     critical_value(0.0), statistic(0.0), baseline_size(0) {}
};

// Two-sided prediction-interval test of one new observation against a
// reference sample.
class BaselineOutlierScreen {
public:
    BaselineOutlierScreen(double alpha = 0.01,
                          CriticalValueMethod method = CriticalValueMethod::StudentT);
    ~BaselineOutlierScreen();

    // Throws InsufficientDataError when baseline has fewer than 2 points,
    // InvalidInputError on non-finite values.
    ScreenResult evaluate(const std::vector<double>& baseline, double candidate) const;

    // Critical value for the configured alpha and method
    double criticalValue(size_t degrees_of_freedom) const;

    double getAlpha() const { return alpha_; }
    CriticalValueMethod getMethod() const { return method_; }

private:
    double alpha_;
    CriticalValueMethod method_;

    double twoSidedPValue(double statistic, size_t degrees_of_freedom) const;
};

#endif // OUTLIER_SCREEN_H
