/**
 * Unit tests for the baseline outlier screen (prediction interval test).
 */

#include <iostream>
#include <cassert>
#include <vector>
#include <cmath>
#include <limits>

#include "detectors/outlier_screen.h"
#include "utils/errors.h"

using namespace std;

// Test utilities
#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_NEAR(a, b, tol) assert(abs((a) - (b)) < (tol))
#define ASSERT_THROWS(expr, type) \
    do { \
        bool thrown_ = false; \
        try { expr; } catch (const type&) { thrown_ = true; } \
        assert(thrown_); \
    } while (0)
#define TEST(name) cout << "\n[TEST] " << name << "..." << endl

void test_zero_spread_baseline() {
    TEST("Zero-spread baseline");

    BaselineOutlierScreen screen(0.01);
    vector<double> baseline = {10.0, 10.0, 10.0, 10.0};

    ScreenResult far = screen.evaluate(baseline, 50.0);
    ASSERT_TRUE(far.outlier);
    ASSERT_EQ(far.p_value, 0.0);
    ASSERT_EQ(far.lower, 10.0);
    ASSERT_EQ(far.upper, 10.0);
    cout << "  ✓ 50 flagged against [10, 10, 10, 10]" << endl;

    ScreenResult same = screen.evaluate(baseline, 10.0);
    ASSERT_TRUE(!same.outlier);
    ASSERT_EQ(same.p_value, 1.0);
    cout << "  ✓ Candidate on the mean is accepted" << endl;
}

void test_prediction_interval() {
    TEST("Prediction interval");

    BaselineOutlierScreen screen(0.01);
    vector<double> baseline = {9.0, 10.0, 11.0, 10.0, 10.0};

    ScreenResult inside = screen.evaluate(baseline, 10.5);
    ASSERT_NEAR(inside.mean, 10.0, 1e-12);
    ASSERT_NEAR(inside.std_dev, sqrt(0.5), 1e-12);
    ASSERT_NEAR(inside.se_pred, sqrt(0.5) * sqrt(1.2), 1e-12);
    ASSERT_NEAR(inside.critical_value, 4.604094871, 1e-6);
    ASSERT_EQ(inside.baseline_size, 5u);
    ASSERT_TRUE(!inside.outlier);
    ASSERT_TRUE(inside.p_value > 0.01);
    ASSERT_TRUE(inside.lower < 10.5 && 10.5 < inside.upper);
    cout << "  ✓ Interval [" << inside.lower << ", " << inside.upper << "] keeps 10.5" << endl;

    ScreenResult outside = screen.evaluate(baseline, 20.0);
    ASSERT_TRUE(outside.outlier);
    ASSERT_TRUE(outside.p_value < 0.01);
    cout << "  ✓ 20.0 rejected with p=" << outside.p_value << endl;

    // p equals alpha on the interval edge
    ScreenResult edge = screen.evaluate(baseline, inside.upper);
    ASSERT_NEAR(edge.p_value, 0.01, 1e-9);
    ASSERT_NEAR(edge.statistic, inside.critical_value, 1e-9);
    cout << "  ✓ p-value at the interval edge matches alpha" << endl;

    ScreenResult low = screen.evaluate(baseline, 0.0);
    ASSERT_TRUE(low.outlier);
    ASSERT_TRUE(low.statistic < 0.0);
    cout << "  ✓ Two-sided: low values rejected too" << endl;
}

void test_critical_values() {
    TEST("Critical values");

    BaselineOutlierScreen t_screen(0.01, CriticalValueMethod::StudentT);
    BaselineOutlierScreen z_screen(0.01, CriticalValueMethod::NormalApprox);

    ASSERT_NEAR(z_screen.criticalValue(4), 2.575829304, 1e-6);
    ASSERT_NEAR(z_screen.criticalValue(1000), 2.575829304, 1e-6);
    ASSERT_TRUE(t_screen.criticalValue(4) > z_screen.criticalValue(4));
    cout << "  ✓ t(4)=" << t_screen.criticalValue(4)
         << " wider than normal=" << z_screen.criticalValue(4) << endl;

    BaselineOutlierScreen t05(0.05);
    ASSERT_NEAR(t05.criticalValue(9), 2.262157163, 1e-6);
    BaselineOutlierScreen z05(0.05, CriticalValueMethod::NormalApprox);
    ASSERT_NEAR(z05.criticalValue(9), 1.959963985, 1e-6);
    cout << "  ✓ alpha=0.05 quantiles" << endl;

    // Same baseline, same candidate: normal is the narrower interval
    vector<double> baseline = {9.0, 10.0, 11.0, 10.0, 10.0};
    ScreenResult t_result = t_screen.evaluate(baseline, 12.5);
    ScreenResult z_result = z_screen.evaluate(baseline, 12.5);
    ASSERT_TRUE(t_result.upper > z_result.upper);
    ASSERT_TRUE(!t_result.outlier);
    ASSERT_TRUE(z_result.outlier);
    cout << "  ✓ 12.5 passes the t screen but not the normal one" << endl;
}

void test_errors() {
    TEST("Error handling");

    BaselineOutlierScreen screen(0.01);
    ASSERT_THROWS(screen.evaluate({}, 1.0), InsufficientDataError);
    ASSERT_THROWS(screen.evaluate({5.0}, 1.0), InsufficientDataError);
    cout << "  ✓ Fewer than 2 baseline points rejected" << endl;

    vector<double> pair = {1.0, 2.0};
    ASSERT_THROWS(screen.evaluate(pair, numeric_limits<double>::quiet_NaN()), InvalidInputError);
    pair[1] = numeric_limits<double>::infinity();
    ASSERT_THROWS(screen.evaluate(pair, 1.0), InvalidInputError);
    cout << "  ✓ Non-finite values rejected" << endl;

    ASSERT_THROWS(BaselineOutlierScreen bad(0.0), InvalidConfigurationError);
    ASSERT_THROWS(BaselineOutlierScreen bad(1.0), InvalidConfigurationError);
    ASSERT_THROWS(BaselineOutlierScreen bad(-0.5), InvalidConfigurationError);
    cout << "  ✓ alpha outside (0, 1) rejected" << endl;

    ASSERT_TRUE(parseCriticalValueMethod("student_t") == CriticalValueMethod::StudentT);
    ASSERT_TRUE(parseCriticalValueMethod("normal") == CriticalValueMethod::NormalApprox);
    ASSERT_THROWS(parseCriticalValueMethod("bootstrap"), InvalidConfigurationError);
    cout << "  ✓ Method names parsed" << endl;
}

int main() {
    cout << "=" << string(80, '=') << endl;
    cout << "Outlier Screen Unit Tests" << endl;
    cout << "=" << string(80, '=') << endl;

    try {
        test_zero_spread_baseline();
        test_prediction_interval();
        test_critical_values();
        test_errors();

        cout << "\n" << string(80, '=') << endl;
        cout << "All Outlier Screen Tests PASSED!" << endl;
        cout << string(80, '=') << endl;
        return 0;
    } catch (const exception& e) {
        cerr << "\n❌ TEST FAILED: " << e.what() << endl;
        return 1;
    }
}
