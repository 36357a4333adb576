#include "testing.h"
#include <AbcPop/AbcUtil.h>

#include <cmath>
#include <gsl/gsl_rng.h>

using namespace ABCPOP;

void series_median() {
    Col odd(3), even(4);
    odd << 3, 1, 2;
    even << 4, 1, 3, 2;
    IS_TRUE(median(odd) == 2);
    IS_TRUE(median(even) == 2.5);

    Col vals(4), w(4);
    vals << 1, 2, 3, 4;
    w << 0.1, 0.1, 0.1, 0.7;
    IS_TRUE(weighted_median(vals, w) == 4);
    w << 1, 1, 1, 1;
    IS_TRUE(weighted_median(vals, w) == 2);
    // all zero weights behave as uniform
    w << 0, 0, 0, 0;
    IS_TRUE(weighted_median(vals, w) == 2);
}

void series_weighted_moments() {
    Mat2D data(3, 2);
    data << 1, 10,
            2, 20,
            3, 30;
    Col w(3);
    w << 1, 1, 2;

    const Row mu = weighted_mean(data, w);
    IS_TRUE(std::fabs(mu[0] - 2.25) < 1e-12);
    IS_TRUE(std::fabs(mu[1] - 22.5) < 1e-12);

    const Mat2D cov = weighted_covariance(data, w);
    // 0.25*(1.25^2) + 0.25*(0.25^2) + 0.5*(0.75^2)
    IS_TRUE(std::fabs(cov(0, 0) - 0.6875) < 1e-12);
    IS_TRUE(std::fabs(cov(0, 1) - 6.875) < 1e-10);
    IS_TRUE(std::fabs(cov(1, 1) - 68.75) < 1e-9);
}

void series_safe_normalize() {
    Col w(3);
    w << 1, 3, 0;
    Col n = safe_normalize(w);
    IS_TRUE(std::fabs(n.sum() - 1) < 1e-12 and n[1] == 0.75 and n[2] == 0);

    w << 0, 0, 0;
    n = safe_normalize(w);
    IS_TRUE(std::fabs(n[0] - 1.0/3) < 1e-12 and std::fabs(n[2] - 1.0/3) < 1e-12);
}

void series_weighted_sampling() {
    gsl_rng * rng = gsl_rng_alloc(gsl_rng_taus2);
    gsl_rng_set(rng, 1234);

    const std::vector<float_type> w = { 0.0, 1.0, 3.0 };
    size_t counts[3] = { 0, 0, 0 };
    for (size_t i = 0; i < 4000; ++i) { counts[gsl_rng_weighted_index(rng, w)]++; }
    IS_TRUE(counts[0] == 0);
    IS_TRUE(counts[2] > 2 * counts[1]);

    const std::vector<float_type> vw = { 0.0, 0.0, 5.0 };
    IS_TRUE(gsl_rng_weighted_index(rng, vw) == 2);

    gsl_rng_free(rng);
}

int main(void) {
    series_median();
    series_weighted_moments();
    series_safe_normalize();
    series_weighted_sampling();
    return test_status();
}
