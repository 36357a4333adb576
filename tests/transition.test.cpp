#include "testing.h"
#include <AbcPop/Transition.h>

#include <cmath>
#include <stdexcept>

using namespace ABCPOP;

WeightedParameters two_par_sample() {
    WeightedParameters wp;
    wp.names = { "a", "b" };
    wp.values = Mat2D(4, 2);
    wp.values << 0.0, 1.0,
                 1.0, 2.0,
                 2.0, 2.5,
                 3.0, 4.0;
    wp.weights = Col(4);
    wp.weights << 1, 2, 3, 4;
    return wp;
}

void series_fit_and_density(Transition & kernel) {
    IS_TRUE(not kernel.is_fitted());
    THROWS(kernel.rvs(nullptr), std::logic_error);

    kernel.fit(two_par_sample());
    IS_TRUE(kernel.is_fitted());
    IS_TRUE(kernel.names().size() == 2);

    gsl_rng * rng = gsl_rng_alloc(gsl_rng_taus2);
    gsl_rng_set(rng, 99);
    bool positive = true;
    double mean_a = 0;
    const size_t n = 5000;
    for (size_t i = 0; i < n; ++i) {
        const Parameter p = kernel.rvs(rng);
        positive = positive and (kernel.pdf(p) > 0);
        mean_a += p.at("a") / n;
    }
    IS_TRUE(positive);
    // the weighted mean of `a` is 2.0; noise is centered
    IS_TRUE(std::fabs(mean_a - 2.0) < 0.15);
    // density is highest near the heavily weighted particles
    IS_TRUE(kernel.pdf({ { "a", 3.0 }, { "b", 4.0 } }) > kernel.pdf({ { "a", -5.0 }, { "b", -5.0 } }));
    THROWS(kernel.pdf({ { "a", 1.0 } }), std::out_of_range);

    auto fresh = kernel.clone();
    IS_TRUE(not fresh->is_fitted());
    IS_TRUE(fresh->scaling() == kernel.scaling());
    gsl_rng_free(rng);
}

void series_independent_variance() {
    IndependentNormalTransition kernel(2.0);
    WeightedParameters wp;
    wp.names = { "x" };
    wp.values = Mat2D(2, 1);
    wp.values << -1.0, 1.0;
    wp.weights = Col::Ones(2);
    kernel.fit(wp);
    // weighted variance 1, doubled
    IS_TRUE(std::fabs(kernel.sd()[0] - std::sqrt(2.0)) < 1e-12);
    const double expected = 0.5 * (gsl_ran_gaussian_pdf(1.0, std::sqrt(2.0)) + gsl_ran_gaussian_pdf(-1.0, std::sqrt(2.0)));
    IS_TRUE(std::fabs(kernel.pdf({ { "x", 0.0 } }) - expected) < 1e-12);
}

void series_degenerate_input(Transition & kernel) {
    // a single particle: zero variance is floored, so the kernel still has support
    WeightedParameters single;
    single.names = { "a", "b" };
    single.values = Mat2D(1, 2);
    single.values << 5.0, 5.0;
    single.weights = Col::Ones(1);
    kernel.fit(single);
    IS_TRUE(kernel.pdf({ { "a", 5.0 }, { "b", 5.0 } }) > 0);
    IS_TRUE(std::isfinite(kernel.pdf({ { "a", 5.0 }, { "b", 5.0 } })));

    // weights that sum to 0 fall back to uniform
    WeightedParameters zero = two_par_sample();
    zero.weights.setZero();
    auto k2 = kernel.clone();
    k2->fit(zero);
    IS_TRUE(k2->pdf({ { "a", 1.5 }, { "b", 2.4 } }) > 0);

    // collinear parameters
    WeightedParameters collinear;
    collinear.names = { "a", "b" };
    collinear.values = Mat2D(3, 2);
    collinear.values << 1, 2,
                        2, 4,
                        3, 6;
    collinear.weights = Col::Ones(3);
    auto k3 = kernel.clone();
    k3->fit(collinear);
    IS_TRUE(k3->pdf({ { "a", 2.0 }, { "b", 4.0 } }) > 0);

    WeightedParameters empty;
    empty.names = { "a" };
    THROWS(kernel.clone()->fit(empty), std::invalid_argument);
}

void series_parameter_free_model() {
    IndependentNormalTransition kernel;
    WeightedParameters wp;
    wp.values = Mat2D(3, 0);
    wp.weights = Col::Ones(3);
    kernel.fit(wp);
    gsl_rng * rng = gsl_rng_alloc(gsl_rng_taus2);
    IS_TRUE(kernel.rvs(rng).empty());
    IS_TRUE(kernel.pdf(Parameter()) == 1.0);
    gsl_rng_free(rng);
}

void series_model_kernel() {
    const ModelPerturbationKernel k(3, 0.7);
    IS_TRUE(std::fabs(k.pmf(1, 1) - 0.7) < 1e-12);
    IS_TRUE(std::fabs(k.pmf(0, 1) - 0.15) < 1e-12);
    IS_TRUE(std::fabs(k.pmf(0, 0) + k.pmf(1, 0) + k.pmf(2, 0) - 1.0) < 1e-12);
    IS_TRUE(k.pmf(3, 0) == 0.0);

    gsl_rng * rng = gsl_rng_alloc(gsl_rng_taus2);
    gsl_rng_set(rng, 7);
    size_t counts[3] = { 0, 0, 0 };
    for (size_t i = 0; i < 10000; ++i) { counts[k.rvs(2, rng)]++; }
    IS_TRUE(counts[2] > 6500 and counts[2] < 7500);
    IS_TRUE(counts[0] > 1200 and counts[1] > 1200);

    const ModelPerturbationKernel single(1, 0.2);
    IS_TRUE(single.pmf(0, 0) == 1.0);
    bool stays = true;
    for (size_t i = 0; i < 100; ++i) { stays = stays and (single.rvs(0, rng) == 0); }
    IS_TRUE(stays);
    gsl_rng_free(rng);

    THROWS(ModelPerturbationKernel(0, 0.5), std::invalid_argument);
    THROWS(ModelPerturbationKernel(2, 1.5), std::invalid_argument);
}

int main(void) {
    IndependentNormalTransition independent;
    MultivariateNormalTransition multivariate;
    series_fit_and_density(independent);
    series_fit_and_density(multivariate);
    series_independent_variance();
    series_degenerate_input(independent);
    series_degenerate_input(multivariate);
    series_parameter_free_model();
    series_model_kernel();
    return test_status();
}
