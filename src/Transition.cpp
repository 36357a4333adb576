#include <AbcPop/Transition.h>
#include <AbcPop/AbcUtil.h>

#include <cmath>
#include <stdexcept>
#include <Eigen/Cholesky>
#include <gsl/gsl_vector.h>

using std::vector;
using std::string;

namespace ABCPOP {

float_type variance_floor(const float_type mean) {
    return 1e-8 * std::max(1.0, mean * mean);
}

void Transition::fit(const WeightedParameters & sample) {
    if (sample.empty()) { throw std::invalid_argument("Transition::fit: empty sample"); }
    if (static_cast<size_t>(sample.weights.size()) != sample.size() or static_cast<size_t>(sample.values.cols()) != sample.names.size()) {
        throw std::invalid_argument("Transition::fit: inconsistent sample dimensions");
    }
    _names = sample.names;
    _values = sample.values;
    _weights = safe_normalize(sample.weights);
    _resampler = std::shared_ptr<gsl_ran_discrete_t>(
        gsl_ran_discrete_preproc(_weights.size(), _weights.data()),
        gsl_ran_discrete_free
    );
    if (not _names.empty()) { _fit(); }
    _fitted = true;
}

Parameter Transition::rvs(const gsl_rng * rng) const {
    if (not _fitted) { throw std::logic_error("Transition::rvs: kernel not fitted"); }
    if (_names.empty()) { return Parameter(); }
    const size_t idx = gsl_ran_discrete(rng, _resampler.get());
    return as_parameter(_perturb(rng, _values.row(idx)), _names);
}

float_type Transition::pdf(const Parameter & par) const {
    if (not _fitted) { throw std::logic_error("Transition::pdf: kernel not fitted"); }
    if (_names.empty()) { return 1.0; }
    const Row x = as_row(par, _names);
    float_type density = 0.0;
    for (size_t j = 0; j < static_cast<size_t>(_values.rows()); ++j) {
        if (_weights[j] == 0.0) continue;
        density += _weights[j] * _density(x, _values.row(j));
    }
    return density;
}

void IndependentNormalTransition::_fit() {
    const Row mu = weighted_mean(_values, _weights);
    const Mat2D sigma = weighted_covariance(_values, _weights);
    _sd = Row::Zero(_names.size());
    for (size_t i = 0; i < _names.size(); ++i) {
        float_type var = _scaling * sigma(i, i);
        const float_type vmin = variance_floor(mu[i]);
        if (not std::isfinite(var) or var < vmin) { var = vmin; }
        _sd[i] = std::sqrt(var);
    }
}

Row IndependentNormalTransition::_perturb(const gsl_rng * rng, const Row & center) const {
    Row res = center;
    for (size_t i = 0; i < static_cast<size_t>(res.size()); ++i) {
        res[i] += gsl_ran_gaussian(rng, _sd[i]);
    }
    return res;
}

float_type IndependentNormalTransition::_density(const Row & x, const Row & center) const {
    float_type density = 1.0;
    for (size_t i = 0; (i < static_cast<size_t>(x.size())) and (density != 0.0); ++i) {
        density *= gsl_ran_gaussian_pdf(x[i] - center[i], _sd[i]);
    }
    return density;
}

void MultivariateNormalTransition::_fit() {
    const Row mu = weighted_mean(_values, _weights);
    _sigma = _scaling * weighted_covariance(_values, _weights);
    const size_t d = _names.size();

    // degenerate (e.g. single particle, or collinear) samples: floor the diagonal, then
    // add jitter until the factorization succeeds
    for (size_t i = 0; i < d; ++i) {
        const float_type vmin = variance_floor(mu[i]);
        if (not std::isfinite(_sigma(i, i)) or _sigma(i, i) < vmin) { _sigma(i, i) = vmin; }
        for (size_t j = 0; j < d; ++j) {
            if (not std::isfinite(_sigma(i, j))) { _sigma(i, j) = (i == j) ? vmin : 0.0; }
        }
    }
    float_type jitter = _sigma.diagonal().maxCoeff() * 1e-10;
    Mat2D L;
    while (true) {
        Eigen::LLT<Mat2D> llt(_sigma);
        if (llt.info() == Eigen::Success) {
            L = llt.matrixL();
            const Col pivots = L.diagonal();
            if (pivots.allFinite() and pivots.minCoeff() > 1e-12 * pivots.maxCoeff()) break;
        }
        _sigma.diagonal().array() += jitter;
        jitter *= 10;
    }
    _L = std::shared_ptr<gsl_matrix>(to_gsl_m(L), gsl_matrix_free);
}

Row MultivariateNormalTransition::_perturb(const gsl_rng * rng, const Row & center) const {
    gsl_vector * mu = to_gsl_v(center);
    gsl_vector * result = gsl_vector_alloc(center.size());
    gsl_ran_multivariate_gaussian(rng, mu, _L.get(), result);
    Row res(center.size());
    for (size_t i = 0; i < static_cast<size_t>(res.size()); ++i) { res[i] = gsl_vector_get(result, i); }
    gsl_vector_free(mu);
    gsl_vector_free(result);
    return res;
}

float_type MultivariateNormalTransition::_density(const Row & x, const Row & center) const {
    gsl_vector * gx = to_gsl_v(x);
    gsl_vector * mu = to_gsl_v(center);
    gsl_vector * work = gsl_vector_alloc(x.size());
    double res = 0.0;
    gsl_ran_multivariate_gaussian_pdf(gx, mu, _L.get(), &res, work);
    gsl_vector_free(gx);
    gsl_vector_free(mu);
    gsl_vector_free(work);
    return res;
}

std::unique_ptr<Transition> make_transition(const NOISE noise, const float_type scaling) {
    switch (noise) {
        case INDEPENDENT: return std::make_unique<IndependentNormalTransition>(scaling);
        case MULTIVARIATE: return std::make_unique<MultivariateNormalTransition>(scaling);
        default: throw std::invalid_argument("make_transition: unknown noise type");
    }
}

ModelPerturbationKernel::ModelPerturbationKernel(
    const size_t nr_models, const float_type probability_to_stay
) : _nr_models(nr_models), _p_stay(probability_to_stay) {
    if (nr_models == 0) { throw std::invalid_argument("ModelPerturbationKernel: no models"); }
    if (not (probability_to_stay >= 0.0 and probability_to_stay <= 1.0)) {
        throw std::invalid_argument("ModelPerturbationKernel: probability_to_stay must be in [0, 1]");
    }
}

size_t ModelPerturbationKernel::rvs(const size_t source, const gsl_rng * rng) const {
    if (_nr_models == 1) { return source; }
    if (gsl_rng_uniform(rng) < _p_stay) { return source; }
    const size_t other = gsl_rng_uniform_int(rng, _nr_models - 1);
    return other < source ? other : other + 1;
}

float_type ModelPerturbationKernel::pmf(const size_t target, const size_t source) const {
    if (target >= _nr_models or source >= _nr_models) { return 0.0; }
    if (_nr_models == 1) { return 1.0; }
    return target == source ? _p_stay : (1.0 - _p_stay) / (_nr_models - 1);
}

}
