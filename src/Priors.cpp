#include <AbcPop/Priors.h>
#include <AbcPop/AbcUtil.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace ABCPOP {

GaussianPrior::GaussianPrior(
    const std::string & nm, const std::string & snm,
    const float_type mn, const float_type sd
) : Prior(nm, snm, mn, sd) {
    if (not (sd > 0)) { throw std::invalid_argument("GaussianPrior " + nm + ": sd must be positive"); }
}

DiscreteUniformPrior::DiscreteUniformPrior(
    const std::string & nm, const std::string & snm,
    const long min, const long max
) : Prior(
    nm, snm,
    static_cast<float_type>(max + min) / 2.0, static_cast<float_type>(max - min) / sqrt(12.0)
), minval(min), maxval(max) {
    if (not (min < max)) { throw std::invalid_argument("DiscreteUniformPrior " + nm + ": requires min < max"); }
}

float_type DiscreteUniformPrior::sample(const gsl_rng * rng) const {
    // signed arithmetic: minval may be negative
    const long offset = static_cast<long>(gsl_rng_uniform_int(rng, static_cast<unsigned long>(maxval - minval + 1)));
    return static_cast<float_type>(offset + minval);
}

float_type DiscreteUniformPrior::likelihood(const float_type pval) const {
    return ((pval == recast(pval)) and (minval <= pval) and (pval <= maxval)) ? 1.0 / (maxval - minval + 1) : 0.0;
}

ContinuousUniformPrior::ContinuousUniformPrior(
    const std::string & nm, const std::string & snm,
    const float_type min, const float_type max
) : Prior(
    nm, snm,
    static_cast<float_type>(max + min) / 2.0,
    static_cast<float_type>(max - min) / sqrt(12.0)
), minval(min), maxval(max) {
    if (not (min < max)) { throw std::invalid_argument("ContinuousUniformPrior " + nm + ": requires min < max"); }
}

float_type ContinuousUniformPrior::likelihood(const float_type pval) const {
    return ((minval <= pval) and (pval <= maxval)) ? 1.0 / (maxval - minval) : 0.0;
}

ParameterPrior::ParameterPrior(const std::vector<PriorPtr> & priors) {
    for (auto p : priors) { add_next_parameter(p); }
}

void ParameterPrior::add_next_parameter(const PriorPtr & prior) {
    const std::string nm = prior->get_short_name();
    if (std::find(_names.begin(), _names.end(), nm) != _names.end()) {
        throw std::invalid_argument("duplicate parameter name: " + nm);
    }
    _priors.push_back(prior);
    _names.push_back(nm);
}

Parameter ParameterPrior::rvs(const gsl_rng * rng) const {
    Parameter par;
    for (size_t parIdx = 0; parIdx < _priors.size(); ++parIdx) {
        par.emplace(_names[parIdx], _priors[parIdx]->sample(rng));
    }
    return par;
}

float_type ParameterPrior::pdf(const Parameter & par) const {
    float_type density = 1.0;
    for (size_t parIdx = 0; (parIdx < _priors.size()) and (density != 0.0); ++parIdx) {
        auto it = par.find(_names[parIdx]);
        density *= (it == par.end()) ? 0.0 : _priors[parIdx]->likelihood(it->second);
    }
    return density;
}

Parameter ParameterPrior::recast(const Parameter & par) const {
    Parameter res(par);
    for (size_t parIdx = 0; parIdx < _priors.size(); ++parIdx) {
        auto it = res.find(_names[parIdx]);
        if (it != res.end()) { it->second = _priors[parIdx]->recast(it->second); }
    }
    return res;
}

ModelPrior::ModelPrior(const std::vector<float_type> & weights) : _pmf(weights) {
    if (weights.empty()) { throw std::invalid_argument("ModelPrior: no models"); }
    if (not std::all_of(weights.begin(), weights.end(), [](float_type w) { return std::isfinite(w) and (w >= 0); })) {
        throw std::invalid_argument("ModelPrior: weights must be finite and non-negative");
    }
    const float_type total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (not (total > 0)) { throw std::invalid_argument("ModelPrior: at least one weight must be positive"); }
    for (auto & p : _pmf) { p /= total; }
}

ModelPrior ModelPrior::uniform(const size_t nr_models) {
    return ModelPrior(std::vector<float_type>(nr_models, 1.0));
}

size_t ModelPrior::rvs(const gsl_rng * rng) const {
    return gsl_rng_weighted_index(rng, _pmf);
}

}
