#include <AbcPop/Generation.h>
#include <AbcPop/AbcUtil.h>

#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>

using std::vector;
using std::cerr;
using std::endl;

namespace ABCPOP {

Proposer::Proposer(
    const ModelPrior & model_prior, const vector<ParameterPriorPtr> & parameter_priors
) : _t(0), _model_prior(model_prior), _priors(parameter_priors) {}

Proposer::Proposer(
    const size_t t,
    const ModelPrior & model_prior,
    const vector<ParameterPriorPtr> & parameter_priors,
    const ModelPerturbationKernel & model_kernel,
    const vector<TransitionPtr> & kernels,
    const History & history
) : _t(t), _model_prior(model_prior), _priors(parameter_priors),
    _model_kernel(model_kernel), _kernels(kernels) {
    if (t == 0) { throw std::invalid_argument("Proposer: perturbed proposals need t > 0"); }
    if (kernels.size() != parameter_priors.size()) { throw std::invalid_argument("Proposer: one kernel per model required"); }
    _prev_model_probs = history.get_model_probabilities(t - 1);
    float_type total = 0.0;
    for (auto p : _prev_model_probs) { total += p; }
    if (total > 0) {
        _source_models = std::shared_ptr<gsl_ran_discrete_t>(
            gsl_ran_discrete_preproc(_prev_model_probs.size(), _prev_model_probs.data()), gsl_ran_discrete_free
        );
    }
}

Proposal Proposer::_from_prior(const gsl_rng * rng) const {
    Proposal res;
    res.model = _model_prior.rvs(rng);
    res.parameter = _priors[res.model]->rvs(rng);
    return res;
}

Proposal Proposer::operator()(const gsl_rng * rng) const {
    if (_t == 0) { return _from_prior(rng); }
    if (not _source_models) { throw std::logic_error("Proposer: no model alive at t = " + std::to_string(_t - 1)); }

    for (size_t attempt = 0; attempt < MAX_PROPOSAL_ATTEMPTS; ++attempt) {
        const size_t source = gsl_ran_discrete(rng, _source_models.get());
        const size_t m = _model_kernel->rvs(source, rng);
        // route around extinct models
        if (m >= _prev_model_probs.size() or _prev_model_probs[m] == 0.0 or not _kernels[m]) { continue; }

        Proposal res;
        res.model = m;
        res.parameter = _priors[m]->recast(_kernels[m]->rvs(rng));
        if (_model_prior.pmf(m) * _priors[m]->pdf(res.parameter) > 0) { return res; }
    }
    throw std::runtime_error(
        "Proposer: no proposal with positive prior density after " + std::to_string(MAX_PROPOSAL_ATTEMPTS) +
        " attempts at t = " + std::to_string(_t)
    );
}

Json::Value SimulationContext::to_json() const {
    Json::Value res;
    res["t"] = Json::UInt64(t);
    res["epsilon"] = epsilon;
    res["budget"] = Json::UInt64(budget);
    res["max_attempts"] = Json::UInt64(max_attempts);
    res["stats_only"] = stats_only;
    res["distance"] = distance;
    return res;
}

SimulationContext SimulationContext::from_json(const Json::Value & json) {
    SimulationContext res;
    res.t = json["t"].asUInt64();
    res.epsilon = json["epsilon"].asDouble();
    res.budget = json["budget"].asUInt64();
    res.max_attempts = json["max_attempts"].asUInt64();
    res.stats_only = json["stats_only"].asBool();
    res.distance = json["distance"];
    return res;
}

Weigher::Weigher(
    const size_t t, const size_t budget,
    const ModelPrior & model_prior,
    const vector<ParameterPriorPtr> & parameter_priors,
    const ModelPerturbationKernel & model_kernel,
    const vector<TransitionPtr> & kernels,
    const vector<float_type> & prev_model_probs
) : _t(t), _budget(budget), _model_prior(model_prior), _priors(parameter_priors),
    _model_kernel(model_kernel), _kernels(kernels), _prev_model_probs(prev_model_probs) {}

void Weigher::operator()(Evaluation & ev) const {
    Particle & p = ev.particle;
    if (not p.valid()) { p.weight = 0.0; return; }

    const float_type f = static_cast<float_type>(p.distances.size()) / _budget;
    if (_t == 0) { p.weight = f; return; }

    const size_t m = ev.model;
    float_type model_factor = 0.0;
    for (size_t j = 0; j < _prev_model_probs.size(); ++j) {
        model_factor += _prev_model_probs[j] * _model_kernel->pmf(m, j);
    }
    const float_type particle_factor = _kernels[m] ? _kernels[m]->pdf(p.parameter) : 0.0;
    const float_type normalization = model_factor * particle_factor;

    if (not (normalization > 0) or not std::isfinite(normalization)) {
        p.weight = 0.0;
        ev.degenerate_weight = true;
        return;
    }
    p.weight = _model_prior->pmf(m) * _priors[m]->pdf(p.parameter) * f / normalization;
}

Evaluator::Evaluator(
    const ModelVec & models,
    const SimulationContext & context,
    const DistanceToObserved & distance_to_observed,
    const SumStatsTransform & transform,
    const Weigher & weigher,
    const size_t verbose
) : _models(models), _context(context), _distance_to_observed(distance_to_observed),
    _transform(transform), _weigher(weigher), _verbose(verbose) {
    if (context.budget == 0) { throw std::invalid_argument("Evaluator: simulation budget must be positive"); }
}

Evaluation Evaluator::simulate(const Proposal & proposal, const unsigned long int seed, const size_t serial) const {
    Evaluation ev;
    ev.serial = serial;
    ev.model = proposal.model;
    ev.particle.model = proposal.model;
    ev.particle.parameter = proposal.parameter;
    const Model & model = *_models.at(proposal.model);

    for (size_t i = 0; i < _context.budget; ++i) {
        if (ev.nr_simulations >= _context.max_attempts) {
            if (_verbose > 1) {
                cerr << "WARNING: max nr of simulations (" << _context.max_attempts << ") reached for particle " << serial << endl;
            }
            ev.exhausted = true;
            ev.particle.distances.clear();
            ev.particle.sum_stats.clear();
            break;
        }
        ++ev.nr_simulations;
        const auto start = std::chrono::steady_clock::now();

        if (_context.stats_only) {
            ev.particle.sum_stats.push_back(model.summary_statistics(proposal.parameter, seed + i, serial, _transform));
        } else {
            const ModelResult res = model.accept(
                proposal.parameter, seed + i, serial, _transform, _distance_to_observed, _context.epsilon
            );
            if (res.accepted) {
                ev.particle.distances.push_back(res.distance);
                ev.particle.sum_stats.push_back(res.sum_stats);
            }
        }

        if (_verbose > 2) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            cerr << "Sampled model=" << proposal.model << "-" << model.get_name()
                 << ", delta_time=" << elapsed.count() << "s, theta=" << to_string(proposal.parameter) << endl;
        }
    }
    ev.evaluated = true;
    return ev;
}

void Evaluator::weigh(Evaluation & ev) const {
    if (_context.stats_only) {
        ev.particle.weight = 1.0;
    } else {
        _weigher(ev);
    }
}

Evaluation Evaluator::operator()(const Proposal & proposal, const gsl_rng * rng, const size_t serial) const {
    Evaluation ev = simulate(proposal, gsl_rng_get(rng), serial);
    weigh(ev);
    return ev;
}

}
