#include <AbcPop/AbcSmc.h>
#include <AbcPop/AbcLog.h>

#include <iostream>
#include <limits>

using std::vector;
using std::string;
using std::cerr;
using std::endl;

namespace ABCPOP {

AbcSmc::AbcSmc(
    const ModelVec & models,
    const ModelPrior & model_prior,
    const ModelPerturbationKernel & model_perturbation_kernel,
    const vector<ParameterPriorPtr> & parameter_priors,
    const vector<TransitionPtr> & transitions,
    const DistancePtr & distance,
    const EpsilonPtr & epsilon,
    const size_t nr_particles,
    const SamplerPtr & sampler,
    const size_t max_nr_allowed_sample_attempts_per_particle,
    const size_t min_nr_particles_per_population
) : _models(models), _model_prior(model_prior), _model_perturbation_kernel(model_perturbation_kernel),
    _parameter_priors(parameter_priors), _transitions(transitions), _distance(distance), _epsilon(epsilon),
    _nr_particles(nr_particles), _sampler(sampler),
    _max_nr_allowed_sample_attempts_per_particle(max_nr_allowed_sample_attempts_per_particle),
    _min_nr_particles_per_population(min_nr_particles_per_population),
    _rng(gsl_rng_alloc(gsl_rng_taus2), gsl_rng_free) {
    const size_t nm = models.size();
    if (nm == 0) { throw std::invalid_argument("AbcSmc: no models"); }
    if (model_prior.size() != nm) { throw std::invalid_argument("AbcSmc: model prior covers " + std::to_string(model_prior.size()) + " models, not " + std::to_string(nm)); }
    if (model_perturbation_kernel.size() != nm) { throw std::invalid_argument("AbcSmc: model perturbation kernel covers " + std::to_string(model_perturbation_kernel.size()) + " models, not " + std::to_string(nm)); }
    if (parameter_priors.size() != nm) { throw std::invalid_argument("AbcSmc: " + std::to_string(parameter_priors.size()) + " parameter priors for " + std::to_string(nm) + " models"); }
    if (transitions.size() != nm) { throw std::invalid_argument("AbcSmc: " + std::to_string(transitions.size()) + " transitions for " + std::to_string(nm) + " models"); }
    for (size_t m = 0; m < nm; ++m) {
        if (not models[m] or not parameter_priors[m] or not transitions[m]) { throw std::invalid_argument("AbcSmc: missing model, prior or transition for model " + std::to_string(m)); }
    }
    if (not distance or not epsilon) { throw std::invalid_argument("AbcSmc: distance and epsilon are required"); }
    if (nr_particles == 0) { throw std::invalid_argument("AbcSmc: nr_particles must be positive"); }
    if (min_nr_particles_per_population > nr_particles) { throw std::invalid_argument("AbcSmc: min_nr_particles_per_population exceeds nr_particles"); }
    if (max_nr_allowed_sample_attempts_per_particle == 0) { throw std::invalid_argument("AbcSmc: max_nr_allowed_sample_attempts_per_particle must be positive"); }
}

vector<string> AbcSmc::model_names() const {
    vector<string> names;
    for (auto & m : _models) { names.push_back(m->get_name()); }
    return names;
}

Sample AbcSmc::_sample_from_prior() {
    SimulationContext context;
    context.t = 0;
    context.epsilon = std::numeric_limits<float_type>::infinity();
    context.budget = 1;
    context.max_attempts = _max_nr_allowed_sample_attempts_per_particle;
    context.stats_only = true;

    const Proposer proposer(_model_prior, _parameter_priors);
    const Evaluator evaluator(
        _models, context,
        [this](const SumStats & x) { return distance_to_observed(x); },
        _transform, Weigher(context.budget), _verbose
    );
    SamplingOptions options;
    options.all_accepted = true;

    return _sampler.sample_until_n_accepted(_nr_particles, proposer, evaluator, Acceptor(true), options, _rng.get());
}

const Sample & AbcSmc::prior_sample() {
    return _prior_sample.get([this]() { return _sample_from_prior(); });
}

void AbcSmc::set_data(
    const SumStats & observed,
    const std::shared_ptr<History> & history,
    const std::optional<size_t> ground_truth_model,
    const Parameter & ground_truth_parameter,
    const Json::Value & options
) {
    if (not history) { throw std::invalid_argument("AbcSmc::set_data: no history"); }
    if (ground_truth_model and *ground_truth_model >= nr_models()) { throw std::out_of_range("AbcSmc::set_data: ground truth model out of range"); }
    _observed = observed;
    _history = history;
    _history->set_min_nr_particles_per_population(_min_nr_particles_per_population);

    vector<SumStats> prior_sum_stats;
    for (auto & ev : prior_sample().accepted()) {
        for (auto & ss : ev.particle.sum_stats) { prior_sum_stats.push_back(ss); }
    }
    _distance->initialize(prior_sum_stats);
    _epsilon->initialize(prior_sum_stats, [this](const SumStats & x) { return distance_to_observed(x); });

    // a history with populations is resumed, not restarted
    if (_history->nr_populations() == 0) {
        InitialData data;
        data.observed = observed;
        data.model_names = model_names();
        data.ground_truth_model = ground_truth_model;
        data.ground_truth_parameter = ground_truth_parameter;
        data.options = options;
        data.distance = _distance->to_json();
        data.epsilon = _epsilon->to_json();
        _history->store_initial_data(data);
    } else if (_history->nr_models() != nr_models()) {
        throw std::invalid_argument("AbcSmc::set_data: history was recorded for a different number of models");
    }
}

vector<TransitionPtr> AbcSmc::_fit_transitions(const size_t t) const {
    vector<TransitionPtr> kernels(nr_models());
    for (size_t m = 0; m < nr_models(); ++m) {
        const WeightedParameters particles = _history->weighted_particles(t - 1, m);
        if (particles.empty()) {
            if (_verbose > 0) { AbcLog::warning("model " + _models[m]->get_name() + " is extinct at t = " + std::to_string(t - 1)); }
            continue;
        }
        std::unique_ptr<Transition> kernel = _transitions[m]->clone();
        kernel->fit(particles);
        kernels[m] = std::move(kernel);
    }
    return kernels;
}

Population AbcSmc::_make_population(const size_t t, const float_type eps, const Sample & sample) const {
    vector<Particle> particles;
    size_t degenerate = 0;
    for (auto & ev : sample.accepted()) {
        if (ev.degenerate_weight) { ++degenerate; }
        // zero weight particles are counted as accepted, but never stored
        if (ev.particle.valid() and ev.particle.weight > 0) { particles.push_back(ev.particle); }
    }
    Population pop(t, eps, particles);
    pop.nr_evaluations = sample.nr_evaluations;
    pop.nr_simulations = sample.nr_simulations;
    pop.nr_accepted = sample.n_accepted();
    pop.nr_degenerate_weights = degenerate;
    return pop;
}

void AbcSmc::_report(const size_t t, const Population & pop) const {
    if (_verbose == 0) return;
    AbcLog::generation_report(pop, _nr_particles);
    AbcLog::model_probabilities(model_names(), _history->get_model_probabilities(t));
    if (_verbose > 1) {
        for (size_t m = 0; m < nr_models(); ++m) { AbcLog::report_convergence_data(*_history, t, m, *_parameter_priors[m]); }
    }
}

const History & AbcSmc::run(const vector<size_t> & attempts_schedule, const float_type min_epsilon) {
    if (not _history) { throw std::logic_error("AbcSmc::run: set_data must be called first"); }
    _incomplete = false;
    const size_t t0 = _history->next_t();

    // nothing to perturb after an empty generation
    if (t0 > 0 and _history->nr_of_models_alive(t0 - 1) == 0) {
        _incomplete = true;
        const string msg = "generation " + std::to_string(t0 - 1) + " is empty; the run cannot be resumed from it";
        AbcLog::warning(msg);
        _history->done();
        if (_fail_on_incomplete) { throw IncompleteSampleError(msg); }
        return *_history;
    }

    for (size_t t = t0; t < t0 + attempts_schedule.size(); ++t) {
        const size_t budget = attempts_schedule[t - t0];
        if (budget == 0) { throw std::invalid_argument("AbcSmc::run: attempts schedule entries must be positive"); }
        const float_type eps = (*_epsilon)(t, *_history);

        SimulationContext context;
        context.t = t;
        context.epsilon = eps;
        context.budget = budget;
        context.max_attempts = _max_nr_allowed_sample_attempts_per_particle;
        context.distance = _distance->to_json();

        const DistanceToObserved dist = [this](const SumStats & x) { return distance_to_observed(x); };
        const Acceptor acceptor;
        SamplingOptions options;
        options.max_eval = _max_eval;

        Sample sample;
        if (t == 0) {
            const Proposer proposer(_model_prior, _parameter_priors);
            const Evaluator evaluator(_models, context, dist, _transform, Weigher(budget), _verbose);
            sample = _sampler.sample_until_n_accepted(_nr_particles, proposer, evaluator, acceptor, options, _rng.get());
        } else {
            const vector<TransitionPtr> kernels = _fit_transitions(t);
            const Proposer proposer(t, _model_prior, _parameter_priors, _model_perturbation_kernel, kernels, *_history);
            const Weigher weigher(
                t, budget, _model_prior, _parameter_priors, _model_perturbation_kernel, kernels,
                _history->get_model_probabilities(t - 1)
            );
            const Evaluator evaluator(_models, context, dist, _transform, weigher, _verbose);
            sample = _sampler.sample_until_n_accepted(_nr_particles, proposer, evaluator, acceptor, options, _rng.get());
        }

        const Population pop = _make_population(t, eps, sample);
        const bool enough = _history->append_population(t, eps, pop, model_names());
        _report(t, pop);

        if (not sample.ok() or not enough) {
            _incomplete = true;
            const string msg = "generation " + std::to_string(t) + " is incomplete: " + std::to_string(pop.size()) + " particles stored, "
                             + std::to_string(_nr_particles) + " requested, minimum " + std::to_string(_min_nr_particles_per_population)
                             + (sample.ok() ? "" : " (evaluation budget exhausted)");
            AbcLog::warning(msg);
            if (_fail_on_incomplete) {
                _history->done();
                throw IncompleteSampleError(msg);
            }
            break;
        }
        if (eps <= min_epsilon) break;
        if (_stop_if_only_single_model_alive and _history->nr_of_models_alive() <= 1) break;
    }

    _history->done();
    return *_history;
}

}
