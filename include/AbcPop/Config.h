#ifndef ABCPOP_CONFIG_H
#define ABCPOP_CONFIG_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Metric.h>
#include <AbcPop/Priors.h>
#include <AbcPop/Transition.h>
#include <AbcPop/AbcSim.h>
#include <AbcPop/Distance.h>
#include <AbcPop/Epsilon.h>
#include <AbcPop/Sampler.h>
#include <AbcPop/AbcMPIPar.h>
#include <AbcPop/AbcSmc.h>

namespace ABCPOP {

template <NumericType T>
std::vector<T> as_vector(const Json::Value & val) {
    std::vector<T> extracted_vals;
    if (val.isArray()) { for (const Json::Value & jv : val) {
        extracted_vals.push_back( jv.as<T>() ); // NB, jsoncpp handles cast failures
    } } else {
        extracted_vals.push_back( val.as<T>() );
    }
    return extracted_vals;
}

// the run-level settings of a configuration
struct RunSettings {
    size_t nr_particles = 0;
    std::vector<size_t> nr_samples_per_particle = { 1 }; // one entry per generation
    float_type min_epsilon = 0.0;
    size_t max_nr_allowed_sample_attempts_per_particle = 500;
    size_t min_nr_particles_per_population = 1;
    bool stop_if_only_single_model_alive = true;
    size_t max_eval = UNLIMITED;
    std::optional<unsigned long int> seed;
};

// Builds the pieces of an `AbcSmc` from a JSON configuration.
// Every getter throws std::invalid_argument when its part of the configuration is missing or malformed.
struct JsonConfig {
    // throws std::invalid_argument if the file is missing or not valid JSON
    JsonConfig(const std::string & filename);
    static JsonConfig from_json(const Json::Value & root) { return JsonConfig(root, 0); }
    static JsonConfig from_string(const std::string & json_data);

    RunSettings settings() const;

    MetricVec metrics() const;
    SumStats observed() const { return observed_sum_stats(metrics()); }

    std::vector<std::string> model_names() const;
    std::vector<ParameterPriorPtr> parameter_priors() const;
    ModelVec models() const;
    ModelPrior model_prior() const;
    ModelPerturbationKernel model_perturbation_kernel() const;
    std::vector<TransitionPtr> transitions() const;

    DistancePtr distance() const;
    EpsilonPtr epsilon() const;
    // `mp` is only needed for an MPI sampler
    SamplerPtr sampler(MPI_par * mp = nullptr) const;

    // everything above, assembled; `sampler_override` replaces the configured sampler
    std::unique_ptr<AbcSmc> make_abc(MPI_par * mp = nullptr, const SamplerPtr & sampler_override = nullptr) const;

    const Json::Value & root() const { return _root; }

    private:
        JsonConfig(const Json::Value & root, int) : _root(root) {}
        const Json::Value & _models_json() const;
        const Json::Value _root;
};

}

#endif // ABCPOP_CONFIG_H
