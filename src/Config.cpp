#include <AbcPop/Config.h>
#include <AbcPop/AbcUtil.h>
#include <AbcPop/AbcMPI.h>

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using std::string;
using std::vector;

namespace ABCPOP {

namespace {

    PriorPtr parse_parameter(const Json::Value & mpar) {
        const string name = mpar["name"].asString();
        const string short_name = mpar.get("short_name", name).asString();

        const string ptype_str = mpar["dist_type"].asString();
        const string ntype_str = mpar.get("num_type", "FLOAT").asString();

        if (not ((ntype_str == "INT") or (ntype_str == "FLOAT"))) {
            throw std::invalid_argument("Unknown parameter numeric type: " + ntype_str);
        }

        if (ptype_str == "UNIFORM") {
            if (ntype_str == "INT") {
                return std::make_shared<DiscreteUniformPrior>(name, short_name, mpar["par1"].asInt64(), mpar["par2"].asInt64());
            } else {
                return std::make_shared<ContinuousUniformPrior>(name, short_name, mpar["par1"].asDouble(), mpar["par2"].asDouble());
            }
        } else if (ptype_str == "NORMAL" or ptype_str == "GAUSSIAN") {
            if (ntype_str == "INT") {
                throw std::invalid_argument("Parameter numeric " + ntype_str + " not supported for parameter type " + ptype_str);
            }
            return std::make_shared<GaussianPrior>(name, short_name, mpar["par1"].asDouble(), mpar["par2"].asDouble());
        } else {
            throw std::invalid_argument("Unknown parameter distribution type: " + ptype_str);
        }
    }

    MetricPtr parse_metric(const Json::Value & mmet) {
        const string name = mmet["name"].asString();
        const string short_name = mmet.get("short_name", name).asString();
        if (not mmet.isMember("value")) { throw std::invalid_argument("Metric " + name + " has no observed value"); }
        const float_type val = mmet["value"].asDouble();
        const string ntype_str = mmet.get("num_type", "FLOAT").asString();

        if (ntype_str == "INT") {
            return std::make_shared<TMetric<int>>(name, short_name, val);
        } else if (ntype_str == "FLOAT") {
            return std::make_shared<TMetric<float_type>>(name, short_name, val);
        } else {
            throw std::invalid_argument("Unknown metric numeric type: " + ntype_str);
        }
    }

    float_type parse_float(const Json::Value & val) {
        if (val.isString() and (val.asString() == "inf" or val.asString() == "Infinity")) { return std::numeric_limits<float_type>::infinity(); }
        if (val.isString() and (val.asString() == "-inf" or val.asString() == "-Infinity")) { return -std::numeric_limits<float_type>::infinity(); }
        return val.asDouble();
    }

}

JsonConfig::JsonConfig(const string & filename) : _root([&filename]() {
    if (not file_exists(filename)) { throw std::invalid_argument("File does not exist: " + filename); }
    Json::Value par;   // will contain the par value after parsing.
    Json::Reader reader;
    if (not reader.parse(slurp(filename), par)) {
        throw std::invalid_argument("Failed to parse configuration\n" + reader.getFormattedErrorMessages());
    }
    return par;
}()) {}

JsonConfig JsonConfig::from_string(const string & json_data) {
    Json::Value par;
    Json::Reader reader;
    if (not reader.parse(json_data, par)) {
        throw std::invalid_argument("Failed to parse configuration\n" + reader.getFormattedErrorMessages());
    }
    return from_json(par);
}

RunSettings JsonConfig::settings() const {
    RunSettings rs;
    if (not _root.isMember("nr_particles")) { throw std::invalid_argument("Configuration lacks `nr_particles`"); }
    rs.nr_particles = _root["nr_particles"].asUInt64();
    if (_root.isMember("nr_samples_per_particle")) {
        rs.nr_samples_per_particle = as_vector<size_t>(_root["nr_samples_per_particle"]);
    }
    rs.min_epsilon = _root.isMember("min_epsilon") ? parse_float(_root["min_epsilon"]) : -std::numeric_limits<float_type>::infinity();
    rs.max_nr_allowed_sample_attempts_per_particle = _root.get("max_nr_allowed_sample_attempts_per_particle", 500).asUInt64();
    rs.min_nr_particles_per_population = _root.get("min_nr_particles_per_population", 1).asUInt64();
    rs.stop_if_only_single_model_alive = _root.get("stop_if_only_single_model_alive", true).asBool();
    if (_root.isMember("max_eval")) { rs.max_eval = _root["max_eval"].asUInt64(); }
    if (_root.isMember("seed")) { rs.seed.emplace(_root["seed"].asUInt64()); }
    return rs;
}

MetricVec JsonConfig::metrics() const {
    MetricVec mets;
    for (const Json::Value & mmet : _root["metrics"]) { mets.push_back(parse_metric(mmet)); }
    if (mets.empty()) { throw std::invalid_argument("Configuration lacks `metrics`"); }
    return mets;
}

const Json::Value & JsonConfig::_models_json() const {
    const Json::Value & mods = _root["models"];
    if (not mods.isArray() or mods.empty()) { throw std::invalid_argument("Configuration lacks `models`"); }
    return mods;
}

vector<string> JsonConfig::model_names() const {
    vector<string> names;
    for (const Json::Value & mod : _models_json()) {
        names.push_back(mod.get("name", "model_" + std::to_string(names.size())).asString());
    }
    return names;
}

vector<ParameterPriorPtr> JsonConfig::parameter_priors() const {
    vector<ParameterPriorPtr> priors;
    for (const Json::Value & mod : _models_json()) {
        auto pp = std::make_shared<ParameterPrior>();
        for (const Json::Value & mpar : mod["parameters"]) { pp->add_next_parameter(parse_parameter(mpar)); }
        priors.push_back(pp);
    }
    return priors;
}

ModelVec JsonConfig::models() const {
    const vector<string> names = model_names();
    const vector<ParameterPriorPtr> priors = parameter_priors();
    const vector<string> met_names = metric_names(metrics());

    ModelVec mods;
    size_t m = 0;
    for (const Json::Value & mod : _models_json()) {
        SimFunPtr simulator;
        if (mod.isMember("shared")) {
            simulator = std::make_shared<SimFPtr>(mod["shared"].asString());
        } else if (mod.isMember("executable")) {
            simulator = std::make_shared<SimExec>(mod["executable"].asString());
        } else {
            throw std::invalid_argument("Model " + names[m] + " needs a `shared` object or an `executable`");
        }
        mods.push_back(std::make_shared<SimulatorModel>(names[m], priors[m]->names(), met_names, simulator));
        ++m;
    }
    return mods;
}

ModelPrior JsonConfig::model_prior() const {
    vector<float_type> weights;
    for (const Json::Value & mod : _models_json()) { weights.push_back(mod.get("prior_weight", 1.0).asDouble()); }
    return ModelPrior(weights);
}

ModelPerturbationKernel JsonConfig::model_perturbation_kernel() const {
    const float_type p_stay = _root["model_perturbation"].get("probability_to_stay", 0.7).asDouble();
    return ModelPerturbationKernel(_models_json().size(), p_stay);
}

vector<TransitionPtr> JsonConfig::transitions() const {
    const string noise_str = _root.get("noise", "INDEPENDENT").asString();
    NOISE noise;
    if (noise_str == "INDEPENDENT") {
        noise = INDEPENDENT;
    } else if (noise_str == "MULTIVARIATE") {
        noise = MULTIVARIATE;
    } else {
        throw std::invalid_argument("Unknown noise type: " + noise_str);
    }
    const float_type scaling = _root.get("kernel_scaling", 2.0).asDouble();
    if (not (scaling > 0)) { throw std::invalid_argument("kernel_scaling must be positive"); }

    vector<TransitionPtr> kernels;
    for (size_t m = 0; m < _models_json().size(); ++m) { kernels.push_back(make_transition(noise, scaling)); }
    return kernels;
}

DistancePtr JsonConfig::distance() const {
    const Json::Value & dist = _root["distance"];
    const string type = dist.get("type", "PNORM").asString();
    if (type == "PNORM") {
        std::map<string, float_type> weights;
        for (auto & key : dist["weights"].getMemberNames()) { weights[key] = dist["weights"][key].asDouble(); }
        return std::make_shared<PNormDistance>(dist.isMember("p") ? parse_float(dist["p"]) : 2.0, weights);
    } else if (type == "ZSCORE") {
        return std::make_shared<ZScoreDistance>();
    }
    throw std::invalid_argument("Unknown distance type: " + type);
}

EpsilonPtr JsonConfig::epsilon() const {
    const Json::Value & eps = _root["epsilon"];
    const string type = eps.get("type", "MEDIAN").asString();
    if (type == "CONSTANT") {
        if (not eps.isMember("value")) { throw std::invalid_argument("CONSTANT epsilon needs a `value`"); }
        return std::make_shared<ConstantEpsilon>(parse_float(eps["value"]));
    } else if (type == "LIST") {
        return std::make_shared<ListEpsilon>(as_vector<float_type>(eps["values"]));
    } else if (type == "MEDIAN") {
        const float_type multiplier = eps.get("multiplier", 1.0).asDouble();
        const Json::Value & initial = eps.get("initial", "from_sample");
        if (initial.isString() and initial.asString() == "from_sample") { return MedianEpsilon::from_sample(multiplier); }
        return std::make_shared<MedianEpsilon>(parse_float(initial), multiplier);
    }
    throw std::invalid_argument("Unknown epsilon type: " + type);
}

SamplerPtr JsonConfig::sampler(MPI_par * mp) const {
    const Json::Value & samp = _root["sampler"];
    const string type = samp.get("type", "SINGLE").asString();
    if (type == "SINGLE") {
        return std::make_shared<SingleCoreSampler>();
    } else if (type == "MULTICORE") {
        return std::make_shared<MulticoreSampler>(samp.get("n_procs", 0).asUInt64(), samp.get("batch_size", 1).asUInt64());
    } else if (type == "MPI") {
#ifdef ABCPOP_USE_MPI
        return std::make_shared<MPISampler>(mp);
#else
        (void) mp;
        throw std::invalid_argument("MPI sampler requested, but built without MPI support");
#endif
    }
    throw std::invalid_argument("Unknown sampler type: " + type);
}

std::unique_ptr<AbcSmc> JsonConfig::make_abc(MPI_par * mp, const SamplerPtr & sampler_override) const {
    const RunSettings rs = settings();
    auto abc = std::make_unique<AbcSmc>(
        models(), model_prior(), model_perturbation_kernel(), parameter_priors(), transitions(),
        distance(), epsilon(), rs.nr_particles, sampler_override ? sampler_override : sampler(mp),
        rs.max_nr_allowed_sample_attempts_per_particle, rs.min_nr_particles_per_population
    );
    if (not rs.stop_if_only_single_model_alive) { abc->do_not_stop_when_only_single_model_alive(); }
    abc->set_max_eval(rs.max_eval);
    if (rs.seed) { abc->set_seed(*rs.seed); }
    return abc;
}

}
