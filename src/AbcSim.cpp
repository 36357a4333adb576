#include <AbcPop/AbcSim.h>

#include <cmath>
#include <cstdio>
#include <dlfcn.h>
#include <sstream>

using std::string;
using std::vector;
using std::ostringstream;
using std::istringstream;

namespace ABCPOP {

AbcSimBase * loadSO(const string & target) {
    void * handle = dlopen(target.c_str(), RTLD_LAZY);
    if (!handle) {
        throw std::runtime_error("Failed to open simulator object: " + target + " ; " + dlerror());
    }
    auto simf = reinterpret_cast<AbcSimBase *>(dlsym(handle, "simulator"));
    if (!simf) {
        const string err = dlerror();
        dlclose(handle);
        throw std::runtime_error("Failed to find 'simulator' function in " + target + " ; " + err);
    }
    return simf;
}

vector<float_type> SimExec::operator()(
    vector<float_type> pars, const unsigned long int seed, const unsigned long int /*serial*/
) const {
    ostringstream execcom(command, std::ios_base::ate);
    vector<float_type> mets;
    for (const float_type par : pars) { execcom << " " << par; }
    execcom << " " << seed;

    FILE * pipe = popen(execcom.str().c_str(), "r");
    if (!pipe) {
        throw SimulationError("Unable to create pipe to " + execcom.str());
    }

    char buffer[512];
    string retval = "";
    while (!feof(pipe)) {
        if (fgets(buffer, 512, pipe) != NULL) { retval += buffer; }
    }
    const int status = pclose(pipe);

    if (status != 0 or retval == "ERROR" or retval == "") {
        throw SimulationError(command + " does not exist or appears to be an invalid simulator; attempted: " + execcom.str());
    }

    istringstream ss(retval);
    float_type met;
    while (ss >> met) mets.push_back(met);
    return mets;
}

ModelResult Model::accept(
    const Parameter & par, const unsigned long int seed, const unsigned long int serial,
    const SumStatsTransform & transform,
    const DistanceToObserved & distance_to_observed,
    const float_type eps
) const {
    ModelResult res;
    res.sum_stats = summary_statistics(par, seed, serial, transform);
    res.distance = distance_to_observed(res.sum_stats);
    res.accepted = res.distance <= eps;
    return res;
}

SimulatorModel::SimulatorModel(
    const string & nm,
    const vector<string> & par_names,
    const vector<string> & met_names,
    const SimFunPtr & simulator
) : Model(nm), _par_names(par_names), _met_names(met_names), _simulator(simulator) {
    if (not _simulator) { throw std::invalid_argument("model " + nm + " has no simulator"); }
}

SumStats SimulatorModel::sample(const Parameter & par, const unsigned long int seed, const unsigned long int serial) const {
    vector<float_type> pars;
    for (const auto & nm : _par_names) { pars.push_back(par.at(nm)); }

    const vector<float_type> mets = (*_simulator)(pars, seed, serial);
    if (mets.size() != _met_names.size()) {
        ostringstream ss;
        ss << "simulator for model " << get_name() << " returned the wrong number of metrics: expected "
           << _met_names.size() << ", received " << mets.size();
        throw SimulationError(ss.str());
    }

    SumStats res;
    for (size_t i = 0; i < mets.size(); ++i) {
        if (not std::isfinite(mets[i])) {
            throw SimulationError("simulator for model " + get_name() + " returned a non-finite value for " + _met_names[i]);
        }
        res[_met_names[i]] = mets[i];
    }
    return res;
}

}
