#ifndef ABCPOP_ABCSIM_H
#define ABCPOP_ABCSIM_H

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Parameter.h>
#include <AbcPop/Metric.h>

namespace ABCPOP {

// raised when a simulator cannot produce usable metrics; isolated to the offending particle
struct SimulationError : public std::runtime_error {
    SimulationError(const std::string & msg) : std::runtime_error(msg) {}
};

// defines the core abstraction for a simulator: (1) a functor, (2) with an operator(), (3) return type vector<float_type> (the metrics),
// (4) arguments vector<float_type> (the parameters), and unsigned long int, unsigned long int (the seed / serial)
// In general, implementations should *not* be "stateful", i.e. should not have any internal state which
// is changed when they are used; samplers may call them concurrently.
struct SimFun {
    virtual ~SimFun() {}
    virtual std::vector<float_type> operator()(
        std::vector<float_type> pars, const unsigned long int seed, const unsigned long int serial
    ) const = 0;
};

typedef std::shared_ptr<const SimFun> SimFunPtr;

// This defines a function type, for cleaner typing when using a function pointer as a simulator
typedef std::vector<float_type> AbcSimBase(std::vector<float_type>, const unsigned long int, const unsigned long int);

// loads the `simulator` symbol from a shared object; throws std::runtime_error on failure
AbcSimBase * loadSO(const std::string & target);

// a SimFun built around an AbcSimBase pointer. That pointer can come from code compiled along with this library,
// or be loaded from a shared object file.
struct SimFPtr : SimFun {
    AbcSimBase * fptr;
    SimFPtr(AbcSimBase * _fptr) : fptr(_fptr) { }
    SimFPtr(const std::string & target) : SimFPtr(loadSO(target)) { }

    std::vector<float_type> operator()(
        std::vector<float_type> pars, const unsigned long int seed, const unsigned long int serial
    ) const override {
        return fptr(pars, seed, serial);
    }
};

// a SimFun built around an external executable. This is constructed with a command string to be executed in a shell,
// which receives the parameters (followed by the seed) as command line arguments and replies on standard out
// with the metrics as a series of numbers.
struct SimExec : SimFun {
    const std::string command;
    SimExec(const std::string & _command) : command(_command) { }

    std::vector<float_type> operator()(
        std::vector<float_type> pars, const unsigned long int seed, const unsigned long int serial
    ) const override;
};

// a SimFun around any callable; mostly for programs that define their simulator inline
struct SimFunction : SimFun {
    typedef std::function<std::vector<float_type>(std::vector<float_type>, const unsigned long int, const unsigned long int)> Callable;
    Callable fun;
    SimFunction(Callable f) : fun(f) { }

    std::vector<float_type> operator()(
        std::vector<float_type> pars, const unsigned long int seed, const unsigned long int serial
    ) const override {
        return fun(pars, seed, serial);
    }
};

// maps raw model output to summary statistics; identity unless the user supplies one
typedef std::function<SumStats(const SumStats &)> SumStatsTransform;
typedef std::function<float_type(const SumStats &)> DistanceToObserved;

inline SumStats identity(const SumStats & ss) { return ss; }

struct ModelResult {
    bool accepted = false;
    float_type distance = 0.0;
    SumStats sum_stats;
};

// A candidate model: simulate, then summarize and compare.
class Model {
    public:
        Model(const std::string & nm) : name(nm) {}
        virtual ~Model() {}

        std::string get_name() const { return name; }

        // the raw model output for `par`; throws SimulationError if unusable
        virtual SumStats sample(const Parameter & par, const unsigned long int seed, const unsigned long int serial) const = 0;

        SumStats summary_statistics(
            const Parameter & par, const unsigned long int seed, const unsigned long int serial,
            const SumStatsTransform & transform = identity
        ) const { return transform(sample(par, seed, serial)); }

        // simulate once and accept iff distance <= eps
        ModelResult accept(
            const Parameter & par, const unsigned long int seed, const unsigned long int serial,
            const SumStatsTransform & transform,
            const DistanceToObserved & distance_to_observed,
            const float_type eps
        ) const;

    private:
        const std::string name;
};

typedef std::shared_ptr<const Model> ModelPtr;
typedef std::vector<ModelPtr> ModelVec;

// A `Model` backed by a `SimFun`: parameters are passed in `par_names` order,
// returned metrics are labelled in `met_names` order.
class SimulatorModel : public Model {
    public:
        SimulatorModel(
            const std::string & nm,
            const std::vector<std::string> & par_names,
            const std::vector<std::string> & met_names,
            const SimFunPtr & simulator
        );

        SumStats sample(const Parameter & par, const unsigned long int seed, const unsigned long int serial) const override;

    private:
        const std::vector<std::string> _par_names;
        const std::vector<std::string> _met_names;
        const SimFunPtr _simulator;
};

}

#endif // ABCPOP_ABCSIM_H
