#ifndef ABCPOP_PRIORS_H
#define ABCPOP_PRIORS_H

#include <cmath>
#include <memory>
#include <string>
#include <vector>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Parameter.h>

// Design goals for `Prior`s:
//  - can be integral or floating point
//  - "easy" to implement new concrete Priors
//  - has no state; sampling side-effects the RNG, *not* the prior
//  - does not need to know about other parameters (that is `ParameterPrior`'s job)

namespace ABCPOP {

// A `Prior` is the distribution of one named parameter.
class Prior {
    public:
        Prior(
            const std::string & s, const std::string & ss,
            const float_type mv, const float_type sv
        ) : name(s), short_name(ss == "" ? s : ss), meanval(mv), sdval(sv) {}
        virtual ~Prior() {}

        // get the parameter name (for printing, etc - can be whatever format)
        std::string get_name() const { return name; }
        // get the parameter short name (keys `Parameter`s; should be short and sanitized)
        std::string get_short_name() const { return short_name; }

        // sample from the prior; this side-effects the RNG *not* the prior
        virtual float_type sample(const gsl_rng * rng) const = 0;
        // compute the likelihood (density or mass) of a value
        virtual float_type likelihood(const float_type pval) const = 0;
        // if this is an integral parameter, flatten it to the appropriate integer, then recast to double
        virtual float_type recast(const float_type pval) const = 0;

        bool valid(const float_type pval) const { return likelihood(pval) != 0.0; }

        float_type get_mean() const { return meanval; }
        float_type get_sd() const { return sdval; }

    private:
        const std::string name;
        const std::string short_name;

    protected:
        const float_type meanval, sdval;
};

typedef std::shared_ptr<const Prior> PriorPtr;

struct GaussianPrior : public Prior {
    GaussianPrior(
        const std::string & nm, const std::string & snm,
        const float_type mn, const float_type sd
    );

    float_type sample(const gsl_rng * rng) const override { return gsl_ran_gaussian(rng, sdval) + meanval; }
    float_type likelihood(const float_type pval) const override { return gsl_ran_gaussian_pdf(pval - meanval, sdval); }
    float_type recast(const float_type pval) const override { return pval; }
};

struct DiscreteUniformPrior : public Prior {
    DiscreteUniformPrior(
        const std::string & nm, const std::string & snm,
        const long min, const long max
    );

    float_type sample(const gsl_rng * rng) const override;
    float_type likelihood(const float_type pval) const override;
    float_type recast(const float_type pval) const override { return static_cast<float_type>(std::round(pval)); }

    private:
        const long minval, maxval;
};

struct ContinuousUniformPrior : public Prior {
    ContinuousUniformPrior(
        const std::string & nm, const std::string & snm,
        const float_type min, const float_type max
    );

    float_type sample(const gsl_rng * rng) const override { return gsl_rng_uniform(rng)*(maxval-minval) + minval; }
    float_type likelihood(const float_type pval) const override;
    float_type recast(const float_type pval) const override { return pval; }

    private:
        const float_type minval, maxval;
};

// The joint prior of one model's parameters: independent named `Prior`s.
class ParameterPrior {
    public:
        ParameterPrior() {}
        ParameterPrior(const std::vector<PriorPtr> & priors);

        // throws std::invalid_argument on a duplicate short name
        void add_next_parameter(const PriorPtr & prior);

        Parameter rvs(const gsl_rng * rng) const;
        // product of the marginal likelihoods; 0 if `par` does not carry every name
        float_type pdf(const Parameter & par) const;
        // flatten integral parameters of a perturbed `par` back onto their lattice
        Parameter recast(const Parameter & par) const;

        size_t size() const { return _priors.size(); }
        const std::vector<std::string> & names() const { return _names; }
        const PriorPtr & at(const size_t idx) const { return _priors.at(idx); }

    private:
        std::vector<PriorPtr> _priors;
        std::vector<std::string> _names;
};

typedef std::shared_ptr<const ParameterPrior> ParameterPriorPtr;

// Discrete prior over model indices [0, nr_models).
class ModelPrior {
    public:
        // @param weights: non-negative, not all 0; normalized internally
        ModelPrior(const std::vector<float_type> & weights);
        // uniform over `nr_models`
        static ModelPrior uniform(const size_t nr_models);

        size_t rvs(const gsl_rng * rng) const;
        float_type pmf(const size_t model) const { return model < _pmf.size() ? _pmf[model] : 0.0; }
        size_t size() const { return _pmf.size(); }

    private:
        std::vector<float_type> _pmf;
};

}

#endif // ABCPOP_PRIORS_H
