#ifndef ABCPOP_TRANSITION_H
#define ABCPOP_TRANSITION_H

#include <memory>
#include <string>
#include <vector>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>
#include <gsl/gsl_matrix.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Parameter.h>

namespace ABCPOP {

enum NOISE { INDEPENDENT, MULTIVARIATE };

// A perturbation kernel for one model: fitted to the previous generation's weighted
// parameters, then used to propose new parameters and to evaluate proposal densities.
//
// A `Transition` is fitted once and then only read; a new generation gets a fresh
// `clone()` rather than a refit of the old object.
class Transition {
    public:
        Transition(const float_type scaling) : _scaling(scaling) {}
        virtual ~Transition() {}

        // @param sample: must be non-empty; weights need not be normalized, and may be (nearly) all 0
        void fit(const WeightedParameters & sample);
        Parameter rvs(const gsl_rng * rng) const;
        float_type pdf(const Parameter & par) const;

        // an unfitted copy with the same configuration
        virtual std::unique_ptr<Transition> clone() const = 0;

        bool is_fitted() const { return _fitted; }
        const std::vector<std::string> & names() const { return _names; }
        float_type scaling() const { return _scaling; }

    protected:
        virtual void _fit() = 0;
        virtual Row _perturb(const gsl_rng * rng, const Row & center) const = 0;
        // kernel density of `x` given it was perturbed from `center`
        virtual float_type _density(const Row & x, const Row & center) const = 0;

        const float_type _scaling;
        std::vector<std::string> _names;
        Mat2D _values;
        Col _weights; // normalized

    private:
        bool _fitted = false;
        std::shared_ptr<gsl_ran_discrete_t> _resampler;
};

typedef std::shared_ptr<const Transition> TransitionPtr;

// Weighted resampling + independent gaussian noise on each parameter, with variance
// `scaling` times the weighted variance of the fitted sample (the "doubled variance" kernel by default).
class IndependentNormalTransition : public Transition {
    public:
        IndependentNormalTransition(const float_type scaling = 2.0) : Transition(scaling) {}
        std::unique_ptr<Transition> clone() const override { return std::make_unique<IndependentNormalTransition>(_scaling); }

        const Row & sd() const { return _sd; }

    protected:
        void _fit() override;
        Row _perturb(const gsl_rng * rng, const Row & center) const override;
        float_type _density(const Row & x, const Row & center) const override;

    private:
        Row _sd;
};

// Weighted resampling + multivariate gaussian noise, covariance `scaling` times the
// weighted variance-covariance matrix of the fitted sample.
class MultivariateNormalTransition : public Transition {
    public:
        MultivariateNormalTransition(const float_type scaling = 2.0) : Transition(scaling) {}
        std::unique_ptr<Transition> clone() const override { return std::make_unique<MultivariateNormalTransition>(_scaling); }

        const Mat2D & covariance() const { return _sigma; }

    protected:
        void _fit() override;
        Row _perturb(const gsl_rng * rng, const Row & center) const override;
        float_type _density(const Row & x, const Row & center) const override;

    private:
        Mat2D _sigma;
        std::shared_ptr<gsl_matrix> _L; // cholesky factor, lower triangle
};

std::unique_ptr<Transition> make_transition(const NOISE noise, const float_type scaling = 2.0);

// smallest variance a kernel will use for a parameter centered around `mean`
float_type variance_floor(const float_type mean);

// Discrete transition kernel over model indices: stay with `probability_to_stay`,
// otherwise jump uniformly to one of the other models.
class ModelPerturbationKernel {
    public:
        ModelPerturbationKernel(const size_t nr_models, const float_type probability_to_stay = 0.7);

        size_t rvs(const size_t source, const gsl_rng * rng) const;
        float_type pmf(const size_t target, const size_t source) const;

        size_t size() const { return _nr_models; }
        float_type probability_to_stay() const { return _p_stay; }

    private:
        const size_t _nr_models;
        const float_type _p_stay;
};

}

#endif // ABCPOP_TRANSITION_H
