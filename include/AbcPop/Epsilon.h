#ifndef ABCPOP_EPSILON_H
#define ABCPOP_EPSILON_H

#include <memory>
#include <vector>
#include <json/json.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Metric.h>
#include <AbcPop/AbcSim.h>
#include <AbcPop/History.h>

namespace ABCPOP {

// The acceptance threshold schedule.
class Epsilon {
    public:
        virtual ~Epsilon() {}

        // called once, after the distance has been initialized, with the prior sample's summary statistics
        virtual void initialize(
            const std::vector<SumStats> & /* prior_sum_stats */,
            const DistanceToObserved & /* distance_to_observed */
        ) {}

        // threshold for generation `t`; `history` holds generations [0, t)
        virtual float_type operator()(const size_t t, const History & history) const = 0;

        virtual Json::Value to_json() const = 0;
};

typedef std::shared_ptr<Epsilon> EpsilonPtr;

class ConstantEpsilon : public Epsilon {
    public:
        ConstantEpsilon(const float_type value) : _value(value) {}
        float_type operator()(const size_t, const History &) const override { return _value; }
        Json::Value to_json() const override;

    private:
        const float_type _value;
};

// one value per generation; throws std::out_of_range past the end
class ListEpsilon : public Epsilon {
    public:
        ListEpsilon(const std::vector<float_type> & values);
        float_type operator()(const size_t t, const History &) const override { return _values.at(t); }
        Json::Value to_json() const override;

    private:
        const std::vector<float_type> _values;
};

// t = 0: `initial` (or, with `from_sample`, the median prior sample distance);
// t > 0: `multiplier` times the weighted median particle distance of generation t-1
class MedianEpsilon : public Epsilon {
    public:
        MedianEpsilon(const float_type initial, const float_type multiplier = 1.0);
        // initial value computed from the prior sample
        static std::shared_ptr<MedianEpsilon> from_sample(const float_type multiplier = 1.0);

        void initialize(const std::vector<SumStats> & prior_sum_stats, const DistanceToObserved & distance_to_observed) override;
        float_type operator()(const size_t t, const History & history) const override;
        Json::Value to_json() const override;

        float_type initial() const { return _initial; }

    private:
        float_type _initial;
        const float_type _multiplier;
        bool _from_sample = false;
};

}

#endif // ABCPOP_EPSILON_H
