#ifndef ABCPOP_DISTANCE_H
#define ABCPOP_DISTANCE_H

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>

#include <AbcPop/TypeDefs.h>
#include <AbcPop/Metric.h>

namespace ABCPOP {

// Distance between simulated and observed summary statistics. Only the statistics
// named in the observed data (`x0`) are compared; a missing simulated statistic is an error.
class Distance {
    public:
        virtual ~Distance() {}

        // called once with the summary statistics of the prior sample, before any evaluation
        virtual void initialize(const std::vector<SumStats> & /* prior_sum_stats */) {}

        virtual float_type operator()(const SumStats & x, const SumStats & x0) const = 0;

        virtual Json::Value to_json() const = 0;
};

typedef std::shared_ptr<Distance> DistancePtr;

// rebuilds an initialized distance from its `to_json()`; throws std::invalid_argument for an unknown type
DistancePtr distance_from_json(const Json::Value & json);

// weighted L^p norm of the difference; p may be infinity
class PNormDistance : public Distance {
    public:
        PNormDistance(const float_type p = 2.0, const std::map<std::string, float_type> & weights = {});

        float_type operator()(const SumStats & x, const SumStats & x0) const override;
        Json::Value to_json() const override;

        float_type p() const { return _p; }

    protected:
        float_type weight(const std::string & key) const;

        const float_type _p;
        std::map<std::string, float_type> _weights; // missing keys weigh 1
};

// euclidean distance, each statistic scaled by its standard deviation over the prior sample
class ZScoreDistance : public PNormDistance {
    public:
        ZScoreDistance() : PNormDistance(2.0) {}

        void initialize(const std::vector<SumStats> & prior_sum_stats) override;
        Json::Value to_json() const override;
};

}

#endif // ABCPOP_DISTANCE_H
