#ifndef ABCPOP_METRIC_H
#define ABCPOP_METRIC_H

#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>
#include <AbcPop/TypeDefs.h>

namespace ABCPOP {

    // summary statistics, as produced by a model: statistic name => value
    typedef std::map<std::string, float_type> SumStats;

    // A `Metric` is one observed summary statistic.
    struct Metric {
        Metric(std::string s, std::string ss) : name(s), short_name(ss) {}
        virtual ~Metric() {}
        std::string get_name() const { return name; }
        std::string get_short_name() const { if (short_name == "") { return name; } else { return short_name; } }
        virtual bool is_integral() const = 0;
        virtual float_type get_obs_val() const = 0;

        private:
            std::string name;
            std::string short_name;
    };

    typedef std::shared_ptr<const Metric> MetricPtr;
    typedef std::vector<MetricPtr> MetricVec;

    // Type'd metric (as in, integer or float typed)
    template <NumericType NT>
    class TMetric : public Metric {
        public:
            TMetric(std::string s, std::string ss, float_type val) : Metric(s, ss), obs_val(val) {};

            bool is_integral() const override { if constexpr (std::is_integral_v<NT>) { return true; } else { return false; } }
            float_type get_obs_val() const override { return obs_val; }

        private:
            float_type obs_val;
    };

    // the observed data, keyed by metric (short) name
    inline SumStats observed_sum_stats(const MetricVec & mets) {
        SumStats obs;
        for (auto met : mets) { obs[met->get_short_name()] = met->get_obs_val(); }
        return obs;
    }

    inline std::vector<std::string> metric_names(const MetricVec & mets) {
        std::vector<std::string> names;
        for (auto met : mets) { names.push_back(met->get_short_name()); }
        return names;
    }
}

#endif // ABCPOP_METRIC_H
