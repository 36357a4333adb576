#include <AbcPop/Epsilon.h>
#include <AbcPop/AbcUtil.h>

#include <cmath>
#include <limits>
#include <stdexcept>

using std::vector;

namespace ABCPOP {

Json::Value ConstantEpsilon::to_json() const {
    Json::Value res;
    res["type"] = "CONSTANT";
    res["value"] = _value;
    return res;
}

ListEpsilon::ListEpsilon(const vector<float_type> & values) : _values(values) {
    if (values.empty()) { throw std::invalid_argument("ListEpsilon: no values"); }
}

Json::Value ListEpsilon::to_json() const {
    Json::Value res;
    res["type"] = "LIST";
    for (auto v : _values) { res["values"].append(v); }
    return res;
}

MedianEpsilon::MedianEpsilon(
    const float_type initial, const float_type multiplier
) : _initial(initial), _multiplier(multiplier) {
    if (not (multiplier > 0)) { throw std::invalid_argument("MedianEpsilon: multiplier must be positive"); }
}

std::shared_ptr<MedianEpsilon> MedianEpsilon::from_sample(const float_type multiplier) {
    auto res = std::make_shared<MedianEpsilon>(std::numeric_limits<float_type>::infinity(), multiplier);
    res->_from_sample = true;
    return res;
}

void MedianEpsilon::initialize(const vector<SumStats> & prior_sum_stats, const DistanceToObserved & distance_to_observed) {
    if (not _from_sample or prior_sum_stats.empty()) return;
    Col distances(prior_sum_stats.size());
    for (size_t i = 0; i < prior_sum_stats.size(); ++i) { distances[i] = distance_to_observed(prior_sum_stats[i]); }
    _initial = median(distances);
}

float_type MedianEpsilon::operator()(const size_t t, const History & history) const {
    if (t == 0) { return _initial; }
    const auto [distances, weights] = history.get_weighted_distances(t - 1);
    if (distances.size() == 0) {
        throw std::logic_error("MedianEpsilon: generation " + std::to_string(t - 1) + " is empty");
    }
    return _multiplier * weighted_median(distances, weights);
}

Json::Value MedianEpsilon::to_json() const {
    Json::Value res;
    res["type"] = "MEDIAN";
    if (_from_sample) { res["initial"] = "from_sample"; } else { res["initial"] = _initial; }
    res["multiplier"] = _multiplier;
    return res;
}

}
