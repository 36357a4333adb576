#include <AbcPop/Distance.h>
#include <AbcPop/AbcUtil.h>

#include <cmath>
#include <limits>
#include <stdexcept>

using std::string;
using std::vector;

namespace ABCPOP {

PNormDistance::PNormDistance(
    const float_type p, const std::map<string, float_type> & weights
) : _p(p), _weights(weights) {
    if (not (p >= 1.0)) { throw std::invalid_argument("PNormDistance: p must be >= 1"); }
    for (auto & [key, w] : weights) {
        if (not (std::isfinite(w) and w >= 0)) { throw std::invalid_argument("PNormDistance: bad weight for " + key); }
    }
}

float_type PNormDistance::weight(const string & key) const {
    auto it = _weights.find(key);
    return it == _weights.end() ? 1.0 : it->second;
}

float_type PNormDistance::operator()(const SumStats & x, const SumStats & x0) const {
    float_type res = 0.0;
    for (auto & [key, obs] : x0) {
        auto it = x.find(key);
        if (it == x.end()) { throw std::out_of_range("PNormDistance: simulated statistics lack " + key); }
        const float_type d = weight(key) * std::fabs(it->second - obs);
        if (std::isinf(_p)) {
            res = std::max(res, d);
        } else {
            res += std::pow(d, _p);
        }
    }
    return std::isinf(_p) ? res : std::pow(res, 1.0 / _p);
}

Json::Value PNormDistance::to_json() const {
    Json::Value res;
    res["type"] = "PNORM";
    res["p"] = std::isinf(_p) ? Json::Value("inf") : Json::Value(_p);
    if (not _weights.empty()) {
        for (auto & [key, w] : _weights) { res["weights"][key] = w; }
    }
    return res;
}

DistancePtr distance_from_json(const Json::Value & json) {
    const std::string type = json.get("type", "PNORM").asString();
    if (type != "PNORM" and type != "ZSCORE") { throw std::invalid_argument("Unknown distance type: " + type); }
    std::map<string, float_type> weights;
    for (auto & key : json["weights"].getMemberNames()) { weights[key] = json["weights"][key].asDouble(); }
    const Json::Value & jp = json.get("p", 2.0);
    const float_type p = jp.isString() ? std::numeric_limits<float_type>::infinity() : jp.asDouble();
    // a z-score distance is a weighted 2-norm, once its scales are known
    return std::make_shared<PNormDistance>(p, weights);
}

void ZScoreDistance::initialize(const vector<SumStats> & prior_sum_stats) {
    _weights.clear();
    if (prior_sum_stats.empty()) return;

    std::map<string, vector<float_type>> columns;
    for (auto & ss : prior_sum_stats) {
        for (auto & [key, val] : ss) { columns[key].push_back(val); }
    }
    for (auto & [key, vals] : columns) {
        Col data = Eigen::Map<Col>(vals.data(), vals.size());
        const float_type sd = std::sqrt(variance(data, data.mean()));
        _weights[key] = (sd > 0 and std::isfinite(sd)) ? 1.0 / sd : 1.0;
    }
}

Json::Value ZScoreDistance::to_json() const {
    Json::Value res = PNormDistance::to_json();
    res["type"] = "ZSCORE";
    return res;
}

}
