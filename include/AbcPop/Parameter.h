#ifndef ABCPOP_PARAMETER_H
#define ABCPOP_PARAMETER_H

#include <map>
#include <string>
#include <vector>
#include <AbcPop/TypeDefs.h>

// A `Parameter` is one proposed theta: parameter name => value.
// Ordered by name; never modified once proposed.
//
// Kernels and tables work with `Row`s, so conversion is always done against
// an explicit, ordered list of names (the model's `ParameterPrior::names()`).

namespace ABCPOP {

typedef std::map<std::string, float_type> Parameter;

// parameter values of many particles of one model, plus their weights
struct WeightedParameters {
    std::vector<std::string> names;
    Mat2D values;   // rows = particles, cols = parameters (in `names` order)
    Col weights;    // one per row; not necessarily normalized

    size_t size() const { return static_cast<size_t>(values.rows()); }
    bool empty() const { return values.rows() == 0; }
};

// throws std::out_of_range if `par` lacks one of `names`
Row as_row(const Parameter & par, const std::vector<std::string> & names);

Parameter as_parameter(const Row & vals, const std::vector<std::string> & names);

std::string to_string(const Parameter & par);

} // namespace ABCPOP

#endif // ABCPOP_PARAMETER_H
