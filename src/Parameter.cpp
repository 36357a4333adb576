#include <AbcPop/Parameter.h>

#include <cassert>
#include <sstream>

namespace ABCPOP {

Row as_row(const Parameter & par, const std::vector<std::string> & names) {
    Row row(names.size());
    for (size_t i = 0; i < names.size(); ++i) { row[i] = par.at(names[i]); }
    return row;
}

Parameter as_parameter(const Row & vals, const std::vector<std::string> & names) {
    assert(static_cast<size_t>(vals.size()) == names.size());
    Parameter par;
    for (size_t i = 0; i < names.size(); ++i) { par.emplace(names[i], vals[i]); }
    return par;
}

std::string to_string(const Parameter & par) {
    std::stringstream ss;
    ss << "{";
    for (auto it = par.begin(); it != par.end(); ++it) {
        if (it != par.begin()) { ss << ", "; }
        ss << it->first << ": " << it->second;
    }
    ss << "}";
    return ss.str();
}

} // namespace ABCPOP
