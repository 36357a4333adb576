#ifndef ABCPOP_MEMOCELL_H
#define ABCPOP_MEMOCELL_H

#include <optional>

namespace ABCPOP {

// A lazily computed value: the first `get` computes and keeps it, until `reset`.
template<typename T>
class MemoCell {
    public:
        template<typename F>
        const T & get(F compute) {
            if (not _value) { _value.emplace(compute()); }
            return *_value;
        }

        bool has_value() const { return _value.has_value(); }
        void reset() { _value.reset(); }

    private:
        std::optional<T> _value;
};

}

#endif // ABCPOP_MEMOCELL_H
