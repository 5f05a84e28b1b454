#ifndef BNINF_INCLUDE_STATESPACE_H_
#define BNINF_INCLUDE_STATESPACE_H_

#include <gmpxx.h>
#include "contraction.h"
#include "types.h"

namespace bninf {

// Number of cells of a joint state space. Products of state counts overflow
// size_t quickly for wide networks, hence the arbitrary precision.
class StateSpace {
    public:
        typedef mpz_class StateSpaceSize;

        static StateSpaceSize GetSize(const Shape&);
        static StateSpaceSize GetSize(const LabelDimensions&);

        // throws a StateSpaceException when kSize exceeds a non zero kLimit
        static void Check(const StateSpaceSize &kSize, const StateSpaceSize &kLimit);

        static std::string ToString(const StateSpaceSize&);
};

}

#endif
