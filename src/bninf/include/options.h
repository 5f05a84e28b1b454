#ifndef BNINF_INCLUDE_OPTIONS_H_
#define BNINF_INCLUDE_OPTIONS_H_

#include <gmpxx.h>
#include <string>
#include "types.h"

namespace bninf {

struct Options {
    Options();

    // a result must sum to one within this tolerance
    probability_t tolerance;

    // largest number of cells a single contraction may iterate, 0 (the
    // default) is unlimited
    mpz_class max_state_space;

    // check that declared parents are a permutation of the structural parents
    bool validate_parents;

    bool verbose;

    // Log() output goes to one file per process: applying these options
    // through BayesianNetwork also redirects the log of every other network,
    // and an empty name turns file logging off for all of them
    std::string logfile;
};

}

#endif
