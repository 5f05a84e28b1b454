#include "options.h"

namespace bninf {

Options::Options(){
    tolerance = 1e-9;
    max_state_space = 0;
    validate_parents = false;
    verbose = false;
}

}
