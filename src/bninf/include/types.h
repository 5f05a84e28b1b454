#ifndef BNINF_INCLUDE_TYPES_H_
#define BNINF_INCLUDE_TYPES_H_

#include <digraph/digraph.h>
#include <string>
#include <vector>
#include <cstddef>

namespace bninf {

typedef double                  probability_t;
typedef std::string             State;
typedef std::vector<State>      StateList;

// contraction index identifier, one per network vertex
typedef unsigned int            Label;
typedef std::vector<Label>      LabelList;

typedef size_t                  Axis;
typedef std::vector<size_t>     Shape;

}

#endif
