#include "statespace.h"
#include "exceptions.h"

namespace bninf {

StateSpace::StateSpaceSize StateSpace::GetSize(const Shape &kShape){
    StateSpaceSize size = 1;
    for(auto it = kShape.begin(); it != kShape.end(); it++)
        size *= (unsigned long) *it;

    return size;
}

StateSpace::StateSpaceSize StateSpace::GetSize(const LabelDimensions &kDimensions){
    StateSpaceSize size = 1;
    for(auto it = kDimensions.begin(); it != kDimensions.end(); it++)
        size *= (unsigned long) it->second;

    return size;
}

void StateSpace::Check(const StateSpaceSize &kSize, const StateSpaceSize &kLimit){
    if(kLimit > 0 && kSize > kLimit)
        throw StateSpaceException("State space of %s cells exceeds the limit of %s cells", ToString(kSize).c_str(), ToString(kLimit).c_str());
}

std::string StateSpace::ToString(const StateSpaceSize &kSize){
    return kSize.get_str();
}

}
