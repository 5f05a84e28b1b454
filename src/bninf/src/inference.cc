#include "inference.h"
#include "exceptions.h"

namespace bninf {

Inference::Inference(const State &kState) : is_state_(true), state_(kState) {
}

Inference::Inference(const Tensor &kDistribution) : is_state_(false), distribution_(kDistribution) {
}

bool Inference::IsState() const {
    return is_state_;
}

bool Inference::IsDistribution() const {
    return !is_state_;
}

const State& Inference::GetState() const {
    if(!is_state_)
        throw InferenceException("Inference holds a distribution, not a state");
    return state_;
}

const Tensor& Inference::GetDistribution() const {
    if(is_state_)
        throw InferenceException("Inference holds the observed state %s, not a distribution", state_.c_str());
    return distribution_;
}

}
