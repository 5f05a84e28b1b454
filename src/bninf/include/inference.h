#ifndef BNINF_INCLUDE_INFERENCE_H_
#define BNINF_INCLUDE_INFERENCE_H_

#include "tensor.h"
#include "types.h"

namespace bninf {

// Answer to an inference query: either the state a variable is clamped to by
// evidence, or its posterior distribution.
class Inference {
    public:
        explicit Inference(const State&);
        explicit Inference(const Tensor&);

        bool IsState() const;
        bool IsDistribution() const;
        const State& GetState() const;
        const Tensor& GetDistribution() const;

    private:
        bool is_state_;
        State state_;
        Tensor distribution_;
};

}

#endif
