#ifndef BNINF_INCLUDE_CONTRACTION_H_
#define BNINF_INCLUDE_CONTRACTION_H_

#include <vector>
#include <map>
#include "tensor.h"
#include "types.h"

namespace bninf {

// a tensor together with one label per axis
struct ContractionInput {
    ContractionInput(const Tensor *kTensor, const LabelList &kLabels) : tensor(kTensor), labels(kLabels) {};
    const Tensor *tensor;
    LabelList labels;
};

typedef std::vector<ContractionInput>   ContractionInputs;
typedef std::map<Label, size_t>         LabelDimensions;

// Collects the dimension of every label used by the inputs. Throws a
// ContractionException when a label list does not match its tensor's rank,
// when a label repeats within one input, or when two inputs disagree on the
// dimension of a shared label.
LabelDimensions GetLabelDimensions(const ContractionInputs&);

// Einstein summation: every element of the result is the sum, over all labels
// not in kOutput, of the product of the matching elements of every input.
Tensor Contract(const ContractionInputs&, const LabelList &kOutput);

}

#endif
