#include "contraction.h"
#include "exceptions.h"
#include "xary.h"
#include <algorithm>
#include <set>

namespace bninf {

typedef std::vector<long> StepList;

LabelDimensions GetLabelDimensions(const ContractionInputs &kInputs){
    LabelDimensions dimensions;
    for(unsigned int i = 0; i < kInputs.size(); i++){
        const ContractionInput &kInput = kInputs[i];
        if(kInput.tensor == NULL)
            throw ContractionException("Input %u has no tensor", i);

        const Shape &kShape = kInput.tensor->GetShape();
        if(kShape.size() != kInput.labels.size())
            throw ContractionException("Input %u has rank %lu, but %lu labels", i, kShape.size(), kInput.labels.size());

        std::set<Label> seen;
        for(unsigned int axis = 0; axis < kShape.size(); axis++){
            const Label kLabel = kInput.labels[axis];
            if(!seen.insert(kLabel).second)
                throw ContractionException("Label %u repeats within input %u", kLabel, i);

            auto it = dimensions.find(kLabel);
            if(it == dimensions.end())
                dimensions[kLabel] = kShape[axis];
            else if(it->second != kShape[axis])
                throw ContractionException("Label %u has dimension %lu in input %u, expected %lu", kLabel, kShape[axis], i, it->second);
        }
    }
    return dimensions;
}

// Step of every counter position in a tensor whose axes carry kLabels. The
// step is zero for positions the tensor does not carry.
static StepList CreateStepList(const LabelList &kCounterLabels, const LabelList &kLabels, const Shape &kShape){
    XAry::StepsizeList stepsize_list;
    XAry::CreateStepsizeList(kShape, stepsize_list);

    StepList steps(kCounterLabels.size(), 0);
    for(unsigned int axis = 0; axis < kLabels.size(); axis++){
        const unsigned int kPosition = std::distance(kCounterLabels.begin(), std::find(kCounterLabels.begin(), kCounterLabels.end(), kLabels[axis]));
        steps[kPosition] = stepsize_list[axis];
    }
    return steps;
}

// Offset change when the counter increments at position p: bit p goes up by
// one and every less significant bit wraps back to zero.
static StepList CreateCarryList(const StepList &kSteps, const Shape &kDimension){
    StepList carry(kSteps.size(), 0);
    long wrapped = 0;
    for(int p = kSteps.size()-1; p >= 0; p--){
        carry[p] = kSteps[p] - wrapped;
        wrapped += (long)(kDimension[p]-1) * kSteps[p];
    }
    return carry;
}

Tensor Contract(const ContractionInputs &kInputs, const LabelList &kOutput){
    const LabelDimensions kDimensions = GetLabelDimensions(kInputs);

    // output labels are the most significant counter positions, so that all
    // terms of one output cell are visited consecutively
    LabelList counter_labels;
    Shape counter_dimension;
    Shape output_shape;
    for(auto it = kOutput.begin(); it != kOutput.end(); it++){
        auto dim_it = kDimensions.find(*it);
        if(dim_it == kDimensions.end())
            throw ContractionException("Output label %u does not appear in any input", *it);
        if(std::find(counter_labels.begin(), counter_labels.end(), *it) != counter_labels.end())
            throw ContractionException("Output label %u repeats", *it);

        counter_labels.push_back(*it);
        counter_dimension.push_back(dim_it->second);
        output_shape.push_back(dim_it->second);
    }

    for(auto in_it = kInputs.begin(); in_it != kInputs.end(); in_it++)
        for(auto it = in_it->labels.begin(); it != in_it->labels.end(); it++)
            if(std::find(counter_labels.begin(), counter_labels.end(), *it) == counter_labels.end()){
                counter_labels.push_back(*it);
                counter_dimension.push_back(kDimensions.find(*it)->second);
            }

    Tensor result(output_shape);
    XAry xary;
    xary.SetDimension(counter_dimension);
    const size_t kCells = xary.Max();
    if(kCells == 0)
        return result;

    const unsigned int kNrInputs = kInputs.size();
    std::vector<const probability_t*> data(kNrInputs);
    std::vector<StepList> carry(kNrInputs);
    std::vector<long> offset(kNrInputs, 0);
    for(unsigned int i = 0; i < kNrInputs; i++){
        data[i] = &(kInputs[i].tensor->GetData()[0]);
        carry[i] = CreateCarryList(CreateStepList(counter_labels, kInputs[i].labels, kInputs[i].tensor->GetShape()), counter_dimension);
    }
    const StepList kOutputCarry = CreateCarryList(CreateStepList(counter_labels, kOutput, output_shape), counter_dimension);
    long output_offset = 0;

    for(size_t cell = 0; cell < kCells; cell++){
        probability_t product = 1;
        for(unsigned int i = 0; i < kNrInputs && product != 0; i++)
            product *= data[i][offset[i]];

        result[output_offset] += product;

        const size_t kPosition = xary.Increment();
        if(kPosition == xary.Size())
            break;

        for(unsigned int i = 0; i < kNrInputs; i++)
            offset[i] += carry[i][kPosition];
        output_offset += kOutputCarry[kPosition];
    }

    return result;
}

}
