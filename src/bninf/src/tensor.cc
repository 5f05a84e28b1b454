#include "tensor.h"
#include "exceptions.h"
#include "xary.h"
#include <cmath>
#include <sstream>
#include <numeric>

namespace bninf {

static size_t GetVolume(const Shape &kShape){
    size_t volume = 1;
    for(auto it = kShape.begin(); it != kShape.end(); it++)
        volume *= *it;
    return volume;
}

Tensor::Tensor() : data_(1, 0) {
}

Tensor::Tensor(const Shape &kShape) : shape_(kShape), data_(GetVolume(kShape), 0) {
}

Tensor::Tensor(const Shape &kShape, const Data &kData) : shape_(kShape), data_(kData) {
    if(GetVolume(shape_) != data_.size())
        throw TensorException("Shape holds %lu elements, but %lu were given", GetVolume(shape_), data_.size());
}

Tensor Tensor::Vector(const Data &kData){
    return Tensor(Shape(1, kData.size()), kData);
}

size_t Tensor::Rank() const {
    return shape_.size();
}

size_t Tensor::Size() const {
    return data_.size();
}

const Shape& Tensor::GetShape() const {
    return shape_;
}

size_t Tensor::GetDimension(const Axis kAxis) const {
    if(kAxis >= shape_.size())
        throw TensorException("Axis %lu out of range for tensor of rank %lu", kAxis, shape_.size());
    return shape_[kAxis];
}

const Tensor::Data& Tensor::GetData() const {
    return data_;
}

size_t Tensor::GetOffset(const Index &kIndex) const {
    if(kIndex.size() != shape_.size())
        throw TensorException("Index of rank %lu used on tensor of rank %lu", kIndex.size(), shape_.size());

    size_t offset = 0;
    for(unsigned int i = 0; i < kIndex.size(); i++){
        if(kIndex[i] >= shape_[i])
            throw TensorException("Index %lu out of range on axis %u (dimension %lu)", kIndex[i], i, shape_[i]);
        offset = offset * shape_[i] + kIndex[i];
    }
    return offset;
}

probability_t Tensor::At(const Index &kIndex) const {
    return data_[GetOffset(kIndex)];
}

probability_t& Tensor::At(const Index &kIndex){
    return data_[GetOffset(kIndex)];
}

probability_t Tensor::Sum() const {
    return std::accumulate(data_.begin(), data_.end(), (probability_t) 0);
}

probability_t Tensor::Normalize(){
    const probability_t kSum = Sum();
    if(!(kSum > 0) || !std::isfinite(kSum))
        throw TensorException("Cannot normalize a tensor with total %g", kSum);

    for(auto it = data_.begin(); it != data_.end(); it++)
        *it /= kSum;

    return kSum;
}

Tensor Tensor::Slice(const Axis kAxis, const size_t kValue) const {
    AxisFixing fixing;
    fixing[kAxis] = kValue;
    return Fix(fixing);
}

Tensor Tensor::Fix(const AxisFixing &kFixing) const {
    for(auto it = kFixing.begin(); it != kFixing.end(); it++)
        if(it->first >= shape_.size())
            throw TensorException("Axis %lu out of range for tensor of rank %lu", it->first, shape_.size());

    XAry::StepsizeList stepsize_list;
    XAry::CreateStepsizeList(shape_, stepsize_list);

    // offset contributed by the fixed axes, and steps of the free ones
    size_t base = 0;
    Shape shape;
    XAry::StepsizeList free_steps;
    for(Axis axis = 0; axis < shape_.size(); axis++){
        auto it = kFixing.find(axis);
        if(it != kFixing.end()){
            if(it->second >= shape_[axis])
                throw TensorException("Cannot fix axis %lu to %lu (dimension %lu)", axis, it->second, shape_[axis]);
            base += it->second * stepsize_list[axis];
        } else {
            shape.push_back(shape_[axis]);
            free_steps.push_back(stepsize_list[axis]);
        }
    }

    Tensor result(shape);
    XAry xary;
    xary.SetDimension(shape);
    const size_t kMax = result.Size();
    for(size_t i = 0; i < kMax; i++){
        size_t offset = base;
        for(unsigned int j = 0; j < xary.Size(); j++)
            offset += xary[j] * free_steps[j];

        result.data_[i] = data_[offset];
        xary.Increment();
    }

    return result;
}

bool Tensor::ApproxEqual(const Tensor &kOther, const probability_t kTolerance) const {
    if(shape_ != kOther.shape_)
        return false;

    for(unsigned int i = 0; i < data_.size(); i++)
        if(std::fabs(data_[i] - kOther.data_[i]) > kTolerance)
            return false;

    return true;
}

bool Tensor::operator==(const Tensor &kOther) const {
    return shape_ == kOther.shape_ && data_ == kOther.data_;
}

bool Tensor::operator!=(const Tensor &kOther) const {
    return !(*this == kOther);
}

std::string Tensor::ToString() const {
    std::ostringstream ss;
    ss << "Tensor(";
    for(unsigned int i = 0; i < shape_.size(); i++)
        ss << (i > 0 ? "x" : "") << shape_[i];
    ss << ") [";
    for(unsigned int i = 0; i < data_.size(); i++)
        ss << (i > 0 ? ", " : "") << data_[i];
    ss << "]";
    return ss.str();
}

std::ostream& operator<<(std::ostream &os, const Tensor &kTensor){
    return os << kTensor.ToString();
}

}
