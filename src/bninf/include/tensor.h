#ifndef BNINF_INCLUDE_TENSOR_H_
#define BNINF_INCLUDE_TENSOR_H_

#include <vector>
#include <map>
#include <string>
#include <ostream>
#include "types.h"

namespace bninf {

typedef std::vector<size_t>         Index;
typedef std::map<Axis, size_t>      AxisFixing;

// Dense row-major tensor of probabilities. A tensor of rank 0 holds a single
// element.
class Tensor {
    public:
        typedef std::vector<probability_t> Data;

        Tensor();
        explicit Tensor(const Shape&);
        Tensor(const Shape&, const Data&);

        static Tensor Vector(const Data&);

        size_t Rank() const;
        size_t Size() const;
        const Shape& GetShape() const;
        size_t GetDimension(const Axis) const;
        const Data& GetData() const;

        size_t GetOffset(const Index&) const;
        probability_t At(const Index&) const;
        probability_t& At(const Index&);
        probability_t operator[](const size_t kOffset) const { return data_[kOffset]; };
        probability_t& operator[](const size_t kOffset) { return data_[kOffset]; };

        probability_t Sum() const;
        probability_t Normalize();

        // fix one axis to a value and drop it
        Tensor Slice(const Axis, const size_t) const;
        // fix several axes at once, the remaining axes keep their order
        Tensor Fix(const AxisFixing&) const;

        bool ApproxEqual(const Tensor&, const probability_t kTolerance) const;
        bool operator==(const Tensor&) const;
        bool operator!=(const Tensor&) const;

        std::string ToString() const;

    private:
        Shape shape_;
        Data data_;
};

std::ostream& operator<<(std::ostream&, const Tensor&);

}

#endif
