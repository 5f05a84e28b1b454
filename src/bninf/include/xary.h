#ifndef BNINF_INCLUDE_XARY_H_
#define BNINF_INCLUDE_XARY_H_

#include <vector>
#include <algorithm>
#include <cstddef>
#include "types.h"

namespace bninf {

typedef size_t XAryBit;
typedef std::vector<XAryBit> XAryBits;

// Mixed radix number, one bit per tensor axis. The most significant bit is
// placed at index 0 so that counting visits a row-major tensor in memory order.
class XAry : public XAryBits {
    public:
        typedef XAryBit Bit;
        typedef std::vector<size_t> StepsizeList;
        typedef Shape Dimension;

    protected:
        Dimension dimension_;

    public:
        inline size_t Size() const {
            return size();
        }

        inline void SetZero(){
            std::fill(begin(),end(), 0);
        }

        inline void SetDimension(const Dimension &kDimension){
            dimension_ = kDimension;
            resize(kDimension.size());
            SetZero();
        }

        // get domain size
        inline size_t Max() const {
            size_t max = 1;
            for(auto it = dimension_.begin(); it != dimension_.end(); it++)
                max *= *it;

            return max;
        }

        // determine step size per xary bit
        static inline void CreateStepsizeList(const Dimension &kDimension, StepsizeList &stepsize_list){
            stepsize_list.resize(kDimension.size());
            if(stepsize_list.size() > 0){
                stepsize_list[stepsize_list.size()-1] = 1;
                for(int i = stepsize_list.size()-2; i >= 0; i--)
                    stepsize_list[i] = stepsize_list[i+1] * kDimension[i+1];
            }
        }

        // increment xary number by 1, returns the position of the most
        // significant bit that changed, or Size() on overflow
        inline size_t Increment(){
            size_t position = Size();
            while(position > 0){
                --position;
                Bit &bit = (*this)[position];
                if(bit+1 < dimension_[position]){
                    ++bit;
                    return position;
                }
                bit = 0;
            }
            return Size();
        }
};

}

#endif
