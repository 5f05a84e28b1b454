#include <gtest/gtest.h>
#include <bninf/tensor.h>
#include <bninf/xary.h>
#include <bninf/exceptions.h>

using bninf::Tensor;
using bninf::Shape;

TEST(XAryTest, CountsInRowMajorOrder) {
    bninf::XAry xary;
    xary.SetDimension(Shape({2, 3}));
    EXPECT_EQ(xary.Max(), 6u);

    // least significant bit last, carries reported by position
    const size_t kExpectedBits[6][2] = {{0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 1}, {1, 2}};
    const size_t kExpectedPosition[6] = {1, 1, 0, 1, 1, 2};
    for(size_t i = 0; i < 6; i++){
        EXPECT_EQ(xary[0], kExpectedBits[i][0]);
        EXPECT_EQ(xary[1], kExpectedBits[i][1]);
        EXPECT_EQ(xary.Increment(), kExpectedPosition[i]);
    }

    // overflow wraps to zero
    EXPECT_EQ(xary[0], 0u);
    EXPECT_EQ(xary[1], 0u);
}

TEST(XAryTest, StepsizeList) {
    bninf::XAry::StepsizeList stepsize_list;
    bninf::XAry::CreateStepsizeList(Shape({2, 3, 4}), stepsize_list);

    ASSERT_EQ(stepsize_list.size(), 3u);
    EXPECT_EQ(stepsize_list[0], 12u);
    EXPECT_EQ(stepsize_list[1], 4u);
    EXPECT_EQ(stepsize_list[2], 1u);
}

TEST(XAryTest, EmptyDimensionCountsOnce) {
    bninf::XAry xary;
    xary.SetDimension(Shape());
    EXPECT_EQ(xary.Max(), 1u);
    EXPECT_EQ(xary.Increment(), xary.Size());
}

TEST(TensorTest, ShapeAndAccess) {
    Tensor tensor({2, 3}, {1, 2, 3,
                           4, 5, 6});

    EXPECT_EQ(tensor.Rank(), 2u);
    EXPECT_EQ(tensor.Size(), 6u);
    EXPECT_DOUBLE_EQ(tensor.At({0, 2}), 3);
    EXPECT_DOUBLE_EQ(tensor.At({1, 0}), 4);
    EXPECT_EQ(tensor.GetDimension(1), 3u);
}

TEST(TensorTest, RankZeroHoldsOneElement) {
    Tensor scalar;
    EXPECT_EQ(scalar.Rank(), 0u);
    EXPECT_EQ(scalar.Size(), 1u);
}

TEST(TensorTest, DataMustMatchShape) {
    EXPECT_THROW(Tensor({2, 2}, {1, 2, 3}), bninf::TensorException);
}

TEST(TensorTest, OutOfRangeIndexThrows) {
    Tensor tensor(Shape({2, 2}));
    EXPECT_THROW(tensor.At({2, 0}), bninf::TensorException);
    EXPECT_THROW(tensor.At({0}), bninf::TensorException);
    EXPECT_THROW(tensor.GetDimension(2), bninf::TensorException);
}

TEST(TensorTest, Normalize) {
    Tensor tensor = Tensor::Vector({1, 3});
    EXPECT_DOUBLE_EQ(tensor.Normalize(), 4);
    EXPECT_DOUBLE_EQ(tensor[0], 0.25);
    EXPECT_DOUBLE_EQ(tensor[1], 0.75);
    EXPECT_DOUBLE_EQ(tensor.Sum(), 1);
}

TEST(TensorTest, NormalizeWithoutMassThrows) {
    Tensor tensor(Shape({3}));
    EXPECT_THROW(tensor.Normalize(), bninf::TensorException);
}

TEST(TensorTest, SliceDropsAxis) {
    Tensor tensor({2, 3}, {1, 2, 3,
                           4, 5, 6});

    EXPECT_EQ(tensor.Slice(0, 1), Tensor::Vector({4, 5, 6}));
    EXPECT_EQ(tensor.Slice(1, 2), Tensor::Vector({3, 6}));
}

TEST(TensorTest, FixSeveralAxes) {
    Tensor tensor({2, 2, 2}, {0, 1,
                              2, 3,
                              4, 5,
                              6, 7});

    bninf::AxisFixing fixing;
    fixing[0] = 1;
    fixing[2] = 0;
    EXPECT_EQ(tensor.Fix(fixing), Tensor::Vector({4, 6}));

    fixing[1] = 1;
    Tensor scalar = tensor.Fix(fixing);
    EXPECT_EQ(scalar.Rank(), 0u);
    EXPECT_DOUBLE_EQ(scalar[0], 6);
}

TEST(TensorTest, FixOutOfRangeThrows) {
    Tensor tensor(Shape({2, 2}));
    EXPECT_THROW(tensor.Slice(0, 2), bninf::TensorException);
    EXPECT_THROW(tensor.Slice(2, 0), bninf::TensorException);
}

TEST(TensorTest, ApproxEqual) {
    Tensor a = Tensor::Vector({0.5, 0.5});
    Tensor b = Tensor::Vector({0.5 + 1e-12, 0.5});

    EXPECT_TRUE(a.ApproxEqual(b, 1e-9));
    EXPECT_FALSE(a == b);
    EXPECT_FALSE(a.ApproxEqual(Tensor({1, 2}, {0.5, 0.5}), 1e-9));
}
