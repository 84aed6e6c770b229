#include "BinaryLabelDataset.hpp"
#include "types.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Columns: id, sex, race, x. The id column identifies rows after shuffling.
static BinaryLabelDataset makeDataset(int n)
{
    Matrix X(n, 4);
    Vector y(n);
    for (int i = 0; i < n; ++i)
    {
        X(i, 0) = i;
        X(i, 1) = i % 2;
        X(i, 2) = (i / 2) % 2;
        X(i, 3) = 0.5 * i;
        y(i) = i % 3 == 0 ? 1.0 : 0.0;
    }
    return BinaryLabelDataset(X, y, {"id", "sex", "race", "x"}, {"sex", "race"});
}

TEST(BinaryLabelDatasetTest, DefaultWeightsAreOne)
{
    BinaryLabelDataset data = makeDataset(6);
    EXPECT_EQ(data.numInstances(), 6);
    EXPECT_EQ(data.numFeatures(), 4);
    EXPECT_TRUE(data.instanceWeights().isApprox(Vector::Ones(6)));
}

TEST(BinaryLabelDatasetTest, ProtectedAttributeValuesAreCopiedFromFeatures)
{
    BinaryLabelDataset data = makeDataset(6);
    Vector sex = data.protectedAttributeValues("sex");
    ASSERT_EQ(sex.size(), 6);
    for (int i = 0; i < 6; ++i)
        EXPECT_DOUBLE_EQ(sex(i), i % 2);

    EXPECT_TRUE(data.hasProtectedAttribute("race"));
    EXPECT_FALSE(data.hasProtectedAttribute("x"));
    EXPECT_THROW(data.protectedAttributeValues("age"), std::invalid_argument);
}

TEST(BinaryLabelDatasetTest, UnknownProtectedAttributeIsRejected)
{
    Matrix X = Matrix::Zero(3, 2);
    Vector y = Vector::Zero(3);
    EXPECT_THROW(BinaryLabelDataset(X, y, {"a", "b"}, {"sex"}), std::invalid_argument);
    EXPECT_THROW(BinaryLabelDataset(X, y, {"a", "b"}, {}), std::invalid_argument);
    EXPECT_THROW(BinaryLabelDataset(X, y, {"a"}, {"a"}), std::invalid_argument);
}

TEST(BinaryLabelDatasetTest, InvalidLabelsAndWeightsAreRejected)
{
    Matrix X = Matrix::Zero(3, 1);
    Vector badLabels(3);
    badLabels << 0.0, 1.0, 2.0;
    EXPECT_THROW(BinaryLabelDataset(X, badLabels, {"sex"}, {"sex"}), std::invalid_argument);

    Vector labels(3);
    labels << 0.0, 1.0, 1.0;
    Vector negativeWeights(3);
    negativeWeights << 1.0, -1.0, 1.0;
    EXPECT_THROW(BinaryLabelDataset(X, labels, {"sex"}, {"sex"}, negativeWeights), std::invalid_argument);

    Vector shortLabels = Vector::Zero(2);
    EXPECT_THROW(BinaryLabelDataset(X, shortLabels, {"sex"}, {"sex"}), std::invalid_argument);
}

TEST(BinaryLabelDatasetTest, DropFeaturesKeepsGroupMembership)
{
    BinaryLabelDataset data = makeDataset(8);
    BinaryLabelDataset dropped = data.dropFeatures({1});

    EXPECT_EQ(dropped.numFeatures(), 3);
    EXPECT_EQ(dropped.featureNames(), (std::vector<std::string>{"id", "race", "x"}));
    EXPECT_TRUE(dropped.protectedAttributeValues("sex").isApprox(data.protectedAttributeValues("sex")));

    // Only race still has a feature column, now at position 1
    EXPECT_EQ(dropped.protectedFeatureColumns(), (IndexList{1}));
    EXPECT_EQ(data.protectedFeatureColumns(), (IndexList{1, 2}));

    EXPECT_THROW(data.dropFeatures({0, 1, 2, 3}), std::invalid_argument);
    EXPECT_THROW(data.dropFeatures({4}), std::out_of_range);
}

TEST(BinaryLabelDatasetTest, SubsetFollowsGivenOrder)
{
    BinaryLabelDataset data = makeDataset(10);
    BinaryLabelDataset sub = data.subset({7, 2, 5});

    ASSERT_EQ(sub.numInstances(), 3);
    EXPECT_DOUBLE_EQ(sub.features()(0, 0), 7.0);
    EXPECT_DOUBLE_EQ(sub.features()(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(sub.features()(2, 0), 5.0);
    EXPECT_DOUBLE_EQ(sub.labels()(1), data.labels()(2));
    EXPECT_DOUBLE_EQ(sub.protectedAttributeValues("sex")(0), 1.0);

    EXPECT_THROW(data.subset({0, 10}), std::out_of_range);
    EXPECT_THROW(data.subset({}), std::invalid_argument);
}

TEST(BinaryLabelDatasetTest, WithLabelsLeavesSourceUntouched)
{
    BinaryLabelDataset data = makeDataset(5);
    Vector predictions = Vector::Ones(5);
    BinaryLabelDataset predicted = data.withLabels(predictions);

    EXPECT_TRUE(predicted.labels().isApprox(predictions));
    EXPECT_FALSE(data.labels().isApprox(predictions));
    EXPECT_TRUE(predicted.features().isApprox(data.features()));
    EXPECT_THROW(data.withLabels(Vector::Ones(4)), std::invalid_argument);
}

TEST(BinaryLabelDatasetTest, SplitPartitionsAllRows)
{
    BinaryLabelDataset data = makeDataset(10);
    auto [first, second] = data.split(0.7, 16);

    EXPECT_EQ(first.numInstances(), 7);
    EXPECT_EQ(second.numInstances(), 3);

    std::set<int> ids;
    for (const BinaryLabelDataset *part : {&first, &second})
    {
        for (Eigen::Index i = 0; i < part->numInstances(); ++i)
            ids.insert(static_cast<int>(part->features()(i, 0)));
    }
    EXPECT_EQ(ids.size(), 10u);

    // Same seed, same split
    auto [again, rest] = data.split(0.7, 16);
    EXPECT_TRUE(again.features().isApprox(first.features()));

    EXPECT_THROW(data.split(1.0, 16), std::invalid_argument);
    EXPECT_THROW(data.split(0.01, 16), std::invalid_argument);
}
