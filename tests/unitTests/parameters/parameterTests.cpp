#include "eos/gas.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "isentropic/relation.hpp"
#include "parameters/mockParameters.hpp"
#include "parameters/parameters.hpp"

namespace gasdynTesting::parameters {

using namespace gasdyn::parameters;

// double based tests
class ParameterTestFixtureDouble : public testing::TestWithParam<std::tuple<std::string, double>> {};

TEST_P(ParameterTestFixtureDouble, GetShouldReturnValue) {
    // arrange
    const auto [expectedString, expectedValue] = GetParam();
    const std::string key = "M";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1)).WillOnce(::testing::Return(expectedString));

    // act
    auto actualValue = mockParameters.Get<double>(key);

    // assert
    EXPECT_TRUE(actualValue.has_value());
    EXPECT_DOUBLE_EQ(actualValue.value(), expectedValue);
}

TEST_P(ParameterTestFixtureDouble, GetShouldReturnEmptyOptional) {
    // arrange
    const std::string key = "M";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1));

    // act
    auto actualValue = mockParameters.Get<double>(key);

    // assert
    EXPECT_FALSE(actualValue.has_value());
}

TEST_P(ParameterTestFixtureDouble, GetExpectShouldReturnValue) {
    // arrange
    const auto [expectedString, expectedValue] = GetParam();
    const std::string key = "M";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1)).WillOnce(::testing::Return(expectedString));

    // act
    auto actualValue = mockParameters.GetExpect<double>(key);

    // assert
    EXPECT_DOUBLE_EQ(actualValue, expectedValue);
}

TEST_P(ParameterTestFixtureDouble, GetShouldThrowExceptionWhenNotFound) {
    // arrange
    const std::string key = "M";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1));

    // act
    // assert
    EXPECT_THROW(mockParameters.GetExpect<double>(key), ParameterException);
}

TEST_P(ParameterTestFixtureDouble, GetShouldReturnDefaultValue) {
    // arrange
    const std::string key = "M";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1));

    // act
    auto actualValue = mockParameters.Get<double>(key, 102.2);

    // assert
    EXPECT_DOUBLE_EQ(actualValue, 102.2);
}

INSTANTIATE_TEST_SUITE_P(ParameterTests, ParameterTestFixtureDouble, ::testing::Values(std::make_tuple("22.3", 22.3), std::make_tuple(" 1E-3 ", 1.0E-3), std::make_tuple("-1.2", -1.2)));

class ParameterTestFixtureMalformedDouble : public testing::TestWithParam<std::string> {};

TEST_P(ParameterTestFixtureMalformedDouble, GetShouldThrowForUnconvertibleValue) {
    // arrange
    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString("T")).Times(::testing::Exactly(1)).WillOnce(::testing::Return(GetParam()));

    // act
    // assert
    EXPECT_THROW(mockParameters.Get<double>("T"), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(ParameterTests, ParameterTestFixtureMalformedDouble, ::testing::Values("warm", "300abc", "1 2", "0.5,1", ""));

// bool based tests
class ParameterTestFixtureBool : public testing::TestWithParam<std::tuple<std::string, bool>> {};

TEST_P(ParameterTestFixtureBool, GetShouldReturnValue) {
    // arrange
    const auto [expectedString, expectedValue] = GetParam();
    const std::string key = "metric";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1)).WillOnce(::testing::Return(expectedString));

    // act
    auto actualValue = mockParameters.Get<bool>(key);

    // assert
    EXPECT_TRUE(actualValue.has_value());
    EXPECT_EQ(actualValue.value(), expectedValue);
}

TEST_P(ParameterTestFixtureBool, GetShouldReturnDefaultValue) {
    // arrange
    const std::string key = "metric";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1));

    // act
    auto actualValue = mockParameters.Get<bool>(key, true);

    // assert
    EXPECT_EQ(actualValue, true);
}

INSTANTIATE_TEST_SUITE_P(ParameterTests, ParameterTestFixtureBool,
                         ::testing::Values(std::make_tuple("true", true), std::make_tuple("false", false), std::make_tuple("True", true), std::make_tuple("TRUE", true), std::make_tuple("1", true),
                                           std::make_tuple("0", false), std::make_tuple("yes", true), std::make_tuple(" off ", false), std::make_tuple("", true)));

TEST(ParameterTests, GetBoolShouldThrowForUnknownValue) {
    // arrange
    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString("metric")).Times(::testing::Exactly(1)).WillOnce(::testing::Return("imperial"));

    // act
    // assert
    EXPECT_THROW(mockParameters.Get<bool>("metric"), std::invalid_argument);
}

// string based tests
class ParameterTestFixtureString : public testing::TestWithParam<std::tuple<std::string, std::string>> {};

TEST_P(ParameterTestFixtureString, GetShouldReturnValue) {
    // arrange
    const auto [expectedString, expectedValue] = GetParam();
    const std::string key = "name";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1)).WillOnce(::testing::Return(expectedString));

    // act
    auto actualValue = mockParameters.GetExpect<std::string>(key);

    // assert
    EXPECT_EQ(actualValue, expectedValue);
}

TEST_P(ParameterTestFixtureString, GetShouldReturnDefaultValue) {
    // arrange
    const std::string key = "name";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1));

    // act
    auto actualValue = mockParameters.Get<std::string>(key, "custom");

    // assert
    EXPECT_EQ(actualValue, "custom");
}

INSTANTIATE_TEST_SUITE_P(ParameterTests, ParameterTestFixtureString, ::testing::Values(std::make_tuple("22.3", "22.3"), std::make_tuple("my gas", "my gas")));

// double vector
class ParameterTestFixtureDoubleVector : public testing::TestWithParam<std::tuple<std::string, std::vector<double>>> {};

TEST_P(ParameterTestFixtureDoubleVector, GetShouldReturnValue) {
    // arrange
    const auto [expectedString, expectedValue] = GetParam();
    const std::string key = "M";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1)).WillOnce(::testing::Return(expectedString));

    // act
    auto actualValue = mockParameters.Get<std::vector<double>>(key);

    // assert
    EXPECT_TRUE(actualValue.has_value());
    EXPECT_EQ(actualValue.value(), expectedValue);
}

TEST_P(ParameterTestFixtureDoubleVector, GetShouldReturnDefaultValue) {
    // arrange
    const std::string key = "M";

    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString(key)).Times(::testing::Exactly(1));

    // act
    auto actualValue = mockParameters.Get<std::vector<double>>(key, {102.2});

    // assert
    EXPECT_EQ(actualValue, std::vector<double>{102.2});
}

INSTANTIATE_TEST_SUITE_P(ParameterTests, ParameterTestFixtureDoubleVector,
                         ::testing::Values(std::make_tuple("22.3", std::vector<double>{22.3}), std::make_tuple("1E-3 2.3 ", std::vector<double>{1.0E-3, 2.3}),
                                           std::make_tuple("", std::vector<double>{}), std::make_tuple("0.5,1,2", std::vector<double>{0.5, 1.0, 2.0}),
                                           std::make_tuple(" 0.5, 1 ,2 ", std::vector<double>{0.5, 1.0, 2.0})));

class ParameterTestFixtureMalformedDoubleVector : public testing::TestWithParam<std::string> {};

TEST_P(ParameterTestFixtureMalformedDoubleVector, GetShouldThrowForUnconvertibleValue) {
    // arrange
    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString("M")).Times(::testing::Exactly(1)).WillOnce(::testing::Return(GetParam()));

    // act
    // assert
    EXPECT_THROW(mockParameters.Get<std::vector<double>>("M"), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(ParameterTests, ParameterTestFixtureMalformedDoubleVector, ::testing::Values("abc", "0.5 x 2", "0.5,1,2abc", "300abc"));

// enum tests
TEST(ParameterTests, GetShouldReadMultiWordGas) {
    // arrange
    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString("gas")).Times(::testing::Exactly(1)).WillOnce(::testing::Return("carbon dioxide"));

    // act
    auto gas = mockParameters.GetExpect<gasdyn::eos::Gas>("gas");

    // assert
    EXPECT_EQ(gas, gasdyn::eos::Gas::CarbonDioxide);
}

TEST(ParameterTests, GetShouldReadRelation) {
    // arrange
    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString("relation")).Times(::testing::Exactly(1)).WillOnce(::testing::Return("machFromAreaRatio"));

    // act
    auto relation = mockParameters.GetExpect<gasdyn::isentropic::Relation>("relation");

    // assert
    EXPECT_EQ(relation, gasdyn::isentropic::Relation::MachFromAreaRatio);
}

TEST(ParameterTests, GetShouldRejectTrailingTextAfterRelation) {
    // arrange
    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString("relation")).Times(::testing::Exactly(1)).WillOnce(::testing::Return("machFromAreaRatio sonicVelocity"));

    // act
    // assert
    EXPECT_THROW(mockParameters.GetExpect<gasdyn::isentropic::Relation>("relation"), std::invalid_argument);
}

TEST(ParameterTests, ContainsShouldReportPresence) {
    // arrange
    MockParameters mockParameters;
    EXPECT_CALL(mockParameters, GetString("gamma")).Times(::testing::Exactly(1)).WillOnce(::testing::Return("1.3"));
    EXPECT_CALL(mockParameters, GetString("Rgas")).Times(::testing::Exactly(1));

    // act
    // assert
    EXPECT_TRUE(mockParameters.Contains("gamma"));
    EXPECT_FALSE(mockParameters.Contains("Rgas"));
}

}  // namespace gasdynTesting::parameters
