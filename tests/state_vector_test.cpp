#include "minimod/errors.hpp"
#include "minimod/state_vector.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

using minimod::ConfigurationError;
using minimod::StateVector;

TEST(StateVectorTest, ConstructionAndAccess) {
    StateVector s({ "G", "X" }, { 290.0, 0.0 });
    EXPECT_EQ(s.size(), 2u);
    EXPECT_FALSE(s.empty());
    EXPECT_DOUBLE_EQ(s.get("G"), 290.0);
    EXPECT_DOUBLE_EQ(s.get("X"), 0.0);
    EXPECT_DOUBLE_EQ(s[0], 290.0);
    EXPECT_EQ(s.index_of("X"), 1u);
    EXPECT_TRUE(s.has("G"));
    EXPECT_FALSE(s.has("I"));

    // Field order is declaration order
    ASSERT_EQ(s.names().size(), 2u);
    EXPECT_EQ(s.names()[0], "G");
    EXPECT_EQ(s.names()[1], "X");
}

TEST(StateVectorTest, InitializerListMatchesVectors) {
    StateVector a{ { "G", 1.0 }, { "X", 2.0 } };
    StateVector b({ "G", "X" }, { 1.0, 2.0 });
    EXPECT_EQ(a, b);
}

TEST(StateVectorTest, RejectsMalformedFields) {
    EXPECT_THROW(StateVector({ "G", "X" }, { 1.0 }), ConfigurationError);
    EXPECT_THROW(StateVector({ "G", "G" }, { 1.0, 2.0 }), ConfigurationError);
    EXPECT_THROW(StateVector({ "" }, { 1.0 }), ConfigurationError);
    // ConfigurationError is an invalid_argument
    EXPECT_THROW(StateVector({ "G" }, {}), std::invalid_argument);
}

TEST(StateVectorTest, MissingFieldThrows) {
    StateVector s{ { "G", 1.0 } };
    EXPECT_THROW(s.get("X"), std::out_of_range);
}

TEST(StateVectorTest, WithValuesKeepsFieldsAndLeavesSourceUnchanged) {
    StateVector const s({ "G", "X" }, { 1.0, 2.0 });
    StateVector const next = s.with_values({ 3.0, 4.0 });

    EXPECT_TRUE(next.same_fields(s));
    EXPECT_DOUBLE_EQ(next.get("G"), 3.0);
    EXPECT_DOUBLE_EQ(next.get("X"), 4.0);
    EXPECT_DOUBLE_EQ(s.get("G"), 1.0);
    EXPECT_NE(s, next);

    EXPECT_THROW(s.with_values({ 1.0 }), ConfigurationError);
}

TEST(StateVectorTest, SameFieldsIsOrderSensitive) {
    StateVector a({ "G", "X" }, { 1.0, 2.0 });
    StateVector b({ "X", "G" }, { 2.0, 1.0 });
    EXPECT_FALSE(a.same_fields(b));
}

TEST(StateVectorTest, StreamOutput) {
    StateVector s({ "G", "X" }, { 1.5, 0.0 });
    std::stringstream ss;
    ss << s;
    EXPECT_EQ(ss.str(), "{G=1.5, X=0}");
}
