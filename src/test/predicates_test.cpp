#include "airwaiter/predicates.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "airwaiter/value_format.h"

namespace airwaiter {

namespace {

using Value = std::variant<std::monostate, int, std::string, bool>;

struct Opaque {
    int field = 0;
};

} // namespace

TEST(PredicatesTest, IsTruthy) {
    EXPECT_TRUE(IsTruthy(true));
    EXPECT_FALSE(IsTruthy(false));
    EXPECT_TRUE(IsTruthy(1));
    EXPECT_TRUE(IsTruthy(-1));
    EXPECT_FALSE(IsTruthy(0));
    EXPECT_FALSE(IsTruthy(0.0));
    EXPECT_TRUE(IsTruthy(0.5));
    EXPECT_TRUE(IsTruthy(std::string("1")));
    EXPECT_FALSE(IsTruthy(std::string()));
    EXPECT_TRUE(IsTruthy(std::vector<int>{1}));
    EXPECT_FALSE(IsTruthy(std::vector<int>()));
    EXPECT_FALSE(IsTruthy(nullptr));
    EXPECT_FALSE(IsTruthy(std::monostate()));
}

TEST(PredicatesTest, IsTruthyPointers) {
    int value = 0;
    int* null_ptr = nullptr;
    EXPECT_TRUE(IsTruthy(&value));
    EXPECT_FALSE(IsTruthy(null_ptr));
    EXPECT_TRUE(IsTruthy(std::make_shared<int>(0)));
    EXPECT_FALSE(IsTruthy(std::shared_ptr<int>()));
    EXPECT_TRUE(IsTruthy(std::function<void()>([]() {})));
    EXPECT_FALSE(IsTruthy(std::function<void()>()));
}

TEST(PredicatesTest, IsTruthyWrappers) {
    EXPECT_TRUE(IsTruthy(std::optional<int>(3)));
    EXPECT_FALSE(IsTruthy(std::optional<int>(0)));
    EXPECT_FALSE(IsTruthy(std::optional<int>()));
    EXPECT_TRUE(IsTruthy(Value(std::string("1"))));
    EXPECT_FALSE(IsTruthy(Value(std::string())));
    EXPECT_FALSE(IsTruthy(Value(false)));
    EXPECT_FALSE(IsTruthy(Value()));
}

TEST(PredicatesTest, IsNone) {
    int value = 0;
    int* null_ptr = nullptr;
    EXPECT_TRUE(IsNone(std::optional<int>()));
    EXPECT_FALSE(IsNone(std::optional<int>(0)));
    EXPECT_TRUE(IsNone(null_ptr));
    EXPECT_FALSE(IsNone(&value));
    EXPECT_TRUE(IsNone(std::unique_ptr<int>()));
    EXPECT_TRUE(IsNone(nullptr));
    EXPECT_TRUE(IsNone(Value()));
    EXPECT_FALSE(IsNone(Value(0)));
    EXPECT_FALSE(IsNone(Value(false)));
}

TEST(PredicatesTest, FalsyValuesAreNotNone) {
    EXPECT_FALSE(IsNone(0));
    EXPECT_FALSE(IsNone(false));
    EXPECT_FALSE(IsNone(std::string()));
    EXPECT_FALSE(IsNone(std::vector<int>()));
}

TEST(PredicatesTest, BoolIdentity) {
    EXPECT_TRUE(IsTrueValue(true));
    EXPECT_FALSE(IsTrueValue(false));
    EXPECT_TRUE(IsFalseValue(false));
    EXPECT_FALSE(IsFalseValue(true));

    // truthiness is not identity
    EXPECT_FALSE(IsTrueValue(1));
    EXPECT_FALSE(IsTrueValue(std::string("true")));
    EXPECT_FALSE(IsFalseValue(0));
    EXPECT_FALSE(IsFalseValue(std::optional<bool>()));
    EXPECT_FALSE(IsFalseValue(Value()));
}

TEST(PredicatesTest, BoolIdentityWrappers) {
    EXPECT_TRUE(IsTrueValue(std::optional<bool>(true)));
    EXPECT_TRUE(IsFalseValue(std::optional<bool>(false)));
    EXPECT_TRUE(IsTrueValue(Value(true)));
    EXPECT_FALSE(IsTrueValue(Value(1)));
    EXPECT_TRUE(IsFalseValue(Value(false)));
    EXPECT_FALSE(IsFalseValue(Value(0)));
}

TEST(ValueFormatTest, FormatValue) {
    EXPECT_EQ(FormatValue(5), "5");
    EXPECT_EQ(FormatValue(true), "true");
    EXPECT_EQ(FormatValue(std::string("ready")), "ready");
    EXPECT_EQ(FormatValue(std::vector<int>{1, 2, 3}), "[1, 2, 3]");
    EXPECT_EQ(FormatValue(std::optional<int>(7)), "7");
    EXPECT_EQ(FormatValue(std::optional<int>()), "None");
    EXPECT_EQ(FormatValue(Value()), "None");
    EXPECT_EQ(FormatValue(Value(false)), "false");
}

TEST(ValueFormatTest, UnprintableValue) {
    std::string result = FormatValue(Opaque{});
    ASSERT_FALSE(result.empty());
    EXPECT_EQ(result.front(), '<');
    EXPECT_EQ(result.back(), '>');
}

} // namespace airwaiter
