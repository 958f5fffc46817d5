#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/pilot_errors.hpp"
#include "tools/utility_tools.hpp"

namespace {

using deploypilot::core::errors::get_error;
using deploypilot::core::errors::get_value;
using deploypilot::core::errors::is_error;
using deploypilot::tools::CalculatorTool;
using deploypilot::tools::TimeTool;
using deploypilot::tools::WeatherTool;
using nlohmann::json;

std::string calculate(const std::string& expression) {
    CalculatorTool tool;
    return tool.execute(json{{"expression", expression}}).content;
}

TEST(UtilityToolsTest, TimeHasExpectedShape) {
    TimeTool tool;
    const std::string text = tool.execute(json::object()).content;
    ASSERT_EQ(text.size(), 19u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[7], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[13], ':');
    EXPECT_EQ(text[16], ':');
}

TEST(UtilityToolsTest, AddsIntegers) {
    EXPECT_EQ(calculate("add(3, 4)"), "7");
    EXPECT_EQ(calculate("subtract(5, 2)"), "3");
    EXPECT_EQ(calculate("multiply(3, 3)"), "9");
}

TEST(UtilityToolsTest, DivisionAlwaysYieldsFloat) {
    EXPECT_EQ(calculate("divide(10, 2)"), "5.0");
    EXPECT_EQ(calculate("divide(1, 4)"), "0.25");
}

TEST(UtilityToolsTest, FloatOperandsPropagate) {
    EXPECT_EQ(calculate("add(1.5, 2)"), "3.5");
    EXPECT_EQ(calculate("multiply(2.0, 3)"), "6.0");
}

TEST(UtilityToolsTest, SupportsNestedAndInfixExpressions) {
    EXPECT_EQ(calculate("add(multiply(2, 3), 4)"), "10");
    EXPECT_EQ(calculate("(1 + 2) * -3"), "-9");
}

TEST(UtilityToolsTest, DivisionByZeroMessage) {
    EXPECT_EQ(calculate("divide(5, 0)"), "Division by zero error");

    auto result = CalculatorTool::evaluate("divide(5, 0)");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "division_by_zero");
}

TEST(UtilityToolsTest, UnknownFunctionIsError) {
    const std::string text = calculate("power(2, 3)");
    EXPECT_EQ(text.rfind("Error: ", 0), 0u);
    EXPECT_NE(text.find("power"), std::string::npos);
}

TEST(UtilityToolsTest, MalformedExpressionIsError) {
    auto result = CalculatorTool::evaluate("add(1)");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_expression");
    EXPECT_EQ(calculate("3 +").rfind("Error: ", 0), 0u);
}

TEST(UtilityToolsTest, DeepNestingIsRejected) {
    const std::string parens = std::string(60000, '(') + "1";
    auto nested = CalculatorTool::evaluate(parens);
    ASSERT_TRUE(is_error(nested));
    EXPECT_EQ(get_error(nested).message, "Expression nested too deeply");

    EXPECT_EQ(calculate(std::string(60000, '-') + "1"), "Error: Expression nested too deeply");
    EXPECT_EQ(calculate(std::string(100, '(') + "2" + std::string(100, ')')), "2");
}

TEST(UtilityToolsTest, MissingExpression) {
    CalculatorTool tool;
    EXPECT_EQ(tool.execute(json::object()).content, "Error: Expression not provided");
}

TEST(UtilityToolsTest, EvaluateReturnsFormattedValue) {
    auto result = CalculatorTool::evaluate("add(3,4)");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "7");
}

TEST(UtilityToolsTest, WeatherForKnownCity) {
    WeatherTool tool;
    EXPECT_EQ(tool.execute(json{{"location", "London"}}).content,
              "Weather in London: Rainy, 60°F");
}

TEST(UtilityToolsTest, WeatherForUnknownCity) {
    WeatherTool tool;
    EXPECT_EQ(tool.execute(json{{"location", "Atlantis"}}).content,
              "No weather data available for Atlantis");
}

TEST(UtilityToolsTest, WeatherWithoutLocation) {
    WeatherTool tool;
    EXPECT_EQ(tool.execute(json::object()).content, "Error: Location not provided");
}

}  // namespace
