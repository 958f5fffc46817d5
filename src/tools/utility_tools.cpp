#include "tools/utility_tools.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>
#include <map>
#include "tools/tool_args.hpp"

namespace deploypilot::tools {

using core::errors::ErrorCategory;
using core::errors::PilotError;
using core::errors::Result;
using nlohmann::json;
using protocol::ToolCallResult;

namespace {

struct Number {
    double value = 0.0;
    bool is_integer = true;
};

PilotError invalid(const std::string& message) {
    return PilotError{ErrorCategory::Input, message, "invalid_expression"};
}

// Grammar:
//   expr   := term (('+' | '-') term)*
//   term   := unary (('*' | '/') unary)*
//   unary  := '-' unary | '+' unary | atom
//   atom   := number | name '(' expr ',' expr ')' | '(' expr ')'
class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& text) : text_(text) {}

    Result<Number> parse() {
        auto value = parse_expr();
        if (core::errors::is_error(value)) {
            return value;
        }
        skip_spaces();
        if (pos_ != text_.size()) {
            return invalid("Unexpected character '" + std::string(1, text_[pos_]) +
                           "' at position " + std::to_string(pos_));
        }
        return value;
    }

private:
    void skip_spaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
    }

    bool consume(const char c) {
        skip_spaces();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    static Number apply(const char op, const Number& lhs, const Number& rhs) {
        Number out;
        out.is_integer = lhs.is_integer && rhs.is_integer;
        switch (op) {
            case '+':
                out.value = lhs.value + rhs.value;
                break;
            case '-':
                out.value = lhs.value - rhs.value;
                break;
            default:
                out.value = lhs.value * rhs.value;
                break;
        }
        return out;
    }

    Result<Number> divide(const Number& lhs, const Number& rhs, const bool from_function) {
        if (rhs.value == 0.0) {
            if (from_function) {
                return PilotError{ErrorCategory::Input, "Division by zero error",
                                  "division_by_zero"};
            }
            return invalid("division by zero");
        }
        return Number{lhs.value / rhs.value, false};
    }

    Result<Number> parse_expr() {
        auto lhs = parse_term();
        if (core::errors::is_error(lhs)) {
            return lhs;
        }
        Number acc = core::errors::get_value(lhs);
        while (true) {
            skip_spaces();
            if (pos_ >= text_.size() || (text_[pos_] != '+' && text_[pos_] != '-')) {
                return acc;
            }
            const char op = text_[pos_++];
            auto rhs = parse_term();
            if (core::errors::is_error(rhs)) {
                return rhs;
            }
            acc = apply(op, acc, core::errors::get_value(rhs));
        }
    }

    Result<Number> parse_term() {
        auto lhs = parse_unary();
        if (core::errors::is_error(lhs)) {
            return lhs;
        }
        Number acc = core::errors::get_value(lhs);
        while (true) {
            skip_spaces();
            if (pos_ >= text_.size() || (text_[pos_] != '*' && text_[pos_] != '/')) {
                return acc;
            }
            const char op = text_[pos_++];
            auto rhs = parse_unary();
            if (core::errors::is_error(rhs)) {
                return rhs;
            }
            if (op == '*') {
                acc = apply(op, acc, core::errors::get_value(rhs));
                continue;
            }
            auto quotient = divide(acc, core::errors::get_value(rhs), false);
            if (core::errors::is_error(quotient)) {
                return quotient;
            }
            acc = core::errors::get_value(quotient);
        }
    }

    // Every nesting level (parentheses, calls, sign chains) passes through here.
    Result<Number> parse_unary() {
        if (depth_ >= kMaxDepth) {
            return invalid("Expression nested too deeply");
        }
        ++depth_;
        auto value = parse_signed();
        --depth_;
        return value;
    }

    Result<Number> parse_signed() {
        if (consume('-')) {
            auto inner = parse_unary();
            if (core::errors::is_error(inner)) {
                return inner;
            }
            Number negated = core::errors::get_value(inner);
            negated.value = -negated.value;
            return negated;
        }
        if (consume('+')) {
            return parse_unary();
        }
        return parse_atom();
    }

    Result<Number> parse_number() {
        const std::size_t start = pos_;
        bool is_integer = true;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            is_integer = false;
            ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
                ++pos_;
            }
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            is_integer = false;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
                ++pos_;
            }
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
                ++pos_;
            }
        }

        const std::string token = text_.substr(start, pos_ - start);
        try {
            std::size_t used = 0;
            const double value = std::stod(token, &used);
            if (used != token.size()) {
                return invalid("Malformed number '" + token + "'");
            }
            return Number{value, is_integer};
        } catch (const std::exception&) {
            return invalid("Malformed number '" + token + "'");
        }
    }

    Result<Number> parse_call(const std::string& name) {
        if (name != "add" && name != "subtract" && name != "multiply" && name != "divide") {
            return invalid("name '" + name + "' is not defined");
        }
        if (!consume('(')) {
            return invalid("Expected '(' after " + name);
        }
        auto first = parse_expr();
        if (core::errors::is_error(first)) {
            return first;
        }
        if (!consume(',')) {
            return invalid(name + "() takes exactly 2 arguments");
        }
        auto second = parse_expr();
        if (core::errors::is_error(second)) {
            return second;
        }
        if (!consume(')')) {
            return invalid(name + "() takes exactly 2 arguments");
        }

        const Number& x = core::errors::get_value(first);
        const Number& y = core::errors::get_value(second);
        if (name == "add") return apply('+', x, y);
        if (name == "subtract") return apply('-', x, y);
        if (name == "multiply") return apply('*', x, y);
        return divide(x, y, true);
    }

    Result<Number> parse_atom() {
        skip_spaces();
        if (pos_ >= text_.size()) {
            return invalid("Unexpected end of expression");
        }
        const char c = text_[pos_];
        if (c == '(') {
            ++pos_;
            auto inner = parse_expr();
            if (core::errors::is_error(inner)) {
                return inner;
            }
            if (!consume(')')) {
                return invalid("Missing closing parenthesis");
            }
            return inner;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.') {
            return parse_number();
        }
        if (std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_') {
            const std::size_t start = pos_;
            while (pos_ < text_.size() &&
                   (std::isalnum(static_cast<unsigned char>(text_[pos_])) != 0 || text_[pos_] == '_')) {
                ++pos_;
            }
            return parse_call(text_.substr(start, pos_ - start));
        }
        return invalid("Unexpected character '" + std::string(1, c) + "'");
    }

    static constexpr std::size_t kMaxDepth = 256;

    const std::string& text_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
};

std::string format_number(const Number& number) {
    if (number.is_integer && std::fabs(number.value) < 9.0e15) {
        return std::to_string(static_cast<long long>(number.value));
    }
    if (std::isnan(number.value)) {
        return "nan";
    }
    if (std::isinf(number.value)) {
        return number.value > 0 ? "inf" : "-inf";
    }
    char buffer[64];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number.value);
    if (ec != std::errc()) {
        return std::to_string(number.value);
    }
    std::string text(buffer, end);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

json empty_schema() {
    return json{{"type", "object"}, {"properties", json::object()}, {"required", json::array()}};
}

}  // namespace

ToolCallResult TimeTool::execute(const json& /*arguments*/) {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return {buffer};
}

json TimeTool::input_schema() {
    return empty_schema();
}

Result<std::string> CalculatorTool::evaluate(const std::string& expression) {
    ExpressionParser parser(expression);
    auto value = parser.parse();
    if (core::errors::is_error(value)) {
        return core::errors::get_error(value);
    }
    return format_number(core::errors::get_value(value));
}

ToolCallResult CalculatorTool::execute(const json& arguments) {
    const auto expression = string_arg(arguments, "expression");
    if (!expression) {
        return {"Error: Expression not provided"};
    }
    auto result = evaluate(*expression);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        if (err.code == "division_by_zero") {
            return {err.message};
        }
        return {"Error: " + err.message};
    }
    return {core::errors::get_value(result)};
}

json CalculatorTool::input_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"expression",
           {{"type", "string"},
            {"description",
             "The expression to calculate (e.g., 'add(3, 4)', 'subtract(5, 2)', "
             "'multiply(3, 3)', 'divide(10, 2)')"}}}}},
        {"required", json::array({"expression"})}};
}

ToolCallResult WeatherTool::execute(const json& arguments) {
    static const std::map<std::string, std::pair<std::string, std::string>> kWeather = {
        {"New York", {"Sunny", "72°F"}},
        {"London", {"Rainy", "60°F"}},
        {"Tokyo", {"Cloudy", "65°F"}},
        {"Sydney", {"Partly Cloudy", "70°F"}},
        {"Paris", {"Clear", "68°F"}}};

    const auto location = string_arg(arguments, "location");
    if (!location) {
        return {"Error: Location not provided"};
    }
    const auto it = kWeather.find(*location);
    if (it == kWeather.end()) {
        return {"No weather data available for " + *location};
    }
    return {"Weather in " + *location + ": " + it->second.first + ", " + it->second.second};
}

json WeatherTool::input_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"location",
           {{"type", "string"},
            {"description",
             "The location to get weather for (e.g., 'New York', 'London', 'Tokyo', "
             "'Sydney', 'Paris')"}}}}},
        {"required", json::array({"location"})}};
}

}  // namespace deploypilot::tools
