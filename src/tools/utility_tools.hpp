#pragma once

#include <string>
#include "core/errors/pilot_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace deploypilot::tools {

class TimeTool : public protocol::ToolHandler {
public:
    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;
    static nlohmann::json input_schema();
};

class CalculatorTool : public protocol::ToolHandler {
public:
    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;
    static nlohmann::json input_schema();

    // Formatted result of `expression`, e.g. "7" for add(3,4) and "5.0" for
    // divide(10,2). Error code division_by_zero uses the message
    // "Division by zero error"; parse failures use invalid_expression.
    static core::errors::Result<std::string> evaluate(const std::string& expression);
};

class WeatherTool : public protocol::ToolHandler {
public:
    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;
    static nlohmann::json input_schema();
};

}  // namespace deploypilot::tools
