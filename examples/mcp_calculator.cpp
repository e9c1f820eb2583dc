/**
 * @file mcp_calculator.cpp
 * @brief Example: embedded calculator tool server
 *
 * Registers an in-process tool server with the connection. The CLI reaches
 * it through mcp_message control requests; no separate server process is
 * started.
 */

#include <agentlink/agentlink.hpp>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace agentlink;
using namespace agentlink::mcp;

auto add_numbers()
{
    return make_tool(
        "add", "Add two numbers", [](double a, double b) { return a + b; },
        std::vector<std::string>{"a", "b"});
}

auto subtract_numbers()
{
    return make_tool(
        "subtract", "Subtract one number from another", [](double a, double b) { return a - b; },
        std::vector<std::string>{"a", "b"});
}

auto divide_numbers()
{
    return make_tool(
        "divide", "Divide one number by another",
        [](double a, double b)
        {
            if (b == 0.0)
                throw std::runtime_error("Division by zero is not allowed");
            return a / b;
        },
        std::vector<std::string>{"a", "b"});
}

auto square_root()
{
    return make_tool(
        "sqrt", "Calculate square root",
        [](double n)
        {
            if (n < 0)
                throw std::runtime_error("Cannot take the square root of " + std::to_string(n));
            return std::sqrt(n);
        },
        std::vector<std::string>{"n"});
}

void print_event(const json& event)
{
    const std::string type = event.value("type", "");
    if (type == "assistant" && event.contains("message"))
    {
        for (const auto& block : event["message"].value("content", json::array()))
        {
            if (block.value("type", "") == "text")
                std::cout << "Assistant: " << block.value("text", "") << "\n";
            else if (block.value("type", "") == "tool_use")
                std::cout << "Using tool: " << block.value("name", "") << "\n";
        }
    }
    else if (type == "result")
    {
        std::cout << "Result: " << event.value("subtype", "") << "\n";
    }
}

int main()
{
    auto calculator = create_tool_server("calc", "2.0.0",
                                         {add_numbers(), subtract_numbers(), divide_numbers(),
                                          square_root()});

    LinkOptions opts;
    opts.sdk_mcp_servers["calc"] = calculator;
    opts.extra_args["allowedTools"] = "mcp__calc__add,mcp__calc__subtract,mcp__calc__divide,"
                                      "mcp__calc__sqrt";

    try
    {
        Connection connection(opts);
        connection.connect();

        for (const char* prompt : {"Calculate 15 + 27", "What is 100 divided by 7?",
                                   "What is the square root of 144?"})
        {
            std::cout << ">>> " << prompt << "\n";
            connection.send_user_message(prompt);
            for (const auto& event : connection.receive_response())
                print_event(event);
            std::cout << "\n";
        }

        connection.close();
    }
    catch (const CLINotFoundError& e)
    {
        std::cerr << "CLI not found: " << e.what() << "\n";
        return 1;
    }
    catch (const LinkError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
