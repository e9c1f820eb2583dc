#ifndef AGENTLINK_MCP_TYPED_TOOL_HPP
#define AGENTLINK_MCP_TYPED_TOOL_HPP

#include <agentlink/mcp/tool.hpp>
#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace agentlink
{
namespace mcp
{

namespace detail
{

template <typename T>
struct always_false : std::false_type
{
};

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename T>
struct is_vector : std::false_type
{
};

template <typename U, typename Alloc>
struct is_vector<std::vector<U, Alloc>> : std::true_type
{
};

template <typename T>
struct is_string_map : std::false_type
{
};

template <typename V, typename Compare, typename Alloc>
struct is_string_map<std::map<std::string, V, Compare, Alloc>> : std::true_type
{
};

// ============================================================================
// C++ type -> JSON Schema
// ============================================================================

template <typename T>
json schema_for()
{
    using Base = remove_cvref_t<T>;

    if constexpr (std::is_same_v<Base, bool>)
        return json{{"type", "boolean"}};
    else if constexpr (std::is_integral_v<Base>)
        return json{{"type", "integer"}};
    else if constexpr (std::is_floating_point_v<Base>)
        return json{{"type", "number"}};
    else if constexpr (std::is_same_v<Base, std::string>)
        return json{{"type", "string"}};
    else if constexpr (std::is_same_v<Base, json>)
        return json{{"type", "object"}};
    else if constexpr (is_vector<Base>::value)
        return json{{"type", "array"}, {"items", schema_for<typename Base::value_type>()}};
    else if constexpr (is_string_map<Base>::value)
        return json{{"type", "object"},
                    {"additionalProperties", schema_for<typename Base::mapped_type>()}};
    else
    {
        static_assert(always_false<T>::value,
                      "Unsupported tool parameter type. Supported types: bool, integers, "
                      "floating point, std::string, json, std::vector<T>, "
                      "std::map<std::string, T>");
        return json{};
    }
}

// ============================================================================
// Function signature traits
// ============================================================================

template <typename Func>
struct FunctionTraits;

template <typename Ret, typename... Args>
struct FunctionTraits<Ret (*)(Args...)>
{
    using ReturnType = Ret;
    using ArgsTuple = std::tuple<Args...>;
    static constexpr std::size_t arity = sizeof...(Args);
};

template <typename Ret, typename... Args>
struct FunctionTraits<Ret(Args...)> : FunctionTraits<Ret (*)(Args...)>
{
};

template <typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret (Class::*)(Args...) const> : FunctionTraits<Ret (*)(Args...)>
{
};

template <typename Ret, typename Class, typename... Args>
struct FunctionTraits<Ret (Class::*)(Args...)> : FunctionTraits<Ret (*)(Args...)>
{
};

// Lambdas and functors decay to their call operator
template <typename Func>
struct FunctionTraits : FunctionTraits<decltype(&remove_cvref_t<Func>::operator())>
{
};

template <typename Traits, std::size_t N>
using arg_t = remove_cvref_t<std::tuple_element_t<N, typename Traits::ArgsTuple>>;

template <typename Traits, std::size_t... I>
json parameter_schemas(const std::vector<std::string>& names, std::index_sequence<I...>)
{
    json properties = json::object();
    ((properties[names[I]] = schema_for<arg_t<Traits, I>>()), ...);
    return properties;
}

// ============================================================================
// Argument extraction and result conversion
// ============================================================================

template <typename T>
T extract_argument(const json& arguments, const std::string& name)
{
    if (!arguments.is_object() || !arguments.contains(name))
        throw std::invalid_argument("Missing required argument: " + name);

    try
    {
        return arguments.at(name).get<T>();
    }
    catch (const json::exception& e)
    {
        throw std::invalid_argument("Invalid type for argument '" + name + "': " + e.what());
    }
}

template <typename R>
ToolResult to_tool_result(R&& value)
{
    using Base = remove_cvref_t<R>;

    if constexpr (std::is_same_v<Base, ToolResult>)
        return std::forward<R>(value);
    else if constexpr (std::is_same_v<Base, std::string>)
        return ToolResult::text(std::forward<R>(value));
    else if constexpr (std::is_same_v<Base, json>)
        return ToolResult::text(value.is_string() ? value.template get<std::string>()
                                                  : value.dump());
    else
        return ToolResult::text(json(std::forward<R>(value)).dump());
}

template <typename Func, std::size_t... I>
ToolResult invoke_tool(Func& func, const json& arguments, const std::vector<std::string>& names,
                       std::index_sequence<I...>)
{
    using Traits = FunctionTraits<std::decay_t<Func>>;
    using Ret = typename Traits::ReturnType;

    if constexpr (std::is_void_v<Ret>)
    {
        func(extract_argument<arg_t<Traits, I>>(arguments, names[I])...);
        return ToolResult{};
    }
    else
    {
        return to_tool_result(func(extract_argument<arg_t<Traits, I>>(arguments, names[I])...));
    }
}

} // namespace detail

/// Build a tool from a typed C++ callable. The input schema is derived from
/// the parameter types; every parameter is required. The return value may be
/// a ToolResult, a string, json, or anything json can represent (reported as
/// its JSON text).
///
/// ```cpp
/// auto add = mcp::make_tool("add", "Add two numbers",
///                           [](double a, double b) { return a + b; }, {"a", "b"});
/// ```
template <typename Func>
ToolDefinition make_tool(std::string name, std::string description, Func&& func,
                         std::vector<std::string> param_names)
{
    using Stored = std::decay_t<Func>;
    using Traits = detail::FunctionTraits<Stored>;
    constexpr std::size_t arity = Traits::arity;

    if (param_names.size() != arity)
    {
        throw std::invalid_argument("Parameter name count mismatch for tool '" + name +
                                    "': expected " + std::to_string(arity) + ", got " +
                                    std::to_string(param_names.size()));
    }

    json properties =
        detail::parameter_schemas<Traits>(param_names, std::make_index_sequence<arity>{});

    ToolDefinition tool;
    tool.name = std::move(name);
    tool.description = std::move(description);
    tool.input_schema = {{"type", "object"}, {"properties", properties}, {"required", param_names}};
    tool.handler = [f = Stored(std::forward<Func>(func)),
                    names = std::move(param_names)](const json& arguments) mutable
    {
        return detail::invoke_tool(f, arguments, names,
                                   std::make_index_sequence<Traits::arity>{});
    };
    return tool;
}

} // namespace mcp
} // namespace agentlink

#endif // AGENTLINK_MCP_TYPED_TOOL_HPP
