#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace apischema
{

using Json = nlohmann::json;

/// Direction of the payload being validated.
/// Requests are inbound (client -> service), responses outbound.
enum class Direction
{
    Request,
    Response
};

inline std::string to_string(Direction direction)
{
    switch (direction)
    {
    case Direction::Request:
        return "request";
    case Direction::Response:
        return "response";
    }
    return "request";
}

inline Direction direction_from_string(const std::string& s)
{
    if (s == "response")
        return Direction::Response;
    return Direction::Request;
}

} // namespace apischema
