#pragma once

#include <cstddef>
#include <string>

#include <boost/json.hpp>

#include "RemoteTypes.h"

namespace protocol {

namespace json = boost::json;

// One JSON object per line. Every message carries a "type" naming the operation.
class ProtocolCodec {
public:
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    std::string encodeRequest(const Request& request) const;
    bool decodeRequest(const std::string& line, Request& out, std::string& error) const;

    std::string encodeResponse(const Response& response) const;
    // An Error response decodes successfully whatever operation was expected.
    bool decodeResponse(OperationType expected, const std::string& line, Response& out, std::string& error) const;

    json::object requestToJson(const Request& request) const;
    bool jsonToRequest(const json::value& payload, Request& out, std::string& error) const;

    json::object responseToJson(const Response& response) const;
    bool jsonToResponse(OperationType expected, const json::value& payload, Response& out, std::string& error) const;

private:
    static bool parseLine(const std::string& line, json::value& out, std::string& error);
    static std::string frame(const json::object& object);
};

} // namespace protocol
