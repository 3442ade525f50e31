//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Request.hpp
// Purpose: Explicit request abstraction (headers + query parameters) handed to the SSO flows
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>

namespace sso {

//==========================================================================================================
// IRequest
// Purpose: Read-only view of an incoming HTTP request.
//==========================================================================================================
class IRequest {
public:
    virtual ~IRequest() = default;

    // Header value by case-insensitive name; empty string when absent.
    virtual std::string GetHeader(const std::string& name) const = 0;

    // Decoded query parameter; std::nullopt when absent (present-but-empty yields "").
    virtual std::optional<std::string> GetQueryParam(const std::string& name) const = 0;
};

//==========================================================================================================
// RequestData
// Purpose: Value-type IRequest used by the HTTP front end and by tests.
//==========================================================================================================
class RequestData : public IRequest {
public:
    RequestData() = default;

    //==========================================================================================================
    // FromTarget
    // Purpose: Build a request from an HTTP request-target ("/path?a=1&b=2"); the query is decoded with
    //          parseQueryString.
    //==========================================================================================================
    static RequestData FromTarget(const std::string& target);

    std::string GetHeader(const std::string& name) const override;
    std::optional<std::string> GetQueryParam(const std::string& name) const override;

    RequestData& SetHeader(const std::string& name, const std::string& value);
    RequestData& SetQueryParam(const std::string& name, const std::string& value);

    const std::string& Path() const { return path; }

private:
    struct ICaseLess {
        bool operator()(const std::string& a, const std::string& b) const;
    };

    std::string path;
    std::map<std::string, std::string, ICaseLess> headers;
    std::map<std::string, std::string> query;
};

//==========================================================================================================
// urlDecode
// Purpose: Percent-decode a query component ('+' becomes a space). Malformed escapes are kept verbatim.
//==========================================================================================================
std::string urlDecode(const std::string& s);

//==========================================================================================================
// parseQueryString
// Purpose: Split "a=1&b=2" into decoded key/value pairs. Keys without '=' map to "". The last occurrence
//          of a repeated key wins.
//==========================================================================================================
std::map<std::string, std::string> parseQueryString(const std::string& query);

} // namespace sso
