//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/Request.cpp
// Purpose: Request value type and query-string decoding
//==========================================================================================================

#include "sso/Request.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace sso {

namespace {
    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

bool RequestData::ICaseLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
    });
}

RequestData RequestData::FromTarget(const std::string& target) {
    RequestData r;
    auto qpos = target.find('?');
    if (qpos == std::string::npos) {
        r.path = target;
        return r;
    }
    r.path = target.substr(0, qpos);
    std::string query = target.substr(qpos + 1);
    auto hash = query.find('#');
    if (hash != std::string::npos) {
        query.erase(hash);
    }
    r.query = parseQueryString(query);
    return r;
}

std::string RequestData::GetHeader(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

std::optional<std::string> RequestData::GetQueryParam(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end()) {
        return std::nullopt;
    }
    return it->second;
}

RequestData& RequestData::SetHeader(const std::string& name, const std::string& value) {
    headers[name] = value;
    return *this;
}

RequestData& RequestData::SetQueryParam(const std::string& name, const std::string& value) {
    query[name] = value;
    return *this;
}

std::string urlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::string> parseQueryString(const std::string& query) {
    std::map<std::string, std::string> params;
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        if (kv.empty()) {
            continue;
        }
        auto eq = kv.find('=');
        std::string key = urlDecode((eq == std::string::npos) ? kv : kv.substr(0, eq));
        std::string val = (eq == std::string::npos) ? std::string() : urlDecode(kv.substr(eq + 1));
        if (key.empty()) {
            continue;
        }
        params[key] = std::move(val);
    }
    return params;
}

} // namespace sso
