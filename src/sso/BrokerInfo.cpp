//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/sso/BrokerInfo.cpp
// Purpose: In-memory broker registry and its configuration-string loader
//==========================================================================================================

#include "sso/BrokerInfo.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "sso/auth/BearerCredential.hpp"

namespace sso {

namespace {
    void trim(std::string& s) {
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    }

    std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out;
        std::size_t start = 0;
        while (start <= s.size()) {
            std::size_t pos = s.find(sep, start);
            std::string item = (pos == std::string::npos) ? s.substr(start) : s.substr(start, pos - start);
            trim(item);
            out.push_back(item);
            if (pos == std::string::npos) {
                break;
            }
            start = pos + 1;
        }
        return out;
    }
}

std::optional<BrokerInfo> InMemoryBrokerRegistry::GetBrokerInfo(const std::string& brokerId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = brokers.find(brokerId);
    if (it == brokers.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryBrokerRegistry::SetBroker(const std::string& brokerId, BrokerInfo info) {
    std::lock_guard<std::mutex> lock(mutex);
    brokers[brokerId] = std::move(info);
}

bool InMemoryBrokerRegistry::RemoveBroker(const std::string& brokerId) {
    std::lock_guard<std::mutex> lock(mutex);
    return brokers.erase(brokerId) > 0;
}

size_t InMemoryBrokerRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return brokers.size();
}

int InMemoryBrokerRegistry::LoadFromString(const std::string& config, std::string& errorMessage) {
    std::vector<std::pair<std::string, BrokerInfo>> parsed;

    for (const std::string& entry : split(config, ';')) {
        if (entry.empty()) {
            continue;
        }
        // id:secret[:domains]; the secret itself may not contain ':'
        std::vector<std::string> fields = split(entry, ':');
        if (fields.size() < 2 || fields.size() > 3) {
            errorMessage = std::string("expected id:secret[:domains] in broker entry '") + entry + "'";
            return -1;
        }
        if (!auth::isWordString(fields[0])) {
            errorMessage = std::string("broker id must be word characters: '") + fields[0] + "'";
            return -1;
        }
        if (fields[1].empty()) {
            errorMessage = std::string("empty secret for broker '") + fields[0] + "'";
            return -1;
        }
        BrokerInfo info;
        info.secret = fields[1];
        if (fields.size() == 3) {
            for (const std::string& d : split(fields[2], ',')) {
                if (!d.empty()) {
                    info.domains.push_back(d);
                }
            }
        }
        parsed.emplace_back(fields[0], std::move(info));
    }

    std::lock_guard<std::mutex> lock(mutex);
    for (auto& p : parsed) {
        brokers[p.first] = std::move(p.second);
    }
    return static_cast<int>(parsed.size());
}

} // namespace sso
