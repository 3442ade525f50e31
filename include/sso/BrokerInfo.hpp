//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BrokerInfo.hpp
// Purpose: Broker registry contract (secret + allowed domains) and an in-memory registry
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sso {

//==========================================================================================================
// BrokerInfo
// Purpose: Registry entry for a broker.
// Fields:
//   secret: Shared secret used to key checksums.
//   domains: Hosts allowed for origin/referer/return_url, in configuration order.
//==========================================================================================================
struct BrokerInfo {
    std::string secret;
    std::vector<std::string> domains;
};

//==========================================================================================================
// IBrokerInfoProvider
// Purpose: Looks up a broker by id. Called on every use; implementations must not rely on the caller
//          caching results.
// Returns: BrokerInfo for a known broker, std::nullopt for an unknown one.
// Throws: Any std::exception on lookup failure (treated as an infrastructure error by callers).
//==========================================================================================================
class IBrokerInfoProvider {
public:
    virtual ~IBrokerInfoProvider() = default;
    virtual std::optional<BrokerInfo> GetBrokerInfo(const std::string& brokerId) = 0;
};

//==========================================================================================================
// InMemoryBrokerRegistry
// Purpose: Thread-safe broker table. Entries may be replaced at runtime (secret rotation).
//==========================================================================================================
class InMemoryBrokerRegistry : public IBrokerInfoProvider {
public:
    InMemoryBrokerRegistry() = default;

    std::optional<BrokerInfo> GetBrokerInfo(const std::string& brokerId) override;

    // Insert or replace a broker.
    void SetBroker(const std::string& brokerId, BrokerInfo info);

    // Remove a broker; returns false when it was not registered.
    bool RemoveBroker(const std::string& brokerId);

    size_t Size() const;

    //==========================================================================================================
    // LoadFromString
    // Purpose: Populate the registry from "id:secret:domain1,domain2;id2:secret2:..." (domains optional).
    //          Whitespace around entries and fields is trimmed. Existing entries with the same id are replaced.
    // Args:
    //   config: Broker configuration string.
    //   errorMessage: Set to a description of the first malformed entry on failure.
    // Returns:
    //   Number of brokers loaded, or -1 on a malformed entry (nothing is loaded in that case).
    //==========================================================================================================
    int LoadFromString(const std::string& config, std::string& errorMessage);

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, BrokerInfo> brokers;
};

} // namespace sso
