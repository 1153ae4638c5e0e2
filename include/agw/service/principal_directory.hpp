#pragma once

/// @file principal_directory.hpp
/// @brief Principal lookup interface and in-memory implementation.
///
/// Credential issuance lives outside the gateway; the directory only
/// answers "who is this caller and what tier/rules do they have".

#include "agw/service/admission_types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace agw::service {

/// Abstract principal directory. Implementations must be thread-safe.
class IPrincipalDirectory {
public:
    virtual ~IPrincipalDirectory() = default;

    [[nodiscard]] virtual std::optional<Principal> find(std::string_view principalId) const = 0;

    /// Insert or replace by ID.
    virtual void upsert(Principal principal) = 0;

    /// @return false if the principal was not present.
    virtual bool remove(std::string_view principalId) = 0;
};

/// Directory populated from the `principals` configuration section.
class InMemoryPrincipalDirectory : public IPrincipalDirectory {
public:
    [[nodiscard]] std::optional<Principal> find(std::string_view principalId) const override;

    void upsert(Principal principal) override;

    bool remove(std::string_view principalId) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Principal> principals_;
};

}  // namespace agw::service
