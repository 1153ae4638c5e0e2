/// @file principal_directory.cpp
/// @brief InMemoryPrincipalDirectory implementation.

#include "agw/service/principal_directory.hpp"

#include <mutex>

namespace agw::service {

std::optional<Principal> InMemoryPrincipalDirectory::find(std::string_view principalId) const {
    std::shared_lock lock(mutex_);
    auto it = principals_.find(std::string(principalId));
    if (it == principals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryPrincipalDirectory::upsert(Principal principal) {
    std::unique_lock lock(mutex_);
    auto id = principal.id;
    principals_.insert_or_assign(std::move(id), std::move(principal));
}

bool InMemoryPrincipalDirectory::remove(std::string_view principalId) {
    std::unique_lock lock(mutex_);
    return principals_.erase(std::string(principalId)) > 0;
}

std::size_t InMemoryPrincipalDirectory::size() const {
    std::shared_lock lock(mutex_);
    return principals_.size();
}

}  // namespace agw::service
