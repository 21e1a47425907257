/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "registry.hpp"
#include <stdexcept>
#include <tuple>
#include <utility>

namespace Pinwave
{

auto ResourceID::operator<(const ResourceID& other) const -> bool
{
    return std::tie(this->kind, this->index)
        < std::tie(other.kind, other.index);
}

auto ResourceID::operator==(const ResourceID& other) const -> bool
{
    return this->kind == other.kind && this->index == other.index;
}

auto to_string(const ResourceID& resource) -> std::string
{
    switch (resource.kind) {
    case ResourceKind::Clock:
        return "clock " + std::to_string(resource.index);

    case ResourceKind::DmaChannel:
        return "DMA channel " + std::to_string(resource.index);
    }

    return "resource " + std::to_string(resource.index);
}

Lease::Lease()
: registry(nullptr)
, resource{ResourceKind::Clock, -1}
{}

Lease::Lease(ResourceRegistry& registry, ResourceID resource)
: registry(&registry)
, resource(resource)
{}

Lease::Lease(Lease&& other) noexcept
: registry(std::exchange(other.registry, nullptr))
, resource(other.resource)
{}

auto Lease::operator=(Lease&& other) noexcept -> Lease&
{
    if (this != &other) {
        this->release();
        this->registry = std::exchange(other.registry, nullptr);
        this->resource = other.resource;
    }

    return *this;
}

Lease::~Lease()
{
    this->release();
}

auto Lease::is_held() const -> bool
{
    return this->registry != nullptr;
}

auto Lease::get_resource() const -> const ResourceID&
{
    return this->resource;
}

void Lease::release()
{
    if (this->registry != nullptr) {
        this->registry->release(this->resource);
        this->registry = nullptr;
    }
}

auto ResourceRegistry::lease(ResourceID resource, const std::string& holder)
-> Lease
{
    std::lock_guard<std::mutex> lock(this->mutex);
    auto result = this->holders.emplace(resource, holder);

    if (!result.second) {
        throw std::runtime_error(
            "Cannot lease " + to_string(resource) + " for " + holder
            + ", already held by " + result.first->second
        );
    }

    return Lease{*this, resource};
}

auto ResourceRegistry::get_holder(ResourceID resource) const
-> std::optional<std::string>
{
    std::lock_guard<std::mutex> lock(this->mutex);
    auto it = this->holders.find(resource);

    if (it == this->holders.end()) {
        return {};
    }

    return it->second;
}

auto ResourceRegistry::get_lease_count() const -> std::size_t
{
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->holders.size();
}

void ResourceRegistry::release(ResourceID resource)
{
    std::lock_guard<std::mutex> lock(this->mutex);
    this->holders.erase(resource);
}

} // namespace Pinwave
