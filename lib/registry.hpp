/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_REGISTRY_HPP
#define PINWAVE_REGISTRY_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace Pinwave
{

/** Kind of shared hardware resource a stream may need. */
enum class ResourceKind
{
    Clock,
    DmaChannel,
};

/** Identifier of a shared hardware resource. */
struct ResourceID
{
    ResourceKind kind;
    int index;

    bool operator<(const ResourceID& other) const;
    bool operator==(const ResourceID& other) const;
};

/** Get a human-readable name for a resource, e.g. "clock 2". */
std::string to_string(const ResourceID&);

class ResourceRegistry;

/**
 * Exclusive hold on a resource.
 *
 * The resource is released when the lease is destroyed.
 */
class Lease
{
public:
    /** Create an empty lease holding nothing. */
    Lease();

    // No copies, only allow moves
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    ~Lease();

    /** Check whether this lease currently holds a resource. */
    bool is_held() const;

    /** Get the leased resource. */
    const ResourceID& get_resource() const;

    /** Release the resource early. Does nothing if nothing is held. */
    void release();

private:
    friend class ResourceRegistry;
    Lease(ResourceRegistry& registry, ResourceID resource);

    ResourceRegistry* registry;
    ResourceID resource;
}; // class Lease

/**
 * Keeps track of which stream uses each clock and DMA channel.
 *
 * Two concurrent streams must never share a clock or a DMA channel. Backends
 * lease the resources they need before programming them. The registry must
 * outlive every lease it hands out. Safe to use from several threads.
 */
class ResourceRegistry
{
public:
    ResourceRegistry() = default;

    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    /**
     * Acquire a resource.
     *
     * @param resource Resource to acquire.
     * @param holder Name of the user of the resource, for diagnostics.
     * @return Lease releasing the resource when destroyed.
     * @throws std::runtime_error If the resource is already held.
     */
    Lease lease(ResourceID resource, const std::string& holder);

    /** Get the current holder of a resource, if any. */
    std::optional<std::string> get_holder(ResourceID resource) const;

    /** Get the number of resources currently held. */
    std::size_t get_lease_count() const;

private:
    friend class Lease;
    void release(ResourceID resource);

    mutable std::mutex mutex;
    std::map<ResourceID, std::string> holders;
}; // class ResourceRegistry

} // namespace Pinwave

#endif // PINWAVE_REGISTRY_HPP
