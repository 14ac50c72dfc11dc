/**
 * @file INameResolver.hpp
 * @brief Interface for the name resolution probe.
 */

#pragma once

#include "core/types/ProbeOutcome.hpp"

#include <chrono>
#include <future>
#include <string>

namespace netprobe::core {

/**
 * @brief Times the resolution of a target name to an address.
 *
 * On success the outcome's detail carries the first resolved address.
 */
class INameResolver {
public:
    virtual ~INameResolver() = default;

    virtual std::future<ProbeOutcome> resolveAsync(const std::string& target,
                                                   std::chrono::milliseconds timeout) = 0;
};

} // namespace netprobe::core
