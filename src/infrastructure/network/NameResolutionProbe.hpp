#pragma once

#include "core/services/INameResolver.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <memory>

namespace netprobe::infra {

/**
 * @brief Times DNS resolution of a target through the system resolver.
 *
 * On success the outcome's detail holds the first resolved address. An empty
 * target fails without contacting the resolver.
 */
class NameResolutionProbe : public core::INameResolver {
public:
    explicit NameResolutionProbe(AsioContext& context);

    std::future<core::ProbeOutcome> resolveAsync(const std::string& target,
                                                 std::chrono::milliseconds timeout) override;

private:
    struct ResolveState;

    AsioContext& context_;
};

} // namespace netprobe::infra
