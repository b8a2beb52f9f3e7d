#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uabridge::bridge {

struct SourceOverride {
    std::optional<bool> drop;
    std::string device;
    std::string feature;
};

struct RouteDecision {
    bool drop = false;
    std::string device;
    std::string feature;
};

/**
 * @brief Per-source overrides keyed by address prefix
 *
 * A sample's address is `opcua/<connection>/subscriptions/<subscription>/<node>`.
 * Overrides are registered for whole-segment prefixes of such addresses. For
 * every field the most specific prefix that sets it wins; unset fields fall
 * through to less specific prefixes and finally to the channel defaults.
 */
class SourceRouter {
public:
    using Address = std::vector<std::string>;

    SourceRouter() = default;
    explicit SourceRouter(const std::map<std::string, SourceOverride>& overrides);

    [[nodiscard]] static Address SourceAddress(
        std::string_view connection,
        std::string_view subscription,
        std::string_view node);

    /// Split an override key; the fifth segment keeps any further slashes, since node ids may contain them.
    [[nodiscard]] static Address ParseAddress(std::string_view text);

    [[nodiscard]] static std::string FormatAddress(const Address& address);

    /// Feature name used when no override sets one: the last address segment.
    [[nodiscard]] static std::string DefaultFeature(const Address& address);

    [[nodiscard]] RouteDecision Route(
        const Address& address,
        std::string_view default_device,
        std::string_view default_feature) const;

    [[nodiscard]] size_t Size() const noexcept { return overrides_.size(); }

private:
    std::map<Address, SourceOverride> overrides_;
};

}
