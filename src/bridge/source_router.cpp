#include "uabridge/bridge/source_router.hpp"

namespace uabridge::bridge {

namespace {

constexpr size_t NODE_SEGMENT = 4;

}

SourceRouter::SourceRouter(const std::map<std::string, SourceOverride>& overrides) {
    for (const auto& [key, value] : overrides) {
        overrides_.insert_or_assign(ParseAddress(key), value);
    }
}

SourceRouter::Address SourceRouter::SourceAddress(
    const std::string_view connection,
    const std::string_view subscription,
    const std::string_view node) {
    return Address{"opcua", std::string(connection), "subscriptions", std::string(subscription), std::string(node)};
}

SourceRouter::Address SourceRouter::ParseAddress(std::string_view text) {
    Address address;
    while (!text.empty() && text.back() == '/') {
        text.remove_suffix(1);
    }
    while (!text.empty()) {
        if (address.size() == NODE_SEGMENT) {
            address.emplace_back(text);
            break;
        }
        const auto slash = text.find('/');
        address.emplace_back(text.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        text.remove_prefix(slash + 1);
    }
    return address;
}

std::string SourceRouter::FormatAddress(const Address& address) {
    std::string text;
    for (const auto& segment : address) {
        if (!text.empty()) {
            text.push_back('/');
        }
        text.append(segment);
    }
    return text;
}

std::string SourceRouter::DefaultFeature(const Address& address) {
    return address.empty() ? std::string() : address.back();
}

RouteDecision SourceRouter::Route(
    const Address& address,
    const std::string_view default_device,
    const std::string_view default_feature) const {
    RouteDecision decision{false, std::string(default_device), std::string(default_feature)};
    if (decision.feature.empty()) {
        decision.feature = DefaultFeature(address);
    }

    // Least specific first, so later matches overwrite.
    Address prefix;
    prefix.reserve(address.size());
    for (size_t depth = 0; depth <= address.size(); ++depth) {
        if (depth > 0) {
            prefix.push_back(address[depth - 1]);
        }
        const auto it = overrides_.find(prefix);
        if (it == overrides_.end()) {
            continue;
        }
        const SourceOverride& entry = it->second;
        if (entry.drop.has_value()) {
            decision.drop = *entry.drop;
        }
        if (!entry.device.empty()) {
            decision.device = entry.device;
        }
        if (!entry.feature.empty()) {
            decision.feature = entry.feature;
        }
    }
    return decision;
}

}
