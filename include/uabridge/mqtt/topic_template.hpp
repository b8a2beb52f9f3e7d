#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uabridge::mqtt {

struct TopicContext {
    std::string device;
    std::string connection;
    std::string feature;
};

/**
 * @brief MQTT topic with `{device}`, `{connection}` and `{feature}` placeholders
 *
 * Parse() rejects empty templates, unknown placeholders, unbalanced braces
 * and the wildcards `+` and `#`. Render() applies the same wildcard rule to
 * substituted values, so a rendered topic is always publishable.
 */
class TopicTemplate {
public:
    [[nodiscard]] static Result<TopicTemplate, BridgeFailure> Parse(std::string_view text);

    [[nodiscard]] Result<std::string, BridgeFailure> Render(const TopicContext& context) const;

    [[nodiscard]] const std::string& Text() const noexcept { return text_; }

    [[nodiscard]] bool UsesPlaceholder(std::string_view name) const;

private:
    enum class Placeholder {
        Device,
        Connection,
        Feature
    };

    using Segment = std::variant<std::string, Placeholder>;

    TopicTemplate(std::string text, std::vector<Segment> segments)
        : text_(std::move(text)), segments_(std::move(segments)) {}

    std::string text_;
    std::vector<Segment> segments_;
};

}
