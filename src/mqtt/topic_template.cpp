#include "uabridge/mqtt/topic_template.hpp"

#include <format>

namespace uabridge::mqtt {

namespace {

    bool HasWildcard(std::string_view text) {
        return text.find_first_of("+#") != std::string_view::npos;
    }

}

Result<TopicTemplate, BridgeFailure> TopicTemplate::Parse(std::string_view text) {
    using ResultType = Result<TopicTemplate, BridgeFailure>;
    if (text.empty()) {
        return ResultType::Err(BridgeFailure::Config("Topic template must not be empty"));
    }
    if (HasWildcard(text)) {
        return ResultType::Err(BridgeFailure::Config(
            std::format("Topic template '{}' contains an MQTT wildcard", text)));
    }

    std::vector<Segment> segments;
    std::string literal;
    size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (c == '}') {
            return ResultType::Err(BridgeFailure::Config(
                std::format("Unbalanced '}}' at offset {} in topic template '{}'", pos, text)));
        }
        if (c != '{') {
            literal.push_back(c);
            ++pos;
            continue;
        }
        const size_t close = text.find_first_of("{}", pos + 1);
        if (close == std::string_view::npos || text[close] != '}') {
            return ResultType::Err(BridgeFailure::Config(
                std::format("Unbalanced '{{' at offset {} in topic template '{}'", pos, text)));
        }
        const auto name = text.substr(pos + 1, close - pos - 1);
        Placeholder placeholder;
        if (name == "device") {
            placeholder = Placeholder::Device;
        } else if (name == "connection") {
            placeholder = Placeholder::Connection;
        } else if (name == "feature") {
            placeholder = Placeholder::Feature;
        } else {
            return ResultType::Err(BridgeFailure::Config(
                std::format("Unknown placeholder '{{{}}}' in topic template '{}'", name, text)));
        }
        if (!literal.empty()) {
            segments.emplace_back(std::move(literal));
            literal.clear();
        }
        segments.emplace_back(placeholder);
        pos = close + 1;
    }
    if (!literal.empty()) {
        segments.emplace_back(std::move(literal));
    }
    return ResultType::Ok(TopicTemplate(std::string(text), std::move(segments)));
}

Result<std::string, BridgeFailure> TopicTemplate::Render(const TopicContext& context) const {
    std::string topic;
    for (const auto& segment : segments_) {
        if (const auto* literal = std::get_if<std::string>(&segment)) {
            topic.append(*literal);
            continue;
        }
        std::string_view name;
        const std::string* value = nullptr;
        switch (std::get<Placeholder>(segment)) {
            case Placeholder::Device:
                name = "device";
                value = &context.device;
                break;
            case Placeholder::Connection:
                name = "connection";
                value = &context.connection;
                break;
            case Placeholder::Feature:
                name = "feature";
                value = &context.feature;
                break;
        }
        if (value->empty() || HasWildcard(*value)) {
            return Result<std::string, BridgeFailure>::Err(BridgeFailure::Config(std::format(
                "Value '{}' for {{{}}} cannot be used in topic '{}'", *value, name, text_)));
        }
        topic.append(*value);
    }
    return Result<std::string, BridgeFailure>::Ok(std::move(topic));
}

bool TopicTemplate::UsesPlaceholder(std::string_view name) const {
    for (const auto& segment : segments_) {
        if (const auto* placeholder = std::get_if<Placeholder>(&segment)) {
            if ((*placeholder == Placeholder::Device && name == "device") ||
                (*placeholder == Placeholder::Connection && name == "connection") ||
                (*placeholder == Placeholder::Feature && name == "feature")) {
                return true;
            }
        }
    }
    return false;
}

}
