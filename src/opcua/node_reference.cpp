#include "uabridge/opcua/node_reference.hpp"
#include "uabridge/opcua/ua_data_value.hpp"

#include <format>

namespace uabridge::opcua {

NodeReference::NodeReference(UA_NodeId id, std::string text) noexcept
    : id_(id)
    , text_(std::move(text)) {}

Result<NodeReference, BridgeFailure> NodeReference::Parse(std::string_view text) {
    if (text.empty()) {
        return Result<NodeReference, BridgeFailure>::Err(
            BridgeFailure::Config("Node id must not be empty"));
    }
    UA_String input;
    input.length = text.size();
    input.data = reinterpret_cast<UA_Byte*>(const_cast<char*>(text.data()));

    UA_NodeId id;
    UA_NodeId_init(&id);
    const UA_StatusCode status = UA_NodeId_parse(&id, input);
    if (status != UA_STATUSCODE_GOOD) {
        return Result<NodeReference, BridgeFailure>::Err(BridgeFailure::Config(
            std::format("Invalid node id '{}': {}", text, StatusCodeName(status))));
    }
    return Result<NodeReference, BridgeFailure>::Ok(NodeReference(id, std::string(text)));
}

NodeReference::~NodeReference() {
    UA_NodeId_clear(&id_);
}

NodeReference::NodeReference(NodeReference&& other) noexcept
    : id_(other.id_)
    , text_(std::move(other.text_)) {
    UA_NodeId_init(&other.id_);
}

NodeReference& NodeReference::operator=(NodeReference&& other) noexcept {
    if (this != &other) {
        UA_NodeId_clear(&id_);
        id_ = other.id_;
        text_ = std::move(other.text_);
        UA_NodeId_init(&other.id_);
    }
    return *this;
}

std::string NodeIdToString(const UA_NodeId& id) {
    UA_String printed = UA_STRING_NULL;
    if (UA_NodeId_print(&id, &printed) != UA_STATUSCODE_GOOD) {
        return {};
    }
    auto result = ToStdString(printed);
    UA_String_clear(&printed);
    return result;
}

std::string ExpandedNodeIdToString(const UA_ExpandedNodeId& id) {
    UA_String printed = UA_STRING_NULL;
    if (UA_ExpandedNodeId_print(&id, &printed) != UA_STATUSCODE_GOOD) {
        return {};
    }
    auto result = ToStdString(printed);
    UA_String_clear(&printed);
    return result;
}

}
