#pragma once

#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"

#include <open62541/types.h>

#include <string>
#include <string_view>

namespace uabridge::opcua {

/**
 * @brief Parsed OPC-UA node id that releases itself
 *
 * Accepts the standard string form (`ns=2;s=Pump.Speed`, `i=2258`,
 * `ns=1;g=...`, `ns=1;b=...`). The original text is kept for addressing and
 * logging, so a node is always reported the way it was configured.
 */
class NodeReference {
public:
    [[nodiscard]] static Result<NodeReference, BridgeFailure> Parse(std::string_view text);

    ~NodeReference();

    NodeReference(NodeReference&& other) noexcept;
    NodeReference& operator=(NodeReference&& other) noexcept;

    NodeReference(const NodeReference&) = delete;
    NodeReference& operator=(const NodeReference&) = delete;

    [[nodiscard]] const UA_NodeId& Id() const noexcept { return id_; }

    [[nodiscard]] const std::string& Text() const noexcept { return text_; }

private:
    NodeReference(UA_NodeId id, std::string text) noexcept;

    UA_NodeId id_;
    std::string text_;
};

std::string NodeIdToString(const UA_NodeId& id);

std::string ExpandedNodeIdToString(const UA_ExpandedNodeId& id);

}
