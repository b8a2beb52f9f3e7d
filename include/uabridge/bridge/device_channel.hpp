#pragma once

#include "uabridge/mqtt/topic_template.hpp"

#include <string>
#include <vector>

namespace uabridge::bridge {

struct GroupNode {
    std::string node;
    /// Empty means the last element of the source address.
    std::string feature;
};

/**
 * One OPC-UA node, or a node group, published for one device. Fixed for the
 * process lifetime. `node` is the first node of the group and names the
 * channel; `group` lists the rest.
 */
struct DeviceChannel {
    std::string device_id;
    std::string connection;
    std::string subscription;
    std::string node;
    mqtt::TopicTemplate topic;
    int qos = 0;
    bool encrypted = false;
    /// Refuse to publish once the encryption path hits a Persistence failure.
    bool encryption_mandatory = true;
    /// Empty means the last element of the source address.
    std::string feature;
    std::vector<GroupNode> group;
    /// Every envelope also carries the latest value of each group feature.
    bool full_state = false;

    /// `node` followed by the group members.
    [[nodiscard]] std::vector<GroupNode> Nodes() const {
        std::vector<GroupNode> nodes{GroupNode{node, feature}};
        nodes.insert(nodes.end(), group.begin(), group.end());
        return nodes;
    }
};

}
