#pragma once
#include "uabridge/core/result.hpp"
#include "uabridge/core/failures.hpp"
#include "uabridge/opcua/data_change_stream.hpp"

#include <memory>

namespace uabridge::interfaces {

/**
 * @brief Producer of OPC-UA events for the bridge
 *
 * Start() may be called once. The returned stream is closed by Stop(), after
 * which no further events are pushed.
 */
class IDataSource {
public:
    virtual ~IDataSource() = default;

    [[nodiscard]] virtual Result<std::shared_ptr<opcua::DataChangeStream>, BridgeFailure> Start() = 0;

    virtual void Stop() = 0;
};

}
