#pragma once
#include "uabridge/interfaces/i_data_source.hpp"

#include <memory>
#include <optional>

namespace uabridge::test_helpers {

/**
 * IDataSource whose events are pushed by the test.
 */
class FakeDataSource : public interfaces::IDataSource {
public:
    [[nodiscard]] Result<std::shared_ptr<opcua::DataChangeStream>, BridgeFailure> Start() override {
        if (start_failure_.has_value()) {
            return Result<std::shared_ptr<opcua::DataChangeStream>, BridgeFailure>::Err(*start_failure_);
        }
        return Result<std::shared_ptr<opcua::DataChangeStream>, BridgeFailure>::Ok(stream_);
    }

    void Stop() override { stream_->Close(); }

    bool Emit(opcua::StreamEvent event) { return stream_->Push(std::move(event)); }

    void FailStartWith(BridgeFailure failure) { start_failure_ = std::move(failure); }

private:
    std::shared_ptr<opcua::DataChangeStream> stream_ = std::make_shared<opcua::DataChangeStream>();
    std::optional<BridgeFailure> start_failure_;
};

}
