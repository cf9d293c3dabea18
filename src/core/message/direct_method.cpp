#include "devicelink/core/message/direct_method.hpp"
#include "devicelink/core/util/error_types.hpp"

namespace devicelink {

    namespace {
        [[noreturn]] void throwNoResult(const std::string& correlationId) {
            throw GatewayError(GatewayErr::NotSupported,
                "Direct method response retrieval is not supported (cid='" + correlationId + "')");
        }
    }

    DirectMethodResponse::DirectMethodResponse(std::string correlationId, int status, std::vector<uint8_t> data)
        : correlationId_(std::move(correlationId)), status_(status), data_(std::move(data)) {}

    int DirectMethodResponse::status() const {
        if (!status_) throwNoResult(correlationId_);
        return *status_;
    }

    const std::vector<uint8_t>& DirectMethodResponse::data() const {
        if (!status_) throwNoResult(correlationId_);
        return data_;
    }

}
