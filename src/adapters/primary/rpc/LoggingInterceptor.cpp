#include "adapters/primary/rpc/LoggingInterceptor.hpp"
#include "adapters/primary/rpc/GrpcErrorMapping.hpp"

#include <google/protobuf/util/json_util.h>
#include <iostream>

namespace accounts::adapters::primary::rpc {

using ::grpc::experimental::InterceptionHookPoints;

LoggingInterceptor::LoggingInterceptor(::grpc::experimental::ServerRpcInfo* info,
                                       std::shared_ptr<ports::output::ICallObserver> observer)
    : method_(info->method() != nullptr ? info->method() : "<unknown>")
    , observer_(std::move(observer))
    , start_(std::chrono::steady_clock::now())
{}

void LoggingInterceptor::Intercept(::grpc::experimental::InterceptorBatchMethods* methods)
{
    if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::POST_RECV_MESSAGE)) {
        request_ = messageToJson(static_cast<const google::protobuf::Message*>(methods->GetRecvMessage()));
    }

    if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_MESSAGE)) {
        response_ = messageToJson(static_cast<const google::protobuf::Message*>(methods->GetSendMessage()));
    }

    if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_STATUS)) {
        try {
            ::grpc::Status status = methods->GetSendStatus();

            ports::output::CallRecord record;
            record.transport = "gRPC";
            record.label = method_;
            record.request = request_;
            record.response = status.ok() ? response_ : status.error_message();
            record.status = statusCodeName(status.error_code());
            record.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start_);

            observer_->onCallCompleted(record);
        } catch (const std::exception& e) {
            std::cerr << "[LoggingInterceptor] Observer error: " << e.what() << std::endl;
        }
    }

    methods->Proceed();
}

std::string LoggingInterceptor::messageToJson(const google::protobuf::Message* message)
{
    if (message == nullptr) {
        return "<nil>";
    }

    try {
        std::string json;
        google::protobuf::util::JsonPrintOptions options;
        options.add_whitespace = false;
        options.preserve_proto_field_names = true;

        auto status = google::protobuf::util::MessageToJsonString(*message, &json, options);
        if (!status.ok()) {
            return "<unmarshalable>";
        }
        return json;
    } catch (const std::exception&) {
        return "<unmarshalable>";
    }
}

} // namespace accounts::adapters::primary::rpc
