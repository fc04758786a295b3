#pragma once

#include "http/IRequest.hpp"
#include "http/IResponse.hpp"

namespace accounts::http {

class IHttpHandler {
public:
    virtual ~IHttpHandler() = default;

    virtual void handle(IRequest& req, IResponse& res) = 0;
};

} // namespace accounts::http
