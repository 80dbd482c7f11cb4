#pragma once

#include <crow/common.h>
#include <crow/http_request.h>
#include <string>

namespace querygate {

/**
 * Owned copy of the parts of an HTTP request the gateway needs.
 *
 * A crow::request is only valid on its connection thread, while the pipeline
 * runs on a worker, so the handler copies what it needs up front.
 */
struct GatewayRequest {
    std::string method;
    std::string path;       // without query string
    std::string raw_url;    // with query string
    crow::ci_map headers;
    std::string body;
    std::string remote_address;

    std::string getHeader(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }

    static GatewayRequest fromCrow(const crow::request& req) {
        GatewayRequest request;
        request.method = crow::method_name(req.method);
        request.path = req.url;
        request.raw_url = req.raw_url;
        request.headers = req.headers;
        request.body = req.body;
        request.remote_address = req.remote_ip_address;
        return request;
    }
};

} // namespace querygate
