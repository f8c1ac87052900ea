#include <gtest/gtest.h>
#include <drogon/drogon.h>
#include "../src/control/cors.hpp"

using namespace income_api;

TEST(CorsTest, PreflightAllowsAnyOrigin) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Options);
    req->setPath("/fetch_data");
    req->addHeader("Origin", "http://localhost:3000");
    req->addHeader("Access-Control-Request-Headers", "X-Requested-With");

    auto resp = cors_preflight(req);
    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getStatusCode(), drogon::k200OK);
    EXPECT_EQ(resp->getHeader("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(resp->getHeader("Access-Control-Allow-Methods"), "GET, OPTIONS");
    EXPECT_EQ(resp->getHeader("Access-Control-Allow-Headers"), "X-Requested-With");
}

TEST(CorsTest, PreflightDefaultsAllowedHeaders) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Options);
    auto resp = cors_preflight(req);
    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->getHeader("Access-Control-Allow-Headers"), "Content-Type");
}

TEST(CorsTest, NonOptionsRequestsPassThrough) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    EXPECT_EQ(cors_preflight(req), nullptr);
}

TEST(CorsTest, AddsAllowOriginToResponses) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    add_cors_headers(resp);
    EXPECT_EQ(resp->getHeader("Access-Control-Allow-Origin"), "*");
}
