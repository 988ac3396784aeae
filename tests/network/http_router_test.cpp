#include "tus/network/http_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace tus::network;

namespace {

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    return request;
}

} // namespace

TEST(HttpRouterTest, ExtractsPathParameters) {
    HttpRouter router;
    router.patch("/files/:id", [](const HttpContext& ctx) {
        HttpResponse response(HttpStatus::NO_CONTENT);
        response.set_header("X-Id", ctx.get_param("id"));
        return response;
    });

    auto response = router.handle_request(make_request(HttpMethod::PATCH, "/files/abc-123"));
    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.get_header("X-Id"), "abc-123");
}

TEST(HttpRouterTest, IgnoresQueryString) {
    HttpRouter router;
    router.get("/files/", [](const HttpContext&) { return HttpResponse(HttpStatus::OK); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/files/?x=1")).status_code, 200);
}

TEST(HttpRouterTest, ParameterDoesNotSpanSegments) {
    HttpRouter router;
    router.head("/files/:id", [](const HttpContext&) { return HttpResponse(HttpStatus::OK); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::HEAD, "/files/a/b")).status_code, 404);
}

TEST(HttpRouterTest, WrongMethodIsMethodNotAllowed) {
    HttpRouter router;
    router.head("/files/:id", [](const HttpContext&) { return HttpResponse(HttpStatus::OK); });
    router.patch("/files/:id", [](const HttpContext&) { return HttpResponse(HttpStatus::NO_CONTENT); });

    auto response = router.handle_request(make_request(HttpMethod::PUT, "/files/abc"));
    EXPECT_EQ(response.status_code, 405);
    EXPECT_EQ(response.get_header("Allow"), "HEAD, PATCH");
}

TEST(HttpRouterTest, UnknownPathUsesNotFoundHandler) {
    HttpRouter router;
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/nothing")).status_code, 404);

    router.set_not_found_handler([](const HttpContext&) { return HttpResponse(HttpStatus::GONE); });
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/nothing")).status_code, 410);
}

TEST(HttpRouterTest, MiddlewareCanShortCircuit) {
    HttpRouter router;
    bool handler_called = false;
    router.post("/files/", [&](const HttpContext&) {
        handler_called = true;
        return HttpResponse(HttpStatus::CREATED);
    });
    router.use([](const HttpContext&, HttpResponse& response) {
        response = HttpResponse(HttpStatus::PRECONDITION_FAILED);
        return false;
    });

    auto response = router.handle_request(make_request(HttpMethod::POST, "/files/"));
    EXPECT_EQ(response.status_code, 412);
    EXPECT_FALSE(handler_called);
}

TEST(HttpRouterTest, ThrowingHandlerBecomesInternalError) {
    HttpRouter router;
    router.delete_("/files/:id", [](const HttpContext&) -> HttpResponse {
        throw std::runtime_error("disk on fire");
    });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::DELETE_METHOD, "/files/x")).status_code, 500);
}

TEST(HttpRouterTest, ListsRoutes) {
    HttpRouter router;
    router.options("/files/", [](const HttpContext&) { return HttpResponse(HttpStatus::NO_CONTENT); });
    router.post("/files/", [](const HttpContext&) { return HttpResponse(HttpStatus::CREATED); });

    EXPECT_EQ(router.route_count(), 2u);
    EXPECT_EQ(router.list_routes(), (std::vector<std::string>{"OPTIONS /files/", "POST /files/"}));
}

TEST(PatternToRegexTest, ConvertsParametersAndEscapes) {
    std::vector<std::string> names;
    EXPECT_EQ(pattern_to_regex("/files/:id", names), "^/files/([^/]+)$");
    EXPECT_EQ(names, std::vector<std::string>{"id"});

    names.clear();
    EXPECT_EQ(pattern_to_regex("/a.b/*", names), "^/a\\.b/(.*)$");
    EXPECT_TRUE(names.empty());
}
