// Gangway Request Classifier Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/gateway/classifier.hpp"
#include "../../src/http/http.hpp"

using namespace gangway::gateway;
using namespace gangway::http;

namespace {

Request make_request(Method method, std::vector<Header> headers) {
    Request request;
    request.method = method;
    request.method_name = to_string(method);
    request.uri = "/ws";
    request.path = "/ws";
    request.headers = std::move(headers);
    return request;
}

}  // namespace

TEST_CASE("Classifier - Upgrade websocket goes to relay", "[classifier]") {
    auto request = make_request(Method::GET, {{"Host", "localhost"},
                                              {"Upgrade", "websocket"},
                                              {"Connection", "Upgrade"}});
    REQUIRE(is_websocket_upgrade(request));
    REQUIRE(classify(request) == Route::Relay);
}

TEST_CASE("Classifier - Upgrade value is case-insensitive and trimmed", "[classifier]") {
    REQUIRE(classify(make_request(Method::GET, {{"upgrade", "WebSocket"}})) == Route::Relay);
    REQUIRE(classify(make_request(Method::GET, {{"UPGRADE", "  WEBSOCKET\t"}})) == Route::Relay);
}

TEST_CASE("Classifier - Plain requests are static", "[classifier]") {
    REQUIRE(classify(make_request(Method::GET, {{"Host", "localhost"}})) == Route::StaticFiles);
    REQUIRE(classify(make_request(Method::GET, {})) == Route::StaticFiles);
}

TEST_CASE("Classifier - Other upgrade tokens are static", "[classifier]") {
    REQUIRE(classify(make_request(Method::GET, {{"Upgrade", "h2c"}})) == Route::StaticFiles);
    REQUIRE(classify(make_request(Method::GET, {{"Upgrade", "websocket, h2c"}})) ==
            Route::StaticFiles);
    REQUIRE(classify(make_request(Method::GET, {{"Upgrade", ""}})) == Route::StaticFiles);
}

TEST_CASE("Classifier - Only the first Upgrade header counts", "[classifier]") {
    auto request = make_request(Method::GET, {{"Upgrade", "h2c"}, {"Upgrade", "websocket"}});
    REQUIRE(classify(request) == Route::StaticFiles);
}

TEST_CASE("Classifier - Connection header is not required", "[classifier]") {
    auto request = make_request(Method::GET, {{"Upgrade", "websocket"}});
    REQUIRE(classify(request) == Route::Relay);
}

TEST_CASE("Classifier - Method does not matter", "[classifier]") {
    REQUIRE(classify(make_request(Method::POST, {{"Upgrade", "websocket"}})) == Route::Relay);
    REQUIRE(classify(make_request(Method::HEAD, {{"Upgrade", "websocket"}})) == Route::Relay);
}

TEST_CASE("Classifier - Route names", "[classifier]") {
    REQUIRE(to_string(Route::StaticFiles) == "static");
    REQUIRE(to_string(Route::Relay) == "relay");
}
