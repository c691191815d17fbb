// tests/test_caching_facade.cpp
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http.hpp>

#include "../src/config/AppConfig.hpp"
#include "../src/core/CachingFacade.hpp"
#include "../src/interfaces/IBackendClient.hpp"
#include "../src/utils/Utils.hpp"
#include "TestMocks.hpp"

using json = nlohmann::json;
using ::testing::NiceMock;

// Records every GET; the test decides when and how each one completes.
class FakeBackendClient : public IBackendClient {
public:
    struct Call {
        BackendUrlInfo backend;
        std::string target;
        Callback on_complete;
    };

    void get(const BackendUrlInfo& backend, const std::string& target, Callback on_complete) override {
        calls.push_back({backend, target, std::move(on_complete)});
    }

    void cancelAll() override { ++cancel_all_calls; }

    void respond(std::size_t index, http::status status, const std::string& body,
                 const std::string& content_type = "application/json") {
        Response res{status, 11};
        res.set(http::field::content_type, content_type);
        res.body() = body;
        res.prepare_payload();
        calls.at(index).on_complete(std::move(res), {});
    }

    void fail(std::size_t index, beast::error_code ec) {
        calls.at(index).on_complete({}, ec);
    }

    std::vector<Call> calls;
    int cancel_all_calls = 0;
};

class CachingFacadeTest : public ::testing::Test {
protected:
    using Response = http::response<http::string_body>;

    boost::asio::io_context ioc_;
    AppConfig config_;
    std::shared_ptr<FakeBackendClient> backend_ = std::make_shared<FakeBackendClient>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    std::shared_ptr<CachingFacade> facade_;

    void SetUp() override {
        ASSERT_TRUE(Utils::addBackend(config_, "users", "http://localhost:9001"));
        config_.cache_ttl_in_millis = 60000;
        config_.circuit_breaker_cool_off_in_millis = 1000;
        facade_ = std::make_shared<CachingFacade>(ioc_, backend_, statsd_, config_, logger_, clock_);
    }

    void drain() {
        ioc_.restart();
        ioc_.run();
    }

    // Issues a request; the returned slot is filled once the facade answers.
    std::shared_ptr<std::optional<Response>> request(const std::string& target) {
        auto slot = std::make_shared<std::optional<Response>>();
        http::request<http::string_body> req{http::verb::get, target, 11};
        facade_->processResourceRequest(req, [slot](std::optional<Response> res) { *slot = std::move(res); });
        drain();
        return slot;
    }

    static std::string errorOf(const Response& res) {
        return json::parse(res.body()).at("error").get<std::string>();
    }
};

TEST_F(CachingFacadeTest, MissingBackendIsBadRequest) {
    auto res = request("/resource/");
    ASSERT_TRUE(res->has_value());
    EXPECT_EQ((*res)->result(), http::status::bad_request);
    EXPECT_EQ(errorOf(**res), "Missing backend name");
    EXPECT_TRUE(backend_->calls.empty());
}

TEST_F(CachingFacadeTest, UnknownBackendIsNotFound) {
    auto res = request("/resource/orders/1");
    ASSERT_TRUE(res->has_value());
    EXPECT_EQ((*res)->result(), http::status::not_found);
    EXPECT_EQ(errorOf(**res), "Unconfigured backend");
    EXPECT_TRUE(backend_->calls.empty());
}

TEST_F(CachingFacadeTest, ConcurrentRequestsShareOneBackendCall) {
    auto first = request("/resource/users/api/1?full=true");
    auto second = request("/resource/USERS/api/1?full=true");
    ASSERT_EQ(backend_->calls.size(), 1u);
    EXPECT_EQ(backend_->calls[0].backend.name, "users");
    EXPECT_EQ(backend_->calls[0].target, "/api/1?full=true");
    EXPECT_FALSE(first->has_value());

    backend_->respond(0, http::status::ok, "hello", "text/plain");
    drain();

    for (const auto& res : {first, second}) {
        ASSERT_TRUE(res->has_value());
        EXPECT_EQ((*res)->result(), http::status::ok);
        EXPECT_EQ((*res)->body(), "hello");
        EXPECT_EQ((**res)[http::field::content_type], "text/plain");
    }

    // Served from the cache afterwards.
    auto third = request("/resource/users/api/1?full=true");
    ASSERT_TRUE(third->has_value());
    EXPECT_EQ((*third)->body(), "hello");
    EXPECT_EQ(backend_->calls.size(), 1u);
}

TEST_F(CachingFacadeTest, BackendNotFoundIsPassedOnAndNotCached) {
    auto res = request("/resource/users/missing");
    ASSERT_EQ(backend_->calls.size(), 1u);
    backend_->respond(0, http::status::not_found, "{}");
    drain();

    ASSERT_TRUE(res->has_value());
    EXPECT_EQ((*res)->result(), http::status::not_found);
    EXPECT_EQ(errorOf(**res), "Not Found");

    request("/resource/users/missing");
    EXPECT_EQ(backend_->calls.size(), 2u);
}

TEST_F(CachingFacadeTest, ServerErrorTripsCircuitBreaker) {
    EXPECT_CALL(*statsd_, increment(::testing::_, ::testing::_)).Times(::testing::AnyNumber());
    EXPECT_CALL(*statsd_, increment(MetricsDefinitions::CIRCUIT_BREAKER_TRIPPED, 1)).Times(1);

    auto res = request("/resource/users/a");
    ASSERT_EQ(backend_->calls.size(), 1u);
    backend_->respond(0, http::status::internal_server_error, "{}");
    drain();
    ASSERT_TRUE(res->has_value());
    EXPECT_EQ((*res)->result(), http::status::bad_gateway);
    EXPECT_EQ(errorOf(**res), "Bad Gateway - Upstream Server Error");

    // Any path on the tripped backend fails fast.
    auto blocked = request("/resource/users/b");
    ASSERT_TRUE(blocked->has_value());
    EXPECT_EQ((*blocked)->result(), http::status::gateway_timeout);
    EXPECT_EQ(errorOf(**blocked), "Gateway Timeout - Circuit Breaker Active");
    EXPECT_EQ(backend_->calls.size(), 1u);

    clock_->advance(std::chrono::milliseconds(1001));
    request("/resource/users/b");
    EXPECT_EQ(backend_->calls.size(), 2u);
}

TEST_F(CachingFacadeTest, UnexpectedStatusIsBadGateway) {
    auto res = request("/resource/users/moved");
    ASSERT_EQ(backend_->calls.size(), 1u);
    backend_->respond(0, http::status::found, "");
    drain();
    ASSERT_TRUE(res->has_value());
    EXPECT_EQ((*res)->result(), http::status::bad_gateway);
    EXPECT_EQ(errorOf(**res), "Bad Gateway");
}

TEST_F(CachingFacadeTest, UpstreamStatusIsLoggedAtDebug) {
    ON_CALL(*logger_, getLogLevel()).WillByDefault(::testing::Return(0));
    EXPECT_CALL(*logger_, debug(::testing::_)).Times(::testing::AnyNumber());
    EXPECT_CALL(*logger_, debug(::testing::HasSubstr("Mapping upstream status 302"))).Times(1);

    auto res = request("/resource/users/moved");
    ASSERT_EQ(backend_->calls.size(), 1u);
    backend_->respond(0, http::status::found, "");
    drain();
    ASSERT_TRUE(res->has_value());
    EXPECT_EQ((*res)->result(), http::status::bad_gateway);
}

TEST_F(CachingFacadeTest, TransportErrorIsGatewayTimeout) {
    auto res = request("/resource/users/slow");
    ASSERT_EQ(backend_->calls.size(), 1u);
    backend_->fail(0, beast::errc::make_error_code(beast::errc::timed_out));
    drain();
    ASSERT_TRUE(res->has_value());
    EXPECT_EQ((*res)->result(), http::status::gateway_timeout);
    EXPECT_EQ(errorOf(**res), "Gateway Timeout");
}

TEST_F(CachingFacadeTest, StatusReportsCacheAndBackends) {
    request("/resource/users/a");
    backend_->respond(0, http::status::ok, "x");
    drain();

    auto slot = std::make_shared<std::optional<Response>>();
    http::request<http::string_body> req{http::verb::get, "/status", 11};
    facade_->processStatusRequest(req, [slot](std::optional<Response> res) { *slot = std::move(res); });
    drain();

    ASSERT_TRUE(slot->has_value());
    EXPECT_EQ((*slot)->result(), http::status::ok);
    json body = json::parse((*slot)->body());
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["cache"]["policy"], "expiring");
    EXPECT_EQ(body["cache"]["ttl_ms"], 60000);
    EXPECT_EQ(body["cache"]["records"], 1);
    EXPECT_EQ(body["cache"]["misses"], 1);
    ASSERT_EQ(body["backends"].size(), 1u);
    EXPECT_EQ(body["backends"][0]["name"], "users");
    EXPECT_EQ(body["backends"][0]["url"], "http://localhost:9001");
}

TEST_F(CachingFacadeTest, CancelReachesBackendClient) {
    facade_->cancel_active_backend_calls();
    EXPECT_EQ(backend_->cancel_all_calls, 1);
}

TEST_F(CachingFacadeTest, RejectsNullDependencies) {
    EXPECT_THROW(std::make_shared<CachingFacade>(ioc_, nullptr, statsd_, config_, logger_, clock_),
                 std::invalid_argument);
    EXPECT_THROW(std::make_shared<CachingFacade>(ioc_, backend_, statsd_, config_, logger_, nullptr),
                 std::invalid_argument);
}
