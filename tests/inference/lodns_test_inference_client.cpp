// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <map>

using lodns::inference::InferenceClient;
using lodns::inference::InferenceError;
using lodns::test::MockHttpServer;

namespace
{
InferenceClient::Config clientConfig(const MockHttpServer& server)
{
  InferenceClient::Config config;
  config.apiKey = "sk-test-key";
  config.systemPrompt = "Be brief.";
  config.endpoint = server.url();
  config.requestTimeout = std::chrono::milliseconds(2000);
  return config;
}

/// Scripted reply per model name; unknown models get a 500.
MockHttpServer::Handler scripted(std::map<std::string, std::optional<std::string>> replies)
{
  return [replies](const MockHttpServer::Request& req) -> std::optional<std::string>
  {
    auto it = replies.find(req.model());
    if (it == replies.end())
    {
      return lodns::test::httpResponse(500, "Internal Server Error", "{}");
    }
    return it->second;
  };
}
} // namespace

TEST_CASE("InferenceClient falls back to the next model", "[inference][fallback]")
{
  lodns::test::initializeTestLogging();
  MockHttpServer server(scripted({
    {"m1", lodns::test::httpResponse(429, "Too Many Requests", "{\"error\":\"rate\"}")},
    {"m2", lodns::test::httpResponse(200, "OK", lodns::test::completionBody("  hello \n"))},
    {"m3", lodns::test::httpResponse(200, "OK", lodns::test::completionBody("never"))},
  }));

  InferenceClient client(clientConfig(server));
  auto outcome = client.complete("what is rust", {"m1", "m2", "m3"});

  REQUIRE(outcome.ok);
  REQUIRE(outcome.error == InferenceError::None);
  REQUIRE(outcome.result.model == "m2");
  REQUIRE(outcome.result.text == "hello");
  REQUIRE(outcome.attempts.size() == 2);
  REQUIRE(outcome.attempts[0].status == 429);
  REQUIRE(outcome.attempts[0].retryable);
  REQUIRE(outcome.attempts[0].message == "Rate limit exceeded (429)");

  auto requests = server.requests();
  REQUIRE(requests.size() == 2);
  REQUIRE(requests[0].model() == "m1");
  REQUIRE(requests[1].model() == "m2");
}

TEST_CASE("InferenceClient sends an OpenAI-style request", "[inference][request]")
{
  MockHttpServer server(scripted(
    {{"only", lodns::test::httpResponse(200, "OK", lodns::test::completionBody("ok"))}}));

  InferenceClient client(clientConfig(server));
  auto outcome = client.complete("hi there", {"only"});
  REQUIRE(outcome.ok);

  auto requests = server.requests();
  REQUIRE(requests.size() == 1);
  REQUIRE(requests[0].method == "POST");
  REQUIRE(requests[0].path == "/api/v1/chat/completions");
  REQUIRE(requests[0].head.find("Authorization: Bearer sk-test-key") != std::string::npos);
  REQUIRE(requests[0].head.find("Content-Type: application/json") != std::string::npos);

  auto body = lodns::core::tryParse(requests[0].body);
  REQUIRE(body.has_value());
  REQUIRE((*body)["model"] == "only");
  REQUIRE((*body)["messages"].size() == 2);
  REQUIRE((*body)["messages"][0]["role"] == "system");
  REQUIRE((*body)["messages"][0]["content"] == "Be brief.");
  REQUIRE((*body)["messages"][1]["role"] == "user");
  REQUIRE((*body)["messages"][1]["content"] == "hi there");
}

TEST_CASE("InferenceClient omits an empty system prompt", "[inference][request]")
{
  InferenceClient::Config config;
  config.apiKey = "k";
  InferenceClient client(config);

  auto body = lodns::core::tryParse(client.buildRequestBody("model-x", "question"));
  REQUIRE(body.has_value());
  REQUIRE((*body)["messages"].size() == 1);
  REQUIRE((*body)["messages"][0]["role"] == "user");
}

TEST_CASE("InferenceClient validates its inputs before any request", "[inference][errors]")
{
  MockHttpServer server(scripted({}));
  auto config = clientConfig(server);

  SECTION("Empty prompt")
  {
    InferenceClient client(config);
    auto outcome = client.complete("", {"m1"});
    REQUIRE_FALSE(outcome.ok);
    REQUIRE(outcome.error == InferenceError::EmptyPrompt);
    REQUIRE(outcome.message == "Prompt cannot be empty");
  }

  SECTION("Empty model list")
  {
    InferenceClient client(config);
    auto outcome = client.complete("hello", {});
    REQUIRE(outcome.error == InferenceError::EmptyModelList);
  }

  SECTION("Empty API key")
  {
    config.apiKey.clear();
    InferenceClient client(config);
    auto outcome = client.complete("hello", {"m1"});
    REQUIRE(outcome.error == InferenceError::EmptyApiKey);
    REQUIRE(std::string(lodns::inference::toString(outcome.error)) == "empty API key");
  }

  REQUIRE(server.hitCount() == 0);
}

TEST_CASE("InferenceClient reports exhaustion after a timeout", "[inference][timeout]")
{
  MockHttpServer server(scripted({{"slow", std::nullopt}}));
  auto config = clientConfig(server);
  config.requestTimeout = std::chrono::milliseconds(300);

  InferenceClient client(config);
  auto outcome = client.complete("hello", {"slow"});

  REQUIRE_FALSE(outcome.ok);
  REQUIRE(outcome.error == InferenceError::AllModelsFailed);
  REQUIRE(outcome.attempts.size() == 1);
  REQUIRE(outcome.attempts[0].status == 0);
  REQUIRE(outcome.message.find("timeout") != std::string::npos);
}

TEST_CASE("InferenceClient treats unusable bodies as failures", "[inference][errors]")
{
  MockHttpServer server(scripted({
    {"nochoices", lodns::test::httpResponse(200, "OK", "{\"choices\":[]}")},
    {"notjson", lodns::test::httpResponse(200, "OK", "<html>")},
    {"blank", lodns::test::httpResponse(200, "OK", lodns::test::completionBody("   "))},
    {"bad", lodns::test::httpResponse(400, "Bad Request", "{\"error\":\"bad\"}")},
  }));

  InferenceClient client(clientConfig(server));
  auto outcome = client.complete("hello", {"nochoices", "notjson", "blank", "bad", "boom"});

  REQUIRE(outcome.error == InferenceError::AllModelsFailed);
  REQUIRE(outcome.attempts.size() == 5);
  REQUIRE(outcome.attempts[0].message == "No choices in API response");
  REQUIRE(outcome.attempts[1].message == "Failed to parse inference API response");
  REQUIRE(outcome.attempts[2].message == "Empty completion in API response");
  REQUIRE(outcome.attempts[3].message == "Bad request (400): {\"error\":\"bad\"}");
  REQUIRE_FALSE(outcome.attempts[3].retryable);
  REQUIRE(outcome.attempts[4].status == 500);
  REQUIRE(outcome.message == "Inference API server error (500)");
  REQUIRE(server.hitCount() == 5);
}

TEST_CASE("InferenceClient authentication failures", "[inference][auth]")
{
  auto unauthorized = lodns::test::httpResponse(401, "Unauthorized", "{}");
  MockHttpServer server(scripted({
    {"m1", unauthorized},
    {"m2", lodns::test::httpResponse(200, "OK", lodns::test::completionBody("fine"))},
  }));
  auto config = clientConfig(server);

  SECTION("Fallback continues by default")
  {
    InferenceClient client(config);
    auto outcome = client.complete("hello", {"m1", "m2"});
    REQUIRE(outcome.ok);
    REQUIRE(outcome.result.model == "m2");
    REQUIRE(outcome.attempts[0].message == "Unauthorized: Invalid API key (401)");
  }

  SECTION("stopOnAuthError ends the chain")
  {
    config.stopOnAuthError = true;
    InferenceClient client(config);
    auto outcome = client.complete("hello", {"m1", "m2"});
    REQUIRE_FALSE(outcome.ok);
    REQUIRE(outcome.error == InferenceError::AuthenticationFailed);
    REQUIRE(outcome.attempts.size() == 1);
  }
}

TEST_CASE("InferenceClient response helpers", "[inference]")
{
  std::string error;
  auto content = InferenceClient::extractContent(lodns::test::completionBody("\t42 "), error);
  REQUIRE(content.has_value());
  REQUIRE(*content == "42");

  REQUIRE_FALSE(
    InferenceClient::extractContent("{\"choices\":[{\"message\":{}}]}", error).has_value());
  REQUIRE(error == "No content in API response");
  REQUIRE_FALSE(InferenceClient::extractContent("{\"choices\":[{}]}", error).has_value());
  REQUIRE(error == "No message in API response");

  REQUIRE(InferenceClient::isRetryableStatus(429));
  REQUIRE(InferenceClient::isRetryableStatus(404));
  REQUIRE(InferenceClient::isRetryableStatus(503));
  REQUIRE_FALSE(InferenceClient::isRetryableStatus(400));
  REQUIRE_FALSE(InferenceClient::isRetryableStatus(401));
}
