// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <map>

using lodns::gateway::Configuration;
using lodns::gateway::ConfigurationError;

namespace
{
Configuration::EnvLookup envFrom(std::map<std::string, std::string> vars)
{
  return [vars](const std::string& name) -> std::optional<std::string>
  {
    auto it = vars.find(name);
    if (it == vars.end())
    {
      return std::nullopt;
    }
    return it->second;
  };
}
} // namespace

TEST_CASE("Configuration defaults", "[config][gateway]")
{
  Configuration config;
  REQUIRE(config.apiKey.empty());
  REQUIRE(config.models.size() == 3);
  REQUIRE(config.models[0] == "nvidia/nemotron-nano-9b-v2:free");
  REQUIRE(config.systemPrompt == Configuration::DEFAULT_SYSTEM_PROMPT);
  REQUIRE(config.endpoint == "https://openrouter.ai/api/v1/chat/completions");
  REQUIRE(config.listenAddress == "0.0.0.0");
  REQUIRE(config.listenPort == 53);
  REQUIRE(config.ttl == 300);
  REQUIRE(config.maxChunkBytes == 250);
  REQUIRE(config.maxTotalBytes == 4096);
  REQUIRE(config.requestTimeout.count() == 30000);
  REQUIRE_FALSE(config.stopOnAuthError);
}

TEST_CASE("Configuration from environment", "[config][gateway][env]")
{
  SECTION("All variables applied")
  {
    auto config = Configuration::fromEnvironment(envFrom({
      {"OPENROUTER_API_KEY", "sk-or-v1-abcdef123456"},
      {"OPENROUTER_MODEL", " a/one , ,b/two,"},
      {"SYSTEM_PROMPT", "Answer in French."},
      {"PORT", "5353"},
      {"HOST", "127.0.0.1"},
      {"LOG_LEVEL", "debug"},
    }));
    REQUIRE(config.apiKey == "sk-or-v1-abcdef123456");
    REQUIRE(config.models == std::vector<std::string>{"a/one", "b/two"});
    REQUIRE(config.systemPrompt == "Answer in French.");
    REQUIRE(config.listenPort == 5353);
    REQUIRE(config.listenAddress == "127.0.0.1");
    REQUIRE(config.log.level == "debug");
  }

  SECTION("PORT wins over DNS_PORT")
  {
    auto config = Configuration::fromEnvironment(
      envFrom({{"OPENROUTER_API_KEY", "k"}, {"PORT", "1053"}, {"DNS_PORT", "2053"}}));
    REQUIRE(config.listenPort == 1053);
  }

  SECTION("DNS_PORT and DNS_ADDRESS used as fallbacks")
  {
    auto config = Configuration::fromEnvironment(envFrom(
      {{"OPENROUTER_API_KEY", "k"}, {"DNS_PORT", "2053"}, {"DNS_ADDRESS", "::1"}}));
    REQUIRE(config.listenPort == 2053);
    REQUIRE(config.listenAddress == "::1");
  }

  SECTION("Missing API key")
  {
    REQUIRE_THROWS_WITH(Configuration::fromEnvironment(envFrom({})),
                        "OPENROUTER_API_KEY environment variable not set");
  }

  SECTION("Model list that cleans to nothing")
  {
    REQUIRE_THROWS_AS(Configuration::fromEnvironment(
                        envFrom({{"OPENROUTER_API_KEY", "k"}, {"OPENROUTER_MODEL", " , ,"}})),
                      ConfigurationError);
  }

  SECTION("Unparsable port")
  {
    REQUIRE_THROWS_WITH(
      Configuration::fromEnvironment(envFrom({{"OPENROUTER_API_KEY", "k"}, {"PORT", "abc"}})),
      "Invalid PORT/DNS_PORT value: abc");
  }
}

TEST_CASE("Configuration layers dotenv files under the environment", "[config][gateway][env]")
{
  auto dir = std::filesystem::temp_directory_path() / "lodns_test_dotenv_layers";
  lodns::test::ScopedPath cleanup(dir);
  std::filesystem::create_directories(dir);
  auto local = (dir / ".env.local").string();
  auto shared = (dir / ".env").string();
  lodns::test::writeFile(local, "OPENROUTER_API_KEY=local-key\nPORT=1053\n");
  lodns::test::writeFile(shared, "OPENROUTER_API_KEY=shared-key\n"
                                 "PORT=2053\n"
                                 "HOST=127.0.0.1\n"
                                 "OPENROUTER_MODEL=x/one,x/two\n");

  auto lookup = Configuration::layeredEnvironment(
    {local, shared, (dir / "missing.env").string()}, envFrom({{"PORT", "3053"}}));

  auto config = Configuration::fromEnvironment(lookup);
  REQUIRE(config.apiKey == "local-key");
  REQUIRE(config.listenPort == 3053);
  REQUIRE(config.listenAddress == "127.0.0.1");
  REQUIRE(config.models == std::vector<std::string>{"x/one", "x/two"});
  REQUIRE_FALSE(lookup("UNSET_VARIABLE").has_value());

  SECTION("Malformed file is a configuration error")
  {
    lodns::test::writeFile(shared, "this line has no assignment\n");
    REQUIRE_THROWS_AS(Configuration::layeredEnvironment({local, shared}, envFrom({})),
                      ConfigurationError);
  }
}

TEST_CASE("Configuration helpers", "[config][gateway]")
{
  REQUIRE(Configuration::parseModelList("x,y , z") == std::vector<std::string>{"x", "y", "z"});
  REQUIRE(Configuration::parseModelList("").empty());

  REQUIRE(Configuration::parsePort("53") == 53);
  REQUIRE(Configuration::parsePort("65535") == 65535);
  REQUIRE_THROWS_AS(Configuration::parsePort("0"), ConfigurationError);
  REQUIRE_THROWS_AS(Configuration::parsePort("65536"), ConfigurationError);
  REQUIRE_THROWS_AS(Configuration::parsePort("53abc"), ConfigurationError);
  REQUIRE_THROWS_AS(Configuration::parsePort(""), ConfigurationError);

  REQUIRE(Configuration::maskApiKey("sk-or-v1-secretvalue") == "sk-or-v1");
  REQUIRE(Configuration::maskApiKey("short") == "*****");
  REQUIRE(Configuration::maskApiKey("12345678") == "********");
  REQUIRE(Configuration::maskApiKey("").empty());
}

TEST_CASE("Configuration validation", "[config][gateway]")
{
  Configuration config;
  config.apiKey = "k";
  REQUIRE_NOTHROW(config.validate());

  SECTION("Chunk size bounds")
  {
    config.maxChunkBytes = 256;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    config.maxChunkBytes = 3;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }

  SECTION("Total must hold at least one chunk")
  {
    config.maxTotalBytes = 100;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }

  SECTION("Total must keep the reply within one UDP datagram")
  {
    config.maxTotalBytes = 70000;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    config.maxTotalBytes = 65000;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    config.maxTotalBytes = 60000;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(Configuration::worstCaseReplySize(250, 60000) <= 65507);

    config.maxChunkBytes = 4;
    config.maxTotalBytes = 40000;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    config.maxTotalBytes = 4096;
    REQUIRE_NOTHROW(config.validate());
  }

  SECTION("Largest total builds a reply that fits")
  {
    config.maxTotalBytes = 60000;
    REQUIRE_NOTHROW(config.validate());

    lodns::network::dns::DnsQuestion question("", lodns::network::dns::DnsType::TXT);
    question.labels = {std::string(63, 'q'), std::string(63, 'q'), std::string(63, 'q'),
                       std::string(61, 'q')};
    auto decoded =
      lodns::gateway::ProtocolAdapter::decode(lodns::network::dns::DnsMessage::buildQuery(question, 1));
    REQUIRE(decoded.ok);

    auto chunks = lodns::text::TextChunker::chunk(std::string(70000, 'x'), config.maxChunkBytes,
                                                  config.maxTotalBytes);
    auto reply = lodns::gateway::ProtocolAdapter::encode(
      decoded.query, chunks, lodns::network::dns::DnsResponseCode::NOERROR, config.ttl);
    REQUIRE(reply.size() <= 65507);
    REQUIRE(reply.size() <= Configuration::worstCaseReplySize(config.maxChunkBytes, config.maxTotalBytes));
  }

  SECTION("TTL fits in 31 bits")
  {
    config.ttl = 0x80000000u;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    config.ttl = 0x7FFFFFFF;
    REQUIRE_NOTHROW(config.validate());
    config.ttl = 0;
    REQUIRE_NOTHROW(config.validate());
  }

  SECTION("Timeout must be positive")
  {
    config.requestTimeout = std::chrono::milliseconds(0);
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }

  SECTION("Thread pool bounds")
  {
    config.threadPool.minThreads = 8;
    config.threadPool.maxThreads = 4;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }

  SECTION("Empty model list")
  {
    config.models.clear();
    REQUIRE_THROWS_WITH(config.validate(), "Model list cannot be empty");
  }
}

TEST_CASE("Configuration file overlay", "[config][gateway][toml]")
{
  auto loader = lodns::core::ConfigLoader::fromString("[inference]\n"
                                                      "api_key = \"file-key\"\n"
                                                      "models = [\"f/one\", \"f/two\"]\n"
                                                      "timeout_seconds = 12\n"
                                                      "stop_on_auth_error = true\n"
                                                      "[dns]\n"
                                                      "address = \"127.0.0.1\"\n"
                                                      "port = 8053\n"
                                                      "ttl = 60\n"
                                                      "max_chunk_bytes = 200\n"
                                                      "[log]\n"
                                                      "level = \"warning\"\n"
                                                      "retention_days = 3\n"
                                                      "[threadpool]\n"
                                                      "min_threads = 1\n"
                                                      "max_threads = 4\n"
                                                      "queue_size = 32\n");
  Configuration config;
  config.applyConfigFile(loader);

  REQUIRE(config.apiKey == "file-key");
  REQUIRE(config.models == std::vector<std::string>{"f/one", "f/two"});
  REQUIRE(config.requestTimeout.count() == 12000);
  REQUIRE(config.stopOnAuthError);
  REQUIRE(config.listenAddress == "127.0.0.1");
  REQUIRE(config.listenPort == 8053);
  REQUIRE(config.ttl == 60);
  REQUIRE(config.maxChunkBytes == 200);
  REQUIRE(config.log.level == "warning");
  REQUIRE(config.log.retentionDays == 3);
  REQUIRE(config.threadPool.minThreads == 1);
  REQUIRE(config.threadPool.maxThreads == 4);
  REQUIRE(config.threadPool.queueSize == 32);
  REQUIRE_NOTHROW(config.validate());

  SECTION("Environment overrides the file")
  {
    config.applyEnvironment(envFrom({{"OPENROUTER_API_KEY", "env-key"}, {"PORT", "9053"}}));
    REQUIRE(config.apiKey == "env-key");
    REQUIRE(config.listenPort == 9053);
    REQUIRE(config.models == std::vector<std::string>{"f/one", "f/two"});
  }

  SECTION("Comma separated model string")
  {
    auto other = lodns::core::ConfigLoader::fromString("[inference]\nmodels = \"a, b\"\n");
    config.applyConfigFile(other);
    REQUIRE(config.models == std::vector<std::string>{"a", "b"});
  }
}

TEST_CASE("Configuration file rejects an out of range TTL", "[config][gateway][toml]")
{
  Configuration config;
  auto negative = lodns::core::ConfigLoader::fromString("[dns]\nttl = -1\n");
  REQUIRE_THROWS_AS(config.applyConfigFile(negative), ConfigurationError);
  REQUIRE(config.ttl == 300);

  auto huge = lodns::core::ConfigLoader::fromString("[dns]\nttl = 4294967295\n");
  REQUIRE_THROWS_AS(config.applyConfigFile(huge), ConfigurationError);

  auto largeTotal = lodns::core::ConfigLoader::fromString("[dns]\nmax_total_bytes = 70000\n");
  config.apiKey = "k";
  config.applyConfigFile(largeTotal);
  REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
}

TEST_CASE("Configuration summary masks the key", "[config][gateway]")
{
  Configuration config;
  config.apiKey = "sk-or-v1-0123456789abcdef";
  auto summary = config.summary();
  REQUIRE(summary.find("sk-or-v1") != std::string::npos);
  REQUIRE(summary.find("0123456789abcdef") == std::string::npos);
  REQUIRE(summary.find("listen=0.0.0.0:53") != std::string::npos);
}
