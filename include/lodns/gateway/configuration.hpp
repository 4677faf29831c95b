// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "lodns/core/config_loader.hpp"
#include "lodns/network/dns/dns_types.hpp"
#include "lodns/parsers/env_file.hpp"

namespace lodns
{
namespace gateway
{

  /// \brief Raised for missing or out-of-range settings.
  class ConfigurationError : public std::runtime_error
  {
  public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
  };

  /// \brief Process-wide settings. Built once at startup, then shared
  /// read-only by every request.
  struct Configuration
  {
    static constexpr const char* DEFAULT_MODELS =
        "nvidia/nemotron-nano-9b-v2:free,meituan/longcat-flash-chat:free,minimax/minimax-m2:free";
    static constexpr const char* DEFAULT_SYSTEM_PROMPT =
        "You are a helpful assistant. Keep responses concise and under 200 words.";
    static constexpr const char* DEFAULT_ENDPOINT =
        "https://openrouter.ai/api/v1/chat/completions";

    struct Log
    {
      std::string level = "info";
      std::string file;             ///< Empty: console
      bool async = false;
      int retentionDays = 7;
    };

    struct WorkerPool
    {
      std::size_t minThreads = 2;
      std::size_t maxThreads = 16;
      std::size_t queueSize = 256;
      std::chrono::seconds idleTimeout{60};
    };

    // Inference
    std::string apiKey;
    std::vector<std::string> models = parseModelList(DEFAULT_MODELS);
    std::string systemPrompt = DEFAULT_SYSTEM_PROMPT;
    std::string endpoint = DEFAULT_ENDPOINT;
    std::chrono::milliseconds requestTimeout{30000};
    bool stopOnAuthError = false;

    // DNS
    std::string listenAddress = "0.0.0.0";
    int listenPort = 53;
    std::uint32_t ttl = 300;
    std::size_t maxChunkBytes = 250;
    std::size_t maxTotalBytes = 4096;

    Log log;
    WorkerPool threadPool;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /// \brief Reads a variable from the process environment.
    static std::optional<std::string> systemEnvironment(const std::string& name)
    {
      const char* value = std::getenv(name.c_str());
      if (!value)
      {
        return std::nullopt;
      }
      return std::string(value);
    }

    /// \brief `base` first, then each existing dotenv file in order.
    ///
    /// A variable already set in `base` is never replaced by a file, and an
    /// earlier file wins over a later one. Missing files are skipped.
    /// \throws ConfigurationError if an existing file cannot be parsed
    static EnvLookup layeredEnvironment(const std::vector<std::string>& files,
                                        EnvLookup base = systemEnvironment)
    {
      auto merged = std::make_shared<parsers::dotenv::variables>();
      for (const auto& path : files)
      {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
          continue;
        }
        try
        {
          // insert() keeps the value from an earlier file
          for (auto& entry : parsers::dotenv::parse_file(path))
          {
            merged->insert(entry);
          }
        }
        catch (const std::runtime_error& e)
        {
          throw ConfigurationError("Failed to load " + path + ": " + e.what());
        }
      }
      return [merged, base = std::move(base)](const std::string& name) -> std::optional<std::string>
      {
        if (auto v = base(name))
        {
          return v;
        }
        auto it = merged->find(name);
        if (it == merged->end())
        {
          return std::nullopt;
        }
        return it->second;
      };
    }

    /// \brief Defaults overlaid with the process environment, then validated.
    static Configuration fromEnvironment(const EnvLookup& lookup = systemEnvironment)
    {
      Configuration config;
      config.applyEnvironment(lookup);
      config.validate();
      return config;
    }

    /// \brief Split a comma separated model list; items are trimmed and
    /// empty items dropped.
    static std::vector<std::string> parseModelList(const std::string& list)
    {
      std::vector<std::string> models;
      std::istringstream stream(list);
      std::string item;
      while (std::getline(stream, item, ','))
      {
        auto begin = item.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
          continue;
        }
        auto end = item.find_last_not_of(" \t\r\n");
        models.push_back(item.substr(begin, end - begin + 1));
      }
      return models;
    }

    /// \brief Port text to number.
    /// \throws ConfigurationError when not an integer in 1-65535
    static int parsePort(const std::string& text)
    {
      std::size_t consumed = 0;
      long port = 0;
      try
      {
        port = std::stol(text, &consumed);
      }
      catch (const std::logic_error&)
      {
        throw ConfigurationError("Invalid PORT/DNS_PORT value: " + text);
      }
      if (consumed != text.size() || port < 1 || port > 65535)
      {
        throw ConfigurationError("Invalid PORT/DNS_PORT value: " + text);
      }
      return static_cast<int>(port);
    }

    /// \brief First 8 characters of the key, or one '*' per character for
    /// keys of 8 characters or fewer.
    static std::string maskApiKey(const std::string& key)
    {
      if (key.size() > 8)
      {
        return key.substr(0, 8);
      }
      return std::string(key.size(), '*');
    }

    /// \brief Overlay values present in a TOML document.
    void applyConfigFile(const core::ConfigLoader& loader)
    {
      if (auto v = loader.getString("inference.api_key"))
        apiKey = *v;
      if (auto list = loader.getStringArray("inference.models"))
      {
        std::vector<std::string> cleaned;
        for (const auto& m : *list)
        {
          auto parsed = parseModelList(m);
          cleaned.insert(cleaned.end(), parsed.begin(), parsed.end());
        }
        models = cleaned;
      }
      else if (auto v = loader.getString("inference.models"))
      {
        models = parseModelList(*v);
      }
      if (auto v = loader.getString("inference.system_prompt"))
        systemPrompt = *v;
      if (auto v = loader.getString("inference.endpoint"))
        endpoint = *v;
      if (auto v = loader.getInt("inference.timeout_seconds"))
        requestTimeout = std::chrono::seconds(*v);
      if (auto v = loader.getBool("inference.stop_on_auth_error"))
        stopOnAuthError = *v;

      if (auto v = loader.getString("dns.address"))
        listenAddress = *v;
      if (auto v = loader.getInt("dns.port"))
        listenPort = static_cast<int>(*v);
      if (auto v = loader.getInt("dns.ttl"))
      {
        if (*v < 0 || *v > static_cast<std::int64_t>(network::dns::constants::DNS_MAX_TTL))
        {
          throw ConfigurationError("dns.ttl must be between 0 and " +
                                   std::to_string(network::dns::constants::DNS_MAX_TTL));
        }
        ttl = static_cast<std::uint32_t>(*v);
      }
      if (auto v = loader.getInt("dns.max_chunk_bytes"))
        maxChunkBytes = static_cast<std::size_t>(*v);
      if (auto v = loader.getInt("dns.max_total_bytes"))
        maxTotalBytes = static_cast<std::size_t>(*v);

      if (auto v = loader.getString("log.level"))
        log.level = *v;
      if (auto v = loader.getString("log.file"))
        log.file = *v;
      if (auto v = loader.getBool("log.async"))
        log.async = *v;
      if (auto v = loader.getInt("log.retention_days"))
        log.retentionDays = static_cast<int>(*v);

      if (auto v = loader.getInt("threadpool.min_threads"))
        threadPool.minThreads = static_cast<std::size_t>(*v);
      if (auto v = loader.getInt("threadpool.max_threads"))
        threadPool.maxThreads = static_cast<std::size_t>(*v);
      if (auto v = loader.getInt("threadpool.queue_size"))
        threadPool.queueSize = static_cast<std::size_t>(*v);
      if (auto v = loader.getInt("threadpool.idle_timeout_seconds"))
        threadPool.idleTimeout = std::chrono::seconds(*v);
    }

    /// \brief Overlay values from environment variables.
    /// \throws ConfigurationError for an unparsable port or a model list
    /// that is empty after cleaning
    void applyEnvironment(const EnvLookup& lookup = systemEnvironment)
    {
      if (auto v = lookup("OPENROUTER_API_KEY"))
        apiKey = *v;
      if (auto v = lookup("OPENROUTER_MODEL"))
      {
        models = parseModelList(*v);
        if (models.empty())
        {
          throw ConfigurationError("OPENROUTER_MODEL list cannot be empty");
        }
      }
      if (auto v = lookup("SYSTEM_PROMPT"))
        systemPrompt = *v;
      if (auto v = lookup("OPENROUTER_ENDPOINT"))
        endpoint = *v;

      if (auto v = lookup("PORT"))
        listenPort = parsePort(*v);
      else if (auto v = lookup("DNS_PORT"))
        listenPort = parsePort(*v);

      if (auto v = lookup("HOST"))
        listenAddress = *v;
      else if (auto v = lookup("DNS_ADDRESS"))
        listenAddress = *v;

      if (auto v = lookup("LOG_LEVEL"))
        log.level = *v;
    }

    /// \brief Largest reply the gateway can build for these limits.
    ///
    /// Header, the longest possible echoed question, the fixed answer fields
    /// and one length byte per character-string. A chunk never carries fewer
    /// than `maxChunkBytes - 3` bytes, since only a whole code point moves to
    /// the next chunk. Expects `maxChunkBytes >= 4`.
    static std::size_t worstCaseReplySize(std::size_t maxChunkBytes, std::size_t maxTotalBytes)
    {
      using namespace network::dns::constants;
      const std::size_t question = DNS_MAX_NAME_SIZE + 4;
      const std::size_t answerFixed = 2 + 2 + 2 + 4 + 2;
      const std::size_t minChunk = maxChunkBytes - 3;
      const std::size_t chunks = maxTotalBytes == 0 ? 1 : (maxTotalBytes + minChunk - 1) / minChunk;
      return DNS_HEADER_SIZE + question + answerFixed + maxTotalBytes + chunks;
    }

    /// \throws ConfigurationError on the first invalid setting
    void validate() const
    {
      if (apiKey.empty())
      {
        throw ConfigurationError("OPENROUTER_API_KEY environment variable not set");
      }
      if (models.empty())
      {
        throw ConfigurationError("Model list cannot be empty");
      }
      if (listenPort < 1 || listenPort > 65535)
      {
        throw ConfigurationError("Invalid PORT/DNS_PORT value: " + std::to_string(listenPort));
      }
      if (maxChunkBytes < 4 || maxChunkBytes > 255)
      {
        throw ConfigurationError("dns.max_chunk_bytes must be between 4 and 255");
      }
      if (maxTotalBytes < maxChunkBytes)
      {
        throw ConfigurationError("dns.max_total_bytes must not be smaller than dns.max_chunk_bytes");
      }
      if (maxTotalBytes > network::dns::constants::DNS_MAX_UDP_PAYLOAD ||
          worstCaseReplySize(maxChunkBytes, maxTotalBytes) >
            network::dns::constants::DNS_MAX_UDP_PAYLOAD)
      {
        throw ConfigurationError("dns.max_total_bytes too large: a reply could exceed the " +
                                 std::to_string(network::dns::constants::DNS_MAX_UDP_PAYLOAD) +
                                 " byte UDP payload limit");
      }
      if (ttl > network::dns::constants::DNS_MAX_TTL)
      {
        throw ConfigurationError("dns.ttl must be between 0 and " +
                                 std::to_string(network::dns::constants::DNS_MAX_TTL));
      }
      if (requestTimeout.count() <= 0)
      {
        throw ConfigurationError("inference.timeout_seconds must be positive");
      }
      if (threadPool.minThreads == 0 || threadPool.maxThreads < threadPool.minThreads ||
          threadPool.queueSize == 0)
      {
        throw ConfigurationError("Invalid threadpool settings");
      }
    }

    /// \brief One-line description safe for logs (API key masked).
    std::string summary() const
    {
      std::ostringstream out;
      out << "listen=" << listenAddress << ":" << listenPort << " models=[";
      for (std::size_t i = 0; i < models.size(); ++i)
      {
        out << (i ? "," : "") << models[i];
      }
      out << "] endpoint=" << endpoint << " api_key=" << maskApiKey(apiKey)
          << " timeout=" << requestTimeout.count() << "ms"
          << " chunk=" << maxChunkBytes << "/" << maxTotalBytes << " ttl=" << ttl;
      return out.str();
    }
  };

} // namespace gateway
} // namespace lodns
