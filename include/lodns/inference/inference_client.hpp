// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "lodns/core/json.hpp"
#include "lodns/core/logger.hpp"
#include "lodns/network/http_client.hpp"

namespace lodns
{
namespace inference
{

  enum class InferenceError
  {
    None,
    EmptyPrompt,
    EmptyModelList,
    EmptyApiKey,
    AuthenticationFailed, ///< 401/403 with stopOnAuthError set
    AllModelsFailed
  };

  inline const char* toString(InferenceError error)
  {
    switch (error)
    {
    case InferenceError::None:
      return "none";
    case InferenceError::EmptyPrompt:
      return "empty prompt";
    case InferenceError::EmptyModelList:
      return "empty model list";
    case InferenceError::EmptyApiKey:
      return "empty API key";
    case InferenceError::AuthenticationFailed:
      return "authentication failed";
    case InferenceError::AllModelsFailed:
      return "all models failed";
    }
    return "unknown";
  }

  /// \brief Text produced by the model that answered.
  struct CompletionResult
  {
    std::string model;
    std::string text;
  };

  /// \brief One model tried during a completion.
  struct ModelAttempt
  {
    std::string model;
    int status = 0;          ///< HTTP status, 0 for transport failures
    bool retryable = false;
    std::string message;
  };

  struct CompletionOutcome
  {
    bool ok = false;
    CompletionResult result;
    InferenceError error = InferenceError::None;
    std::string message;     ///< Last failure when !ok
    std::vector<ModelAttempt> attempts;
  };

  /// \brief Sends a prompt to an OpenAI-compatible chat completions endpoint,
  /// trying models in order until one answers.
  ///
  /// Holds no per-request state; complete() may be called concurrently.
  class InferenceClient
  {
  public:
    struct Config
    {
      std::string apiKey;
      std::string systemPrompt;
      std::string endpoint = "https://openrouter.ai/api/v1/chat/completions";
      std::chrono::milliseconds requestTimeout{30000};
      bool stopOnAuthError = false;
      std::string caFile;
    };

    explicit InferenceClient(Config config)
      : _config(std::move(config)), _http(makeHttpConfig(_config))
    {
    }

    const Config& config() const { return _config; }

    /// \brief Query models in order; the first non-empty 2xx answer wins.
    CompletionOutcome complete(const std::string& prompt,
                               const std::vector<std::string>& models) const
    {
      CompletionOutcome outcome;
      if (prompt.empty())
      {
        return fail(outcome, InferenceError::EmptyPrompt, "Prompt cannot be empty");
      }
      if (models.empty())
      {
        return fail(outcome, InferenceError::EmptyModelList, "Models list cannot be empty");
      }
      if (_config.apiKey.empty())
      {
        return fail(outcome, InferenceError::EmptyApiKey, "API key cannot be empty");
      }

      for (std::size_t i = 0; i < models.size(); ++i)
      {
        const auto& model = models[i];
        LODNS_LOG_DEBUG("Attempting model " << (i + 1) << "/" << models.size() << ": "
                                            << model);

        std::string text;
        ModelAttempt attempt = queryModel(prompt, model, text);
        outcome.attempts.push_back(attempt);

        if (attempt.status >= 200 && attempt.status < 300 && attempt.message.empty())
        {
          LODNS_LOG_DEBUG("Received response from model " << model << " (" << text.size()
                                                          << " bytes)");
          outcome.ok = true;
          outcome.result = CompletionResult{model, std::move(text)};
          return outcome;
        }

        LODNS_LOG_WARN("Model " << model << " failed: " << attempt.message);
        if (_config.stopOnAuthError && (attempt.status == 401 || attempt.status == 403))
        {
          return fail(outcome, InferenceError::AuthenticationFailed, attempt.message);
        }
      }

      LODNS_LOG_ERROR("All " << models.size() << " models exhausted");
      return fail(outcome, InferenceError::AllModelsFailed, outcome.attempts.back().message);
    }

    /// \brief Chat completions request body for one model.
    std::string buildRequestBody(const std::string& model, const std::string& prompt) const
    {
      core::Json messages = core::Json::array();
      if (!_config.systemPrompt.empty())
      {
        messages.push_back({{"role", "system"}, {"content", _config.systemPrompt}});
      }
      messages.push_back({{"role", "user"}, {"content", prompt}});

      core::Json body = {{"model", model}, {"messages", messages}};
      return core::dumpCompact(body);
    }

    /// \brief Generated text at choices[0].message.content, trimmed.
    /// \return std::nullopt if the body is not JSON or lacks the field;
    /// `error` describes why
    static std::optional<std::string> extractContent(const std::string& body, std::string& error)
    {
      auto parsed = core::tryParse(body);
      if (!parsed || !parsed->is_object())
      {
        error = "Failed to parse inference API response";
        return std::nullopt;
      }
      auto choices = parsed->find("choices");
      if (choices == parsed->end() || !choices->is_array() || choices->empty())
      {
        error = "No choices in API response";
        return std::nullopt;
      }
      const auto& first = (*choices)[0];
      if (!first.is_object() || !first.contains("message") || !first["message"].is_object())
      {
        error = "No message in API response";
        return std::nullopt;
      }
      const auto& message = first["message"];
      auto content = message.find("content");
      if (content == message.end() || !content->is_string())
      {
        error = "No content in API response";
        return std::nullopt;
      }
      return trim(content->get<std::string>());
    }

    /// \brief Whether a failed status should count as transient.
    static bool isRetryableStatus(int status)
    {
      return status == 429 || status == 404 || status == 408 || status >= 500;
    }

  private:
    static network::HttpClient::Config makeHttpConfig(const Config& config)
    {
      network::HttpClient::Config http;
      http.requestTimeout = config.requestTimeout;
      http.connectTimeout = std::min(http.connectTimeout, config.requestTimeout);
      http.userAgent = "lodns/1.0";
      http.caFile = config.caFile;
      return http;
    }

    static CompletionOutcome& fail(CompletionOutcome& outcome, InferenceError error,
                                   const std::string& message)
    {
      outcome.ok = false;
      outcome.error = error;
      outcome.message = message;
      return outcome;
    }

    static std::string trim(const std::string& s)
    {
      auto begin = s.find_first_not_of(" \t\r\n");
      if (begin == std::string::npos)
      {
        return "";
      }
      auto end = s.find_last_not_of(" \t\r\n");
      return s.substr(begin, end - begin + 1);
    }

    static std::string excerpt(const std::string& body)
    {
      constexpr std::size_t limit = 200;
      return body.size() <= limit ? body : body.substr(0, limit) + "...";
    }

    static std::string statusMessage(int status, const std::string& body)
    {
      switch (status)
      {
      case 429:
        return "Rate limit exceeded (429)";
      case 404:
        return "Model not found or data policy restriction (404)";
      case 500:
        return "Inference API server error (500)";
      case 401:
        return "Unauthorized: Invalid API key (401)";
      case 403:
        return "Forbidden (403): " + excerpt(body);
      case 400:
        return "Bad request (400): " + excerpt(body);
      case 408:
        return "Request timeout (408)";
      default:
        if (status > 500)
        {
          return "Inference API server error (" + std::to_string(status) + ")";
        }
        return "Unexpected status code " + std::to_string(status) + ": " + excerpt(body);
      }
    }

    /// \brief One HTTP exchange. An empty attempt.message means success
    /// and `text` holds the answer.
    ModelAttempt queryModel(const std::string& prompt, const std::string& model,
                            std::string& text) const
    {
      ModelAttempt attempt;
      attempt.model = model;

      std::map<std::string, std::string> headers = {
          {"Authorization", "Bearer " + _config.apiKey},
          {"Content-Type", "application/json"},
          {"Accept", "application/json"},
      };

      network::HttpClient::Response response;
      try
      {
        response = _http.post(_config.endpoint, buildRequestBody(model, prompt), headers);
      }
      catch (const network::HttpError& e)
      {
        attempt.retryable = true;
        attempt.message = std::string("Failed to send request (") +
                          network::HttpError::kindName(e.kind()) + "): " + e.what();
        return attempt;
      }

      attempt.status = response.statusCode;
      LODNS_LOG_DEBUG("Inference API response status for " << model << ": "
                                                           << response.statusCode);

      if (!response.success())
      {
        attempt.retryable = isRetryableStatus(response.statusCode);
        attempt.message = statusMessage(response.statusCode, response.body);
        return attempt;
      }

      std::string error;
      auto content = extractContent(response.body, error);
      if (!content)
      {
        attempt.retryable = true;
        attempt.message = error;
        return attempt;
      }
      if (content->empty())
      {
        attempt.retryable = true;
        attempt.message = "Empty completion in API response";
        return attempt;
      }

      text = std::move(*content);
      return attempt;
    }

    Config _config;
    network::HttpClient _http;
  };

} // namespace inference
} // namespace lodns
