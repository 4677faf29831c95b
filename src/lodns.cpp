// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <lodns/lodns.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace
{
  std::atomic<bool> terminateRequested{false};

  /// \brief Command-line values; unset fields leave lower layers in place.
  struct CliOptions
  {
    std::optional<std::string> configFile;
    std::optional<std::string> apiKey;
    std::optional<std::string> models;
    std::optional<std::string> systemPrompt;
    std::optional<std::string> endpoint;
    std::optional<int> timeoutSeconds;
    bool stopOnAuthError = false;
    std::optional<std::string> address;
    std::optional<int> port;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    bool logAsync = false;
    std::optional<std::size_t> threadPoolMin;
    std::optional<std::size_t> threadPoolMax;
    std::optional<std::size_t> threadPoolQueue;
  };
}

/// \brief Print help message
static void printHelp()
{
  std::cout
      << "lodns " << LODNS_VERSION << " - answers DNS TXT queries with LLM completions\n"
      << "Options:\n"
      << "  -h, --help                       Show this help message\n"
      << "  -c, --config <file>              TOML configuration file\n"
      << "      --api-key <key>              Inference API key (env: OPENROUTER_API_KEY)\n"
      << "  -m, --models <list>              Comma separated model fallback list\n"
      << "      --system-prompt <text>       System prompt sent with every query\n"
      << "      --endpoint <url>             Chat completions endpoint\n"
      << "      --timeout <seconds>          Per-model request timeout (default: 30)\n"
      << "      --stop-on-auth-error         Do not try further models after 401/403\n"
      << "  -a, --address <addr>             Listen address (default: 0.0.0.0)\n"
      << "  -p, --port <port>                Listen port (default: 53)\n"
      << "  -l, --log-level <level>          Log level (trace, debug, info, "
         "warning, error, fatal)\n"
      << "  -f, --log-file <file>            Log file path\n"
      << "      --log-async                  Enable async logging\n"
      << "      --threadpool-min <n>         Minimum worker threads (default: 2)\n"
      << "      --threadpool-max <n>         Maximum worker threads (default: 16)\n"
      << "      --threadpool-queue <n>       Pending request limit (default: 256)\n"
      << "\n"
      << "Environment variables may also be set in .env.local or .env in the\n"
      << "working directory; variables already in the environment take precedence.\n";
}

static int parseIntArg(const std::string& option, const std::string& value)
{
  try
  {
    std::size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size())
    {
      throw std::invalid_argument(value);
    }
    return parsed;
  }
  catch (const std::exception&)
  {
    throw std::runtime_error("Invalid value for " + option + ": " + value);
  }
}

static std::size_t parseCountArg(const std::string& option, const std::string& value)
{
  int parsed = parseIntArg(option, value);
  if (parsed < 0)
  {
    throw std::runtime_error("Invalid value for " + option + ": " + value);
  }
  return static_cast<std::size_t>(parsed);
}

/// \brief Parse command-line arguments
static void parseCliArgs(int argc, char** argv, CliOptions& cli)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    bool hasValue = i + 1 < argc;
    if ((arg == "-c" || arg == "--config") && hasValue)
    {
      cli.configFile = argv[++i];
    }
    else if (arg == "--api-key" && hasValue)
    {
      cli.apiKey = argv[++i];
    }
    else if ((arg == "-m" || arg == "--models") && hasValue)
    {
      cli.models = argv[++i];
    }
    else if (arg == "--system-prompt" && hasValue)
    {
      cli.systemPrompt = argv[++i];
    }
    else if (arg == "--endpoint" && hasValue)
    {
      cli.endpoint = argv[++i];
    }
    else if (arg == "--timeout" && hasValue)
    {
      cli.timeoutSeconds = parseIntArg(arg, argv[++i]);
    }
    else if (arg == "--stop-on-auth-error")
    {
      cli.stopOnAuthError = true;
    }
    else if ((arg == "-a" || arg == "--address") && hasValue)
    {
      cli.address = argv[++i];
    }
    else if ((arg == "-p" || arg == "--port") && hasValue)
    {
      cli.port = parseIntArg(arg, argv[++i]);
    }
    else if ((arg == "-l" || arg == "--log-level") && hasValue)
    {
      cli.logLevel = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && hasValue)
    {
      cli.logFile = argv[++i];
    }
    else if (arg == "--log-async")
    {
      cli.logAsync = true;
    }
    else if (arg == "--threadpool-min" && hasValue)
    {
      cli.threadPoolMin = parseCountArg(arg, argv[++i]);
    }
    else if (arg == "--threadpool-max" && hasValue)
    {
      cli.threadPoolMax = parseCountArg(arg, argv[++i]);
    }
    else if (arg == "--threadpool-queue" && hasValue)
    {
      cli.threadPoolQueue = parseCountArg(arg, argv[++i]);
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else
    {
      throw std::runtime_error("Unknown or incomplete option: " + arg);
    }
  }
}

/// \brief Defaults, then TOML file, then environment (with .env.local and
/// .env underneath it), then command line.
static lodns::gateway::Configuration buildConfiguration(const CliOptions& cli)
{
  using lodns::gateway::Configuration;
  Configuration config;

  if (cli.configFile)
  {
    lodns::core::ConfigLoader loader(*cli.configFile);
    config.applyConfigFile(loader);
  }

  config.applyEnvironment(Configuration::layeredEnvironment({".env.local", ".env"}));

  if (cli.apiKey)
    config.apiKey = *cli.apiKey;
  if (cli.models)
    config.models = Configuration::parseModelList(*cli.models);
  if (cli.systemPrompt)
    config.systemPrompt = *cli.systemPrompt;
  if (cli.endpoint)
    config.endpoint = *cli.endpoint;
  if (cli.timeoutSeconds)
    config.requestTimeout = std::chrono::seconds(*cli.timeoutSeconds);
  if (cli.stopOnAuthError)
    config.stopOnAuthError = true;
  if (cli.address)
    config.listenAddress = *cli.address;
  if (cli.port)
    config.listenPort = *cli.port;
  if (cli.logLevel)
    config.log.level = *cli.logLevel;
  if (cli.logFile)
    config.log.file = *cli.logFile;
  if (cli.logAsync)
    config.log.async = true;
  if (cli.threadPoolMin)
    config.threadPool.minThreads = *cli.threadPoolMin;
  if (cli.threadPoolMax)
    config.threadPool.maxThreads = *cli.threadPoolMax;
  if (cli.threadPoolQueue)
    config.threadPool.queueSize = *cli.threadPoolQueue;

  config.validate();
  return config;
}

int main(int argc, char** argv)
{
  using lodns::core::Logger;

  lodns::gateway::Configuration config;
  try
  {
    CliOptions cli;
    parseCliArgs(argc, argv, cli);
    config = buildConfiguration(cli);
    Logger::init(Logger::parseLevel(config.log.level), config.log.file, config.log.async,
                 config.log.retentionDays);
  }
  catch (const std::exception& ex)
  {
    std::cerr << "Configuration error: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }

  LODNS_LOG_INFO("Starting lodns " << LODNS_VERSION);
  LODNS_LOG_INFO("Configuration: " << config.summary());

  int status = 0;
  try
  {
    auto context = std::make_shared<const lodns::gateway::GatewayContext>(std::move(config));
    lodns::gateway::RequestOrchestrator orchestrator(context);
    orchestrator.start();

    std::signal(SIGINT, [](int) { terminateRequested = true; });
    std::signal(SIGTERM, [](int) { terminateRequested = true; });

    while (!terminateRequested)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LODNS_LOG_INFO("Shutdown requested");
    orchestrator.stop();
  }
  catch (const std::exception& ex)
  {
    LODNS_LOG_FATAL("lodns failed: " << ex.what());
    status = EXIT_FAILURE;
  }

  Logger::shutdown();
  return status;
}
