// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "lodns/core/logger.hpp"
#include "lodns/core/thread_pool.hpp"
#include "lodns/gateway/configuration.hpp"
#include "lodns/gateway/protocol_adapter.hpp"
#include "lodns/inference/inference_client.hpp"
#include "lodns/network/udp_socket.hpp"
#include "lodns/text/text_chunker.hpp"

namespace lodns
{
namespace gateway
{

  /// \brief Everything a request handler reads. Immutable once built.
  struct GatewayContext
  {
    Configuration config;
    inference::InferenceClient inference;

    explicit GatewayContext(Configuration cfg)
      : config(std::move(cfg)), inference(makeInferenceConfig(config))
    {
    }

    static inference::InferenceClient::Config makeInferenceConfig(const Configuration& config)
    {
      inference::InferenceClient::Config ic;
      ic.apiKey = config.apiKey;
      ic.systemPrompt = config.systemPrompt;
      ic.endpoint = config.endpoint;
      ic.requestTimeout = config.requestTimeout;
      ic.stopOnAuthError = config.stopOnAuthError;
      return ic;
    }
  };

  /// \brief UDP front end: one receive loop, each datagram answered on a
  /// worker thread.
  class RequestOrchestrator
  {
  public:
    /// Receive loop poll interval; bounds how long stop() waits for it.
    static constexpr std::chrono::milliseconds POLL_INTERVAL{200};

    explicit RequestOrchestrator(std::shared_ptr<const GatewayContext> context)
      : _context(std::move(context))
    {
    }

    ~RequestOrchestrator() { stop(); }

    RequestOrchestrator(const RequestOrchestrator&) = delete;
    RequestOrchestrator& operator=(const RequestOrchestrator&) = delete;

    /// \brief Bind the socket and start the receive loop.
    /// \throws std::runtime_error if the socket cannot be bound
    void start()
    {
      std::lock_guard<std::mutex> lock(_lifecycleMutex);
      if (_running)
      {
        return;
      }

      const auto& cfg = _context->config;
      _socket.bind(cfg.listenAddress, static_cast<std::uint16_t>(cfg.listenPort));

      _pool = std::make_unique<core::ThreadPool>(
          cfg.threadPool.minThreads, cfg.threadPool.maxThreads,
          std::chrono::duration_cast<std::chrono::milliseconds>(cfg.threadPool.idleTimeout),
          cfg.threadPool.queueSize,
          [](std::exception_ptr eptr)
          {
            try
            {
              std::rethrow_exception(eptr);
            }
            catch (const std::exception& e)
            {
              LODNS_LOG_ERROR("Request task failed: " << e.what());
            }
            catch (...)
            {
              LODNS_LOG_ERROR("Request task failed with unknown exception");
            }
          });

      _running = true;
      _receiver = std::thread([this]() { receiveLoop(); });
      LODNS_LOG_INFO("DNS server listening on " << _socket.localEndpoint().toString());
    }

    /// \brief Stop receiving, finish queued requests and close the socket.
    void stop()
    {
      std::lock_guard<std::mutex> lock(_lifecycleMutex);
      if (!_running && !_receiver.joinable())
      {
        return;
      }
      _running = false;
      if (_receiver.joinable())
      {
        _receiver.join();
      }
      if (_pool)
      {
        _pool->shutdown();
        _pool.reset();
      }
      _socket.close();
      LODNS_LOG_INFO("DNS server stopped");
    }

    bool isRunning() const { return _running; }

    /// \brief Bound address, including the port chosen for port 0.
    network::Endpoint localEndpoint() const { return _socket.localEndpoint(); }

    /// \brief Full pipeline for one datagram.
    /// \return the reply, or std::nullopt when the packet is dropped
    static std::optional<std::vector<std::uint8_t>> handleDatagram(const GatewayContext& context,
                                                                   const std::uint8_t* data,
                                                                   std::size_t size)
    {
      using network::dns::DnsResponseCode;

      DecodeResult decoded = ProtocolAdapter::decode(data, size);
      if (!decoded.ok)
      {
        if (!decoded.respond)
        {
          LODNS_LOG_DEBUG("Dropping packet: " << decoded.message);
          return std::nullopt;
        }
        LODNS_LOG_WARN("Rejecting query id " << decoded.query.id << ": " << decoded.message);
        return ProtocolAdapter::encodeFailure(decoded);
      }

      const DnsQuery& query = decoded.query;
      LODNS_LOG_DEBUG("Query id " << query.id << " prompt: " << query.prompt);

      try
      {
        auto outcome = context.inference.complete(query.prompt, context.config.models);
        if (!outcome.ok)
        {
          LODNS_LOG_ERROR("Inference failed for query id "
                          << query.id << " (" << inference::toString(outcome.error)
                          << "): " << outcome.message);
          return ProtocolAdapter::encode(query, std::nullopt, DnsResponseCode::SERVFAIL);
        }

        auto chunks = text::TextChunker::chunk(outcome.result.text, context.config.maxChunkBytes,
                                               context.config.maxTotalBytes);
        LODNS_LOG_INFO("Answered query id " << query.id << " with model "
                                            << outcome.result.model << ": "
                                            << outcome.result.text.size() << " bytes in "
                                            << chunks.size() << " chunks");
        return ProtocolAdapter::encode(query, chunks, DnsResponseCode::NOERROR,
                                       context.config.ttl);
      }
      catch (const std::exception& e)
      {
        LODNS_LOG_ERROR("Failed to answer query id " << query.id << ": " << e.what());
        return ProtocolAdapter::encode(query, std::nullopt, DnsResponseCode::SERVFAIL);
      }
    }

  private:
    void receiveLoop()
    {
      std::vector<std::uint8_t> buffer;
      while (_running)
      {
        network::Endpoint from;
        auto rr = _socket.receiveFrom(buffer, network::dns::constants::DNS_MAX_UDP_SIZE, from,
                                      POLL_INTERVAL);
        if (rr.status == network::UdpSocket::RecvStatus::Timeout)
        {
          continue;
        }
        if (rr.status == network::UdpSocket::RecvStatus::Error)
        {
          LODNS_LOG_ERROR("Error receiving DNS packet: " << rr.error);
          continue;
        }

        LODNS_LOG_DEBUG("Received " << rr.size << " bytes from " << from.toString());
        dispatch(std::move(buffer), from);
        buffer = std::vector<std::uint8_t>();
      }
    }

    void dispatch(std::vector<std::uint8_t> packet, const network::Endpoint& from)
    {
      auto context = _context;
      auto datagram = std::make_shared<const std::vector<std::uint8_t>>(std::move(packet));
      try
      {
        _pool->enqueue(
            [this, context, datagram, from]()
            {
              auto reply = handleDatagram(*context, datagram->data(), datagram->size());
              if (reply)
              {
                sendReply(*reply, from);
              }
            });
      }
      catch (const std::runtime_error& e)
      {
        LODNS_LOG_WARN("Worker pool rejected request from " << from.toString() << ": "
                                                            << e.what());
        DecodeResult decoded = ProtocolAdapter::decode(*datagram);
        if (!decoded.respond)
        {
          return;
        }
        sendReply(decoded.ok ? ProtocolAdapter::encode(decoded.query, std::nullopt,
                                                       network::dns::DnsResponseCode::SERVFAIL)
                             : ProtocolAdapter::encodeFailure(decoded),
                  from);
      }
    }

    void sendReply(const std::vector<std::uint8_t>& reply, const network::Endpoint& to)
    {
      std::string error;
      if (!_socket.sendTo(reply, to, error))
      {
        LODNS_LOG_ERROR("Failed to send response to " << to.toString() << ": " << error);
        return;
      }
      LODNS_LOG_DEBUG("Sent " << reply.size() << " byte response to " << to.toString());
    }

    std::shared_ptr<const GatewayContext> _context;
    network::UdpSocket _socket;
    std::unique_ptr<core::ThreadPool> _pool;
    std::thread _receiver;
    std::atomic<bool> _running{false};
    std::mutex _lifecycleMutex;
  };

} // namespace gateway
} // namespace lodns
