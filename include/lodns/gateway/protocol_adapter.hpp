// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lodns/network/dns/dns_message.hpp"
#include "lodns/text/text_chunker.hpp"
#include "lodns/text/utf8.hpp"

namespace lodns
{
namespace gateway
{

  enum class DecodeError
  {
    None,
    Malformed,        ///< Truncated or structurally invalid packet
    UnsupportedQuery  ///< Well formed, but not something we answer
  };

  /// \brief A serviceable TXT question and the prompt derived from it.
  struct DnsQuery
  {
    std::uint16_t id = 0;
    bool recursionDesired = false;
    network::dns::DnsQuestion question;
    std::vector<std::uint8_t> rawQuestion; ///< Question section as received
    std::string prompt;
  };

  struct DecodeResult
  {
    bool ok = false;
    DnsQuery query;       ///< On failure, id/rd/rawQuestion are filled as far as parsed
    DecodeError error = DecodeError::None;
    network::dns::DnsResponseCode rcode = network::dns::DnsResponseCode::NOERROR;
    bool respond = true;  ///< false: drop the packet without a reply
    std::string message;
  };

  /// \brief Stateless codec between DNS wire format and prompts/answers.
  class ProtocolAdapter
  {
  public:
    /// \brief Decode a query datagram.
    ///
    /// Packets shorter than a header or with QR=1 are marked respond=false.
    static DecodeResult decode(const std::uint8_t* data, std::size_t size)
    {
      using namespace network::dns;
      DecodeResult result;

      if (size < constants::DNS_HEADER_SIZE)
      {
        return reject(result, DecodeError::Malformed, DnsResponseCode::FORMERR,
                      "Packet too short: " + std::to_string(size) + " bytes", false);
      }

      DnsHeader header;
      std::size_t offset = DnsMessage::parseHeader(data, 0, size, header);
      result.query.id = header.id;
      result.query.recursionDesired = header.rd;

      if (header.qr)
      {
        return reject(result, DecodeError::Malformed, DnsResponseCode::FORMERR,
                      "Ignoring packet with QR=1", false);
      }
      if (header.opcode != DnsOpcode::Query)
      {
        return reject(result, DecodeError::UnsupportedQuery, DnsResponseCode::NOTIMP,
                      "Unsupported opcode " + std::to_string(static_cast<int>(header.opcode)));
      }
      if (header.qdcount != 1)
      {
        return reject(result, DecodeError::Malformed, DnsResponseCode::FORMERR,
                      "Expected exactly one question, got " + std::to_string(header.qdcount));
      }

      std::size_t end = 0;
      try
      {
        end = DnsMessage::parseQuestion(data, offset, size, result.query.question);
      }
      catch (const DnsParseException& e)
      {
        return reject(result, DecodeError::Malformed, DnsResponseCode::FORMERR, e.what());
      }
      result.query.rawQuestion.assign(data + offset, data + end);

      const auto& question = result.query.question;
      if (question.qtype != DnsType::TXT)
      {
        return reject(result, DecodeError::UnsupportedQuery, DnsResponseCode::NOTIMP,
                      "Unsupported QTYPE " + std::to_string(static_cast<int>(question.qtype)));
      }
      if (question.qclass != DnsClass::IN)
      {
        return reject(result, DecodeError::UnsupportedQuery, DnsResponseCode::REFUSED,
                      "Unsupported QCLASS " + std::to_string(static_cast<int>(question.qclass)));
      }

      for (const auto& label : question.labels)
      {
        if (!text::utf8::isValid(label))
        {
          return reject(result, DecodeError::UnsupportedQuery, DnsResponseCode::REFUSED,
                        "Query label is not valid UTF-8");
        }
      }

      result.query.prompt = promptFromLabels(question.labels);
      if (result.query.prompt.empty())
      {
        return reject(result, DecodeError::UnsupportedQuery, DnsResponseCode::REFUSED,
                      "Empty prompt");
      }

      result.ok = true;
      return result;
    }

    static DecodeResult decode(const std::vector<std::uint8_t>& packet)
    {
      return decode(packet.data(), packet.size());
    }

    /// \brief Labels joined with single spaces, ASCII-lowercased, trimmed.
    static std::string promptFromLabels(const std::vector<std::string>& labels)
    {
      std::string joined;
      for (const auto& label : labels)
      {
        if (!joined.empty())
        {
          joined += ' ';
        }
        joined += label;
      }
      for (auto& c : joined)
      {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80)
        {
          c = static_cast<char>(std::tolower(uc));
        }
      }
      auto begin = joined.find_first_not_of(" \t\r\n");
      if (begin == std::string::npos)
      {
        return "";
      }
      auto last = joined.find_last_not_of(" \t\r\n");
      return joined.substr(begin, last - begin + 1);
    }

    /// \brief Build a response: QR=1, AA=1, RA=0, RD echoed.
    /// \param rawQuestion question section to echo (empty for none)
    /// \param chunks TXT strings for a single answer; std::nullopt for none
    static std::vector<std::uint8_t> encode(std::uint16_t transactionId,
                                            const std::vector<std::uint8_t>& rawQuestion,
                                            bool recursionDesired,
                                            const std::optional<text::ChunkSet>& chunks,
                                            network::dns::DnsResponseCode rcode,
                                            std::uint32_t ttl = network::dns::constants::DNS_DEFAULT_TTL)
    {
      using namespace network::dns;
      DnsHeader header;
      header.id = transactionId;
      header.qr = true;
      header.opcode = DnsOpcode::Query;
      header.aa = true;
      header.rd = recursionDesired;
      header.ra = false;
      header.rcode = rcode;

      std::optional<TxtRecord> answer;
      if (chunks)
      {
        answer = TxtRecord("", *chunks, ttl);
      }
      return DnsMessage::buildResponse(header, rawQuestion, answer);
    }

    /// \brief Response to a decoded query.
    static std::vector<std::uint8_t> encode(const DnsQuery& query,
                                            const std::optional<text::ChunkSet>& chunks,
                                            network::dns::DnsResponseCode rcode,
                                            std::uint32_t ttl = network::dns::constants::DNS_DEFAULT_TTL)
    {
      return encode(query.id, query.rawQuestion, query.recursionDesired, chunks, rcode, ttl);
    }

    /// \brief Failure response for a query that did not decode.
    static std::vector<std::uint8_t> encodeFailure(const DecodeResult& decoded)
    {
      return encode(decoded.query, std::nullopt, decoded.rcode);
    }

    /// \brief Wire form of a question, for callers that hold a structured one.
    static std::vector<std::uint8_t> questionBytes(const network::dns::DnsQuestion& question)
    {
      using namespace network::dns;
      auto bytes = question.labels.empty() ? DnsMessage::encodeName(question.qname)
                                           : DnsMessage::encodeLabels(question.labels);
      DnsMessage::writeUint16(bytes, static_cast<std::uint16_t>(question.qtype));
      DnsMessage::writeUint16(bytes, static_cast<std::uint16_t>(question.qclass));
      return bytes;
    }

  private:
    static DecodeResult& reject(DecodeResult& result, DecodeError error,
                                network::dns::DnsResponseCode rcode, const std::string& message,
                                bool respond = true)
    {
      result.ok = false;
      result.error = error;
      result.rcode = rcode;
      result.respond = respond;
      result.message = message;
      return result;
    }
  };

} // namespace gateway
} // namespace lodns
