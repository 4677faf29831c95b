// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_types.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace lodns
{
namespace network
{
namespace dns
{

/// \brief DNS parsing exceptions
class DnsParseException : public std::runtime_error
{
public:
  explicit DnsParseException(const std::string &message)
      : std::runtime_error("DNS Parse Error: " + message)
  {
  }
};

/// \brief DNS message parsing and construction utilities
class DnsMessage
{
public:
  /// \brief Parse a complete DNS message (header, questions, answers)
  /// \throws DnsParseException on parsing errors
  static DnsResult parse(const std::uint8_t *data, std::size_t size);

  static DnsResult parse(const std::vector<std::uint8_t> &data)
  {
    return parse(data.data(), data.size());
  }

  /// \brief Parse the fixed 12-byte header
  /// \return Offset just past the header
  static std::size_t parseHeader(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                 DnsHeader &header);

  /// \brief Parse one question entry
  /// \return Offset just past the question
  static std::size_t parseQuestion(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                   DnsQuestion &question);

  /// \brief Build a query message
  /// \param question DNS question; `labels` is used verbatim when non-empty,
  /// otherwise `qname` is split on '.'
  /// \param id Query identifier (0 = auto-generate)
  static std::vector<std::uint8_t> buildQuery(const DnsQuestion &question, std::uint16_t id = 0,
                                              bool recursionDesired = true);

  /// \brief Build a response message
  /// \param header Header to write; counts are derived from the arguments
  /// \param rawQuestion Question section bytes copied verbatim (may be empty)
  /// \param answer Optional TXT answer; its owner name is a compression
  /// pointer to the question name when a question is present
  static std::vector<std::uint8_t> buildResponse(const DnsHeader &header,
                                                 const std::vector<std::uint8_t> &rawQuestion,
                                                 const std::optional<TxtRecord> &answer);

  static std::uint16_t generateQueryId();

  /// \brief Encode a dotted name into wire format
  static std::vector<std::uint8_t> encodeName(const std::string &name);

  /// \brief Encode labels into wire format
  static std::vector<std::uint8_t> encodeLabels(const std::vector<std::string> &labels);

  /// \brief Encode TXT RDATA as length-prefixed character-strings
  static std::vector<std::uint8_t> encodeCharacterStrings(const std::vector<std::string> &strings);

  /// \brief Decode a possibly compressed name
  /// \return Offset just past the name in the original position
  static std::size_t decodeName(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                std::string &name);

  static std::size_t decodeName(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                std::string &name, std::vector<std::string> &labels);

  static TxtRecord parseTxtRecord(const DnsResourceRecord &rr);

  static void writeUint16(std::vector<std::uint8_t> &buffer, std::uint16_t value);
  static void writeUint32(std::vector<std::uint8_t> &buffer, std::uint32_t value);
  static std::uint16_t readUint16(const std::uint8_t *data, std::size_t offset);
  static std::uint32_t readUint32(const std::uint8_t *data, std::size_t offset);

private:
  static std::size_t parseResourceRecord(const std::uint8_t *data, std::size_t offset,
                                         std::size_t size, DnsResourceRecord &rr);

  static std::uint16_t encodeFlags(const DnsHeader &header);

  static void checkBounds(std::size_t offset, std::size_t needed, std::size_t total);

  static std::mt19937 &getRandomGenerator();
};

inline std::uint16_t DnsMessage::generateQueryId()
{
  static thread_local std::uniform_int_distribution<std::uint16_t> dist(1, 65535);
  return dist(getRandomGenerator());
}

inline std::mt19937 &DnsMessage::getRandomGenerator()
{
  static thread_local std::mt19937 gen(std::random_device{}());
  return gen;
}

inline void DnsMessage::writeUint16(std::vector<std::uint8_t> &buffer, std::uint16_t value)
{
  std::uint16_t netValue = htons(value);
  const std::uint8_t *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
  buffer.insert(buffer.end(), bytes, bytes + 2);
}

inline void DnsMessage::writeUint32(std::vector<std::uint8_t> &buffer, std::uint32_t value)
{
  std::uint32_t netValue = htonl(value);
  const std::uint8_t *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
  buffer.insert(buffer.end(), bytes, bytes + 4);
}

inline std::uint16_t DnsMessage::readUint16(const std::uint8_t *data, std::size_t offset)
{
  std::uint16_t netValue;
  std::memcpy(&netValue, data + offset, 2);
  return ntohs(netValue);
}

inline std::uint32_t DnsMessage::readUint32(const std::uint8_t *data, std::size_t offset)
{
  std::uint32_t netValue;
  std::memcpy(&netValue, data + offset, 4);
  return ntohl(netValue);
}

inline void DnsMessage::checkBounds(std::size_t offset, std::size_t needed, std::size_t total)
{
  if (offset + needed > total)
  {
    throw DnsParseException("Insufficient data at offset " + std::to_string(offset) + ", needed " +
                            std::to_string(needed) + ", total " + std::to_string(total));
  }
}

inline std::vector<std::uint8_t> DnsMessage::encodeName(const std::string &name)
{
  std::vector<std::string> labels;
  std::istringstream iss(name);
  std::string label;
  while (std::getline(iss, label, '.'))
  {
    if (!label.empty())
    {
      labels.push_back(label);
    }
  }
  return encodeLabels(labels);
}

inline std::vector<std::uint8_t> DnsMessage::encodeLabels(const std::vector<std::string> &labels)
{
  std::vector<std::uint8_t> encoded;

  for (const auto &label : labels)
  {
    if (label.empty())
      continue;

    if (label.length() > constants::DNS_MAX_LABEL_SIZE)
    {
      throw DnsParseException("Label too long: " + label + " (max " +
                              std::to_string(constants::DNS_MAX_LABEL_SIZE) + ")");
    }

    encoded.push_back(static_cast<std::uint8_t>(label.length()));
    encoded.insert(encoded.end(), label.begin(), label.end());
  }

  encoded.push_back(0); // Root label

  if (encoded.size() > constants::DNS_MAX_NAME_SIZE)
  {
    throw DnsParseException("Domain name too long: " + std::to_string(encoded.size()) +
                            " bytes");
  }

  return encoded;
}

inline std::vector<std::uint8_t>
DnsMessage::encodeCharacterStrings(const std::vector<std::string> &strings)
{
  std::vector<std::uint8_t> rdata;
  for (const auto &s : strings)
  {
    if (s.size() > constants::DNS_MAX_CHARACTER_STRING)
    {
      throw DnsParseException("Character-string too long: " + std::to_string(s.size()) +
                              " (max " + std::to_string(constants::DNS_MAX_CHARACTER_STRING) +
                              ")");
    }
    rdata.push_back(static_cast<std::uint8_t>(s.size()));
    rdata.insert(rdata.end(), s.begin(), s.end());
  }
  if (rdata.size() > constants::DNS_MAX_RDATA_SIZE)
  {
    throw DnsParseException("RDATA too long: " + std::to_string(rdata.size()));
  }
  return rdata;
}

inline std::uint16_t DnsMessage::encodeFlags(const DnsHeader &header)
{
  std::uint16_t flags = 0;
  if (header.qr)
    flags |= 0x8000;
  flags |= static_cast<std::uint16_t>((static_cast<std::uint16_t>(header.opcode) & 0x0F) << 11);
  if (header.aa)
    flags |= 0x0400;
  if (header.tc)
    flags |= 0x0200;
  if (header.rd)
    flags |= 0x0100;
  if (header.ra)
    flags |= 0x0080;
  flags |= static_cast<std::uint16_t>(static_cast<std::uint16_t>(header.rcode) & 0x0F);
  return flags;
}

inline std::vector<std::uint8_t> DnsMessage::buildQuery(const DnsQuestion &question,
                                                        std::uint16_t id, bool recursionDesired)
{
  std::vector<std::uint8_t> message;
  message.reserve(constants::DNS_MAX_UDP_SIZE);

  if (id == 0)
  {
    id = generateQueryId();
  }

  writeUint16(message, id);
  writeUint16(message, recursionDesired ? 0x0100 : 0x0000); // Standard query, RD configurable
  writeUint16(message, 1);                                  // QDCOUNT
  writeUint16(message, 0);                                  // ANCOUNT
  writeUint16(message, 0);                                  // NSCOUNT
  writeUint16(message, 0);                                  // ARCOUNT

  auto encodedName =
    question.labels.empty() ? encodeName(question.qname) : encodeLabels(question.labels);
  message.insert(message.end(), encodedName.begin(), encodedName.end());
  writeUint16(message, static_cast<std::uint16_t>(question.qtype));
  writeUint16(message, static_cast<std::uint16_t>(question.qclass));

  return message;
}

inline std::vector<std::uint8_t>
DnsMessage::buildResponse(const DnsHeader &header, const std::vector<std::uint8_t> &rawQuestion,
                          const std::optional<TxtRecord> &answer)
{
  std::vector<std::uint8_t> message;
  message.reserve(constants::DNS_MAX_UDP_SIZE);

  writeUint16(message, header.id);
  writeUint16(message, encodeFlags(header));
  writeUint16(message, rawQuestion.empty() ? 0 : 1); // QDCOUNT
  writeUint16(message, answer ? 1 : 0);              // ANCOUNT
  writeUint16(message, 0);                           // NSCOUNT
  writeUint16(message, 0);                           // ARCOUNT

  message.insert(message.end(), rawQuestion.begin(), rawQuestion.end());

  if (answer)
  {
    if (rawQuestion.empty())
    {
      auto owner = encodeName(answer->name);
      message.insert(message.end(), owner.begin(), owner.end());
    }
    else
    {
      // Pointer to the question name right after the header
      writeUint16(message, static_cast<std::uint16_t>(0xC000 | constants::DNS_HEADER_SIZE));
    }

    auto rdata = encodeCharacterStrings(answer->text);
    writeUint16(message, static_cast<std::uint16_t>(DnsType::TXT));
    writeUint16(message, static_cast<std::uint16_t>(DnsClass::IN));
    writeUint32(message, answer->ttl);
    writeUint16(message, static_cast<std::uint16_t>(rdata.size()));
    message.insert(message.end(), rdata.begin(), rdata.end());
  }

  return message;
}

inline DnsResult DnsMessage::parse(const std::uint8_t *data, std::size_t size)
{
  if (size < constants::DNS_HEADER_SIZE)
  {
    throw DnsParseException("Message too short for DNS header: " + std::to_string(size) +
                            " bytes, minimum " + std::to_string(constants::DNS_HEADER_SIZE) +
                            " required");
  }

  DnsResult result;
  std::size_t offset = parseHeader(data, 0, size, result.header);

  result.questions.reserve(result.header.qdcount);
  for (std::uint16_t i = 0; i < result.header.qdcount; ++i)
  {
    DnsQuestion question;
    offset = parseQuestion(data, offset, size, question);
    result.questions.push_back(question);
  }

  result.answers.reserve(result.header.ancount);
  for (std::uint16_t i = 0; i < result.header.ancount; ++i)
  {
    DnsResourceRecord rr;
    offset = parseResourceRecord(data, offset, size, rr);
    if (rr.type == DnsType::TXT)
    {
      result.txt_records.push_back(parseTxtRecord(rr));
    }
    result.answers.push_back(std::move(rr));
  }

  return result;
}

inline std::size_t DnsMessage::parseHeader(const std::uint8_t *data, std::size_t offset,
                                           std::size_t size, DnsHeader &header)
{
  checkBounds(offset, constants::DNS_HEADER_SIZE, size);

  header.id = readUint16(data, offset);
  offset += 2;

  std::uint16_t flags = readUint16(data, offset);
  header.qr = (flags & 0x8000) != 0;
  header.opcode = static_cast<DnsOpcode>((flags >> 11) & 0x0F);
  header.aa = (flags & 0x0400) != 0;
  header.tc = (flags & 0x0200) != 0;
  header.rd = (flags & 0x0100) != 0;
  header.ra = (flags & 0x0080) != 0;
  header.z = static_cast<std::uint8_t>((flags >> 4) & 0x07);
  header.rcode = static_cast<DnsResponseCode>(flags & 0x0F);
  offset += 2;

  header.qdcount = readUint16(data, offset);
  offset += 2;
  header.ancount = readUint16(data, offset);
  offset += 2;
  header.nscount = readUint16(data, offset);
  offset += 2;
  header.arcount = readUint16(data, offset);
  offset += 2;

  return offset;
}

inline std::size_t DnsMessage::parseQuestion(const std::uint8_t *data, std::size_t offset,
                                             std::size_t size, DnsQuestion &question)
{
  offset = decodeName(data, offset, size, question.qname, question.labels);

  checkBounds(offset, 4, size);
  question.qtype = static_cast<DnsType>(readUint16(data, offset));
  question.qclass = static_cast<DnsClass>(readUint16(data, offset + 2));

  return offset + 4;
}

inline std::size_t DnsMessage::parseResourceRecord(const std::uint8_t *data, std::size_t offset,
                                                   std::size_t size, DnsResourceRecord &rr)
{
  offset = decodeName(data, offset, size, rr.name);

  // TYPE, CLASS, TTL, RDLENGTH
  checkBounds(offset, 10, size);
  rr.type = static_cast<DnsType>(readUint16(data, offset));
  rr.cls = static_cast<DnsClass>(readUint16(data, offset + 2));
  rr.ttl = readUint32(data, offset + 4);
  rr.rdlength = readUint16(data, offset + 8);
  offset += 10;

  checkBounds(offset, rr.rdlength, size);
  rr.rdata.assign(data + offset, data + offset + rr.rdlength);

  return offset + rr.rdlength;
}

inline std::size_t DnsMessage::decodeName(const std::uint8_t *data, std::size_t offset,
                                          std::size_t size, std::string &name)
{
  std::vector<std::string> labels;
  return decodeName(data, offset, size, name, labels);
}

inline std::size_t DnsMessage::decodeName(const std::uint8_t *data, std::size_t offset,
                                          std::size_t size, std::string &name,
                                          std::vector<std::string> &labels)
{
  std::unordered_set<std::uint16_t> visitedPointers;
  name.clear();
  labels.clear();
  std::size_t originalOffset = offset;
  bool jumped = false;
  bool terminated = false;
  std::size_t totalLength = 0;

  while (offset < size)
  {
    std::uint8_t length = data[offset];

    if ((length & constants::DNS_COMPRESSION_MASK) == constants::DNS_COMPRESSION_MASK)
    {
      checkBounds(offset, 2, size);
      if (!jumped)
      {
        originalOffset = offset + 2; // Continue from after the pointer
        jumped = true;
      }

      std::uint16_t pointer = readUint16(data, offset) & constants::DNS_COMPRESSION_POINTER_MASK;
      if (pointer >= size)
      {
        throw DnsParseException("Invalid compression pointer: " + std::to_string(pointer) +
                                ", message size: " + std::to_string(size));
      }
      if (!visitedPointers.insert(pointer).second)
      {
        throw DnsParseException("Compression pointer loop detected at offset: " +
                                std::to_string(pointer));
      }

      offset = pointer;
      continue;
    }

    if (length == 0)
    {
      offset++;
      terminated = true;
      break;
    }

    // 0x40 and 0x80 prefixes are reserved label types
    if (length > constants::DNS_MAX_LABEL_SIZE)
    {
      throw DnsParseException("Label too long: " + std::to_string(length) + " (max " +
                              std::to_string(constants::DNS_MAX_LABEL_SIZE) + ")");
    }

    checkBounds(offset + 1, length, size);

    labels.emplace_back(reinterpret_cast<const char *>(data + offset + 1), length);
    if (!name.empty())
    {
      name += ".";
    }
    name += labels.back();
    offset += length + 1;

    totalLength += length + 1;
    if (totalLength + 1 > constants::DNS_MAX_NAME_SIZE)
    {
      throw DnsParseException("Domain name too long: " + std::to_string(totalLength + 1) +
                              " (max " + std::to_string(constants::DNS_MAX_NAME_SIZE) + ")");
    }
  }

  if (!terminated)
  {
    throw DnsParseException("Name not terminated before end of message");
  }

  return jumped ? originalOffset : offset;
}

inline TxtRecord DnsMessage::parseTxtRecord(const DnsResourceRecord &rr)
{
  TxtRecord record(rr.name, {}, rr.ttl);

  std::size_t offset = 0;
  while (offset < rr.rdata.size())
  {
    std::uint8_t len = rr.rdata[offset++];
    if (offset + len > rr.rdata.size())
    {
      throw DnsParseException("TXT character-string exceeds RDATA");
    }

    record.text.emplace_back(reinterpret_cast<const char *>(rr.rdata.data() + offset), len);
    offset += len;
  }

  return record;
}

} // namespace dns
} // namespace network
} // namespace lodns
