// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lodns
{
namespace network
{
namespace dns
{

/// \brief DNS message opcodes (RFC 1035)
enum class DnsOpcode : std::uint8_t
{
  Query = 0,        ///< Standard query
  IQuery = 1,       ///< Inverse query (obsolete)
  Status = 2,       ///< Server status request
  Notify = 4,       ///< Zone change notification (RFC 1996)
  Update = 5        ///< Dynamic update (RFC 2136)
};

/// \brief DNS response codes (RFC 1035)
enum class DnsResponseCode : std::uint8_t
{
  NOERROR = 0,      ///< No error
  FORMERR = 1,      ///< Format error
  SERVFAIL = 2,     ///< Server failure
  NXDOMAIN = 3,     ///< Name does not exist
  NOTIMP = 4,       ///< Not implemented
  REFUSED = 5       ///< Query refused
};

/// \brief DNS record types
enum class DnsType : std::uint16_t
{
  A = 1,            ///< IPv4 address
  NS = 2,           ///< Name server
  CNAME = 5,        ///< Canonical name
  SOA = 6,          ///< Start of authority
  PTR = 12,         ///< Pointer record
  MX = 15,          ///< Mail exchange
  TXT = 16,         ///< Text record
  AAAA = 28,        ///< IPv6 address
  ANY = 255         ///< All records
};

/// \brief DNS record class (RFC 1035)
enum class DnsClass : std::uint16_t
{
  IN = 1,           ///< Internet class
  CS = 2,           ///< CSNET class (obsolete)
  CH = 3,           ///< CHAOS class
  HS = 4,           ///< Hesiod class
  ANY = 255         ///< Any class
};

/// \brief DNS message flags and header structure
struct DnsHeader
{
  std::uint16_t id;                 ///< Query identifier
  bool qr;                          ///< Query/Response flag
  DnsOpcode opcode;                 ///< Operation code
  bool aa;                          ///< Authoritative answer
  bool tc;                          ///< Truncation flag
  bool rd;                          ///< Recursion desired
  bool ra;                          ///< Recursion available
  std::uint8_t z;                   ///< Reserved for future use (must be zero)
  DnsResponseCode rcode;            ///< Response code
  std::uint16_t qdcount;            ///< Question count
  std::uint16_t ancount;            ///< Answer count
  std::uint16_t nscount;            ///< Authority count
  std::uint16_t arcount;            ///< Additional count

  DnsHeader()
    : id(0), qr(false), opcode(DnsOpcode::Query), aa(false), tc(false),
      rd(false), ra(false), z(0), rcode(DnsResponseCode::NOERROR),
      qdcount(0), ancount(0), nscount(0), arcount(0)
  {
  }
};

/// \brief DNS question section
///
/// `labels` keeps the raw label bytes exactly as they arrived, so a label
/// containing a literal '.' survives; `qname` is the dotted presentation form.
struct DnsQuestion
{
  std::string qname;                ///< Domain name, labels joined by '.'
  std::vector<std::string> labels;  ///< Raw labels in wire order
  DnsType qtype;                    ///< Query type
  DnsClass qclass;                  ///< Query class

  DnsQuestion(const std::string& name = "", DnsType type = DnsType::TXT,
              DnsClass cls = DnsClass::IN)
    : qname(name), qtype(type), qclass(cls)
  {
  }
};

/// \brief Base DNS resource record
struct DnsResourceRecord
{
  std::string name;                 ///< Owner name
  DnsType type;                     ///< Record type
  DnsClass cls;                     ///< Record class
  std::uint32_t ttl;                ///< Time to live (seconds)
  std::uint16_t rdlength;           ///< Resource data length
  std::vector<std::uint8_t> rdata;  ///< Resource data (raw)

  DnsResourceRecord(const std::string& n = "", DnsType t = DnsType::TXT,
                    DnsClass c = DnsClass::IN, std::uint32_t ttl_val = 0)
    : name(n), type(t), cls(c), ttl(ttl_val), rdlength(0)
  {
  }
};

/// \brief TXT record structure
struct TxtRecord : public DnsResourceRecord
{
  std::vector<std::string> text;    ///< Character-strings in order

  TxtRecord(const std::string& name = "",
            const std::vector<std::string>& txt = {},
            std::uint32_t ttl_val = 0)
    : DnsResourceRecord(name, DnsType::TXT, DnsClass::IN, ttl_val),
      text(txt)
  {
  }

  /// \brief Concatenation of all character-strings
  std::string joined() const
  {
    std::string out;
    for (const auto& s : text)
    {
      out += s;
    }
    return out;
  }
};

/// \brief A parsed DNS message
struct DnsResult
{
  DnsHeader header;                          ///< Message header
  std::vector<DnsQuestion> questions;        ///< Question section
  std::vector<DnsResourceRecord> answers;    ///< Answer section
  std::vector<TxtRecord> txt_records;        ///< TXT answers decoded

  /// \brief Check if response indicates success
  bool isSuccess() const
  {
    return header.rcode == DnsResponseCode::NOERROR && header.ancount > 0;
  }
};

/// \brief Human-readable response code, for logging
inline std::string toString(DnsResponseCode rcode)
{
  switch (rcode)
  {
    case DnsResponseCode::NOERROR:
      return "NOERROR";
    case DnsResponseCode::FORMERR:
      return "FORMERR";
    case DnsResponseCode::SERVFAIL:
      return "SERVFAIL";
    case DnsResponseCode::NXDOMAIN:
      return "NXDOMAIN";
    case DnsResponseCode::NOTIMP:
      return "NOTIMP";
    case DnsResponseCode::REFUSED:
      return "REFUSED";
  }
  return "UNKNOWN(" + std::to_string(static_cast<unsigned>(rcode)) + ")";
}

/// \brief DNS protocol constants
namespace constants
{
  constexpr std::uint16_t DNS_PORT = 53;
  constexpr std::size_t DNS_HEADER_SIZE = 12;
  constexpr std::size_t DNS_MAX_UDP_SIZE = 512;
  constexpr std::size_t DNS_MAX_UDP_PAYLOAD = 65507;
  constexpr std::size_t DNS_MAX_LABEL_SIZE = 63;
  constexpr std::size_t DNS_MAX_NAME_SIZE = 255;
  constexpr std::size_t DNS_MAX_CHARACTER_STRING = 255;
  constexpr std::size_t DNS_MAX_RDATA_SIZE = 65535;
  constexpr std::uint8_t DNS_COMPRESSION_MASK = 0xC0;
  constexpr std::uint16_t DNS_COMPRESSION_POINTER_MASK = 0x3FFF;
  constexpr std::uint32_t DNS_DEFAULT_TTL = 300;
  constexpr std::uint32_t DNS_MAX_TTL = 0x7FFFFFFF;
}

} // namespace dns
} // namespace network
} // namespace lodns
