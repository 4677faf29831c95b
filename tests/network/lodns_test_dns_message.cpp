// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace lodns::network::dns;

TEST_CASE("DnsMessage builds and parses a TXT query", "[dns][message]")
{
  DnsQuestion question("what.is.rust", DnsType::TXT, DnsClass::IN);
  auto packet = DnsMessage::buildQuery(question, 0xBEEF, true);

  REQUIRE(packet.size() == 12 + 14 + 4);
  REQUIRE(packet[0] == 0xBE);
  REQUIRE(packet[1] == 0xEF);
  REQUIRE(packet[2] == 0x01); // RD
  REQUIRE(packet[3] == 0x00);

  auto result = DnsMessage::parse(packet);
  REQUIRE(result.header.id == 0xBEEF);
  REQUIRE_FALSE(result.header.qr);
  REQUIRE(result.header.rd);
  REQUIRE(result.header.opcode == DnsOpcode::Query);
  REQUIRE(result.header.qdcount == 1);
  REQUIRE(result.questions.size() == 1);
  REQUIRE(result.questions[0].qname == "what.is.rust");
  REQUIRE(result.questions[0].labels == std::vector<std::string>{"what", "is", "rust"});
  REQUIRE(result.questions[0].qtype == DnsType::TXT);
  REQUIRE(result.questions[0].qclass == DnsClass::IN);
}

TEST_CASE("DnsMessage auto-generates non-zero query ids", "[dns][message]")
{
  DnsQuestion question("example");
  for (int i = 0; i < 20; ++i)
  {
    auto packet = DnsMessage::buildQuery(question);
    REQUIRE(DnsMessage::readUint16(packet.data(), 0) != 0);
  }
}

TEST_CASE("DnsMessage keeps raw label bytes", "[dns][message]")
{
  DnsQuestion question("", DnsType::TXT);
  question.labels = {"a.b", "Caf\xC3\xA9"};
  auto packet = DnsMessage::buildQuery(question, 7);

  auto result = DnsMessage::parse(packet);
  REQUIRE(result.questions[0].labels.size() == 2);
  REQUIRE(result.questions[0].labels[0] == "a.b");
  REQUIRE(result.questions[0].labels[1] == "Caf\xC3\xA9");
}

TEST_CASE("DnsMessage response with TXT answer", "[dns][message][txt]")
{
  DnsQuestion question("hello.world");
  auto query = DnsMessage::buildQuery(question, 0x0102);
  std::vector<std::uint8_t> rawQuestion(query.begin() + constants::DNS_HEADER_SIZE, query.end());

  DnsHeader header;
  header.id = 0x0102;
  header.qr = true;
  header.aa = true;
  header.rd = true;
  header.rcode = DnsResponseCode::NOERROR;

  TxtRecord answer("", {"first part ", "second part"}, 120);
  auto response = DnsMessage::buildResponse(header, rawQuestion, answer);

  // Answer owner is a pointer to offset 12
  std::size_t answerOffset = constants::DNS_HEADER_SIZE + rawQuestion.size();
  REQUIRE(response[answerOffset] == 0xC0);
  REQUIRE(response[answerOffset + 1] == 0x0C);

  auto result = DnsMessage::parse(response);
  REQUIRE(result.header.qr);
  REQUIRE(result.header.aa);
  REQUIRE(result.header.rd);
  REQUIRE_FALSE(result.header.ra);
  REQUIRE_FALSE(result.header.tc);
  REQUIRE(result.isSuccess());
  REQUIRE(result.header.qdcount == 1);
  REQUIRE(result.header.ancount == 1);
  REQUIRE(result.header.nscount == 0);
  REQUIRE(result.header.arcount == 0);
  REQUIRE(result.answers.size() == 1);
  REQUIRE(result.answers[0].name == "hello.world");
  REQUIRE(result.answers[0].ttl == 120);
  REQUIRE(result.txt_records.size() == 1);
  REQUIRE(result.txt_records[0].text.size() == 2);
  REQUIRE(result.txt_records[0].joined() == "first part second part");
}

TEST_CASE("DnsMessage error response without answer", "[dns][message]")
{
  DnsHeader header;
  header.id = 99;
  header.qr = true;
  header.rcode = DnsResponseCode::SERVFAIL;

  auto response = DnsMessage::buildResponse(header, {}, std::nullopt);
  REQUIRE(response.size() == constants::DNS_HEADER_SIZE);

  auto result = DnsMessage::parse(response);
  REQUIRE(result.header.rcode == DnsResponseCode::SERVFAIL);
  REQUIRE_FALSE(result.isSuccess());
  REQUIRE(result.header.qdcount == 0);
  REQUIRE(result.header.ancount == 0);
  REQUIRE(std::string(toString(DnsResponseCode::SERVFAIL)) == "SERVFAIL");
}

TEST_CASE("DnsMessage encoding limits", "[dns][message][errors]")
{
  REQUIRE_THROWS_AS(DnsMessage::encodeLabels({std::string(64, 'x')}), DnsParseException);
  REQUIRE_NOTHROW(DnsMessage::encodeLabels({std::string(63, 'x')}));

  std::vector<std::string> tooMany(5, std::string(63, 'y'));
  REQUIRE_THROWS_AS(DnsMessage::encodeLabels(tooMany), DnsParseException);

  REQUIRE_THROWS_AS(DnsMessage::encodeCharacterStrings({std::string(256, 'z')}),
                    DnsParseException);
  auto rdata = DnsMessage::encodeCharacterStrings({"ab", "", "c"});
  REQUIRE(rdata == std::vector<std::uint8_t>{2, 'a', 'b', 0, 1, 'c'});

  REQUIRE(DnsMessage::encodeName("") == std::vector<std::uint8_t>{0});
}

TEST_CASE("DnsMessage rejects malformed packets", "[dns][message][errors]")
{
  SECTION("Too short for a header")
  {
    std::vector<std::uint8_t> packet(11, 0);
    REQUIRE_THROWS_AS(DnsMessage::parse(packet), DnsParseException);
  }

  SECTION("Truncated question")
  {
    auto packet = DnsMessage::buildQuery(DnsQuestion("abc.def"), 1);
    packet.resize(packet.size() - 3);
    REQUIRE_THROWS_AS(DnsMessage::parse(packet), DnsParseException);
  }

  SECTION("Label runs past the end")
  {
    std::vector<std::uint8_t> packet = {0, 1, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 10, 'a', 'b'};
    REQUIRE_THROWS_AS(DnsMessage::parse(packet), DnsParseException);
  }

  SECTION("Name without terminator")
  {
    std::vector<std::uint8_t> packet = {0, 1, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 2, 'a', 'b'};
    REQUIRE_THROWS_AS(DnsMessage::parse(packet), DnsParseException);
  }

  SECTION("Compression pointer loop")
  {
    std::vector<std::uint8_t> packet = {0, 1, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0xC0, 0x0C, 0, 16, 0, 1};
    REQUIRE_THROWS_AS(DnsMessage::parse(packet), DnsParseException);
  }

  SECTION("Reserved label type")
  {
    std::vector<std::uint8_t> packet = {0, 1, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0x41, 'a', 0, 0, 16, 0, 1};
    REQUIRE_THROWS_AS(DnsMessage::parse(packet), DnsParseException);
  }

  SECTION("TXT character-string overruns RDATA")
  {
    DnsResourceRecord rr("x", DnsType::TXT);
    rr.rdata = {5, 'a', 'b'};
    REQUIRE_THROWS_AS(DnsMessage::parseTxtRecord(rr), DnsParseException);
  }
}

TEST_CASE("DnsMessage follows compression pointers", "[dns][message]")
{
  // Question "ab" at offset 12, answer owner points back to it
  std::vector<std::uint8_t> packet = {0, 1, 0x84, 0, 0, 1, 0, 1, 0, 0, 0, 0,
                                      2, 'a', 'b', 0, 0, 16, 0, 1,
                                      0xC0, 0x0C, 0, 16, 0, 1, 0, 0, 0, 60, 0, 3, 2, 'h', 'i'};
  auto result = DnsMessage::parse(packet);
  REQUIRE(result.answers.size() == 1);
  REQUIRE(result.answers[0].name == "ab");
  REQUIRE(result.txt_records[0].joined() == "hi");
  REQUIRE(result.txt_records[0].ttl == 60);
}
