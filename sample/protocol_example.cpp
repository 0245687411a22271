/// \file protocol_example.cpp
/// \brief Example consumer that maps a protocol-schema document onto C++ structs.
///
/// The tokenizer itself only reports lexical events. This sample shows the layer a consumer
/// builds on top of it:
///
/// - Run `ProtocolReader::read()` over an in-memory document and check `ReadResult::ok`.
/// - Walk the resulting `Protocol` value (interfaces, requests, events, enums).
/// - Use the raw `Scanner` next to it, tracking byte offsets with `remaining()`.
/// - Route diagnostics through the txml `Logger`.

#include <txml/core/logger.hpp>
#include <txml/parsers/xml.hpp>
#include <txml/protocol/protocol_reader.hpp>

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace
{
constexpr std::string_view kProtocol = R"(<?xml version="1.0" encoding="UTF-8"?>
<protocol name="test_protocol">
  <copyright>Test Copyright</copyright>
  <description summary="Test protocol">Protocol description body.</description>
  <interface name="test_interface" version="2">
    <description summary="Test interface">Interface description.</description>
    <request name="test_request" since="2" deprecated-since="3">
      <description summary="Test request">Request description.</description>
      <arg name="id" type="new_id"/>
      <arg name="num" type="int"/>
      <arg name="count" type="uint"/>
      <arg name="fixed_val" type="fixed"/>
      <arg name="text" type="string" allow-null="true"/>
      <arg name="obj" type="object" interface="test_interface"/>
      <arg name="data" type="array"/>
      <arg name="fd" type="fd"/>
      <arg name="enum_arg" type="uint" enum="test_enum" summary="Enum arg"/>
    </request>
    <request name="destroy" type="destructor"/>
    <event name="test_event" deprecated-since="5">
      <arg name="value" type="string"/>
    </event>
    <enum name="test_enum" deprecated-since="4">
      <description summary="Test enum">Enum description.</description>
      <entry name="val_one" value="1" summary="First value"/>
      <entry name="val_hex" value="0xff" since="2" deprecated-since="5">
        <description summary="Hex value">Entry description.</description>
      </entry>
    </enum>
    <enum name="flags" bitfield="true" since="2">
      <entry name="flag_a" value="1"/>
      <entry name="flag_b" value="2" deprecated-since="6"/>
    </enum>
  </interface>
</protocol>)";
} // namespace

int main()
{
  txml::core::Logger::init(txml::core::Logger::Level::Debug);

  // Count elements with the bare scanner first
  txml::parsers::xml::Scanner scanner(kProtocol);
  std::size_t elements = 0;
  while (scanner.next())
  {
    if (scanner.current().kind == txml::parsers::xml::EventKind::Open)
    {
      ++elements;
    }
  }
  if (scanner.error())
  {
    TXML_LOG_ERROR("Lexical error at byte " << kProtocol.size() - scanner.remaining().size()
                                            << ": " << *scanner.error());
    return EXIT_FAILURE;
  }
  TXML_LOG_INFO("Document has " << elements << " elements");

  auto result = txml::protocol::ProtocolReader::read(kProtocol);
  if (!result.ok)
  {
    TXML_LOG_ERROR("Failed to read protocol: " << result.message);
    return EXIT_FAILURE;
  }

  const auto &protocol = result.protocol;
  std::cout << "Copyright: " << protocol.copyright << "\n";
  if (protocol.description)
  {
    std::cout << "Summary: " << protocol.description->summary << "\n";
  }
  txml::protocol::writeSummary(std::cout, protocol);

  for (const auto &iface : protocol.interfaces)
  {
    for (const auto &request : iface.requests)
    {
      if (request.deprecatedSince)
      {
        TXML_LOG_WARN(iface.name << "." << request.name << " is deprecated since version "
                                 << *request.deprecatedSince);
      }
    }
  }

  txml::core::Logger::shutdown();
  return EXIT_SUCCESS;
}
