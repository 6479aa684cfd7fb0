// huelink headers
#include "core/Errors.hpp"
#include "protocols/DeviceDescription.hpp"
#include "protocols/Lamp.hpp"
#include "protocols/ResponseProtocol.hpp"
#include "protocols/SearchAnswer.hpp"
#include "protocols/SearchRequest.hpp"

#include "SampleDocuments.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace huelink::protocols;
using huelink::core::DecodeError;
using huelink::core::DescriptorError;
using huelink::core::ProtocolError;

namespace {
  ResponseSection err(int type, std::string address, std::string description) {
    return ApiError{ type, std::move(address), std::move(description) };
  }
  ResponseSection ok(nlohmann::json payload = nlohmann::json::object()) {
    return SuccessSection{ std::move(payload) };
  }
} // namespace

// --- ResponseProtocol ---------------------------------------------------------

TEST(response_protocol, parses_error_and_success_sections_in_order) {
  auto sections = parseSections(R"([
    {"error": {"type": 101, "address": "", "description": "link button not pressed"}},
    {"success": {"/lights/1/state/on": true}}
  ])");

  ASSERT_EQ(sections.size(), 2u);
  ASSERT_TRUE(std::holds_alternative<ApiError>(sections[0]));
  EXPECT_EQ(std::get<ApiError>(sections[0]).type, 101);
  EXPECT_EQ(std::get<ApiError>(sections[0]).description, "link button not pressed");
  ASSERT_TRUE(std::holds_alternative<SuccessSection>(sections[1]));
  EXPECT_TRUE(std::get<SuccessSection>(sections[1]).payload.at("/lights/1/state/on").get<bool>());
}

TEST(response_protocol, rejects_bodies_that_are_not_section_lists) {
  EXPECT_THROW(parseSections("not json"), DecodeError);
  EXPECT_THROW(parseSections(R"({"success": {}})"), DecodeError);
  EXPECT_THROW(parseSections(R"([{"warning": {}}])"), DecodeError);
  EXPECT_THROW(parseSections(R"([{"error": {}, "success": {}}])"), DecodeError);
  EXPECT_THROW(parseSections(R"([{"success": "yes"}])"), DecodeError);
  EXPECT_THROW(parseSections(R"([{"error": {"type": "one"}}])"), DecodeError);
}

TEST(response_protocol, empty_list_parses_to_no_sections) { EXPECT_TRUE(parseSections("[]").empty()); }

TEST(response_protocol, mutation_succeeds_when_any_section_succeeds) {
  EXPECT_NO_THROW(interpretMutation({ ok() }));
  EXPECT_NO_THROW(interpretMutation({ err(7, "/lights/1/state/bri", "invalid value"), ok() }));
  EXPECT_NO_THROW(interpretMutation({ ok(), err(1, "/lights/1", "a"), err(2, "/lights/2", "b") }));
}

TEST(response_protocol, mutation_fails_with_every_error_in_order) {
  std::vector<ResponseSection> sections{ err(1, "/lights/1/state/on", "unauthorized user"),
                                         err(3, "/lights/9", "resource not available"),
                                         err(7, "/lights/1/state/bri", "invalid value") };
  try {
    interpretMutation(sections);
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError& e) {
    ASSERT_EQ(e.errors().size(), 3u);
    EXPECT_EQ(e.errors()[0].description, "unauthorized user");
    EXPECT_EQ(e.errors()[1].type, 3);
    EXPECT_EQ(e.errors()[2].address, "/lights/1/state/bri");
  }
}

TEST(response_protocol, mutation_of_empty_response_fails_without_errors) {
  try {
    interpretMutation({});
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError& e) {
    EXPECT_TRUE(e.errors().empty());
  }
}

TEST(response_protocol, registration_returns_username_despite_preceding_errors) {
  std::vector<ResponseSection> sections{ err(101, "", "link button not pressed"),
                                         err(7, "/devicetype", "invalid value"),
                                         ok({ { "username", "abc123" } }) };
  EXPECT_EQ(interpretRegistration(sections), "abc123");
}

TEST(response_protocol, registration_first_username_wins) {
  EXPECT_EQ(interpretRegistration({ ok({ { "username", "first" } }), ok({ { "username", "second" } }) }),
            "first");
}

TEST(response_protocol, registration_coerces_non_string_username) {
  EXPECT_EQ(interpretRegistration({ ok({ { "username", 42 } }) }), "42");
}

TEST(response_protocol, registration_without_username_fails_with_collected_errors) {
  try {
    interpretRegistration({ ok({ { "clientkey", "x" } }), err(101, "", "link button not pressed") });
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError& e) {
    ASSERT_EQ(e.errors().size(), 1u);
    EXPECT_EQ(e.errors()[0].type, 101);
  }
}

TEST(response_protocol, registration_of_empty_response_fails_without_errors) {
  try {
    interpretRegistration({});
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError& e) {
    EXPECT_TRUE(e.errors().empty());
    EXPECT_THAT(e.what(), ::testing::HasSubstr("no success"));
  }
}

// --- SSDP messages ------------------------------------------------------------

TEST(search_request, wire_format_is_crlf_terminated_m_search) {
  const std::string wire = SearchRequest{}.toWire();
  EXPECT_TRUE(wire.starts_with("M-SEARCH * HTTP/1.1\r\n"));
  EXPECT_THAT(wire, ::testing::HasSubstr("HOST: 239.255.255.250:1900\r\n"));
  EXPECT_THAT(wire, ::testing::HasSubstr("MX: 10\r\n"));
  EXPECT_THAT(wire, ::testing::HasSubstr("ST: ssdp:all\r\n"));
  EXPECT_TRUE(wire.ends_with("\r\n\r\n"));
}

TEST(search_answer, extracts_location) {
  auto answer = SearchAnswer::fromWire(huelink::test::searchAnswer("http://192.168.1.20:80/description.xml"));
  ASSERT_TRUE(answer);
  EXPECT_EQ(answer->location, "http://192.168.1.20:80/description.xml");
}

TEST(search_answer, accepts_bare_newlines_and_any_header_case) {
  auto answer = SearchAnswer::fromWire("HTTP/1.1 200 OK\nCache-Control: max-age=100\nLocation:   http://10.0.0.2/d.xml  \n\n");
  ASSERT_TRUE(answer);
  EXPECT_EQ(answer->location, "http://10.0.0.2/d.xml");
}

TEST(search_answer, rejects_malformed_answers) {
  EXPECT_FALSE(SearchAnswer::fromWire(""));
  EXPECT_FALSE(SearchAnswer::fromWire("NOTIFY * HTTP/1.1\r\nLOCATION: http://x/\r\n\r\n"));
  EXPECT_FALSE(SearchAnswer::fromWire("HTTP/1.1 404 Not Found\r\nLOCATION: http://x/\r\n\r\n"));
  EXPECT_FALSE(SearchAnswer::fromWire("HTTP/1.1 200 OK\r\nST: ssdp:all\r\n\r\n"));
  EXPECT_FALSE(SearchAnswer::fromWire("HTTP/1.1 200 OK\r\nLOCATION:\r\n\r\n"));
}

// --- device description -------------------------------------------------------

TEST(device_description, decodes_url_base_and_device_fields) {
  auto desc = BridgeDescriptor::fromXml(huelink::test::descriptionXml());
  EXPECT_EQ(desc.urlBase, "http://192.168.1.20:80/");
  EXPECT_EQ(desc.device.udn, "uuid:2f402f80-da50-11e1-9b23-001788255acc");
  EXPECT_EQ(desc.device.deviceType, "urn:schemas-upnp-org:device:Basic:1");
  EXPECT_EQ(desc.device.manufacturer, "Royal Philips Electronics");
  EXPECT_EQ(desc.device.modelName, "Philips hue bridge 2015");
  EXPECT_EQ(desc.device.modelDescription, "Philips hue Personal Wireless Lighting");
  EXPECT_EQ(desc.device.serialNumber, "001788255acc");
  EXPECT_EQ(desc.device.friendlyName, "Philips hue (192.168.1.20)");
}

TEST(device_description, appends_missing_trailing_slash) {
  auto desc = BridgeDescriptor::fromXml(huelink::test::descriptionXml("http://10.0.0.2:80"));
  EXPECT_EQ(desc.urlBase, "http://10.0.0.2:80/");
}

TEST(device_description, falls_back_to_location_origin_without_url_base) {
  std::string xml = huelink::test::descriptionXml();
  auto begin = xml.find("<URLBase>");
  auto end = xml.find("</URLBase>") + std::string("</URLBase>").size();
  xml.erase(begin, end - begin);

  auto desc = BridgeDescriptor::fromXml(xml, "http://10.0.0.7:80/description.xml");
  EXPECT_EQ(desc.urlBase, "http://10.0.0.7:80/");
  EXPECT_THROW(BridgeDescriptor::fromXml(xml), DescriptorError);
}

TEST(device_description, ignores_embedded_devices) {
  std::string xml = huelink::test::descriptionXml();
  xml.insert(xml.find("  </device>"),
             "<deviceList><device><friendlyName>inner</friendlyName></device></deviceList>\n");
  EXPECT_EQ(BridgeDescriptor::fromXml(xml).device.friendlyName, "Philips hue (192.168.1.20)");
}

TEST(device_description, rejects_malformed_or_incomplete_documents) {
  EXPECT_THROW(BridgeDescriptor::fromXml("<root><URLBase>http://x/</URLBase>"), DescriptorError);
  EXPECT_THROW(BridgeDescriptor::fromXml("{\"not\": \"xml\"}"), DescriptorError);
  EXPECT_THROW(BridgeDescriptor::fromXml("<html><body>hi</body></html>"), DescriptorError);

  std::string xml = huelink::test::descriptionXml();
  xml.erase(xml.find("<serialNumber>"), std::string("<serialNumber>001788255acc</serialNumber>").size());
  EXPECT_THROW(BridgeDescriptor::fromXml(xml), DescriptorError);
}

// --- lamps --------------------------------------------------------------------

TEST(lamp_record, decodes_all_fields) {
  auto j = nlohmann::json::parse(R"({
    "state": {"on": true, "bri": 200, "ct": 366, "alert": "none", "colormode": "ct",
              "mode": "homeautomation", "reachable": true},
    "type": "Color temperature light", "name": "Bedroom", "modelid": "LTW001",
    "manufacturername": "Philips", "productid": "Philips-LTW001-1-A19CTv2",
    "uniqueid": "00:17:88:01:02:03:04:05-0b", "swversion": "1.46.13_r26312",
    "swconfigid": "116B4B4C"
  })");
  auto lamp = j.get<LampRecord>();
  EXPECT_EQ(lamp.name, "Bedroom");
  EXPECT_EQ(lamp.uniqueId, "00:17:88:01:02:03:04:05-0b");
  EXPECT_EQ(lamp.type, "Color temperature light");
  EXPECT_EQ(lamp.modelId, "LTW001");
  EXPECT_EQ(lamp.manufacturerName, "Philips");
  EXPECT_EQ(lamp.productId, "Philips-LTW001-1-A19CTv2");
  EXPECT_EQ(lamp.swVersion, "1.46.13_r26312");
  EXPECT_EQ(lamp.swConfigId, "116B4B4C");
  EXPECT_TRUE(lamp.state.on);
  EXPECT_EQ(lamp.state.bri, 200);
  EXPECT_EQ(lamp.state.ct, 366);
  EXPECT_EQ(lamp.state.alert, "none");
  EXPECT_EQ(lamp.state.colorMode, "ct");
  EXPECT_EQ(lamp.state.mode, "homeautomation");
  EXPECT_TRUE(lamp.state.reachable);
}

TEST(lamp_record, absent_fields_keep_defaults) {
  auto lamp = nlohmann::json::parse(R"({"name": "Hall", "state": {"on": false}})").get<LampRecord>();
  EXPECT_EQ(lamp.name, "Hall");
  EXPECT_FALSE(lamp.state.on);
  EXPECT_EQ(lamp.state.ct, 0);
  EXPECT_TRUE(lamp.productId.empty());
}

TEST(lamp_record, wrong_types_are_rejected) {
  EXPECT_THROW(nlohmann::json::parse(R"({"name": 7})").get<LampRecord>(), nlohmann::json::type_error);
  EXPECT_THROW(nlohmann::json::parse(R"({"state": {"on": "yes"}})").get<LampRecord>(),
               nlohmann::json::type_error);
  EXPECT_THROW(nlohmann::json::parse(R"([1, 2])").get<LampRecord>(), nlohmann::json::type_error);
}

TEST(lamp_record, out_of_range_levels_are_rejected) {
  EXPECT_THROW(nlohmann::json::parse(R"({"state": {"on": true, "bri": 300}})").get<LampRecord>(),
               std::out_of_range);
  EXPECT_THROW(nlohmann::json::parse(R"({"state": {"on": true, "ct": -1}})").get<LampRecord>(),
               std::out_of_range);
  EXPECT_THROW(nlohmann::json::parse(R"({"state": {"ct": 65536}})").get<LampRecord>(), std::out_of_range);

  auto edge = nlohmann::json::parse(R"({"state": {"bri": 255, "ct": 65535}})").get<LampRecord>();
  EXPECT_EQ(edge.state.bri, 255);
  EXPECT_EQ(edge.state.ct, 65535);
}
