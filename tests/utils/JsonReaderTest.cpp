/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace CurveLights;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.getType(), JsonType::Boolean);
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);

  JsonValue number(3.5);
  BOOST_CHECK(number.isNumber());
  BOOST_CHECK_CLOSE(number.asNumber(), 3.5, 0.001);
  BOOST_CHECK_EQUAL(number.asInt(), 3);

  // A string literal must not decay to the bool overload
  JsonValue text("hello");
  BOOST_CHECK(text.isString());
  BOOST_CHECK_EQUAL(text.asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestTryAccessors) {
  JsonValue number(2.0);
  JsonValue text("two");

  BOOST_CHECK(number.tryAsNumber().has_value());
  BOOST_CHECK(!number.tryAsString().has_value());
  BOOST_CHECK(text.tryAsString().has_value());
  BOOST_CHECK(!text.tryAsNumber().has_value());
}

BOOST_AUTO_TEST_CASE(TestMissingLookupsYieldNull) {
  JsonObject obj;
  obj["count"] = JsonValue(350.0);
  JsonValue object(obj);

  BOOST_CHECK(object.hasKey("count"));
  BOOST_CHECK(!object.hasKey("missing"));
  BOOST_CHECK(object["missing"].isNull());
  BOOST_CHECK(object[size_t{0}].isNull());
  BOOST_CHECK(JsonValue(1.0)["anything"].isNull());
  BOOST_CHECK_EQUAL(object.size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderTests)

BOOST_AUTO_TEST_CASE(TestParseSettingsShape) {
  const std::string json = R"({
    "particles": { "count": 350, "speed_factor": 0.004, "type": "comet" },
    "color": { "palette1_enabled": true, "palette1": "#fff1cc" },
    "path": { "lorenz_start": [0.1, 0, -2.5e-1] },
    "render": null
  })";

  JsonReader reader;
  BOOST_REQUIRE_MESSAGE(reader.parse(json), reader.getLastError());

  const JsonValue &root = reader.getRoot();
  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root["particles"]["count"].asInt(), 350);
  BOOST_CHECK_CLOSE(root["particles"]["speed_factor"].asNumber(), 0.004, 0.001);
  BOOST_CHECK_EQUAL(root["particles"]["type"].asString(), "comet");
  BOOST_CHECK_EQUAL(root["color"]["palette1_enabled"].asBool(), true);
  BOOST_CHECK_EQUAL(root["path"]["lorenz_start"].size(), 3u);
  BOOST_CHECK_CLOSE(root["path"]["lorenz_start"][2].asNumber(), -0.25, 0.001);
  BOOST_CHECK(root["render"].isNull());
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"(["a\"b", "line\nbreak", "tab\t", "\u00e9", "slash\/"])"));

  const JsonValue &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root[0].asString(), "a\"b");
  BOOST_CHECK_EQUAL(root[1].asString(), "line\nbreak");
  BOOST_CHECK_EQUAL(root[2].asString(), "tab\t");
  BOOST_CHECK_EQUAL(root[3].asString(), "\xC3\xA9");
  BOOST_CHECK_EQUAL(root[4].asString(), "slash/");
}

BOOST_AUTO_TEST_CASE(TestMalformedInputReportsPosition) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\n  \"count\": 350,\n  \"type\" \"trail\"\n}"));
  BOOST_CHECK(reader.getLastError().find("Line 3") != std::string::npos);
  BOOST_CHECK(reader.getLastError().find("':'") != std::string::npos);

  BOOST_CHECK(!reader.parse("[1, 2,]"));
  BOOST_CHECK(!reader.parse("{\"a\": 1} trailing"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("[01.]"));
  BOOST_CHECK(!reader.parse("[tru]"));
  BOOST_CHECK(!reader.parse("\"bad \\x escape\""));

  // A failed parse leaves an empty root
  BOOST_CHECK(reader.getRoot().isNull());

  // The reader is reusable after an error
  BOOST_CHECK(reader.parse("[true]"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  std::string deep(200, '[');
  deep += std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(reader.getLastError().find("depth") != std::string::npos);

  std::string shallow(10, '[');
  shallow += std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  std::filesystem::create_directories("tests/test_data");
  const std::string path = "tests/test_data/json_reader_test.json";
  {
    std::ofstream file(path);
    file << R"({"render": {"theme": "light"}})";
  }

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(path));
  BOOST_CHECK_EQUAL(reader.getRoot()["render"]["theme"].asString(), "light");

  std::error_code ec;
  std::filesystem::remove(path, ec);

  BOOST_CHECK(!reader.loadFromFile("tests/test_data/does_not_exist.json"));
  BOOST_CHECK(reader.getLastError().find("Could not open file") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
