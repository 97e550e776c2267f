#include "test.h"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "stratai/util/json.h"

using namespace stratai;

#define SAI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

static std::string parse_error_message(const std::string& text) {
  try {
    (void)json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

int test_json_errors() {
  // Hand-edited observation/config files: errors carry line/col and a caret.

  // Missing value after a key.
  {
    const std::string msg = parse_error_message("{\n  \"our_total_economy\": ,\n  \"alloy_density\": 0.2\n}\n");
    SAI_ASSERT(!msg.empty());
    SAI_ASSERT(msg.find("line 2, col 24") != std::string::npos);
    SAI_ASSERT(msg.find("unexpected") != std::string::npos);
    SAI_ASSERT(msg.find("^") != std::string::npos);
  }

  // Same with CRLF line endings.
  {
    const std::string msg = parse_error_message("{\r\n  \"our_total_economy\": ,\r\n}\r\n");
    SAI_ASSERT(msg.find("line 2, col 24") != std::string::npos);
  }

  // Unterminated object.
  {
    const std::string msg = parse_error_message("{\n  \"aggression_slider\": 1.5");
    SAI_ASSERT(!msg.empty());
    SAI_ASSERT(msg.find("line 2") != std::string::npos);
    SAI_ASSERT(msg.find("expected") != std::string::npos);
  }

  // Trailing garbage.
  {
    const std::string msg = parse_error_message("{} extra");
    SAI_ASSERT(msg.find("trailing") != std::string::npos);
  }

  return 0;
}

int test_json_values() {
  // Leading UTF-8 BOM is tolerated.
  {
    std::string txt = "\xEF\xBB\xBF";
    txt += " {\"signals\": {\"aggressive\": 0.8}, \"flags\": [true, null, \"x\"]}";
    const auto v = json::parse(txt);
    SAI_ASSERT(v.is_object());
    SAI_ASSERT(v.at("signals").at("aggressive").number_value() == 0.8);
    SAI_ASSERT(v.at("flags").array().size() == 3);
    SAI_ASSERT(v.at("flags").at(1).is_null());
    SAI_ASSERT(v.at("flags").at(2).string_value() == "x");
  }

  // Typed accessors fall back to their defaults on a type mismatch.
  {
    const auto v = json::parse(R"({"n": 3, "s": "text"})");
    SAI_ASSERT(v.at("n").int_value() == 3);
    SAI_ASSERT(v.at("s").number_value(-1.0) == -1.0);
    SAI_ASSERT(v.at("n").string_value("d") == "d");
    SAI_ASSERT(v.at("n").bool_value(true) == true);
    SAI_ASSERT(json::find_key(v.object(), "missing") == nullptr);
    SAI_ASSERT(std::string(json::type_name(v.at("s"))) == "string");

    bool threw = false;
    try {
      (void)v.at("missing");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SAI_ASSERT(threw);
  }

  // Output is deterministic: sorted keys, clean integers, non-finite as null.
  {
    json::Object o;
    o["zeta"] = 2.0;
    o["alpha"] = std::numeric_limits<double>::infinity();
    o["mid"] = std::string("m");
    const std::string text = json::stringify(json::object(o), 0);
    SAI_ASSERT(text == R"({"alpha":null,"mid":"m","zeta":2})");
  }

  // Out-of-range magnitudes saturate instead of failing the parse.
  {
    const auto v = json::parse("[1e400, -1E+400, 1e-400]");
    SAI_ASSERT(v.at(0).number_value() == std::numeric_limits<double>::infinity());
    SAI_ASSERT(v.at(1).number_value() == -std::numeric_limits<double>::infinity());
    SAI_ASSERT(v.at(2).number_value(-1.0) == 0.0);
  }

  // Unicode escapes decode to UTF-8.
  {
    const auto v = json::parse(R"("é🚀")");
    SAI_ASSERT(v.string_value() == "\xC3\xA9\xF0\x9F\x9A\x80");
  }

  return 0;
}
