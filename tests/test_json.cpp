#include <iostream>
#include <stdexcept>
#include <string>

#include "agirace/util/json.h"

#define AGR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_json() {
  namespace json = agirace::json;

  {
    const auto v = json::parse(R"({"b": [1, 2.5, true, null], "a": "x\u00e9", "n": -3e2})");
    AGR_ASSERT(v.is_object());
    AGR_ASSERT(v.at("a").string_value() == "x\xc3\xa9");
    AGR_ASSERT(v.at("n").number_value() == -300.0);
    const auto& arr = v.at("b").array();
    AGR_ASSERT(arr.size() == 4);
    AGR_ASSERT(arr[0].int_value() == 1);
    AGR_ASSERT(arr[1].number_value() == 2.5);
    AGR_ASSERT(arr[2].bool_value() == true);
    AGR_ASSERT(arr[3].is_null());
    AGR_ASSERT(json::find_key(v.object(), "missing") == nullptr);
  }

  // Keys come out sorted, so equal objects produce identical text.
  {
    json::Object o;
    o["zeta"] = 1.0;
    o["alpha"] = std::string("a");
    const std::string text = json::stringify(json::Value(o), 0);
    AGR_ASSERT(text.find("alpha") < text.find("zeta"));

    const auto back = json::parse(json::stringify(json::Value(o)));
    AGR_ASSERT(back.at("zeta").number_value() == 1.0);
  }

  // Doubles survive a text round trip exactly.
  {
    const double x = 23.749999999999996;
    json::Object o;
    o["x"] = x;
    AGR_ASSERT(json::parse(json::stringify(json::Value(o))).at("x").number_value() == x);
  }

  // Errors carry a position.
  {
    bool threw = false;
    try {
      (void)json::parse("{\n  \"a\": [1, 2,\n}");
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("line") != std::string::npos;
    }
    AGR_ASSERT(threw);
  }

  {
    bool threw = false;
    try {
      (void)json::parse("[1] trailing");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    AGR_ASSERT(threw);
  }

  {
    const auto v = json::parse("{\"a\": 1}");
    bool threw = false;
    try {
      (void)v.at("b");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    AGR_ASSERT(threw);
  }

  return 0;
}
