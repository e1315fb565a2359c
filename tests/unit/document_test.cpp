#include "internal/db/api/document.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace stateshift::db;

void TestDecodeEncodeNestedDocument() {
  const auto doc = DecodeJson(R"({"name":"alpha","tags":["a","b"],"meta":{"count":3,"active":true,"missing":null}})");

  assert(Field(doc, "name")->string_value() == "alpha");
  assert(Field(doc, "tags")->list_value().values_size() == 2);
  assert(AsInt(*Field(*Field(doc, "meta"), "count")) == 3);
  assert(Field(*Field(doc, "meta"), "active")->bool_value());
  assert(Field(*Field(doc, "meta"), "missing")->kind_case() == Document::kNullValue);
  assert(Field(doc, "absent") == nullptr);

  assert(Equals(DecodeJson(EncodeJson(doc)), doc));
}

void TestLargeIntegersEncodeWithoutExponent() {
  const auto json = EncodeJson(IntValue(20250102000000));
  assert(json == "20250102000000");
  assert(AsInt(DecodeJson(json)) == 20250102000000);
}

void TestAsIntRejectsFractionsAndStrings() {
  bool threw = false;
  try {
    (void)AsInt(NumberValue(1.5));
  } catch (const stateshift::util::StorageError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)AsInt(StringValue("7"));
  } catch (const stateshift::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

void TestDataMapRequiresTopLevelObject() {
  DataMap data;
  data["b"] = IntValue(2);
  data["a"] = StringValue("one");

  const auto decoded = DecodeDataMap(EncodeDataMap(data));
  assert(Equals(decoded, data));

  bool threw = false;
  try {
    (void)DecodeDataMap("[1,2,3]");
  } catch (const stateshift::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedJsonIsStorageError() {
  bool threw = false;
  try {
    (void)DecodeJson("{not json");
  } catch (const stateshift::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

void TestEqualsDistinguishesValues() {
  DataMap a;
  a["k"] = IntValue(1);
  DataMap b;
  b["k"] = IntValue(2);
  assert(!Equals(a, b));

  b["k"] = IntValue(1);
  assert(Equals(a, b));

  b["extra"] = NullValue();
  assert(!Equals(a, b));
}

} // namespace

int main() {
  TestDecodeEncodeNestedDocument();
  TestLargeIntegersEncodeWithoutExponent();
  TestAsIntRejectsFractionsAndStrings();
  TestDataMapRequiresTopLevelObject();
  TestMalformedJsonIsStorageError();
  TestEqualsDistinguishesValues();

  std::cout << "stateshift_unit_document: pass\n";
  return 0;
}
