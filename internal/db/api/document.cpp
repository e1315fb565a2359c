#include "internal/db/api/document.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace stateshift::db {

std::string EncodeJson(const Document& value, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;

  // An unset Value has no JSON form; store it as null.
  if (value.kind_case() == Document::KIND_NOT_SET) {
    return "null";
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json, options);
  if (!status.ok()) {
    throw util::StorageError("failed to encode document: " + std::string(status.message()));
  }
  return json;
}

Document DecodeJson(std::string_view json) {
  Document value;
  auto     status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw util::StorageError("failed to decode document: " + std::string(status.message()));
  }
  return value;
}

std::string EncodeDataMap(const DataMap& data, bool pretty) {
  return EncodeJson(ToDocument(data), pretty);
}

DataMap DecodeDataMap(std::string_view json) {
  return ToDataMap(DecodeJson(json));
}

Document ToDocument(const DataMap& data) {
  Document object = EmptyObject();
  auto&    fields = *object.mutable_struct_value()->mutable_fields();
  for (const auto& [key, value] : data) {
    fields[key] = value;
  }
  return object;
}

DataMap ToDataMap(const Document& object) {
  if (object.kind_case() != Document::kStructValue) {
    throw util::StorageError("expected a JSON object at top level");
  }

  DataMap data;
  for (const auto& [key, value] : object.struct_value().fields()) {
    data.emplace(key, value);
  }
  return data;
}

bool Equals(const Document& a, const Document& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

bool Equals(const DataMap& a, const DataMap& b) {
  if (a.size() != b.size()) return false;
  auto it_a = a.begin();
  auto it_b = b.begin();
  for (; it_a != a.end(); ++it_a, ++it_b) {
    if (it_a->first != it_b->first || !Equals(it_a->second, it_b->second)) {
      return false;
    }
  }
  return true;
}

Document StringValue(std::string_view value) {
  Document d;
  d.set_string_value(std::string(value));
  return d;
}

Document NumberValue(double value) {
  Document d;
  d.set_number_value(value);
  return d;
}

Document IntValue(std::int64_t value) {
  return NumberValue(static_cast<double>(value));
}

Document BoolValue(bool value) {
  Document d;
  d.set_bool_value(value);
  return d;
}

Document NullValue() {
  Document d;
  d.set_null_value(google::protobuf::NULL_VALUE);
  return d;
}

Document EmptyObject() {
  Document d;
  d.mutable_struct_value();
  return d;
}

Document EmptyList() {
  Document d;
  d.mutable_list_value();
  return d;
}

const Document* Field(const Document& object, const std::string& name) {
  if (object.kind_case() != Document::kStructValue) return nullptr;
  const auto& fields = object.struct_value().fields();
  auto        it     = fields.find(name);
  return it == fields.end() ? nullptr : &it->second;
}

Document* MutableField(Document& object, const std::string& name) {
  return &(*object.mutable_struct_value()->mutable_fields())[name];
}

std::int64_t AsInt(const Document& value) {
  if (value.kind_case() == Document::kNumberValue) {
    const double n = value.number_value();
    if (std::isfinite(n) && std::floor(n) == n) {
      return static_cast<std::int64_t>(n);
    }
  }
  throw util::StorageError("expected an integral number, got " + EncodeJson(value));
}

} // namespace stateshift::db
