#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace stateshift::db {

/*
  Stored values are arbitrary JSON documents.

  google.protobuf.Value already models null / number / string / bool /
  struct / list, and json_util gives us a codec for free.
*/
using Document = google::protobuf::Value;

// Ordered full-keyspace export.
using DataMap = std::map<std::string, Document>;

// JSON text codec. Decode throws util::StorageError.
std::string EncodeJson(const Document& value, bool pretty = false);
Document    DecodeJson(std::string_view json);

std::string EncodeDataMap(const DataMap& data, bool pretty = false);
DataMap     DecodeDataMap(std::string_view json);

Document ToDocument(const DataMap& data);
DataMap  ToDataMap(const Document& object);

bool Equals(const Document& a, const Document& b);
bool Equals(const DataMap& a, const DataMap& b);

// Builders
Document StringValue(std::string_view value);
Document NumberValue(double value);
Document IntValue(std::int64_t value);
Document BoolValue(bool value);
Document NullValue();
Document EmptyObject();
Document EmptyList();

// Object access; nullptr when absent or when `object` is not a struct.
const Document* Field(const Document& object, const std::string& name);
Document*       MutableField(Document& object, const std::string& name);

// Integral view of a number value. Throws util::StorageError if not integral.
std::int64_t AsInt(const Document& value);

} // namespace stateshift::db
