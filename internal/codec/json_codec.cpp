#include "json_codec.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>

namespace crumbtrail::codec {

using google::protobuf::FieldDescriptor;

static void MessageToProtoStruct(const google::protobuf::Message& message, google::protobuf::Struct* out);

static void SetNumberValue(double number, google::protobuf::Value* value) {
  // JSON has no literal for these; use the protobuf mapping's spelling.
  if (std::isnan(number)) {
    value->set_string_value("NaN");
  } else if (std::isinf(number)) {
    value->set_string_value(number > 0 ? "Infinity" : "-Infinity");
  } else {
    value->set_number_value(number);
  }
}

// index < 0 reads the singular field.
static void FieldToProtoValue(const google::protobuf::Message& message, const FieldDescriptor* field, int index, google::protobuf::Value* value) {
  const auto* reflection = message.GetReflection();
  const bool  repeated   = index >= 0;

  switch (field->cpp_type()) {
    case FieldDescriptor::CPPTYPE_INT32:
      value->set_number_value(repeated ? reflection->GetRepeatedInt32(message, field, index) : reflection->GetInt32(message, field));
      break;
    case FieldDescriptor::CPPTYPE_INT64:
      value->set_number_value(static_cast<double>(repeated ? reflection->GetRepeatedInt64(message, field, index) : reflection->GetInt64(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_UINT32:
      value->set_number_value(repeated ? reflection->GetRepeatedUInt32(message, field, index) : reflection->GetUInt32(message, field));
      break;
    case FieldDescriptor::CPPTYPE_UINT64:
      value->set_number_value(static_cast<double>(repeated ? reflection->GetRepeatedUInt64(message, field, index) : reflection->GetUInt64(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_DOUBLE:
      SetNumberValue(repeated ? reflection->GetRepeatedDouble(message, field, index) : reflection->GetDouble(message, field), value);
      break;
    case FieldDescriptor::CPPTYPE_FLOAT:
      SetNumberValue(repeated ? reflection->GetRepeatedFloat(message, field, index) : reflection->GetFloat(message, field), value);
      break;
    case FieldDescriptor::CPPTYPE_BOOL:
      value->set_bool_value(repeated ? reflection->GetRepeatedBool(message, field, index) : reflection->GetBool(message, field));
      break;
    case FieldDescriptor::CPPTYPE_ENUM:
      value->set_string_value((repeated ? reflection->GetRepeatedEnum(message, field, index) : reflection->GetEnum(message, field))->name());
      break;
    case FieldDescriptor::CPPTYPE_STRING:
      value->set_string_value(repeated ? reflection->GetRepeatedString(message, field, index) : reflection->GetString(message, field));
      break;
    case FieldDescriptor::CPPTYPE_MESSAGE:
      MessageToProtoStruct(repeated ? reflection->GetRepeatedMessage(message, field, index) : reflection->GetMessage(message, field),
                           value->mutable_struct_value());
      break;
  }
}

static std::string MapKeyString(const google::protobuf::Message& entry, const FieldDescriptor* key_field) {
  google::protobuf::Value key;
  FieldToProtoValue(entry, key_field, -1, &key);
  switch (key.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return key.string_value();
    case google::protobuf::Value::kBoolValue:
      return key.bool_value() ? "true" : "false";
    default:
      return std::to_string(static_cast<int64_t>(key.number_value()));
  }
}

static void MessageToProtoStruct(const google::protobuf::Message& message, google::protobuf::Struct* out) {
  const auto* descriptor = message.GetDescriptor();
  const auto* reflection = message.GetReflection();
  auto&       fields     = *out->mutable_fields();

  for (int i = 0; i < descriptor->field_count(); ++i) {
    const FieldDescriptor* field = descriptor->field(i);

    if (field->is_map()) {
      auto* map_value = fields[field->name()].mutable_struct_value();
      for (int j = 0; j < reflection->FieldSize(message, field); ++j) {
        const auto& entry     = reflection->GetRepeatedMessage(message, field, j);
        const auto* key_field = field->message_type()->map_key();
        const auto* val_field = field->message_type()->map_value();
        FieldToProtoValue(entry, val_field, -1, &(*map_value->mutable_fields())[MapKeyString(entry, key_field)]);
      }
    } else if (field->is_repeated()) {
      auto* list_value = fields[field->name()].mutable_list_value();
      for (int j = 0; j < reflection->FieldSize(message, field); ++j) {
        FieldToProtoValue(message, field, j, list_value->add_values());
      }
    } else if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE || field->has_presence()) {
      if (reflection->HasField(message, field)) {
        FieldToProtoValue(message, field, -1, &fields[field->name()]);
      }
    } else {
      FieldToProtoValue(message, field, -1, &fields[field->name()]);
    }
  }
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

std::string ToWireJson(const google::protobuf::Message& message) {
  google::protobuf::Struct body;
  MessageToProtoStruct(message, &body);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

bool FromJson(std::string_view json, google::protobuf::Message* out) {
  if (json.empty()) {
    return false;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  out->Clear();
  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), out, options);
  return status.ok();
}

} // namespace crumbtrail::codec
