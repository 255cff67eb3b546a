#pragma once

#include <string>
#include <string_view>

namespace google::protobuf {
class Message;
}

namespace crumbtrail::codec {

/*
  JSON encoding shared by record files and request bodies.

  Keys are the proto field names (snake_case) and every primitive field is
  printed, so `"is_fatal":false` is explicit on the wire.

  Record files use the protobuf JSON mapping, where 64-bit integers are
  quoted. Request bodies go through ToWireJson, which prints every integer
  as a JSON number (`"time":1700000000000`). FromJson accepts both forms.
*/

// Throws std::runtime_error when the message cannot be encoded.
std::string ToJson(const google::protobuf::Message& message);

// Request body encoding. Throws std::runtime_error like ToJson.
std::string ToWireJson(const google::protobuf::Message& message);

// false on malformed, truncated or empty input; `out` is then unspecified.
bool FromJson(std::string_view json, google::protobuf::Message* out);

} // namespace crumbtrail::codec
