#ifndef CAPABILITY_VALUE_CODEC_HPP
#define CAPABILITY_VALUE_CODEC_HPP

#include <string>

#include "proto/channel.pb.h"
#include "proto/value.pb.h"
#include "script/value.hpp"

namespace capability {

// Deepest nesting ToProto accepts. Each level costs two protobuf message
// levels, and parsing stops at a recursion depth of 100.
static const constexpr int kMaxValueDepth = 32;

// Converts a data value (None, bool, int, float, str and lists, tuples and
// dicts of those) to its wire form. Returns false and sets error_msg for
// values that are not data, such as functions or modules, and for
// structures nested too deeply or containing themselves.
bool ToProto(const script::Value& value, proto::Value* out,
             std::string* error_msg);

script::Value FromProto(const proto::Value& value);

// Row helpers used by the database builtins.
script::Value RowToDict(const proto::Row& row);
bool DictToProto(const script::Value& dict, proto::ValueDict* out,
                 std::string* error_msg);

}  // namespace capability

#endif
