#include "capability/value_codec.hpp"

#include "absl/strings/str_cat.h"

namespace capability {

namespace {

bool Encode(const script::Value& value, proto::Value* out, int depth,
            std::string* error_msg) {
  if (depth > kMaxValueDepth) {
    *error_msg = "value is nested too deeply";
    return false;
  }
  switch (value.type()) {
    case script::Type::kNone:
      out->set_null_value(true);
      return true;
    case script::Type::kBool:
      out->set_bool_value(value.bool_value());
      return true;
    case script::Type::kInt:
      out->set_int_value(value.int_value());
      return true;
    case script::Type::kFloat:
      out->set_float_value(value.float_value());
      return true;
    case script::Type::kStr:
      out->set_str_value(value.str());
      return true;
    case script::Type::kList:
    case script::Type::kTuple: {
      proto::ValueList* list = value.is_list() ? out->mutable_list_value()
                                               : out->mutable_tuple_value();
      for (const script::Value& item : value.items()) {
        if (!Encode(item, list->add_item(), depth + 1, error_msg)) return false;
      }
      return true;
    }
    case script::Type::kDict: {
      proto::ValueDict* dict = out->mutable_dict_value();
      for (const auto& entry : value.dict().entries()) {
        proto::DictEntry* encoded = dict->add_entry();
        if (!Encode(entry.first, encoded->mutable_key(), depth + 1,
                    error_msg) ||
            !Encode(entry.second, encoded->mutable_value(), depth + 1,
                    error_msg))
          return false;
      }
      return true;
    }
    case script::Type::kRange: {
      const script::RangeObject& range = value.range();
      if (range.Size() > 1000000) {
        *error_msg = "range is too large to be transferred";
        return false;
      }
      proto::ValueList* list = out->mutable_list_value();
      for (int64_t i = 0; i < range.Size(); i++)
        list->add_item()->set_int_value(range.At(i));
      return true;
    }
    default:
      *error_msg = absl::StrCat("values of type '", script::TypeName(value),
                                "' cannot be transferred");
      return false;
  }
}

}  // namespace

bool ToProto(const script::Value& value, proto::Value* out,
             std::string* error_msg) {
  out->Clear();
  return Encode(value, out, 0, error_msg);
}

script::Value FromProto(const proto::Value& value) {
  switch (value.kind_case()) {
    case proto::Value::kBoolValue:
      return script::Value::Bool(value.bool_value());
    case proto::Value::kIntValue:
      return script::Value::Int(value.int_value());
    case proto::Value::kFloatValue:
      return script::Value::Float(value.float_value());
    case proto::Value::kStrValue:
      return script::Value::Str(value.str_value());
    case proto::Value::kListValue:
    case proto::Value::kTupleValue: {
      const proto::ValueList& list = value.has_list_value()
                                         ? value.list_value()
                                         : value.tuple_value();
      std::vector<script::Value> items;
      items.reserve(list.item_size());
      for (const proto::Value& item : list.item())
        items.push_back(FromProto(item));
      return value.has_list_value() ? script::Value::List(std::move(items))
                                    : script::Value::Tuple(std::move(items));
    }
    case proto::Value::kDictValue: {
      script::Value dict = script::Value::NewDict();
      for (const proto::DictEntry& entry : value.dict_value().entry()) {
        script::Value key = FromProto(entry.key());
        std::string hash;
        // Unhashable keys can only come from a malformed message.
        if (!script::HashKey(key, &hash)) key = script::Value::Str(script::Repr(key));
        dict.dict().Set(key, FromProto(entry.value()));
      }
      return dict;
    }
    default:
      return script::Value::None();
  }
}

script::Value RowToDict(const proto::Row& row) {
  script::Value dict = script::Value::NewDict();
  for (int i = 0; i < row.column_size(); i++) {
    dict.dict().Set(script::Value::Str(row.column(i)),
                    i < row.value_size() ? FromProto(row.value(i))
                                         : script::Value::None());
  }
  return dict;
}

bool DictToProto(const script::Value& dict, proto::ValueDict* out,
                 std::string* error_msg) {
  proto::Value encoded;
  if (!ToProto(dict, &encoded, error_msg)) return false;
  if (!encoded.has_dict_value()) {
    *error_msg = "expected a dict";
    return false;
  }
  out->Swap(encoded.mutable_dict_value());
  return true;
}

}  // namespace capability
