/* capchan: Typed capability channels
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "capchan/codec/codec.hpp"

namespace capchan::codec::detail
{

// Free function implementations.

util::String_view kind_name(wire::Value::KindCase kind)
{
  switch (kind)
  {
  case wire::Value::kBoolVal:
    return "bool";
  case wire::Value::kIntVal:
    return "signed integer";
  case wire::Value::kUintVal:
    return "unsigned integer";
  case wire::Value::kDoubleVal:
    return "floating-point";
  case wire::Value::kTextVal:
    return "text";
  case wire::Value::kBytesVal:
    return "bytes";
  case wire::Value::kSeqVal:
    return "sequence";
  case wire::Value::kRecordVal:
    return "record";
  case wire::Value::kNothingVal:
    return "nothing";
  case wire::Value::kCapabilityIndex:
    return "capability";
  case wire::Value::KIND_NOT_SET:
    return "unset";
  }
  return "unknown"; // Peer with a newer schema could send a kind we do not know.
}

bool check_kind(const wire::Value& src, wire::Value::KindCase expected, const Decode_context& ctx,
                Error_code* err_code)
{
  if (src.kind_case() == expected)
  {
    return true;
  }
  // else

  FLOW_LOG_SET_CONTEXT(ctx.get_logger(), Log_component::S_CODEC);
  FLOW_LOG_WARNING("Decode_context [" << ctx << "]: Expected wire value of kind [" << kind_name(expected) << "]; "
                   "got [" << kind_name(src.kind_case()) << "].");
  *err_code = error::Code::S_WRONG_KIND;
  return false;
}

bool check_arity(const wire::Sequence& src, size_t expected, const Decode_context& ctx, Error_code* err_code)
{
  if (static_cast<size_t>(src.elements_size()) == expected)
  {
    return true;
  }
  // else

  FLOW_LOG_SET_CONTEXT(ctx.get_logger(), Log_component::S_CODEC);
  FLOW_LOG_WARNING("Decode_context [" << ctx << "]: Expected sequence of [" << expected << "] elements; "
                   "got [" << src.elements_size() << "].");
  *err_code = error::Code::S_WRONG_ARITY;
  return false;
}

bool check_field_name(const wire::Field& src, util::String_view expected_name, const Decode_context& ctx,
                      Error_code* err_code)
{
  if (util::String_view(src.name()) == expected_name)
  {
    return true;
  }
  // else

  FLOW_LOG_SET_CONTEXT(ctx.get_logger(), Log_component::S_CODEC);
  FLOW_LOG_WARNING("Decode_context [" << ctx << "]: Expected record field [" << expected_name << "]; "
                   "got [" << src.name() << "].");
  *err_code = error::Code::S_RECORD_FIELD_MISMATCH;
  return false;
}

bool fail_integer_range(const wire::Value& src, util::String_view target_type_name, const Decode_context& ctx,
                        Error_code* err_code)
{
  FLOW_LOG_SET_CONTEXT(ctx.get_logger(), Log_component::S_CODEC);
  if (src.kind_case() == wire::Value::kIntVal)
  {
    FLOW_LOG_WARNING("Decode_context [" << ctx << "]: Integer [" << src.int_val() << "] does not fit the "
                     "target " << target_type_name << " type.");
  }
  else
  {
    FLOW_LOG_WARNING("Decode_context [" << ctx << "]: Integer [" << src.uint_val() << "] does not fit the "
                     "target " << target_type_name << " type.");
  }
  *err_code = error::Code::S_INTEGER_OUT_OF_RANGE;
  return false;
}

bool fail_float_range(const wire::Value& src, util::String_view target_type_name, const Decode_context& ctx,
                      Error_code* err_code)
{
  FLOW_LOG_SET_CONTEXT(ctx.get_logger(), Log_component::S_CODEC);
  FLOW_LOG_WARNING("Decode_context [" << ctx << "]: Floating-point value [" << src.double_val() << "] does not "
                   "fit the target " << target_type_name << " type.");
  *err_code = error::Code::S_FLOAT_OUT_OF_RANGE;
  return false;
}

bool serialize_envelope(wire::Envelope* envelope, const Encode_context& ctx, std::string* target_bytes,
                        Error_code* err_code)
{
  FLOW_LOG_SET_CONTEXT(ctx.get_logger(), Log_component::S_CODEC);

  envelope->set_n_capabilities(static_cast<uint32_t>(ctx.size()));
  if (!envelope->SerializeToString(target_bytes))
  {
    FLOW_LOG_WARNING("Encode_context [" << ctx << "]: Could not serialize envelope of "
                     "[" << envelope->ByteSizeLong() << "] bytes.");
    *err_code = error::Code::S_SERIALIZE_FAILED;
    return false;
  }
  // else

  FLOW_LOG_TRACE("Encode_context [" << ctx << "]: Encoded envelope: [" << target_bytes->size() << "] bytes.");
  FLOW_LOG_DATA("Encode_context [" << ctx << "]: Envelope contents: [" << envelope->ShortDebugString() << "].");
  err_code->clear();
  return true;
}

bool parse_envelope(const util::Blob_const& bytes, const Decode_context& ctx, wire::Envelope* target_envelope,
                    Error_code* err_code)
{
  FLOW_LOG_SET_CONTEXT(ctx.get_logger(), Log_component::S_CODEC);

  if ((bytes.size() > size_t(std::numeric_limits<int>::max()))
      || (!target_envelope->ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))))
  {
    FLOW_LOG_WARNING("Decode_context [" << ctx << "]: Could not parse [" << bytes.size() << "] bytes as an "
                     "envelope.");
    *err_code = error::Code::S_MALFORMED_MESSAGE;
    return false;
  }
  // else

  FLOW_LOG_DATA("Decode_context [" << ctx << "]: Envelope contents: "
                "[" << target_envelope->ShortDebugString() << "].");

  if (target_envelope->n_capabilities() != ctx.size())
  {
    FLOW_LOG_WARNING("Decode_context [" << ctx << "]: Envelope declares [" << target_envelope->n_capabilities() << "] "
                     "capabilities; [" << ctx.size() << "] were delivered with it.");
    *err_code = error::Code::S_CAPABILITY_COUNT_MISMATCH;
    return false;
  }
  // else

  err_code->clear();
  return true;
}

} // namespace capchan::codec::detail
