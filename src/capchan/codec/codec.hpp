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
#pragma once

#include "capchan/codec/capability_context.hpp"
#include "capchan/codec/error.hpp"
#include "capchan_wire.pb.h"
#include <flow/error/error.hpp>
#include <boost/fusion/include/at_c.hpp>
#include <boost/fusion/include/size.hpp>
#include <boost/fusion/include/value_at.hpp>
#include <boost/fusion/include/tag_of.hpp>
#include <boost/fusion/adapted/struct/detail/extension.hpp>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace capchan::codec
{

// Types.

/**
 * Converts values of type `T` to and from the wire value tree (`wire::Value`).  The primary template is not
 * defined for any type; each supported type has a (partial) specialization.  Out of the box:
 *   - `bool`; all integer types (encoded as 64 bits; range-checked on decode); `float`, `double`;
 *     enumerations (via their underlying type);
 *   - `std::string` (arbitrary bytes); `std::vector<uint8_t>` (as a blob);
 *   - `std::vector<T>`, `std::map<K, V>`, `std::pair<A, B>`, `std::tuple<...>`, `std::optional<T>`, recursively;
 *   - structures adapted via `BOOST_FUSION_ADAPT_STRUCT()` (encoded as a record of named fields; the names,
 *     count and order are checked on decode);
 *   - `chan::Sender<U>`, the capability itself (see chan/sender.hpp).
 *
 * To support another type, specialize Codec for it, providing the same 2 `static` functions:
 *
 *   ~~~
 *   static bool encode(const T& value, wire::Value* target, Encode_context* ctx, Error_code* err_code);
 *   static bool decode(const wire::Value& src, T* target, Decode_context* ctx, Error_code* err_code);
 *   ~~~
 *
 * Each returns `true` on success, else sets `*err_code` (never null) and returns `false`; on success `*err_code`
 * is cleared.  Pass `ctx` unchanged to the Codec of every nested value, so that all capabilities in the message
 * share one index sequence.  On decode failure `*target` may have been partially modified.
 *
 * @tparam T
 *         The value type.
 * @tparam Enable
 *         `void`; for `std::enable_if_t` use by partial specializations.
 */
template<typename T, typename Enable>
struct Codec
{
  static_assert(!std::is_same_v<T, T>,
                "There is no capchan::codec::Codec<T> for this T.  Specialize it, or (for a plain struct) adapt "
                "the struct with BOOST_FUSION_ADAPT_STRUCT().");
};

namespace detail
{

// Free functions.

/**
 * Returns a name for the given kind of wire value, for logging.
 *
 * @param kind
 *        The kind.
 * @return See above.
 */
util::String_view kind_name(wire::Value::KindCase kind);

/**
 * Checks the given value is of the given kind; if not, logs and sets error::Code::S_WRONG_KIND.
 *
 * @param src
 *        Value being decoded.
 * @param expected
 *        The kind the target type requires.
 * @param ctx
 *        Context (used for its logger).
 * @param err_code
 *        Not null.  Set on failure; untouched on success.
 * @return `true` if and only if the kinds match.
 */
bool check_kind(const wire::Value& src, wire::Value::KindCase expected, const Decode_context& ctx,
                Error_code* err_code);

/**
 * Checks the given sequence has the given number of elements; if not, logs and sets error::Code::S_WRONG_ARITY.
 *
 * @param src
 *        Sequence being decoded.
 * @param expected
 *        Element count the target type requires.
 * @param ctx
 *        Context (used for its logger).
 * @param err_code
 *        Not null.  Set on failure; untouched on success.
 * @return `true` if and only if the counts match.
 */
bool check_arity(const wire::Sequence& src, size_t expected, const Decode_context& ctx, Error_code* err_code);

/**
 * Checks the given record field has the given name; if not, logs and sets error::Code::S_RECORD_FIELD_MISMATCH.
 *
 * @param src
 *        Field being decoded.
 * @param expected_name
 *        Name of the corresponding member of the target structure.
 * @param ctx
 *        Context (used for its logger).
 * @param err_code
 *        Not null.  Set on failure; untouched on success.
 * @return `true` if and only if the names match.
 */
bool check_field_name(const wire::Field& src, util::String_view expected_name, const Decode_context& ctx,
                      Error_code* err_code);

/**
 * Logs and sets error::Code::S_INTEGER_OUT_OF_RANGE.
 *
 * @param src
 *        Value being decoded.
 * @param target_type_name
 *        Description of the target type, for logging.
 * @param ctx
 *        Context (used for its logger).
 * @param err_code
 *        Not null.
 * @return `false`.
 */
bool fail_integer_range(const wire::Value& src, util::String_view target_type_name, const Decode_context& ctx,
                        Error_code* err_code);

/**
 * Logs and sets error::Code::S_FLOAT_OUT_OF_RANGE.
 *
 * @param src
 *        Value being decoded.
 * @param target_type_name
 *        Description of the target type, for logging.
 * @param ctx
 *        Context (used for its logger).
 * @param err_code
 *        Not null.
 * @return `false`.
 */
bool fail_float_range(const wire::Value& src, util::String_view target_type_name, const Decode_context& ctx,
                      Error_code* err_code);

/**
 * Fills in the envelope's capability count from `ctx`; serializes the envelope into `*target_bytes`.
 *
 * @param envelope
 *        Envelope with its `root` already encoded.
 * @param ctx
 *        The context used to encode `root`.
 * @param target_bytes
 *        Receives the bytes.
 * @param err_code
 *        Not null.  Set to success or error::Code::S_SERIALIZE_FAILED.
 * @return `true` on success.
 */
bool serialize_envelope(wire::Envelope* envelope, const Encode_context& ctx, std::string* target_bytes,
                        Error_code* err_code);

/**
 * Parses the bytes into an envelope; checks its capability count against `ctx`.
 *
 * @param bytes
 *        Message bytes.
 * @param ctx
 *        The context holding the capabilities delivered with the message.
 * @param target_envelope
 *        Receives the envelope.
 * @param err_code
 *        Not null.  Set to success or error::Code::S_MALFORMED_MESSAGE or error::Code::S_CAPABILITY_COUNT_MISMATCH.
 * @return `true` on success.
 */
bool parse_envelope(const util::Blob_const& bytes, const Decode_context& ctx, wire::Envelope* target_envelope,
                    Error_code* err_code);

// Constants.

/// Whether `T` is a structure adapted via `BOOST_FUSION_ADAPT_STRUCT()`.
template<typename T>
constexpr bool S_IS_ADAPTED_STRUCT
  = std::is_same_v<typename boost::fusion::traits::tag_of<T>::type, boost::fusion::struct_tag>;

} // namespace detail

/// Codec for `bool`.
template<>
struct Codec<bool>
{
  /**
   * See Codec.
   * @param value
   *        See Codec.
   * @param target
   *        See Codec.
   * @param err_code
   *        See Codec.
   * @return See Codec.
   */
  static bool encode(const bool& value, wire::Value* target, Encode_context*, Error_code* err_code)
  {
    target->set_bool_val(value);
    err_code->clear();
    return true;
  }

  /**
   * See Codec.
   * @param src
   *        See Codec.
   * @param target
   *        See Codec.
   * @param ctx
   *        See Codec.
   * @param err_code
   *        See Codec.
   * @return See Codec.
   */
  static bool decode(const wire::Value& src, bool* target, Decode_context* ctx, Error_code* err_code)
  {
    if (!detail::check_kind(src, wire::Value::kBoolVal, *ctx, err_code))
    {
      return false;
    }
    // else
    *target = src.bool_val();
    err_code->clear();
    return true;
  }
}; // struct Codec<bool>

/**
 * Codec for integer types other than `bool`.  Signed types are encoded as the wire's signed integer; unsigned
 * as unsigned.  Either is accepted on decode, if the value fits the target type.
 *
 * @tparam T
 *         The integer type.
 */
template<typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && (!std::is_same_v<T, bool>)>>
{
  /// See Codec.
  static bool encode(const T& value, wire::Value* target, Encode_context*, Error_code* err_code)
  {
    if constexpr(std::is_signed_v<T>)
    {
      target->set_int_val(static_cast<int64_t>(value));
    }
    else
    {
      target->set_uint_val(static_cast<uint64_t>(value));
    }
    err_code->clear();
    return true;
  }

  /// See Codec.
  static bool decode(const wire::Value& src, T* target, Decode_context* ctx, Error_code* err_code)
  {
    using Limits = std::numeric_limits<T>;

    if (src.kind_case() == wire::Value::kIntVal)
    {
      const int64_t val = src.int_val();
      bool fits;
      if constexpr(std::is_signed_v<T>)
      {
        fits = (val >= static_cast<int64_t>(Limits::min())) && (val <= static_cast<int64_t>(Limits::max()));
      }
      else
      {
        fits = (val >= 0) && (static_cast<uint64_t>(val) <= static_cast<uint64_t>(Limits::max()));
      }
      if (!fits)
      {
        return detail::fail_integer_range(src, std::is_signed_v<T> ? "signed integer" : "unsigned integer",
                                          *ctx, err_code);
      }
      // else
      *target = static_cast<T>(val);
    }
    else if (src.kind_case() == wire::Value::kUintVal)
    {
      const uint64_t val = src.uint_val();
      if (val > static_cast<uint64_t>(Limits::max()))
      {
        return detail::fail_integer_range(src, std::is_signed_v<T> ? "signed integer" : "unsigned integer",
                                          *ctx, err_code);
      }
      // else
      *target = static_cast<T>(val);
    }
    else
    {
      // Report it against the kind we would have encoded.
      return detail::check_kind(src, std::is_signed_v<T> ? wire::Value::kIntVal : wire::Value::kUintVal,
                                *ctx, err_code);
    }

    err_code->clear();
    return true;
  } // decode()
}; // struct Codec<T: integral>

/**
 * Codec for floating-point types (as the wire's `double`).
 *
 * @tparam T
 *         `float`, `double` or `long double`.
 */
template<typename T>
struct Codec<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
  /// See Codec.
  static bool encode(const T& value, wire::Value* target, Encode_context*, Error_code* err_code)
  {
    target->set_double_val(static_cast<double>(value));
    err_code->clear();
    return true;
  }

  /// See Codec.
  static bool decode(const wire::Value& src, T* target, Decode_context* ctx, Error_code* err_code)
  {
    if (!detail::check_kind(src, wire::Value::kDoubleVal, *ctx, err_code))
    {
      return false;
    }
    // else
    const double val = src.double_val();
    // NaN and infinities carry over as-is; only a finite value too large for T is an error.
    if (std::isfinite(val)
        && ((val > static_cast<double>(std::numeric_limits<T>::max()))
            || (val < static_cast<double>(std::numeric_limits<T>::lowest()))))
    {
      return detail::fail_float_range(src, "floating-point", *ctx, err_code);
    }
    // else
    *target = static_cast<T>(val);
    err_code->clear();
    return true;
  }
}; // struct Codec<T: floating-point>

/**
 * Codec for enumerations: via the underlying integer type.  Any value of the underlying type is accepted
 * on decode, listed enumerator or not.
 *
 * @tparam T
 *         The `enum` or `enum class`.
 */
template<typename T>
struct Codec<T, std::enable_if_t<std::is_enum_v<T>>>
{
  /// Short-hand for the underlying type.
  using Underlying = std::underlying_type_t<T>;

  /// See Codec.
  static bool encode(const T& value, wire::Value* target, Encode_context* ctx, Error_code* err_code)
  {
    return Codec<Underlying>::encode(static_cast<Underlying>(value), target, ctx, err_code);
  }

  /// See Codec.
  static bool decode(const wire::Value& src, T* target, Decode_context* ctx, Error_code* err_code)
  {
    Underlying val;
    if (!Codec<Underlying>::decode(src, &val, ctx, err_code))
    {
      return false;
    }
    // else
    *target = static_cast<T>(val);
    return true;
  }
}; // struct Codec<T: enum>

/// Codec for `std::string`: any bytes.
template<>
struct Codec<std::string>
{
  /// See Codec.
  static bool encode(const std::string& value, wire::Value* target, Encode_context*, Error_code* err_code)
  {
    target->set_text_val(value);
    err_code->clear();
    return true;
  }

  /// See Codec.
  static bool decode(const wire::Value& src, std::string* target, Decode_context* ctx, Error_code* err_code)
  {
    if (!detail::check_kind(src, wire::Value::kTextVal, *ctx, err_code))
    {
      return false;
    }
    // else
    *target = src.text_val();
    err_code->clear();
    return true;
  }
}; // struct Codec<std::string>

/**
 * Codec for a byte vector: as one blob rather than a sequence of integers.
 *
 * @tparam Allocator
 *         Allocator.
 */
template<typename Allocator>
struct Codec<std::vector<uint8_t, Allocator>>
{
  /// See Codec.
  static bool encode(const std::vector<uint8_t, Allocator>& value, wire::Value* target, Encode_context*,
                     Error_code* err_code)
  {
    target->set_bytes_val(std::string(value.begin(), value.end()));
    err_code->clear();
    return true;
  }

  /// See Codec.
  static bool decode(const wire::Value& src, std::vector<uint8_t, Allocator>* target, Decode_context* ctx,
                     Error_code* err_code)
  {
    if (!detail::check_kind(src, wire::Value::kBytesVal, *ctx, err_code))
    {
      return false;
    }
    // else
    const auto& bytes = src.bytes_val();
    target->assign(bytes.begin(), bytes.end());
    err_code->clear();
    return true;
  }
}; // struct Codec<std::vector<uint8_t>>

/**
 * Codec for `std::vector`: a sequence of the elements.
 *
 * @tparam T
 *         Element type; must be default-constructible and have a Codec.
 * @tparam Allocator
 *         Allocator.
 */
template<typename T, typename Allocator>
struct Codec<std::vector<T, Allocator>>
{
  /// See Codec.
  static bool encode(const std::vector<T, Allocator>& value, wire::Value* target, Encode_context* ctx,
                     Error_code* err_code)
  {
    auto seq = target->mutable_seq_val();
    seq->mutable_elements()->Reserve(static_cast<int>(value.size()));
    for (const auto& elem : value)
    {
      if (!Codec<T>::encode(elem, seq->add_elements(), ctx, err_code))
      {
        return false;
      }
    }
    err_code->clear();
    return true;
  }

  /// See Codec.
  static bool decode(const wire::Value& src, std::vector<T, Allocator>* target, Decode_context* ctx,
                     Error_code* err_code)
  {
    if (!detail::check_kind(src, wire::Value::kSeqVal, *ctx, err_code))
    {
      return false;
    }
    // else

    const auto& elements = src.seq_val().elements();
    target->clear();
    target->reserve(elements.size());
    for (const auto& elem_src : elements)
    {
      T elem;
      if (!Codec<T>::decode(elem_src, &elem, ctx, err_code))
      {
        return false;
      }
      target->push_back(std::move(elem));
    }
    err_code->clear();
    return true;
  } // decode()
}; // struct Codec<std::vector>

/**
 * Codec for `std::pair`: a sequence of 2.
 *
 * @tparam A
 *         First type.
 * @tparam B
 *         Second type.
 */
template<typename A, typename B>
struct Codec<std::pair<A, B>>
{
  /// See Codec.
  static bool encode(const std::pair<A, B>& value, wire::Value* target, Encode_context* ctx, Error_code* err_code)
  {
    auto seq = target->mutable_seq_val();
    return Codec<A>::encode(value.first, seq->add_elements(), ctx, err_code)
           && Codec<B>::encode(value.second, seq->add_elements(), ctx, err_code);
  }

  /// See Codec.
  static bool decode(const wire::Value& src, std::pair<A, B>* target, Decode_context* ctx, Error_code* err_code)
  {
    if (!(detail::check_kind(src, wire::Value::kSeqVal, *ctx, err_code)
          && detail::check_arity(src.seq_val(), 2, *ctx, err_code)))
    {
      return false;
    }
    // else
    const auto& elements = src.seq_val().elements();
    return Codec<A>::decode(elements.Get(0), &target->first, ctx, err_code)
           && Codec<B>::decode(elements.Get(1), &target->second, ctx, err_code);
  }
}; // struct Codec<std::pair>

/**
 * Codec for `std::map`: a sequence of entries, each a sequence of 2 (key, value), in key order.
 *
 * @tparam K
 *         Key type; must be default-constructible and have a Codec.
 * @tparam V
 *         Mapped type; ditto.
 * @tparam Compare
 *         Comparator.
 * @tparam Allocator
 *         Allocator.
 */
template<typename K, typename V, typename Compare, typename Allocator>
struct Codec<std::map<K, V, Compare, Allocator>>
{
  /// Short-hand for the map type.
  using Map = std::map<K, V, Compare, Allocator>;

  /// See Codec.
  static bool encode(const Map& value, wire::Value* target, Encode_context* ctx, Error_code* err_code)
  {
    auto seq = target->mutable_seq_val();
    for (const auto& entry : value)
    {
      auto entry_seq = seq->add_elements()->mutable_seq_val();
      if (!(Codec<K>::encode(entry.first, entry_seq->add_elements(), ctx, err_code)
            && Codec<V>::encode(entry.second, entry_seq->add_elements(), ctx, err_code)))
      {
        return false;
      }
    }
    err_code->clear();
    return true;
  }

  /// See Codec.
  static bool decode(const wire::Value& src, Map* target, Decode_context* ctx, Error_code* err_code)
  {
    if (!detail::check_kind(src, wire::Value::kSeqVal, *ctx, err_code))
    {
      return false;
    }
    // else

    target->clear();
    for (const auto& entry_src : src.seq_val().elements())
    {
      if (!(detail::check_kind(entry_src, wire::Value::kSeqVal, *ctx, err_code)
            && detail::check_arity(entry_src.seq_val(), 2, *ctx, err_code)))
      {
        return false;
      }
      // else

      K key;
      V mapped;
      const auto& kv = entry_src.seq_val().elements();
      if (!(Codec<K>::decode(kv.Get(0), &key, ctx, err_code) && Codec<V>::decode(kv.Get(1), &mapped, ctx, err_code)))
      {
        return false;
      }
      // else
      (*target)[std::move(key)] = std::move(mapped); // Duplicate keys: last one wins.
    }
    err_code->clear();
    return true;
  } // decode()
}; // struct Codec<std::map>

/**
 * Codec for `std::tuple`: a sequence of the elements.
 *
 * @tparam Ts
 *         Element types.
 */
template<typename... Ts>
struct Codec<std::tuple<Ts...>>
{
  /// Short-hand for the tuple type.
  using Tuple = std::tuple<Ts...>;

  /// See Codec.
  static bool encode(const Tuple& value, wire::Value* target, Encode_context* ctx, Error_code* err_code)
  {
    auto seq = target->mutable_seq_val();
    err_code->clear(); // In case of the empty tuple.
    return encode_elements(value, seq, ctx, err_code, std::index_sequence_for<Ts...>());
  }

  /// See Codec.
  static bool decode(const wire::Value& src, Tuple* target, Decode_context* ctx, Error_code* err_code)
  {
    if (!(detail::check_kind(src, wire::Value::kSeqVal, *ctx, err_code)
          && detail::check_arity(src.seq_val(), sizeof...(Ts), *ctx, err_code)))
    {
      return false;
    }
    // else
    err_code->clear();
    return decode_elements(src.seq_val(), target, ctx, err_code, std::index_sequence_for<Ts...>());
  }

private:
  /**
   * Helper of encode(): encodes elements in order, stopping at first failure.
   *
   * @tparam IDX
   *         0, 1, ....
   * @param value
   *         See encode().
   * @param seq
   *         Target sequence.
   * @param ctx
   *         See encode().
   * @param err_code
   *         See encode().
   * @return See encode().
   */
  template<size_t... IDX>
  static bool encode_elements(const Tuple& value, wire::Sequence* seq, Encode_context* ctx, Error_code* err_code,
                              std::index_sequence<IDX...>)
  {
    bool ok = true;
    ((ok = ok && Codec<std::tuple_element_t<IDX, Tuple>>::encode(std::get<IDX>(value), seq->add_elements(),
                                                                   ctx, err_code)), ...);
    return ok;
  }

  /**
   * Helper of decode(): decodes elements in order, stopping at first failure.
   *
   * @tparam IDX
   *         0, 1, ....
   * @param seq
   *         Source sequence (of the right arity).
   * @param target
   *         See decode().
   * @param ctx
   *         See decode().
   * @param err_code
   *         See decode().
   * @return See decode().
   */
  template<size_t... IDX>
  static bool decode_elements(const wire::Sequence& seq, Tuple* target, Decode_context* ctx, Error_code* err_code,
                              std::index_sequence<IDX...>)
  {
    bool ok = true;
    ((ok = ok && Codec<std::tuple_element_t<IDX, Tuple>>::decode(seq.elements(IDX), &std::get<IDX>(*target),
                                                                   ctx, err_code)), ...);
    return ok;
  }
}; // struct Codec<std::tuple>

/**
 * Codec for `std::optional`: nothing, or a sequence of the 1 value (so that `optional<optional<T>>` round-trips).
 *
 * @tparam T
 *         Value type; must be default-constructible and have a Codec.
 */
template<typename T>
struct Codec<std::optional<T>>
{
  /// See Codec.
  static bool encode(const std::optional<T>& value, wire::Value* target, Encode_context* ctx, Error_code* err_code)
  {
    if (!value)
    {
      target->mutable_nothing_val();
      err_code->clear();
      return true;
    }
    // else
    return Codec<T>::encode(*value, target->mutable_seq_val()->add_elements(), ctx, err_code);
  }

  /// See Codec.
  static bool decode(const wire::Value& src, std::optional<T>* target, Decode_context* ctx, Error_code* err_code)
  {
    if (src.kind_case() == wire::Value::kNothingVal)
    {
      target->reset();
      err_code->clear();
      return true;
    }
    // else
    if (!(detail::check_kind(src, wire::Value::kSeqVal, *ctx, err_code)
          && detail::check_arity(src.seq_val(), 1, *ctx, err_code)))
    {
      return false;
    }
    // else
    T val;
    if (!Codec<T>::decode(src.seq_val().elements(0), &val, ctx, err_code))
    {
      return false;
    }
    // else
    target->emplace(std::move(val));
    return true;
  }
}; // struct Codec<std::optional>

/**
 * Codec for structures adapted via `BOOST_FUSION_ADAPT_STRUCT()`: a record of (name, value) fields in member
 * order.  Decoding requires the same field count, names and order.
 *
 * @tparam T
 *         The structure.  Its members must have a Codec each.
 */
template<typename T>
struct Codec<T, std::enable_if_t<std::is_class_v<T> && detail::S_IS_ADAPTED_STRUCT<T>>>
{
  /// Number of members.
  static constexpr size_t S_N_FIELDS = boost::fusion::result_of::size<T>::value;

  /// See Codec.
  static bool encode(const T& value, wire::Value* target, Encode_context* ctx, Error_code* err_code)
  {
    auto rec = target->mutable_record_val();
    err_code->clear(); // In case of 0 members.
    return encode_fields(value, rec, ctx, err_code, std::make_index_sequence<S_N_FIELDS>());
  }

  /// See Codec.
  static bool decode(const wire::Value& src, T* target, Decode_context* ctx, Error_code* err_code)
  {
    if (!detail::check_kind(src, wire::Value::kRecordVal, *ctx, err_code))
    {
      return false;
    }
    // else

    const auto& rec = src.record_val();
    if (static_cast<size_t>(rec.fields_size()) != S_N_FIELDS)
    {
      FLOW_LOG_SET_CONTEXT(ctx->get_logger(), Log_component::S_CODEC);
      FLOW_LOG_WARNING("Decoding a record: expected [" << S_N_FIELDS << "] fields; "
                       "got [" << rec.fields_size() << "].");
      *err_code = error::Code::S_RECORD_FIELD_MISMATCH;
      return false;
    }
    // else

    err_code->clear(); // In case of 0 members.
    return decode_fields(rec, target, ctx, err_code, std::make_index_sequence<S_N_FIELDS>());
  }

private:
  /**
   * Name of member #IDX.
   *
   * @tparam IDX
   *         Member index.
   * @return See above.
   */
  template<size_t IDX>
  static util::String_view field_name()
  {
    return boost::fusion::extension::struct_member_name<T, IDX>::call();
  }

  /**
   * Helper of encode(): encodes members in order, stopping at first failure.
   *
   * @tparam IDX
   *         0, 1, ....
   * @param value
   *         See encode().
   * @param rec
   *         Target record.
   * @param ctx
   *         See encode().
   * @param err_code
   *         See encode().
   * @return See encode().
   */
  template<size_t... IDX>
  static bool encode_fields(const T& value, wire::Record* rec, Encode_context* ctx, Error_code* err_code,
                            std::index_sequence<IDX...>)
  {
    bool ok = true;
    ((ok = ok && encode_field<IDX>(value, rec->add_fields(), ctx, err_code)), ...);
    return ok;
  }

  /**
   * Helper of encode_fields(): encodes member #IDX.
   *
   * @tparam IDX
   *         Member index.
   * @param value
   *         See encode().
   * @param field
   *         Target field.
   * @param ctx
   *         See encode().
   * @param err_code
   *         See encode().
   * @return See encode().
   */
  template<size_t IDX>
  static bool encode_field(const T& value, wire::Field* field, Encode_context* ctx, Error_code* err_code)
  {
    using Field_type = typename boost::fusion::result_of::value_at_c<T, IDX>::type;

    const auto name = field_name<IDX>();
    field->set_name(name.data(), name.size());
    return Codec<Field_type>::encode(boost::fusion::at_c<IDX>(value), field->mutable_value(), ctx, err_code);
  }

  /**
   * Helper of decode(): decodes members in order, stopping at first failure.
   *
   * @tparam IDX
   *         0, 1, ....
   * @param rec
   *         Source record (of the right field count).
   * @param target
   *         See decode().
   * @param ctx
   *         See decode().
   * @param err_code
   *         See decode().
   * @return See decode().
   */
  template<size_t... IDX>
  static bool decode_fields(const wire::Record& rec, T* target, Decode_context* ctx, Error_code* err_code,
                            std::index_sequence<IDX...>)
  {
    bool ok = true;
    ((ok = ok && decode_field<IDX>(rec.fields(IDX), target, ctx, err_code)), ...);
    return ok;
  }

  /**
   * Helper of decode_fields(): decodes member #IDX.
   *
   * @tparam IDX
   *         Member index.
   * @param field
   *         Source field.
   * @param target
   *         See decode().
   * @param ctx
   *         See decode().
   * @param err_code
   *         See decode().
   * @return See decode().
   */
  template<size_t IDX>
  static bool decode_field(const wire::Field& field, T* target, Decode_context* ctx, Error_code* err_code)
  {
    using Field_type = typename boost::fusion::result_of::value_at_c<T, IDX>::type;

    return detail::check_field_name(field, field_name<IDX>(), *ctx, err_code)
           && Codec<Field_type>::decode(field.value(), &boost::fusion::at_c<IDX>(*target), ctx, err_code);
  }
}; // struct Codec<T: adapted struct>

// Free functions.

/**
 * Encodes a value into message bytes, collecting its capabilities into `*ctx`.  The bytes and
 * `ctx->capabilities()` together are what must be sent.
 *
 * @tparam T
 *         The value type (has a Codec).
 * @param value
 *        The value.
 * @param ctx
 *        A fresh (empty) context.
 * @param target_bytes
 *        Receives the bytes.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        any error::Code that an encode can produce (notably error::Code::S_NULL_CAPABILITY).
 * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
 */
template<typename T>
bool encode(const T& value, Encode_context* ctx, std::string* target_bytes, Error_code* err_code = 0)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return encode(value, ctx, target_bytes, actual_err_code); },
         &ok, err_code, "codec::encode()"))
  {
    return ok;
  }
  // else

  assert(ctx && target_bytes);
  assert((ctx->size() == 0) && "Use a fresh Encode_context for each message.");

  wire::Envelope envelope;
  if (!Codec<T>::encode(value, envelope.mutable_root(), ctx, err_code))
  {
    FLOW_LOG_SET_CONTEXT(ctx->get_logger(), Log_component::S_CODEC);
    FLOW_LOG_WARNING("Encode_context [" << *ctx << "]: Could not encode value: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else
  return detail::serialize_envelope(&envelope, *ctx, target_bytes, err_code);
}

/**
 * Decodes message bytes into a value, resolving its capabilities against `*ctx`.
 *
 * @tparam T
 *         The value type (has a Codec).
 * @param bytes
 *        The message bytes.
 * @param ctx
 *        Context holding the capabilities delivered with the bytes.
 * @param target_value
 *        Receives the value.  On failure it may have been partially modified.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        any error::Code that a decode can produce; errors from Decode_context::clone_sender_at().
 * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
 */
template<typename T>
bool decode(const util::Blob_const& bytes, Decode_context* ctx, T* target_value, Error_code* err_code = 0)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return decode(bytes, ctx, target_value, actual_err_code); },
         &ok, err_code, "codec::decode()"))
  {
    return ok;
  }
  // else

  assert(ctx && target_value);

  wire::Envelope envelope;
  if (!detail::parse_envelope(bytes, *ctx, &envelope, err_code))
  {
    return false; // It logged.
  }
  // else

  if (!Codec<T>::decode(envelope.root(), target_value, ctx, err_code))
  {
    FLOW_LOG_SET_CONTEXT(ctx->get_logger(), Log_component::S_CODEC);
    FLOW_LOG_WARNING("Decode_context [" << *ctx << "]: Could not decode value: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else
  return true;
}

} // namespace capchan::codec
