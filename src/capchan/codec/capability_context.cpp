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
#include "capchan/codec/capability_context.hpp"
#include "capchan/codec/error.hpp"

namespace capchan::codec
{

// Encode_context implementations.

Encode_context::Encode_context(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_CODEC)
{
  // Nothing else.
}

size_t Encode_context::add_capability(util::Native_handle hndl)
{
  assert((!hndl.null()) && "Codecs must check for null senders before adding them.");

  m_hndls.push_back(hndl);
  FLOW_LOG_TRACE("Encode_context [" << *this << "]: Capability [" << hndl << "] => "
                 "index [" << (m_hndls.size() - 1) << "].");
  return m_hndls.size() - 1;
}

const transport::Native_handle_list& Encode_context::capabilities() const
{
  return m_hndls;
}

size_t Encode_context::size() const
{
  return m_hndls.size();
}

std::ostream& operator<<(std::ostream& os, const Encode_context& val)
{
  return os << '@' << static_cast<const void*>(&val) << " n_caps[" << val.size() << ']';
}

// Decode_context implementations.

Decode_context::Decode_context(flow::log::Logger* logger_ptr, transport::Raw_sender_list&& delivered_snds) :
  flow::log::Log_context(logger_ptr, Log_component::S_CODEC),
  m_snds(std::move(delivered_snds)),
  m_n_resolved(0)
{
  delivered_snds.clear(); // Moved-from vector is valid-but-unspecified; make it definitely empty.
}

Decode_context::~Decode_context()
{
  FLOW_LOG_TRACE("Decode_context [" << *this << "]: Closing the delivered capabilities; "
                 "[" << m_n_resolved << "] clone(s) were made.");
  // m_snds destructor closes each.
}

bool Decode_context::clone_sender_at(size_t idx, transport::Raw_sender* target_snd, Error_code* err_code)
{
  assert(err_code && target_snd);

  if (idx >= m_snds.size())
  {
    FLOW_LOG_WARNING("Decode_context [" << *this << "]: Message refers to capability index [" << idx << "], but "
                     "only [" << m_snds.size() << "] capabilities were delivered with it.");
    *err_code = error::Code::S_CAPABILITY_INDEX_OUT_OF_RANGE;
    return false;
  }
  // else

  if (!m_snds[idx].clone(target_snd, err_code))
  {
    return false; // It logged.
  }
  // else

  ++m_n_resolved;
  FLOW_LOG_TRACE("Decode_context [" << *this << "]: Capability index [" << idx << "] => "
                 "[" << *target_snd << "].");
  return true;
}

size_t Decode_context::size() const
{
  return m_snds.size();
}

std::ostream& operator<<(std::ostream& os, const Decode_context& val)
{
  return os << '@' << static_cast<const void*>(&val) << " n_caps[" << val.size() << ']';
}

} // namespace capchan::codec
