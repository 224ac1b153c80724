#pragma once
#include <ballot/common/critical.hpp>
#include <ballot/schema/encoding/encoder.hpp>
#include <ballot/schema/encoding/scale/delegation_edge.hpp>
#include <ballot/schema/encoding/scale/event_attribute.hpp>
#include <ballot/schema/encoding/scale/governance_event.hpp>
#include <ballot/schema/encoding/scale/power_checkpoint.hpp>
#include <ballot/schema/encoding/scale/proposal_state.hpp>
#include <ballot/schema/encoding/scale/vote_receipt.hpp>
#include <ballot/schema/encoding/scale/vote_tally.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace ballot::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  ballot::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, ballot::schema::bytes_t& out);

  template <typename T>
  T decode(const ballot::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ballot::schema::bytes_view_t& bytes);
};

template <typename T>
ballot::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    ballot::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        ballot::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const ballot::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    ballot::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const ballot::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace ballot::schema::encoding
