// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <nlohmann/json.hpp>

#include "storage/error.hpp"
#include "utils/uuid.hpp"

namespace trellis::storage {

/// Per identifier type services needed by the datastores. Every specialization
/// provides:
///
///   * `Encode(id, out)` appends a byte representation of `id` to `out`. The
///     representation is self delimiting and its byte order matches
///     `operator<` of the identifier, so ordered key-value engines iterate
///     identifiers in the same order as the in-memory maps.
///   * `Decode(in)` consumes one encoded identifier from the front of `in`.
///   * `Next(id)` returns the smallest identifier greater than `id`.
///   * `ToJson(id)` / `FromJson(json)` convert without loss of precision.
///     `FromJson` throws `SerializationException` on malformed input.
template <typename T>
struct IdTraits;

template <typename T>
concept Identifier = std::totally_ordered<T> && std::copyable<T> &&
                     requires(const T &id, std::string *out, std::string_view *in, const nlohmann::json &json) {
                       { IdTraits<T>::Encode(id, out) } -> std::same_as<void>;
                       { IdTraits<T>::Decode(in) } -> std::same_as<std::optional<T>>;
                       { IdTraits<T>::Next(id) } -> std::same_as<ValidationResult<T>>;
                       { IdTraits<T>::ToJson(id) } -> std::same_as<nlohmann::json>;
                       { IdTraits<T>::FromJson(json) } -> std::same_as<T>;
                     };

/// Numeric identifiers, encoded big-endian.
template <>
struct IdTraits<uint64_t> {
  static constexpr std::string_view kName = "uint";

  static void Encode(uint64_t id, std::string *out) {
    for (int shift = 56; shift >= 0; shift -= 8) {
      out->push_back(static_cast<char>((id >> shift) & 0xFF));
    }
  }

  static std::optional<uint64_t> Decode(std::string_view *in) {
    if (in->size() < sizeof(uint64_t)) return std::nullopt;
    uint64_t id = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
      id = (id << 8) | static_cast<uint8_t>((*in)[i]);
    }
    in->remove_prefix(sizeof(uint64_t));
    return id;
  }

  static ValidationResult<uint64_t> Next(uint64_t id) {
    if (id == std::numeric_limits<uint64_t>::max()) return std::unexpected{ValidationError::CannotIncrementUuid};
    return id + 1;
  }

  static nlohmann::json ToJson(uint64_t id) { return id; }

  static uint64_t FromJson(const nlohmann::json &json) {
    if (!json.is_number_unsigned()) throw SerializationException("Expected an unsigned integer identifier");
    return json.get<uint64_t>();
  }
};

/// Textual identifiers. Zero bytes are escaped as 0x00 0xFF and the value is
/// terminated with 0x00 0x01, which keeps the encoding prefix free and order
/// preserving.
template <>
struct IdTraits<std::string> {
  static constexpr std::string_view kName = "string";

  static void Encode(const std::string &id, std::string *out) {
    for (char c : id) {
      out->push_back(c);
      if (c == '\0') out->push_back('\xFF');
    }
    out->push_back('\0');
    out->push_back('\x01');
  }

  static std::optional<std::string> Decode(std::string_view *in) {
    std::string id;
    for (size_t i = 0; i < in->size(); ++i) {
      auto c = (*in)[i];
      if (c != '\0') {
        id.push_back(c);
        continue;
      }
      if (i + 1 >= in->size()) return std::nullopt;
      auto const marker = (*in)[i + 1];
      if (marker == '\x01') {
        in->remove_prefix(i + 2);
        return id;
      }
      if (marker != '\xFF') return std::nullopt;
      id.push_back('\0');
      ++i;
    }
    return std::nullopt;
  }

  static ValidationResult<std::string> Next(const std::string &id) { return id + '\0'; }

  /// Identifiers are arbitrary bytes and JSON strings must be UTF-8, so the
  /// JSON form is the padded base64 of the identifier.
  static nlohmann::json ToJson(const std::string &id) {
    using Encoder = boost::archive::iterators::base64_from_binary<
        boost::archive::iterators::transform_width<std::string::const_iterator, 6, 8>>;
    std::string encoded(Encoder(id.begin()), Encoder(id.end()));
    encoded.append((3 - id.size() % 3) % 3, '=');
    return encoded;
  }

  static std::string FromJson(const nlohmann::json &json) {
    if (!json.is_string()) throw SerializationException("Expected a string identifier");
    auto encoded = json.get<std::string>();
    if (encoded.size() % 4 != 0) throw SerializationException("Malformed base64 string identifier");
    auto const last = encoded.find_last_not_of('=');
    auto const padding = last == std::string::npos ? encoded.size() : encoded.size() - last - 1;
    if (padding > 2 || encoded.find('=') < encoded.size() - padding) {
      throw SerializationException("Malformed base64 string identifier");
    }
    std::fill(encoded.end() - static_cast<std::ptrdiff_t>(padding), encoded.end(), 'A');

    using Decoder = boost::archive::iterators::transform_width<
        boost::archive::iterators::binary_from_base64<std::string::const_iterator>, 8, 6>;
    try {
      std::string id(Decoder(encoded.cbegin()), Decoder(encoded.cend()));
      id.erase(id.end() - static_cast<std::ptrdiff_t>(padding), id.end());
      return id;
    } catch (const boost::archive::iterators::dataflow_exception &e) {
      throw SerializationException("Malformed base64 string identifier: {}", e.what());
    }
  }
};

/// 128-bit random identifiers, encoded as their raw bytes.
template <>
struct IdTraits<utils::UUID> {
  static constexpr std::string_view kName = "uuid";

  static void Encode(const utils::UUID &id, std::string *out) {
    auto const bytes = static_cast<utils::UUID::Bytes>(id);
    out->append(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  }

  static std::optional<utils::UUID> Decode(std::string_view *in) {
    auto bytes = utils::UUID::Bytes{};
    if (in->size() < bytes.size()) return std::nullopt;
    for (size_t i = 0; i < bytes.size(); ++i) {
      bytes[i] = static_cast<unsigned char>((*in)[i]);
    }
    in->remove_prefix(bytes.size());
    return utils::UUID{bytes};
  }

  /// Treats the identifier as a big-endian 128-bit integer and adds one.
  static ValidationResult<utils::UUID> Next(const utils::UUID &id) {
    auto bytes = static_cast<utils::UUID::Bytes>(id);
    for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
      if (*it == 0xFF) {
        *it = 0;
        continue;
      }
      ++*it;
      return utils::UUID{bytes};
    }
    return std::unexpected{ValidationError::CannotIncrementUuid};
  }

  static nlohmann::json ToJson(const utils::UUID &id) { return static_cast<std::string>(id); }

  static utils::UUID FromJson(const nlohmann::json &json) {
    if (!json.is_string()) throw SerializationException("Expected a UUID string identifier");
    auto maybe_uuid = utils::UUID::Parse(json.get<std::string>());
    if (!maybe_uuid) throw SerializationException("Malformed UUID identifier");
    return *maybe_uuid;
  }
};

}  // namespace trellis::storage
