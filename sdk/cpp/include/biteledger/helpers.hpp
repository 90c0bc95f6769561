#pragma once

#include <cstdint>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "biteledger/types.pb.h"
#include "errors.hpp"

namespace biteledger {

/**
 * Helper functions for working with biteledger types.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Extract the type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

/**
 * Check if a type URL matches the given fully qualified type name.
 * @param type_url Full type URL (e.g., "type.googleapis.com/contracts.Mint")
 * @param type_name Fully qualified type name (e.g., "contracts.Mint")
 */
inline bool type_url_matches(const std::string& type_url, const std::string& type_name) {
    return type_url == std::string(TYPE_URL_PREFIX) + type_name;
}

/**
 * Check if an Any holds a message of type T.
 */
template<typename T>
bool is_a(const google::protobuf::Any& any) {
    return type_url_matches(any.type_url(), T::descriptor()->full_name());
}

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

/**
 * Unpack an Any into T.
 * @throws InvalidArgumentError if the Any holds another type or is corrupt
 */
template<typename T>
T unpack(const google::protobuf::Any& any) {
    T message;
    if (!is_a<T>(any) || !any.UnpackTo(&message)) {
        throw InvalidArgumentError("Expected " + T::descriptor()->full_name() +
                                   ", got " + any.type_url());
    }
    return message;
}

/**
 * Get the current wall-clock time as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Build a Timestamp from whole seconds since the epoch.
 */
google::protobuf::Timestamp from_seconds(int64_t seconds);

/**
 * Storage key for a numbered record: prefix + "/" + zero-padded id, so
 * that lexicographic key order equals numeric id order.
 */
std::string record_key(const std::string& prefix, uint64_t id);

/**
 * Storage key for an address-keyed record: prefix + "/" + address.
 */
inline std::string address_key(const std::string& prefix, const std::string& address) {
    return prefix + "/" + address;
}

} // namespace helpers
} // namespace biteledger
