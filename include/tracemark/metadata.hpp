#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace tracemark
{

// Opaque key/value description of an item, used to correlate it with storage.
using MetadataValue = std::variant<bool, int64_t, double, std::string>;
using Metadata      = std::map<std::string, MetadataValue>;

// True when every key of `partial` exists in `full` with an equal value.
bool metadata_matches(const Metadata& partial, const Metadata& full);

// Items whose metadata carries is_total == true hold aggregate data.
bool metadata_is_total(const Metadata& metadata);

// Strings are single-quoted with backslash and quote escaped. Doubles always carry
// a '.' or an exponent and read back exactly, so integer 1 and double 1.0 differ.
std::string metadata_value_to_string(const MetadataValue& value);

// Canonical "key=value, ..." form. Keys are sorted, so equal maps give equal strings
// and unequal maps give unequal strings. Used as the storage and load-guard key.
std::string metadata_to_string(const Metadata& metadata);

}   // namespace tracemark
