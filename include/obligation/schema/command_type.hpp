#pragma once

#include <obligation/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: command type.
// Intent of a transaction towards the obligation contract. The set is closed;
// a value outside it can still arrive off the wire and is rejected by the
// dispatcher.
namespace obligation::schema {

enum class command_type_t : uint8_t { issue = 0, transfer = 1, settle = 2 };

inline constexpr auto kCommandTypeMappings =
    enum_mappings_t<command_type_t, 3>{
        std::pair<std::string_view, command_type_t>{"issue",
                                                    command_type_t::issue},
        std::pair<std::string_view, command_type_t>{"transfer",
                                                    command_type_t::transfer},
        std::pair<std::string_view, command_type_t>{"settle",
                                                    command_type_t::settle}};

template <>
inline std::optional<command_type_t> try_from_string<command_type_t>(
    const std::string_view value) {
  return from_string(value, kCommandTypeMappings);
}

inline constexpr std::string_view to_string(const command_type_t value) {
  return to_string(value, kCommandTypeMappings).value_or("unknown");
}

}  // namespace obligation::schema
