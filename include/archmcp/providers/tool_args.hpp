#pragma once

#include "archmcp/error.hpp"
#include "archmcp/protocol/mcp_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archmcp::args {

// Typed access to tools/call arguments. A missing required member, or any
// member of the wrong type, is an InvalidParams error naming the member.

[[nodiscard]] Result<std::string> required_string(const ToolArgs& args, const char* key);

[[nodiscard]] Result<std::optional<std::string>> optional_string(const ToolArgs& args, const char* key);

[[nodiscard]] Result<bool> optional_bool(const ToolArgs& args, const char* key, bool fallback);

[[nodiscard]] Result<std::optional<std::int64_t>> optional_int(const ToolArgs& args, const char* key);

[[nodiscard]] Result<std::vector<std::string>> optional_string_list(const ToolArgs& args, const char* key);

}  // namespace archmcp::args
