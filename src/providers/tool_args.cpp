#include "archmcp/providers/tool_args.hpp"

namespace archmcp::args {

namespace {

const Json* find_member(const ToolArgs& args, const char* key) {
    if (args.is_object() == false) {
        return nullptr;
    }
    const auto it = args.find(key);
    if ((it == args.end()) || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

Error wrong_type(const char* key, const char* expected) {
    return Error::invalid_params(std::string("'") + key + "' must be " + expected);
}

}  // namespace

Result<std::string> required_string(const ToolArgs& args, const char* key) {
    const Json* member = find_member(args, key);
    if (member == nullptr) {
        return tl::unexpected(Error::invalid_params(std::string("missing required argument '") + key + "'"));
    }
    if (member->is_string() == false) {
        return tl::unexpected(wrong_type(key, "a string"));
    }
    return member->get<std::string>();
}

Result<std::optional<std::string>> optional_string(const ToolArgs& args, const char* key) {
    const Json* member = find_member(args, key);
    if (member == nullptr) {
        return std::optional<std::string>{};
    }
    if (member->is_string() == false) {
        return tl::unexpected(wrong_type(key, "a string"));
    }
    return std::optional<std::string>(member->get<std::string>());
}

Result<bool> optional_bool(const ToolArgs& args, const char* key, bool fallback) {
    const Json* member = find_member(args, key);
    if (member == nullptr) {
        return fallback;
    }
    if (member->is_boolean() == false) {
        return tl::unexpected(wrong_type(key, "a boolean"));
    }
    return member->get<bool>();
}

Result<std::optional<std::int64_t>> optional_int(const ToolArgs& args, const char* key) {
    const Json* member = find_member(args, key);
    if (member == nullptr) {
        return std::optional<std::int64_t>{};
    }
    if (member->is_number_integer() == false) {
        return tl::unexpected(wrong_type(key, "an integer"));
    }
    return std::optional<std::int64_t>(member->get<std::int64_t>());
}

Result<std::vector<std::string>> optional_string_list(const ToolArgs& args, const char* key) {
    const Json* member = find_member(args, key);
    std::vector<std::string> values;
    if (member == nullptr) {
        return values;
    }
    if (member->is_array() == false) {
        return tl::unexpected(wrong_type(key, "an array of strings"));
    }
    for (const auto& item : *member) {
        if (item.is_string() == false) {
            return tl::unexpected(wrong_type(key, "an array of strings"));
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

}  // namespace archmcp::args
