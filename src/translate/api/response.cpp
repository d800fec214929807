#include "response.hpp"

#include <initializer_list>

using json = nlohmann::json;

namespace {

// Looks up a path of object keys and array indices; nullptr if absent.
const json* find_path(const json& j, std::initializer_list<json::object_t::key_type> keys,
                      std::optional<size_t> index = std::nullopt,
                      const char* leaf = nullptr) {
    const json* cur = &j;
    for (const auto& key : keys) {
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(key);
        if (it == cur->end()) return nullptr;
        cur = &*it;
    }
    if (index) {
        if (!cur->is_array() || cur->size() <= *index) return nullptr;
        cur = &(*cur)[*index];
    }
    if (leaf) {
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(leaf);
        if (it == cur->end()) return nullptr;
        cur = &*it;
    }
    return cur;
}

// Null, false and empty values count as absent; other non-strings are dumped.
std::optional<std::string> as_text(const json* v) {
    if (!v || v->is_null()) return std::nullopt;
    if (v->is_boolean() && !v->get<bool>()) return std::nullopt;
    std::string s = v->is_string() ? v->get<std::string>() : v->dump();
    if (s.empty()) return std::nullopt;
    return s;
}

std::optional<std::string> first_of(std::initializer_list<const json*> candidates) {
    for (auto* c : candidates) {
        if (auto s = as_text(c)) return s;
    }
    return std::nullopt;
}

} // namespace

Result<ApiResponse> parse_response(const std::string& body) {
    ApiResponse resp;
    try {
        resp.raw = json::parse(body);
    } catch (const json::exception& e) {
        return make_error(ErrorCode::ApiError,
                          std::string("Invalid JSON response: ") + e.what() + "\n" + body);
    }

    const auto& j = resp.raw;

    if (auto err = as_text(find_path(j, {"error"}))) {
        resp.error = *err;
    }

    resp.text = first_of({
        find_path(j, {"transcript"}),
        find_path(j, {"results"}, 0, "text"),
        find_path(j, {"text"}),
    });
    // A single space counts as no text.
    if (resp.text && *resp.text == " ") resp.text.reset();

    resp.audio = first_of({
        find_path(j, {"results"}, 0, "audio_url"),
        find_path(j, {"audio_url"}),
        find_path(j, {"audio_data"}),
    });

    return resp;
}
