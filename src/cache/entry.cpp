#include "entry.hpp"

namespace middleman {

// {"type":"Buffer","data":[...]}: the text-store form of a byte string.
static bool is_tagged_buffer(const nlohmann::json& value) {
    if (!value.is_object() || value.size() != 2) return false;
    auto type = value.find("type");
    auto data = value.find("data");
    return type != value.end() && *type == "Buffer" &&
           data != value.end() && data->is_array();
}

uint64_t estimate_size(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return 0;
        case nlohmann::json::value_t::boolean:
            return 4;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return 8;
        case nlohmann::json::value_t::string:
            return value.get_ref<const std::string&>().size();
        case nlohmann::json::value_t::binary:
            return value.get_binary().size();
        case nlohmann::json::value_t::array: {
            uint64_t total = 0;
            for (const auto& item : value) total += estimate_size(item);
            return total;
        }
        case nlohmann::json::value_t::object: {
            // Same size as the binary value it stands for.
            if (is_tagged_buffer(value)) return value["data"].size();
            uint64_t total = 0;
            for (auto it = value.begin(); it != value.end(); ++it) {
                total += it.key().size() + estimate_size(it.value());
            }
            return total;
        }
    }
    return 0;
}

uint64_t CacheEntry::size() const {
    return estimate_size(value);
}

nlohmann::json entry_to_json(const CacheEntry& entry) {
    return nlohmann::json{
        {"key", entry.key},
        {"value", entry.value},
        {"created", entry.created}
    };
}

nlohmann::json to_portable_json(const nlohmann::json& value) {
    if (value.is_binary()) {
        const auto& bytes = value.get_binary();
        nlohmann::json data = nlohmann::json::array();
        for (uint8_t b : bytes) data.push_back(b);
        return nlohmann::json{{"type", "Buffer"}, {"data", std::move(data)}};
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) out.push_back(to_portable_json(item));
        return out;
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = to_portable_json(it.value());
        }
        return out;
    }
    return value;
}

static std::optional<CacheEntry> entry_from_object(const nlohmann::json& obj) {
    if (!obj.is_object()) return std::nullopt;

    auto key = obj.find("key");
    auto value = obj.find("value");
    auto created = obj.find("created");
    if (key == obj.end() || !key->is_string()) return std::nullopt;
    if (value == obj.end()) return std::nullopt;
    if (created == obj.end()) return std::nullopt;

    CacheEntry entry;
    entry.key = key->get<std::string>();
    entry.value = *value;
    if (created->is_number_unsigned()) {
        entry.created = created->get<uint64_t>();
    } else if (created->is_number_integer() && created->get<int64_t>() >= 0) {
        entry.created = static_cast<uint64_t>(created->get<int64_t>());
    } else if (created->is_number_float() && created->get<double>() >= 0 &&
               created->get<double>() < 18446744073709551616.0) {
        entry.created = static_cast<uint64_t>(created->get<double>());
    } else {
        return std::nullopt;
    }
    return entry;
}

std::optional<CacheEntry> entry_from_json(const nlohmann::json& stored) {
    if (stored.is_string()) {
        auto parsed = nlohmann::json::parse(stored.get_ref<const std::string&>(),
                                            nullptr, false);
        if (parsed.is_discarded()) return std::nullopt;
        return entry_from_object(parsed);
    }
    return entry_from_object(stored);
}

} // namespace middleman
