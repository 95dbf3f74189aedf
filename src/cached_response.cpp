#include "cached_response.hpp"
#include "errors.hpp"

namespace middleman {

uint64_t CachedResponse::size() const {
    uint64_t total = 8;
    for (const auto& [name, value] : headers) {
        total += name.size() + value.size();
    }
    return total + body.size();
}

nlohmann::json CachedResponse::to_json() const {
    nlohmann::json h = nlohmann::json::object();
    for (const auto& [name, value] : headers) h[name] = value;
    return {
        {"status", status},
        {"headers", std::move(h)},
        {"body", nlohmann::json::binary(body)}
    };
}

nlohmann::json CachedResponse::to_portable_json() const {
    nlohmann::json j = to_json();
    nlohmann::json data = nlohmann::json::array();
    for (uint8_t b : body) data.push_back(b);
    j["body"] = nlohmann::json{{"type", "Buffer"}, {"data", std::move(data)}};
    return j;
}

static Bytes bytes_from_array(const nlohmann::json& arr) {
    Bytes out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        if (!item.is_number_integer())
            throw DecodeError("Invalid CachedResponse body: non-integer byte");
        int64_t v = item.get<int64_t>();
        if (v < 0 || v > 255)
            throw DecodeError("Invalid CachedResponse body: byte out of range");
        out.push_back(static_cast<uint8_t>(v));
    }
    return out;
}

static Bytes decode_body(const nlohmann::json& body) {
    if (body.is_binary()) {
        const auto& bin = body.get_binary();
        return Bytes(bin.begin(), bin.end());
    }
    if (body.is_array()) return bytes_from_array(body);
    if (body.is_object()) {
        auto type = body.find("type");
        auto data = body.find("data");
        if (type == body.end() || !type->is_string() || *type != "Buffer" ||
            data == body.end() || !data->is_array())
            throw DecodeError("Invalid CachedResponse Buffer");
        return bytes_from_array(*data);
    }
    throw DecodeError("Invalid CachedResponse body");
}

CachedResponse CachedResponse::parse(const nlohmann::json& obj) {
    if (!obj.is_object())
        throw DecodeError("Invalid CachedResponse");
    auto status = obj.find("status");
    auto headers = obj.find("headers");
    auto body = obj.find("body");
    if (status == obj.end() || !status->is_number() ||
        headers == obj.end() || !headers->is_object() ||
        body == obj.end())
        throw DecodeError("Invalid CachedResponse");

    CachedResponse out;
    out.status = status->get<int>();
    for (auto it = headers->begin(); it != headers->end(); ++it) {
        const auto& v = it.value();
        if (v.is_string()) {
            out.headers[it.key()] = v.get<std::string>();
        } else if (v.is_array()) {
            std::string joined;
            for (const auto& part : v) {
                if (!part.is_string())
                    throw DecodeError("Invalid CachedResponse header: " + it.key());
                if (!joined.empty()) joined += ", ";
                joined += part.get<std::string>();
            }
            out.headers[it.key()] = joined;
        } else {
            throw DecodeError("Invalid CachedResponse header: " + it.key());
        }
    }
    out.body = decode_body(*body);
    return out;
}

CachedResponse CachedResponse::parse_json(const std::string& text) {
    auto obj = nlohmann::json::parse(text, nullptr, false);
    if (obj.is_discarded())
        throw DecodeError("Invalid CachedResponse JSON");
    return parse(obj);
}

CachedResponse CachedResponse::decode(const nlohmann::json& value) {
    if (value.is_string()) return parse_json(value.get<std::string>());
    return parse(value);
}

bool operator==(const CachedResponse& a, const CachedResponse& b) {
    return a.status == b.status && a.headers == b.headers && a.body == b.body;
}

} // namespace middleman
