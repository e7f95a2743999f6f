#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hostmux::json {

    using value = glz::generic;
    using object_t = glz::generic::object_t;
    using array_t = glz::generic::array_t;
    using null_t = glz::generic::null_t;

    inline value parse_json(std::string_view text) {
        value out{};
        auto ec = glz::read_json(out, text);
        if (ec) {
            throw std::runtime_error("malformed json: " + glz::format_error(ec, text));
        }
        return out;
    }

    inline std::optional<value> try_parse_json(std::string_view text) {
        value out{};
        if (glz::read_json(out, text)) {
            return std::nullopt;
        }
        return out;
    }

    inline std::string to_json(const value& v) {
        std::string out{};
        if (auto ec = glz::write_json(v, out)) {
            throw std::runtime_error("failed to serialize json value");
        }
        return out;
    }

    inline std::string to_pretty_json(const value& v) {
        std::string out{};
        if (auto ec = glz::write<glz::opts{.prettify = true}>(v, out)) {
            throw std::runtime_error("failed to serialize json value");
        }
        return out;
    }

    inline value make_object() {
        value v{};
        v.data = object_t{};
        return v;
    }

    inline bool is_null(const value& v) {
        return std::holds_alternative<null_t>(v.data);
    }

    inline const object_t* as_object(const value& v) {
        return std::get_if<object_t>(&v.data);
    }

    inline const array_t* as_array(const value& v) {
        return std::get_if<array_t>(&v.data);
    }

    inline const std::string* as_string(const value& v) {
        return std::get_if<std::string>(&v.data);
    }

    inline const value* find_member(const value& v, std::string_view key) {
        const auto* obj = as_object(v);
        if (obj == nullptr) {
            return nullptr;
        }
        auto it = obj->find(key);
        if (it == obj->end()) {
            return nullptr;
        }
        return &it->second;
    }

    inline std::optional<std::string> string_member(const value& v, std::string_view key) {
        const auto* member = find_member(v, key);
        if (member == nullptr) {
            return std::nullopt;
        }
        if (const auto* s = as_string(*member)) {
            return *s;
        }
        return std::nullopt;
    }

    // JSON numbers are held as double; only exact integral values inside the int64 range qualify
    inline std::optional<std::int64_t> integer_value(const value& v) {
        const auto* d = std::get_if<double>(&v.data);
        if (d == nullptr || !std::isfinite(*d) || std::trunc(*d) != *d) {
            return std::nullopt;
        }
        if (*d < -0x1p63 || *d >= 0x1p63) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(*d);
    }

    inline void set_member(value& target, std::string key, value member) {
        if (as_object(target) == nullptr) {
            target.data = object_t{};
        }
        std::get<object_t>(target.data).insert_or_assign(std::move(key), std::move(member));
    }

    inline value string_value(std::string text) {
        value v{};
        v.data = std::move(text);
        return v;
    }

}  // namespace hostmux::json
