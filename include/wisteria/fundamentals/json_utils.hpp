#pragma once
#include <boost/json.hpp>
#include <concepts>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace wisteria::json_utils
{

namespace json = boost::json;

// A structural decoding failure. `path` locates the offending value
// ("author.id", "mentions[2].username"), empty when it is the root.
struct DecodeError
{
    std::string path;
    std::string problem;

    [[nodiscard]] DecodeError prepend(std::string_view key) const;
    [[nodiscard]] DecodeError prepend_index(size_t idx) const;
    [[nodiscard]] std::string message() const;

    bool operator==(const DecodeError&) const = default;
};

template<class T>
using Decoded = std::expected<T, DecodeError>;

template<class T>
concept json_model = requires(const json::value& jv)
{
    { T::from_json(jv) } -> std::same_as<Decoded<T>>;
};

template<class T>
struct is_vector : std::false_type {};

template<class T, class A>
struct is_vector<std::vector<T, A>> : std::true_type {};

Decoded<std::string> decode_string(const json::value& jv);
Decoded<bool> decode_bool(const json::value& jv);
Decoded<uint64_t> decode_uint(const json::value& jv, uint64_t max_val);
Decoded<int64_t> decode_int(const json::value& jv, int64_t min_val, int64_t max_val);
Decoded<double> decode_double(const json::value& jv);

// Strings and integers both come back as text; anything else is rejected.
// Used for fields the API has sent in either form (nonces, permission sets).
Decoded<std::string> decode_scalar_text(const json::value& jv);

template<class T>
Decoded<T> decode(const json::value& jv)
{
    if constexpr (std::same_as<T, std::string>)
    {
        return decode_string(jv);
    }
    else if constexpr (std::same_as<T, bool>)
    {
        return decode_bool(jv);
    }
    else if constexpr (std::unsigned_integral<T>)
    {
        return decode_uint(jv, std::numeric_limits<T>::max())
            .transform([](uint64_t v) { return static_cast<T>(v); });
    }
    else if constexpr (std::signed_integral<T>)
    {
        return decode_int(jv, std::numeric_limits<T>::min(), std::numeric_limits<T>::max())
            .transform([](int64_t v) { return static_cast<T>(v); });
    }
    else if constexpr (std::floating_point<T>)
    {
        return decode_double(jv).transform([](double v) { return static_cast<T>(v); });
    }
    else if constexpr (std::same_as<T, json::value>)
    {
        return jv;
    }
    else if constexpr (is_vector<T>::value)
    {
        using Elem = typename T::value_type;
        if (!jv.is_array())
        {
            return std::unexpected(DecodeError{{}, "must be an array"});
        }
        T ret;
        ret.reserve(jv.as_array().size());
        size_t idx = 0;
        for (const auto& item : jv.as_array())
        {
            auto elem = decode<Elem>(item);
            if (!elem)
            {
                return std::unexpected(elem.error().prepend_index(idx));
            }
            ret.push_back(std::move(*elem));
            ++idx;
        }
        return ret;
    }
    else
    {
        static_assert(json_model<T>, "type has no from_json decoder");
        return T::from_json(jv);
    }
}

// Field-by-field reader over a JSON object. The first failure is kept and
// reported by finish(); later reads after a failure are skipped.
class Reader
{
public:
    [[nodiscard]] static Decoded<Reader> open(const json::value& jv);

    template<class T>
    T required(std::string_view key)
    {
        if (err)
        {
            return T{};
        }
        auto it = obj->find(key);
        if (it == obj->end())
        {
            reject(key, "field required");
            return T{};
        }
        auto ret = decode<T>(it->value());
        if (!ret)
        {
            err = ret.error().prepend(key);
            return T{};
        }
        return std::move(*ret);
    }

    // Absent and null are both "not provided".
    template<class T>
    std::optional<T> optional(std::string_view key)
    {
        if (err)
        {
            return std::nullopt;
        }
        auto it = obj->find(key);
        if (it == obj->end() || it->value().is_null())
        {
            return std::nullopt;
        }
        auto ret = decode<T>(it->value());
        if (!ret)
        {
            err = ret.error().prepend(key);
            return std::nullopt;
        }
        return std::move(*ret);
    }

    template<class T>
    std::vector<T> list_or_empty(std::string_view key)
    {
        return optional<std::vector<T>>(key).value_or(std::vector<T>{});
    }

    // Fields sent either as a string or as an integer, read as text.
    std::string required_text(std::string_view key);
    std::optional<std::string> optional_text(std::string_view key);

    void reject(std::string_view key, std::string problem);

    [[nodiscard]] bool ok() const { return !err.has_value(); }
    [[nodiscard]] const json::object& object() const { return *obj; }

    template<class T>
    [[nodiscard]] Decoded<T> finish(T value) const
    {
        if (err)
        {
            return std::unexpected(*err);
        }
        return value;
    }

private:
    explicit Reader(const json::object& o) : obj(&o) {}

    const json::object* obj;
    std::optional<DecodeError> err;
};

// Serialization helpers for the outbound direction.
template<class T>
void put_optional(json::object& obj, std::string_view key, const std::optional<T>& val)
{
    if (val)
    {
        obj[key] = json::value_from(*val);
    }
}

} // namespace wisteria::json_utils
