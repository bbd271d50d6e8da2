#pragma once

/// @file game_serializer.hpp
/// @brief GameSerializer providing JSON encoding with schema versioning and
///        compile-time field registration via MF_SERIALIZABLE.
///
/// Template-heavy header: the encoder operates on user-defined types
/// through SerializableTraits, so it must live here. Writing handles nested
/// registered structs, vectors, optionals, maps, strong ids and enums; reading
/// handles flat records only.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "mf/foundation/game_result.hpp"
#include "mf/foundation/types.hpp"

namespace mf::foundation {

/// Specialization point for compile-time field registration.
/// Users specialize this via the MF_SERIALIZABLE macro.
template <typename T>
struct SerializableTraits {
    static constexpr bool is_serializable = false;
};

/// Describes a single serializable field: its name and pointer-to-member.
template <typename T, typename M>
struct FieldDescriptor {
    const char* name;
    M T::*pointer;
};

template <typename T, typename M>
constexpr FieldDescriptor<T, M> field(const char* name, M T::*ptr) {
    return {name, ptr};
}

namespace detail {

template <typename T, typename = void>
struct is_serializable : std::false_type {};

template <typename T>
struct is_serializable<
    T, std::void_t<decltype(SerializableTraits<T>::schema_version)>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_serializable_v = is_serializable<T>::value;

template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};

template <typename T>
struct is_strong_id : std::false_type {};
template <typename Tag>
struct is_strong_id<StrongId<Tag>> : std::true_type {};

/// Enums opt into name rendering by providing toString(E) in their namespace.
template <typename E, typename = void>
struct has_to_string : std::false_type {};
template <typename E>
struct has_to_string<E, std::void_t<decltype(toString(std::declval<E>()))>>
    : std::true_type {};

// ── Tuple iteration ─────────────────────────────────────────────────────

template <typename Tuple, typename Func, std::size_t... Is>
void forEachFieldImpl(const Tuple& t, Func&& f, std::index_sequence<Is...>) {
    (f(std::get<Is>(t), Is), ...);
}

template <typename Tuple, typename Func>
void forEachField(const Tuple& t, Func&& f) {
    forEachFieldImpl(
        t, std::forward<Func>(f),
        std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

// ── JSON write helpers ──────────────────────────────────────────────────

inline void appendEscaped(std::string& out, std::string_view sv) {
    out += '"';
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

inline void appendDouble(std::string& out, double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.10g", val);
    out += buf;
}

template <typename K>
std::string mapKeyString(const K& key) {
    if constexpr (std::is_same_v<K, std::string>) {
        return key;
    } else if constexpr (is_strong_id<K>::value) {
        return key.value();
    } else if constexpr (std::is_enum_v<K> && has_to_string<K>::value) {
        return std::string(toString(key));
    } else {
        return std::to_string(key);
    }
}

template <typename T>
void writeJsonValue(std::string& out, const T& val);

template <typename T>
void writeJsonObject(std::string& out, const T& obj, bool withVersion) {
    out += '{';
    bool first = true;
    if (withVersion) {
        out += "\"__v\":";
        out += std::to_string(SerializableTraits<T>::schema_version);
        first = false;
    }
    auto fields = SerializableTraits<T>::fields();
    forEachField(fields, [&](const auto& fd, std::size_t) {
        if (!first) {
            out += ',';
        }
        first = false;
        appendEscaped(out, fd.name);
        out += ':';
        writeJsonValue(out, obj.*(fd.pointer));
    });
    out += '}';
}

template <typename T>
void writeJsonValue(std::string& out, const T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        out += val ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::string>) {
        appendEscaped(out, val);
    } else if constexpr (is_strong_id<T>::value) {
        appendEscaped(out, val.value());
    } else if constexpr (std::is_enum_v<T>) {
        if constexpr (has_to_string<T>::value) {
            appendEscaped(out, toString(val));
        } else {
            out += std::to_string(static_cast<int64_t>(val));
        }
    } else if constexpr (std::is_floating_point_v<T>) {
        appendDouble(out, static_cast<double>(val));
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        out += std::to_string(static_cast<int64_t>(val));
    } else if constexpr (std::is_integral_v<T>) {
        out += std::to_string(static_cast<uint64_t>(val));
    } else if constexpr (is_optional<T>::value) {
        if (val) {
            writeJsonValue(out, *val);
        } else {
            out += "null";
        }
    } else if constexpr (is_vector<T>::value) {
        out += '[';
        for (std::size_t i = 0; i < val.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            writeJsonValue(out, val[i]);
        }
        out += ']';
    } else if constexpr (is_map<T>::value) {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : val) {
            if (!first) {
                out += ',';
            }
            first = false;
            appendEscaped(out, mapKeyString(key));
            out += ':';
            writeJsonValue(out, item);
        }
        out += '}';
    } else {
        static_assert(is_serializable_v<T>,
                      "Nested type must be registered with MF_SERIALIZABLE");
        writeJsonObject(out, val, false);
    }
}

// ── JSON read helpers (flat records) ────────────────────────────────────

struct JsonReader {
    std::string_view data;
    std::size_t pos = 0;

    void skipWhitespace() {
        while (pos < data.size() &&
               (data[pos] == ' ' || data[pos] == '\t' ||
                data[pos] == '\n' || data[pos] == '\r')) {
            ++pos;
        }
    }

    bool expect(char c) {
        skipWhitespace();
        if (pos < data.size() && data[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }

    bool readQuotedString(std::string& out) {
        skipWhitespace();
        if (pos >= data.size() || data[pos] != '"') return false;
        ++pos;
        out.clear();
        while (pos < data.size() && data[pos] != '"') {
            if (data[pos] == '\\') {
                ++pos;
                if (pos >= data.size()) return false;
                switch (data[pos]) {
                    case '"':  out += '"'; break;
                    case '\\': out += '\\'; break;
                    case 'b':  out += '\b'; break;
                    case 'f':  out += '\f'; break;
                    case 'n':  out += '\n'; break;
                    case 'r':  out += '\r'; break;
                    case 't':  out += '\t'; break;
                    default:   out += data[pos]; break;
                }
            } else {
                out += data[pos];
            }
            ++pos;
        }
        if (pos >= data.size()) return false;
        ++pos;  // closing quote
        return true;
    }

    /// Strings come back unescaped; numbers, bools and null as raw text.
    bool readRawValue(std::string& out, bool& quoted) {
        skipWhitespace();
        if (pos >= data.size()) return false;
        quoted = data[pos] == '"';
        if (quoted) {
            return readQuotedString(out);
        }
        std::size_t start = pos;
        while (pos < data.size() && data[pos] != ',' && data[pos] != '}' &&
               data[pos] != ' ' && data[pos] != '\t' &&
               data[pos] != '\n' && data[pos] != '\r') {
            ++pos;
        }
        out = std::string(data.substr(start, pos - start));
        return !out.empty();
    }

    /// Skip any value, including nested objects and arrays.
    bool skipValue() {
        skipWhitespace();
        if (pos >= data.size()) return false;
        if (data[pos] == '"') {
            std::string dummy;
            return readQuotedString(dummy);
        }
        if (data[pos] == '{' || data[pos] == '[') {
            int depth = 0;
            while (pos < data.size()) {
                char c = data[pos];
                if (c == '"') {
                    std::string dummy;
                    if (!readQuotedString(dummy)) return false;
                    continue;
                }
                if (c == '{' || c == '[') ++depth;
                if (c == '}' || c == ']') --depth;
                ++pos;
                if (depth == 0) return true;
            }
            return false;
        }
        while (pos < data.size() && data[pos] != ',' && data[pos] != '}') {
            ++pos;
        }
        return true;
    }
};

template <typename T>
bool parseJsonValue(const std::string& raw, bool quoted, T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        if (quoted) return false;
        if (raw == "true") { val = true; return true; }
        if (raw == "false") { val = false; return true; }
        return false;
    } else if constexpr (std::is_same_v<T, std::string>) {
        val = raw;
        return quoted;
    } else if constexpr (is_strong_id<T>::value) {
        val = T(raw);
        return quoted;
    } else if constexpr (std::is_arithmetic_v<T>) {
        if (quoted || raw.empty()) return false;
        char* end = nullptr;
        if constexpr (std::is_floating_point_v<T>) {
            double parsed = std::strtod(raw.c_str(), &end);
            val = static_cast<T>(parsed);
        } else if constexpr (std::is_signed_v<T>) {
            long long parsed = std::strtoll(raw.c_str(), &end, 10);
            val = static_cast<T>(parsed);
        } else {
            unsigned long long parsed = std::strtoull(raw.c_str(), &end, 10);
            val = static_cast<T>(parsed);
        }
        return end != nullptr && *end == '\0';
    } else {
        return false;
    }
}

}  // namespace detail

/// JSON serializer with schema versioning.
///
/// Types must be registered with MF_SERIALIZABLE before use. Output is
/// compact, keeps declaration order and renders doubles with a fixed
/// format, so identical values always produce byte-identical text.
///
/// Example:
/// @code
///   struct StatBlock { int32_t hp = 0; int32_t attack = 0; };
///   MF_SERIALIZABLE(StatBlock, 1,
///       field("hp", &StatBlock::hp),
///       field("attack", &StatBlock::attack)
///   );
///
///   auto json = GameSerializer::instance().serializeJson(stats);
/// @endcode
class GameSerializer {
public:
    GameSerializer();
    ~GameSerializer();

    GameSerializer(const GameSerializer&) = delete;
    GameSerializer& operator=(const GameSerializer&) = delete;
    GameSerializer(GameSerializer&&) noexcept;
    GameSerializer& operator=(GameSerializer&&) noexcept;

    /// Serialize an object to a JSON string carrying its schema version.
    template <typename T>
    [[nodiscard]] std::string serializeJson(const T& obj) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with MF_SERIALIZABLE");
        std::string out;
        out.reserve(256);
        detail::writeJsonObject(out, obj, true);
        return out;
    }

    /// Deserialize a flat record from a JSON string.
    /// Unrecognized keys (nested values included) are skipped; missing keys
    /// retain default values; a value of the wrong JSON type is an error.
    template <typename T>
    [[nodiscard]] GameResult<T> deserializeJson(std::string_view json) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with MF_SERIALIZABLE");

        detail::JsonReader reader{json};
        auto fail = [](const char* what) {
            return GameResult<T>::err(GameError(ErrorCode::InvalidJsonData, what));
        };

        if (!reader.expect('{')) {
            return fail("expected '{'");
        }

        T obj{};
        auto fields = SerializableTraits<T>::fields();

        bool first = true;
        while (true) {
            reader.skipWhitespace();
            if (reader.pos >= reader.data.size()) {
                return fail("unexpected end of JSON");
            }
            if (reader.data[reader.pos] == '}') {
                ++reader.pos;
                break;
            }
            if (!first && !reader.expect(',')) {
                return fail("expected ','");
            }
            first = false;

            std::string key;
            if (!reader.readQuotedString(key)) {
                return fail("expected key string");
            }
            if (!reader.expect(':')) {
                return fail("expected ':'");
            }

            bool matched = false;
            bool valid = true;
            detail::forEachField(fields, [&](const auto& fd, std::size_t) {
                if (matched || key != fd.name) return;
                using FieldType =
                    std::remove_reference_t<decltype(obj.*(fd.pointer))>;
                if constexpr (std::is_arithmetic_v<FieldType> ||
                              std::is_same_v<FieldType, std::string> ||
                              detail::is_strong_id<FieldType>::value) {
                    matched = true;
                    std::string rawVal;
                    bool quoted = false;
                    FieldType val{};
                    if (reader.readRawValue(rawVal, quoted) &&
                        detail::parseJsonValue(rawVal, quoted, val)) {
                        obj.*(fd.pointer) = std::move(val);
                    } else {
                        valid = false;
                    }
                }
            });

            if (!valid) {
                return GameResult<T>::err(GameError(
                    ErrorCode::InvalidJsonData, "invalid value for key: " + key));
            }
            if (!matched && !reader.skipValue()) {
                return fail("malformed value");
            }
        }

        return GameResult<T>::ok(std::move(obj));
    }

    static GameSerializer& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace mf::foundation

// ── MF_SERIALIZABLE macro ───────────────────────────────────────────────────
/// Register a type for serialization with field descriptors and version.
/// Must be used at global namespace scope.
///
/// @param Type     The struct type to register (fully qualified).
/// @param Version  Schema version number (uint32_t).
/// @param ...      field("name", &Type::member) descriptors.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MF_SERIALIZABLE(Type, Version, ...)                                    \
    template <>                                                                \
    struct mf::foundation::SerializableTraits<Type> {                          \
        static constexpr bool is_serializable = true;                          \
        static constexpr uint32_t schema_version = Version;                    \
        static constexpr auto fields() {                                       \
            using mf::foundation::field;                                       \
            return std::make_tuple(__VA_ARGS__);                               \
        }                                                                      \
    }
