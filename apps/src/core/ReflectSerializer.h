#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace NeuroEvo {

namespace ReflectSerializerAdl {

struct JsonAdapter {
    nlohmann::json& json;
    operator nlohmann::json&() const { return json; }
};

struct ConstJsonAdapter {
    const nlohmann::json& json;
    operator const nlohmann::json&() const { return json; }
};

template <typename T>
auto test_to_json(int)
    -> decltype(to_json(JsonAdapter{ std::declval<nlohmann::json&>() }, std::declval<const T&>()), std::true_type{});

template <typename T>
std::false_type test_to_json(...);

template <typename T>
inline constexpr bool has_adl_to_json_v = decltype(test_to_json<T>(0))::value;

template <typename T>
auto test_from_json(int)
    -> decltype(from_json(ConstJsonAdapter{ std::declval<const nlohmann::json&>() }, std::declval<T&>()), std::true_type{});

template <typename T>
std::false_type test_from_json(...);

template <typename T>
inline constexpr bool has_adl_from_json_v = decltype(test_from_json<T>(0))::value;

} // namespace ReflectSerializerAdl

/**
 * Reflection-based JSON serialization for aggregate configuration types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json for the
 * document. Enums without their own to_json/from_json are written by name.
 * Members missing from the input keep their default values, so partial config
 * files are valid.
 *
 * Example:
 *   struct CompatibilityConfig { double excessCoefficient = 1.0; ... };
 *   auto j = ReflectSerializer::to_json(config);
 *   auto copy = ReflectSerializer::from_json<CompatibilityConfig>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename EnumType>
nlohmann::json enumToJson(const EnumType& value)
{
    if constexpr (ReflectSerializerAdl::has_adl_to_json_v<EnumType>) {
        nlohmann::json enumJson;
        to_json(ReflectSerializerAdl::JsonAdapter{ enumJson }, value);
        return enumJson;
    }
    else {
        return std::string(reflect::enum_name(value));
    }
}

template <typename EnumType>
EnumType enumFromJson(const nlohmann::json& j)
{
    EnumType value{};
    if constexpr (ReflectSerializerAdl::has_adl_from_json_v<EnumType>) {
        from_json(ReflectSerializerAdl::ConstJsonAdapter{ j }, value);
        return value;
    }
    else {
        const auto str = j.get<std::string>();
        for (const auto& [enumValue, enumName] : reflect::enumerators<EnumType>) {
            if (enumName == str) {
                return static_cast<EnumType>(enumValue);
            }
        }
        throw std::runtime_error("Invalid enum value: " + str);
    }
}

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);

            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                // Empty optionals are omitted.
                if (value.has_value()) {
                    using InnerType = typename MemberType::value_type;
                    if constexpr (std::is_enum_v<InnerType>) {
                        j[name] = enumToJson(*value);
                    }
                    else {
                        j[name] = *value;
                    }
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = enumToJson(value);
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name) || j.at(name).is_null()) {
                return;
            }

            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if constexpr (is_optional_v<MemberType>) {
                using InnerType = typename MemberType::value_type;
                if constexpr (std::is_enum_v<InnerType>) {
                    reflect::get<I>(obj) = enumFromJson<InnerType>(j.at(name));
                }
                else {
                    reflect::get<I>(obj) = j.at(name).template get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                reflect::get<I>(obj) = enumFromJson<MemberType>(j.at(name));
            }
            else {
                reflect::get<I>(obj) = j.at(name).template get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer

} // namespace NeuroEvo
