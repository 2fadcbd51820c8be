#pragma once

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/fmt/fmt.h>
#include <zpp_bits.h>

namespace NeuroEvo {

// A strong type wrapper for integral ids.
// Creates distinct types that prevent accidental mixing of values.
//
// Usage:
//   using GenotypeId = StrongType<struct GenotypeIdTag, uint64_t>;
//   using SpeciesId = StrongType<struct SpeciesIdTag>;
//
//   GenotypeId genotype{ 42 };
//   SpeciesId species{ 42 };
//   // genotype == species;  // Compile error - different types.
//   uint64_t raw = genotype.get();

template <typename Tag, typename Rep = int>
class StrongType {
public:
    using ValueType = Rep;

    constexpr StrongType() : m_value{ 0 } {}
    constexpr explicit StrongType(Rep value) : m_value{ value } {}

    [[nodiscard]] constexpr Rep get() const { return m_value; }

    constexpr bool operator==(const StrongType& other) const { return m_value == other.m_value; }
    constexpr bool operator!=(const StrongType& other) const { return m_value != other.m_value; }
    constexpr bool operator<(const StrongType& other) const { return m_value < other.m_value; }
    constexpr bool operator<=(const StrongType& other) const { return m_value <= other.m_value; }
    constexpr bool operator>(const StrongType& other) const { return m_value > other.m_value; }
    constexpr bool operator>=(const StrongType& other) const { return m_value >= other.m_value; }

    // Increment operators (for id counters).
    StrongType& operator++()
    {
        ++m_value;
        return *this;
    }
    StrongType operator++(int)
    {
        StrongType temp = *this;
        ++m_value;
        return temp;
    }

    // Binary serialization support for zpp_bits requires public member access.
    using serialize = zpp::bits::members<1>;
    Rep m_value;
};

template <typename Tag, typename Rep>
void to_json(nlohmann::json& j, const StrongType<Tag, Rep>& st)
{
    j = st.get();
}

template <typename Tag, typename Rep>
void from_json(const nlohmann::json& j, StrongType<Tag, Rep>& st)
{
    st = StrongType<Tag, Rep>{ j.get<Rep>() };
}

template <typename Tag, typename Rep>
std::ostream& operator<<(std::ostream& os, const StrongType<Tag, Rep>& st)
{
    return os << st.get();
}

} // namespace NeuroEvo

template <typename Tag, typename Rep>
struct std::hash<NeuroEvo::StrongType<Tag, Rep>> {
    std::size_t operator()(const NeuroEvo::StrongType<Tag, Rep>& st) const noexcept
    {
        return std::hash<Rep>{}(st.get());
    }
};

template <typename Tag, typename Rep>
struct fmt::formatter<NeuroEvo::StrongType<Tag, Rep>> : fmt::formatter<Rep> {
    auto format(const NeuroEvo::StrongType<Tag, Rep>& st, fmt::format_context& ctx) const
    {
        return fmt::formatter<Rep>::format(st.get(), ctx);
    }
};
