#pragma once

#include "di/container/interface/access.h"
#include "di/container/string/string.h"
#include "di/container/string/string_view.h"
#include "di/container/vector/vector.h"
#include "di/function/minmax.h"
#include "di/util/initializer_list.h"

namespace vtcore {
// A single numeric parameter. A parameter may be omitted entirely ("1;;3"),
// which is different from being explicitly 0 for many sequences, so the
// value is stored offset by one with 0 meaning "not present".
class Param {
public:
    // Larger values saturate, so "99999999999" still moves the cursor as far as possible.
    constexpr static auto max_value = u32(65535);

    // Parses a run of decimal digits. Anything else yields an omitted parameter.
    static auto parse(di::StringView digits) -> Param;

    Param() = default;

    constexpr Param(u32 value) : m_value(di::min(value, max_value) + 1) {}

    constexpr auto value() const -> u32 {
        DI_ASSERT(has_value());
        return m_value - 1;
    }

    constexpr auto has_value() const -> bool { return m_value != 0; }

    constexpr auto value_or(u32 fallback) const -> u32 {
        if (!has_value()) {
            return fallback;
        }
        return value();
    }

    auto operator==(Param const&) const -> bool = default;

private:
    u32 m_value { 0 };
};

// Subparameters are separated by `:`. A Subparams object is a view into
// the owning Params and must not outlive it.
class Subparams {
public:
    Subparams() = default;

    constexpr auto get(usize index = 0, u32 fallback = 0) const -> u32 {
        return m_subparams.at(index).value_or(Param(fallback)).value_or(fallback);
    }

    constexpr auto empty() const { return m_subparams.empty(); }
    constexpr auto size() const { return m_subparams.size(); }

    auto to_string() const -> di::String;

    auto operator==(Subparams const& other) const -> bool = default;

private:
    friend class Params;

    constexpr explicit Subparams(di::Span<Param const> subparams) : m_subparams(subparams) {}

    di::Span<Param const> m_subparams;
};

// Numeric parameters of a CSI or DCS sequence. Parameters are separated by
// `;` and subparameters by `:`.
class Params {
public:
    static auto from_string(di::StringView view) -> Params;

    Params() = default;

    constexpr Params(std::initializer_list<std::initializer_list<Param>> params) {
        for (auto const& subparams : params) {
            m_parameters.emplace_back(subparams);
        }
    }

    constexpr auto clone() const -> Params { return Params(m_parameters.clone()); }

    constexpr auto get(usize index = 0, u32 fallback = 0) const -> u32 {
        return m_parameters.at(index).and_then(di::at(0)).value_or(Param(fallback)).value_or(fallback);
    }

    // Most cursor movement and editing sequences treat both an omitted parameter
    // and an explicit 0 as 1.
    constexpr auto get_nonzero(usize index = 0, u32 fallback = 1) const -> u32 {
        auto value = get(index, fallback);
        return value == 0 ? fallback : value;
    }

    constexpr auto get_subparam(usize index = 0, usize subindex = 1, u32 fallback = 0) const -> u32 {
        return m_parameters.at(index).and_then(di::at(subindex)).value_or(Param(fallback)).value_or(fallback);
    }

    constexpr auto has(usize index) const -> bool {
        return m_parameters.at(index).and_then(di::at(0)).transform(&Param::has_value).value_or(false);
    }

    constexpr auto empty() const { return m_parameters.empty(); }
    constexpr auto size() const { return m_parameters.size(); }

    constexpr auto subparams(usize index = 0) const -> Subparams {
        auto span = m_parameters.at(index)
                        .transform([&](auto const& subparams) {
                            return subparams.span();
                        })
                        .value_or(di::Span<Param const> {});
        return Subparams(span);
    }

    // An omitted parameter is stored without any subparameters.
    constexpr void add_param(Param value) {
        if (!value.has_value()) {
            m_parameters.emplace_back();
        } else {
            m_parameters.push_back({ value });
        }
    }

    constexpr void add_subparam(Param value) {
        if (empty()) {
            add_param(value);
        } else {
            m_parameters.back().value().push_back(value);
        }
    }
    constexpr void add_subparams(di::Vector<Param> subparams) { m_parameters.push_back(di::move(subparams)); }

    auto to_string() const -> di::String;

    auto operator==(Params const& other) const -> bool = default;

private:
    constexpr explicit Params(di::Vector<di::Vector<Param>> params) : m_parameters(di::move(params)) {}

    di::Vector<di::Vector<Param>> m_parameters;
};
}
