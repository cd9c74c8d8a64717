#include "vtcore/params.h"

#include "di/container/view/transform.h"
#include "di/format/prelude.h"

namespace vtcore {
auto Param::parse(di::StringView digits) -> Param {
    if (digits.empty()) {
        return {};
    }

    auto value = u32(0);
    for (auto code_point : digits) {
        if (code_point < U'0' || code_point > U'9') {
            return {};
        }
        value = di::min(value * 10 + u32(code_point - U'0'), max_value + 1);
    }
    return value;
}

auto Params::from_string(di::StringView view) -> Params {
    if (view.empty()) {
        return {};
    }

    auto params = view | di::split(U';') | di::transform([](di::StringView nums) -> di::Vector<Param> {
                      return nums | di::split(U':') | di::transform(Param::parse) | di::to<di::Vector>();
                  }) |
                  di::to<di::Vector>();
    return Params(di::move(params));
}

auto Subparams::to_string() const -> di::String {
    return m_subparams | di::transform([](Param param) -> di::String {
               if (!param.has_value()) {
                   return {};
               }
               return di::to_string(param.value());
           }) |
           di::join_with(U':') | di::to<di::String>();
}

auto Params::to_string() const -> di::String {
    return m_parameters | di::transform([&](auto const& subparams) {
               return Subparams(subparams.span()).to_string();
           }) |
           di::join_with(U';') | di::to<di::String>();
}
}
