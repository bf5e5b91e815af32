#pragma once

namespace knotstore {

    /// Visitor built from lambdas, for std::visit over message and event variants
    template <class... Ts> struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace knotstore
