/// @file src/engine/apply_adjustment.cpp
/// @brief Per-kind adjustment kernels over Eigen blocks.

#include "apply_adjustment.hpp"

#include "adjarr/errors.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace adjarr::detail {

namespace {

template <typename T>
auto block_of(Matrix<T>& m, const Region& r) {
    return m.block(r.first_row, r.first_col, r.rows(), r.cols());
}

template <typename Expected, typename Buffer>
Expected& buffer_as(Buffer& buffer, AdjustmentKind kind) {
    auto* target = std::get_if<Expected>(&buffer);
    if (target == nullptr) {
        throw DtypeError(fmt::format(
            "{} cannot be applied to this buffer", to_string(kind)));
    }
    return *target;
}

}  // anonymous namespace

void apply_adjustment(WindowTraversal::Buffer& buffer, const Adjustment& adj) {
    std::visit([&buffer](const auto& a) {
        using A = std::decay_t<decltype(a)>;

        if constexpr (std::is_same_v<A, Float64Multiply>) {
            block_of(buffer_as<Float64Matrix>(buffer, A::kind), a.region()) *= a.value();
        } else if constexpr (std::is_same_v<A, Float64Overwrite>) {
            block_of(buffer_as<Float64Matrix>(buffer, A::kind), a.region())
                .setConstant(a.value());
        } else if constexpr (std::is_same_v<A, Int64Overwrite>) {
            block_of(buffer_as<Int64Matrix>(buffer, A::kind), a.region())
                .setConstant(a.value());
        } else if constexpr (std::is_same_v<A, Datetime64Overwrite>) {
            block_of(buffer_as<Int64Matrix>(buffer, A::kind), a.region())
                .setConstant(a.value().value);
        } else {
            static_assert(std::is_same_v<A, ObjectOverwrite>);
            buffer_as<LabelArray>(buffer, A::kind).assign(a.region(), a.value());
        }
    }, adj);
}

}  // namespace adjarr::detail
