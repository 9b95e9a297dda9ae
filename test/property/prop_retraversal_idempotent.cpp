/**
 * @file  prop_retraversal_idempotent.cpp
 * @brief Property: traversing the same AdjustedArray twice yields identical
 *        windows, and the window ending at row k shows every adjustment keyed
 *        at or before k and none keyed after it.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_retraversal_idempotent
 *
 * The second property rebuilds the expected buffer for each window from the
 * baseline by applying every adjustment keyed ≤ window.last_row() directly,
 * so both missing and premature adjustments are caught.
 */

#include <rapidcheck.h>

#include "adjarr/adjusted_array.hpp"

#include <variant>
#include <vector>

using namespace adjarr;

namespace {

/// Random schedule over a rows × cols buffer. The value written is 1000 + key.
AdjustmentSchedule random_schedule(Index rows, Index cols) {
    AdjustmentSchedule schedule;
    const auto n = *rc::gen::inRange(0, 12);
    for (int i = 0; i < n; ++i) {
        const auto key = *rc::gen::inRange<Index>(0, rows + 2);
        const auto r0  = *rc::gen::inRange<Index>(0, rows);
        const auto r1  = *rc::gen::inRange<Index>(r0, rows);
        const auto c0  = *rc::gen::inRange<Index>(0, cols);
        const auto c1  = *rc::gen::inRange<Index>(c0, cols);
        schedule[key].push_back(
            Float64Overwrite(r0, r1, c0, c1, 1000.0 + static_cast<double>(key)));
    }
    return schedule;
}

/// Random overwrites and exact multiplies (by 2 or −1).
AdjustmentSchedule random_mixed_schedule(Index rows, Index cols) {
    AdjustmentSchedule schedule;
    const auto n = *rc::gen::inRange(0, 12);
    for (int i = 0; i < n; ++i) {
        const auto key = *rc::gen::inRange<Index>(0, rows + 2);
        const auto r0  = *rc::gen::inRange<Index>(0, rows);
        const auto r1  = *rc::gen::inRange<Index>(r0, rows);
        const auto c0  = *rc::gen::inRange<Index>(0, cols);
        const auto c1  = *rc::gen::inRange<Index>(c0, cols);
        if (*rc::gen::arbitrary<bool>()) {
            const double v = static_cast<double>(*rc::gen::inRange(-50, 50));
            schedule[key].push_back(Float64Overwrite(r0, r1, c0, c1, v));
        } else {
            const double m = *rc::gen::element(2.0, -1.0);
            schedule[key].push_back(Float64Multiply(r0, r1, c0, c1, m));
        }
    }
    return schedule;
}

/// Baseline with every adjustment keyed at or before `last_row` applied
/// directly, in key order then list order.
Float64Matrix applied_through(const Float64Matrix& baseline,
                              const AdjustmentSchedule& schedule,
                              Index last_row) {
    Float64Matrix out = baseline;
    for (const auto& [key, list] : schedule) {
        if (key > last_row) {
            break;
        }
        for (const Adjustment& adj : list) {
            const Region& r = region_of(adj);
            auto block = out.block(r.first_row, r.first_col, r.rows(), r.cols());
            if (const auto* m = std::get_if<Float64Multiply>(&adj)) {
                block *= m->value();
            } else {
                block.setConstant(std::get<Float64Overwrite>(adj).value());
            }
        }
    }
    return out;
}

}  // anonymous namespace

int main() {
    // ── Property 1: two traversals produce the same windows ──────────────────
    rc::check(
        "retraversal: identical windows on every pass",
        []() {
            const auto rows = *rc::gen::inRange<Index>(1, 30);
            const auto cols = *rc::gen::inRange<Index>(1, 5);
            const auto w    = *rc::gen::inRange<Index>(1, rows + 1);

            const auto array = AdjustedArray::from_float64(
                Float64Matrix::Zero(rows, cols), NOMASK, random_schedule(rows, cols));

            std::vector<Float64Matrix> first;
            for (const Window& window : array.traverse(w)) {
                first.emplace_back(window.float64());
            }

            std::size_t i = 0;
            for (const Window& window : array.traverse(w)) {
                RC_ASSERT(i < first.size());
                RC_ASSERT(Float64Matrix(window.float64()) == first[i]);
                ++i;
            }
            RC_ASSERT(i == first.size());
            RC_ASSERT((array.baseline_float64().array() == 0.0).all());
        }
    );

    // ── Property 2: window ending at k == every key <= k applied ────────────
    rc::check(
        "retraversal: window ending at row k shows exactly the keys <= k",
        []() {
            const auto rows = *rc::gen::inRange<Index>(1, 30);
            const auto cols = *rc::gen::inRange<Index>(1, 5);
            const auto w    = *rc::gen::inRange<Index>(1, rows + 1);

            Float64Matrix baseline(rows, cols);
            for (Index r = 0; r < rows; ++r) {
                for (Index c = 0; c < cols; ++c) {
                    baseline(r, c) = static_cast<double>(*rc::gen::inRange(-50, 50));
                }
            }
            const AdjustmentSchedule schedule = random_mixed_schedule(rows, cols);
            const auto array = AdjustedArray::from_float64(baseline, NOMASK, schedule);

            auto traversal = array.traverse(w);
            while (auto window = traversal.next()) {
                const Float64Matrix expected = applied_through(baseline, schedule,
                                                               window->last_row());
                RC_ASSERT(Float64Matrix(window->float64()) ==
                          Float64Matrix(expected.middleRows(window->offset(), w)));
            }
        }
    );

    return 0;
}
