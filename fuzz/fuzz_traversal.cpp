/**
 * @file  fuzz_traversal.cpp
 * @brief libFuzzer target for AdjustedArray construction and traversal.
 *
 * Build:
 *   cmake -DADJARR_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_traversal
 *
 * Run for 60 seconds:
 *   ./fuzz_traversal -max_total_time=60
 *
 * Input layout (bytes consumed front to back, missing bytes read as 0):
 *   [0] rows − 1 (mod 32)    [1] cols − 1 (mod 8)    [2] window length
 *   [3] bounds policy (odd = Clip)
 *   then 7-byte adjustment records until the input is exhausted:
 *     key, kind, first_row, last_row, first_col, last_col, value
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Bad input is reported only through adjarr::Error subclasses.
 *   3. A constructed array traverses rows − w + 1 windows of shape w × cols.
 *   4. Two traversals of the same array produce identical windows.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "adjarr/adjusted_array.hpp"
#include "adjarr/errors.hpp"

using namespace adjarr;

namespace {

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool empty() const { return pos_ >= size_; }

    uint8_t next() { return pos_ < size_ ? data_[pos_++] : 0; }

private:
    const uint8_t* data_;
    size_t         size_;
    size_t         pos_ = 0;
};

Float64Matrix fill(Index rows, Index cols) {
    Float64Matrix m(rows, cols);
    for (Index r = 0; r < rows; ++r) {
        for (Index c = 0; c < cols; ++c) {
            m(r, c) = static_cast<double>(r * cols + c);
        }
    }
    return m;
}

}  // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    ByteReader in(data, size);

    const Index rows = in.next() % 32 + 1;
    const Index cols = in.next() % 8 + 1;
    const Index w    = static_cast<Index>(static_cast<int8_t>(in.next()));

    AdjustedArrayConfig config;
    config.bounds_policy = (in.next() & 1) ? BoundsPolicy::Clip : BoundsPolicy::Reject;

    AdjustmentSchedule schedule;
    try {
        while (!in.empty()) {
            const Index key  = static_cast<Index>(in.next()) - 4;
            const auto  kind = static_cast<AdjustmentKind>(in.next() % 3);
            const Index r0   = in.next() % 40;
            const Index r1   = in.next() % 40;
            const Index c0   = in.next() % 10;
            const Index c1   = in.next() % 10;
            const double v   = static_cast<double>(static_cast<int8_t>(in.next())) / 8.0;
            schedule[key].push_back(make_adjustment(kind, r0, r1, c0, c1, v));
        }
    } catch (const AdjustmentError&) {
        return 0;  // malformed record
    }

    // Int64Overwrite records make a float64 schedule invalid; both outcomes
    // are exercised.
    try {
        const auto array = AdjustedArray::from_float64(fill(rows, cols), NOMASK,
                                                       schedule, 0.0, config);

        std::vector<Float64Matrix> first;
        for (const Window& window : array.traverse(w)) {
            assert(window.rows() == w);
            assert(window.cols() == cols);
            first.emplace_back(window.float64());
        }
        assert(static_cast<Index>(first.size()) == rows - w + 1);

        std::size_t i = 0;
        for (const Window& window : array.traverse(w)) {
            assert(Float64Matrix(window.float64()) == first[i]);
            ++i;
        }
        assert(i == first.size());
    } catch (const Error&) {
        // ConfigurationError, AdjustmentError or a window-length error.
    }

    return 0;
}
