#pragma once

#include "normxcorr/core/types.hpp"
#include "normxcorr/correlation/padding.hpp"

#include <functional>
#include <thread>
#include <vector>

namespace normxcorr::correlation {

// Raw spatial cross terms on the padded canvas (sums, not yet divided by the
// template area).
struct CorrelationTerms {
    Matrix2Dd cross;     // A: T' against L - mean(L)
    Matrix2Dd energy;    // B: U against L^2
    Matrix2Dd local_sum; // C: U against L
};

// conj(a) * b, element-wise:
// (a.re*b.re + a.im*b.im, a.re*b.im - a.im*b.re)
FrequencyGrid conjugate_product(const FrequencyGrid& a, const FrequencyGrid& b);

// Circular cross-correlation out(y, x) = sum kernel(j, i) * signal(j + y, i + x)
// evaluated through one forward transform per operand and one inverse.
Matrix2Dd cross_correlate(const Matrix2Dd& kernel, const Matrix2Dd& signal);

using Task = std::function<void()>;
using TaskLauncher = std::function<std::thread(Task)>;

// Starts every task through launch and joins all started threads before
// returning. A task exception is rethrown after the join; a launch failure
// (std::system_error) joins what already runs and surfaces as TransformError.
void run_fork_join(const std::vector<Task>& tasks, const TaskLauncher& launch);
void run_fork_join(const std::vector<Task>& tasks);

// Computes the three terms. With parallel set, each term runs on its own
// thread and the call joins all of them before returning; the first failure
// is rethrown after the join.
CorrelationTerms correlate_terms(const PaddedOperands& ops, bool parallel);

} // namespace normxcorr::correlation
