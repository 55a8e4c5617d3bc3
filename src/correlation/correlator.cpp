#include "normxcorr/correlation/correlator.hpp"
#include "normxcorr/core/errors.hpp"
#include "normxcorr/correlation/transform.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace normxcorr::correlation {

FrequencyGrid conjugate_product(const FrequencyGrid& a, const FrequencyGrid& b) {
    if (a.width() != b.width() || a.height() != b.height()) {
        throw TransformError("spectra differ in size");
    }
    FrequencyGrid out;
    out.re = (a.re.array() * b.re.array() + a.im.array() * b.im.array()).matrix();
    out.im = (a.re.array() * b.im.array() - a.im.array() * b.re.array()).matrix();
    return out;
}

Matrix2Dd cross_correlate(const Matrix2Dd& kernel, const Matrix2Dd& signal) {
    if (kernel.rows() != signal.rows() || kernel.cols() != signal.cols()) {
        throw TransformError("correlation operands must share the padded size");
    }
    const FrequencyGrid k = forward_transform(kernel);
    const FrequencyGrid s = forward_transform(signal);
    return inverse_transform(conjugate_product(k, s));
}

void run_fork_join(const std::vector<Task>& tasks, const TaskLauncher& launch) {
    std::vector<std::exception_ptr> errors(tasks.size());
    std::vector<std::thread> workers;
    workers.reserve(tasks.size());

    auto join_all = [&workers]() {
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    };

    try {
        for (size_t i = 0; i < tasks.size(); ++i) {
            workers.push_back(launch([&tasks, &errors, i]() {
                try {
                    tasks[i]();
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }));
        }
    } catch (const std::system_error& e) {
        join_all();
        throw TransformError(std::string("cannot start correlation worker: ") + e.what());
    } catch (const std::exception&) {
        join_all();
        throw;
    }
    join_all();

    for (const auto& err : errors) {
        if (err) {
            std::rethrow_exception(err);
        }
    }
}

void run_fork_join(const std::vector<Task>& tasks) {
    run_fork_join(tasks, [](Task task) { return std::thread(std::move(task)); });
}

CorrelationTerms correlate_terms(const PaddedOperands& ops, bool parallel) {
    CorrelationTerms terms;

    const std::vector<Task> tasks = {
        [&]() { terms.cross = cross_correlate(ops.template_zero_mean, ops.search_zero_mean); },
        [&]() { terms.energy = cross_correlate(ops.unit_mask, ops.search_squared); },
        [&]() { terms.local_sum = cross_correlate(ops.unit_mask, ops.search); }
    };

    if (!parallel) {
        for (const auto& task : tasks) {
            task();
        }
        return terms;
    }

    run_fork_join(tasks);
    return terms;
}

} // namespace normxcorr::correlation
