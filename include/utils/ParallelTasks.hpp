#ifndef PARALLEL_TASKS_HPP
#define PARALLEL_TASKS_HPP

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace citerate {

/**
 * @brief Run task(i) for every i in [0, count) on up to num_threads OpenMP threads.
 *
 * Tasks are independent. An exception thrown by one task is caught inside
 * the parallel region and its message stored at that task's index; the
 * remaining tasks still run. Successful tasks leave their entry empty.
 */
template <typename Task>
std::vector<std::optional<std::string>> runIndependentTasks(int count, int num_threads, Task&& task) {
    std::vector<std::optional<std::string>> errors(count > 0 ? static_cast<size_t>(count) : 0);
    if (num_threads < 1) num_threads = 1;

    #pragma omp parallel for num_threads(num_threads) schedule(dynamic)
    for (int i = 0; i < count; ++i) {
        try {
            task(i);
        } catch (const std::exception& e) {
            errors[i] = e.what();
        }
    }
    return errors;
}

} // namespace citerate

#endif // PARALLEL_TASKS_HPP
