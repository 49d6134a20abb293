#include "state_space/RtsSmoother.hpp"
#include "exceptions/Exceptions.hpp"

#include <string>

namespace citerate {

SmoothOutput RtsSmoother::smooth(const FilterOutput& filtered) const {
    const Eigen::Index T = filtered.size();

    SmoothOutput out;
    out.mean.resize(T);
    out.var.resize(T);
    if (T == 0) {
        return out;
    }

    out.mean(T - 1) = filtered.filtered_mean(T - 1);
    out.var(T - 1) = filtered.filtered_var(T - 1);

    for (Eigen::Index t = T - 2; t >= 0; --t) {
        const double gain = filtered.filtered_var(t) / filtered.predicted_var(t + 1);
        out.mean(t) = filtered.filtered_mean(t) +
                      gain * (out.mean(t + 1) - filtered.predicted_mean(t + 1));
        out.var(t) = filtered.filtered_var(t) +
                     gain * gain * (out.var(t + 1) - filtered.predicted_var(t + 1));

        if (!(out.var(t) >= 0.0)) {
            THROW_NUMERICAL("RtsSmoother::smooth",
                            "Smoothed variance is negative or NaN at step " + std::to_string(t) +
                            " (" + std::to_string(out.var(t)) + ")");
        }
    }

    return out;
}

} // namespace citerate
