#ifndef RTS_SMOOTHER_HPP
#define RTS_SMOOTHER_HPP

#include "state_space/StateSpaceTypes.hpp"

namespace citerate {

/**
 * @brief Rauch-Tung-Striebel backward pass for the local-level model.
 *
 * Refines a complete forward pass using all observations. The terminal
 * smoothed state equals the terminal filtered state; a single-step series
 * is returned unchanged.
 */
class RtsSmoother {
public:
    RtsSmoother() = default;

    /**
     * @throws NumericalException if a smoothed variance comes out negative.
     */
    SmoothOutput smooth(const FilterOutput& filtered) const;
};

} // namespace citerate

#endif // RTS_SMOOTHER_HPP
