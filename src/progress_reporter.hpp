#pragma once

#include "ir/measurement_record.types.hpp"

#include <cstddef>

namespace qviz {

// Observer for step playback, log events and state refreshes. A renderer
// implements it to redraw after every edit or step; tests record what it receives.
class ProgressReporter {
  public:
    virtual ~ProgressReporter() = default;

    // Called on rewind with the number of entries playback will walk.
    virtual void set_total_steps(std::size_t total_steps) = 0;
    virtual void increment_completed_steps(std::size_t delta = 1) = 0;
    virtual void record_log(const ExecutionLog& log) = 0;

    // The live amplitudes changed; `position` of `total_steps` gates applied.
    virtual void state_updated(std::size_t /*position*/, std::size_t /*total_steps*/) {}
};

}  // namespace qviz
