#pragma once

#include "../Utils/Types.hpp"

namespace switchboard::core::runtime {
  /**
   * @struct RuntimeConfig
   * @brief Tuning knobs for Runtime.
   */
  struct RuntimeConfig {
    utils::types::usize workerThreads = 2; ///< Executor workers running task actions (0 is treated as 1).
  };
} // namespace switchboard::core::runtime
