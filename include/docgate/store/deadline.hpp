/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file deadline.hpp
 * @brief Per-operation time budget for long scans.
 */

#pragma once

#include "docgate/store/store.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace docgate::store {

/**
 * @class Deadline
 * @brief Started when an operation begins; `check()` is called once per scanned item.
 *
 * The clock is sampled on the first call and every 64th call after that.
 */
class Deadline {
  public:
    explicit Deadline(std::chrono::seconds budget)
        : budget_(budget), end_(std::chrono::steady_clock::now() + budget)
    {
    }

    /// @throws StoreError once the budget is spent.
    void check()
    {
        if ((ticks_++ & 63U) != 0) {
            return;
        }
        if (std::chrono::steady_clock::now() >= end_) {
            throw StoreError("Operation exceeded time limit of " +
                             std::to_string(budget_.count()) + "s");
        }
    }

  private:
    std::chrono::seconds budget_;
    std::chrono::steady_clock::time_point end_;
    std::uint32_t ticks_ = 0;
};

} // namespace docgate::store
