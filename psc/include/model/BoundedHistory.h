// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PSC (Player State Coordinator).

#pragma once

#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace PSC {

/**
 * @brief Append-only record buffer that drops its oldest entry once full
 *
 * Not synchronized; owners guard it with their own mutex.
 */
template <typename T> class BoundedHistory {
public:
    explicit BoundedHistory(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(T entry) {
        entries_.push_back(std::move(entry));
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    std::vector<T> snapshot() const {
        return std::vector<T>(entries_.begin(), entries_.end());
    }

private:
    size_t capacity_;
    std::deque<T> entries_;
};

}  // namespace PSC
