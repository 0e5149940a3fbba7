// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "reserved_words.hpp"

namespace labelguard {

const std::unordered_set<std::string_view>& reserved_words() {
    // Function-local static: initialized exactly once, concurrent first callers wait
    static const std::unordered_set<std::string_view> instance{
        "shuttleapp", "shuttle", "console", "unstable", "staging"};
    return instance;
}

bool isReservedWord(std::string_view name) {
    return reserved_words().contains(name);
}

} // namespace labelguard
