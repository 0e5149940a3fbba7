// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "label_rules.hpp"

namespace labelguard {

bool isWellFormedLabel(std::string_view label) {
    if (label.empty() || label.size() > MAX_LABEL_LENGTH) {
        return false;
    }

    if (label.front() == '-' || label.back() == '-') {
        return false;
    }

    for (char c : label) {
        if (!isLabelChar(c)) {
            return false;
        }
    }

    return true;
}

} // namespace labelguard
