/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/errors.hpp>

namespace satlink {

std::ostream& operator<<(std::ostream &os, const PropagationErrorCode &code) {
    switch (code) {
        case PropagationErrorCode::Decayed:
            return os << "decayed";
        case PropagationErrorCode::InvalidElements:
            return os << "invalid elements";
        case PropagationErrorCode::NumericalFailure:
            return os << "numerical failure";
    }
    return os << "unknown";
}

}
