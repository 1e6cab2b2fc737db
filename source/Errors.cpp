// SPDX-License-Identifier: Apache-2.0
#include "Errors.hpp"
#include <iostream>

static void reportCause(const std::exception& error, std::ostream& os) {
    os << "verus-strip: caused by: " << error.what() << "\n";
    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& nested) {
        reportCause(nested, os);
    }
}

void reportError(const std::exception& error, std::ostream& os) {
    os << "verus-strip: error: " << error.what() << "\n";
    if (auto stripError = dynamic_cast<const StripError*>(&error)) {
        if (!stripError->getHint().empty()) {
            os << "verus-strip: hint: " << stripError->getHint() << "\n";
        }
    }
    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& nested) {
        reportCause(nested, os);
    }
}
