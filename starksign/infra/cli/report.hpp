// Copyright 2025 The Starksign Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <ostream>
#include <utility>

#include <starksign/core/common/error.hpp>
#include <starksign/infra/common/log.hpp>

namespace starksign::cmd::common {

//! \brief Prints the value or the error, returning the process exit code
//! \remarks The error goes to the error stream whatever the log verbosity is
template <class T, class Printer>
int report(const Result<T>& result, Printer&& print, std::ostream& err = std::cerr) {
    if (!result) {
        const auto error{result.error().to_string()};
        log::Error("Operation failed", {"error", error});
        err << "\nError: " << error << "\n\n";
        return 1;
    }
    std::forward<Printer>(print)(*result);
    return 0;
}

}  // namespace starksign::cmd::common
