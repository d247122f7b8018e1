// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>

namespace framescan {

class framescan_err : public std::runtime_error {
  public:
    framescan_err(const std::string &what_arg) : std::runtime_error(what_arg) {}
    framescan_err(const char *what_arg) : std::runtime_error(what_arg) {}
};

} // namespace framescan
