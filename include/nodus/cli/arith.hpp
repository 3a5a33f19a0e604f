#pragma once

#include "nodus/node/framework.hpp"

namespace nodus::cli {

    // Built-in framework "arith":
    //   arith.add(x...)          sum, 0 for no arguments
    //   arith.mul(x...)          product, 1 for no arguments
    //   arith.Accumulator([x])   instance holding a running total (default 0)
    //     .add(x...)             adds to the total, returns the new total
    //     .total()               current total
    //     .reset()               total back to 0
    // Ints stay ints until a float joins in. Non-numeric arguments and i64
    // overflow are Framework/Invalid with aux = argument index.
    [[nodiscard]] nodus::node::Framework arith_framework();

} // namespace nodus::cli
