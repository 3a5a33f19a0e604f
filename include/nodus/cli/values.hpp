#pragma once

#include <string>
#include <string_view>

#include "nodus/cli/options.hpp"
#include "nodus/core/errors.hpp"
#include "nodus/core/value.hpp"
#include "nodus/net/message.hpp"

namespace nodus::cli {

    // One REPL token to a Value:
    //   integer -> int, decimal -> float, true/false -> bool, none -> None,
    //   @<uid> -> Pointer to that object on 'node_id', anything else -> str.
    // A malformed "@..." is Identity/InvalidIdentifier.
    [[nodiscard]] nodus::core::Status parse_value_token(std::string_view tok,
                                                        const std::string& node_id,
                                                        nodus::core::Value* out);

    // Applies parse_value_token to each argument. aux of a failure is the
    // argument index.
    [[nodiscard]] nodus::core::Status parse_value_args(const CliArgs& args,
                                                       const std::string& node_id,
                                                       nodus::net::ArgList* out);

} // namespace nodus::cli
