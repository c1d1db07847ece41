#pragma once

#include "snotes/token/token_generator.h"

#include <cstddef>
#include <ostream>

// execute_mint draws count tokens from generator and prints them as a JSON array. Each
// entry carries the token, its numeric id and the decomposed Snowflake fields.
// Takes only interface types; generator errors propagate.
int execute_mint(snotes::token::ITokenGenerator& generator, std::size_t count, std::ostream& out);
