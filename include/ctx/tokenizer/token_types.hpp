// include/ctx/tokenizer/token_types.hpp
#pragma once

#include <cstdint>

namespace ctx {

using TokenID = std::uint32_t;

} // namespace ctx
