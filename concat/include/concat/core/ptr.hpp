#pragma once

namespace concat {
template <typename Type>
using Ptr = Type*;
} // namespace concat
