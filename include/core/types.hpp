#pragma once

// Standard size_t definition for freestanding builds (LP64)
typedef unsigned long size_t;

namespace strata::system {

using u8  = unsigned char;
using u16 = unsigned short;
using u32 = unsigned int;
using u64 = unsigned long long;

using i8  = signed char;
using i16 = signed short;
using i32 = signed int;
using i64 = signed long long;

using uintptr_t = unsigned long;
using intptr_t = signed long;

static_assert(sizeof(uintptr_t) == sizeof(void*), "uintptr_t must hold a pointer");
static_assert(sizeof(u64) == 8, "u64 must be 64 bits wide");

} // namespace strata::system
