// config.hpp
#pragma once
#include <cstdint>
#include <cstddef>
#include <limits>

// Compile-time configuration for core facilities.
//
// Node identifiers are interned to dense integers; 32 bits covers the full
// article set with room to spare and halves the memory of every table that
// is indexed by node.

#ifndef FIRSTLINK_NODE_ID_T
#define FIRSTLINK_NODE_ID_T std::uint32_t
#endif

#ifndef FIRSTLINK_DEFAULT_TARGET
#define FIRSTLINK_DEFAULT_TARGET "Philosophy"
#endif

#ifndef FIRSTLINK_DEFAULT_SEED
#define FIRSTLINK_DEFAULT_SEED 123456789ULL
#endif

// Global hardening switch for optional runtime assertions in debug/testing code.
// Set via compile flag: -DFIRSTLINK_HARDENED=1
#ifndef FIRSTLINK_HARDENED
#define FIRSTLINK_HARDENED 0
#endif

#if FIRSTLINK_HARDENED
#include <stdexcept>
#define FIRSTLINK_ASSERT_H(cond, msg) do { if(!(cond)) throw std::runtime_error(msg); } while(0)
#else
#define FIRSTLINK_ASSERT_H(cond, msg) do { } while(0)
#endif

namespace core {

using node_id  = FIRSTLINK_NODE_ID_T;
using size_t   = std::size_t;
using distance_t = std::uint32_t;

// Reserved id values; never handed out by the interner.
inline constexpr node_id no_node = std::numeric_limits<node_id>::max();
inline constexpr distance_t no_distance = std::numeric_limits<distance_t>::max();

inline constexpr const char* default_target = FIRSTLINK_DEFAULT_TARGET;

} // namespace core
