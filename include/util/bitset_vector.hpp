#pragma once
// A simple dynamic bitset backed by 64-bit words. Bounds-checked gets in debug only.
// Used for per-node flags over interned ids (store membership, BFS seen-set).

#include <vector>
#include <cstdint>
#include <cstddef>
#include <cassert>
#include <algorithm>

struct BitsetVector {
    std::vector<std::uint64_t> words{};
    std::size_t n_bits{0};

    BitsetVector() = default;
    explicit BitsetVector(std::size_t n) { resize(n); }

    // Grows (or shrinks) keeping existing bits; new bits are clear.
    void resize(std::size_t n) {
        n_bits = n;
        words.resize((n + 63) / 64, 0ull);
        const std::size_t tail = n & 63;
        if (tail && !words.empty()) words.back() &= (1ull << tail) - 1;
    }
    void reset() { std::fill(words.begin(), words.end(), 0ull); }
    std::size_t size() const noexcept { return n_bits; }

    inline void set(std::size_t i, bool val = true) {
        assert(i < n_bits);
        const std::size_t w = i >> 6;
        const std::size_t b = i & 63;
        const std::uint64_t mask = 1ull << b;
        if (val) words[w] |= mask; else words[w] &= ~mask;
    }
    inline bool get(std::size_t i) const {
        assert(i < n_bits);
        const std::size_t w = i >> 6;
        const std::size_t b = i & 63;
        return (words[w] >> b) & 1ull;
    }

    // Sets bit i; returns true if it was previously clear.
    inline bool test_and_set(std::size_t i) {
        assert(i < n_bits);
        std::uint64_t& w = words[i >> 6];
        const std::uint64_t mask = 1ull << (i & 63);
        const bool was_clear = (w & mask) == 0;
        w |= mask;
        return was_clear;
    }
};
