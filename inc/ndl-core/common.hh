#pragma once

#include <cstddef>
#include <cstdint>
#include "ndl-core/config.hh"
#include "robin_hood.h"

namespace ndl {

    template <typename K, typename V>
    using UnstableHashMap = robin_hood::unordered_flat_map<K, V>;

    #if (NDL_CONFIG_SIZEOF_VOID_P==8)
        using Word = uint64_t;
    #else
        #error "Unknown NDL_CONFIG_SIZEOF_VOID_P value: expected 64-bit only"
    #endif
    static_assert(sizeof(void*) == sizeof(Word), "needle only runs on 64-bit hosts");

    constexpr inline size_t KIBIBYTES(size_t num) { return num << 10; }
    constexpr inline size_t MIBIBYTES(size_t num) { return KIBIBYTES(num) << 10; }

}   // namespace ndl
