#pragma once

#include "prelude.hh"

namespace cfg {
    enum class id: uint16_t {
#define CFG(name_,key_) name_ = key_,
#include "def/cfg.def"
#undef CFG
    };

    constexpr id ALL_IDS[] = {
#define CFG(name_,key_) id::name_,
#include "def/cfg.def"
#undef CFG
    };

    constexpr size_t N_PARAMS = sizeof(ALL_IDS) / sizeof(ALL_IDS[0]);

    inline char const *id_name(id key)
    {
        switch (key) {
#define CFG(name_,key_) case id::name_: return stringify(name_);
#include "def/cfg.def"
#undef CFG
        }
        return "?";
    }
}
