#pragma once

#include "prelude.hh"
#include "cfg/ids.hh"
#include "cfg/backend.hh"
#include "cfg/types.hh"

namespace cfg {
    /**
     * @brief A typed, versioned record in a `backend`.
     *
     * Bump the version whenever `T` changes layout; records written under
     * another version are treated as missing.
     */
    template<typename T>
    struct param {
        constexpr param(id key, uint16_t version):
            key(key),
            version(version)
        {}

        ret_code_t get(backend &store, T &value) const
        {
            auto record = param_value<T>();

            ret_code_t const ret = store.read(key, &record, sizeof(record));
            VERIFY_SUCCESS(ret);

            if (record.version != version)
                return ERROR_WRONG_VERSION;

            value = record.value;
            return NRF_SUCCESS;
        }

        ret_code_t set(backend &store, T const &value) const
        {
            auto const record = param_value<T>(value, version);
            return store.write(key, &record, sizeof(record));
        }

        /**
         * @brief `get`, except a missing or stale record is replaced by `defaults`.
         */
        ret_code_t load(backend &store, T &value, T const &defaults) const
        {
            ret_code_t const ret = get(store, value);
            if (ret != NRF_ERROR_NOT_FOUND && ret != ERROR_WRONG_VERSION)
                return ret;

            value = defaults;
            return set(store, value);
        }

        id const key;
        uint16_t const version;
    };

    namespace strip {
        constexpr auto config = param<strip_config_t>(id::strip, 1);
    }

    /**
     * @brief Read the strip configuration once at boot.
     *
     * A missing or stale record is written back with the defaults. Out-of-range
     * values are sanitized in `config` only, the stored record keeps them.
     */
    ret_code_t load_strip_config(backend &store, strip_config_t &config);
}
