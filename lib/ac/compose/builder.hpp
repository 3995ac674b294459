/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_BUILDER_HPP
#define ADA_COMPOSER_COMPOSE_BUILDER_HPP

#include <ac/cardano/keys.hpp>
#include <ac/compose/request.hpp>

namespace ada_composer::compose {
    struct unsigned_tx {
        cardano::tx_hash id {};
        uint64_t fee = 0;
        uint8_vector body {};
    };

    struct signed_tx {
        cardano::tx_hash id {};
        uint8_vector cbor {};
    };

    // Balances, prices and signs a request; implemented outside of this library
    struct tx_builder {
        virtual ~tx_builder() =default;

        [[nodiscard]] unsigned_tx build(const tx_request &req) const
        {
            return _build_impl(req);
        }

        [[nodiscard]] signed_tx build_and_sign(const tx_request &req, const cardano::signing_key_list &keys) const
        {
            if (keys.empty())
                throw no_signing_key_error("a transaction cannot be signed without signing keys");
            return _build_and_sign_impl(req, keys);
        }
    private:
        virtual unsigned_tx _build_impl(const tx_request &) const =0;
        virtual signed_tx _build_and_sign_impl(const tx_request &, const cardano::signing_key_list &) const =0;
    };
}

#endif // !ADA_COMPOSER_COMPOSE_BUILDER_HPP
