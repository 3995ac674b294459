/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_REQUEST_HPP
#define ADA_COMPOSER_COMPOSE_REQUEST_HPP

#include <ac/cardano/cert.hpp>
#include <ac/cardano/native-script.hpp>
#include <ac/compose/metadata.hpp>

namespace ada_composer::compose {
    // reward address bytes -> lovelace
    using withdrawal_map = map<uint8_vector, uint64_t>;

    // The fully resolved plan handed over to a transaction builder
    struct tx_request {
        cardano::utxo_list inputs {};
        vector<cardano::tx_output> outputs {};
        cardano::policy_map mint {};
        cardano::native_script::script_list scripts {};
        cardano::cert_list certs {};
        withdrawal_map withdrawals {};
        metadata_map metadata {};
        std::optional<cardano::address> change_address {};
        bool merge_change = true;
        std::optional<uint64_t> ttl {};

        // checks the cross-field consistency; throws on the first problem
        void validate() const;

        uint64_t input_coin() const;
        uint64_t output_coin() const;
        // the CBOR of the auxiliary data or an empty vector when there is no metadata
        uint8_vector aux_cbor() const;
        uint8_vector body_cbor(uint64_t fee) const;
    };
}

#endif // !ADA_COMPOSER_COMPOSE_REQUEST_HPP
