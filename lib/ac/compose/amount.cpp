/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <limits>
#include <ac/compose/amount.hpp>

namespace ada_composer::compose {
    static constexpr double lovelace_per_ada = static_cast<double>(cardano::lovelace_per_ada);

    static int64_t to_minor(const double v)
    {
        if (!std::isfinite(v) || std::fabs(v) >= static_cast<double>(std::numeric_limits<int64_t>::max())) [[unlikely]]
            throw amount_error(fmt::format("amount value {} is out of range!", v));
        return static_cast<int64_t>(std::trunc(v));
    }

    // drops the binary noise below a millionth of a lovelace so that 1.005 ada is 1005000 lovelace
    static int64_t ada_to_minor(const double v)
    {
        return to_minor(std::round(v * lovelace_per_ada * 1e6) / 1e6);
    }

    amount amount::from_json(const json::value &j)
    {
        switch (j.kind()) {
            case json::kind::int64:
                return lovelace { j.get_int64() };
            case json::kind::uint64:
                return lovelace { to_minor(static_cast<double>(j.get_uint64())) };
            case json::kind::double_: {
                const auto v = j.get_double();
                if (std::trunc(v) != v) [[unlikely]]
                    throw type_mismatch_error(fmt::format("a lovelace amount must be a whole number but got {}", v));
                return lovelace { to_minor(v) };
            }
            case json::kind::object: {
                const auto &obj = j.get_object();
                if (obj.size() == 1) {
                    if (const auto *v = obj.if_contains("lovelace"); v && v->is_int64())
                        return lovelace { v->get_int64() };
                    if (const auto *v = obj.if_contains("ada"); v && v->is_number())
                        return ada { v->to_number<double>() };
                }
                throw type_mismatch_error(fmt::format("an amount object must have either a lovelace or an ada member: {}", json::serialize(j)));
            }
            default:
                throw type_mismatch_error(fmt::format("an amount must be a number or an object but got: {}", json::serialize(j)));
        }
    }

    amount::amount(const double value, const compose::unit u): _unit { u }
    {
        _set(value);
    }

    void amount::_set(const double v)
    {
        if (_unit == compose::unit::lovelace) {
            _set_minor(to_minor(v));
        } else {
            if (!std::isfinite(v)) [[unlikely]]
                throw amount_error(fmt::format("amount value {} is not finite!", v));
            _value = v;
            _ada = v;
            _lovelace = ada_to_minor(v);
        }
    }

    void amount::_set_minor(const int64_t v)
    {
        if (_unit != compose::unit::lovelace) [[unlikely]]
            throw amount_error("only lovelace amounts can be assigned an integer value!");
        _lovelace = v;
        _value = static_cast<double>(v);
        _ada = static_cast<double>(v) / lovelace_per_ada;
    }

    lovelace amount::as_lovelace() const
    {
        return lovelace { _lovelace };
    }

    ada amount::as_ada() const
    {
        return ada { _ada };
    }

    std::string amount::to_string() const
    {
        if (_unit == compose::unit::lovelace)
            return fmt::format("{}", _lovelace);
        return fmt::format("{}", _value);
    }
}
