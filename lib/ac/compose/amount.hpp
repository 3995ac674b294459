/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef ADA_COMPOSER_COMPOSE_AMOUNT_HPP
#define ADA_COMPOSER_COMPOSE_AMOUNT_HPP

#include <cmath>
#include <compare>
#include <concepts>
#include <string>
#include <ac/json.hpp>
#include <ac/cardano/types.hpp>
#include <ac/compose/errors.hpp>

namespace ada_composer::compose {
    enum class unit: uint8_t {
        lovelace, ada
    };

    struct lovelace;
    struct ada;

    // A quantity of the native currency tagged with the unit it was expressed in
    struct amount {
        // accepts a number of lovelace or an object with a single "lovelace" or "ada" member
        static amount from_json(const json::value &j);

        // a copy of proto's unit and static type that carries the value v
        template<typename A>
        static A rebased(const A &proto, const double v)
        {
            A res { proto };
            res._set(v);
            return res;
        }

        template<typename A>
        static A rebased_minor(const A &proto, const int64_t v)
        {
            A res { proto };
            res._set_minor(v);
            return res;
        }

        explicit amount(double value=0, compose::unit u=compose::unit::lovelace);

        compose::unit unit() const noexcept
        {
            return _unit;
        }

        // the value in the amount's own unit
        double value() const noexcept
        {
            return _value;
        }

        int64_t lovelace_value() const noexcept
        {
            return _lovelace;
        }

        double ada_value() const noexcept
        {
            return _ada;
        }

        double operator[](const compose::unit u) const noexcept
        {
            return u == compose::unit::lovelace ? static_cast<double>(_lovelace) : _ada;
        }

        explicit operator bool() const noexcept
        {
            return _lovelace != 0 || _value != 0;
        }

        compose::lovelace as_lovelace() const;
        compose::ada as_ada() const;
        std::string to_string() const;

        bool operator==(const amount &o) const noexcept
        {
            return _lovelace == o._lovelace;
        }

        std::strong_ordering operator<=>(const amount &o) const noexcept
        {
            return _lovelace <=> o._lovelace;
        }

        bool operator==(const double n) const noexcept
        {
            return _value == n;
        }

        std::partial_ordering operator<=>(const double n) const noexcept
        {
            return _value <=> n;
        }
    protected:
        compose::unit _unit;
        double _value = 0;
        int64_t _lovelace = 0;
        double _ada = 0;

        void _set(double v);
        void _set_minor(int64_t v);
    };

    struct lovelace: amount {
        static lovelace with_value(const double v)
        {
            return rebased(lovelace {}, v);
        }

        explicit lovelace(const int64_t v=0): amount {}
        {
            _set_minor(v);
        }
    };

    struct ada: amount {
        static ada with_value(const double v)
        {
            return ada { v };
        }

        explicit ada(const double v=0): amount { v, compose::unit::ada }
        {
        }
    };

    template<typename A>
    concept amount_type = std::derived_from<A, amount>;

    namespace detail {
        inline double checked_divisor(const double d)
        {
            if (d == 0) [[unlikely]]
                throw amount_error("division of an amount by zero!");
            return d;
        }
    }

    template<amount_type A>
    A operator+(const A &a, const amount &b)
    {
        if (a.unit() == unit::lovelace)
            return amount::rebased_minor(a, a.lovelace_value() + b.lovelace_value());
        return amount::rebased(a, a.value() + b[a.unit()]);
    }

    template<amount_type A>
    A operator+(const A &a, const double n)
    {
        return amount::rebased(a, a.value() + n);
    }

    template<amount_type A>
    A operator+(const double n, const A &a)
    {
        return amount::rebased(a, n + a.value());
    }

    template<amount_type A>
    A operator-(const A &a, const amount &b)
    {
        if (a.unit() == unit::lovelace)
            return amount::rebased_minor(a, a.lovelace_value() - b.lovelace_value());
        return amount::rebased(a, a.value() - b[a.unit()]);
    }

    template<amount_type A>
    A operator-(const A &a, const double n)
    {
        return amount::rebased(a, a.value() - n);
    }

    template<amount_type A>
    A operator-(const double n, const A &a)
    {
        return amount::rebased(a, n - a.value());
    }

    template<amount_type A>
    A operator*(const A &a, const amount &b)
    {
        return amount::rebased(a, a.value() * b[a.unit()]);
    }

    template<amount_type A>
    A operator*(const A &a, const double n)
    {
        return amount::rebased(a, a.value() * n);
    }

    template<amount_type A>
    A operator*(const double n, const A &a)
    {
        return amount::rebased(a, n * a.value());
    }

    template<amount_type A>
    A operator/(const A &a, const amount &b)
    {
        return amount::rebased(a, a.value() / detail::checked_divisor(b[a.unit()]));
    }

    template<amount_type A>
    A operator/(const A &a, const double n)
    {
        return amount::rebased(a, a.value() / detail::checked_divisor(n));
    }

    template<amount_type A>
    A operator/(const double n, const A &a)
    {
        return amount::rebased(a, n / detail::checked_divisor(a.value()));
    }

    template<amount_type A>
    A floor_div(const A &a, const amount &b)
    {
        return amount::rebased(a, std::floor(a.value() / detail::checked_divisor(b[a.unit()])));
    }

    template<amount_type A>
    A floor_div(const A &a, const double n)
    {
        return amount::rebased(a, std::floor(a.value() / detail::checked_divisor(n)));
    }

    template<amount_type A>
    A operator-(const A &a)
    {
        return amount::rebased(a, -a.value());
    }

    template<amount_type A>
    A abs(const A &a)
    {
        return amount::rebased(a, std::fabs(a.value()));
    }

    template<amount_type A>
    A round(const A &a)
    {
        return amount::rebased(a, std::round(a.value()));
    }
}

namespace fmt {
    template<>
    struct formatter<ada_composer::compose::amount>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<ada_composer::compose::lovelace>: formatter<ada_composer::compose::amount> {
    };

    template<>
    struct formatter<ada_composer::compose::ada>: formatter<ada_composer::compose::amount> {
    };
}

#endif // !ADA_COMPOSER_COMPOSE_AMOUNT_HPP
