#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cafe::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранится как целая часть + дробная часть в нано-единицах (10^-9),
 * чтобы цены меню не теряли точность при суммировании.
 */
class Money {
public:
    int64_t units = 0;
    int32_t nano = 0;
    std::string currency = "USD";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "USD")
        : units(u), nano(n), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "USD") {
        Money m;
        m.currency = cur;
        m.units = static_cast<int64_t>(value);
        m.nano = static_cast<int32_t>(std::llround((value - static_cast<double>(m.units)) * 1e9));
        m.normalize();
        return m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    /// @throws std::overflow_error если сумма не помещается в int64 единиц
    Money operator+(const Money& other) const {
        int64_t sumUnits = 0;
        int64_t sumNano = static_cast<int64_t>(nano) + other.nano;
        if (__builtin_add_overflow(units, other.units, &sumUnits)
            || __builtin_add_overflow(sumUnits, sumNano / 1000000000, &sumUnits)) {
            throw std::overflow_error("money amount out of range");
        }
        Money result(sumUnits, static_cast<int32_t>(sumNano % 1000000000), currency);
        result.normalize();
        return result;
    }

    /// @throws std::overflow_error если произведение не помещается в int64 единиц
    Money operator*(int64_t multiplier) const {
        int64_t totalNano = 0;
        int64_t scaledUnits = 0;
        if (__builtin_mul_overflow(static_cast<int64_t>(nano), multiplier, &totalNano)
            || __builtin_mul_overflow(units, multiplier, &scaledUnits)
            || __builtin_add_overflow(scaledUnits, totalNano / 1000000000, &scaledUnits)) {
            throw std::overflow_error("money amount out of range");
        }
        Money result(scaledUnits, static_cast<int32_t>(totalNano % 1000000000), currency);
        result.normalize();
        return result;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

    bool isNegative() const {
        return units < 0 || (units == 0 && nano < 0);
    }

private:
    void normalize() {
        while (nano >= 1000000000) {
            ++units;
            nano -= 1000000000;
        }
        while (nano < 0 && units > 0) {
            --units;
            nano += 1000000000;
        }
    }
};

} // namespace cafe::domain
