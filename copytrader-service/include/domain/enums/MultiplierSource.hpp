#pragma once

#include <string>

namespace copytrader::domain {

enum class MultiplierSource {
    BASE,
    USER_OVERRIDE
};

inline std::string toString(MultiplierSource source) {
    switch (source) {
        case MultiplierSource::BASE: return "BASE";
        case MultiplierSource::USER_OVERRIDE: return "USER_OVERRIDE";
        default: return "UNKNOWN";
    }
}

inline MultiplierSource parseMultiplierSource(const std::string& str) {
    if (str == "USER_OVERRIDE") return MultiplierSource::USER_OVERRIDE;
    return MultiplierSource::BASE;
}

} // namespace copytrader::domain
