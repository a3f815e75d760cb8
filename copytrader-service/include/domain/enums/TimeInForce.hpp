#pragma once

#include <string>

namespace copytrader::domain {

enum class TimeInForce {
    DAY,
    GTC,
    IOC,
    FOK
};

inline std::string toString(TimeInForce tif) {
    switch (tif) {
        case TimeInForce::DAY: return "DAY";
        case TimeInForce::GTC: return "GTC";
        case TimeInForce::IOC: return "IOC";
        case TimeInForce::FOK: return "FOK";
        default: return "UNKNOWN";
    }
}

inline TimeInForce parseTimeInForce(const std::string& str) {
    if (str == "GTC") return TimeInForce::GTC;
    if (str == "IOC") return TimeInForce::IOC;
    if (str == "FOK") return TimeInForce::FOK;
    return TimeInForce::DAY;
}

} // namespace copytrader::domain
