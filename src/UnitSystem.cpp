#include "UnitSystem.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace CRSKit {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

const char* kindName(UnitKind kind) {
    return kind == UnitKind::ANGLE ? "angle" : "length";
}

} // namespace

UnitSystem::UnitSystem() {
    // Lengths (metres)
    registerUnit(Unit("meter", "m", UnitKind::LENGTH, 1.0));
    registerUnit(Unit("kilometer", "km", UnitKind::LENGTH, 1000.0));
    registerUnit(Unit("foot", "ft", UnitKind::LENGTH, 0.3048));
    registerUnit(Unit("US survey foot", "us-ft", UnitKind::LENGTH, 1200.0 / 3937.0));
    registerUnit(Unit("mile", "mi", UnitKind::LENGTH, 1609.344));
    registerUnit(Unit("nautical mile", "nmi", UnitKind::LENGTH, 1852.0));

    // Angles (radians)
    registerUnit(Unit("radian", "rad", UnitKind::ANGLE, 1.0));
    registerUnit(Unit("degree", "deg", UnitKind::ANGLE, M_PI / 180.0));
    registerUnit(Unit("gradian", "grad", UnitKind::ANGLE, M_PI / 200.0));
    registerUnit(Unit("arc minute", "arcmin", UnitKind::ANGLE, M_PI / 10800.0));
    registerUnit(Unit("arc second", "arcsec", UnitKind::ANGLE, M_PI / 648000.0));
}

void UnitSystem::registerUnit(const Unit& unit) {
    units_[lower(unit.name)] = unit;
    units_[lower(unit.symbol)] = unit;
}

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    auto it = units_.find(lower(strip(name_or_symbol)));
    return it != units_.end() ? &it->second : nullptr;
}

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);
    if (!from) throw std::runtime_error("Unknown unit: " + from_unit);
    if (!to) throw std::runtime_error("Unknown unit: " + to_unit);

    if (from->kind != to->kind) {
        throw std::runtime_error("Cannot convert " + std::string(kindName(from->kind)) + " '" +
                                 from_unit + "' to " + kindName(to->kind) + " '" + to_unit + "'");
    }
    return value * from->to_base / to->to_base;
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) throw std::runtime_error("Unknown unit: " + from_unit);
    return value * unit->to_base;
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    const Unit* unit = getUnit(to_unit);
    if (!unit) throw std::runtime_error("Unknown unit: " + to_unit);
    return value / unit->to_base;
}

bool UnitSystem::parseValueWithUnit(const std::string& text, double& value,
                                    std::string& unit) const {
    std::string s = strip(text);
    if (s.empty()) return false;

    // strtod accepts sign, decimals and exponents; whatever follows is the unit
    const char* begin = s.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin) return false;

    // "inf"/"nan" are not geodetic input
    if (!std::isfinite(parsed)) return false;

    value = parsed;
    unit = strip(std::string(end));
    return true;
}

double UnitSystem::parseAs(const std::string& text, const std::string& default_unit,
                           UnitKind kind, const std::string& target_unit) const {
    double value;
    std::string unit;
    if (!parseValueWithUnit(text, value, unit)) {
        throw std::runtime_error("Cannot parse " + std::string(kindName(kind)) + " '" + text + "'");
    }
    if (unit.empty()) unit = default_unit;

    const Unit* u = getUnit(unit);
    if (!u) throw std::runtime_error("Unknown unit '" + unit + "' in '" + text + "'");
    if (u->kind != kind) {
        throw std::runtime_error("'" + text + "' is not " +
                                 (kind == UnitKind::ANGLE ? "an angle" : "a length"));
    }
    return convert(value, unit, target_unit);
}

double UnitSystem::parseAngle(const std::string& text, const std::string& default_unit) const {
    return parseAs(text, default_unit, UnitKind::ANGLE, "deg");
}

double UnitSystem::parseDistance(const std::string& text, const std::string& default_unit) const {
    return parseAs(text, default_unit, UnitKind::LENGTH, "m");
}

} // namespace CRSKit
