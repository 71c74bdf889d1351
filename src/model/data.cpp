#include "data.hpp"
#include <cmath>     // For std::isnan, std::trunc, std::nextafter
#include <limits>
#include <stdexcept>
#include <string>

namespace Ctess {

namespace {

template<typename T>
real_t saturate(real_t value) {
    if (std::isnan(value)) return 0.0;
    const real_t lo = static_cast<real_t>(std::numeric_limits<T>::min());
    const real_t hi = static_cast<real_t>(std::numeric_limits<T>::max());
    real_t t = std::trunc(value);
    if (t <= lo) return lo;
    // max() of a 64-bit type rounds up to 2^63 as a double
    if (t >= hi) return sizeof(T) >= 8 ? std::nextafter(hi, 0.0) : hi;
    return t;
}

} // anonymous namespace

Data::Data(DataType type, size_t n_attributes)
    : m_type(type), m_values(n_attributes, 0.0) {}

Data::Data(DataType type, const std::vector<real_t>& values)
    : m_type(type), m_values(values.size())
{
    for (size_t i = 0; i < values.size(); ++i) {
        m_values[i] = narrow(type, values[i]);
    }
}

real_t Data::narrow(DataType type, real_t value) {
    switch (type) {
        case DataType::DOUBLE: return value;
        case DataType::FLOAT: return static_cast<real_t>(static_cast<float>(value));
        case DataType::LONG: return saturate<std::int64_t>(value);
        case DataType::INT: return saturate<std::int32_t>(value);
        case DataType::SHORT: return saturate<std::int16_t>(value);
        case DataType::BYTE: return saturate<std::int8_t>(value);
    }
    return value;
}

void Data::check_index(size_t attribute) const {
    if (attribute >= m_values.size()) {
        throw std::out_of_range("Attribute index " + std::to_string(attribute) +
                                " out of range (" + std::to_string(m_values.size()) + " attributes).");
    }
}

real_t Data::get_double(size_t attribute) const {
    check_index(attribute);
    return m_values[attribute];
}

float Data::get_float(size_t attribute) const {
    return static_cast<float>(get_double(attribute));
}

std::int64_t Data::get_long(size_t attribute) const {
    return static_cast<std::int64_t>(saturate<std::int64_t>(get_double(attribute)));
}

std::int32_t Data::get_int(size_t attribute) const {
    return static_cast<std::int32_t>(saturate<std::int32_t>(get_double(attribute)));
}

std::int16_t Data::get_short(size_t attribute) const {
    return static_cast<std::int16_t>(saturate<std::int16_t>(get_double(attribute)));
}

std::int8_t Data::get_byte(size_t attribute) const {
    return static_cast<std::int8_t>(saturate<std::int8_t>(get_double(attribute)));
}

void Data::set_value(size_t attribute, real_t value) {
    check_index(attribute);
    m_values[attribute] = narrow(m_type, value);
}

void Data::fill(real_t value) {
    real_t v = narrow(m_type, value);
    for (auto& x : m_values) x = v;
}

bool Data::is_nan(size_t attribute) const {
    check_index(attribute);
    if (m_type != DataType::DOUBLE && m_type != DataType::FLOAT) return false;
    return std::isnan(m_values[attribute]);
}

bool Data::operator==(const Data& other) const {
    if (m_type != other.m_type || m_values.size() != other.m_values.size()) return false;
    for (size_t i = 0; i < m_values.size(); ++i) {
        bool a_nan = std::isnan(m_values[i]);
        bool b_nan = std::isnan(other.m_values[i]);
        if (a_nan != b_nan) return false;
        if (!a_nan && m_values[i] != other.m_values[i]) return false;
    }
    return true;
}

} // namespace Ctess
