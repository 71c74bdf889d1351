#ifndef Ctess_DATA_HPP
#define Ctess_DATA_HPP

#include "core/tess_types.hpp"
#include "core/tess_constants.hpp"
#include <cstdint>
#include <vector>

namespace Ctess {

// Attribute vector of one radial node. Every attribute is stored at the
// precision of the declared DataType: values written through set_value are
// narrowed (rounded to float, or truncated and saturated to the integer
// range) before they are kept, so reads return exactly what the declared
// type can hold. NaN survives only for FLOAT and DOUBLE; integer types
// store it as 0.
class Data {
public:
    Data() : m_type(DataType::DOUBLE) {}
    Data(DataType type, size_t n_attributes);
    Data(DataType type, const std::vector<real_t>& values);

    DataType get_data_type() const { return m_type; }
    size_t size() const { return m_values.size(); }

    real_t get_double(size_t attribute) const;
    float get_float(size_t attribute) const;
    std::int64_t get_long(size_t attribute) const;
    std::int32_t get_int(size_t attribute) const;
    std::int16_t get_short(size_t attribute) const;
    std::int8_t get_byte(size_t attribute) const;

    void set_value(size_t attribute, real_t value);
    void fill(real_t value);

    bool is_nan(size_t attribute) const;

    // All attributes as doubles.
    const std::vector<real_t>& get_values() const { return m_values; }

    bool operator==(const Data& other) const;
    bool operator!=(const Data& other) const { return !(*this == other); }

    // Representation of value in the given storage type.
    static real_t narrow(DataType type, real_t value);

private:
    DataType m_type;
    std::vector<real_t> m_values;

    void check_index(size_t attribute) const;
};

} // namespace Ctess

#endif // Ctess_DATA_HPP
