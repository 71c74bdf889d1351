#ifndef Ctess_MODEL_METADATA_HPP
#define Ctess_MODEL_METADATA_HPP

#include "core/tess_types.hpp"
#include "numerics/earth_shape.hpp"
#include <string>
#include <vector>

namespace Ctess {

// Descriptive and structural information of a model: its layers (bottom
// first) and the tessellation supporting each, its attributes, the storage
// type of its data and the reference earth shape.
class ModelMetaData {
public:
    ModelMetaData() = default;

    const std::string& get_description() const { return m_description; }
    void set_description(const std::string& description) { m_description = description; }

    // --- Layers ---
    void set_layers(const std::vector<std::string>& names, const std::vector<int>& tessellations);
    int get_n_layers() const { return static_cast<int>(m_layer_names.size()); }
    const std::vector<std::string>& get_layer_names() const { return m_layer_names; }
    const std::string& get_layer_name(int layer) const;
    // INVALID_INDEX when no layer has that name (case-insensitive).
    int get_layer_index(const std::string& name) const;
    const std::vector<int>& get_layer_tessellations() const { return m_layer_tess; }
    int get_tessellation(int layer) const;
    std::vector<int> get_layers_of_tessellation(int tess) const;

    // --- Attributes ---
    void set_attributes(const std::vector<std::string>& names, const std::vector<std::string>& units);
    int get_n_attributes() const { return static_cast<int>(m_attribute_names.size()); }
    const std::vector<std::string>& get_attribute_names() const { return m_attribute_names; }
    const std::vector<std::string>& get_attribute_units() const { return m_attribute_units; }
    const std::string& get_attribute_name(int attribute) const;
    const std::string& get_attribute_unit(int attribute) const;
    int get_attribute_index(const std::string& name) const;

    DataType get_data_type() const { return m_data_type; }
    void set_data_type(DataType type) { m_data_type = type; }

    EarthShapeType get_earth_shape() const { return m_earth_shape; }
    void set_earth_shape(EarthShapeType shape) { m_earth_shape = shape; }

    // Free-form provenance, carried through serialization.
    const std::string& get_model_software_version() const { return m_software_version; }
    void set_model_software_version(const std::string& v) { m_software_version = v; }
    const std::string& get_model_generation_date() const { return m_generation_date; }
    void set_model_generation_date(const std::string& d) { m_generation_date = d; }

    // Throws std::invalid_argument if layers or attributes are missing, or a
    // layer refers to a tessellation outside [0, n_tessellations).
    void validate(int n_tessellations) const;

private:
    std::string m_description;
    std::vector<std::string> m_layer_names;
    std::vector<int> m_layer_tess;
    std::vector<std::string> m_attribute_names;
    std::vector<std::string> m_attribute_units;
    DataType m_data_type = DataType::FLOAT;
    EarthShapeType m_earth_shape = EarthShapeType::WGS84;
    std::string m_software_version;
    std::string m_generation_date;
};

} // namespace Ctess

#endif // Ctess_MODEL_METADATA_HPP
