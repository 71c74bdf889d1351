#include "model_metadata.hpp"
#include <stdexcept>

namespace Ctess {

void ModelMetaData::set_layers(const std::vector<std::string>& names, const std::vector<int>& tessellations) {
    if (names.size() != tessellations.size()) {
        throw std::invalid_argument("ModelMetaData: " + std::to_string(names.size()) + " layer names but " +
                                    std::to_string(tessellations.size()) + " layer tessellation ids.");
    }
    m_layer_names = names;
    m_layer_tess = tessellations;
}

const std::string& ModelMetaData::get_layer_name(int layer) const {
    if (layer < 0 || layer >= get_n_layers()) {
        throw std::out_of_range("Layer index " + std::to_string(layer) + " out of range.");
    }
    return m_layer_names[layer];
}

int ModelMetaData::get_layer_index(const std::string& name) const {
    std::string key = to_lower(name);
    for (size_t i = 0; i < m_layer_names.size(); ++i) {
        if (to_lower(m_layer_names[i]) == key) return static_cast<int>(i);
    }
    return INVALID_INDEX;
}

int ModelMetaData::get_tessellation(int layer) const {
    if (layer < 0 || layer >= get_n_layers()) {
        throw std::out_of_range("Layer index " + std::to_string(layer) + " out of range.");
    }
    return m_layer_tess[layer];
}

std::vector<int> ModelMetaData::get_layers_of_tessellation(int tess) const {
    std::vector<int> layers;
    for (size_t i = 0; i < m_layer_tess.size(); ++i) {
        if (m_layer_tess[i] == tess) layers.push_back(static_cast<int>(i));
    }
    return layers;
}

void ModelMetaData::set_attributes(const std::vector<std::string>& names, const std::vector<std::string>& units) {
    if (names.size() != units.size()) {
        throw std::invalid_argument("ModelMetaData: " + std::to_string(names.size()) + " attribute names but " +
                                    std::to_string(units.size()) + " units.");
    }
    m_attribute_names = names;
    m_attribute_units = units;
}

const std::string& ModelMetaData::get_attribute_name(int attribute) const {
    if (attribute < 0 || attribute >= get_n_attributes()) {
        throw std::out_of_range("Attribute index " + std::to_string(attribute) + " out of range.");
    }
    return m_attribute_names[attribute];
}

const std::string& ModelMetaData::get_attribute_unit(int attribute) const {
    if (attribute < 0 || attribute >= get_n_attributes()) {
        throw std::out_of_range("Attribute index " + std::to_string(attribute) + " out of range.");
    }
    return m_attribute_units[attribute];
}

int ModelMetaData::get_attribute_index(const std::string& name) const {
    std::string key = to_lower(name);
    for (size_t i = 0; i < m_attribute_names.size(); ++i) {
        if (to_lower(m_attribute_names[i]) == key) return static_cast<int>(i);
    }
    return INVALID_INDEX;
}

void ModelMetaData::validate(int n_tessellations) const {
    if (m_layer_names.empty()) {
        throw std::invalid_argument("ModelMetaData: no layers defined.");
    }
    if (m_attribute_names.empty()) {
        throw std::invalid_argument("ModelMetaData: no attributes defined.");
    }
    for (size_t i = 0; i < m_layer_tess.size(); ++i) {
        if (m_layer_tess[i] < 0 || m_layer_tess[i] >= n_tessellations) {
            throw std::invalid_argument("ModelMetaData: layer " + m_layer_names[i] + " refers to tessellation " +
                                        std::to_string(m_layer_tess[i]) + " but the grid has " +
                                        std::to_string(n_tessellations) + ".");
        }
        // Layers are ordered bottom to top, and a tessellation never supports
        // a layer below one supported by a lower-numbered tessellation.
        if (i > 0 && m_layer_tess[i] < m_layer_tess[i - 1]) {
            throw std::invalid_argument("ModelMetaData: layer tessellation ids must not decrease from bottom to top.");
        }
    }
}

} // namespace Ctess
