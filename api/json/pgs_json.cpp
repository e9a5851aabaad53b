#include "pgs_json.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>

namespace {

  pgs_variant nlohmann_to_pgs(const nlohmann::json& j_val) {
    if (j_val.is_null()) {
      return pgs_variant();
    }
    if (j_val.is_boolean()) {
      return pgs_variant(j_val.get<bool>());
    }
    if (j_val.is_number_unsigned()) {
      unsigned long long u_val = j_val.get<unsigned long long>();
      if (u_val > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        std::cerr << "Warning: Unsigned JSON number " << u_val << " too large for long long, converting to double." << std::endl;
        return pgs_variant(static_cast<double>(u_val));
      }
      return pgs_variant(static_cast<long long>(u_val));
    }
    if (j_val.is_number_integer()) {
      return pgs_variant(j_val.get<long long>());
    }
    if (j_val.is_number_float()) {
      return pgs_variant(j_val.get<double>());
    }
    if (j_val.is_string()) {
      return pgs_variant(pgs_string(j_val.get<std::string>()));
    }
    if (j_val.is_array()) {
      pgsv_vector vec;
      vec.reserve(j_val.size());
      for (const auto& el : j_val) {
        vec.push_back(nlohmann_to_pgs(el));
      }
      return pgs_variant(vec);
    }
    if (j_val.is_object()) {
      pgsv_map map_val;
      for (auto it = j_val.begin(); it != j_val.end(); ++it) {
        map_val[pgs_string(it.key())] = nlohmann_to_pgs(it.value());
      }
      return pgs_variant(map_val);
    }
    std::cerr << "Warning: Unknown nlohmann::json type encountered during conversion." << std::endl;
    return pgs_variant();
  }

  nlohmann::json pgs_to_nlohmann(const pgs_variant& var) {
    switch (var.in_state()) {
      case pgs_variant::string_state:
        return var.string_value().to_std_const();
      case pgs_variant::int_state:
        return var.int_value();
      case pgs_variant::bool_state:
        return var.bool_value();
      case pgs_variant::double_state:
        return var.double_value();
      case pgs_variant::vector_state: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& el : var.vector_value()) {
          arr.push_back(pgs_to_nlohmann(el));
        }
        return arr;
      }
      case pgs_variant::map_state: {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& pair : var.map_value()) {
          obj[pair.first.to_std_const()] = pgs_to_nlohmann(pair.second);
        }
        return obj;
      }
      case pgs_variant::none:
      default:
        return nullptr;
    }
  }

}

pgs_json::pgs_json(pgsv_map* map_ptr) : data_map(map_ptr) {
  if (!data_map) {
    throw std::invalid_argument("pgs_json constructor received a nullptr for data_map");
  }
}

bool pgs_json::parse(const pgs_string& json_string) {
  data_map->clear();
  error_message.clear();

  try {
    nlohmann::json parsed_json = nlohmann::json::parse(json_string.to_std_const());

    if (!parsed_json.is_object()) {
      error_message = "JSON document does not represent an object at the top level";
      return false;
    }

    for (auto it = parsed_json.begin(); it != parsed_json.end(); ++it) {
      (*data_map)[pgs_string(it.key())] = nlohmann_to_pgs(it.value());
    }
    return true;

  } catch (const nlohmann::json::parse_error& e) {
    error_message = pgs_string("JSON parse error at byte ") + pgs_string((unsigned long)e.byte) + ": " + e.what();
    data_map->clear();
    return false;
  } catch (const std::exception& e) {
    error_message = pgs_string("Unexpected error during JSON parsing: ") + e.what();
    data_map->clear();
    return false;
  }
}

pgs_string pgs_json::create(int indent) const {
  nlohmann::json j_obj = nlohmann::json::object();
  for (const auto& pair : *data_map) {
    j_obj[pair.first.to_std_const()] = pgs_to_nlohmann(pair.second);
  }

  try {
    // Invalid UTF-8 in titles is replaced rather than aborting the dump
    return pgs_string(j_obj.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace));
  } catch (const std::exception& e) {
    std::cerr << "JSON dump error: " << e.what() << std::endl;
    return pgs_string("");
  }
}
