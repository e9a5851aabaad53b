#ifndef PGS_JSON_H
#define PGS_JSON_H

#include "../../utils/pgs_variant.h"

class pgs_json {
public:
  /**
   * @brief Binds the converter to an externally owned map.
   * @param map_ptr Map that parse() fills and create() reads. Must outlive this object.
   */
  explicit pgs_json(pgsv_map* map_ptr);

  /**
   * @brief Parses a JSON document and fills the bound map.
   * @param json_string JSON text whose top level must be an object.
   * @return true on success. On failure the map is left empty and
   * last_error() describes the problem.
   */
  bool parse(const pgs_string& json_string);

  /**
   * @brief Serializes the bound map to JSON.
   * @param indent Pretty-print indentation, -1 for a compact single line.
   */
  pgs_string create(int indent = -1) const;

  const pgs_string& last_error() const { return error_message; }

private:
  pgsv_map* data_map;
  pgs_string error_message;
};

#endif // PGS_JSON_H
