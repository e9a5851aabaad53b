#ifndef pgs_VARIANT_H
#define pgs_VARIANT_H

#include "pgs_string.h"
#include <map>
#include <vector>

class pgs_variant;

typedef std::vector<pgs_variant> pgsv_vector;
typedef std::map<pgs_string, pgs_variant> pgsv_map;

class pgs_variant
{
public:
  enum state
  {
    none,
    string_state,
    int_state,
    bool_state,
    double_state,
    vector_state,
    map_state
  };

private:
  void* content;
  state is;

  void copy_from(const pgs_variant &other);

public:
  template<typename to>
  to* cast_content() const
  {
    return static_cast<to*>(content);
  }
  void clear();
  void reset(state to);
  ~pgs_variant();
  pgs_variant();
  pgs_variant(const char* from_string);
  pgs_variant(const pgs_string &from_string);
  pgs_variant(int from_int);
  pgs_variant(bool from_bool);
  pgs_variant(long long from_int);
  pgs_variant(double from_double);
  pgs_variant(const pgsv_vector &from_vector);
  pgs_variant(const pgsv_map &from_map);
  pgs_variant(const pgs_variant &other);

  state in_state() const;
  bool is_null() const;
  bool is_string() const;
  bool is_int() const;
  bool is_bool() const;
  bool is_double() const;
  bool is_vector() const;
  bool is_map() const;

  // These should only be used after type check
  const pgs_string& string_value() const;
  const long long& int_value() const;
  const bool& bool_value() const;
  const double& double_value() const;
  const pgsv_vector& vector_value() const;
  const pgsv_map& map_value() const;

  pgs_variant convert(state to) const;

  // Human readable name of a state, used in validation messages
  static const char* state_name(state s);

  pgs_variant& operator=(const pgs_variant &other);

  bool operator==(const pgs_variant &other) const;

  bool operator!=(const pgs_variant& other) const
  {
    return !(*this == other);
  }
};

#endif // pgs_VARIANT_H
