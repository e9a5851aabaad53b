#include "pgs_variant.h"

void pgs_variant::copy_from(const pgs_variant &other)
{
  reset(other.is);
  if (other.is == string_state)
  {
    *cast_content<pgs_string>() = other.string_value();
  }
  if (other.is == int_state)
  {
    *cast_content<long long>() = other.int_value();
  }
  if (other.is == double_state)
  {
    *cast_content<double>() = other.double_value();
  }
  if (other.is == bool_state)
  {
    *cast_content<bool>() = other.bool_value();
  }
  if (other.is == vector_state)
  {
    *cast_content<pgsv_vector>() = other.vector_value();
  }
  if (other.is == map_state)
  {
    *cast_content<pgsv_map>() = other.map_value();
  }
}

void pgs_variant::clear()
{
  if (is == string_state)
  {
    delete cast_content<pgs_string>();
  }
  if (is == int_state)
  {
    delete cast_content<long long>();
  }
  if (is == double_state)
  {
    delete cast_content<double>();
  }
  if (is == bool_state)
  {
    delete cast_content<bool>();
  }
  if (is == vector_state)
  {
    delete cast_content<pgsv_vector>();
  }
  if (is == map_state)
  {
    delete cast_content<pgsv_map>();
  }
  content = nullptr;
  is = none;
}

void pgs_variant::reset(pgs_variant::state to)
{
  clear();
  is = to;
  if (is == string_state)
  {
    content = new pgs_string;
  }
  if (is == int_state)
  {
    content = new long long(0);
  }
  if (is == double_state)
  {
    content = new double(0.0);
  }
  if (is == bool_state)
  {
    content = new bool(false);
  }
  if (is == vector_state)
  {
    content = new pgsv_vector;
  }
  if (is == map_state)
  {
    content = new pgsv_map;
  }
}

pgs_variant::~pgs_variant()
{
  clear();
}

pgs_variant::pgs_variant() : content(nullptr), is(none)
{
}

pgs_variant::pgs_variant(const char *from_string) : content(new pgs_string(from_string)), is(string_state)
{
}

pgs_variant::pgs_variant(const pgs_string &from_string) : content(new pgs_string(from_string)), is(string_state)
{
}

pgs_variant::pgs_variant(int from_int) : content(new long long(from_int)), is(int_state)
{
}

pgs_variant::pgs_variant(bool from_bool) : content(new bool(from_bool)), is(bool_state)
{
}

pgs_variant::pgs_variant(long long from_int) : content(new long long(from_int)), is(int_state)
{
}

pgs_variant::pgs_variant(double from_double) : content(new double(from_double)), is(double_state)
{
}

pgs_variant::pgs_variant(const pgsv_vector &from_vector) : content(new pgsv_vector(from_vector)), is(vector_state)
{
}

pgs_variant::pgs_variant(const pgsv_map &from_map) : content(new pgsv_map(from_map)), is(map_state)
{
}

pgs_variant::pgs_variant(const pgs_variant &other) : content(nullptr), is(none)
{
  copy_from(other);
}

pgs_variant::state pgs_variant::in_state() const
{
  return is;
}

bool pgs_variant::is_null() const
{
  return is == none;
}

bool pgs_variant::is_string() const
{
  return is == string_state;
}

bool pgs_variant::is_int() const
{
  return is == int_state;
}

bool pgs_variant::is_bool() const
{
  return is == bool_state;
}

bool pgs_variant::is_double() const
{
  return is == double_state;
}

bool pgs_variant::is_vector() const
{
  return is == vector_state;
}

bool pgs_variant::is_map() const
{
  return is == map_state;
}

const pgs_string &pgs_variant::string_value() const
{
  return *cast_content<pgs_string>();
}

const long long &pgs_variant::int_value() const
{
  return *cast_content<long long>();
}

const bool &pgs_variant::bool_value() const
{
  return *cast_content<bool>();
}

const double &pgs_variant::double_value() const
{
  return *cast_content<double>();
}

const pgsv_vector &pgs_variant::vector_value() const
{
  return *cast_content<pgsv_vector>();
}

const pgsv_map &pgs_variant::map_value() const
{
  return *cast_content<pgsv_map>();
}

pgs_variant pgs_variant::convert(pgs_variant::state to) const
{
  if (is == to)
  {
    return *this;
  }

  pgs_variant res;
  res.reset(to);

  if (is == string_state)
  {
    if (to == int_state)
    {
      res = pgs_variant(string_value().to_int(0));
    }
    else if (to == bool_state)
    {
      pgs_string lower = string_value().lower().trim();
      res = pgs_variant(lower == "true" || lower == "yes" || lower == "on" || string_value().to_int(0) != 0);
    }
  }
  else if (is == bool_state)
  {
    if (to == int_state)
    {
      res = pgs_variant(bool_value() ? 1 : 0);
    }
    else if (to == string_state)
    {
      res = pgs_variant(bool_value() ? "true" : "false");
    }
  }
  else if (is == int_state)
  {
    if (to == double_state)
    {
      res = pgs_variant((double)int_value());
    }
    else if (to == bool_state)
    {
      res = pgs_variant(int_value() != 0);
    }
    else if (to == string_state)
    {
      res = pgs_variant(pgs_string(int_value()));
    }
  }
  else if (is == double_state)
  {
    if (to == int_state)
    {
      res = pgs_variant((long long)double_value());
    }
    else if (to == string_state)
    {
      res = pgs_variant(pgs_string(double_value()));
    }
  }
  return res;
}

const char* pgs_variant::state_name(pgs_variant::state s)
{
  switch (s)
  {
    case string_state: return "string";
    case int_state: return "integer";
    case bool_state: return "boolean";
    case double_state: return "number";
    case vector_state: return "array";
    case map_state: return "object";
    case none:
    default:
      return "null";
  }
}

pgs_variant &pgs_variant::operator=(const pgs_variant &other)
{
  if (this != &other)
  {
    copy_from(other);
  }
  return *this;
}

bool pgs_variant::operator==(const pgs_variant &other) const
{
  if (is != other.is)
  {
    return false;
  }
  switch (is)
  {
    case string_state: return string_value() == other.string_value();
    case int_state: return int_value() == other.int_value();
    case bool_state: return bool_value() == other.bool_value();
    case double_state: return double_value() == other.double_value();
    case vector_state: return vector_value() == other.vector_value();
    case map_state: return map_value() == other.map_value();
    case none:
    default:
      return true;
  }
}
