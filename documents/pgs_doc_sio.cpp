#include "pgs_doc_sio.h"
#include <fstream>
#include <iostream>
#include <iterator>

bool pgs_doc_sio::read(pgs_string filename)
{
  std::fstream f;
  f.open(filename.c_str(), std::ios::in | std::ios::binary);
  if (!f.is_open())
  {
    error_message = pgs_string("Cannot open file for reading: ") + filename;
    return false;
  }
  // read all bytes from the file
  std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  f.close();

  pgs_string str(data.data(), data.size());
  return parse(str);
}

bool pgs_doc_sio::write(pgs_string filename)
{
  pgs_string data;
  if (!serialize(data))
  {
    return false;
  }
  std::fstream f;
  f.open(filename.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!f.is_open())
  {
    error_message = pgs_string("Cannot open file for writing: ") + filename;
    return false;
  }
  f.write(data.c_str(), data.size());
  f.close();
  return !f.fail();
}

bool pgs_doc_sio::write_page(size_t page_index, pgs_string filename)
{
  pgs_string data;
  if (!extract_page(page_index, data))
  {
    return false;
  }
  std::fstream f;
  f.open(filename.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!f.is_open())
  {
    error_message = pgs_string("Cannot open file for writing: ") + filename;
    return false;
  }
  f.write(data.c_str(), data.size());
  f.close();
  if (f.fail())
  {
    error_message = pgs_string("Short write to ") + filename;
    return false;
  }
  return true;
}
