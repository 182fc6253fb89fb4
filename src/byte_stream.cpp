#include <arpa/inet.h>
#include <cstring>

#include "byte_stream.hpp"

using namespace sandor_laboratories::ippo;

byte_cursor_s sandor_laboratories::ippo::make_byte_cursor(const octet_t * buffer, size_t size)
{
  byte_cursor_s cursor = 
    {
      .buffer = buffer,
      .size   = ((buffer != nullptr)?size:0),
      .offset = 0,
    };

  return cursor;
}

bool sandor_laboratories::ippo::read_u8(byte_cursor_s *cursor, uint8_t *value)
{
  bool ret_val = false;

  if((cursor != nullptr) && (value != nullptr) && (remaining_bytes(cursor) >= sizeof(uint8_t)))
  {
    *value = cursor->buffer[cursor->offset];
    cursor->offset += sizeof(uint8_t);
    ret_val = true;
  }

  return ret_val;
}

bool sandor_laboratories::ippo::read_u16(byte_cursor_s *cursor, uint16_t *value)
{
  bool     ret_val = false;
  uint16_t network_half_word;

  if((cursor != nullptr) && (value != nullptr) && (remaining_bytes(cursor) >= sizeof(uint16_t)))
  {
    memcpy(&network_half_word, &cursor->buffer[cursor->offset], sizeof(network_half_word));
    *value = ntohs(network_half_word);
    cursor->offset += sizeof(uint16_t);
    ret_val = true;
  }

  return ret_val;
}

bool sandor_laboratories::ippo::read_u32(byte_cursor_s *cursor, uint32_t *value)
{
  bool     ret_val = false;
  uint32_t network_word;

  if((cursor != nullptr) && (value != nullptr) && (remaining_bytes(cursor) >= sizeof(uint32_t)))
  {
    memcpy(&network_word, &cursor->buffer[cursor->offset], sizeof(network_word));
    *value = ntohl(network_word);
    cursor->offset += sizeof(uint32_t);
    ret_val = true;
  }

  return ret_val;
}

bool sandor_laboratories::ippo::read_i32(byte_cursor_s *cursor, int32_t *value)
{
  bool     ret_val = false;
  uint32_t host_word;

  if((value != nullptr) && read_u32(cursor, &host_word))
  {
    *value = (int32_t) host_word;
    ret_val = true;
  }

  return ret_val;
}

bool sandor_laboratories::ippo::read_bytes(byte_cursor_s *cursor, size_t length, octet_buffer_t *output)
{
  bool ret_val = false;

  if((cursor != nullptr) && (output != nullptr) && (remaining_bytes(cursor) >= length))
  {
    output->assign(&cursor->buffer[cursor->offset], &cursor->buffer[cursor->offset+length]);
    cursor->offset += length;
    ret_val = true;
  }

  return ret_val;
}

bool sandor_laboratories::ippo::read_string(byte_cursor_s *cursor, size_t length, std::string *output)
{
  bool ret_val = false;

  if((cursor != nullptr) && (output != nullptr) && (remaining_bytes(cursor) >= length))
  {
    output->assign((const char*) &cursor->buffer[cursor->offset], length);
    cursor->offset += length;
    ret_val = true;
  }

  return ret_val;
}

bool sandor_laboratories::ippo::skip_bytes(byte_cursor_s *cursor, size_t length)
{
  bool ret_val = false;

  if((cursor != nullptr) && (remaining_bytes(cursor) >= length))
  {
    cursor->offset += length;
    ret_val = true;
  }

  return ret_val;
}

void sandor_laboratories::ippo::write_u8(octet_buffer_t *output, uint8_t value)
{
  output->push_back(value);
}

void sandor_laboratories::ippo::write_u16(octet_buffer_t *output, uint16_t value)
{
  const uint16_t network_half_word = htons(value);
  write_bytes(output, (const octet_t*) &network_half_word, sizeof(network_half_word));
}

void sandor_laboratories::ippo::write_u32(octet_buffer_t *output, uint32_t value)
{
  const uint32_t network_word = htonl(value);
  write_bytes(output, (const octet_t*) &network_word, sizeof(network_word));
}

void sandor_laboratories::ippo::write_i32(octet_buffer_t *output, int32_t value)
{
  write_u32(output, (uint32_t) value);
}

void sandor_laboratories::ippo::write_bytes(octet_buffer_t *output, const octet_t *bytes, size_t length)
{
  if(length > 0)
  {
    output->insert(output->end(), bytes, bytes+length);
  }
}

void sandor_laboratories::ippo::write_fixed_string(octet_buffer_t *output, const std::string &text, size_t field_size)
{
  const size_t text_size = ((field_size > 0)?MIN(text.size(), (field_size-1)):0);

  write_bytes(output, (const octet_t*) text.data(), text_size);
  write_zeros(output, (field_size - text_size));
}

void sandor_laboratories::ippo::write_zeros(octet_buffer_t *output, size_t length)
{
  output->insert(output->end(), length, 0);
}
