#ifndef __BYTE_STREAM_HPP__
#define __BYTE_STREAM_HPP__

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ippo.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    typedef std::vector<octet_t> octet_buffer_t;

    /* Read position over a caller owned buffer.  Never reads past size. */
    typedef struct
    {
      const octet_t *buffer;
      size_t         size;
      size_t         offset;
    } byte_cursor_s;

    byte_cursor_s make_byte_cursor(const octet_t * buffer, size_t size);
    inline byte_cursor_s make_byte_cursor(const octet_buffer_t &buffer) {return make_byte_cursor(buffer.data(), buffer.size());};

    inline size_t remaining_bytes(const byte_cursor_s *cursor) {return (cursor->size - cursor->offset);};

    /* Big-endian readers.  Return false without advancing if too few bytes remain. */
    bool read_u8  (byte_cursor_s *cursor, uint8_t  *value);
    bool read_u16 (byte_cursor_s *cursor, uint16_t *value);
    bool read_u32 (byte_cursor_s *cursor, uint32_t *value);
    bool read_i32 (byte_cursor_s *cursor, int32_t  *value);
    bool read_bytes(byte_cursor_s *cursor, size_t length, octet_buffer_t *output);
    bool read_string(byte_cursor_s *cursor, size_t length, std::string *output);
    bool skip_bytes(byte_cursor_s *cursor, size_t length);

    /* Big-endian writers.  Append to output. */
    void write_u8  (octet_buffer_t *output, uint8_t  value);
    void write_u16 (octet_buffer_t *output, uint16_t value);
    void write_u32 (octet_buffer_t *output, uint32_t value);
    void write_i32 (octet_buffer_t *output, int32_t  value);
    void write_bytes(octet_buffer_t *output, const octet_t *bytes, size_t length);
    inline void write_bytes(octet_buffer_t *output, const octet_buffer_t &bytes) {write_bytes(output, bytes.data(), bytes.size());};
    inline void write_string(octet_buffer_t *output, const std::string &text) {write_bytes(output, (const octet_t*) text.data(), text.size());};
    /* Writes text NUL terminated and padded to exactly field_size bytes.  Truncates text to field_size-1. */
    void write_fixed_string(octet_buffer_t *output, const std::string &text, size_t field_size);
    void write_zeros(octet_buffer_t *output, size_t length);
  }
}

#endif /* __BYTE_STREAM_HPP__ */
