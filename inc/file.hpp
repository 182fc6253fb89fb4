#ifndef __FILE_HPP__
#define __FILE_HPP__

#include <cstdint>
#include <string>

#include "byte_stream.hpp"
#include "ippo.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    /* MD5 checksums are 128bits (16 bytes) */
    #define MD5_SIZE 16

    /* Reads whole file into output.  Output is replaced only on success. */
    ippo_error_e read_octet_file(const char *path, octet_buffer_t *output);
    /* Creates or truncates file at path and writes data */
    ippo_error_e write_octet_file(const char *path, const octet_buffer_t &data);

    /* Lowercase hex MD5 of data, used to identify generated documents in logs */
    bool md5_digest_string(const octet_buffer_t &data, std::string *output);

    /* Builds "<directory>/<prefix>-<index>.<extension>".  Returns false if path does not fit path_buffer_size. */
    bool indexed_file_path(const char *directory, const char *prefix, unsigned int index, const char *extension,
                           char *path, size_t path_buffer_size);
  }
}

#endif /* __FILE_HPP__ */
