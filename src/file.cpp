#include <cerrno>
#include <cstdio>
#include <cstring>
#include <openssl/evp.h>
#include <utility>

#include "file.hpp"

using namespace sandor_laboratories::ippo;

#define FILE_READ_CHUNK_SIZE 4096

ippo_error_e sandor_laboratories::ippo::read_octet_file(const char *path, octet_buffer_t *output)
{
  ippo_error_e   ret_val  = IPPO_ERROR_NONE;
  FILE          *file_ptr = nullptr;
  octet_buffer_t data;
  octet_t        chunk[FILE_READ_CHUNK_SIZE];
  size_t         read_size = 0;

  if((path == nullptr) || (output == nullptr))
  {
    fprintf(stderr, "Null inputs to read file.  path %p output %p\n", path, output);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  if((file_ptr = fopen(path, "rb")) != nullptr)
  {
    while((read_size = fread(chunk, sizeof(octet_t), sizeof(chunk), file_ptr)) > 0)
    {
      data.insert(data.end(), chunk, chunk+read_size);
    }

    if(ferror(file_ptr))
    {
      fprintf(stderr, "Failed to read file '%s'.  errno %u: %s\n", path, errno, strerror(errno));
      ret_val = IPPO_ERROR_FILE_IO;
    }

    if(0 != fclose(file_ptr))
    {
      fprintf(stderr, "Failed to close file '%s'.  errno %u: %s\n", path, errno, strerror(errno));
      ret_val = IPPO_ERROR_FILE_IO;
    }
  }
  else
  {
    fprintf(stderr, "Failed to open file '%s' for reading.  errno %u: %s\n", path, errno, strerror(errno));
    ret_val = IPPO_ERROR_FILE_IO;
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    *output = std::move(data);
  }

  return ret_val;
}

ippo_error_e sandor_laboratories::ippo::write_octet_file(const char *path, const octet_buffer_t &data)
{
  ippo_error_e  ret_val  = IPPO_ERROR_NONE;
  FILE         *file_ptr = nullptr;

  if(path == nullptr)
  {
    fprintf(stderr, "Null path to write file.\n");
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  if((file_ptr = fopen(path, "wb")) != nullptr)
  {
    if(data.size() != fwrite(data.data(), sizeof(octet_t), data.size(), file_ptr))
    {
      fprintf(stderr, "Failed to write %zu bytes to file '%s'.  errno %u: %s\n", data.size(), path, errno, strerror(errno));
      ret_val = IPPO_ERROR_FILE_IO;
    }

    if(0 != fclose(file_ptr))
    {
      fprintf(stderr, "Failed to close file '%s'.  errno %u: %s\n", path, errno, strerror(errno));
      ret_val = IPPO_ERROR_FILE_IO;
    }
  }
  else
  {
    fprintf(stderr, "Failed to open file '%s' for writing.  errno %u: %s\n", path, errno, strerror(errno));
    ret_val = IPPO_ERROR_FILE_IO;
  }

  return ret_val;
}

bool sandor_laboratories::ippo::md5_digest_string(const octet_buffer_t &data, std::string *output)
{
  bool          ret_val = false;
  unsigned char md_value[EVP_MAX_MD_SIZE];
  unsigned int  md_len = 0;
  char          hex[3];
  EVP_MD_CTX   *mdctx = EVP_MD_CTX_new();

  if((mdctx != nullptr) && (output != nullptr))
  {
    ret_val = ( (1 == EVP_DigestInit_ex(mdctx, EVP_md5(), nullptr)) &&
                (1 == EVP_DigestUpdate(mdctx, data.data(), data.size())) &&
                (1 == EVP_DigestFinal_ex(mdctx, md_value, &md_len)) &&
                (MD5_SIZE == md_len) );

    if(ret_val)
    {
      output->clear();
      for(unsigned int i = 0; i < md_len; i++)
      {
        snprintf(hex, sizeof(hex), "%02x", md_value[i]);
        output->append(hex);
      }
    }
    else
    {
      fprintf(stderr, "Failed to compute MD5 digest of %zu bytes.\n", data.size());
    }
  }
  else
  {
    fprintf(stderr, "Invalid inputs to MD5 digest.  mdctx %p output %p\n", mdctx, output);
  }

  EVP_MD_CTX_free(mdctx);

  return ret_val;
}

bool sandor_laboratories::ippo::indexed_file_path(const char *directory, const char *prefix, unsigned int index, const char *extension,
                                                  char *path, size_t path_buffer_size)
{
  bool ret_val = false;
  int  written = 0;

  if((directory != nullptr) && (prefix != nullptr) && (extension != nullptr) && (path != nullptr))
  {
    written = snprintf(path, path_buffer_size, "%s/%s-%u.%s", directory, prefix, index, extension);
    ret_val = ((written > 0) && (((size_t) written) < path_buffer_size));
    if(!ret_val)
    {
      fprintf(stderr, "File path too long.  directory '%s' prefix '%s' index %u\n", directory, prefix, index);
    }
  }

  return ret_val;
}
