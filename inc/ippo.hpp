#ifndef __IPPO_HPP__
#define __IPPO_HPP__

#include <cstddef>
#include <cstdint>
#include <linux/limits.h>

namespace sandor_laboratories
{
  namespace ippo
  {
    #define UNUSED(x) (void)(x)

    #define MIN(a,b) ((a<b)?a:b)

    #define BITS_PER_BYTE 8

    /* Maximum path length */
    #define FILE_PATH_MAX_LENGTH PATH_MAX

    typedef uint8_t octet_t;

    /* Error kinds reported by codecs, generator, and transport */
    typedef enum
    {
      IPPO_ERROR_NONE,
      IPPO_ERROR_MALFORMED_HEADER,
      IPPO_ERROR_UNKNOWN_GROUP_TAG,
      IPPO_ERROR_TRUNCATED_INPUT,
      IPPO_ERROR_MALFORMED_VALUE,
      IPPO_ERROR_VALUE_TOO_LARGE,
      IPPO_ERROR_UNSUPPORTED_COLOR_SPACE,
      IPPO_ERROR_UNSUPPORTED_BIT_DEPTH,
      IPPO_ERROR_DIMENSION_MISMATCH,
      IPPO_ERROR_INVALID_ARGUMENT,
      IPPO_ERROR_TRANSPORT,
      IPPO_ERROR_REQUEST_ID_MISMATCH,
      IPPO_ERROR_FILE_IO,
      IPPO_ERROR_IMAGE,
      IPPO_ERROR_MAX,
    } ippo_error_e;

    /* Returns printable name for error.  Never returns null. */
    const char * ippo_error_string(ippo_error_e error);

    /* Exit Utils */
    #define EXIT_STATUS_SUCCESS      0
    #define EXIT_STATUS_FAILURE      1
    #define EXIT_STATUS_INVALID_ARGS 22
  }
}
 
#endif /* __IPPO_HPP__ */
