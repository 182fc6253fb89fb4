#include "ippo.hpp"

using namespace sandor_laboratories::ippo;

const char * sandor_laboratories::ippo::ippo_error_string(ippo_error_e error)
{
  const char *ret_string = "unknown error";

  switch(error)
  {
    case IPPO_ERROR_NONE:                    ret_string = "none";                    break;
    case IPPO_ERROR_MALFORMED_HEADER:        ret_string = "malformed header";        break;
    case IPPO_ERROR_UNKNOWN_GROUP_TAG:       ret_string = "unknown group tag";       break;
    case IPPO_ERROR_TRUNCATED_INPUT:         ret_string = "truncated input";         break;
    case IPPO_ERROR_MALFORMED_VALUE:         ret_string = "malformed value";         break;
    case IPPO_ERROR_VALUE_TOO_LARGE:         ret_string = "value too large";         break;
    case IPPO_ERROR_UNSUPPORTED_COLOR_SPACE: ret_string = "unsupported color space"; break;
    case IPPO_ERROR_UNSUPPORTED_BIT_DEPTH:   ret_string = "unsupported bit depth";   break;
    case IPPO_ERROR_DIMENSION_MISMATCH:      ret_string = "dimension mismatch";      break;
    case IPPO_ERROR_INVALID_ARGUMENT:        ret_string = "invalid argument";        break;
    case IPPO_ERROR_TRANSPORT:               ret_string = "transport failure";       break;
    case IPPO_ERROR_REQUEST_ID_MISMATCH:     ret_string = "request id mismatch";     break;
    case IPPO_ERROR_FILE_IO:                 ret_string = "file i/o failure";        break;
    case IPPO_ERROR_IMAGE:                   ret_string = "image failure";           break;
    default:                                                                         break;
  }

  return ret_string;
}
