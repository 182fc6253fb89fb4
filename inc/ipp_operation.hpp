#ifndef __IPP_OPERATION_HPP__
#define __IPP_OPERATION_HPP__

#include <cstdint>
#include <string>
#include <vector>

#include "ipp_message.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    typedef enum
    {
      IPP_OPERATION_PRINT_JOB              = 0x0002,
      IPP_OPERATION_PRINT_URI              = 0x0003,
      IPP_OPERATION_VALIDATE_JOB           = 0x0004,
      IPP_OPERATION_CREATE_JOB             = 0x0005,
      IPP_OPERATION_SEND_DOCUMENT          = 0x0006,
      IPP_OPERATION_SEND_URI               = 0x0007,
      IPP_OPERATION_CANCEL_JOB             = 0x0008,
      IPP_OPERATION_GET_JOB_ATTRIBUTES     = 0x0009,
      IPP_OPERATION_GET_JOBS               = 0x000A,
      IPP_OPERATION_GET_PRINTER_ATTRIBUTES = 0x000B,
      IPP_OPERATION_HOLD_JOB               = 0x000C,
      IPP_OPERATION_RELEASE_JOB            = 0x000D,
      IPP_OPERATION_RESTART_JOB            = 0x000E,
      /* 0x000F reserved */
      IPP_OPERATION_PAUSE_PRINTER          = 0x0010,
      IPP_OPERATION_RESUME_PRINTER         = 0x0011,
      IPP_OPERATION_PURGE_JOBS             = 0x0012,
    } ipp_operation_e;

    typedef enum
    {
      IPP_STATUS_SUCCESSFUL_OK                                  = 0x0000,
      IPP_STATUS_SUCCESSFUL_OK_IGNORED_OR_SUBSTITUTED           = 0x0001,
      IPP_STATUS_SUCCESSFUL_OK_CONFLICTING_ATTRIBUTES           = 0x0002,
      IPP_STATUS_CLIENT_ERROR_BAD_REQUEST                       = 0x0400,
      IPP_STATUS_CLIENT_ERROR_FORBIDDEN                         = 0x0401,
      IPP_STATUS_CLIENT_ERROR_NOT_AUTHENTICATED                 = 0x0402,
      IPP_STATUS_CLIENT_ERROR_NOT_AUTHORIZED                    = 0x0403,
      IPP_STATUS_CLIENT_ERROR_NOT_POSSIBLE                      = 0x0404,
      IPP_STATUS_CLIENT_ERROR_TIMEOUT                           = 0x0405,
      IPP_STATUS_CLIENT_ERROR_NOT_FOUND                         = 0x0406,
      IPP_STATUS_CLIENT_ERROR_GONE                              = 0x0407,
      IPP_STATUS_CLIENT_ERROR_REQUEST_ENTITY_TOO_LARGE          = 0x0408,
      IPP_STATUS_CLIENT_ERROR_REQUEST_VALUE_TOO_LONG            = 0x0409,
      IPP_STATUS_CLIENT_ERROR_DOCUMENT_FORMAT_NOT_SUPPORTED     = 0x040A,
      IPP_STATUS_CLIENT_ERROR_ATTRIBUTES_OR_VALUES_NOT_SUPPORTED = 0x040B,
      IPP_STATUS_CLIENT_ERROR_URI_SCHEME_NOT_SUPPORTED          = 0x040C,
      IPP_STATUS_CLIENT_ERROR_CHARSET_NOT_SUPPORTED             = 0x040D,
      IPP_STATUS_CLIENT_ERROR_CONFLICTING_ATTRIBUTES            = 0x040E,
      IPP_STATUS_CLIENT_ERROR_COMPRESSION_NOT_SUPPORTED         = 0x040F,
      IPP_STATUS_CLIENT_ERROR_COMPRESSION_ERROR                 = 0x0410,
      IPP_STATUS_CLIENT_ERROR_DOCUMENT_FORMAT_ERROR             = 0x0411,
      IPP_STATUS_CLIENT_ERROR_DOCUMENT_ACCESS_ERROR             = 0x0412,
      IPP_STATUS_SERVER_ERROR_INTERNAL_ERROR                    = 0x0500,
      IPP_STATUS_SERVER_ERROR_OPERATION_NOT_SUPPORTED           = 0x0501,
      IPP_STATUS_SERVER_ERROR_SERVICE_UNAVAILABLE               = 0x0502,
      IPP_STATUS_SERVER_ERROR_VERSION_NOT_SUPPORTED             = 0x0503,
      IPP_STATUS_SERVER_ERROR_DEVICE_ERROR                      = 0x0504,
      IPP_STATUS_SERVER_ERROR_TEMPORARY_ERROR                   = 0x0505,
      IPP_STATUS_SERVER_ERROR_NOT_ACCEPTING_JOBS                = 0x0506,
      IPP_STATUS_SERVER_ERROR_BUSY                              = 0x0507,
      IPP_STATUS_SERVER_ERROR_JOB_CANCELED                      = 0x0508,
      IPP_STATUS_SERVER_ERROR_MULTIPLE_DOCUMENT_JOBS_NOT_SUPPORTED = 0x0509,
    } ipp_status_e;

    #define IPP_STATUS_SUCCESSFUL_LIMIT 0x0100

    #define IPP_DEFAULT_CHARSET          "utf-8"
    #define IPP_DEFAULT_NATURAL_LANGUAGE "en"
    #define IPP_PWG_RASTER_MIME_TYPE     "image/pwg-raster"

    const char *ipp_operation_string(uint16_t operation);
    const char *ipp_status_string(uint16_t status);
    inline bool ipp_status_is_successful(uint16_t status) {return (status < IPP_STATUS_SUCCESSFUL_LIMIT);};

    /* Looks up an operation by its keyword, e.g. "get-printer-attributes".  Returns false if unknown. */
    bool ipp_operation_from_string(const char *keyword, ipp_operation_e *operation);

    typedef struct
    {
      std::string printer_uri;
      std::string natural_language;
      std::string requesting_user_name;
      std::string job_name;
      std::string document_format;
      /* Used by job targeted operations */
      int32_t     job_id;
      /* Get-Printer-Attributes / Get-Jobs requested-attributes, empty for printer default */
      std::vector<std::string> requested_attributes;
    } ipp_request_params_s;

    void init_ipp_request_params(ipp_request_params_s *params);

    /* Resets message to a request for operation and fills the operation group with
        attributes-charset, attributes-natural-language and printer-uri in that order */
    bool init_ipp_request(ipp_message_c *message, ipp_operation_e operation, uint32_t request_id, const ipp_request_params_s *params);

    bool build_get_printer_attributes_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params);
    /* Document bytes are copied into the message body */
    bool build_print_job_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params, const octet_buffer_t &document);
    bool build_validate_job_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params);
    bool build_get_jobs_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params);
    bool build_get_job_attributes_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params);
    bool build_cancel_job_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params);
  }
}

#endif /* __IPP_OPERATION_HPP__ */
