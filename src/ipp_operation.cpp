#include <cstdio>
#include <cstring>

#include "ipp_operation.hpp"

using namespace sandor_laboratories::ippo;

typedef struct
{
  ipp_operation_e operation;
  const char     *keyword;
  const char     *name;
} ipp_operation_entry_s;

static const ipp_operation_entry_s ipp_operation_table[] =
{
  {IPP_OPERATION_PRINT_JOB,              "print-job",              "Print-Job"},
  {IPP_OPERATION_PRINT_URI,              "print-uri",              "Print-URI"},
  {IPP_OPERATION_VALIDATE_JOB,           "validate-job",           "Validate-Job"},
  {IPP_OPERATION_CREATE_JOB,             "create-job",             "Create-Job"},
  {IPP_OPERATION_SEND_DOCUMENT,          "send-document",          "Send-Document"},
  {IPP_OPERATION_SEND_URI,               "send-uri",               "Send-URI"},
  {IPP_OPERATION_CANCEL_JOB,             "cancel-job",             "Cancel-Job"},
  {IPP_OPERATION_GET_JOB_ATTRIBUTES,     "get-job-attributes",     "Get-Job-Attributes"},
  {IPP_OPERATION_GET_JOBS,               "get-jobs",               "Get-Jobs"},
  {IPP_OPERATION_GET_PRINTER_ATTRIBUTES, "get-printer-attributes", "Get-Printer-Attributes"},
  {IPP_OPERATION_HOLD_JOB,               "hold-job",               "Hold-Job"},
  {IPP_OPERATION_RELEASE_JOB,            "release-job",            "Release-Job"},
  {IPP_OPERATION_RESTART_JOB,            "restart-job",            "Restart-Job"},
  {IPP_OPERATION_PAUSE_PRINTER,          "pause-printer",          "Pause-Printer"},
  {IPP_OPERATION_RESUME_PRINTER,         "resume-printer",         "Resume-Printer"},
  {IPP_OPERATION_PURGE_JOBS,             "purge-jobs",             "Purge-Jobs"},
};
#define IPP_OPERATION_TABLE_SIZE (sizeof(ipp_operation_table)/sizeof(ipp_operation_table[0]))

const char *sandor_laboratories::ippo::ipp_operation_string(uint16_t operation)
{
  const char *ret_string = "Unknown-Operation";

  for(size_t i = 0; i < IPP_OPERATION_TABLE_SIZE; i++)
  {
    if(ipp_operation_table[i].operation == operation)
    {
      ret_string = ipp_operation_table[i].name;
      break;
    }
  }

  return ret_string;
}

bool sandor_laboratories::ippo::ipp_operation_from_string(const char *keyword, ipp_operation_e *operation)
{
  bool ret_val = false;

  if((keyword != nullptr) && (operation != nullptr))
  {
    for(size_t i = 0; i < IPP_OPERATION_TABLE_SIZE; i++)
    {
      if(0 == strcmp(ipp_operation_table[i].keyword, keyword))
      {
        *operation = ipp_operation_table[i].operation;
        ret_val    = true;
        break;
      }
    }
  }

  return ret_val;
}

const char *sandor_laboratories::ippo::ipp_status_string(uint16_t status)
{
  const char *ret_string = nullptr;

  switch(status)
  {
    case IPP_STATUS_SUCCESSFUL_OK:                                    ret_string = "successful-ok";                                         break;
    case IPP_STATUS_SUCCESSFUL_OK_IGNORED_OR_SUBSTITUTED:             ret_string = "successful-ok-ignored-or-substituted-attributes";       break;
    case IPP_STATUS_SUCCESSFUL_OK_CONFLICTING_ATTRIBUTES:             ret_string = "successful-ok-conflicting-attributes";                  break;
    case IPP_STATUS_CLIENT_ERROR_BAD_REQUEST:                         ret_string = "client-error-bad-request";                              break;
    case IPP_STATUS_CLIENT_ERROR_FORBIDDEN:                           ret_string = "client-error-forbidden";                                break;
    case IPP_STATUS_CLIENT_ERROR_NOT_AUTHENTICATED:                   ret_string = "client-error-not-authenticated";                        break;
    case IPP_STATUS_CLIENT_ERROR_NOT_AUTHORIZED:                      ret_string = "client-error-not-authorized";                           break;
    case IPP_STATUS_CLIENT_ERROR_NOT_POSSIBLE:                        ret_string = "client-error-not-possible";                             break;
    case IPP_STATUS_CLIENT_ERROR_TIMEOUT:                             ret_string = "client-error-timeout";                                  break;
    case IPP_STATUS_CLIENT_ERROR_NOT_FOUND:                           ret_string = "client-error-not-found";                                break;
    case IPP_STATUS_CLIENT_ERROR_GONE:                                ret_string = "client-error-gone";                                     break;
    case IPP_STATUS_CLIENT_ERROR_REQUEST_ENTITY_TOO_LARGE:            ret_string = "client-error-request-entity-too-large";                 break;
    case IPP_STATUS_CLIENT_ERROR_REQUEST_VALUE_TOO_LONG:              ret_string = "client-error-request-value-too-long";                   break;
    case IPP_STATUS_CLIENT_ERROR_DOCUMENT_FORMAT_NOT_SUPPORTED:       ret_string = "client-error-document-format-not-supported";            break;
    case IPP_STATUS_CLIENT_ERROR_ATTRIBUTES_OR_VALUES_NOT_SUPPORTED:  ret_string = "client-error-attributes-or-values-not-supported";       break;
    case IPP_STATUS_CLIENT_ERROR_URI_SCHEME_NOT_SUPPORTED:            ret_string = "client-error-uri-scheme-not-supported";                 break;
    case IPP_STATUS_CLIENT_ERROR_CHARSET_NOT_SUPPORTED:               ret_string = "client-error-charset-not-supported";                    break;
    case IPP_STATUS_CLIENT_ERROR_CONFLICTING_ATTRIBUTES:              ret_string = "client-error-conflicting-attributes";                   break;
    case IPP_STATUS_CLIENT_ERROR_COMPRESSION_NOT_SUPPORTED:           ret_string = "client-error-compression-not-supported";                break;
    case IPP_STATUS_CLIENT_ERROR_COMPRESSION_ERROR:                   ret_string = "client-error-compression-error";                        break;
    case IPP_STATUS_CLIENT_ERROR_DOCUMENT_FORMAT_ERROR:               ret_string = "client-error-document-format-error";                    break;
    case IPP_STATUS_CLIENT_ERROR_DOCUMENT_ACCESS_ERROR:               ret_string = "client-error-document-access-error";                    break;
    case IPP_STATUS_SERVER_ERROR_INTERNAL_ERROR:                      ret_string = "server-error-internal-error";                           break;
    case IPP_STATUS_SERVER_ERROR_OPERATION_NOT_SUPPORTED:             ret_string = "server-error-operation-not-supported";                  break;
    case IPP_STATUS_SERVER_ERROR_SERVICE_UNAVAILABLE:                 ret_string = "server-error-service-unavailable";                      break;
    case IPP_STATUS_SERVER_ERROR_VERSION_NOT_SUPPORTED:               ret_string = "server-error-version-not-supported";                    break;
    case IPP_STATUS_SERVER_ERROR_DEVICE_ERROR:                        ret_string = "server-error-device-error";                             break;
    case IPP_STATUS_SERVER_ERROR_TEMPORARY_ERROR:                     ret_string = "server-error-temporary-error";                          break;
    case IPP_STATUS_SERVER_ERROR_NOT_ACCEPTING_JOBS:                  ret_string = "server-error-not-accepting-jobs";                       break;
    case IPP_STATUS_SERVER_ERROR_BUSY:                                ret_string = "server-error-busy";                                     break;
    case IPP_STATUS_SERVER_ERROR_JOB_CANCELED:                        ret_string = "server-error-job-canceled";                             break;
    case IPP_STATUS_SERVER_ERROR_MULTIPLE_DOCUMENT_JOBS_NOT_SUPPORTED: ret_string = "server-error-multiple-document-jobs-not-supported";    break;
    default:
    {
      ret_string = (ipp_status_is_successful(status)?"successful-ok-unrecognized":
                    (status < 0x0500)?"client-error-unrecognized":"server-error-unrecognized");
      break;
    }
  }

  return ret_string;
}

void sandor_laboratories::ippo::init_ipp_request_params(ipp_request_params_s *params)
{
  if(params != nullptr)
  {
    params->printer_uri.clear();
    params->natural_language     = IPP_DEFAULT_NATURAL_LANGUAGE;
    params->requesting_user_name.clear();
    params->job_name             = "ippo";
    params->document_format      = IPP_PWG_RASTER_MIME_TYPE;
    params->job_id               = 0;
    params->requested_attributes.clear();
  }
}

bool sandor_laboratories::ippo::init_ipp_request(ipp_message_c *message, ipp_operation_e operation, uint32_t request_id, const ipp_request_params_s *params)
{
  bool ret_val = true;

  if((message == nullptr) || (params == nullptr) || params->printer_uri.empty())
  {
    fprintf(stderr, "Invalid inputs to initialize %s request.  message %p params %p\n",
            ipp_operation_string(operation), message, params);
    return false;
  }

  *message = ipp_message_c(operation, request_id);

  ret_val = ( message->add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "attributes-charset",
                                     make_ipp_string(IPP_TAG_CHARSET, IPP_DEFAULT_CHARSET)) &&
              message->add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "attributes-natural-language",
                                     make_ipp_string(IPP_TAG_NATURAL_LANGUAGE,
                                                     (params->natural_language.empty()?IPP_DEFAULT_NATURAL_LANGUAGE:params->natural_language))) &&
              message->add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "printer-uri",
                                     make_ipp_string(IPP_TAG_URI, params->printer_uri)) );

  if(ret_val && !params->requesting_user_name.empty())
  {
    ret_val = message->add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "requesting-user-name",
                                     make_ipp_string(IPP_TAG_NAME_WITHOUT_LANGUAGE, params->requesting_user_name));
  }

  return ret_val;
}

inline bool add_requested_attributes(ipp_message_c *message, const ipp_request_params_s *params)
{
  bool             ret_val = true;
  ipp_value_list_t values;

  for(std::vector<std::string>::const_iterator it = params->requested_attributes.begin(); it != params->requested_attributes.end(); it++)
  {
    values.push_back(make_ipp_string(IPP_TAG_KEYWORD, *it));
  }

  if(!values.empty())
  {
    ret_val = message->add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "requested-attributes", values);
  }

  return ret_val;
}

inline bool add_job_id(ipp_message_c *message, const ipp_request_params_s *params)
{
  bool ret_val = false;

  if(params->job_id > 0)
  {
    ret_val = message->add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "job-id", make_ipp_integer(params->job_id));
  }
  else
  {
    fprintf(stderr, "Job operation requires a positive job-id.  job-id %d\n", params->job_id);
  }

  return ret_val;
}

/* Operation attributes shared by Print-Job and Validate-Job */
inline bool add_job_creation_attributes(ipp_message_c *message, const ipp_request_params_s *params)
{
  bool ret_val = true;

  if(!params->job_name.empty())
  {
    ret_val = message->add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "job-name",
                                     make_ipp_string(IPP_TAG_NAME_WITHOUT_LANGUAGE, params->job_name));
  }
  if(ret_val)
  {
    ret_val = message->add_attribute(IPP_TAG_OPERATION_ATTRIBUTES, "document-format",
                                     make_ipp_string(IPP_TAG_MIME_MEDIA_TYPE,
                                                     (params->document_format.empty()?IPP_PWG_RASTER_MIME_TYPE:params->document_format)));
  }

  return ret_val;
}

bool sandor_laboratories::ippo::build_get_printer_attributes_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params)
{
  return ( init_ipp_request(message, IPP_OPERATION_GET_PRINTER_ATTRIBUTES, request_id, params) &&
           add_requested_attributes(message, params) );
}

bool sandor_laboratories::ippo::build_print_job_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params, const octet_buffer_t &document)
{
  bool ret_val = ( init_ipp_request(message, IPP_OPERATION_PRINT_JOB, request_id, params) &&
                   add_job_creation_attributes(message, params) );

  if(ret_val)
  {
    message->set_body(document);
  }

  return ret_val;
}

bool sandor_laboratories::ippo::build_validate_job_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params)
{
  return ( init_ipp_request(message, IPP_OPERATION_VALIDATE_JOB, request_id, params) &&
           add_job_creation_attributes(message, params) );
}

bool sandor_laboratories::ippo::build_get_jobs_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params)
{
  return ( init_ipp_request(message, IPP_OPERATION_GET_JOBS, request_id, params) &&
           add_requested_attributes(message, params) );
}

bool sandor_laboratories::ippo::build_get_job_attributes_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params)
{
  return ( init_ipp_request(message, IPP_OPERATION_GET_JOB_ATTRIBUTES, request_id, params) &&
           add_job_id(message, params) &&
           add_requested_attributes(message, params) );
}

bool sandor_laboratories::ippo::build_cancel_job_request(ipp_message_c *message, uint32_t request_id, const ipp_request_params_s *params)
{
  return ( init_ipp_request(message, IPP_OPERATION_CANCEL_JOB, request_id, params) &&
           add_job_id(message, params) );
}
