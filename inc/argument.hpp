#ifndef __ARGUMENT_HPP__
#define __ARGUMENT_HPP__

#include <cstdint>
#include <string>
#include <vector>

#include "ipp_operation.hpp"
#include "ippo.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    /* Argument Types */
    typedef enum
    {
      IPPO_ARGUMENT_UNSPECIFIED,
      IPPO_ARGUMENT_VALID,
      IPPO_ARGUMENT_INVALID,
    } ippo_argument_status_e;

    #define ARGUMENT_STRING_BUFFER_SIZE 1024

    typedef struct
    {
      ippo_argument_status_e   image_path_status;
      char                     image_path[FILE_PATH_MAX_LENGTH];

      ippo_argument_status_e   resolution_status;
      uint32_t                 resolution;

      ippo_argument_status_e   raster_output_status;
      char                     raster_output_path[FILE_PATH_MAX_LENGTH];

      ippo_argument_status_e   raster_dump_status;
      char                     raster_dump_path[FILE_PATH_MAX_LENGTH];

      ippo_argument_status_e   dump_directory_status;
      char                     dump_directory[FILE_PATH_MAX_LENGTH];
    } ippo_raster_arguments_s;

    typedef struct
    {
      ippo_argument_status_e   printer_uri_status;
      char                     printer_uri[ARGUMENT_STRING_BUFFER_SIZE];

      ippo_argument_status_e   operation_status;
      ipp_operation_e          operation;

      ippo_argument_status_e   job_id_status;
      int32_t                  job_id;

      ippo_argument_status_e   user_name_status;
      char                     user_name[ARGUMENT_STRING_BUFFER_SIZE];

      ippo_argument_status_e   requested_attributes_status;
      std::vector<std::string> requested_attributes;
    } ippo_request_arguments_s;

    typedef struct
    {
      bool                     unexpected_arg;

      ippo_argument_status_e   help_request;
      ippo_argument_status_e   verbose_status;

      ippo_request_arguments_s request_args;
      ippo_raster_arguments_s  raster_args;
    } ippo_arguments_s;

    void init_ippo_args(ippo_arguments_s* args);
    /* Returns false if getopt reported an option this parser does not handle.  Malformed values set unexpected_arg. */
    bool parse_ippo_args(int argc, char *argv[], ippo_arguments_s* args);

    const char * get_help_string();
  }
}

#endif /* __ARGUMENT_HPP__ */
