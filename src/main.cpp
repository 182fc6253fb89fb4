#include <cstdio>
#include <cstdlib>
#include <string>

#include "argument.hpp"
#include "file.hpp"
#include "image.hpp"
#include "ipp_client.hpp"
#include "ipp_message.hpp"
#include "ipp_operation.hpp"
#include "ippo.hpp"
#include "pwg_raster.hpp"
#include "transport.hpp"

using namespace sandor_laboratories::ippo;

#define DUMP_FILE_PREFIX    "page"
#define DUMP_FILE_EXTENSION "png"

/* Writes every page of a raster file as PNG into directory */
static int dump_raster_file(const ippo_arguments_s *args)
{
  int             ret_val = EXIT_STATUS_SUCCESS;
  octet_buffer_t  raster;
  pwg_page_list_t pages;
  ippo_error_e    error;
  const char     *directory = (IPPO_ARGUMENT_VALID == args->raster_args.dump_directory_status)?args->raster_args.dump_directory:".";
  char            path[FILE_PATH_MAX_LENGTH];

  error = read_octet_file(args->raster_args.raster_dump_path, &raster);
  if(IPPO_ERROR_NONE == error)
  {
    error = parse_pwg_raster(raster, &pages);
  }

  if(IPPO_ERROR_NONE != error)
  {
    fprintf(stderr, "Failed to read raster '%s' - %s.\n", args->raster_args.raster_dump_path, ippo_error_string(error));
    ret_val = EXIT_STATUS_FAILURE;
  }

  for(unsigned int i = 0; (EXIT_STATUS_SUCCESS == ret_val) && (i < pages.size()); i++)
  {
    if(IPPO_ARGUMENT_VALID == args->verbose_status)
    {
      print_pwg_page_header(stdout, &pages[i]);
    }

    if(!indexed_file_path(directory, DUMP_FILE_PREFIX, i+1, DUMP_FILE_EXTENSION, path, sizeof(path)))
    {
      fprintf(stderr, "Dump path for page %u does not fit.\n", i+1);
      ret_val = EXIT_STATUS_FAILURE;
    }
    else if(IPPO_ERROR_NONE != (error = write_raster_page_png(path, &pages[i])))
    {
      fprintf(stderr, "Failed to write page %u - %s.\n", i+1, ippo_error_string(error));
      ret_val = EXIT_STATUS_FAILURE;
    }
    else
    {
      printf("Wrote page %u to '%s'.\n", i+1, path);
    }
  }

  return ret_val;
}

/* Loads the PNG and encodes it as a one page PWG raster document */
static ippo_error_e build_raster_document(const ippo_arguments_s *args, octet_buffer_t *document)
{
  ippo_error_e      ret_val;
  pwg_bitmap_s      bitmap;
  pwg_page_params_s params;
  std::string       digest;

  init_pwg_page_params(&params);
  if(IPPO_ARGUMENT_VALID == args->raster_args.resolution_status)
  {
    params.hw_resolution[0] = args->raster_args.resolution;
    params.hw_resolution[1] = args->raster_args.resolution;
  }

  ret_val = load_png_bitmap(args->raster_args.image_path, &bitmap);
  if(IPPO_ERROR_NONE == ret_val)
  {
    ret_val = generate_pwg_raster(&bitmap, &params, document);
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    if(md5_digest_string(*document, &digest))
    {
      printf("Generated %zu byte PWG raster document.  MD5 %s\n", document->size(), digest.c_str());
    }
    else
    {
      printf("Generated %zu byte PWG raster document.\n", document->size());
    }
  }
  else
  {
    fprintf(stderr, "Failed to generate raster from '%s' - %s.\n", args->raster_args.image_path, ippo_error_string(ret_val));
  }

  return ret_val;
}

static bool build_request(const ippo_arguments_s *args, const octet_buffer_t &document, ipp_message_c *request)
{
  bool                 ret_val = false;
  ipp_request_params_s params;

  init_ipp_request_params(&params);
  params.printer_uri          = args->request_args.printer_uri;
  params.requested_attributes = args->request_args.requested_attributes;
  params.job_id               = args->request_args.job_id;
  if(IPPO_ARGUMENT_VALID == args->request_args.user_name_status)
  {
    params.requesting_user_name = args->request_args.user_name;
  }

  /* request-id is assigned by the client */
  switch(args->request_args.operation)
  {
    case IPP_OPERATION_GET_PRINTER_ATTRIBUTES:
    {
      ret_val = build_get_printer_attributes_request(request, IPP_REQUEST_ID_MIN, &params);
      break;
    }
    case IPP_OPERATION_PRINT_JOB:
    {
      ret_val = build_print_job_request(request, IPP_REQUEST_ID_MIN, &params, document);
      break;
    }
    case IPP_OPERATION_VALIDATE_JOB:
    {
      ret_val = build_validate_job_request(request, IPP_REQUEST_ID_MIN, &params);
      break;
    }
    case IPP_OPERATION_GET_JOBS:
    {
      ret_val = build_get_jobs_request(request, IPP_REQUEST_ID_MIN, &params);
      break;
    }
    case IPP_OPERATION_GET_JOB_ATTRIBUTES:
    {
      ret_val = build_get_job_attributes_request(request, IPP_REQUEST_ID_MIN, &params);
      break;
    }
    case IPP_OPERATION_CANCEL_JOB:
    {
      ret_val = build_cancel_job_request(request, IPP_REQUEST_ID_MIN, &params);
      break;
    }
    default:
    {
      fprintf(stderr, "No request builder for operation 0x%04x.\n", args->request_args.operation);
      break;
    }
  }

  return ret_val;
}

static int send_request(const ippo_arguments_s *args, const octet_buffer_t &document)
{
  int                     ret_val = EXIT_STATUS_FAILURE;
  http_transport_config_s transport_config;
  ipp_parse_config_s      parse_config;
  ipp_message_c           request, response;
  ippo_error_e            error;

  http_transport_c::init_config(&transport_config);
  transport_config.verbose = (IPPO_ARGUMENT_VALID == args->verbose_status);

  init_ipp_parse_config(&parse_config);
  parse_config.verbose = (IPPO_ARGUMENT_VALID == args->verbose_status);

  http_transport_c     transport(args->request_args.printer_uri, &transport_config);
  request_id_counter_c request_ids;
  ipp_client_c         client(&transport, &request_ids, &parse_config);

  if(!transport.is_valid())
  {
    fprintf(stderr, "Printer URI '%s' not supported.\n", args->request_args.printer_uri);
  }
  else if(build_request(args, document, &request))
  {
    if(IPPO_ARGUMENT_VALID == args->verbose_status)
    {
      print_ipp_message(stdout, &request, false);
    }

    error = client.execute(&request, &response);
    if(IPPO_ERROR_NONE == error)
    {
      print_ipp_message(stdout, &response, true);
      if(ipp_status_is_successful(response.get_code()))
      {
        ret_val = EXIT_STATUS_SUCCESS;
      }
    }
    else
    {
      fprintf(stderr, "%s failed - %s.\n", ipp_operation_string(request.get_code()), ippo_error_string(error));
    }
  }
  else
  {
    fprintf(stderr, "Failed to build %s request.\n", ipp_operation_string(args->request_args.operation));
  }

  return ret_val;
}

/* Rejects argument combinations getopt cannot */
static bool check_args(const ippo_arguments_s *args)
{
  bool ret_val = true;
  const bool job_targeted = (IPP_OPERATION_GET_JOB_ATTRIBUTES == args->request_args.operation) ||
                            (IPP_OPERATION_CANCEL_JOB         == args->request_args.operation);
  const bool needs_raster = (IPP_OPERATION_PRINT_JOB == args->request_args.operation) ||
                            (IPPO_ARGUMENT_VALID == args->raster_args.raster_output_status);

  if(IPPO_ARGUMENT_VALID == args->raster_args.raster_dump_status)
  {
    /* Dump needs nothing else */
  }
  else if(needs_raster && (IPPO_ARGUMENT_VALID != args->raster_args.image_path_status))
  {
    fprintf(stderr, "-f PNG file required to generate raster.\n\n");
    ret_val = false;
  }
  else if( (IPPO_ARGUMENT_VALID != args->request_args.printer_uri_status) &&
           (IPPO_ARGUMENT_VALID != args->raster_args.raster_output_status) )
  {
    fprintf(stderr, "-u printer URI required.\n\n");
    ret_val = false;
  }
  else if(job_targeted && (IPPO_ARGUMENT_VALID != args->request_args.job_id_status))
  {
    fprintf(stderr, "-j job id required for %s.\n\n", ipp_operation_string(args->request_args.operation));
    ret_val = false;
  }

  return ret_val;
}

int main(int argc, char *argv[])
{
  int            status = EXIT_STATUS_SUCCESS;
  ippo_arguments_s args;
  octet_buffer_t document;
  ippo_error_e   error;

  if(!parse_ippo_args(argc, argv, &args))
  {
    args.unexpected_arg = true;
  }

  if(!args.unexpected_arg && (IPPO_ARGUMENT_UNSPECIFIED == args.help_request) && !check_args(&args))
  {
    args.unexpected_arg = true;
  }

  if((args.unexpected_arg) || (IPPO_ARGUMENT_UNSPECIFIED != args.help_request))
  {
    status = (args.unexpected_arg)?EXIT_STATUS_INVALID_ARGS:EXIT_STATUS_SUCCESS;
    printf("%s\n", get_help_string());
    exit(status);
  }

  if(IPPO_ARGUMENT_VALID == args.raster_args.raster_dump_status)
  {
    exit(dump_raster_file(&args));
  }

  if(IPPO_ARGUMENT_VALID == args.raster_args.image_path_status)
  {
    if(IPPO_ERROR_NONE != build_raster_document(&args, &document))
    {
      exit(EXIT_STATUS_FAILURE);
    }
  }

  if(IPPO_ARGUMENT_VALID == args.raster_args.raster_output_status)
  {
    error = write_octet_file(args.raster_args.raster_output_path, document);
    if(IPPO_ERROR_NONE != error)
    {
      fprintf(stderr, "Failed to write raster '%s' - %s.\n", args.raster_args.raster_output_path, ippo_error_string(error));
      status = EXIT_STATUS_FAILURE;
    }
    else
    {
      printf("Wrote raster to '%s'.\n", args.raster_args.raster_output_path);
    }
  }
  else
  {
    status = send_request(&args, document);
  }

  return status;
}
