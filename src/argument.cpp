#include <cstdio>
#include <cstring>
#include <unistd.h>

#include "argument.hpp"
#include "version.hpp"

using namespace sandor_laboratories::ippo;

static const char *help_string = PROJECT_NAME " " PROJECT_VER " <" PROJECT_URL ">\n"
                                 PROJECT_DESCRIPTION "\n\n"
                                 "Options:\n"
                                 "  -u: Printer URI (ipp://host[:port]/path or ipps://...)\n"
                                 "  -o: Operation to send.  One of\n"
                                 "        get-printer-attributes (default), print-job, validate-job,\n"
                                 "        get-jobs, get-job-attributes, cancel-job\n"
                                 "  -f: PNG File to print as PWG raster\n"
                                 "  -r: Raster resolution in dpi (default 300)\n"
                                 "  -j: Job id for get-job-attributes and cancel-job\n"
                                 "  -n: requesting-user-Name\n"
                                 "  -a: requested-Attribute keyword (repeatable)\n"
                                 "  -w: Write generated PWG raster to file instead of sending\n"
                                 "  -x: eXtract pages of a PWG raster file to PNG and exit\n"
                                 "  -d: Directory for extracted pages (default .)\n"
                                 "  -v: Verbose output\n"
                                 "  -h: Display this Help text\n";

const char * sandor_laboratories::ippo::get_help_string()
{
  return help_string;
}

void sandor_laboratories::ippo::init_ippo_args(ippo_arguments_s* args)
{
  if(args != nullptr)
  {
    args->unexpected_arg = false;
    args->help_request   = IPPO_ARGUMENT_UNSPECIFIED;
    args->verbose_status = IPPO_ARGUMENT_UNSPECIFIED;

    memset(&args->raster_args, 0, sizeof(args->raster_args));

    args->request_args.printer_uri_status          = IPPO_ARGUMENT_UNSPECIFIED;
    args->request_args.printer_uri[0]              = '\0';
    args->request_args.operation_status            = IPPO_ARGUMENT_UNSPECIFIED;
    args->request_args.operation                   = IPP_OPERATION_GET_PRINTER_ATTRIBUTES;
    args->request_args.job_id_status               = IPPO_ARGUMENT_UNSPECIFIED;
    args->request_args.job_id                      = 0;
    args->request_args.user_name_status            = IPPO_ARGUMENT_UNSPECIFIED;
    args->request_args.user_name[0]                = '\0';
    args->request_args.requested_attributes_status = IPPO_ARGUMENT_UNSPECIFIED;
    args->request_args.requested_attributes.clear();
  }
}

/* Copies optarg into a fixed buffer.  Too long is invalid rather than silently truncated. */
inline ippo_argument_status_e copy_string_option(const int option, char *buffer, size_t buffer_size, ippo_arguments_s* args)
{
  ippo_argument_status_e ret_val = IPPO_ARGUMENT_VALID;

  if(strlen(optarg) < buffer_size)
  {
    strncpy(buffer, optarg, buffer_size);
  }
  else
  {
    fprintf(stderr, "-%c %s: value longer than %zu characters.\n\n", option, optarg, buffer_size-1);
    args->unexpected_arg = true;
    ret_val = IPPO_ARGUMENT_INVALID;
  }

  return ret_val;
}

inline bool parse_option(const int option, ippo_arguments_s* args)
{
  bool ret_val = true;
  char dummy;

  switch(option)
  {
    case 'a':
    {
      if(0 < strlen(optarg))
      {
        args->request_args.requested_attributes_status = IPPO_ARGUMENT_VALID;
        args->request_args.requested_attributes.push_back(optarg);
      }
      else
      {
        args->request_args.requested_attributes_status = IPPO_ARGUMENT_INVALID;
        fprintf(stderr, "-a: requested attribute keyword must not be empty.\n\n");
        args->unexpected_arg = true;
      }
      break;
    }
    case 'd':
    {
      args->raster_args.dump_directory_status =
        copy_string_option(option, args->raster_args.dump_directory, sizeof(args->raster_args.dump_directory), args);
      break;
    }
    case 'f':
    {
      args->raster_args.image_path_status =
        copy_string_option(option, args->raster_args.image_path, sizeof(args->raster_args.image_path), args);
      break;
    }
    case 'h':
    {
      args->help_request = IPPO_ARGUMENT_VALID;
      break;
    }
    case 'j':
    {
      if( (sscanf(optarg, "%d%c", &args->request_args.job_id, &dummy) == 1) &&
          (args->request_args.job_id > 0) )
      {
        args->request_args.job_id_status = IPPO_ARGUMENT_VALID;
      }
      else
      {
        args->request_args.job_id_status = IPPO_ARGUMENT_INVALID;
        fprintf(stderr, "-j %s: job id format incorrect.  Expected positive decimal integer.\n\n", optarg);
        args->unexpected_arg = true;
      }
      break;
    }
    case 'n':
    {
      args->request_args.user_name_status =
        copy_string_option(option, args->request_args.user_name, sizeof(args->request_args.user_name), args);
      break;
    }
    case 'o':
    {
      if(ipp_operation_from_string(optarg, &args->request_args.operation) &&
         ( (IPP_OPERATION_GET_PRINTER_ATTRIBUTES == args->request_args.operation) ||
           (IPP_OPERATION_PRINT_JOB              == args->request_args.operation) ||
           (IPP_OPERATION_VALIDATE_JOB           == args->request_args.operation) ||
           (IPP_OPERATION_GET_JOBS               == args->request_args.operation) ||
           (IPP_OPERATION_GET_JOB_ATTRIBUTES     == args->request_args.operation) ||
           (IPP_OPERATION_CANCEL_JOB             == args->request_args.operation) ))
      {
        args->request_args.operation_status = IPPO_ARGUMENT_VALID;
      }
      else
      {
        args->request_args.operation_status = IPPO_ARGUMENT_INVALID;
        fprintf(stderr, "-o %s: unsupported operation.  See -h for the supported list.\n\n", optarg);
        args->unexpected_arg = true;
      }
      break;
    }
    case 'r':
    {
      if( (sscanf(optarg, "%u%c", &args->raster_args.resolution, &dummy) == 1) &&
          (args->raster_args.resolution > 0) )
      {
        args->raster_args.resolution_status = IPPO_ARGUMENT_VALID;
      }
      else
      {
        args->raster_args.resolution_status = IPPO_ARGUMENT_INVALID;
        fprintf(stderr, "-r %s: resolution format incorrect.  Expected dpi as positive decimal integer.\n\n", optarg);
        args->unexpected_arg = true;
      }
      break;
    }
    case 'u':
    {
      args->request_args.printer_uri_status =
        copy_string_option(option, args->request_args.printer_uri, sizeof(args->request_args.printer_uri), args);
      break;
    }
    case 'v':
    {
      args->verbose_status = IPPO_ARGUMENT_VALID;
      break;
    }
    case 'w':
    {
      args->raster_args.raster_output_status =
        copy_string_option(option, args->raster_args.raster_output_path, sizeof(args->raster_args.raster_output_path), args);
      break;
    }
    case 'x':
    {
      args->raster_args.raster_dump_status =
        copy_string_option(option, args->raster_args.raster_dump_path, sizeof(args->raster_args.raster_dump_path), args);
      break;
    }
    case '?':
    {
      args->unexpected_arg = true;
      break;
    }
    default:
    {
      ret_val = false;
      break;
    }
  }

  return ret_val;
}

bool sandor_laboratories::ippo::parse_ippo_args(int argc, char *argv[], ippo_arguments_s* args)
{
  bool ret_val = true;
  int option;

  if(args != nullptr)
  {
    init_ippo_args(args);

    /* Allows repeated parsing within one process */
    optind = 1;
    while((option = getopt(argc, argv, "a:d:f:hj:n:o:r:u:vw:x:")) !=  -1)
    {
      if(!parse_option(option, args))
      {
        ret_val = false;
      }
    }

    if(optind < argc)
    {
      fprintf(stderr, "Unexpected argument '%s'.\n\n", argv[optind]);
      args->unexpected_arg = true;
    }
  }
  else
  {
    ret_val = false;
  }

  return ret_val;
}
