#include <cinttypes>
#include <cstdio>
#include <cstring>

#include "pwg_raster.hpp"

using namespace sandor_laboratories::ippo;

void sandor_laboratories::ippo::init_pwg_page_params(pwg_page_params_s *params)
{
  if(params == nullptr)
  {
    return;
  }

  params->hw_resolution[0]       = PWG_DEFAULT_RESOLUTION_DPI;
  params->hw_resolution[1]       = PWG_DEFAULT_RESOLUTION_DPI;
  params->page_size[0]           = 0;
  params->page_size[1]           = 0;
  params->media_color.clear();
  params->media_type.clear();
  params->print_content_optimize.clear();
  params->rendering_intent.clear();
  params->page_size_name.clear();
  params->cut_media              = 0;
  params->duplex                 = 0;
  params->tumble                 = 0;
  params->insert_sheet           = 0;
  params->jog                    = 0;
  params->leading_edge           = 0;
  params->media_position         = 0;
  params->media_weight_metric    = 0;
  params->num_copies             = 0;
  params->orientation            = PWG_ORIENTATION_PORTRAIT;
  params->print_quality          = PWG_PRINT_QUALITY_DEFAULT;
  params->cross_feed_transform   = 1;
  params->feed_transform         = 1;
  memset(params->image_box, 0, sizeof(params->image_box));
  params->alternate_primary      = PWG_DEFAULT_ALTERNATE_PRIMARY;
  params->total_page_count       = 0;
  params->vendor_identifier      = 0;
  params->vendor_data.clear();
}

const char *sandor_laboratories::ippo::pwg_color_space_string(uint32_t color_space)
{
  const char *ret_string = "unsupported";

  switch(color_space)
  {
    case PWG_COLOR_SPACE_BLACK:     ret_string = "black";    break;
    case PWG_COLOR_SPACE_CMYK:      ret_string = "cmyk";     break;
    case PWG_COLOR_SPACE_SGRAY:     ret_string = "sgray";    break;
    case PWG_COLOR_SPACE_SRGB:      ret_string = "srgb";     break;
    case PWG_COLOR_SPACE_ADOBE_RGB: ret_string = "adobe-rgb"; break;
    default:                                                 break;
  }

  return ret_string;
}

uint32_t sandor_laboratories::ippo::get_pwg_num_colors(uint32_t color_space)
{
  uint32_t num_colors = 0;

  switch(color_space)
  {
    case PWG_COLOR_SPACE_BLACK:
    case PWG_COLOR_SPACE_SGRAY:
    {
      num_colors = 1;
      break;
    }
    case PWG_COLOR_SPACE_SRGB:
    case PWG_COLOR_SPACE_ADOBE_RGB:
    {
      num_colors = 3;
      break;
    }
    case PWG_COLOR_SPACE_CMYK:
    {
      num_colors = 4;
      break;
    }
    default:
    {
      break;
    }
  }

  return num_colors;
}

ippo_error_e sandor_laboratories::ippo::check_pwg_format(uint32_t color_space, uint32_t bits_per_color)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;
  bool         supported_depth = false;

  switch(color_space)
  {
    case PWG_COLOR_SPACE_BLACK:
    {
      supported_depth = ((1 == bits_per_color) || (8 == bits_per_color));
      break;
    }
    case PWG_COLOR_SPACE_SGRAY:
    {
      supported_depth = ((1 == bits_per_color) || (8 == bits_per_color) || (16 == bits_per_color));
      break;
    }
    case PWG_COLOR_SPACE_SRGB:
    case PWG_COLOR_SPACE_ADOBE_RGB:
    case PWG_COLOR_SPACE_CMYK:
    {
      supported_depth = ((8 == bits_per_color) || (16 == bits_per_color));
      break;
    }
    default:
    {
      fprintf(stderr, "Unsupported PWG color space %" PRIu32 ".\n", color_space);
      ret_val = IPPO_ERROR_UNSUPPORTED_COLOR_SPACE;
      break;
    }
  }

  if((IPPO_ERROR_NONE == ret_val) && !supported_depth)
  {
    fprintf(stderr, "Unsupported bit depth for %s.  bits_per_color %" PRIu32 "\n",
            pwg_color_space_string(color_space), bits_per_color);
    ret_val = IPPO_ERROR_UNSUPPORTED_BIT_DEPTH;
  }

  return ret_val;
}

size_t sandor_laboratories::ippo::compute_pwg_bytes_per_line(uint32_t width, uint32_t bits_per_color, uint32_t num_colors)
{
  uint64_t bits_per_line = ((uint64_t) width) * bits_per_color * num_colors;
  return (size_t) ((bits_per_line + BITS_PER_BYTE - 1) / BITS_PER_BYTE);
}

/* Validates geometry of bitmap against its format.  Returns bytes per line through output. */
static ippo_error_e check_pwg_bitmap(const pwg_bitmap_s *bitmap, size_t *bytes_per_line)
{
  ippo_error_e ret_val = check_pwg_format(bitmap->color_space, bitmap->bits_per_color);

  if(IPPO_ERROR_NONE == ret_val)
  {
    *bytes_per_line = compute_pwg_bytes_per_line(bitmap->width, bitmap->bits_per_color, get_pwg_num_colors(bitmap->color_space));

    if((0 == bitmap->width) || (0 == bitmap->height))
    {
      fprintf(stderr, "Empty PWG page.  width %" PRIu32 " height %" PRIu32 "\n", bitmap->width, bitmap->height);
      ret_val = IPPO_ERROR_DIMENSION_MISMATCH;
    }
    else if((*bytes_per_line > UINT32_MAX) ||
            (bitmap->pixels.size() != (*bytes_per_line * bitmap->height)))
    {
      fprintf(stderr, "Pixel buffer does not match page geometry.  width %" PRIu32 " height %" PRIu32 " bytes_per_line %zu size %zu\n",
              bitmap->width, bitmap->height, *bytes_per_line, bitmap->pixels.size());
      ret_val = IPPO_ERROR_DIMENSION_MISMATCH;
    }
  }

  return ret_val;
}

inline uint32_t derive_page_size(uint32_t page_size, uint32_t pixels, uint32_t resolution)
{
  return ((0 != page_size)?page_size:(uint32_t) (((uint64_t) pixels * PWG_POINTS_PER_INCH) / resolution));
}

static void write_pwg_page_header(const pwg_bitmap_s *bitmap, const pwg_page_params_s *params, uint32_t total_page_count,
                                  uint32_t bytes_per_line, octet_buffer_t *output)
{
  const uint32_t num_colors = get_pwg_num_colors(bitmap->color_space);
  size_t         vendor_length = MIN(params->vendor_data.size(), (size_t) PWG_VENDOR_DATA_SIZE_BYTES);

  write_fixed_string(output, PWG_RASTER_IDENTIFIER, PWG_HEADER_STRING_SIZE_BYTES);
  write_fixed_string(output, params->media_color, PWG_HEADER_STRING_SIZE_BYTES);
  write_fixed_string(output, params->media_type, PWG_HEADER_STRING_SIZE_BYTES);
  write_fixed_string(output, params->print_content_optimize, PWG_HEADER_STRING_SIZE_BYTES);
  write_zeros(output, 12);
  write_u32(output, params->cut_media);
  write_u32(output, params->duplex);
  write_u32(output, params->hw_resolution[0]);
  write_u32(output, params->hw_resolution[1]);
  write_zeros(output, 16);
  write_u32(output, params->insert_sheet);
  write_u32(output, params->jog);
  write_u32(output, params->leading_edge);
  write_zeros(output, 12);
  write_u32(output, params->media_position);
  write_u32(output, params->media_weight_metric);
  write_zeros(output, 8);
  write_u32(output, params->num_copies);
  write_u32(output, params->orientation);
  write_zeros(output, 4);
  write_u32(output, derive_page_size(params->page_size[0], bitmap->width,  params->hw_resolution[0]));
  write_u32(output, derive_page_size(params->page_size[1], bitmap->height, params->hw_resolution[1]));
  write_zeros(output, 8);
  write_u32(output, params->tumble);
  write_u32(output, bitmap->width);
  write_u32(output, bitmap->height);
  write_zeros(output, 4);
  write_u32(output, bitmap->bits_per_color);
  write_u32(output, bitmap->bits_per_color * num_colors);
  write_u32(output, bytes_per_line);
  /* Chunky pixels */
  write_u32(output, 0);
  write_u32(output, bitmap->color_space);
  write_zeros(output, 16);
  write_u32(output, num_colors);
  write_zeros(output, 28);
  write_u32(output, total_page_count);
  write_i32(output, params->cross_feed_transform);
  write_i32(output, params->feed_transform);
  for(int i = 0; i < 4; i++)
  {
    write_u32(output, params->image_box[i]);
  }
  write_u32(output, params->alternate_primary);
  write_u32(output, params->print_quality);
  write_zeros(output, 20);
  write_u32(output, params->vendor_identifier);
  write_u32(output, (uint32_t) vendor_length);
  write_bytes(output, params->vendor_data.data(), vendor_length);
  write_zeros(output, PWG_VENDOR_DATA_SIZE_BYTES - vendor_length);
  write_zeros(output, 64);
  write_fixed_string(output, params->rendering_intent, PWG_HEADER_STRING_SIZE_BYTES);
  write_fixed_string(output, params->page_size_name, PWG_HEADER_STRING_SIZE_BYTES);
}

/* Copies rows, clearing bits past width in the last byte of each row */
static void write_pwg_scanlines(const pwg_bitmap_s *bitmap, size_t bytes_per_line, octet_buffer_t *output)
{
  const uint64_t bits_per_line = ((uint64_t) bitmap->width) * bitmap->bits_per_color * get_pwg_num_colors(bitmap->color_space);
  const unsigned pad_bits      = (unsigned) ((bytes_per_line * BITS_PER_BYTE) - bits_per_line);
  const octet_t  pad_mask      = (octet_t) (0xFF << pad_bits);
  size_t         line_start;

  for(uint32_t y = 0; y < bitmap->height; y++)
  {
    line_start = output->size();
    write_bytes(output, &bitmap->pixels[y * bytes_per_line], bytes_per_line);
    if(pad_bits > 0)
    {
      (*output)[line_start + bytes_per_line - 1] &= pad_mask;
    }
  }
}

/* Header strings need room for a terminating NUL */
inline bool check_pwg_header_string(const char *field, const std::string &text)
{
  bool ret_val = true;

  if(text.size() >= PWG_HEADER_STRING_SIZE_BYTES)
  {
    fprintf(stderr, "PWG %s too long.  length %zu max %u\n", field, text.size(), PWG_HEADER_STRING_SIZE_BYTES-1);
    ret_val = false;
  }

  return ret_val;
}

static ippo_error_e check_pwg_params(const pwg_page_params_s *params)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;

  if((0 == params->hw_resolution[0]) || (0 == params->hw_resolution[1]))
  {
    fprintf(stderr, "PWG page resolution must be non-zero.  %" PRIu32 "x%" PRIu32 "\n",
            params->hw_resolution[0], params->hw_resolution[1]);
    ret_val = IPPO_ERROR_INVALID_ARGUMENT;
  }
  else if(params->vendor_data.size() > PWG_VENDOR_DATA_SIZE_BYTES)
  {
    fprintf(stderr, "PWG vendor data too large.  length %zu max %u\n", params->vendor_data.size(), PWG_VENDOR_DATA_SIZE_BYTES);
    ret_val = IPPO_ERROR_VALUE_TOO_LARGE;
  }
  else if(!check_pwg_header_string("MediaColor",           params->media_color)            ||
          !check_pwg_header_string("MediaType",            params->media_type)             ||
          !check_pwg_header_string("PrintContentOptimize", params->print_content_optimize) ||
          !check_pwg_header_string("RenderingIntent",      params->rendering_intent)       ||
          !check_pwg_header_string("PageSizeName",         params->page_size_name))
  {
    ret_val = IPPO_ERROR_VALUE_TOO_LARGE;
  }

  return ret_val;
}

ippo_error_e sandor_laboratories::ippo::generate_pwg_raster_document(const pwg_page_list_t &pages, octet_buffer_t *output)
{
  ippo_error_e   ret_val = IPPO_ERROR_NONE;
  octet_buffer_t buffer;
  size_t         bytes_per_line = 0;

  if((output == nullptr) || pages.empty())
  {
    fprintf(stderr, "Invalid inputs to generate PWG raster.  pages %zu output %p\n", pages.size(), output);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  write_bytes(&buffer, (const octet_t *) PWG_SYNC_WORD, PWG_SYNC_WORD_SIZE_BYTES);

  for(size_t i = 0; (IPPO_ERROR_NONE == ret_val) && (i < pages.size()); i++)
  {
    const pwg_page_s *page = &pages[i];

    ret_val = check_pwg_bitmap(&page->bitmap, &bytes_per_line);
    if(IPPO_ERROR_NONE == ret_val)
    {
      ret_val = check_pwg_params(&page->params);
    }
    if((IPPO_ERROR_NONE == ret_val) &&
       ((page->bitmap.color_space != pages[0].bitmap.color_space) ||
        (page->bitmap.bits_per_color != pages[0].bitmap.bits_per_color)))
    {
      fprintf(stderr, "PWG page %zu format %s/%" PRIu32 " differs from document format %s/%" PRIu32 ".\n", i+1,
              pwg_color_space_string(page->bitmap.color_space), page->bitmap.bits_per_color,
              pwg_color_space_string(pages[0].bitmap.color_space), pages[0].bitmap.bits_per_color);
      ret_val = IPPO_ERROR_INVALID_ARGUMENT;
    }

    if(IPPO_ERROR_NONE == ret_val)
    {
      write_pwg_page_header(&page->bitmap, &page->params, (uint32_t) pages.size(), (uint32_t) bytes_per_line, &buffer);
      write_pwg_scanlines(&page->bitmap, bytes_per_line, &buffer);
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    output->insert(output->end(), buffer.begin(), buffer.end());
  }

  return ret_val;
}

ippo_error_e sandor_laboratories::ippo::generate_pwg_raster(const pwg_bitmap_s *bitmap, const pwg_page_params_s *params, octet_buffer_t *output)
{
  pwg_page_params_s default_params;

  if(bitmap == nullptr)
  {
    fprintf(stderr, "Null bitmap to generate PWG raster.\n");
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  if(params == nullptr)
  {
    init_pwg_page_params(&default_params);
    params = &default_params;
  }

  const pwg_page_s page =
    {
      .params = *params,
      .bitmap = *bitmap,
    };
  const pwg_page_list_t pages(1, page);

  return generate_pwg_raster_document(pages, output);
}

inline bool read_fixed_string(byte_cursor_s *cursor, std::string *output)
{
  bool ret_val = read_string(cursor, PWG_HEADER_STRING_SIZE_BYTES, output);

  if(ret_val)
  {
    output->resize(strnlen(output->c_str(), PWG_HEADER_STRING_SIZE_BYTES));
  }

  return ret_val;
}

/* Reads one page header.  Cursor must hold at least PWG_PAGE_HEADER_SIZE_BYTES. */
static ippo_error_e read_pwg_page_header(byte_cursor_s *cursor, pwg_page_s *page, uint32_t *bytes_per_line)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;
  std::string  identifier;
  uint32_t     bits_per_pixel = 0;
  uint32_t     color_order = 0;
  uint32_t     color_space = 0;
  uint32_t     num_colors = 0;
  uint32_t     vendor_length = 0;

  init_pwg_page_params(&page->params);

  read_fixed_string(cursor, &identifier);
  read_fixed_string(cursor, &page->params.media_color);
  read_fixed_string(cursor, &page->params.media_type);
  read_fixed_string(cursor, &page->params.print_content_optimize);
  skip_bytes(cursor, 12);
  read_u32(cursor, &page->params.cut_media);
  read_u32(cursor, &page->params.duplex);
  read_u32(cursor, &page->params.hw_resolution[0]);
  read_u32(cursor, &page->params.hw_resolution[1]);
  skip_bytes(cursor, 16);
  read_u32(cursor, &page->params.insert_sheet);
  read_u32(cursor, &page->params.jog);
  read_u32(cursor, &page->params.leading_edge);
  skip_bytes(cursor, 12);
  read_u32(cursor, &page->params.media_position);
  read_u32(cursor, &page->params.media_weight_metric);
  skip_bytes(cursor, 8);
  read_u32(cursor, &page->params.num_copies);
  read_u32(cursor, &page->params.orientation);
  skip_bytes(cursor, 4);
  read_u32(cursor, &page->params.page_size[0]);
  read_u32(cursor, &page->params.page_size[1]);
  skip_bytes(cursor, 8);
  read_u32(cursor, &page->params.tumble);
  read_u32(cursor, &page->bitmap.width);
  read_u32(cursor, &page->bitmap.height);
  skip_bytes(cursor, 4);
  read_u32(cursor, &page->bitmap.bits_per_color);
  read_u32(cursor, &bits_per_pixel);
  read_u32(cursor, bytes_per_line);
  read_u32(cursor, &color_order);
  read_u32(cursor, &color_space);
  skip_bytes(cursor, 16);
  read_u32(cursor, &num_colors);
  skip_bytes(cursor, 28);
  read_u32(cursor, &page->params.total_page_count);
  read_i32(cursor, &page->params.cross_feed_transform);
  read_i32(cursor, &page->params.feed_transform);
  for(int i = 0; i < 4; i++)
  {
    read_u32(cursor, &page->params.image_box[i]);
  }
  read_u32(cursor, &page->params.alternate_primary);
  read_u32(cursor, &page->params.print_quality);
  skip_bytes(cursor, 20);
  read_u32(cursor, &page->params.vendor_identifier);
  read_u32(cursor, &vendor_length);
  read_bytes(cursor, PWG_VENDOR_DATA_SIZE_BYTES, &page->params.vendor_data);
  skip_bytes(cursor, 64);
  read_fixed_string(cursor, &page->params.rendering_intent);
  read_fixed_string(cursor, &page->params.page_size_name);

  if(identifier != PWG_RASTER_IDENTIFIER)
  {
    fprintf(stderr, "PWG page header identifier '%s' is not '%s'.\n", identifier.c_str(), PWG_RASTER_IDENTIFIER);
    ret_val = IPPO_ERROR_MALFORMED_HEADER;
  }
  else if(vendor_length > PWG_VENDOR_DATA_SIZE_BYTES)
  {
    fprintf(stderr, "PWG vendor length out of range.  length %" PRIu32 "\n", vendor_length);
    ret_val = IPPO_ERROR_MALFORMED_HEADER;
  }
  else
  {
    page->params.vendor_data.resize(vendor_length);
    ret_val = check_pwg_format(color_space, page->bitmap.bits_per_color);
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    page->bitmap.color_space = (pwg_color_space_e) color_space;
  }

  if((IPPO_ERROR_NONE == ret_val) &&
     ( (0 != color_order) ||
       (num_colors != get_pwg_num_colors(color_space)) ||
       (bits_per_pixel != (page->bitmap.bits_per_color * num_colors)) ||
       (*bytes_per_line != compute_pwg_bytes_per_line(page->bitmap.width, page->bitmap.bits_per_color, num_colors)) ))
  {
    fprintf(stderr, "Inconsistent PWG page header.  width %" PRIu32 " bits_per_pixel %" PRIu32 " bytes_per_line %" PRIu32 " num_colors %" PRIu32 " color_order %" PRIu32 "\n",
            page->bitmap.width, bits_per_pixel, *bytes_per_line, num_colors, color_order);
    ret_val = IPPO_ERROR_DIMENSION_MISMATCH;
  }

  return ret_val;
}

ippo_error_e sandor_laboratories::ippo::parse_pwg_raster(const octet_t *buffer, size_t size, pwg_page_list_t *pages)
{
  ippo_error_e    ret_val = IPPO_ERROR_NONE;
  byte_cursor_s   cursor;
  pwg_page_list_t parsed_pages;
  uint32_t        bytes_per_line = 0;
  uint64_t        page_bytes = 0;

  if((pages == nullptr) || ((buffer == nullptr) && (size > 0)))
  {
    fprintf(stderr, "Null inputs to parse PWG raster.  buffer %p size %zu pages %p\n", buffer, size, pages);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  cursor = make_byte_cursor(buffer, size);

  if((size < PWG_SYNC_WORD_SIZE_BYTES) || (0 != memcmp(buffer, PWG_SYNC_WORD, PWG_SYNC_WORD_SIZE_BYTES)))
  {
    fprintf(stderr, "Missing PWG raster sync word.  size %zu\n", size);
    return IPPO_ERROR_MALFORMED_HEADER;
  }
  skip_bytes(&cursor, PWG_SYNC_WORD_SIZE_BYTES);

  while((IPPO_ERROR_NONE == ret_val) && (remaining_bytes(&cursor) > 0))
  {
    pwg_page_s page = {};

    if(remaining_bytes(&cursor) < PWG_PAGE_HEADER_SIZE_BYTES)
    {
      fprintf(stderr, "Truncated PWG page header.  page %zu remaining %zu\n", parsed_pages.size()+1, remaining_bytes(&cursor));
      ret_val = IPPO_ERROR_TRUNCATED_INPUT;
      break;
    }

    ret_val = read_pwg_page_header(&cursor, &page, &bytes_per_line);
    if(IPPO_ERROR_NONE == ret_val)
    {
      page_bytes = ((uint64_t) bytes_per_line) * page.bitmap.height;
      if(!read_bytes(&cursor, page_bytes, &page.bitmap.pixels))
      {
        fprintf(stderr, "Truncated PWG page data.  page %zu expected %" PRIu64 " remaining %zu\n",
                parsed_pages.size()+1, page_bytes, remaining_bytes(&cursor));
        ret_val = IPPO_ERROR_TRUNCATED_INPUT;
      }
    }

    if(IPPO_ERROR_NONE == ret_val)
    {
      parsed_pages.push_back(page);
    }
  }

  if((IPPO_ERROR_NONE == ret_val) && parsed_pages.empty())
  {
    fprintf(stderr, "PWG raster contains no pages.\n");
    ret_val = IPPO_ERROR_TRUNCATED_INPUT;
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    *pages = parsed_pages;
  }

  return ret_val;
}

void sandor_laboratories::ippo::print_pwg_page_header(FILE *stream, const pwg_page_s *page)
{
  if((stream == nullptr) || (page == nullptr))
  {
    return;
  }

  fprintf(stream, "Width=%" PRIu32 " Height=%" PRIu32 " ColorSpace=%s BitsPerColor=%" PRIu32 "\n",
          page->bitmap.width, page->bitmap.height, pwg_color_space_string(page->bitmap.color_space), page->bitmap.bits_per_color);
  fprintf(stream, "HWResolution=%" PRIu32 "x%" PRIu32 " PageSize=%" PRIu32 "x%" PRIu32 " PageSizeName=%s\n",
          page->params.hw_resolution[0], page->params.hw_resolution[1],
          page->params.page_size[0], page->params.page_size[1], page->params.page_size_name.c_str());
  fprintf(stream, "MediaColor=%s MediaType=%s Duplex=%" PRIu32 " NumCopies=%" PRIu32 " PrintQuality=%" PRIu32 " TotalPageCount=%" PRIu32 "\n",
          page->params.media_color.c_str(), page->params.media_type.c_str(), page->params.duplex,
          page->params.num_copies, page->params.print_quality, page->params.total_page_count);
}
