#include <cerrno>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <png.h>
#include <utility>
#include <vector>

#include "image.hpp"
#include "version.hpp"

using namespace sandor_laboratories::ippo;

/* State shared with the setjmp guarded sections.  Only touched through a pointer so values survive longjmp. */
typedef struct
{
  FILE                  *file_ptr;
  png_structp            png_ptr;
  png_infop              png_info_ptr;
  pwg_bitmap_s           bitmap;
  std::vector<png_bytep> row_pointers;
} png_session_s;

static void png_error_handler(png_structp png_struct_ptr, png_const_charp error_string)
{
  fprintf(stderr, "libpng error - %s.\n", error_string);
  png_longjmp(png_struct_ptr, 1);
}

static void png_warning_handler(png_structp png_struct_ptr, png_const_charp warning_string)
{
  UNUSED(png_struct_ptr);
  fprintf(stderr, "libpng warning - %s.\n", warning_string);
}

/* Returns false if libpng raised an error */
static bool read_png(png_session_s *session)
{
  png_uint_32 width  = 0;
  png_uint_32 height = 0;
  int         bit_depth  = 0;
  int         color_type = 0;
  size_t      row_bytes  = 0;

  if(setjmp(png_jmpbuf(session->png_ptr)))
  {
    return false;
  }

  png_init_io(session->png_ptr, session->file_ptr);
  png_read_info(session->png_ptr, session->png_info_ptr);
  png_get_IHDR(session->png_ptr, session->png_info_ptr, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

  if(PNG_COLOR_TYPE_PALETTE == color_type)
  {
    png_set_palette_to_rgb(session->png_ptr);
  }
  if((PNG_COLOR_TYPE_GRAY == color_type) && (bit_depth < 8))
  {
    png_set_expand_gray_1_2_4_to_8(session->png_ptr);
  }
  if(16 == bit_depth)
  {
    png_set_strip_16(session->png_ptr);
  }
  if(color_type & PNG_COLOR_MASK_ALPHA)
  {
    png_set_strip_alpha(session->png_ptr);
  }
  png_set_interlace_handling(session->png_ptr);
  png_read_update_info(session->png_ptr, session->png_info_ptr);

  color_type = png_get_color_type(session->png_ptr, session->png_info_ptr);
  row_bytes  = png_get_rowbytes(session->png_ptr, session->png_info_ptr);

  session->bitmap.width          = width;
  session->bitmap.height         = height;
  session->bitmap.bits_per_color = 8;
  session->bitmap.color_space    = ((PNG_COLOR_TYPE_GRAY == color_type)?PWG_COLOR_SPACE_SGRAY:PWG_COLOR_SPACE_SRGB);
  session->bitmap.pixels.assign(row_bytes * height, 0);
  session->row_pointers.resize(height);
  for(png_uint_32 y = 0; y < height; y++)
  {
    session->row_pointers[y] = &session->bitmap.pixels[y * row_bytes];
  }

  png_read_image(session->png_ptr, session->row_pointers.data());
  png_read_end(session->png_ptr, nullptr);

  return true;
}

ippo_error_e sandor_laboratories::ippo::load_png_bitmap(const char *path, pwg_bitmap_s *bitmap)
{
  ippo_error_e  ret_val = IPPO_ERROR_NONE;
  png_session_s session = {};

  if((path == nullptr) || (bitmap == nullptr))
  {
    fprintf(stderr, "Null inputs to load PNG.  path %p bitmap %p\n", path, bitmap);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  printf("Opening file %s for reading.\n", path);
  session.file_ptr = fopen(path, "rb");
  if(session.file_ptr == nullptr)
  {
    fprintf(stderr, "Error opening image file '%s' for reading.  errno %u: %s\n", path, errno, strerror(errno));
    return IPPO_ERROR_FILE_IO;
  }

  session.png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_handler, png_warning_handler);
  if(session.png_ptr != nullptr)
  {
    session.png_info_ptr = png_create_info_struct(session.png_ptr);
  }

  if((session.png_ptr == nullptr) || (session.png_info_ptr == nullptr))
  {
    fprintf(stderr, "Error initializing png read struct.\n");
    ret_val = IPPO_ERROR_IMAGE;
  }
  else if(!read_png(&session))
  {
    fprintf(stderr, "Failed to decode PNG '%s'.\n", path);
    ret_val = IPPO_ERROR_IMAGE;
  }
  else
  {
    printf("Loaded %u x %u %s PNG.\n", session.bitmap.width, session.bitmap.height, pwg_color_space_string(session.bitmap.color_space));
    *bitmap = std::move(session.bitmap);
  }

  png_destroy_read_struct(&session.png_ptr, &session.png_info_ptr, nullptr);
  if(0 != fclose(session.file_ptr))
  {
    fprintf(stderr, "Failed to close image file '%s'.  errno %u: %s\n", path, errno, strerror(errno));
  }

  return ret_val;
}

#define PNG_TEXT_BUFFER_SIZE 1024
static void fill_png_text(png_session_s *session, const pwg_page_s *page)
{
  std::vector<png_text> png_text_array;
  char title_key[] = "Title";
  char title_text[PNG_TEXT_BUFFER_SIZE];
  snprintf(title_text, sizeof(title_text), "PWG Raster page (%u x %u %s %u bit, %u x %u dpi)",
           page->bitmap.width, page->bitmap.height, pwg_color_space_string(page->bitmap.color_space),
           page->bitmap.bits_per_color, page->params.hw_resolution[0], page->params.hw_resolution[1]);
  png_text_array.push_back
    (
      {
        .compression = PNG_TEXT_COMPRESSION_NONE,
        .key = title_key,
        .text = title_text,
        .text_length = strlen(title_text),
        .itxt_length = 0,
        .lang = nullptr,
        .lang_key = nullptr,
      }
    );
  char software_key[]  = "Software";
  char software_text[] = PROJECT_NAME " " PROJECT_VER " <" PROJECT_URL ">";
  png_text_array.push_back
    (
      {
        .compression = PNG_TEXT_COMPRESSION_NONE,
        .key = software_key,
        .text = software_text,
        .text_length = strlen(software_text),
        .itxt_length = 0,
        .lang = nullptr,
        .lang_key = nullptr,
      }
    );
  char time_key[] = "Creation Time";
  char time_text[PNG_TEXT_BUFFER_SIZE];
  time_t time_now = time(NULL);
  struct tm gmtime_now;
  gmtime_r(&time_now, &gmtime_now);
  strftime(time_text, sizeof(time_text), "%a, %d %b %y %T %Z", &gmtime_now);
  png_text_array.push_back
    (
      {
        .compression = PNG_TEXT_COMPRESSION_NONE,
        .key = time_key,
        .text = time_text,
        .text_length = strlen(time_text),
        .itxt_length = 0,
        .lang = nullptr,
        .lang_key = nullptr,
      }
    );

  /* libpng copies the text */
  png_set_text(session->png_ptr, session->png_info_ptr, png_text_array.data(), (int)png_text_array.size());
}

/* Returns false if libpng raised an error */
static bool write_png(png_session_s *session, const pwg_page_s *page, int color_type, size_t bytes_per_line)
{
  if(setjmp(png_jmpbuf(session->png_ptr)))
  {
    return false;
  }

  png_init_io(session->png_ptr, session->file_ptr);
  png_set_IHDR( session->png_ptr, session->png_info_ptr,
                page->bitmap.width, page->bitmap.height,
                (int)page->bitmap.bits_per_color,
                color_type,
                PNG_INTERLACE_NONE,
                PNG_COMPRESSION_TYPE_DEFAULT,
                PNG_FILTER_TYPE_DEFAULT );
  png_set_pHYs(session->png_ptr, session->png_info_ptr,
               /* dpi to pixels per meter */
               (png_uint_32) ((page->params.hw_resolution[0] * 10000ULL) / 254),
               (png_uint_32) ((page->params.hw_resolution[1] * 10000ULL) / 254),
               PNG_RESOLUTION_METER);
  fill_png_text(session, page);
  png_write_info(session->png_ptr, session->png_info_ptr);

  if(PWG_COLOR_SPACE_BLACK == page->bitmap.color_space)
  {
    png_set_invert_mono(session->png_ptr);
  }

  session->row_pointers.resize(page->bitmap.height);
  for(uint32_t y = 0; y < page->bitmap.height; y++)
  {
    session->row_pointers[y] = (png_bytep) &page->bitmap.pixels[y * bytes_per_line];
  }
  png_write_image(session->png_ptr, session->row_pointers.data());
  png_write_end(session->png_ptr, nullptr);

  return true;
}

ippo_error_e sandor_laboratories::ippo::write_raster_page_png(const char *path, const pwg_page_s *page)
{
  ippo_error_e  ret_val = IPPO_ERROR_NONE;
  png_session_s session = {};
  int           color_type = PNG_COLOR_TYPE_GRAY;
  size_t        bytes_per_line = 0;

  if((path == nullptr) || (page == nullptr))
  {
    fprintf(stderr, "Null inputs to write PNG.  path %p page %p\n", path, page);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  ret_val = check_pwg_format(page->bitmap.color_space, page->bitmap.bits_per_color);
  if(IPPO_ERROR_NONE == ret_val)
  {
    switch(page->bitmap.color_space)
    {
      case PWG_COLOR_SPACE_BLACK:
      case PWG_COLOR_SPACE_SGRAY:
      {
        color_type = PNG_COLOR_TYPE_GRAY;
        break;
      }
      case PWG_COLOR_SPACE_SRGB:
      case PWG_COLOR_SPACE_ADOBE_RGB:
      {
        color_type = PNG_COLOR_TYPE_RGB;
        break;
      }
      default:
      {
        fprintf(stderr, "No PNG representation for %s pages.\n", pwg_color_space_string(page->bitmap.color_space));
        ret_val = IPPO_ERROR_UNSUPPORTED_COLOR_SPACE;
        break;
      }
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    bytes_per_line = compute_pwg_bytes_per_line(page->bitmap.width, page->bitmap.bits_per_color, get_pwg_num_colors(page->bitmap.color_space));
    if((0 == page->bitmap.width) || (0 == page->bitmap.height) ||
       (page->bitmap.pixels.size() != (bytes_per_line * page->bitmap.height)))
    {
      fprintf(stderr, "Page pixels do not match geometry.  width %u height %u size %zu\n",
              page->bitmap.width, page->bitmap.height, page->bitmap.pixels.size());
      ret_val = IPPO_ERROR_DIMENSION_MISMATCH;
    }
  }

  if(IPPO_ERROR_NONE != ret_val)
  {
    return ret_val;
  }

  printf("Opening file %s for writing.\n", path);
  session.file_ptr = fopen(path, "wb");
  if(session.file_ptr == nullptr)
  {
    fprintf(stderr, "Error opening image file '%s' for writing.  errno %u: %s\n", path, errno, strerror(errno));
    return IPPO_ERROR_FILE_IO;
  }

  session.png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_handler, png_warning_handler);
  if(session.png_ptr != nullptr)
  {
    session.png_info_ptr = png_create_info_struct(session.png_ptr);
  }

  if((session.png_ptr == nullptr) || (session.png_info_ptr == nullptr))
  {
    fprintf(stderr, "Error initializing png write struct.\n");
    ret_val = IPPO_ERROR_IMAGE;
  }
  else if(!write_png(&session, page, color_type, bytes_per_line))
  {
    fprintf(stderr, "Failed to encode PNG '%s'.\n", path);
    ret_val = IPPO_ERROR_IMAGE;
  }

  png_destroy_write_struct(&session.png_ptr, &session.png_info_ptr);
  if(0 != fclose(session.file_ptr))
  {
    fprintf(stderr, "Failed to close image file '%s'.  errno %u: %s\n", path, errno, strerror(errno));
    ret_val = IPPO_ERROR_FILE_IO;
  }

  return ret_val;
}
