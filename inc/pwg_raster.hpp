#ifndef __PWG_RASTER_HPP__
#define __PWG_RASTER_HPP__

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "byte_stream.hpp"
#include "ippo.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    /* PWG 5102.4 */
    #define PWG_SYNC_WORD                "RaS2"
    #define PWG_SYNC_WORD_SIZE_BYTES     4
    #define PWG_PAGE_HEADER_SIZE_BYTES   1796
    #define PWG_HEADER_STRING_SIZE_BYTES 64
    #define PWG_VENDOR_DATA_SIZE_BYTES   1088
    #define PWG_RASTER_IDENTIFIER        "PwgRaster"

    #define PWG_DEFAULT_RESOLUTION_DPI   300
    #define PWG_DEFAULT_ALTERNATE_PRIMARY 0xFFFFFF
    #define PWG_POINTS_PER_INCH          72

    typedef enum
    {
      PWG_COLOR_SPACE_BLACK     = 3,
      PWG_COLOR_SPACE_CMYK      = 6,
      PWG_COLOR_SPACE_SGRAY     = 18,
      PWG_COLOR_SPACE_SRGB      = 19,
      PWG_COLOR_SPACE_ADOBE_RGB = 20,
    } pwg_color_space_e;

    /* Pixel rows in chunky order (e.g. RGBRGB), each row padded to a whole byte */
    typedef struct
    {
      uint32_t          width;
      uint32_t          height;
      uint32_t          bits_per_color;
      pwg_color_space_e color_space;
      octet_buffer_t    pixels;
    } pwg_bitmap_s;

    typedef enum
    {
      PWG_ORIENTATION_PORTRAIT          = 0,
      PWG_ORIENTATION_LANDSCAPE         = 1,
      PWG_ORIENTATION_REVERSE_PORTRAIT  = 2,
      PWG_ORIENTATION_REVERSE_LANDSCAPE = 3,
    } pwg_orientation_e;

    typedef enum
    {
      PWG_PRINT_QUALITY_DEFAULT = 0,
      PWG_PRINT_QUALITY_DRAFT   = 3,
      PWG_PRINT_QUALITY_NORMAL  = 4,
      PWG_PRINT_QUALITY_HIGH    = 5,
    } pwg_print_quality_e;

    /* Page header fields other than the bitmap geometry */
    typedef struct
    {
      /* [0] cross-feed, [1] feed */
      uint32_t    hw_resolution[2];
      /* Points.  Derived from pixels and resolution when zero. */
      uint32_t    page_size[2];
      std::string media_color;
      std::string media_type;
      std::string print_content_optimize;
      std::string rendering_intent;
      std::string page_size_name;
      uint32_t    cut_media;
      uint32_t    duplex;
      uint32_t    tumble;
      uint32_t    insert_sheet;
      uint32_t    jog;
      uint32_t    leading_edge;
      uint32_t    media_position;
      uint32_t    media_weight_metric;
      /* 0 for printer default */
      uint32_t    num_copies;
      uint32_t    orientation;
      uint32_t    print_quality;
      int32_t     cross_feed_transform;
      int32_t     feed_transform;
      /* left, top, right, bottom.  0 if unknown. */
      uint32_t    image_box[4];
      uint32_t    alternate_primary;
      /* Filled by the generator */
      uint32_t    total_page_count;
      uint32_t    vendor_identifier;
      octet_buffer_t vendor_data;
    } pwg_page_params_s;

    typedef struct
    {
      pwg_page_params_s params;
      pwg_bitmap_s      bitmap;
    } pwg_page_s;

    typedef std::vector<pwg_page_s> pwg_page_list_t;

    void init_pwg_page_params(pwg_page_params_s *params);

    const char *pwg_color_space_string(uint32_t color_space);
    /* Returns 0 for unsupported color spaces */
    uint32_t get_pwg_num_colors(uint32_t color_space);
    /* Returns IPPO_ERROR_NONE if the generator implements color_space at bits_per_color */
    ippo_error_e check_pwg_format(uint32_t color_space, uint32_t bits_per_color);
    /* ceil(width * bits_per_color * num_colors / 8) */
    size_t compute_pwg_bytes_per_line(uint32_t width, uint32_t bits_per_color, uint32_t num_colors);

    /* Encodes one page document: sync word, page header, then height uncompressed scanlines.
        Output is appended only on success. */
    ippo_error_e generate_pwg_raster(const pwg_bitmap_s *bitmap, const pwg_page_params_s *params, octet_buffer_t *output);
    /* Encodes all pages behind a single sync word.  Pages must share color space and bits per color. */
    ippo_error_e generate_pwg_raster_document(const pwg_page_list_t &pages, octet_buffer_t *output);

    /* Decodes a stream produced by the generator.  Output is replaced only on success. */
    ippo_error_e parse_pwg_raster(const octet_t *buffer, size_t size, pwg_page_list_t *pages);
    inline ippo_error_e parse_pwg_raster(const octet_buffer_t &buffer, pwg_page_list_t *pages)
    {
      return parse_pwg_raster(buffer.data(), buffer.size(), pages);
    };

    void print_pwg_page_header(FILE *stream, const pwg_page_s *page);
  }
}

#endif /* __PWG_RASTER_HPP__ */
