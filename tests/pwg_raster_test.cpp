#include <cstring>
#include <gtest/gtest.h>
#include <string>

#include "pwg_raster.hpp"

using namespace sandor_laboratories::ippo;

/* Header field offsets from the start of a page header */
#define HEADER_OFFSET_HW_RESOLUTION   276
#define HEADER_OFFSET_PAGE_SIZE       352
#define HEADER_OFFSET_WIDTH           372
#define HEADER_OFFSET_HEIGHT          376
#define HEADER_OFFSET_BITS_PER_COLOR  384
#define HEADER_OFFSET_BITS_PER_PIXEL  388
#define HEADER_OFFSET_BYTES_PER_LINE  392
#define HEADER_OFFSET_COLOR_ORDER     396
#define HEADER_OFFSET_COLOR_SPACE     400
#define HEADER_OFFSET_NUM_COLORS      420
#define HEADER_OFFSET_TOTAL_PAGES     452
#define HEADER_OFFSET_PAGE_SIZE_NAME  1732

static uint32_t header_u32(const octet_buffer_t &raster, size_t page_start, size_t offset)
{
  byte_cursor_s cursor = make_byte_cursor(raster);
  uint32_t      value = 0;

  EXPECT_TRUE(skip_bytes(&cursor, page_start + offset));
  EXPECT_TRUE(read_u32(&cursor, &value));

  return value;
}

static pwg_bitmap_s make_bitmap(uint32_t width, uint32_t height, uint32_t bits_per_color, pwg_color_space_e color_space, octet_t fill)
{
  pwg_bitmap_s bitmap =
    {
      .width          = width,
      .height         = height,
      .bits_per_color = bits_per_color,
      .color_space    = color_space,
      .pixels         = octet_buffer_t(),
    };
  bitmap.pixels.assign(compute_pwg_bytes_per_line(width, bits_per_color, get_pwg_num_colors(color_space)) * height, fill);

  return bitmap;
}

TEST(pwg_raster, bytes_per_line_rounds_up)
{
  EXPECT_EQ(1u,  compute_pwg_bytes_per_line(2, 1, 1));
  EXPECT_EQ(1u,  compute_pwg_bytes_per_line(8, 1, 1));
  EXPECT_EQ(2u,  compute_pwg_bytes_per_line(9, 1, 1));
  EXPECT_EQ(9u,  compute_pwg_bytes_per_line(3, 8, 3));
  EXPECT_EQ(24u, compute_pwg_bytes_per_line(3, 16, 4));
}

TEST(pwg_raster, one_bit_black_page_layout)
{
  pwg_bitmap_s      bitmap = make_bitmap(2, 2, 1, PWG_COLOR_SPACE_BLACK, 0xFF);
  pwg_page_params_s params;
  octet_buffer_t    raster;

  init_pwg_page_params(&params);
  params.page_size_name = "na_letter_8.5x11in";
  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster(&bitmap, &params, &raster));

  ASSERT_EQ((size_t) (PWG_SYNC_WORD_SIZE_BYTES + PWG_PAGE_HEADER_SIZE_BYTES + 2), raster.size());
  EXPECT_EQ(0, memcmp(raster.data(), "RaS2", 4));
  EXPECT_EQ(0, memcmp(&raster[4], "PwgRaster", 10));

  EXPECT_EQ(300u, header_u32(raster, 4, HEADER_OFFSET_HW_RESOLUTION));
  EXPECT_EQ(300u, header_u32(raster, 4, HEADER_OFFSET_HW_RESOLUTION + 4));
  EXPECT_EQ(2u,  header_u32(raster, 4, HEADER_OFFSET_WIDTH));
  EXPECT_EQ(2u,  header_u32(raster, 4, HEADER_OFFSET_HEIGHT));
  EXPECT_EQ(1u,  header_u32(raster, 4, HEADER_OFFSET_BITS_PER_COLOR));
  EXPECT_EQ(1u,  header_u32(raster, 4, HEADER_OFFSET_BITS_PER_PIXEL));
  EXPECT_EQ(1u,  header_u32(raster, 4, HEADER_OFFSET_BYTES_PER_LINE));
  EXPECT_EQ(0u,  header_u32(raster, 4, HEADER_OFFSET_COLOR_ORDER));
  EXPECT_EQ((uint32_t) PWG_COLOR_SPACE_BLACK, header_u32(raster, 4, HEADER_OFFSET_COLOR_SPACE));
  EXPECT_EQ(1u,  header_u32(raster, 4, HEADER_OFFSET_NUM_COLORS));
  EXPECT_EQ(1u,  header_u32(raster, 4, HEADER_OFFSET_TOTAL_PAGES));
  EXPECT_EQ(0, memcmp(&raster[4 + HEADER_OFFSET_PAGE_SIZE_NAME], "na_letter_8.5x11in", 19));

  /* Bits past the width are cleared */
  EXPECT_EQ(0xC0, raster[raster.size()-2]);
  EXPECT_EQ(0xC0, raster[raster.size()-1]);
}

TEST(pwg_raster, pad_bits_do_not_leak_input)
{
  pwg_bitmap_s   clean = make_bitmap(3, 1, 1, PWG_COLOR_SPACE_BLACK, 0xA0);
  pwg_bitmap_s   dirty = make_bitmap(3, 1, 1, PWG_COLOR_SPACE_BLACK, 0xBF);
  octet_buffer_t clean_raster, dirty_raster;

  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster(&clean, nullptr, &clean_raster));
  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster(&dirty, nullptr, &dirty_raster));
  EXPECT_EQ(clean_raster, dirty_raster);
  EXPECT_EQ(0xA0, clean_raster.back());
}

TEST(pwg_raster, page_size_derived_from_resolution)
{
  pwg_bitmap_s      bitmap = make_bitmap(600, 301, 8, PWG_COLOR_SPACE_SGRAY, 0x80);
  pwg_page_params_s params;
  octet_buffer_t    raster;

  init_pwg_page_params(&params);
  params.hw_resolution[1] = 150;
  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster(&bitmap, &params, &raster));
  EXPECT_EQ(144u, header_u32(raster, 4, HEADER_OFFSET_PAGE_SIZE));
  /* 301 * 72 / 150 truncated */
  EXPECT_EQ(144u, header_u32(raster, 4, HEADER_OFFSET_PAGE_SIZE + 4));

  raster.clear();
  params.page_size[0] = 612;
  params.page_size[1] = 792;
  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster(&bitmap, &params, &raster));
  EXPECT_EQ(612u, header_u32(raster, 4, HEADER_OFFSET_PAGE_SIZE));
  EXPECT_EQ(792u, header_u32(raster, 4, HEADER_OFFSET_PAGE_SIZE + 4));
}

TEST(pwg_raster, srgb_round_trip)
{
  pwg_bitmap_s      bitmap = make_bitmap(3, 2, 8, PWG_COLOR_SPACE_SRGB, 0);
  pwg_page_params_s params;
  octet_buffer_t    raster;
  pwg_page_list_t   pages;

  for(size_t i = 0; i < bitmap.pixels.size(); i++)
  {
    bitmap.pixels[i] = (octet_t) (i * 13);
  }
  init_pwg_page_params(&params);
  params.media_type     = "stationery";
  params.num_copies     = 2;
  params.print_quality  = PWG_PRINT_QUALITY_HIGH;
  params.vendor_data    = {0xCA, 0xFE};

  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster(&bitmap, &params, &raster));
  ASSERT_EQ(IPPO_ERROR_NONE, parse_pwg_raster(raster, &pages));
  ASSERT_EQ(1u, pages.size());

  const pwg_page_s *page = &pages[0];
  EXPECT_EQ(3u, page->bitmap.width);
  EXPECT_EQ(2u, page->bitmap.height);
  EXPECT_EQ(PWG_COLOR_SPACE_SRGB, page->bitmap.color_space);
  EXPECT_EQ(bitmap.pixels, page->bitmap.pixels);
  EXPECT_EQ("stationery", page->params.media_type);
  EXPECT_EQ(2u, page->params.num_copies);
  EXPECT_EQ((uint32_t) PWG_PRINT_QUALITY_HIGH, page->params.print_quality);
  EXPECT_EQ(octet_buffer_t({0xCA, 0xFE}), page->params.vendor_data);
  EXPECT_EQ(1u, page->params.total_page_count);
}

TEST(pwg_raster, multi_page_document_has_one_sync_word)
{
  pwg_page_list_t pages(3);
  pwg_page_list_t parsed;
  octet_buffer_t  raster;

  for(size_t i = 0; i < pages.size(); i++)
  {
    init_pwg_page_params(&pages[i].params);
    pages[i].bitmap = make_bitmap(16, (uint32_t) (i+1), 8, PWG_COLOR_SPACE_SGRAY, (octet_t) i);
  }

  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster_document(pages, &raster));
  EXPECT_EQ((size_t) (4 + (3 * PWG_PAGE_HEADER_SIZE_BYTES) + (16 * (1 + 2 + 3))), raster.size());

  const size_t second_page = 4 + PWG_PAGE_HEADER_SIZE_BYTES + 16;
  EXPECT_EQ(0, memcmp(&raster[second_page], "PwgRaster", 10));
  EXPECT_EQ(3u, header_u32(raster, second_page, HEADER_OFFSET_TOTAL_PAGES));

  ASSERT_EQ(IPPO_ERROR_NONE, parse_pwg_raster(raster, &parsed));
  ASSERT_EQ(3u, parsed.size());
  EXPECT_EQ(3u, parsed[2].bitmap.height);
  EXPECT_EQ(octet_buffer_t(48, 2), parsed[2].bitmap.pixels);
}

TEST(pwg_raster, pages_must_share_format)
{
  pwg_page_list_t pages(2);
  octet_buffer_t  raster;

  init_pwg_page_params(&pages[0].params);
  init_pwg_page_params(&pages[1].params);
  pages[0].bitmap = make_bitmap(4, 4, 8, PWG_COLOR_SPACE_SGRAY, 0);
  pages[1].bitmap = make_bitmap(4, 4, 8, PWG_COLOR_SPACE_SRGB, 0);

  EXPECT_EQ(IPPO_ERROR_INVALID_ARGUMENT, generate_pwg_raster_document(pages, &raster));
  EXPECT_TRUE(raster.empty());
  EXPECT_EQ(IPPO_ERROR_INVALID_ARGUMENT, generate_pwg_raster_document(pwg_page_list_t(), &raster));
}

TEST(pwg_raster, unsupported_formats)
{
  pwg_bitmap_s   bitmap = make_bitmap(4, 4, 8, PWG_COLOR_SPACE_SGRAY, 0);
  octet_buffer_t raster;

  EXPECT_EQ(IPPO_ERROR_NONE, check_pwg_format(PWG_COLOR_SPACE_CMYK, 8));
  EXPECT_EQ(IPPO_ERROR_UNSUPPORTED_BIT_DEPTH,   check_pwg_format(PWG_COLOR_SPACE_SRGB, 1));
  EXPECT_EQ(IPPO_ERROR_UNSUPPORTED_BIT_DEPTH,   check_pwg_format(PWG_COLOR_SPACE_BLACK, 16));
  EXPECT_EQ(IPPO_ERROR_UNSUPPORTED_BIT_DEPTH,   check_pwg_format(PWG_COLOR_SPACE_SGRAY, 4));
  EXPECT_EQ(IPPO_ERROR_UNSUPPORTED_COLOR_SPACE, check_pwg_format(1, 8));

  bitmap.bits_per_color = 2;
  EXPECT_EQ(IPPO_ERROR_UNSUPPORTED_BIT_DEPTH, generate_pwg_raster(&bitmap, nullptr, &raster));
  bitmap.bits_per_color = 8;
  bitmap.color_space    = (pwg_color_space_e) 0;
  EXPECT_EQ(IPPO_ERROR_UNSUPPORTED_COLOR_SPACE, generate_pwg_raster(&bitmap, nullptr, &raster));
  EXPECT_TRUE(raster.empty());
}

TEST(pwg_raster, dimension_mismatch)
{
  pwg_bitmap_s      bitmap = make_bitmap(4, 4, 8, PWG_COLOR_SPACE_SGRAY, 0);
  pwg_page_params_s params;
  octet_buffer_t    raster;

  bitmap.pixels.pop_back();
  EXPECT_EQ(IPPO_ERROR_DIMENSION_MISMATCH, generate_pwg_raster(&bitmap, nullptr, &raster));

  bitmap = make_bitmap(4, 4, 8, PWG_COLOR_SPACE_SGRAY, 0);
  bitmap.height = 0;
  EXPECT_EQ(IPPO_ERROR_DIMENSION_MISMATCH, generate_pwg_raster(&bitmap, nullptr, &raster));

  bitmap = make_bitmap(4, 4, 8, PWG_COLOR_SPACE_SGRAY, 0);
  init_pwg_page_params(&params);
  params.hw_resolution[0] = 0;
  EXPECT_EQ(IPPO_ERROR_INVALID_ARGUMENT, generate_pwg_raster(&bitmap, &params, &raster));

  init_pwg_page_params(&params);
  params.vendor_data.assign(PWG_VENDOR_DATA_SIZE_BYTES + 1, 0);
  EXPECT_EQ(IPPO_ERROR_VALUE_TOO_LARGE, generate_pwg_raster(&bitmap, &params, &raster));
  EXPECT_TRUE(raster.empty());
}

TEST(pwg_raster, parse_rejects_bad_streams)
{
  pwg_bitmap_s    bitmap = make_bitmap(8, 8, 8, PWG_COLOR_SPACE_SGRAY, 0x11);
  octet_buffer_t  raster, damaged;
  pwg_page_list_t pages;

  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster(&bitmap, nullptr, &raster));

  damaged = raster;
  damaged[3] = '3';
  EXPECT_EQ(IPPO_ERROR_MALFORMED_HEADER, parse_pwg_raster(damaged, &pages));

  damaged.assign(raster.begin(), raster.begin() + 4);
  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_pwg_raster(damaged, &pages));

  damaged.assign(raster.begin(), raster.begin() + 100);
  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_pwg_raster(damaged, &pages));

  damaged.assign(raster.begin(), raster.end() - 1);
  EXPECT_EQ(IPPO_ERROR_TRUNCATED_INPUT, parse_pwg_raster(damaged, &pages));

  damaged = raster;
  damaged[4 + HEADER_OFFSET_BYTES_PER_LINE + 3] = 9;
  EXPECT_EQ(IPPO_ERROR_DIMENSION_MISMATCH, parse_pwg_raster(damaged, &pages));

  damaged = raster;
  damaged[4 + HEADER_OFFSET_BITS_PER_COLOR + 3] = 4;
  EXPECT_EQ(IPPO_ERROR_UNSUPPORTED_BIT_DEPTH, parse_pwg_raster(damaged, &pages));

  damaged = raster;
  damaged[4 + HEADER_OFFSET_COLOR_SPACE + 2] = 0x01;
  damaged[4 + HEADER_OFFSET_COLOR_SPACE + 3] = 0xC8;
  EXPECT_EQ(IPPO_ERROR_UNSUPPORTED_COLOR_SPACE, parse_pwg_raster(damaged, &pages));

  EXPECT_TRUE(pages.empty());
}

TEST(pwg_raster, header_strings_must_fit)
{
  pwg_bitmap_s      bitmap = make_bitmap(1, 1, 8, PWG_COLOR_SPACE_SGRAY, 0x80);
  pwg_page_params_s params;
  octet_buffer_t    raster;
  pwg_page_list_t   pages;

  init_pwg_page_params(&params);
  params.media_type     = std::string(PWG_HEADER_STRING_SIZE_BYTES - 1, 'm');
  params.page_size_name = std::string(PWG_HEADER_STRING_SIZE_BYTES - 1, 'p');
  ASSERT_EQ(IPPO_ERROR_NONE, generate_pwg_raster(&bitmap, &params, &raster));
  ASSERT_EQ(IPPO_ERROR_NONE, parse_pwg_raster(raster, &pages));
  ASSERT_EQ(1u, pages.size());
  EXPECT_EQ(params.media_type,     pages[0].params.media_type);
  EXPECT_EQ(params.page_size_name, pages[0].params.page_size_name);

  raster.clear();
  params.media_type = std::string(PWG_HEADER_STRING_SIZE_BYTES, 'm');
  EXPECT_EQ(IPPO_ERROR_VALUE_TOO_LARGE, generate_pwg_raster(&bitmap, &params, &raster));

  init_pwg_page_params(&params);
  params.media_color = std::string(100, 'c');
  EXPECT_EQ(IPPO_ERROR_VALUE_TOO_LARGE, generate_pwg_raster(&bitmap, &params, &raster));

  init_pwg_page_params(&params);
  params.print_content_optimize = std::string(PWG_HEADER_STRING_SIZE_BYTES, 'o');
  EXPECT_EQ(IPPO_ERROR_VALUE_TOO_LARGE, generate_pwg_raster(&bitmap, &params, &raster));

  init_pwg_page_params(&params);
  params.rendering_intent = std::string(PWG_HEADER_STRING_SIZE_BYTES, 'r');
  EXPECT_EQ(IPPO_ERROR_VALUE_TOO_LARGE, generate_pwg_raster(&bitmap, &params, &raster));
  EXPECT_TRUE(raster.empty());
}
