#ifndef __IMAGE_HPP__
#define __IMAGE_HPP__

#include "ippo.hpp"
#include "pwg_raster.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    /* Loads PNG as an 8 bit sGray or sRGB bitmap.  Palette is expanded; 16 bit samples and alpha are stripped.
        Bitmap is replaced only on success. */
    ippo_error_e load_png_bitmap(const char *path, pwg_bitmap_s *bitmap);

    /* Writes one raster page as PNG.  Black is inverted so ink appears dark.
        CMYK has no PNG representation and returns IPPO_ERROR_UNSUPPORTED_COLOR_SPACE. */
    ippo_error_e write_raster_page_png(const char *path, const pwg_page_s *page);
  }
}

#endif /* __IMAGE_HPP__ */
