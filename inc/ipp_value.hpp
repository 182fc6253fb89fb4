#ifndef __IPP_VALUE_HPP__
#define __IPP_VALUE_HPP__

#include <cstdint>
#include <string>
#include <vector>

#include "byte_stream.hpp"
#include "ippo.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    /* Delimiter and value tags share one octet of tag space on the wire (RFC 8010 3.5) */
    typedef uint8_t ipp_tag_t;

    typedef enum
    {
      /* delimiter-tag */
      IPP_TAG_OPERATION_ATTRIBUTES          = 0x01,
      IPP_TAG_JOB_ATTRIBUTES                = 0x02,
      IPP_TAG_END_OF_ATTRIBUTES             = 0x03,
      IPP_TAG_PRINTER_ATTRIBUTES            = 0x04,
      IPP_TAG_UNSUPPORTED_ATTRIBUTES        = 0x05,
      IPP_TAG_SUBSCRIPTION_ATTRIBUTES       = 0x06,
      IPP_TAG_EVENT_NOTIFICATION_ATTRIBUTES = 0x07,
      IPP_TAG_RESOURCE_ATTRIBUTES           = 0x08,
      IPP_TAG_DOCUMENT_ATTRIBUTES           = 0x09,
      IPP_TAG_SYSTEM_ATTRIBUTES             = 0x0A,
      /* 0x0B-0x0F reserved */

      /* out-of-band value-tag */
      IPP_TAG_UNSUPPORTED                   = 0x10,
      IPP_TAG_UNKNOWN                       = 0x12,
      IPP_TAG_NO_VALUE                      = 0x13,

      /* integer value-tag */
      IPP_TAG_INTEGER                       = 0x21,
      IPP_TAG_BOOLEAN                       = 0x22,
      IPP_TAG_ENUM                          = 0x23,

      /* octetString value-tag */
      IPP_TAG_OCTET_STRING                  = 0x30,
      IPP_TAG_DATE_TIME                     = 0x31,
      IPP_TAG_RESOLUTION                    = 0x32,
      IPP_TAG_RANGE_OF_INTEGER              = 0x33,
      IPP_TAG_BEG_COLLECTION                = 0x34,
      IPP_TAG_TEXT_WITH_LANGUAGE            = 0x35,
      IPP_TAG_NAME_WITH_LANGUAGE            = 0x36,
      IPP_TAG_END_COLLECTION                = 0x37,

      /* character-string value-tag */
      IPP_TAG_TEXT_WITHOUT_LANGUAGE         = 0x41,
      IPP_TAG_NAME_WITHOUT_LANGUAGE         = 0x42,
      IPP_TAG_KEYWORD                       = 0x44,
      IPP_TAG_URI                           = 0x45,
      IPP_TAG_URI_SCHEME                    = 0x46,
      IPP_TAG_CHARSET                       = 0x47,
      IPP_TAG_NATURAL_LANGUAGE              = 0x48,
      IPP_TAG_MIME_MEDIA_TYPE               = 0x49,
      IPP_TAG_MEMBER_ATTR_NAME              = 0x4A,

      /* Next four octets hold the real tag.  Treated as unrecognized. */
      IPP_TAG_EXTENSION                     = 0x7F,

    } ipp_tag_e;

    #define IPP_TAG_DELIMITER_LIMIT   0x10
    #define IPP_TAG_OUT_OF_BAND_LIMIT 0x20

    /* Length fields on the wire are 16 bits */
    #define IPP_MAX_VALUE_LENGTH 0xFFFF
    #define IPP_MAX_NAME_LENGTH  0xFFFF

    #define IPP_INTEGER_SIZE_BYTES    4
    #define IPP_BOOLEAN_SIZE_BYTES    1
    #define IPP_DATE_TIME_SIZE_BYTES  11
    #define IPP_RESOLUTION_SIZE_BYTES 9
    #define IPP_RANGE_SIZE_BYTES      8

    /* Binary layout class selected by the value-tag */
    typedef enum
    {
      IPP_VALUE_CLASS_DELIMITER,
      IPP_VALUE_CLASS_OUT_OF_BAND,
      IPP_VALUE_CLASS_INTEGER,
      IPP_VALUE_CLASS_BOOLEAN,
      IPP_VALUE_CLASS_OCTET_STRING,
      IPP_VALUE_CLASS_DATE_TIME,
      IPP_VALUE_CLASS_RESOLUTION,
      IPP_VALUE_CLASS_RANGE_OF_INTEGER,
      IPP_VALUE_CLASS_COLLECTION,
      IPP_VALUE_CLASS_STRING_WITH_LANGUAGE,
      IPP_VALUE_CLASS_END_COLLECTION,
      IPP_VALUE_CLASS_STRING,
      /* Unrecognized tags are kept as opaque octets */
      IPP_VALUE_CLASS_OPAQUE,
      IPP_VALUE_CLASS_MAX,
    } ipp_value_class_e;

    typedef enum
    {
      IPP_RESOLUTION_UNITS_DPI  = 3,
      IPP_RESOLUTION_UNITS_DPCM = 4,
    } ipp_resolution_units_e;

    /* RFC 2579 DateAndTime */
    typedef struct
    {
      uint16_t year;
      uint8_t  month;
      uint8_t  day;
      uint8_t  hour;
      uint8_t  minutes;
      uint8_t  seconds;
      uint8_t  deci_seconds;
      /* '+' or '-' */
      uint8_t  utc_direction;
      uint8_t  utc_hours;
      uint8_t  utc_minutes;
    } ipp_date_time_s;

    typedef struct
    {
      int32_t cross_feed;
      int32_t feed;
      uint8_t units;
    } ipp_resolution_s;

    typedef struct
    {
      int32_t lower;
      int32_t upper;
    } ipp_range_s;

    /* Fixed size payloads.  Member in use is selected by the value-tag. */
    typedef union
    {
      int32_t          integer;
      bool             boolean;
      ipp_date_time_s  date_time;
      ipp_resolution_s resolution;
      ipp_range_s      range;
    } ipp_fixed_value_u;

    struct ipp_attribute_s;

    typedef struct ipp_value_s
    {
      /* Wire value-tag.  Determines which of the members below are meaningful. */
      ipp_tag_t                    tag;
      /* integer, boolean, enum, dateTime, resolution, rangeOfInteger */
      ipp_fixed_value_u            fixed;
      /* character-string tags and the string part of text/nameWithLanguage */
      std::string                  text;
      /* natural language part of text/nameWithLanguage */
      std::string                  language;
      /* octetString, out-of-band, and unrecognized tags (raw payload) */
      octet_buffer_t               octets;
      /* begCollection members in wire order */
      std::vector<ipp_attribute_s> collection;
    } ipp_value_s;

    typedef std::vector<ipp_value_s> ipp_value_list_t;

    /* Named attribute.  All values normally share the value-tag of the first value. */
    typedef struct ipp_attribute_s
    {
      std::string      name;
      ipp_value_list_t values;
    } ipp_attribute_s;

    /* Tag classification */
    ipp_value_class_e get_ipp_value_class(ipp_tag_t tag);
    inline bool is_ipp_delimiter_tag(ipp_tag_t tag) {return (tag < IPP_TAG_DELIMITER_LIMIT);};
    /* True for delimiter tags that open an attribute group */
    bool        is_ipp_group_tag(ipp_tag_t tag);
    const char *ipp_tag_string(ipp_tag_t tag);

    /* Value constructors */
    ipp_value_s make_ipp_integer(int32_t value);
    ipp_value_s make_ipp_enum(int32_t value);
    ipp_value_s make_ipp_boolean(bool value);
    ipp_value_s make_ipp_string(ipp_tag_t tag, const std::string &text);
    ipp_value_s make_ipp_string_with_language(ipp_tag_t tag, const std::string &language, const std::string &text);
    ipp_value_s make_ipp_octet_string(const octet_buffer_t &octets);
    ipp_value_s make_ipp_date_time(const ipp_date_time_s &date_time);
    ipp_value_s make_ipp_resolution(int32_t cross_feed, int32_t feed, uint8_t units);
    ipp_value_s make_ipp_range(int32_t lower, int32_t upper);
    ipp_value_s make_ipp_collection(const std::vector<ipp_attribute_s> &members);
    ipp_value_s make_ipp_out_of_band(ipp_tag_t tag);
    /* Keeps tag and payload verbatim so the value can be re-emitted unchanged */
    ipp_value_s make_ipp_opaque(ipp_tag_t tag, const octet_buffer_t &octets);

    /* Encodes the value payload (no tag, no length prefix) and appends it to output.
        begCollection payload is always empty; members are written by the message codec.
        Returns IPPO_ERROR_VALUE_TOO_LARGE when the payload would not fit the 16 bit length field. */
    ippo_error_e encode_ipp_value(const ipp_value_s *value, octet_buffer_t *output);

    /* Decodes a value payload of the given tag.  Output is only written on success.
        Returns IPPO_ERROR_TRUNCATED_INPUT when fewer bytes than the tag requires are given
        and IPPO_ERROR_MALFORMED_VALUE when the payload does not match the tag's layout. */
    ippo_error_e decode_ipp_value(ipp_tag_t tag, const octet_t *payload, size_t length, ipp_value_s *output);

    /* Deep comparison of tag and meaningful members */
    bool ipp_value_equal(const ipp_value_s *a, const ipp_value_s *b);
    bool ipp_attribute_equal(const ipp_attribute_s *a, const ipp_attribute_s *b);

    /* Human readable rendering of a value, e.g. "300x300dpi" */
    std::string format_ipp_value(const ipp_value_s *value);

    /* Returns the first collection member with name or null */
    const ipp_attribute_s *get_ipp_collection_member(const ipp_value_s *collection, const std::string &name);
  }
}

#endif /* __IPP_VALUE_HPP__ */
