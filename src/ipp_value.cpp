#include <cinttypes>
#include <cstdio>
#include <cstring>

#include "ipp_value.hpp"

using namespace sandor_laboratories::ippo;

ipp_value_class_e sandor_laboratories::ippo::get_ipp_value_class(ipp_tag_t tag)
{
  ipp_value_class_e value_class = IPP_VALUE_CLASS_OPAQUE;

  if(is_ipp_delimiter_tag(tag))
  {
    value_class = IPP_VALUE_CLASS_DELIMITER;
  }
  else if(tag < IPP_TAG_OUT_OF_BAND_LIMIT)
  {
    value_class = IPP_VALUE_CLASS_OUT_OF_BAND;
  }
  else
  {
    switch(tag)
    {
      case IPP_TAG_INTEGER:
      case IPP_TAG_ENUM:
      {
        value_class = IPP_VALUE_CLASS_INTEGER;
        break;
      }
      case IPP_TAG_BOOLEAN:
      {
        value_class = IPP_VALUE_CLASS_BOOLEAN;
        break;
      }
      case IPP_TAG_OCTET_STRING:
      {
        value_class = IPP_VALUE_CLASS_OCTET_STRING;
        break;
      }
      case IPP_TAG_DATE_TIME:
      {
        value_class = IPP_VALUE_CLASS_DATE_TIME;
        break;
      }
      case IPP_TAG_RESOLUTION:
      {
        value_class = IPP_VALUE_CLASS_RESOLUTION;
        break;
      }
      case IPP_TAG_RANGE_OF_INTEGER:
      {
        value_class = IPP_VALUE_CLASS_RANGE_OF_INTEGER;
        break;
      }
      case IPP_TAG_BEG_COLLECTION:
      {
        value_class = IPP_VALUE_CLASS_COLLECTION;
        break;
      }
      case IPP_TAG_TEXT_WITH_LANGUAGE:
      case IPP_TAG_NAME_WITH_LANGUAGE:
      {
        value_class = IPP_VALUE_CLASS_STRING_WITH_LANGUAGE;
        break;
      }
      case IPP_TAG_END_COLLECTION:
      {
        value_class = IPP_VALUE_CLASS_END_COLLECTION;
        break;
      }
      case IPP_TAG_TEXT_WITHOUT_LANGUAGE:
      case IPP_TAG_NAME_WITHOUT_LANGUAGE:
      case IPP_TAG_KEYWORD:
      case IPP_TAG_URI:
      case IPP_TAG_URI_SCHEME:
      case IPP_TAG_CHARSET:
      case IPP_TAG_NATURAL_LANGUAGE:
      case IPP_TAG_MIME_MEDIA_TYPE:
      case IPP_TAG_MEMBER_ATTR_NAME:
      {
        value_class = IPP_VALUE_CLASS_STRING;
        break;
      }
      default:
      {
        value_class = IPP_VALUE_CLASS_OPAQUE;
        break;
      }
    }
  }

  return value_class;
}

bool sandor_laboratories::ippo::is_ipp_group_tag(ipp_tag_t tag)
{
  return ( (tag >= IPP_TAG_OPERATION_ATTRIBUTES) &&
           (tag <= IPP_TAG_SYSTEM_ATTRIBUTES) &&
           (tag != IPP_TAG_END_OF_ATTRIBUTES) );
}

const char * sandor_laboratories::ippo::ipp_tag_string(ipp_tag_t tag)
{
  const char * ret_string = "unrecognized";

  switch(tag)
  {
    case IPP_TAG_OPERATION_ATTRIBUTES:          ret_string = "operation-attributes-tag";          break;
    case IPP_TAG_JOB_ATTRIBUTES:                ret_string = "job-attributes-tag";                break;
    case IPP_TAG_END_OF_ATTRIBUTES:             ret_string = "end-of-attributes-tag";             break;
    case IPP_TAG_PRINTER_ATTRIBUTES:            ret_string = "printer-attributes-tag";            break;
    case IPP_TAG_UNSUPPORTED_ATTRIBUTES:        ret_string = "unsupported-attributes-tag";        break;
    case IPP_TAG_SUBSCRIPTION_ATTRIBUTES:       ret_string = "subscription-attributes-tag";       break;
    case IPP_TAG_EVENT_NOTIFICATION_ATTRIBUTES: ret_string = "event-notification-attributes-tag"; break;
    case IPP_TAG_RESOURCE_ATTRIBUTES:           ret_string = "resource-attributes-tag";           break;
    case IPP_TAG_DOCUMENT_ATTRIBUTES:           ret_string = "document-attributes-tag";           break;
    case IPP_TAG_SYSTEM_ATTRIBUTES:             ret_string = "system-attributes-tag";             break;
    case IPP_TAG_UNSUPPORTED:                   ret_string = "unsupported";                       break;
    case IPP_TAG_UNKNOWN:                       ret_string = "unknown";                           break;
    case IPP_TAG_NO_VALUE:                      ret_string = "no-value";                          break;
    case IPP_TAG_INTEGER:                       ret_string = "integer";                           break;
    case IPP_TAG_BOOLEAN:                       ret_string = "boolean";                           break;
    case IPP_TAG_ENUM:                          ret_string = "enum";                              break;
    case IPP_TAG_OCTET_STRING:                  ret_string = "octetString";                       break;
    case IPP_TAG_DATE_TIME:                     ret_string = "dateTime";                          break;
    case IPP_TAG_RESOLUTION:                    ret_string = "resolution";                        break;
    case IPP_TAG_RANGE_OF_INTEGER:              ret_string = "rangeOfInteger";                    break;
    case IPP_TAG_BEG_COLLECTION:                ret_string = "collection";                        break;
    case IPP_TAG_TEXT_WITH_LANGUAGE:            ret_string = "textWithLanguage";                  break;
    case IPP_TAG_NAME_WITH_LANGUAGE:            ret_string = "nameWithLanguage";                  break;
    case IPP_TAG_END_COLLECTION:                ret_string = "endCollection";                     break;
    case IPP_TAG_TEXT_WITHOUT_LANGUAGE:         ret_string = "textWithoutLanguage";               break;
    case IPP_TAG_NAME_WITHOUT_LANGUAGE:         ret_string = "nameWithoutLanguage";               break;
    case IPP_TAG_KEYWORD:                       ret_string = "keyword";                           break;
    case IPP_TAG_URI:                           ret_string = "uri";                               break;
    case IPP_TAG_URI_SCHEME:                    ret_string = "uriScheme";                         break;
    case IPP_TAG_CHARSET:                       ret_string = "charset";                           break;
    case IPP_TAG_NATURAL_LANGUAGE:              ret_string = "naturalLanguage";                   break;
    case IPP_TAG_MIME_MEDIA_TYPE:               ret_string = "mimeMediaType";                     break;
    case IPP_TAG_MEMBER_ATTR_NAME:              ret_string = "memberAttrName";                    break;
    case IPP_TAG_EXTENSION:                     ret_string = "extension";                         break;
    default:                                                                                      break;
  }

  return ret_string;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_integer(int32_t integer)
{
  ipp_value_s value = {};
  value.tag = IPP_TAG_INTEGER;
  value.fixed.integer = integer;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_enum(int32_t enumeration)
{
  ipp_value_s value = {};
  value.tag = IPP_TAG_ENUM;
  value.fixed.integer = enumeration;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_boolean(bool boolean)
{
  ipp_value_s value = {};
  value.tag = IPP_TAG_BOOLEAN;
  value.fixed.boolean = boolean;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_string(ipp_tag_t tag, const std::string &text)
{
  ipp_value_s value = {};
  value.tag  = tag;
  value.text = text;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_string_with_language(ipp_tag_t tag, const std::string &language, const std::string &text)
{
  ipp_value_s value = {};
  value.tag      = tag;
  value.language = language;
  value.text     = text;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_octet_string(const octet_buffer_t &octets)
{
  ipp_value_s value = {};
  value.tag    = IPP_TAG_OCTET_STRING;
  value.octets = octets;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_date_time(const ipp_date_time_s &date_time)
{
  ipp_value_s value = {};
  value.tag = IPP_TAG_DATE_TIME;
  value.fixed.date_time = date_time;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_resolution(int32_t cross_feed, int32_t feed, uint8_t units)
{
  ipp_value_s value = {};
  value.tag = IPP_TAG_RESOLUTION;
  value.fixed.resolution.cross_feed = cross_feed;
  value.fixed.resolution.feed       = feed;
  value.fixed.resolution.units      = units;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_range(int32_t lower, int32_t upper)
{
  ipp_value_s value = {};
  value.tag = IPP_TAG_RANGE_OF_INTEGER;
  value.fixed.range.lower = lower;
  value.fixed.range.upper = upper;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_collection(const std::vector<ipp_attribute_s> &members)
{
  ipp_value_s value = {};
  value.tag        = IPP_TAG_BEG_COLLECTION;
  value.collection = members;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_out_of_band(ipp_tag_t tag)
{
  ipp_value_s value = {};
  value.tag = tag;
  return value;
}

ipp_value_s sandor_laboratories::ippo::make_ipp_opaque(ipp_tag_t tag, const octet_buffer_t &octets)
{
  ipp_value_s value = {};
  value.tag    = tag;
  value.octets = octets;
  return value;
}

inline ippo_error_e encode_length_prefixed_string(const std::string &text, octet_buffer_t *output)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;

  if(text.size() <= IPP_MAX_VALUE_LENGTH)
  {
    write_u16(output, (uint16_t) text.size());
    write_string(output, text);
  }
  else
  {
    fprintf(stderr, "String too large for 16 bit length field.  length %zu\n", text.size());
    ret_val = IPPO_ERROR_VALUE_TOO_LARGE;
  }

  return ret_val;
}

ippo_error_e sandor_laboratories::ippo::encode_ipp_value(const ipp_value_s *value, octet_buffer_t *output)
{
  ippo_error_e   ret_val = IPPO_ERROR_NONE;
  octet_buffer_t payload;

  if((value == nullptr) || (output == nullptr))
  {
    fprintf(stderr, "Null inputs to encode IPP value.  value %p output %p\n", value, output);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  switch(get_ipp_value_class(value->tag))
  {
    case IPP_VALUE_CLASS_INTEGER:
    {
      write_i32(&payload, value->fixed.integer);
      break;
    }
    case IPP_VALUE_CLASS_BOOLEAN:
    {
      write_u8(&payload, (value->fixed.boolean?1:0));
      break;
    }
    case IPP_VALUE_CLASS_DATE_TIME:
    {
      const ipp_date_time_s *date_time = &value->fixed.date_time;
      write_u16(&payload, date_time->year);
      write_u8 (&payload, date_time->month);
      write_u8 (&payload, date_time->day);
      write_u8 (&payload, date_time->hour);
      write_u8 (&payload, date_time->minutes);
      write_u8 (&payload, date_time->seconds);
      write_u8 (&payload, date_time->deci_seconds);
      write_u8 (&payload, date_time->utc_direction);
      write_u8 (&payload, date_time->utc_hours);
      write_u8 (&payload, date_time->utc_minutes);
      break;
    }
    case IPP_VALUE_CLASS_RESOLUTION:
    {
      write_i32(&payload, value->fixed.resolution.cross_feed);
      write_i32(&payload, value->fixed.resolution.feed);
      write_u8 (&payload, value->fixed.resolution.units);
      break;
    }
    case IPP_VALUE_CLASS_RANGE_OF_INTEGER:
    {
      write_i32(&payload, value->fixed.range.lower);
      write_i32(&payload, value->fixed.range.upper);
      break;
    }
    case IPP_VALUE_CLASS_COLLECTION:
    {
      /* begCollection carries no payload of its own */
      break;
    }
    case IPP_VALUE_CLASS_STRING_WITH_LANGUAGE:
    {
      ret_val = encode_length_prefixed_string(value->language, &payload);
      if(IPPO_ERROR_NONE == ret_val)
      {
        ret_val = encode_length_prefixed_string(value->text, &payload);
      }
      break;
    }
    case IPP_VALUE_CLASS_STRING:
    {
      write_string(&payload, value->text);
      break;
    }
    case IPP_VALUE_CLASS_END_COLLECTION:
    {
      /* endCollection carries no payload */
      break;
    }
    case IPP_VALUE_CLASS_OCTET_STRING:
    case IPP_VALUE_CLASS_OUT_OF_BAND:
    case IPP_VALUE_CLASS_OPAQUE:
    {
      write_bytes(&payload, value->octets);
      break;
    }
    case IPP_VALUE_CLASS_DELIMITER:
    default:
    {
      fprintf(stderr, "Cannot encode delimiter tag 0x%02x as a value.\n", value->tag);
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
      break;
    }
  }

  if((IPPO_ERROR_NONE == ret_val) && (payload.size() > IPP_MAX_VALUE_LENGTH))
  {
    fprintf(stderr, "IPP value too large for 16 bit length field.  tag %s (0x%02x) length %zu\n",
            ipp_tag_string(value->tag), value->tag, payload.size());
    ret_val = IPPO_ERROR_VALUE_TOO_LARGE;
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    write_bytes(output, payload);
  }

  return ret_val;
}

/* Checks payload length against a fixed size layout */
inline ippo_error_e check_fixed_length(ipp_tag_t tag, size_t length, size_t expected_length)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;

  if(length < expected_length)
  {
    fprintf(stderr, "Truncated %s value.  length %zu expected %zu\n", ipp_tag_string(tag), length, expected_length);
    ret_val = IPPO_ERROR_TRUNCATED_INPUT;
  }
  else if(length > expected_length)
  {
    fprintf(stderr, "Oversized %s value.  length %zu expected %zu\n", ipp_tag_string(tag), length, expected_length);
    ret_val = IPPO_ERROR_MALFORMED_VALUE;
  }

  return ret_val;
}

inline ippo_error_e decode_string_with_language(ipp_tag_t tag, byte_cursor_s *cursor, ipp_value_s *value)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;
  uint16_t     language_length = 0;
  uint16_t     text_length = 0;

  if( !read_u16(cursor, &language_length) ||
      !read_string(cursor, language_length, &value->language) ||
      !read_u16(cursor, &text_length) ||
      !read_string(cursor, text_length, &value->text) )
  {
    fprintf(stderr, "Truncated %s value.  length %zu language_length %u text_length %u\n",
            ipp_tag_string(tag), cursor->size, language_length, text_length);
    ret_val = IPPO_ERROR_TRUNCATED_INPUT;
  }
  else if(remaining_bytes(cursor) != 0)
  {
    fprintf(stderr, "Trailing bytes in %s value.  length %zu trailing %zu\n",
            ipp_tag_string(tag), cursor->size, remaining_bytes(cursor));
    ret_val = IPPO_ERROR_MALFORMED_VALUE;
  }

  return ret_val;
}

ippo_error_e sandor_laboratories::ippo::decode_ipp_value(ipp_tag_t tag, const octet_t *payload, size_t length, ipp_value_s *output)
{
  ippo_error_e  ret_val = IPPO_ERROR_NONE;
  ipp_value_s   value = {};
  byte_cursor_s cursor;

  if((output == nullptr) || ((payload == nullptr) && (length > 0)))
  {
    fprintf(stderr, "Null inputs to decode IPP value.  payload %p length %zu output %p\n", payload, length, output);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  cursor    = make_byte_cursor(payload, length);
  value.tag = tag;

  switch(get_ipp_value_class(tag))
  {
    case IPP_VALUE_CLASS_INTEGER:
    {
      ret_val = check_fixed_length(tag, length, IPP_INTEGER_SIZE_BYTES);
      if(IPPO_ERROR_NONE == ret_val)
      {
        read_i32(&cursor, &value.fixed.integer);
      }
      break;
    }
    case IPP_VALUE_CLASS_BOOLEAN:
    {
      ret_val = check_fixed_length(tag, length, IPP_BOOLEAN_SIZE_BYTES);
      if(IPPO_ERROR_NONE == ret_val)
      {
        if(payload[0] > 1)
        {
          fprintf(stderr, "Boolean value out of range.  value 0x%02x\n", payload[0]);
          ret_val = IPPO_ERROR_MALFORMED_VALUE;
        }
        value.fixed.boolean = (1 == payload[0]);
      }
      break;
    }
    case IPP_VALUE_CLASS_DATE_TIME:
    {
      ret_val = check_fixed_length(tag, length, IPP_DATE_TIME_SIZE_BYTES);
      if(IPPO_ERROR_NONE == ret_val)
      {
        /* Structure only, calendar correctness is not checked */
        ipp_date_time_s *date_time = &value.fixed.date_time;
        read_u16(&cursor, &date_time->year);
        read_u8 (&cursor, &date_time->month);
        read_u8 (&cursor, &date_time->day);
        read_u8 (&cursor, &date_time->hour);
        read_u8 (&cursor, &date_time->minutes);
        read_u8 (&cursor, &date_time->seconds);
        read_u8 (&cursor, &date_time->deci_seconds);
        read_u8 (&cursor, &date_time->utc_direction);
        read_u8 (&cursor, &date_time->utc_hours);
        read_u8 (&cursor, &date_time->utc_minutes);
      }
      break;
    }
    case IPP_VALUE_CLASS_RESOLUTION:
    {
      ret_val = check_fixed_length(tag, length, IPP_RESOLUTION_SIZE_BYTES);
      if(IPPO_ERROR_NONE == ret_val)
      {
        read_i32(&cursor, &value.fixed.resolution.cross_feed);
        read_i32(&cursor, &value.fixed.resolution.feed);
        read_u8 (&cursor, &value.fixed.resolution.units);
      }
      break;
    }
    case IPP_VALUE_CLASS_RANGE_OF_INTEGER:
    {
      ret_val = check_fixed_length(tag, length, IPP_RANGE_SIZE_BYTES);
      if(IPPO_ERROR_NONE == ret_val)
      {
        /* lower > upper is passed through as received */
        read_i32(&cursor, &value.fixed.range.lower);
        read_i32(&cursor, &value.fixed.range.upper);
      }
      break;
    }
    case IPP_VALUE_CLASS_COLLECTION:
    {
      if(length != 0)
      {
        fprintf(stderr, "begCollection with non-empty value.  length %zu\n", length);
        ret_val = IPPO_ERROR_MALFORMED_VALUE;
      }
      break;
    }
    case IPP_VALUE_CLASS_STRING_WITH_LANGUAGE:
    {
      ret_val = decode_string_with_language(tag, &cursor, &value);
      break;
    }
    case IPP_VALUE_CLASS_STRING:
    {
      read_string(&cursor, length, &value.text);
      break;
    }
    case IPP_VALUE_CLASS_OCTET_STRING:
    case IPP_VALUE_CLASS_OUT_OF_BAND:
    case IPP_VALUE_CLASS_OPAQUE:
    {
      read_bytes(&cursor, length, &value.octets);
      break;
    }
    case IPP_VALUE_CLASS_END_COLLECTION:
    {
      fprintf(stderr, "endCollection is only valid inside a collection.\n");
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
      break;
    }
    case IPP_VALUE_CLASS_DELIMITER:
    default:
    {
      fprintf(stderr, "Delimiter tag 0x%02x is not a value tag.\n", tag);
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
      break;
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    *output = value;
  }

  return ret_val;
}

bool sandor_laboratories::ippo::ipp_value_equal(const ipp_value_s *a, const ipp_value_s *b)
{
  bool ret_val = false;

  if((a == nullptr) || (b == nullptr))
  {
    return (a == b);
  }

  if(a->tag != b->tag)
  {
    return false;
  }

  switch(get_ipp_value_class(a->tag))
  {
    case IPP_VALUE_CLASS_INTEGER:
    {
      ret_val = (a->fixed.integer == b->fixed.integer);
      break;
    }
    case IPP_VALUE_CLASS_BOOLEAN:
    {
      ret_val = (a->fixed.boolean == b->fixed.boolean);
      break;
    }
    case IPP_VALUE_CLASS_DATE_TIME:
    {
      const ipp_date_time_s *x = &a->fixed.date_time;
      const ipp_date_time_s *y = &b->fixed.date_time;
      ret_val = ( (x->year          == y->year) &&
                  (x->month         == y->month) &&
                  (x->day           == y->day) &&
                  (x->hour          == y->hour) &&
                  (x->minutes       == y->minutes) &&
                  (x->seconds       == y->seconds) &&
                  (x->deci_seconds  == y->deci_seconds) &&
                  (x->utc_direction == y->utc_direction) &&
                  (x->utc_hours     == y->utc_hours) &&
                  (x->utc_minutes   == y->utc_minutes) );
      break;
    }
    case IPP_VALUE_CLASS_RESOLUTION:
    {
      ret_val = ( (a->fixed.resolution.cross_feed == b->fixed.resolution.cross_feed) &&
                  (a->fixed.resolution.feed       == b->fixed.resolution.feed) &&
                  (a->fixed.resolution.units      == b->fixed.resolution.units) );
      break;
    }
    case IPP_VALUE_CLASS_RANGE_OF_INTEGER:
    {
      ret_val = ( (a->fixed.range.lower == b->fixed.range.lower) &&
                  (a->fixed.range.upper == b->fixed.range.upper) );
      break;
    }
    case IPP_VALUE_CLASS_COLLECTION:
    {
      ret_val = (a->collection.size() == b->collection.size());
      for(size_t i = 0; ret_val && (i < a->collection.size()); i++)
      {
        ret_val = ipp_attribute_equal(&a->collection[i], &b->collection[i]);
      }
      break;
    }
    case IPP_VALUE_CLASS_STRING_WITH_LANGUAGE:
    {
      ret_val = ((a->language == b->language) && (a->text == b->text));
      break;
    }
    case IPP_VALUE_CLASS_STRING:
    {
      ret_val = (a->text == b->text);
      break;
    }
    case IPP_VALUE_CLASS_END_COLLECTION:
    {
      ret_val = true;
      break;
    }
    default:
    {
      ret_val = (a->octets == b->octets);
      break;
    }
  }

  return ret_val;
}

bool sandor_laboratories::ippo::ipp_attribute_equal(const ipp_attribute_s *a, const ipp_attribute_s *b)
{
  bool ret_val = false;

  if((a != nullptr) && (b != nullptr))
  {
    ret_val = ((a->name == b->name) && (a->values.size() == b->values.size()));
    for(size_t i = 0; ret_val && (i < a->values.size()); i++)
    {
      ret_val = ipp_value_equal(&a->values[i], &b->values[i]);
    }
  }
  else
  {
    ret_val = (a == b);
  }

  return ret_val;
}

#define FORMAT_BUFFER_SIZE 128
std::string sandor_laboratories::ippo::format_ipp_value(const ipp_value_s *value)
{
  char        buffer[FORMAT_BUFFER_SIZE];
  std::string ret_string;

  if(value == nullptr)
  {
    return ret_string;
  }

  switch(get_ipp_value_class(value->tag))
  {
    case IPP_VALUE_CLASS_INTEGER:
    {
      snprintf(buffer, sizeof(buffer), "%" PRId32, value->fixed.integer);
      ret_string = buffer;
      break;
    }
    case IPP_VALUE_CLASS_BOOLEAN:
    {
      ret_string = (value->fixed.boolean?"true":"false");
      break;
    }
    case IPP_VALUE_CLASS_DATE_TIME:
    {
      const ipp_date_time_s *date_time = &value->fixed.date_time;
      snprintf(buffer, sizeof(buffer), "%04u-%02u-%02uT%02u:%02u:%02u.%u%c%02u%02u",
               date_time->year, date_time->month, date_time->day,
               date_time->hour, date_time->minutes, date_time->seconds, date_time->deci_seconds,
               (char) date_time->utc_direction, date_time->utc_hours, date_time->utc_minutes);
      ret_string = buffer;
      break;
    }
    case IPP_VALUE_CLASS_RESOLUTION:
    {
      snprintf(buffer, sizeof(buffer), "%" PRId32 "x%" PRId32 "%s",
               value->fixed.resolution.cross_feed, value->fixed.resolution.feed,
               (IPP_RESOLUTION_UNITS_DPI == value->fixed.resolution.units)?"dpi":
               (IPP_RESOLUTION_UNITS_DPCM == value->fixed.resolution.units)?"dpcm":"?");
      ret_string = buffer;
      break;
    }
    case IPP_VALUE_CLASS_RANGE_OF_INTEGER:
    {
      snprintf(buffer, sizeof(buffer), "%" PRId32 "-%" PRId32, value->fixed.range.lower, value->fixed.range.upper);
      ret_string = buffer;
      break;
    }
    case IPP_VALUE_CLASS_COLLECTION:
    {
      ret_string = "{";
      for(size_t i = 0; i < value->collection.size(); i++)
      {
        const ipp_attribute_s *member = &value->collection[i];
        ret_string += ((i > 0)?" ":"") + member->name + "=";
        for(size_t j = 0; j < member->values.size(); j++)
        {
          ret_string += ((j > 0)?",":"") + format_ipp_value(&member->values[j]);
        }
      }
      ret_string += "}";
      break;
    }
    case IPP_VALUE_CLASS_STRING_WITH_LANGUAGE:
    {
      ret_string = value->text + " [" + value->language + "]";
      break;
    }
    case IPP_VALUE_CLASS_STRING:
    {
      ret_string = value->text;
      break;
    }
    case IPP_VALUE_CLASS_OUT_OF_BAND:
    {
      ret_string = ipp_tag_string(value->tag);
      break;
    }
    default:
    {
      snprintf(buffer, sizeof(buffer), "<%zu octets tag 0x%02x>", value->octets.size(), value->tag);
      ret_string = buffer;
      break;
    }
  }

  return ret_string;
}

const ipp_attribute_s * sandor_laboratories::ippo::get_ipp_collection_member(const ipp_value_s *collection, const std::string &name)
{
  const ipp_attribute_s *ret_ptr = nullptr;

  if((collection != nullptr) && (IPP_TAG_BEG_COLLECTION == collection->tag))
  {
    for(std::vector<ipp_attribute_s>::const_iterator it = collection->collection.begin(); it != collection->collection.end(); it++)
    {
      if(it->name == name)
      {
        ret_ptr = &(*it);
        break;
      }
    }
  }

  return ret_ptr;
}
