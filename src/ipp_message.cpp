#include <cinttypes>
#include <cstdio>

#include "ipp_message.hpp"
#include "ipp_operation.hpp"

using namespace sandor_laboratories::ippo;

ipp_message_c::ipp_message_c()
  : ipp_message_c(0, 0)
{
}

ipp_message_c::ipp_message_c(uint16_t code, uint32_t request_id)
  : ipp_message_c({.major = IPP_VERSION_MAJOR_DEFAULT, .minor = IPP_VERSION_MINOR_DEFAULT}, code, request_id)
{
}

ipp_message_c::ipp_message_c(ipp_version_s version, uint16_t code, uint32_t request_id)
  : version(version), code(code), request_id(request_id)
{
}

ipp_attribute_group_c *ipp_message_c::add_group(ipp_tag_t tag)
{
  ipp_attribute_group_c               *ret_ptr  = nullptr;
  ipp_attribute_group_list_t::iterator position = groups.end();

  if(is_ipp_group_tag(tag))
  {
    /* Operation groups stay ahead of all others, matching wire order */
    if(IPP_TAG_OPERATION_ATTRIBUTES == tag)
    {
      position = groups.begin();
      while((position != groups.end()) && (IPP_TAG_OPERATION_ATTRIBUTES == position->get_tag()))
      {
        position++;
      }
    }
    ret_ptr = &(*groups.insert(position, ipp_attribute_group_c(tag)));
  }
  else
  {
    fprintf(stderr, "Tag 0x%02x does not begin an attribute group.\n", tag);
  }

  return ret_ptr;
}

ipp_attribute_group_c *ipp_message_c::get_group(ipp_tag_t tag)
{
  ipp_attribute_group_c *ret_ptr = nullptr;

  for(ipp_attribute_group_list_t::reverse_iterator it = groups.rbegin(); it != groups.rend(); it++)
  {
    if(it->get_tag() == tag)
    {
      ret_ptr = &(*it);
      break;
    }
  }

  return ret_ptr;
}

const ipp_attribute_group_c *ipp_message_c::get_group(ipp_tag_t tag) const
{
  const ipp_attribute_group_c *ret_ptr = nullptr;

  for(ipp_attribute_group_list_t::const_reverse_iterator it = groups.rbegin(); it != groups.rend(); it++)
  {
    if(it->get_tag() == tag)
    {
      ret_ptr = &(*it);
      break;
    }
  }

  return ret_ptr;
}

bool ipp_message_c::add_attribute(ipp_tag_t group_tag, const std::string &name, const ipp_value_list_t &values)
{
  bool                   ret_val = false;
  ipp_attribute_group_c *group   = get_group(group_tag);

  if(group == nullptr)
  {
    group = add_group(group_tag);
  }

  if(group != nullptr)
  {
    ret_val = group->add_attribute(name, values);
  }

  return ret_val;
}

bool ipp_message_c::add_attribute(ipp_tag_t group_tag, const std::string &name, const ipp_value_s &value)
{
  return add_attribute(group_tag, name, ipp_value_list_t(1, value));
}

const ipp_attribute_s *ipp_message_c::get_attribute(ipp_tag_t group_tag, const std::string &name) const
{
  const ipp_attribute_s *ret_ptr = nullptr;

  for(ipp_attribute_group_list_t::const_iterator it = groups.begin(); (ret_ptr == nullptr) && (it != groups.end()); it++)
  {
    if(it->get_tag() == group_tag)
    {
      ret_ptr = it->get_attribute(name);
    }
  }

  return ret_ptr;
}

void sandor_laboratories::ippo::init_ipp_parse_config(ipp_parse_config_s *config)
{
  if(config != nullptr)
  {
    config->verbose              = false;
    config->strict_value_tags    = false;
    config->max_collection_depth = IPP_MAX_COLLECTION_DEPTH;
  }
}

/* Writes value-tag, name-length, name.  Value-length and value are written by the caller. */
inline ippo_error_e write_entry_prefix(ipp_tag_t tag, const std::string &name, octet_buffer_t *output)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;

  if(name.size() > IPP_MAX_NAME_LENGTH)
  {
    fprintf(stderr, "Attribute name too large for 16 bit length field.  length %zu\n", name.size());
    ret_val = IPPO_ERROR_VALUE_TOO_LARGE;
  }
  else
  {
    write_u8(output, tag);
    write_u16(output, (uint16_t) name.size());
    write_string(output, name);
  }

  return ret_val;
}

static ippo_error_e serialize_values(const std::string &name, const ipp_value_list_t &values, unsigned int depth, octet_buffer_t *output);

/* Collection members follow the begCollection entry as memberAttrName/value entries up to endCollection */
static ippo_error_e serialize_collection_members(const ipp_value_s *collection, unsigned int depth, octet_buffer_t *output)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;

  if(depth > IPP_MAX_COLLECTION_DEPTH)
  {
    fprintf(stderr, "Collection nesting too deep.  depth %u max %u\n", depth, IPP_MAX_COLLECTION_DEPTH);
    return IPPO_ERROR_MALFORMED_VALUE;
  }

  for(size_t i = 0; (IPPO_ERROR_NONE == ret_val) && (i < collection->collection.size()); i++)
  {
    const ipp_attribute_s *member = &collection->collection[i];

    if(member->name.empty() || member->values.empty())
    {
      fprintf(stderr, "Invalid collection member.  name '%s' values %zu\n", member->name.c_str(), member->values.size());
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
    }
    else if(member->name.size() > IPP_MAX_VALUE_LENGTH)
    {
      fprintf(stderr, "Member name too large for 16 bit length field.  length %zu\n", member->name.size());
      ret_val = IPPO_ERROR_VALUE_TOO_LARGE;
    }
    else
    {
      write_u8 (output, IPP_TAG_MEMBER_ATTR_NAME);
      write_u16(output, 0);
      write_u16(output, (uint16_t) member->name.size());
      write_string(output, member->name);
      /* Member values never carry a name */
      ret_val = serialize_values("", member->values, depth, output);
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    write_u8 (output, IPP_TAG_END_COLLECTION);
    write_u16(output, 0);
    write_u16(output, 0);
  }

  return ret_val;
}

/* First value carries name, the rest are written with an empty name (1setOf continuation) */
static ippo_error_e serialize_values(const std::string &name, const ipp_value_list_t &values, unsigned int depth, octet_buffer_t *output)
{
  ippo_error_e   ret_val = IPPO_ERROR_NONE;
  octet_buffer_t payload;

  for(size_t i = 0; (IPPO_ERROR_NONE == ret_val) && (i < values.size()); i++)
  {
    const ipp_value_s *value = &values[i];

    if((IPP_TAG_MEMBER_ATTR_NAME == value->tag) || (IPP_TAG_END_COLLECTION == value->tag))
    {
      fprintf(stderr, "%s is reserved for collection framing.\n", ipp_tag_string(value->tag));
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
      break;
    }

    payload.clear();
    ret_val = encode_ipp_value(value, &payload);
    if(IPPO_ERROR_NONE == ret_val)
    {
      ret_val = write_entry_prefix(value->tag, ((0 == i)?name:""), output);
    }
    if(IPPO_ERROR_NONE == ret_val)
    {
      write_u16(output, (uint16_t) payload.size());
      write_bytes(output, payload);

      if(IPP_TAG_BEG_COLLECTION == value->tag)
      {
        ret_val = serialize_collection_members(value, depth+1, output);
      }
    }
  }

  return ret_val;
}

inline ippo_error_e serialize_group(const ipp_attribute_group_c *group, octet_buffer_t *output)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;
  const std::vector<ipp_attribute_s> &attributes = group->get_attributes();

  write_u8(output, group->get_tag());
  for(size_t i = 0; (IPPO_ERROR_NONE == ret_val) && (i < attributes.size()); i++)
  {
    ret_val = serialize_values(attributes[i].name, attributes[i].values, 0, output);
  }

  return ret_val;
}

ippo_error_e sandor_laboratories::ippo::serialize_ipp_message(const ipp_message_c *message, octet_buffer_t *output)
{
  ippo_error_e   ret_val = IPPO_ERROR_NONE;
  octet_buffer_t buffer;

  if((message == nullptr) || (output == nullptr))
  {
    fprintf(stderr, "Null inputs to serialize IPP message.  message %p output %p\n", message, output);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  const ipp_attribute_group_list_t &groups = message->get_groups();

  write_u8 (&buffer, message->get_version().major);
  write_u8 (&buffer, message->get_version().minor);
  write_u16(&buffer, message->get_code());
  write_u32(&buffer, message->get_request_id());

  /* Operation attributes first, then remaining groups in insertion order */
  for(size_t i = 0; (IPPO_ERROR_NONE == ret_val) && (i < groups.size()); i++)
  {
    if(IPP_TAG_OPERATION_ATTRIBUTES == groups[i].get_tag())
    {
      ret_val = serialize_group(&groups[i], &buffer);
    }
  }
  for(size_t i = 0; (IPPO_ERROR_NONE == ret_val) && (i < groups.size()); i++)
  {
    if(IPP_TAG_OPERATION_ATTRIBUTES != groups[i].get_tag())
    {
      ret_val = serialize_group(&groups[i], &buffer);
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    write_u8(&buffer, IPP_TAG_END_OF_ATTRIBUTES);
    write_bytes(&buffer, message->get_body());
    output->insert(output->end(), buffer.begin(), buffer.end());
  }
  else
  {
    fprintf(stderr, "Failed to serialize IPP message.  code 0x%04x request-id %" PRIu32 " error %s\n",
            message->get_code(), message->get_request_id(), ippo_error_string(ret_val));
  }

  return ret_val;
}

/* One attribute entry after its value-tag: name-length, name, value-length, value */
typedef struct
{
  ipp_tag_t      tag;
  std::string    name;
  const octet_t *payload;
  uint16_t       payload_length;
} ipp_entry_s;

inline ippo_error_e read_entry(byte_cursor_s *cursor, ipp_tag_t tag, ipp_entry_s *entry)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;
  uint16_t     name_length = 0;
  size_t       entry_offset = cursor->offset;

  entry->tag            = tag;
  entry->payload        = nullptr;
  entry->payload_length = 0;

  if( !read_u16(cursor, &name_length) ||
      !read_string(cursor, name_length, &entry->name) ||
      !read_u16(cursor, &entry->payload_length) ||
      (remaining_bytes(cursor) < entry->payload_length) )
  {
    fprintf(stderr, "Truncated %s attribute entry.  offset %zu size %zu\n", ipp_tag_string(tag), entry_offset, cursor->size);
    ret_val = IPPO_ERROR_TRUNCATED_INPUT;
  }
  else
  {
    entry->payload = &cursor->buffer[cursor->offset];
    skip_bytes(cursor, entry->payload_length);
  }

  return ret_val;
}

static ippo_error_e parse_entry_value(byte_cursor_s *cursor, const ipp_entry_s *entry, unsigned int depth,
                                      const ipp_parse_config_s *config, ipp_value_s *value);

/* Reads members up to and including endCollection into value->collection */
static ippo_error_e parse_collection_members(byte_cursor_s *cursor, unsigned int depth,
                                             const ipp_parse_config_s *config, ipp_value_s *value)
{
  ippo_error_e ret_val = IPPO_ERROR_NONE;
  bool         done    = false;
  ipp_tag_t    tag     = 0;
  ipp_entry_s  entry;

  if(depth > config->max_collection_depth)
  {
    fprintf(stderr, "Collection nesting too deep.  depth %u max %u\n", depth, config->max_collection_depth);
    return IPPO_ERROR_MALFORMED_VALUE;
  }

  while((IPPO_ERROR_NONE == ret_val) && !done)
  {
    if(!read_u8(cursor, &tag))
    {
      fprintf(stderr, "Collection truncated before endCollection.  offset %zu\n", cursor->offset);
      ret_val = IPPO_ERROR_TRUNCATED_INPUT;
      break;
    }
    if(is_ipp_delimiter_tag(tag))
    {
      fprintf(stderr, "Delimiter tag 0x%02x inside collection.  offset %zu\n", tag, cursor->offset-1);
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
      break;
    }

    ret_val = read_entry(cursor, tag, &entry);
    if(IPPO_ERROR_NONE != ret_val)
    {
      break;
    }

    if(!entry.name.empty())
    {
      fprintf(stderr, "Named %s entry inside collection.  name '%s'\n", ipp_tag_string(tag), entry.name.c_str());
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
    }
    else if(IPP_TAG_END_COLLECTION == tag)
    {
      if(entry.payload_length != 0)
      {
        fprintf(stderr, "endCollection with non-empty value.  length %u\n", entry.payload_length);
        ret_val = IPPO_ERROR_MALFORMED_VALUE;
      }
      done = true;
    }
    else if(IPP_TAG_MEMBER_ATTR_NAME == tag)
    {
      if(0 == entry.payload_length)
      {
        fprintf(stderr, "memberAttrName with empty member name.\n");
        ret_val = IPPO_ERROR_MALFORMED_VALUE;
      }
      else
      {
        const ipp_attribute_s member =
          {
            .name   = std::string((const char *) entry.payload, entry.payload_length),
            .values = ipp_value_list_t(),
          };
        value->collection.push_back(member);
      }
    }
    else if(value->collection.empty())
    {
      fprintf(stderr, "Collection value %s before any memberAttrName.\n", ipp_tag_string(tag));
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
    }
    else
    {
      ipp_value_s member_value;
      ret_val = parse_entry_value(cursor, &entry, depth, config, &member_value);
      if(IPPO_ERROR_NONE == ret_val)
      {
        value->collection.back().values.push_back(member_value);
      }
    }
  }

  for(size_t i = 0; (IPPO_ERROR_NONE == ret_val) && (i < value->collection.size()); i++)
  {
    if(value->collection[i].values.empty())
    {
      fprintf(stderr, "Collection member '%s' has no value.\n", value->collection[i].name.c_str());
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
    }
  }

  return ret_val;
}

static ippo_error_e parse_entry_value(byte_cursor_s *cursor, const ipp_entry_s *entry, unsigned int depth,
                                      const ipp_parse_config_s *config, ipp_value_s *value)
{
  ippo_error_e ret_val = decode_ipp_value(entry->tag, entry->payload, entry->payload_length, value);

  if((IPPO_ERROR_NONE == ret_val) && (IPP_TAG_BEG_COLLECTION == entry->tag))
  {
    ret_val = parse_collection_members(cursor, depth+1, config, value);
  }

  return ret_val;
}

/* Adds one top level attribute entry to group */
static ippo_error_e parse_attribute(byte_cursor_s *cursor, ipp_tag_t tag, const ipp_parse_config_s *config, ipp_attribute_group_c *group)
{
  ippo_error_e           ret_val  = IPPO_ERROR_NONE;
  const ipp_attribute_s *existing = nullptr;
  ipp_entry_s            entry;
  ipp_value_s            value;

  ret_val = read_entry(cursor, tag, &entry);

  if((IPPO_ERROR_NONE == ret_val) &&
     ((IPP_TAG_MEMBER_ATTR_NAME == tag) || (IPP_TAG_END_COLLECTION == tag)))
  {
    fprintf(stderr, "%s outside of a collection.  offset %zu\n", ipp_tag_string(tag), cursor->offset);
    ret_val = IPPO_ERROR_MALFORMED_VALUE;
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    existing = (entry.name.empty()?group->get_last_attribute():group->get_attribute(entry.name));
    if(entry.name.empty() && (existing == nullptr))
    {
      fprintf(stderr, "Additional value with no attribute to continue in %s.\n", ipp_tag_string(group->get_tag()));
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
    }
    else if(config->strict_value_tags && (existing != nullptr) && (existing->values[0].tag != tag))
    {
      fprintf(stderr, "Value tag %s does not match %s of attribute '%s'.\n",
              ipp_tag_string(tag), ipp_tag_string(existing->values[0].tag), existing->name.c_str());
      ret_val = IPPO_ERROR_MALFORMED_VALUE;
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    ret_val = parse_entry_value(cursor, &entry, 0, config, &value);
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    if(entry.name.empty())
    {
      group->append_to_last_attribute(value);
    }
    else
    {
      group->add_attribute(entry.name, value);
    }

    if(config->verbose)
    {
      printf("  %s (%s) = %s\n", group->get_last_attribute()->name.c_str(), ipp_tag_string(tag), format_ipp_value(&value).c_str());
    }
  }

  return ret_val;
}

ippo_error_e sandor_laboratories::ippo::parse_ipp_message(const octet_t *buffer, size_t size, ipp_message_c *output, const ipp_parse_config_s *config)
{
  ippo_error_e           ret_val = IPPO_ERROR_NONE;
  ipp_parse_config_s     default_config;
  byte_cursor_s          cursor;
  ipp_version_s          version;
  uint16_t               code       = 0;
  uint32_t               request_id = 0;
  ipp_tag_t              tag        = 0;
  bool                   end_of_attributes = false;
  ipp_attribute_group_c *group      = nullptr;

  if((output == nullptr) || ((buffer == nullptr) && (size > 0)))
  {
    fprintf(stderr, "Null inputs to parse IPP message.  buffer %p size %zu output %p\n", buffer, size, output);
    return IPPO_ERROR_INVALID_ARGUMENT;
  }

  if(config == nullptr)
  {
    init_ipp_parse_config(&default_config);
    config = &default_config;
  }

  cursor = make_byte_cursor(buffer, size);

  if(size < IPP_HEADER_SIZE_BYTES)
  {
    fprintf(stderr, "IPP message shorter than header.  size %zu\n", size);
    return IPPO_ERROR_MALFORMED_HEADER;
  }
  read_u8 (&cursor, &version.major);
  read_u8 (&cursor, &version.minor);
  read_u16(&cursor, &code);
  read_u32(&cursor, &request_id);

  ipp_message_c message(version, code, request_id);

  if(config->verbose)
  {
    printf("IPP/%u.%u code 0x%04x request-id %" PRIu32 "\n", version.major, version.minor, code, request_id);
  }

  if(!read_u8(&cursor, &tag))
  {
    fprintf(stderr, "IPP message ends before end-of-attributes-tag.  size %zu\n", size);
    ret_val = IPPO_ERROR_TRUNCATED_INPUT;
  }

  while((IPPO_ERROR_NONE == ret_val) && !end_of_attributes)
  {
    if(IPP_TAG_END_OF_ATTRIBUTES == tag)
    {
      end_of_attributes = true;
    }
    else if(is_ipp_group_tag(tag))
    {
      group = message.add_group(tag);
      if(config->verbose)
      {
        printf(" %s\n", ipp_tag_string(tag));
      }

      /* Attributes until the next delimiter, which doubles as the next group tag */
      while(IPPO_ERROR_NONE == ret_val)
      {
        if(!read_u8(&cursor, &tag))
        {
          fprintf(stderr, "IPP message ends before end-of-attributes-tag.  size %zu\n", size);
          ret_val = IPPO_ERROR_TRUNCATED_INPUT;
        }
        else if(is_ipp_delimiter_tag(tag))
        {
          break;
        }
        else
        {
          ret_val = parse_attribute(&cursor, tag, config, group);
        }
      }
    }
    else
    {
      fprintf(stderr, "Unknown group tag 0x%02x.  offset %zu\n", tag, cursor.offset-1);
      ret_val = IPPO_ERROR_UNKNOWN_GROUP_TAG;
    }
  }

  if(IPPO_ERROR_NONE == ret_val)
  {
    message.set_body(octet_buffer_t(&cursor.buffer[cursor.offset], &cursor.buffer[cursor.size]));
    *output = std::move(message);
  }

  return ret_val;
}

bool sandor_laboratories::ippo::ipp_message_equal(const ipp_message_c *a, const ipp_message_c *b)
{
  bool ret_val = false;

  if((a != nullptr) && (b != nullptr))
  {
    const ipp_attribute_group_list_t &a_groups = a->get_groups();
    const ipp_attribute_group_list_t &b_groups = b->get_groups();

    ret_val = ( (a->get_version().major == b->get_version().major) &&
                (a->get_version().minor == b->get_version().minor) &&
                (a->get_code()          == b->get_code()) &&
                (a->get_request_id()    == b->get_request_id()) &&
                (a->get_body()          == b->get_body()) &&
                (a_groups.size()        == b_groups.size()) );

    for(size_t i = 0; ret_val && (i < a_groups.size()); i++)
    {
      ret_val = ipp_attribute_group_equal(&a_groups[i], &b_groups[i]);
    }
  }
  else
  {
    ret_val = (a == b);
  }

  return ret_val;
}

void sandor_laboratories::ippo::print_ipp_message(FILE *stream, const ipp_message_c *message, bool is_response)
{
  if((stream == nullptr) || (message == nullptr))
  {
    return;
  }

  fprintf(stream, "IPP/%u.%u %s (0x%04x) request-id %" PRIu32 "\n",
          message->get_version().major, message->get_version().minor,
          (is_response?ipp_status_string(message->get_code()):ipp_operation_string(message->get_code())),
          message->get_code(), message->get_request_id());

  for(ipp_attribute_group_list_t::const_iterator group = message->get_groups().begin(); group != message->get_groups().end(); group++)
  {
    fprintf(stream, "%s\n", ipp_tag_string(group->get_tag()));
    for(std::vector<ipp_attribute_s>::const_iterator attribute = group->get_attributes().begin(); attribute != group->get_attributes().end(); attribute++)
    {
      fprintf(stream, "  %s (%s%s) =", attribute->name.c_str(),
              ((attribute->values.size() > 1)?"1setOf ":""), ipp_tag_string(attribute->values[0].tag));
      for(size_t i = 0; i < attribute->values.size(); i++)
      {
        fprintf(stream, "%s %s", ((i > 0)?",":""), format_ipp_value(&attribute->values[i]).c_str());
      }
      fprintf(stream, "\n");
    }
  }

  fprintf(stream, "body %zu bytes\n", message->get_body().size());
}
