#ifndef __IPP_MESSAGE_HPP__
#define __IPP_MESSAGE_HPP__

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "byte_stream.hpp"
#include "ipp_attribute.hpp"
#include "ipp_value.hpp"
#include "ippo.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    #define IPP_VERSION_MAJOR_DEFAULT 1
    #define IPP_VERSION_MINOR_DEFAULT 1

    /* version-number (2) + operation-id/status-code (2) + request-id (4) */
    #define IPP_HEADER_SIZE_BYTES 8

    /* Deepest collection nesting accepted by the parser */
    #define IPP_MAX_COLLECTION_DEPTH 16

    typedef struct
    {
      uint8_t major;
      uint8_t minor;
    } ipp_version_s;

    typedef std::vector<ipp_attribute_group_c> ipp_attribute_group_list_t;

    /* IPP request or response.  Code is an operation-id on requests and a status-code on responses. */
    class ipp_message_c
    {
      private:
        /* No setter, version is fixed once constructed */
        ipp_version_s              version;
        uint16_t                   code;
        uint32_t                   request_id;
        ipp_attribute_group_list_t groups;
        octet_buffer_t             body;

      public:
        ipp_message_c();
        ipp_message_c(uint16_t code, uint32_t request_id);
        ipp_message_c(ipp_version_s version, uint16_t code, uint32_t request_id);

        inline ipp_version_s get_version()    const {return version;};
        inline uint16_t      get_code()       const {return code;};
        inline uint32_t      get_request_id() const {return request_id;};
        inline void          set_code(uint16_t new_code)             {code = new_code;};
        inline void          set_request_id(uint32_t new_request_id) {request_id = new_request_id;};

        /* Opens a new group with tag.  Operation groups go after existing operation groups, others at the end.
            Returns null for non-group tags. */
        ipp_attribute_group_c *add_group(ipp_tag_t tag);
        /* Returns the last group with tag, or null if none exists.  Invalidated by add_group. */
        ipp_attribute_group_c       *get_group(ipp_tag_t tag);
        const ipp_attribute_group_c *get_group(ipp_tag_t tag) const;
        inline const ipp_attribute_group_list_t &get_groups() const {return groups;};

        /* Adds attribute to the last group with group_tag, opening the group if needed */
        bool add_attribute(ipp_tag_t group_tag, const std::string &name, const ipp_value_list_t &values);
        bool add_attribute(ipp_tag_t group_tag, const std::string &name, const ipp_value_s &value);
        /* Returns first attribute with name from any group with group_tag, or null */
        const ipp_attribute_s *get_attribute(ipp_tag_t group_tag, const std::string &name) const;

        inline const octet_buffer_t &get_body() const {return body;};
        inline void set_body(const octet_buffer_t &new_body) {body = new_body;};
        inline void set_body(octet_buffer_t &&new_body)      {body = std::move(new_body);};
    };

    typedef struct
    {
      /* Log every decoded attribute */
      bool         verbose;
      /* Reject continuation values whose tag differs from the attribute's first value */
      bool         strict_value_tags;
      unsigned int max_collection_depth;
    } ipp_parse_config_s;

    void init_ipp_parse_config(ipp_parse_config_s *config);

    /* Serializes message.  Operation groups are written first, then other groups in insertion order,
        then end-of-attributes-tag and body.  Output is appended only on success. */
    ippo_error_e serialize_ipp_message(const ipp_message_c *message, octet_buffer_t *output);

    /* Parses a complete message.  All-or-nothing: output is replaced only on success.
        Uses the default parse config when config is null. */
    ippo_error_e parse_ipp_message(const octet_t *buffer, size_t size, ipp_message_c *output, const ipp_parse_config_s *config = nullptr);
    inline ippo_error_e parse_ipp_message(const octet_buffer_t &buffer, ipp_message_c *output, const ipp_parse_config_s *config = nullptr)
    {
      return parse_ipp_message(buffer.data(), buffer.size(), output, config);
    };

    bool ipp_message_equal(const ipp_message_c *a, const ipp_message_c *b);

    /* Writes human readable dump.  is_response selects status-code or operation-id naming. */
    void print_ipp_message(FILE *stream, const ipp_message_c *message, bool is_response);
  }
}

#endif /* __IPP_MESSAGE_HPP__ */
