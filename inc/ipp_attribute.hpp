#ifndef __IPP_ATTRIBUTE_HPP__
#define __IPP_ATTRIBUTE_HPP__

#include <map>
#include <string>
#include <vector>

#include "ipp_value.hpp"

namespace sandor_laboratories
{
  namespace ippo
  {
    /* Attributes of one attribute-group in insertion order, addressable by name.
        Repeated names are merged into the first attribute with that name (first write wins). */
    class ipp_attribute_group_c
    {
      private:
        ipp_tag_t                      tag;
        std::vector<ipp_attribute_s>   attributes;
        /* name -> position in attributes */
        std::map<std::string, size_t>  attribute_index;
        /* Position of the attribute that received the latest add */
        size_t                         last_position;

      public:
        ipp_attribute_group_c(ipp_tag_t tag);

        inline ipp_tag_t get_tag() const {return tag;};

        /* Adds attribute with one or more values.  If name already exists in this group the values are appended to it.
            Returns false for an empty name or empty value list. */
        bool add_attribute(const std::string &name, const ipp_value_list_t &values);
        bool add_attribute(const std::string &name, const ipp_value_s &value);
        /* Appends value to the attribute that received the latest add.  Returns false if group is empty. */
        bool append_to_last_attribute(const ipp_value_s &value);

        /* Returns attribute with name or null if absent */
        const ipp_attribute_s *get_attribute(const std::string &name) const;
        /* Returns the attribute that received the latest add or null if group is empty */
        const ipp_attribute_s *get_last_attribute() const;

        inline const std::vector<ipp_attribute_s> &get_attributes() const {return attributes;};
        inline size_t                              size()           const {return attributes.size();};
        inline bool                                empty()          const {return attributes.empty();};
    };

    bool ipp_attribute_group_equal(const ipp_attribute_group_c *a, const ipp_attribute_group_c *b);
  }
}

#endif /* __IPP_ATTRIBUTE_HPP__ */
